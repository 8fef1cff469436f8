#pragma once

#include "tinyboard/common.hpp"
#include "tinyboard/error.hpp"
#include <optional>
#include <string>

namespace tinyboard::board {

/**
 * Kind of media attached to a thread
 */
enum class MediaKind {
    Image,
    Video
};

const char* media_kind_to_string(MediaKind kind);
std::optional<MediaKind> media_kind_from_string(const std::string& text);

/**
 * Public reference to a stored attachment
 */
struct MediaRef {
    std::string url;     // e.g. "/thumbs/images/thumb_<uuid>.png"
    MediaKind kind{MediaKind::Image};
};

/**
 * Top-level post
 */
struct Thread {
    ThreadId id{0};
    std::string title;
    std::string message;
    int64_t last_updated{0};  // Unix seconds
    std::optional<std::string> media_url;
    std::optional<MediaKind> media_kind;

    bool operator==(const Thread& other) const {
        return id == other.id && title == other.title && message == other.message &&
               last_updated == other.last_updated && media_url == other.media_url &&
               media_kind == other.media_kind;
    }
    bool operator!=(const Thread& other) const { return !(*this == other); }
};

/**
 * Text-only follow-up; id is unique within its parent thread
 */
struct Reply {
    ReplyId id{0};
    std::string message;

    bool operator==(const Reply& other) const {
        return id == other.id && message == other.message;
    }
    bool operator!=(const Reply& other) const { return !(*this == other); }
};

// Storage keys.
// Thread records live under "thread_<id>", replies under "reply_<parent>_<id>".
// Reply scans use "reply_<parent>_" so that parent 1 never matches parent 12.
std::string thread_key(ThreadId id);
std::string thread_prefix();
std::string reply_key(ThreadId parent_id, ReplyId reply_id);
std::string reply_prefix(ThreadId parent_id);

// JSON record encoding
Result<std::string> serialize_thread(const Thread& thread);
Result<Thread> deserialize_thread(const std::string& data);
Result<std::string> serialize_reply(const Reply& reply);
Result<Reply> deserialize_reply(const std::string& data);

} // namespace tinyboard::board
