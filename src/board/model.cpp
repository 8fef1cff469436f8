#include "model.hpp"
#include <nlohmann/json.hpp>

namespace tinyboard::board {

using json = nlohmann::json;

namespace {

constexpr const char* THREAD_KEY_PREFIX = "thread_";
constexpr const char* REPLY_KEY_PREFIX = "reply_";

// Invalid UTF-8 in user text is replaced rather than failing the write
std::string dump(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // anonymous namespace

const char* media_kind_to_string(MediaKind kind) {
    switch (kind) {
        case MediaKind::Image: return "Image";
        case MediaKind::Video: return "Video";
    }
    return "Image";
}

std::optional<MediaKind> media_kind_from_string(const std::string& text) {
    if (text == "Image") {
        return MediaKind::Image;
    }
    if (text == "Video") {
        return MediaKind::Video;
    }
    return std::nullopt;
}

std::string thread_key(ThreadId id) {
    return THREAD_KEY_PREFIX + std::to_string(id);
}

std::string thread_prefix() {
    return THREAD_KEY_PREFIX;
}

std::string reply_key(ThreadId parent_id, ReplyId reply_id) {
    return reply_prefix(parent_id) + std::to_string(reply_id);
}

std::string reply_prefix(ThreadId parent_id) {
    return REPLY_KEY_PREFIX + std::to_string(parent_id) + "_";
}

Result<std::string> serialize_thread(const Thread& thread) {
    try {
        json j;
        j["id"] = thread.id;
        j["title"] = thread.title;
        j["message"] = thread.message;
        j["last_updated"] = thread.last_updated;
        j["media_url"] = thread.media_url ? json(*thread.media_url) : json(nullptr);
        j["media_kind"] = thread.media_kind
            ? json(media_kind_to_string(*thread.media_kind))
            : json(nullptr);
        return Result<std::string>::Ok(dump(j));
    } catch (const json::exception& e) {
        return Error(ErrorCode::SerializationFailed,
                     "Failed to serialize thread " + std::to_string(thread.id), e.what());
    }
}

Result<Thread> deserialize_thread(const std::string& data) {
    try {
        auto j = json::parse(data);

        Thread thread;
        thread.id = j.at("id").get<ThreadId>();
        thread.title = j.at("title").get<std::string>();
        thread.message = j.at("message").get<std::string>();
        thread.last_updated = j.at("last_updated").get<int64_t>();

        auto url_it = j.find("media_url");
        if (url_it != j.end() && !url_it->is_null()) {
            thread.media_url = url_it->get<std::string>();
        }

        auto kind_it = j.find("media_kind");
        if (kind_it != j.end() && !kind_it->is_null()) {
            auto kind = media_kind_from_string(kind_it->get<std::string>());
            if (!kind) {
                return Error(ErrorCode::DeserializationFailed,
                             "Unknown media kind", kind_it->get<std::string>());
            }
            thread.media_kind = kind;
        }

        return Result<Thread>::Ok(std::move(thread));
    } catch (const json::exception& e) {
        return Error(ErrorCode::DeserializationFailed, "Malformed thread record", e.what());
    }
}

Result<std::string> serialize_reply(const Reply& reply) {
    try {
        json j;
        j["id"] = reply.id;
        j["message"] = reply.message;
        return Result<std::string>::Ok(dump(j));
    } catch (const json::exception& e) {
        return Error(ErrorCode::SerializationFailed,
                     "Failed to serialize reply " + std::to_string(reply.id), e.what());
    }
}

Result<Reply> deserialize_reply(const std::string& data) {
    try {
        auto j = json::parse(data);

        Reply reply;
        reply.id = j.at("id").get<ReplyId>();
        reply.message = j.at("message").get<std::string>();
        return Result<Reply>::Ok(std::move(reply));
    } catch (const json::exception& e) {
        return Error(ErrorCode::DeserializationFailed, "Malformed reply record", e.what());
    }
}

} // namespace tinyboard::board
