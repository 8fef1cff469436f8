#include "repository.hpp"
#include "storage/kv_store.hpp"
#include "utils/logger.hpp"
#include "tinyboard/time_utils.hpp"
#include <algorithm>

namespace tinyboard::board {

namespace {

// Trim and check a required text field
Result<std::string> validate_text(const char* field, const std::string& value, size_t max_length) {
    auto trimmed = trim(value);
    if (trimmed.empty()) {
        return Error(ErrorCode::ValidationFailed, std::string(field) + " cannot be empty");
    }
    if (utf8_length(trimmed) > max_length) {
        return Error(ErrorCode::ValidationFailed,
                     std::string(field) + " is longer than " + std::to_string(max_length) +
                     " characters");
    }
    return Result<std::string>::Ok(std::move(trimmed));
}

} // anonymous namespace

ContentRepository::ContentRepository(std::shared_ptr<storage::KvStore> store,
                                     TimestampSource clock)
    : store_(std::move(store))
    , ids_(*store_)
    , clock_(clock ? std::move(clock) : TimestampSource(time::timestamp_seconds))
{}

Result<Thread> ContentRepository::create_thread(const std::string& title,
                                                const std::string& message,
                                                const std::optional<MediaRef>& media) {
    auto clean_title = validate_text("Title", title, constants::MAX_TITLE_LENGTH);
    if (clean_title.is_err()) {
        return clean_title.error();
    }
    auto clean_message = validate_text("Message", message, constants::MAX_MESSAGE_LENGTH);
    if (clean_message.is_err()) {
        return clean_message.error();
    }

    auto id = ids_.next_thread_id();
    if (id.is_err()) {
        return id.error();
    }

    Thread thread;
    thread.id = id.value();
    thread.title = clean_title.unwrap();
    thread.message = clean_message.unwrap();
    thread.last_updated = clock_();
    if (media) {
        thread.media_url = media->url;
        thread.media_kind = media->kind;
    }

    auto record = serialize_thread(thread);
    if (record.is_err()) {
        return record.error();
    }
    TINYBOARD_TRY(store_->put(thread_key(thread.id), record.value()));

    TINYBOARD_LOG_INFO("Created thread {}{}", thread.id,
                       thread.media_url ? " with " + *thread.media_url : std::string());
    return Result<Thread>::Ok(std::move(thread));
}

Result<std::optional<Thread>> ContentRepository::get_thread(ThreadId id) const {
    auto record = store_->get(thread_key(id));
    if (record.is_err()) {
        return record.error();
    }
    if (!record.value()) {
        return Result<std::optional<Thread>>::Ok(std::nullopt);
    }

    auto thread = deserialize_thread(*record.value());
    if (thread.is_err()) {
        TINYBOARD_LOG_ERROR("Thread {} is unreadable: {}", id, thread.error().to_string());
        return thread.error();
    }
    return Result<std::optional<Thread>>::Ok(thread.unwrap());
}

Result<std::vector<Thread>> ContentRepository::list_threads() const {
    std::vector<Thread> threads;

    auto scan = store_->scan_prefix(thread_prefix());
    storage::KvStore::Entry entry;
    while (scan.next(entry)) {
        auto thread = deserialize_thread(entry.value);
        if (thread.is_err()) {
            TINYBOARD_LOG_WARN("Skipping {}: {}", entry.key, thread.error().to_string());
            continue;
        }
        threads.push_back(thread.unwrap());
    }
    TINYBOARD_TRY(scan.status());

    return Result<std::vector<Thread>>::Ok(std::move(threads));
}

Result<Reply> ContentRepository::create_reply(ThreadId parent_id, const std::string& message) {
    auto clean_message = validate_text("Message", message, constants::MAX_MESSAGE_LENGTH);
    if (clean_message.is_err()) {
        return clean_message.error();
    }

    auto parent = get_thread(parent_id);
    if (parent.is_err()) {
        return parent.error();
    }
    if (!parent.value()) {
        return Error(ErrorCode::NotFound, "Thread " + std::to_string(parent_id) + " does not exist");
    }

    auto id = ids_.next_reply_id(parent_id);
    if (id.is_err()) {
        return id.error();
    }

    Reply reply;
    reply.id = id.value();
    reply.message = clean_message.unwrap();

    auto record = serialize_reply(reply);
    if (record.is_err()) {
        return record.error();
    }
    TINYBOARD_TRY(store_->put(reply_key(parent_id, reply.id), record.value()));

    // The reply is stored; a failed touch only leaves the sort order stale
    auto touched = touch_thread(parent_id);
    if (touched.is_err()) {
        TINYBOARD_LOG_ERROR("Reply {} to thread {} stored but touch failed: {}",
                            reply.id, parent_id, touched.error().to_string());
    }

    TINYBOARD_LOG_INFO("Created reply {} in thread {}", reply.id, parent_id);
    return Result<Reply>::Ok(std::move(reply));
}

Result<std::vector<Reply>> ContentRepository::list_replies(ThreadId parent_id) const {
    std::vector<Reply> replies;

    auto scan = store_->scan_prefix(reply_prefix(parent_id));
    storage::KvStore::Entry entry;
    while (scan.next(entry)) {
        auto reply = deserialize_reply(entry.value);
        if (reply.is_err()) {
            TINYBOARD_LOG_WARN("Skipping {}: {}", entry.key, reply.error().to_string());
            continue;
        }
        replies.push_back(reply.unwrap());
    }
    TINYBOARD_TRY(scan.status());

    return Result<std::vector<Reply>>::Ok(std::move(replies));
}

Result<size_t> ContentRepository::thread_count() const {
    return store_->count_prefix(thread_prefix());
}

Result<void> ContentRepository::touch_thread(ThreadId id) {
    auto current = get_thread(id);
    if (current.is_err()) {
        return current.error();
    }
    if (!current.value()) {
        return Error(ErrorCode::NotFound, "Thread " + std::to_string(id) + " vanished before touch");
    }

    Thread thread = *current.value();
    thread.last_updated = std::max(thread.last_updated, clock_());

    auto record = serialize_thread(thread);
    if (record.is_err()) {
        return record.error();
    }
    return store_->put(thread_key(id), record.value());
}

} // namespace tinyboard::board
