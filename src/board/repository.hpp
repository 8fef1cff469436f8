#pragma once

#include "model.hpp"
#include "id_allocator.hpp"
#include "tinyboard/error.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tinyboard::storage { class KvStore; }

namespace tinyboard::board {

/**
 * Source of "now" in Unix seconds
 */
using TimestampSource = std::function<int64_t()>;

/**
 * Maps threads and replies to JSON records in the key-value store.
 *
 * Every write is a single-key put. Creating a reply is two puts (the reply,
 * then the parent's last_updated); a failure between them leaves the reply
 * stored and the parent's sort position stale.
 */
class ContentRepository {
public:
    /**
     * @param store Shared store handle
     * @param clock Timestamp source, defaults to the system clock
     */
    explicit ContentRepository(std::shared_ptr<storage::KvStore> store,
                               TimestampSource clock = {});

    /**
     * Create a thread. Title and message are trimmed; either one empty
     * (or over its length limit) fails with ValidationFailed.
     * @param media Already-stored attachment, if any
     * @return The persisted thread
     */
    Result<Thread> create_thread(const std::string& title,
                                 const std::string& message,
                                 const std::optional<MediaRef>& media = std::nullopt);

    /**
     * Look up a thread; nullopt when absent
     */
    Result<std::optional<Thread>> get_thread(ThreadId id) const;

    /**
     * All threads in store order. Undecodable records are skipped.
     */
    Result<std::vector<Thread>> list_threads() const;

    /**
     * Reply to an existing thread and bump its last_updated.
     * Fails with ValidationFailed on an empty message and NotFound when
     * the parent does not exist.
     */
    Result<Reply> create_reply(ThreadId parent_id, const std::string& message);

    /**
     * All replies of a thread in store order
     */
    Result<std::vector<Reply>> list_replies(ThreadId parent_id) const;

    /**
     * Number of stored threads
     */
    Result<size_t> thread_count() const;

private:
    Result<void> touch_thread(ThreadId id);

    std::shared_ptr<storage::KvStore> store_;
    IdAllocator ids_;
    TimestampSource clock_;
};

} // namespace tinyboard::board
