#pragma once

#include "tinyboard/common.hpp"
#include "tinyboard/error.hpp"

namespace tinyboard::storage { class KvStore; }

namespace tinyboard::board {

/**
 * Allocates thread and reply identifiers by counting existing records.
 *
 * next id = number of records under the prefix + 1. There is no counter
 * record and no locking: two writers that scan at the same time get the
 * same id and the later put overwrites the earlier record. LevelDB has no
 * compare-and-set, so uniqueness is best-effort under concurrent writers.
 */
class IdAllocator {
public:
    explicit IdAllocator(const storage::KvStore& store) : store_(store) {}

    Result<ThreadId> next_thread_id() const;
    Result<ReplyId> next_reply_id(ThreadId parent_id) const;

private:
    const storage::KvStore& store_;
};

} // namespace tinyboard::board
