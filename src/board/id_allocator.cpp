#include "id_allocator.hpp"
#include "model.hpp"
#include "storage/kv_store.hpp"

namespace tinyboard::board {

Result<ThreadId> IdAllocator::next_thread_id() const {
    auto count = store_.count_prefix(thread_prefix());
    if (count.is_err()) {
        return count.error();
    }
    return Result<ThreadId>::Ok(static_cast<ThreadId>(count.value()) + 1);
}

Result<ReplyId> IdAllocator::next_reply_id(ThreadId parent_id) const {
    auto count = store_.count_prefix(reply_prefix(parent_id));
    if (count.is_err()) {
        return count.error();
    }
    return Result<ReplyId>::Ok(static_cast<ReplyId>(count.value()) + 1);
}

} // namespace tinyboard::board
