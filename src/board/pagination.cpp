#include "pagination.hpp"
#include <algorithm>
#include <charconv>

namespace tinyboard::board {

Page paginate(std::vector<Thread> threads, int64_t requested_page, int64_t page_size) {
    if (page_size < 1) {
        page_size = constants::PAGE_SIZE;
    }

    std::stable_sort(threads.begin(), threads.end(), [](const Thread& a, const Thread& b) {
        return a.last_updated > b.last_updated;
    });

    Page result;
    result.total_items = threads.size();

    const auto total = static_cast<int64_t>(threads.size());
    result.total_pages = total / page_size + (total % page_size != 0 ? 1 : 0);

    // page stays within [1, max(total_pages, 1)] so the slice offset cannot overflow
    int64_t page = std::max<int64_t>(requested_page, 1);
    if (page > result.total_pages) {
        page = std::max<int64_t>(result.total_pages, 1);
    }
    result.page = page;

    const int64_t begin = (page - 1) * page_size;
    if (begin < total) {
        const int64_t end = begin + std::min(page_size, total - begin);
        result.items.assign(std::make_move_iterator(threads.begin() + begin),
                            std::make_move_iterator(threads.begin() + end));
    }

    return result;
}

int64_t parse_page_param(const std::string& value) {
    auto text = trim(value);
    int64_t page = 1;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), page);
    if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) {
        return 1;
    }
    return page;
}

} // namespace tinyboard::board
