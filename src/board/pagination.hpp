#pragma once

#include "model.hpp"
#include <vector>

namespace tinyboard::board {

/**
 * One visible slice of the thread list
 */
struct Page {
    std::vector<Thread> items;
    int64_t page{1};          // 1-indexed, after clamping
    int64_t total_pages{0};
    size_t total_items{0};

    bool has_previous() const { return page > 1; }
    bool has_next() const { return page < total_pages; }
};

/**
 * Sort threads by last_updated, newest first (ties keep store order), and
 * cut out the requested page.
 *
 * The requested page is clamped to at least 1 and, when there is at least
 * one page, to at most total_pages. An empty list yields an empty page 1.
 */
Page paginate(std::vector<Thread> threads, int64_t requested_page,
              int64_t page_size = constants::PAGE_SIZE);

/**
 * Parse a "page" query value; anything that is not a decimal integer
 * gives 1
 */
int64_t parse_page_param(const std::string& value);

} // namespace tinyboard::board
