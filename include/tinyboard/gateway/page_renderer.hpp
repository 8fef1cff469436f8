#pragma once

#include "tinyboard/common.hpp"
#include <string>
#include <vector>

namespace tinyboard {

// Forward declarations
namespace board {
struct Thread;
struct Reply;
struct Page;
}

namespace gateway {

/**
 * Escape text for HTML element content and attribute values.
 * Escapes & < > " ' and /.
 */
std::string escape_html(const std::string& text);

/**
 * Page renderer configuration
 */
struct PageRendererConfig {
    std::string board_name{"tinyboard"};
    std::string stylesheet_url{"/static/style.css"};
    std::string script_url{"/static/script.js"};
};

/**
 * Renders the board's HTML pages. All user-supplied text is escaped.
 */
class PageRenderer {
public:
    PageRenderer() = default;
    explicit PageRenderer(PageRendererConfig config);

    /**
     * Homepage: post form, one page of threads, pagination controls
     */
    std::string render_homepage(const board::Page& page) const;

    /**
     * Thread view: reply form, the thread post, its replies
     */
    std::string render_thread_page(const board::Thread& thread,
                                   const std::vector<board::Reply>& replies) const;

    std::string render_error_page(const std::string& title, const std::string& message) const;

    const PageRendererConfig& config() const { return config_; }

private:
    std::string render_head(const std::string& title) const;
    std::string render_thread(const board::Thread& thread, bool with_reply_link) const;
    std::string render_reply(const board::Reply& reply) const;
    std::string render_media(const board::Thread& thread) const;
    std::string render_pagination(const board::Page& page) const;

    PageRendererConfig config_;
};

} // namespace gateway
} // namespace tinyboard
