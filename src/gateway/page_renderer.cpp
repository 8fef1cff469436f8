#include "tinyboard/gateway/page_renderer.hpp"
#include "../board/model.hpp"
#include "../board/pagination.hpp"
#include "tinyboard/time_utils.hpp"
#include <sstream>

namespace tinyboard {
namespace gateway {

std::string escape_html(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            case '/': out += "&#x2F;"; break;
            default: out += c; break;
        }
    }
    return out;
}

PageRenderer::PageRenderer(PageRendererConfig config)
    : config_(std::move(config))
{}

std::string PageRenderer::render_head(const std::string& title) const {
    std::ostringstream html;
    html << "<!DOCTYPE html>\n"
         << "<html lang=\"en\">\n"
         << "<head>\n"
         << "    <meta charset=\"UTF-8\">\n"
         << "    <meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\">\n"
         << "    <title>" << escape_html(title) << "</title>\n"
         << "    <link rel=\"stylesheet\" href=\"" << escape_html(config_.stylesheet_url) << "\">\n"
         << "    <script defer src=\"" << escape_html(config_.script_url) << "\"></script>\n"
         << "</head>\n";
    return html.str();
}

std::string PageRenderer::render_media(const board::Thread& thread) const {
    if (!thread.media_url || !thread.media_kind) {
        return {};
    }

    std::ostringstream html;
    html << "<div class=\"post-media\">\n";
    if (*thread.media_kind == board::MediaKind::Video) {
        html << "    <video controls class=\"video-player\">\n"
             << "        <source src=\"" << escape_html(*thread.media_url) << "\" type=\"video/mp4\">\n"
             << "        Your browser does not support the video tag.\n"
             << "    </video>\n";
    } else {
        html << "    <img src=\"" << escape_html(*thread.media_url)
             << "\" alt=\"Thread Image\" class=\"toggle-image\">\n";
    }
    html << "</div>\n";
    return html.str();
}

std::string PageRenderer::render_thread(const board::Thread& thread, bool with_reply_link) const {
    std::ostringstream html;
    html << "<div class=\"post thread-post\">\n"
         << render_media(thread)
         << "    <div class=\"post-content\">\n"
         << "        <div class=\"post-header\">\n"
         << "            <span class=\"title\">" << escape_html(thread.title) << "</span>\n"
         << "            <span class=\"date\">" << time::to_string(thread.last_updated) << "</span>\n";
    if (with_reply_link) {
        html << "            <a href=\"/thread/" << thread.id << "\" class=\"reply-link\">Reply</a>\n";
    }
    html << "        </div>\n"
         << "        <div class=\"message\">" << escape_html(thread.message) << "</div>\n"
         << "    </div>\n"
         << "</div>\n";
    return html.str();
}

std::string PageRenderer::render_reply(const board::Reply& reply) const {
    std::ostringstream html;
    html << "<div class=\"post reply-post\">\n"
         << "    <div class=\"post-content\">\n"
         << "        <div class=\"post-header\">\n"
         << "            <span class=\"title\">Reply " << reply.id << "</span>\n"
         << "        </div>\n"
         << "        <div class=\"message\">" << escape_html(reply.message) << "</div>\n"
         << "    </div>\n"
         << "</div>\n";
    return html.str();
}

std::string PageRenderer::render_pagination(const board::Page& page) const {
    std::ostringstream html;
    html << "<div class=\"pagination\">";
    if (page.has_previous()) {
        html << "<a href=\"/?page=" << page.page - 1 << "\">Previous</a>";
    }
    for (int64_t i = 1; i <= page.total_pages; ++i) {
        if (i == page.page) {
            html << "<span class=\"current\">" << i << "</span>";
        } else {
            html << "<a href=\"/?page=" << i << "\">" << i << "</a>";
        }
    }
    if (page.has_next()) {
        html << "<a href=\"/?page=" << page.page + 1 << "\">Next</a>";
    }
    html << "</div>";
    return html.str();
}

std::string PageRenderer::render_homepage(const board::Page& page) const {
    std::ostringstream html;
    html << render_head(config_.board_name)
         << "<body>\n"
         << "    <div class=\"logo\">" << escape_html(config_.board_name) << "</div>\n"
         << "    <hr>\n"
         << "    <div id=\"post-form-container\">\n"
         << "        <form class=\"postform\" action=\"/thread\" method=\"post\" enctype=\"multipart/form-data\">\n"
         << "            <input type=\"text\" id=\"title\" name=\"title\" maxlength=\""
         << constants::MAX_TITLE_LENGTH << "\" placeholder=\"Title\" required aria-label=\"Title\">\n"
         << "            <textarea id=\"message\" name=\"message\" rows=\"4\" maxlength=\""
         << constants::MAX_MESSAGE_LENGTH << "\" placeholder=\"Message\" required aria-label=\"Message\"></textarea>\n"
         << "            <label for=\"media\">Upload Media (JPEG, PNG, GIF, WEBP, MP4 - optional):</label>\n"
         << "            <input type=\"file\" id=\"media\" name=\"media\" accept=\".jpg,.jpeg,.png,.gif,.webp,.mp4\">\n"
         << "            <input type=\"submit\" value=\"Create Thread\">\n"
         << "        </form>\n"
         << "    </div>\n"
         << "    <hr>\n"
         << "    <div class=\"postlists\">\n";

    if (page.items.empty()) {
        html << "<p>No threads found. Be the first to create one!</p>\n";
    } else {
        for (size_t i = 0; i < page.items.size(); ++i) {
            if (i > 0) {
                html << "<hr>\n";
            }
            html << render_thread(page.items[i], true);
        }
    }

    html << "    </div>\n"
         << "    " << render_pagination(page) << "\n"
         << "    <div class=\"footer\">- " << escape_html(config_.board_name) << " " << TINYBOARD_VERSION_STRING
         << " -</div>\n"
         << "</body>\n"
         << "</html>\n";
    return html.str();
}

std::string PageRenderer::render_thread_page(const board::Thread& thread,
                                             const std::vector<board::Reply>& replies) const {
    std::ostringstream html;
    html << render_head("Thread - " + thread.title)
         << "<body>\n"
         << "    <div class=\"replymode\">\n"
         << "        <strong>Reply Mode</strong> | <a href=\"/\">Back to Main Board</a>\n"
         << "    </div>\n"
         << "    <br>\n"
         << "    <div class=\"postarea-container\">\n"
         << "        <form class=\"postform\" action=\"/reply\" method=\"post\">\n"
         << "            <input type=\"hidden\" name=\"parent_id\" value=\"" << thread.id << "\">\n"
         << "            <textarea id=\"message\" name=\"message\" rows=\"4\" maxlength=\""
         << constants::MAX_MESSAGE_LENGTH << "\" placeholder=\"Message\" required aria-label=\"Message\"></textarea>\n"
         << "            <input type=\"submit\" value=\"Reply\">\n"
         << "        </form>\n"
         << "    </div>\n"
         << "    <br>\n"
         << render_thread(thread, false)
         << "    <hr>\n"
         << "    <div class=\"postlists\">\n";

    if (replies.empty()) {
        html << "<p>No replies yet. Be the first to reply!</p>\n";
    } else {
        for (size_t i = 0; i < replies.size(); ++i) {
            if (i > 0) {
                html << "<hr>\n";
            }
            html << render_reply(replies[i]);
        }
    }

    html << "    </div>\n"
         << "    <div class=\"footer\">- " << escape_html(config_.board_name) << " -</div>\n"
         << "</body>\n"
         << "</html>\n";
    return html.str();
}

std::string PageRenderer::render_error_page(const std::string& title,
                                            const std::string& message) const {
    std::ostringstream html;
    html << "<!DOCTYPE html>\n"
         << "<html lang=\"en\">\n"
         << "<head>\n"
         << "    <meta charset=\"UTF-8\">\n"
         << "    <title>Error - " << escape_html(title) << "</title>\n"
         << "    <link rel=\"stylesheet\" href=\"" << escape_html(config_.stylesheet_url) << "\">\n"
         << "</head>\n"
         << "<body>\n"
         << "    <div class=\"error-container\">\n"
         << "        <h1>" << escape_html(title) << "</h1>\n"
         << "        <p>" << escape_html(message) << "</p>\n"
         << "        <a href=\"/\">Back to Home</a>\n"
         << "    </div>\n"
         << "</body>\n"
         << "</html>\n";
    return html.str();
}

} // namespace gateway
} // namespace tinyboard
