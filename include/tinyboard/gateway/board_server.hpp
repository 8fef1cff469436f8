#pragma once

#include "tinyboard/common.hpp"
#include "tinyboard/error.hpp"
#include "tinyboard/gateway/page_renderer.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>

namespace tinyboard {

// Forward declarations
namespace board {
class ContentRepository;
struct Thread;
}
namespace media { class MediaIngestionPipeline; }

namespace gateway {

/**
 * HTTP status codes
 */
enum class HttpStatus {
    OK = 200,
    SEE_OTHER = 303,
    BAD_REQUEST = 400,
    NOT_FOUND = 404,
    PAYLOAD_TOO_LARGE = 413,
    INTERNAL_ERROR = 500
};

/**
 * HTTP response representation
 */
struct HttpResponse {
    HttpStatus status;
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    HttpResponse() : status(HttpStatus::OK) {
        headers["Content-Type"] = "text/html; charset=utf-8";
    }

    void set_html_body(const std::string& html) {
        body = html;
        headers["Content-Type"] = "text/html; charset=utf-8";
    }

    void redirect(const std::string& location) {
        status = HttpStatus::SEE_OTHER;
        headers["Location"] = location;
        body.clear();
    }
};

/**
 * Board server configuration
 */
struct BoardServerConfig {
    std::string bind_address{"0.0.0.0"};
    uint16_t http_port{constants::DEFAULT_HTTP_PORT};   // 0 picks a free port
    size_t worker_threads{constants::DEFAULT_WORKER_THREADS};

    // Whole request body limit; uploads are additionally capped by the pipeline
    size_t max_request_body_size{constants::DEFAULT_MAX_UPLOAD_BYTES + 1024 * 1024};

    // Static file serving (no directory listing)
    std::string static_dir{"./static"};

    PageRendererConfig pages;
};

/**
 * HTTP front end of the board.
 *
 * Routes:
 *   GET  /                 homepage, ?page=N
 *   GET  /thread/{id}      thread view
 *   POST /thread           multipart: title, message, media
 *   POST /reply            form: parent_id, message
 * plus static mounts for /static and the media directories.
 */
class BoardServer {
public:
    BoardServer(const BoardServerConfig& config,
                std::shared_ptr<board::ContentRepository> repository,
                std::shared_ptr<media::MediaIngestionPipeline> pipeline);

    ~BoardServer();

    /**
     * Bind and start serving on a background thread
     * @return false if already running or the address cannot be bound
     */
    bool start();

    /**
     * Stop serving and join the server thread
     */
    void stop();

    bool is_running() const { return running_; }

    /**
     * Port actually bound; valid after start()
     */
    uint16_t port() const { return bound_port_; }

    // Route handlers, independent of the HTTP transport
    HttpResponse handle_home(const std::string& page_param) const;
    HttpResponse handle_thread(const std::string& id_param) const;
    HttpResponse handle_reply(const std::string& parent_id_param, const std::string& message);

    /**
     * Map the result of a multipart thread submission to a response
     */
    HttpResponse respond_to_submission(const Result<board::Thread>& result) const;

private:
    /**
     * Setup HTTP server routes and mounts
     */
    void setup_http_routes();

    HttpResponse error_page(HttpStatus status, const std::string& title,
                            const std::string& message) const;

    /**
     * Error page for a failed operation; internal failures are logged
     * and shown with a generic message
     */
    HttpResponse error_response(const Error& error, const std::string& context) const;

    BoardServerConfig config_;
    std::shared_ptr<board::ContentRepository> repository_;
    std::shared_ptr<media::MediaIngestionPipeline> pipeline_;
    PageRenderer renderer_;

    std::atomic<bool> running_{false};
    uint16_t bound_port_{0};
    std::thread server_thread_;

    // HTTP server (forward declared, defined in cpp)
    class HttpServerImpl;
    std::unique_ptr<HttpServerImpl> http_server_;
};

} // namespace gateway
} // namespace tinyboard
