#include "tinyboard/gateway/board_server.hpp"
#include "thread_submission.hpp"
#include "../board/pagination.hpp"
#include "../board/repository.hpp"
#include "../media/ingestion.hpp"
#include "../utils/logger.hpp"
#include "tinyboard/time_utils.hpp"

#include <httplib.h>

#include <charconv>
#include <optional>

namespace tinyboard {
namespace gateway {

// Wrapper for httplib::Server to avoid exposing it in public header
class BoardServer::HttpServerImpl {
public:
    httplib::Server server;
};

namespace {

std::optional<int64_t> parse_id(const std::string& text) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

void apply(const HttpResponse& from, httplib::Response& to) {
    to.status = static_cast<int>(from.status);
    std::string content_type = "text/html; charset=utf-8";
    for (const auto& [key, value] : from.headers) {
        if (key == "Content-Type") {
            content_type = value;
        } else {
            to.set_header(key, value);
        }
    }
    to.set_content(from.body, content_type);
}

// Runs a handler, turning escaped exceptions into a 500
template<typename Handler>
void dispatch(const PageRenderer& renderer, httplib::Response& res, Handler&& handler) {
    try {
        apply(handler(), res);
    } catch (const std::exception& e) {
        TINYBOARD_LOG_ERROR("Handler error: {}", e.what());
        HttpResponse response;
        response.status = HttpStatus::INTERNAL_ERROR;
        response.set_html_body(renderer.render_error_page(
            "Server Error", "Something went wrong. Please try again later."));
        apply(response, res);
    }
}

void mount(httplib::Server& server, const std::string& url, const std::string& dir) {
    if (server.set_mount_point(url, dir)) {
        TINYBOARD_LOG_DEBUG("Serving {} from {}", url, dir);
    } else {
        TINYBOARD_LOG_WARN("Cannot serve {}: directory {} does not exist", url, dir);
    }
}

// Mount URLs are the public prefixes without the trailing slash
std::string mount_url(const char* prefix) {
    std::string url(prefix);
    if (url.size() > 1 && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // anonymous namespace

BoardServer::BoardServer(const BoardServerConfig& config,
                         std::shared_ptr<board::ContentRepository> repository,
                         std::shared_ptr<media::MediaIngestionPipeline> pipeline)
    : config_(config)
    , repository_(std::move(repository))
    , pipeline_(std::move(pipeline))
    , renderer_(config.pages)
    , http_server_(std::make_unique<HttpServerImpl>())
{
    setup_http_routes();
}

BoardServer::~BoardServer() {
    if (running_) {
        stop();
    }
}

bool BoardServer::start() {
    if (running_) {
        TINYBOARD_LOG_WARN("Board server already running");
        return false;
    }

    auto& server = http_server_->server;
    if (config_.http_port == 0) {
        int port = server.bind_to_any_port(config_.bind_address);
        if (port <= 0) {
            TINYBOARD_LOG_ERROR("Failed to bind to {}", config_.bind_address);
            return false;
        }
        bound_port_ = static_cast<uint16_t>(port);
    } else {
        if (!server.bind_to_port(config_.bind_address, config_.http_port)) {
            TINYBOARD_LOG_ERROR("Failed to bind to {}:{}", config_.bind_address, config_.http_port);
            return false;
        }
        bound_port_ = config_.http_port;
    }

    running_ = true;

    server_thread_ = std::thread([this]() {
        TINYBOARD_LOG_DEBUG("HTTP server thread starting");

        // Blocks until stop() is called
        if (!http_server_->server.listen_after_bind() && running_) {
            TINYBOARD_LOG_ERROR("HTTP server on port {} stopped unexpectedly", bound_port_);
        }

        TINYBOARD_LOG_DEBUG("HTTP server thread exiting");
    });

    TINYBOARD_LOG_INFO("Board server listening on {}:{}", config_.bind_address, bound_port_);
    return true;
}

void BoardServer::stop() {
    if (!running_) {
        return;
    }

    TINYBOARD_LOG_INFO("Stopping board server");
    running_ = false;

    // Unblocks listen_after_bind()
    http_server_->server.stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    TINYBOARD_LOG_INFO("Board server stopped");
}

void BoardServer::setup_http_routes() {
    auto& server = http_server_->server;

    const size_t workers = config_.worker_threads > 0 ? config_.worker_threads : 1;
    server.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    server.set_payload_max_length(config_.max_request_body_size);

    // GET / - homepage
    server.Get("/", [this](const httplib::Request& req, httplib::Response& res) {
        dispatch(renderer_, res, [&] {
            return handle_home(req.has_param("page") ? req.get_param_value("page") : "");
        });
    });

    // GET /thread/{id} - thread view
    server.Get(R"(/thread/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        dispatch(renderer_, res, [&] {
            return handle_thread(req.matches[1]);
        });
    });

    // POST /thread - create thread, body streamed part by part
    server.Post("/thread", [this](const httplib::Request& req, httplib::Response& res,
                                  const httplib::ContentReader& content_reader) {
        dispatch(renderer_, res, [&] {
            if (!req.is_multipart_form_data()) {
                return error_page(HttpStatus::BAD_REQUEST, "Bad Request",
                                  "Thread submissions must be multipart/form-data.");
            }

            ThreadSubmission submission(*repository_, *pipeline_);
            bool complete = content_reader(
                [&](const httplib::MultipartFormData& part) {
                    return submission.on_part(part.name, part.filename);
                },
                [&](const char* data, size_t length) {
                    return submission.on_data(data, length);
                });
            return respond_to_submission(submission.finish(complete));
        });
    });

    // POST /reply - url-encoded form
    server.Post("/reply", [this](const httplib::Request& req, httplib::Response& res) {
        dispatch(renderer_, res, [&] {
            return handle_reply(req.get_param_value("parent_id"), req.get_param_value("message"));
        });
    });

    // Static content
    const auto& paths = pipeline_->paths();
    mount(server, "/static", config_.static_dir);
    mount(server, mount_url(constants::IMAGE_UPLOAD_URL_PREFIX), paths.image_upload_dir.string());
    mount(server, mount_url(constants::VIDEO_UPLOAD_URL_PREFIX), paths.video_upload_dir.string());
    mount(server, mount_url(constants::IMAGE_THUMB_URL_PREFIX), paths.image_thumb_dir.string());

    // Not found for anything else
    server.set_error_handler([this](const httplib::Request&, httplib::Response& res) {
        if (res.status == static_cast<int>(HttpStatus::NOT_FOUND) && res.body.empty()) {
            res.set_content(renderer_.render_error_page("Not Found", "The page you requested does not exist."),
                            "text/html; charset=utf-8");
        } else if (res.status == static_cast<int>(HttpStatus::PAYLOAD_TOO_LARGE) && res.body.empty()) {
            res.set_content(renderer_.render_error_page("Upload Too Large",
                                                        "The request body exceeds the size limit."),
                            "text/html; charset=utf-8");
        }
    });

    // Access log
    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        TINYBOARD_LOG_INFO("{} {} {}", req.method, req.path, res.status);
    });

    TINYBOARD_LOG_DEBUG("HTTP routes configured");
}

HttpResponse BoardServer::error_page(HttpStatus status, const std::string& title,
                                     const std::string& message) const {
    HttpResponse response;
    response.status = status;
    response.set_html_body(renderer_.render_error_page(title, message));
    return response;
}

HttpResponse BoardServer::error_response(const Error& error, const std::string& context) const {
    switch (error.code()) {
        case ErrorCode::NotFound:
            return error_page(HttpStatus::NOT_FOUND, "Not Found", error.message());
        case ErrorCode::ValidationFailed:
        case ErrorCode::InvalidArgument:
            return error_page(HttpStatus::BAD_REQUEST, "Invalid Input", error.message());
        case ErrorCode::UnsupportedMediaType:
            return error_page(HttpStatus::BAD_REQUEST, "Unsupported Media", error.message());
        case ErrorCode::InvalidMedia:
            return error_page(HttpStatus::BAD_REQUEST, "Invalid Media", error.message());
        case ErrorCode::PayloadTooLarge:
            return error_page(HttpStatus::PAYLOAD_TOO_LARGE, "Upload Too Large", error.message());
        default:
            break;
    }

    TINYBOARD_LOG_ERROR("{}: {}", context, error.to_string());
    return error_page(HttpStatus::INTERNAL_ERROR, "Server Error",
                      "Something went wrong. Please try again later.");
}

HttpResponse BoardServer::handle_home(const std::string& page_param) const {
    time::Timer timer;

    auto threads = repository_->list_threads();
    if (threads.is_err()) {
        return error_response(threads.error(), "Failed to list threads");
    }

    auto page = board::paginate(threads.unwrap(), board::parse_page_param(page_param));

    HttpResponse response;
    response.set_html_body(renderer_.render_homepage(page));

    TINYBOARD_LOG_DEBUG("Rendered page {}/{} ({} threads) in {:.1f} ms",
                        page.page, page.total_pages, page.total_items, timer.elapsed_milliseconds());
    return response;
}

HttpResponse BoardServer::handle_thread(const std::string& id_param) const {
    auto id = parse_id(id_param);
    if (!id) {
        return error_page(HttpStatus::NOT_FOUND, "Not Found", "Thread not found.");
    }

    auto thread = repository_->get_thread(*id);
    if (thread.is_err()) {
        return error_response(thread.error(), "Failed to load thread " + id_param);
    }
    if (!thread.value()) {
        return error_page(HttpStatus::NOT_FOUND, "Not Found", "Thread not found.");
    }

    auto replies = repository_->list_replies(*id);
    if (replies.is_err()) {
        return error_response(replies.error(), "Failed to load replies of thread " + id_param);
    }

    HttpResponse response;
    response.set_html_body(renderer_.render_thread_page(*thread.value(), replies.value()));
    return response;
}

HttpResponse BoardServer::handle_reply(const std::string& parent_id_param,
                                       const std::string& message) {
    auto parent_id = parse_id(trim(parent_id_param));
    if (!parent_id) {
        return error_page(HttpStatus::BAD_REQUEST, "Invalid Input", "Invalid thread id.");
    }

    auto reply = repository_->create_reply(*parent_id, message);
    if (reply.is_err()) {
        return error_response(reply.error(), "Failed to store reply");
    }

    HttpResponse response;
    response.redirect("/thread/" + std::to_string(*parent_id));
    return response;
}

HttpResponse BoardServer::respond_to_submission(const Result<board::Thread>& result) const {
    if (result.is_err()) {
        return error_response(result.error(), "Failed to create thread");
    }

    HttpResponse response;
    response.redirect("/");
    return response;
}

} // namespace gateway
} // namespace tinyboard
