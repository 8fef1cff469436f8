#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <thread>

// Storage
#include "storage/kv_store.hpp"

// Board
#include "board/repository.hpp"

// Media
#include "media/ingestion.hpp"

// Gateway
#include "tinyboard/gateway/board_server.hpp"

// Utilities
#include "utils/logger.hpp"
#include "utils/config.hpp"
#include "tinyboard/common.hpp"

// Global flag for graceful shutdown
std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = true;
    }
}

int main(int argc, char** argv) {
    try {
        // Install signal handlers
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // Determine config file path
        std::string config_path = "tinyboard.json";
        if (argc > 1) {
            config_path = argv[1];
        }

        // Load configuration (defaults apply to every missing key)
        tinyboard::utils::Config config;
        bool config_loaded = false;
        if (std::filesystem::exists(config_path)) {
            config = tinyboard::utils::Config::load_from_file(config_path);
            config_loaded = true;
        }

        // Initialize logging
        auto log_level = config.get_or<std::string>("log_level", "info");
        auto log_to_file = config.get_or<bool>("log_to_file", false);
        tinyboard::utils::Logger::init(log_level, log_to_file);

        TINYBOARD_LOG_INFO("=================================================");
        TINYBOARD_LOG_INFO("    tinyboard v{}.{}.{}",
            TINYBOARD_VERSION_MAJOR,
            TINYBOARD_VERSION_MINOR,
            TINYBOARD_VERSION_PATCH
        );
        TINYBOARD_LOG_INFO("=================================================");
        if (config_loaded) {
            TINYBOARD_LOG_INFO("Configuration loaded from {}", config_path);
        } else {
            TINYBOARD_LOG_INFO("No {} found, using defaults", config_path);
        }

        // 1. Store
        tinyboard::storage::KvStoreOptions store_options;
        store_options.sync_writes = config.get_or<bool>("sync_writes", false);
        store_options.cache_size_mb = config.get_or<size_t>("cache_size_mb", 8);
        auto db_path = config.get_or<std::string>("db_path", "board_db");
        auto store = std::make_shared<tinyboard::storage::KvStore>(db_path, store_options);

        // 2. Media pipeline
        tinyboard::media::MediaPaths media_paths;
        media_paths.image_upload_dir = config.get_or<std::string>("image_upload_dir", "./uploads/images/");
        media_paths.video_upload_dir = config.get_or<std::string>("video_upload_dir", "./uploads/videos/");
        media_paths.image_thumb_dir = config.get_or<std::string>("image_thumb_dir", "./thumbs/images/");
        auto max_upload_bytes = config.get_or<size_t>(
            "max_upload_bytes", tinyboard::constants::DEFAULT_MAX_UPLOAD_BYTES);
        auto pipeline = std::make_shared<tinyboard::media::MediaIngestionPipeline>(
            media_paths, max_upload_bytes);

        // 3. Repository
        auto repository = std::make_shared<tinyboard::board::ContentRepository>(store);
        auto thread_count = repository->thread_count();
        if (thread_count.is_err()) {
            TINYBOARD_LOG_ERROR("Store is unreadable: {}", thread_count.error().to_string());
            return 1;
        }

        // 4. HTTP server
        tinyboard::gateway::BoardServerConfig server_config;
        server_config.bind_address = config.get_or<std::string>("bind_address", "0.0.0.0");
        server_config.http_port = config.get_or<uint16_t>("http_port", tinyboard::constants::DEFAULT_HTTP_PORT);
        server_config.worker_threads = config.get_or<size_t>(
            "worker_threads", tinyboard::constants::DEFAULT_WORKER_THREADS);
        server_config.max_request_body_size = max_upload_bytes + 1024 * 1024;
        server_config.static_dir = config.get_or<std::string>("static_dir", "./static");

        auto server = std::make_unique<tinyboard::gateway::BoardServer>(server_config, repository, pipeline);
        if (!server->start()) {
            TINYBOARD_LOG_ERROR("Failed to start board server");
            return 1;
        }

        TINYBOARD_LOG_INFO("");
        TINYBOARD_LOG_INFO(" tinyboard is running!");
        TINYBOARD_LOG_INFO("");
        TINYBOARD_LOG_INFO("  Board:      http://localhost:{}/", server->port());
        TINYBOARD_LOG_INFO("  Database:   {} ({} threads)", db_path, thread_count.value());
        TINYBOARD_LOG_INFO("  Uploads:    {}, {}", media_paths.image_upload_dir.string(),
                           media_paths.video_upload_dir.string());
        TINYBOARD_LOG_INFO("");
        TINYBOARD_LOG_INFO("Press Ctrl+C to shutdown");

        while (!g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
        }

        TINYBOARD_LOG_INFO("Shutting down...");
        server->stop();

        auto flushed = store->flush();
        if (flushed.is_err()) {
            TINYBOARD_LOG_ERROR("Final flush failed: {}", flushed.error().to_string());
        }

        TINYBOARD_LOG_INFO("Stopped. Goodbye!");

    } catch (const std::exception& e) {
        TINYBOARD_LOG_ERROR("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
