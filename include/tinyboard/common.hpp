#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <memory>
#include <optional>

// tinyboard version
#define TINYBOARD_VERSION_MAJOR 0
#define TINYBOARD_VERSION_MINOR 1
#define TINYBOARD_VERSION_PATCH 0
#define TINYBOARD_VERSION_STRING "0.1.0"

// Platform detection
#if defined(_WIN32) || defined(_WIN64)
    #ifndef TINYBOARD_PLATFORM_WINDOWS
        #define TINYBOARD_PLATFORM_WINDOWS
    #endif
#elif defined(__linux__)
    #ifndef TINYBOARD_PLATFORM_LINUX
        #define TINYBOARD_PLATFORM_LINUX
    #endif
#elif defined(__APPLE__)
    #ifndef TINYBOARD_PLATFORM_MACOS
        #define TINYBOARD_PLATFORM_MACOS
    #endif
#endif

// Utility macros
#define TINYBOARD_UNUSED(x) (void)(x)
#define TINYBOARD_DISALLOW_COPY(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete

#define TINYBOARD_DISALLOW_MOVE(TypeName) \
    TypeName(TypeName&&) = delete; \
    TypeName& operator=(TypeName&&) = delete

#define TINYBOARD_DISALLOW_COPY_AND_MOVE(TypeName) \
    TINYBOARD_DISALLOW_COPY(TypeName); \
    TINYBOARD_DISALLOW_MOVE(TypeName)

// Constants
namespace tinyboard {
namespace constants {

// Board limits
constexpr size_t MAX_TITLE_LENGTH = 75;      // code points
constexpr size_t MAX_MESSAGE_LENGTH = 8000;  // code points
constexpr int64_t PAGE_SIZE = 10;

// Media limits
constexpr uint32_t THUMBNAIL_MAX_DIMENSION = 200;
constexpr uint64_t MAX_DECODED_PIXELS = 40ull * 1000 * 1000;
constexpr size_t DEFAULT_MAX_UPLOAD_BYTES = 50 * 1024 * 1024; // 50 MB

// Gateway defaults
constexpr uint16_t DEFAULT_HTTP_PORT = 8080;
constexpr size_t DEFAULT_WORKER_THREADS = 8;

// Public URL prefixes served by the static mounts
constexpr const char* IMAGE_UPLOAD_URL_PREFIX = "/uploads/images/";
constexpr const char* VIDEO_UPLOAD_URL_PREFIX = "/uploads/videos/";
constexpr const char* IMAGE_THUMB_URL_PREFIX = "/thumbs/images/";

} // namespace constants
} // namespace tinyboard

// Core types
namespace tinyboard {

// Basic types
using byte = uint8_t;
using bytes = std::vector<byte>;

// Thread and reply identifiers
using ThreadId = int64_t;
using ReplyId = int64_t;

// String helpers shared by the board and the gateway
std::string trim(const std::string& text);
bool is_blank(const std::string& text);
std::string to_lower(std::string text);

/**
 * Number of Unicode code points in a UTF-8 string.
 * Continuation bytes are not counted; malformed sequences count per lead byte.
 */
size_t utf8_length(const std::string& text);

} // namespace tinyboard
