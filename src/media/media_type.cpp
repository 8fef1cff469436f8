#include "media_type.hpp"
#include "tinyboard/common.hpp"
#include <unordered_map>

namespace tinyboard::media {

namespace {

struct MimeEntry {
    const char* type;
    const char* subtype;
};

const std::unordered_map<std::string, MimeEntry>& extension_table() {
    static const std::unordered_map<std::string, MimeEntry> table = {
        // Images
        {"jpg",  {"image", "jpeg"}},
        {"jpeg", {"image", "jpeg"}},
        {"jpe",  {"image", "jpeg"}},
        {"jfif", {"image", "jpeg"}},
        {"png",  {"image", "png"}},
        {"gif",  {"image", "gif"}},
        {"webp", {"image", "webp"}},
        {"bmp",  {"image", "bmp"}},
        {"tif",  {"image", "tiff"}},
        {"tiff", {"image", "tiff"}},
        {"ico",  {"image", "x-icon"}},
        {"svg",  {"image", "svg+xml"}},
        {"avif", {"image", "avif"}},
        {"heic", {"image", "heic"}},

        // Video
        {"mp4",  {"video", "mp4"}},
        {"m4v",  {"video", "x-m4v"}},
        {"webm", {"video", "webm"}},
        {"mov",  {"video", "quicktime"}},
        {"avi",  {"video", "x-msvideo"}},
        {"mkv",  {"video", "x-matroska"}},
        {"mpeg", {"video", "mpeg"}},
        {"mpg",  {"video", "mpeg"}},
        {"ogv",  {"video", "ogg"}},

        // Audio
        {"mp3",  {"audio", "mpeg"}},
        {"ogg",  {"audio", "ogg"}},
        {"wav",  {"audio", "wav"}},

        // Documents
        {"txt",  {"text", "plain"}},
        {"html", {"text", "html"}},
        {"htm",  {"text", "html"}},
        {"css",  {"text", "css"}},
        {"js",   {"application", "javascript"}},
        {"json", {"application", "json"}},
        {"pdf",  {"application", "pdf"}},
        {"zip",  {"application", "zip"}},
    };
    return table;
}

} // anonymous namespace

MediaTypeGuess MediaTypeGuess::from_filename(const std::string& filename) {
    auto dot = filename.find_last_of('.');
    auto slash = filename.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash) ||
        dot + 1 == filename.size()) {
        return {"application", "octet-stream"};
    }

    auto ext = to_lower(filename.substr(dot + 1));
    const auto& table = extension_table();
    auto it = table.find(ext);
    if (it == table.end()) {
        return {"application", "octet-stream"};
    }
    return {it->second.type, it->second.subtype};
}

} // namespace tinyboard::media
