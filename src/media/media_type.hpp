#pragma once

#include <string>

namespace tinyboard::media {

/**
 * MIME type guessed from a filename extension
 */
struct MediaTypeGuess {
    std::string type;      // "image", "video", "application", ...
    std::string subtype;   // "png", "mp4", "octet-stream", ...

    std::string essence() const { return type + "/" + subtype; }

    bool is_image() const { return type == "image"; }
    bool is_video() const { return type == "video"; }

    /**
     * Look up the extension of a filename (case-insensitive).
     * Unknown or missing extensions give application/octet-stream.
     */
    static MediaTypeGuess from_filename(const std::string& filename);
};

} // namespace tinyboard::media
