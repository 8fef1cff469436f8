#pragma once

#include "tinyboard/common.hpp"
#include "tinyboard/error.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace tinyboard::media {

/**
 * Still-image container formats accepted for upload
 */
enum class ImageFormat {
    Png,
    Jpeg,
    Gif,
    Webp
};

/**
 * Map a MIME subtype ("png", "jpeg", "gif", "webp") to a format
 */
std::optional<ImageFormat> image_format_from_subtype(const std::string& subtype);
const char* image_format_to_string(ImageFormat format);

/**
 * Decoded raster, 8-bit RGBA, rows top to bottom, no padding
 */
struct Image {
    uint32_t width{0};
    uint32_t height{0};
    bytes pixels;

    size_t stride() const { return static_cast<size_t>(width) * 4; }
    bool empty() const { return width == 0 || height == 0; }
};

/**
 * Decoding and encoding through libpng, libjpeg, giflib and libwebp.
 *
 * Files are decoded as the declared format only; a PNG renamed to .jpg
 * fails to decode. Only the first frame of an animated GIF is decoded.
 */
class ImageCodec {
public:
    /**
     * Decode a file
     * @param path File to read
     * @param format Declared format
     * @param max_pixels Images with more pixels are rejected before the
     *        raster is allocated
     * @return Decoded image, InvalidMedia if the data is not a valid image
     *         of that format, IoError if the file cannot be read
     */
    static Result<Image> decode_file(const std::filesystem::path& path,
                                     ImageFormat format,
                                     uint64_t max_pixels = constants::MAX_DECODED_PIXELS);

    /**
     * Encode an image to a file. GIF output is not supported.
     * @param quality Lossy quality 1-100, ignored for PNG
     */
    static Result<void> encode_file(const Image& image,
                                    ImageFormat format,
                                    const std::filesystem::path& path,
                                    int quality = 85);
};

} // namespace tinyboard::media
