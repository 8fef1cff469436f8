#include "image_codec.hpp"
#include "utils/logger.hpp"
#include <cerrno>
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <vector>
#include <png.h>
#include <jpeglib.h>
#include <gif_lib.h>
#include <webp/decode.h>
#include <webp/encode.h>

namespace tinyboard::media {

namespace {

using FilePtr = std::unique_ptr<FILE, decltype(&std::fclose)>;

FilePtr open_file(const std::filesystem::path& path, const char* mode) {
    return FilePtr(std::fopen(path.string().c_str(), mode), &std::fclose);
}

Error invalid(ImageFormat format, const std::string& reason) {
    return Error(ErrorCode::InvalidMedia,
                 std::string("Not a valid ") + image_format_to_string(format) + " image", reason);
}

Result<void> check_dimensions(ImageFormat format, uint64_t width, uint64_t height,
                              uint64_t max_pixels) {
    if (width == 0 || height == 0) {
        return invalid(format, "zero-sized image");
    }
    if (width * height > max_pixels) {
        return invalid(format, std::to_string(width) + "x" + std::to_string(height) +
                               " exceeds the decode limit");
    }
    return Result<void>::Ok();
}

// PNG (simplified API)

Result<Image> decode_png(const std::filesystem::path& path, uint64_t max_pixels) {
    png_image png;
    std::memset(&png, 0, sizeof(png));
    png.version = PNG_IMAGE_VERSION;

    if (!png_image_begin_read_from_file(&png, path.string().c_str())) {
        std::string reason = png.message;
        png_image_free(&png);
        return invalid(ImageFormat::Png, reason);
    }

    auto dims = check_dimensions(ImageFormat::Png, png.width, png.height, max_pixels);
    if (dims.is_err()) {
        png_image_free(&png);
        return dims.error();
    }

    png.format = PNG_FORMAT_RGBA;

    Image image;
    image.width = png.width;
    image.height = png.height;
    image.pixels.resize(PNG_IMAGE_SIZE(png));

    if (!png_image_finish_read(&png, nullptr, image.pixels.data(), 0, nullptr)) {
        std::string reason = png.message;
        png_image_free(&png);
        return invalid(ImageFormat::Png, reason);
    }

    return Result<Image>::Ok(std::move(image));
}

Result<void> encode_png(const Image& image, const std::filesystem::path& path) {
    png_image png;
    std::memset(&png, 0, sizeof(png));
    png.version = PNG_IMAGE_VERSION;
    png.width = image.width;
    png.height = image.height;
    png.format = PNG_FORMAT_RGBA;

    if (!png_image_write_to_file(&png, path.string().c_str(), 0,
                                 image.pixels.data(), 0, nullptr)) {
        std::string reason = png.message;
        png_image_free(&png);
        return Error(ErrorCode::IoError, "Failed to write PNG " + path.string(), reason);
    }
    return Result<void>::Ok();
}

// JPEG (libjpeg reports errors through longjmp)

struct JpegErrorManager {
    jpeg_error_mgr pub;
    std::jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

void jpeg_error_exit(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    std::longjmp(err->jump, 1);
}

void jpeg_silent_output(j_common_ptr) {}

Result<Image> decode_jpeg(const std::filesystem::path& path, uint64_t max_pixels) {
    auto file = open_file(path, "rb");
    if (!file) {
        return Error(ErrorCode::IoError, "Cannot open " + path.string(), std::strerror(errno));
    }

    // Everything with a destructor lives above setjmp
    Image image;
    bytes row;

    jpeg_decompress_struct cinfo;
    JpegErrorManager jerr;
    std::memset(jerr.message, 0, sizeof(jerr.message));
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit;
    jerr.pub.output_message = jpeg_silent_output;

    if (setjmp(jerr.jump)) {
        jpeg_destroy_decompress(&cinfo);
        return invalid(ImageFormat::Jpeg, jerr.message);
    }

    jpeg_create_decompress(&cinfo);
    jpeg_stdio_src(&cinfo, file.get());
    jpeg_read_header(&cinfo, TRUE);

    {
        auto dims = check_dimensions(ImageFormat::Jpeg, cinfo.image_width, cinfo.image_height,
                                     max_pixels);
        if (dims.is_err()) {
            jpeg_destroy_decompress(&cinfo);
            return dims.error();
        }
    }

    cinfo.out_color_space = JCS_RGB;
    jpeg_start_decompress(&cinfo);

    image.width = cinfo.output_width;
    image.height = cinfo.output_height;
    image.pixels.resize(image.stride() * image.height);
    row.resize(static_cast<size_t>(cinfo.output_width) * cinfo.output_components);

    while (cinfo.output_scanline < cinfo.output_height) {
        JSAMPROW row_ptr = row.data();
        const auto y = cinfo.output_scanline;
        jpeg_read_scanlines(&cinfo, &row_ptr, 1);

        byte* out = image.pixels.data() + static_cast<size_t>(y) * image.stride();
        for (uint32_t x = 0; x < image.width; ++x) {
            out[x * 4 + 0] = row[x * 3 + 0];
            out[x * 4 + 1] = row[x * 3 + 1];
            out[x * 4 + 2] = row[x * 3 + 2];
            out[x * 4 + 3] = 0xFF;
        }
    }

    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);

    return Result<Image>::Ok(std::move(image));
}

Result<void> encode_jpeg(const Image& image, const std::filesystem::path& path, int quality) {
    auto file = open_file(path, "wb");
    if (!file) {
        return Error(ErrorCode::IoError, "Cannot create " + path.string(), std::strerror(errno));
    }

    bytes row(static_cast<size_t>(image.width) * 3);

    jpeg_compress_struct cinfo;
    JpegErrorManager jerr;
    std::memset(jerr.message, 0, sizeof(jerr.message));
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit;
    jerr.pub.output_message = jpeg_silent_output;

    if (setjmp(jerr.jump)) {
        jpeg_destroy_compress(&cinfo);
        return Error(ErrorCode::IoError, "Failed to write JPEG " + path.string(), jerr.message);
    }

    jpeg_create_compress(&cinfo);
    jpeg_stdio_dest(&cinfo, file.get());

    cinfo.image_width = image.width;
    cinfo.image_height = image.height;
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);
    jpeg_start_compress(&cinfo, TRUE);

    while (cinfo.next_scanline < cinfo.image_height) {
        const byte* in = image.pixels.data() + static_cast<size_t>(cinfo.next_scanline) * image.stride();
        for (uint32_t x = 0; x < image.width; ++x) {
            row[x * 3 + 0] = in[x * 4 + 0];
            row[x * 3 + 1] = in[x * 4 + 1];
            row[x * 3 + 2] = in[x * 4 + 2];
        }
        JSAMPROW row_ptr = row.data();
        jpeg_write_scanlines(&cinfo, &row_ptr, 1);
    }

    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);

    if (std::fflush(file.get()) != 0) {
        return Error(ErrorCode::IoError, "Failed to flush " + path.string(), std::strerror(errno));
    }
    return Result<void>::Ok();
}

// GIF (giflib 5)

std::string gif_error(int code) {
    const char* message = GifErrorString(code);
    return message ? message : "giflib error " + std::to_string(code);
}

struct GifCloser {
    void operator()(GifFileType* gif) const {
        int error = 0;
        DGifCloseFile(gif, &error);
    }
};

// Reads records up to the first frame only. A frame must lie inside the
// logical screen, so the screen check also bounds the raster allocation.
Result<Image> decode_gif(const std::filesystem::path& path, uint64_t max_pixels) {
    int error = 0;
    std::unique_ptr<GifFileType, GifCloser> gif(DGifOpenFileName(path.string().c_str(), &error));
    if (!gif) {
        return invalid(ImageFormat::Gif, gif_error(error));
    }

    auto dims = check_dimensions(ImageFormat::Gif, gif->SWidth, gif->SHeight, max_pixels);
    if (dims.is_err()) {
        return dims.error();
    }

    int transparent = NO_TRANSPARENT_COLOR;
    GifRecordType record = UNDEFINED_RECORD_TYPE;
    do {
        if (DGifGetRecordType(gif.get(), &record) != GIF_OK) {
            return invalid(ImageFormat::Gif, gif_error(gif->Error));
        }

        if (record == EXTENSION_RECORD_TYPE) {
            int code = 0;
            GifByteType* block = nullptr;
            if (DGifGetExtension(gif.get(), &code, &block) != GIF_OK) {
                return invalid(ImageFormat::Gif, gif_error(gif->Error));
            }
            if (code == GRAPHICS_EXT_FUNC_CODE && block) {
                GraphicsControlBlock gcb;
                if (DGifExtensionToGCB(block[0], block + 1, &gcb) == GIF_OK) {
                    transparent = gcb.TransparentColor;
                }
            }
            while (block) {
                if (DGifGetExtensionNext(gif.get(), &block) != GIF_OK) {
                    return invalid(ImageFormat::Gif, gif_error(gif->Error));
                }
            }
        }
    } while (record != IMAGE_DESC_RECORD_TYPE && record != TERMINATE_RECORD_TYPE);

    if (record != IMAGE_DESC_RECORD_TYPE) {
        return invalid(ImageFormat::Gif, "no image frames");
    }
    if (DGifGetImageDesc(gif.get()) != GIF_OK) {
        return invalid(ImageFormat::Gif, gif_error(gif->Error));
    }

    const GifImageDesc desc = gif->Image;
    if (desc.Width <= 0 || desc.Height <= 0 || desc.Left < 0 || desc.Top < 0 ||
        desc.Left + desc.Width > gif->SWidth || desc.Top + desc.Height > gif->SHeight) {
        return invalid(ImageFormat::Gif,
                       "frame " + std::to_string(desc.Width) + "x" + std::to_string(desc.Height) +
                       " at " + std::to_string(desc.Left) + "," + std::to_string(desc.Top) +
                       " lies outside the " + std::to_string(gif->SWidth) + "x" +
                       std::to_string(gif->SHeight) + " screen");
    }

    const ColorMapObject* palette = desc.ColorMap ? desc.ColorMap : gif->SColorMap;
    if (!palette) {
        return invalid(ImageFormat::Gif, "no color map");
    }

    // Interlaced frames deliver rows in four passes
    std::vector<int> row_order;
    row_order.reserve(static_cast<size_t>(desc.Height));
    if (desc.Interlace) {
        const int offsets[] = {0, 4, 2, 1};
        const int steps[] = {8, 8, 4, 2};
        for (int pass = 0; pass < 4; ++pass) {
            for (int y = offsets[pass]; y < desc.Height; y += steps[pass]) {
                row_order.push_back(y);
            }
        }
    } else {
        for (int y = 0; y < desc.Height; ++y) {
            row_order.push_back(y);
        }
    }

    Image image;
    image.width = static_cast<uint32_t>(gif->SWidth);
    image.height = static_cast<uint32_t>(gif->SHeight);
    image.pixels.assign(image.stride() * image.height, 0);

    std::vector<GifPixelType> line(static_cast<size_t>(desc.Width));
    for (int y : row_order) {
        if (DGifGetLine(gif.get(), line.data(), desc.Width) != GIF_OK) {
            return invalid(ImageFormat::Gif, gif_error(gif->Error));
        }
        byte* row = image.pixels.data() + static_cast<size_t>(desc.Top + y) * image.stride();
        for (int x = 0; x < desc.Width; ++x) {
            const int index = line[static_cast<size_t>(x)];
            if (index == transparent || index >= palette->ColorCount) {
                continue;
            }
            const GifColorType& color = palette->Colors[index];
            byte* out = row + static_cast<size_t>(desc.Left + x) * 4;
            out[0] = color.Red;
            out[1] = color.Green;
            out[2] = color.Blue;
            out[3] = 0xFF;
        }
    }

    return Result<Image>::Ok(std::move(image));
}

// WebP

Result<Image> decode_webp(const std::filesystem::path& path, uint64_t max_pixels) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error(ErrorCode::IoError, "Cannot open " + path.string());
    }
    bytes data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    int width = 0;
    int height = 0;
    if (!WebPGetInfo(data.data(), data.size(), &width, &height)) {
        return invalid(ImageFormat::Webp, "bad header");
    }

    auto dims = check_dimensions(ImageFormat::Webp, static_cast<uint64_t>(width),
                                 static_cast<uint64_t>(height), max_pixels);
    if (dims.is_err()) {
        return dims.error();
    }

    uint8_t* decoded = WebPDecodeRGBA(data.data(), data.size(), &width, &height);
    if (!decoded) {
        return invalid(ImageFormat::Webp, "decode failed");
    }

    Image image;
    image.width = static_cast<uint32_t>(width);
    image.height = static_cast<uint32_t>(height);
    image.pixels.assign(decoded, decoded + image.stride() * image.height);
    WebPFree(decoded);

    return Result<Image>::Ok(std::move(image));
}

Result<void> encode_webp(const Image& image, const std::filesystem::path& path, int quality) {
    uint8_t* encoded = nullptr;
    const size_t size = WebPEncodeRGBA(image.pixels.data(),
                                       static_cast<int>(image.width),
                                       static_cast<int>(image.height),
                                       static_cast<int>(image.stride()),
                                       static_cast<float>(quality), &encoded);
    if (size == 0 || !encoded) {
        WebPFree(encoded);
        return Error(ErrorCode::IoError, "Failed to encode WebP " + path.string());
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(encoded), static_cast<std::streamsize>(size));
    WebPFree(encoded);

    if (!out) {
        return Error(ErrorCode::IoError, "Failed to write " + path.string());
    }
    return Result<void>::Ok();
}

} // anonymous namespace

std::optional<ImageFormat> image_format_from_subtype(const std::string& subtype) {
    if (subtype == "png") return ImageFormat::Png;
    if (subtype == "jpeg") return ImageFormat::Jpeg;
    if (subtype == "gif") return ImageFormat::Gif;
    if (subtype == "webp") return ImageFormat::Webp;
    return std::nullopt;
}

const char* image_format_to_string(ImageFormat format) {
    switch (format) {
        case ImageFormat::Png: return "png";
        case ImageFormat::Jpeg: return "jpeg";
        case ImageFormat::Gif: return "gif";
        case ImageFormat::Webp: return "webp";
    }
    return "unknown";
}

Result<Image> ImageCodec::decode_file(const std::filesystem::path& path,
                                      ImageFormat format,
                                      uint64_t max_pixels) {
    switch (format) {
        case ImageFormat::Png: return decode_png(path, max_pixels);
        case ImageFormat::Jpeg: return decode_jpeg(path, max_pixels);
        case ImageFormat::Gif: return decode_gif(path, max_pixels);
        case ImageFormat::Webp: return decode_webp(path, max_pixels);
    }
    return Error(ErrorCode::InvalidArgument, "Unknown image format");
}

Result<void> ImageCodec::encode_file(const Image& image,
                                     ImageFormat format,
                                     const std::filesystem::path& path,
                                     int quality) {
    if (image.empty() || image.pixels.size() != image.stride() * image.height) {
        return Error(ErrorCode::InvalidArgument, "Image buffer does not match its dimensions");
    }

    TINYBOARD_LOG_TRACE("Encoding {}x{} {} to {}", image.width, image.height,
                        image_format_to_string(format), path.string());

    switch (format) {
        case ImageFormat::Png: return encode_png(image, path);
        case ImageFormat::Jpeg: return encode_jpeg(image, path, quality);
        case ImageFormat::Webp: return encode_webp(image, path, quality);
        case ImageFormat::Gif:
            return Error(ErrorCode::NotImplemented, "GIF encoding is not supported");
    }
    return Error(ErrorCode::InvalidArgument, "Unknown image format");
}

} // namespace tinyboard::media
