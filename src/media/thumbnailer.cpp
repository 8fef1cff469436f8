#include "thumbnailer.hpp"
#include <algorithm>

namespace tinyboard::media {

Dimensions Thumbnailer::fit_within(uint32_t width, uint32_t height, uint32_t bound) {
    if (width == 0 || height == 0 || bound == 0) {
        return {0, 0};
    }
    if (width <= bound && height <= bound) {
        return {width, height};
    }

    const uint64_t w = width;
    const uint64_t h = height;
    Dimensions out;
    if (w >= h) {
        out.width = bound;
        out.height = static_cast<uint32_t>((h * bound + w / 2) / w);
    } else {
        out.height = bound;
        out.width = static_cast<uint32_t>((w * bound + h / 2) / h);
    }
    out.width = std::clamp<uint32_t>(out.width, 1, bound);
    out.height = std::clamp<uint32_t>(out.height, 1, bound);
    return out;
}

Image Thumbnailer::resize(const Image& source, uint32_t width, uint32_t height) {
    Image out;
    if (source.empty() || width == 0 || height == 0) {
        return out;
    }

    out.width = width;
    out.height = height;
    out.pixels.resize(out.stride() * height);

    const uint64_t sw = source.width;
    const uint64_t sh = source.height;

    for (uint32_t y = 0; y < height; ++y) {
        const uint64_t y0 = y * sh / height;
        const uint64_t y1 = std::max(y0 + 1, (y + 1) * sh / height);

        for (uint32_t x = 0; x < width; ++x) {
            const uint64_t x0 = x * sw / width;
            const uint64_t x1 = std::max(x0 + 1, (x + 1) * sw / width);

            uint64_t r = 0, g = 0, b = 0, a = 0;
            for (uint64_t sy = y0; sy < y1; ++sy) {
                const byte* row = source.pixels.data() + sy * source.stride();
                for (uint64_t sx = x0; sx < x1; ++sx) {
                    const byte* p = row + sx * 4;
                    const uint64_t alpha = p[3];
                    r += p[0] * alpha;
                    g += p[1] * alpha;
                    b += p[2] * alpha;
                    a += alpha;
                }
            }

            const uint64_t count = (x1 - x0) * (y1 - y0);
            byte* dst = out.pixels.data() + static_cast<size_t>(y) * out.stride() + x * 4;
            if (a > 0) {
                dst[0] = static_cast<byte>((r + a / 2) / a);
                dst[1] = static_cast<byte>((g + a / 2) / a);
                dst[2] = static_cast<byte>((b + a / 2) / a);
            } else {
                dst[0] = dst[1] = dst[2] = 0;
            }
            dst[3] = static_cast<byte>((a + count / 2) / count);
        }
    }

    return out;
}

Image Thumbnailer::make_thumbnail(const Image& source, uint32_t bound) {
    auto target = fit_within(source.width, source.height, bound);
    if (target.width == source.width && target.height == source.height) {
        return source;
    }
    return resize(source, target.width, target.height);
}

} // namespace tinyboard::media
