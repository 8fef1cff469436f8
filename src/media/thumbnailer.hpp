#pragma once

#include "image_codec.hpp"

namespace tinyboard::media {

struct Dimensions {
    uint32_t width{0};
    uint32_t height{0};
};

/**
 * Box-filter downscaler for thumbnails
 */
class Thumbnailer {
public:
    /**
     * Largest size that fits inside bound x bound with the same aspect
     * ratio. Never larger than the input, never below 1x1.
     */
    static Dimensions fit_within(uint32_t width, uint32_t height, uint32_t bound);

    /**
     * Area-averaging resample to an exact size. Colour is weighted by
     * alpha so transparent pixels do not darken edges.
     */
    static Image resize(const Image& source, uint32_t width, uint32_t height);

    /**
     * Downscale to fit within bound x bound; a copy if already small enough
     */
    static Image make_thumbnail(const Image& source,
                                uint32_t bound = constants::THUMBNAIL_MAX_DIMENSION);
};

} // namespace tinyboard::media
