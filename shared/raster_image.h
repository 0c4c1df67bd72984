// raster_image.h - CPU-resident RGBA8 image returned by capture-mode frames

#ifndef TESSERA_RASTER_IMAGE_H
#define TESSERA_RASTER_IMAGE_H

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "brush.h"

namespace tessera {

/**
 * Tightly packed width x height x RGBA8 pixels, straight (unpremultiplied) alpha,
 * rows top to bottom.
 */
struct RasterImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;

    RasterImage() = default;
    RasterImage(uint32_t w, uint32_t h) : width(w), height(h), pixels(size_t(w) * size_t(h) * 4, 0) {}

    bool empty() const { return width == 0 || height == 0; }

    size_t rowBytes() const { return size_t(width) * 4; }

    Color pixelAt(uint32_t x, uint32_t y) const {
        size_t i = (size_t(y) * width + x) * 4;
        return {pixels[i], pixels[i + 1], pixels[i + 2], pixels[i + 3]};
    }

    /**
     * Build an image from a row-padded buffer, dropping the padding of each row.
     * @param src       first byte of the padded buffer
     * @param srcStride bytes per padded row (>= width * 4)
     */
    static RasterImage fromPadded(const uint8_t* src, size_t srcStride, uint32_t w, uint32_t h) {
        RasterImage img(w, h);
        const size_t rowSize = img.rowBytes();
        for (uint32_t row = 0; row < h; ++row) {
            const uint8_t* line = src + size_t(row) * srcStride;
            std::copy(line, line + rowSize, img.pixels.begin() + size_t(row) * rowSize);
        }
        return img;
    }
};

}  // namespace tessera

#endif  // TESSERA_RASTER_IMAGE_H
