// screenshot_utils.h - Writing captured frames to disk
// Binary PPM output with timestamped filenames

#ifndef TESSERA_SCREENSHOT_UTILS_H
#define TESSERA_SCREENSHOT_UTILS_H

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "raster_image.h"

namespace tessera {

// Largest capture we agree to write: 32768x32768
static constexpr uint32_t MAX_SCREENSHOT_DIM = 32768;

// Color applied under translucent pixels, since PPM has no alpha channel
static constexpr Color PPM_MATTE = Color::WHITE;

/**
 * Save a captured frame as PPM (P6, 24-bit RGB).
 * Alpha is composited over PPM_MATTE.
 *
 * @return false if the image is empty, oversized, or the write fails
 */
inline bool saveImagePPM(const RasterImage& image, const std::string& filename) {
    if (image.empty() || image.width > MAX_SCREENSHOT_DIM || image.height > MAX_SCREENSHOT_DIM) {
        std::cerr << "[Screenshot] Invalid image dimensions: " << image.width << "x" << image.height << std::endl;
        return false;
    }

    const size_t pixelCount = static_cast<size_t>(image.width) * static_cast<size_t>(image.height);
    if (image.pixels.size() < pixelCount * 4) {
        std::cerr << "[Screenshot] Pixel buffer too small: " << image.pixels.size() << " < " << pixelCount * 4
                  << std::endl;
        return false;
    }

    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[Screenshot] Failed to open file: " << filename << std::endl;
        return false;
    }

    file << "P6\n" << image.width << " " << image.height << "\n255\n";

    std::vector<uint8_t> rgb(pixelCount * 3);
    for (size_t i = 0; i < pixelCount; ++i) {
        const uint8_t* px = &image.pixels[i * 4];
        const unsigned alpha = px[3];
        const uint8_t matte[3] = {PPM_MATTE.r, PPM_MATTE.g, PPM_MATTE.b};
        for (int c = 0; c < 3; ++c) {
            rgb[i * 3 + c] = static_cast<uint8_t>((px[c] * alpha + matte[c] * (255 - alpha) + 127) / 255);
        }
    }

    file.write(reinterpret_cast<const char*>(rgb.data()), static_cast<std::streamsize>(rgb.size()));
    if (!file.good()) {
        std::cerr << "[Screenshot] Failed to write image data to: " << filename << std::endl;
        return false;
    }
    return true;
}

// capture_YYYYMMDD_HHMMSS_mmm_WxH.ppm
inline std::string generateScreenshotFilename(uint32_t width, uint32_t height) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    struct tm timeinfo;
    localtime_r(&time, &timeinfo);

    std::ostringstream ss;
    ss << "capture_" << std::put_time(&timeinfo, "%Y%m%d_%H%M%S") << "_" << std::setfill('0') << std::setw(3)
       << ms.count() << "_" << width << "x" << height << ".ppm";
    return ss.str();
}

}  // namespace tessera

#endif  // TESSERA_SCREENSHOT_UTILS_H
