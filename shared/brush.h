// brush.h - Fill descriptions resolved into backend paints per draw call

#ifndef TESSERA_BRUSH_H
#define TESSERA_BRUSH_H

#include <cstdint>
#include <memory>
#include <variant>
#include <vector>

#include "geometry.h"

namespace tessera {

struct RasterImage;

// 8-bit straight-alpha RGBA color
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    constexpr Color() = default;
    constexpr Color(uint8_t red, uint8_t green, uint8_t blue, uint8_t alpha = 255)
        : r(red), g(green), b(blue), a(alpha) {}

    static constexpr Color rgb8(uint8_t red, uint8_t green, uint8_t blue) { return {red, green, blue, 255}; }

    // Packed as 0xAARRGGBB, the layout SkColor uses
    constexpr uint32_t argb() const {
        return (uint32_t(a) << 24) | (uint32_t(r) << 16) | (uint32_t(g) << 8) | uint32_t(b);
    }

    constexpr bool operator==(const Color& o) const { return r == o.r && g == o.g && b == o.b && a == o.a; }
    constexpr bool operator!=(const Color& o) const { return !(*this == o); }

    static const Color BLACK;
    static const Color WHITE;
    static const Color RED;
    static const Color TRANSPARENT;
};

inline constexpr Color Color::BLACK{0, 0, 0, 255};
inline constexpr Color Color::WHITE{255, 255, 255, 255};
inline constexpr Color Color::RED{255, 0, 0, 255};
inline constexpr Color Color::TRANSPARENT{0, 0, 0, 0};

struct GradientStop {
    float offset = 0.0f;
    Color color;
};

enum class GradientKind {
    Linear,
    Radial,
    Sweep
};

struct Gradient {
    GradientKind kind = GradientKind::Linear;
    Point start;                 // linear: start point; radial/sweep: center
    Point end;                   // linear: end point
    double radius = 0.0;         // radial only
    std::vector<GradientStop> stops;

    static Gradient linear(Point from, Point to, Color first, Color second) {
        Gradient g;
        g.kind = GradientKind::Linear;
        g.start = from;
        g.end = to;
        g.stops = {{0.0f, first}, {1.0f, second}};
        return g;
    }
};

// Image-pattern brush. Accepted by the API, but no backend produces a paint for it.
struct ImageBrush {
    std::shared_ptr<const RasterImage> image;
};

using Brush = std::variant<Color, Gradient, ImageBrush>;

}  // namespace tessera

#endif  // TESSERA_BRUSH_H
