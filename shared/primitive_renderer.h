// primitive_renderer.h - The drawing surface shared by every Tessera backend

#ifndef TESSERA_PRIMITIVE_RENDERER_H
#define TESSERA_PRIMITIVE_RENDERER_H

#include <cstdint>
#include <optional>

#include "brush.h"
#include "geometry.h"
#include "image_cache.h"
#include "text_layout.h"

namespace tessera {

/**
 * Outcome of a single stroke() or fill() call.
 * A primitive that is not Drawn was skipped; the rest of the frame is unaffected.
 */
enum class DrawStatus {
    Drawn,
    NoPaint,      // brush resolved to no paint (radial/sweep gradient, image brush, < 2 stops)
    Unsupported   // geometry the backend cannot stroke (cubic segments)
};

const char* drawStatusName(DrawStatus status);

/**
 * Abstract drawing interface.
 *
 * All coordinates are logical units. The current transform maps them into
 * transform output space; the device scale maps that into device pixels.
 * Frame presentation (finish) is backend specific and lives on the backends.
 */
class PrimitiveRenderer {
public:
    virtual ~PrimitiveRenderer() = default;

    // Non-copyable
    PrimitiveRenderer(const PrimitiveRenderer&) = delete;
    PrimitiveRenderer& operator=(const PrimitiveRenderer&) = delete;

    /**
     * Start a frame. Resets the transform to identity and clears the clip.
     * @param capture true to render into a CPU-readable image instead of the window
     */
    virtual void begin(bool capture) = 0;

    virtual void clip(const Shape& shape) = 0;
    virtual void clearClip() = 0;

    virtual DrawStatus stroke(const Shape& shape, const Brush& brush, double width) = 0;
    virtual DrawStatus fill(const Shape& shape, const Brush& brush, double blurRadius) = 0;

    // pos is the layout origin in logical units
    virtual void drawText(const TextLayout& layout, Point pos) = 0;
    virtual void drawImage(const Img& img, const Rect& rect) = 0;
    virtual void drawSvg(const Svg& svg, const Rect& rect, const std::optional<Brush>& brush) = 0;

    // Replaces the current transform (it does not concatenate)
    virtual void transform(const Affine& affine) = 0;
    virtual void setZIndex(int32_t z) = 0;

    virtual void resize(double scale, Size size) = 0;
    virtual void setScale(double scale) = 0;
    virtual double scale() const = 0;
    // Surface size in device pixels
    virtual Size size() const = 0;

protected:
    PrimitiveRenderer() = default;
};

}  // namespace tessera

#endif  // TESSERA_PRIMITIVE_RENDERER_H
