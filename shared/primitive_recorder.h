// primitive_recorder.h - Per-frame list of device-space drawing primitives
//
// Backends record every stroke, fill, glyph and image of a frame here, then
// replay the list onto a Skia canvas when the frame finishes: a Graphite
// canvas for the GPU backend, a raster canvas for the software backend.

#ifndef TESSERA_PRIMITIVE_RECORDER_H
#define TESSERA_PRIMITIVE_RECORDER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "include/core/SkImage.h"
#include "include/core/SkPaint.h"
#include "include/core/SkPath.h"
#include "include/core/SkPoint.h"
#include "include/core/SkRect.h"
#include "include/core/SkRefCnt.h"

#include "brush.h"

class SkCanvas;

namespace tessera {

using PaintIndex = uint32_t;

// A resolved brush: solid color or two-color linear gradient (device space)
struct PaintDesc {
    enum class Kind { Solid, LinearGradient };

    Kind kind = Kind::Solid;
    Color inner;
    Color outer;
    SkPoint start = {0, 0};
    SkPoint end = {0, 0};
};

enum class PrimitiveKind {
    FillRect,
    StrokeRect,
    StrokeSegment,
    StrokeArc,
    StrokeBezier,
    FillCircle,
    FillPath,
    Glyph,
    Image,
    Svg
};

struct Scissor {
    SkRect rect = SkRect::MakeEmpty();
    float radius = 0.0f;
};

/**
 * One recorded primitive. Field use by kind:
 *   FillRect      rect, radius, blur
 *   StrokeRect    points[0..1] (min, max), radius, width
 *   StrokeSegment points[0..1], width
 *   StrokeArc     points[0] (center), radius, width, rotation, aperture
 *   StrokeBezier  points[0..2], width
 *   FillCircle    points[0] (center), radius
 *   FillPath      path
 *   Glyph         points[0] (pen origin), image (A8 mask), glyphLeft/glyphTop
 *   Image, Svg    rect, image
 * Coordinates are device pixels. Svg uses paint only when hasPaint is set.
 */
struct Primitive {
    PrimitiveKind kind = PrimitiveKind::FillRect;
    SkPoint points[3] = {{0, 0}, {0, 0}, {0, 0}};
    SkRect rect = SkRect::MakeEmpty();
    float radius = 0.0f;
    float width = 0.0f;
    float blur = 0.0f;
    float rotation = 0.0f;
    float aperture = 0.0f;
    int32_t glyphLeft = 0;
    int32_t glyphTop = 0;
    PaintIndex paint = 0;
    bool hasPaint = true;
    int32_t zIndex = 0;
    int32_t scissor = -1;  // index into scissors(), -1 when unclipped
    SkPath path;
    sk_sp<SkImage> image;
};

class PrimitiveRecorder {
public:
    PrimitiveRecorder() = default;

    PrimitiveRecorder(const PrimitiveRecorder&) = delete;
    PrimitiveRecorder& operator=(const PrimitiveRecorder&) = delete;

    /**
     * Start a new frame. Drops all primitives, paints, scissor and z-index state.
     * @param width, height frame size in device pixels
     * @param scale device scale of the frame
     */
    void begin(uint32_t width, uint32_t height, float scale);

    // Paint table (valid until the next begin)
    PaintIndex colorPaint(Color color);
    PaintIndex linearGradient(SkPoint start, SkPoint end, Color inner, Color outer);
    const PaintDesc& paint(PaintIndex index) const { return paints_[index]; }
    size_t paintCount() const { return paints_.size(); }

    void fillRect(const SkRect& rect, float radius, PaintIndex paint, float blur);
    void strokeRect(SkPoint min, SkPoint max, float radius, float width, PaintIndex paint);
    void strokeSegment(SkPoint a, SkPoint b, float width, PaintIndex paint);
    /**
     * Arc centered on `rotation` (radians) extending `aperture` radians to
     * either side; aperture >= pi is a full ring.
     */
    void strokeArc(SkPoint center, float radius, float width, float rotation, float aperture, PaintIndex paint);
    void strokeBezier(SkPoint a, SkPoint b, SkPoint c, float width, PaintIndex paint);
    void fillCircle(SkPoint center, float radius, PaintIndex paint);

    // Contour accumulation for fill(); moveTo starts a subpath
    void moveTo(SkPoint p);
    void quadTo(SkPoint control, SkPoint end);
    void fill(PaintIndex paint);
    bool hasPendingPath() const { return !pendingPath_.isEmpty(); }

    void renderGlyph(float x, float y, const sk_sp<SkImage>& mask, int32_t left, int32_t top, PaintIndex paint);
    void renderImage(float x, float y, float width, float height, sk_sp<SkImage> image);
    void renderSvg(float x, float y, float width, float height, sk_sp<SkImage> raster,
                   std::optional<PaintIndex> tint);

    void scissor(const SkRect& rect, float radius);
    void resetScissor();
    void setZIndex(int32_t z) { zIndex_ = z; }
    int32_t zIndex() const { return zIndex_; }

    /**
     * Replay the frame onto a canvas in z-index order. Primitives sharing a
     * z-index keep their recording order. Does not clear the canvas.
     */
    void encode(SkCanvas* canvas) const;

    const std::vector<Primitive>& primitives() const { return primitives_; }
    const std::vector<Scissor>& scissors() const { return scissors_; }
    uint32_t frameWidth() const { return frameWidth_; }
    uint32_t frameHeight() const { return frameHeight_; }
    float frameScale() const { return frameScale_; }

private:
    Primitive& push(PrimitiveKind kind, PaintIndex paint);
    SkPaint makePaint(PaintIndex index) const;

    std::vector<Primitive> primitives_;
    std::vector<PaintDesc> paints_;
    std::vector<Scissor> scissors_;
    SkPath pendingPath_;
    int32_t currentScissor_ = -1;
    int32_t zIndex_ = 0;
    uint32_t frameWidth_ = 0;
    uint32_t frameHeight_ = 0;
    float frameScale_ = 1.0f;
};

}  // namespace tessera

#endif  // TESSERA_PRIMITIVE_RECORDER_H
