// recording_renderer.h - Drawing semantics shared by the GPU and raster backends
//
// RecordingRenderer turns PrimitiveRenderer calls into device-space
// primitives on the backend's current PrimitiveRecorder. Backends only
// decide which recorder is current and what happens at finish().

#ifndef TESSERA_RECORDING_RENDERER_H
#define TESSERA_RECORDING_RENDERER_H

#include <cstdint>
#include <memory>
#include <optional>

#include "include/core/SkImage.h"
#include "include/core/SkPoint.h"
#include "include/core/SkRefCnt.h"

#include "font_registry.h"
#include "glyph_cache.h"
#include "image_cache.h"
#include "primitive_recorder.h"
#include "primitive_renderer.h"

namespace tessera {

// Smallest surface dimension (device pixels) a backend will build targets for
constexpr uint32_t MIN_TARGET_DIMENSION = 10;

enum class ResizeAction {
    ScaleOnly,  // same pixel size
    Ignore,     // below MIN_TARGET_DIMENSION, keep the current target
    Recreate
};

ResizeAction planResize(uint32_t currentWidth, uint32_t currentHeight, uint32_t width, uint32_t height);

// Truncate a surface size to whole pixels, at least 1 per dimension
void clampSurfaceSize(Size size, uint32_t* width, uint32_t* height);

class RecordingRenderer : public PrimitiveRenderer {
public:
    ~RecordingRenderer() override = default;

    void begin(bool capture) override;
    void clip(const Shape& shape) override;
    void clearClip() override;
    DrawStatus stroke(const Shape& shape, const Brush& brush, double width) override;
    DrawStatus fill(const Shape& shape, const Brush& brush, double blurRadius) override;
    void drawText(const TextLayout& layout, Point pos) override;
    void drawImage(const Img& img, const Rect& rect) override;
    void drawSvg(const Svg& svg, const Rect& rect, const std::optional<Brush>& brush) override;
    void transform(const Affine& affine) override;
    void setZIndex(int32_t z) override;

    void setScale(double scale) override { scale_ = scale; }
    double scale() const override { return scale_; }

    const Affine& currentTransform() const { return transform_; }
    // Clip rectangle in transform output space
    const std::optional<Rect>& currentClip() const { return clip_; }

    // Recorder receiving this frame's primitives
    const PrimitiveRecorder& frameRecorder() const { return recorder(); }

    const GlyphCache& glyphCache() const { return glyphCache_; }
    GlyphCache& glyphCache() { return glyphCache_; }
    const ImageCache& imageCache() const { return imageCache_; }
    const std::shared_ptr<FontRegistry>& fonts() const { return rasterizer_.fonts(); }

    // Image and SVG primitives recorded since construction
    uint64_t imagesDrawn() const { return imagesDrawn_; }

protected:
    RecordingRenderer(std::shared_ptr<FontRegistry> fonts, double scale, float fontEmbolden);

    virtual PrimitiveRecorder& recorder() = 0;
    virtual const PrimitiveRecorder& recorder() const = 0;

    // Called by begin() before the frame state is reset
    virtual void onBegin(bool capture) = 0;

    /**
     * Turn a decoded image into the form this backend draws from
     * (a GPU texture, or the raster image itself). Called on cache misses only.
     */
    virtual sk_sp<SkImage> prepareImage(sk_sp<SkImage> image) = 0;

    // Release cached images before the backend's GPU objects go away
    void dropCachedImages() { imageCache_.clear(); }

    // Logical point through the transform and device scale, in device pixels
    SkPoint toDevice(Point p) const;
    // (a + d) / 2 of the transform times the device scale
    double averageScale() const;

    double scale_;

private:
    std::optional<PaintIndex> brushToPaint(const Brush& brush);
    void recordPathFill(const std::vector<PathSegment>& segments, PaintIndex paint);
    sk_sp<SkImage> rasterizeSvg(const Svg& svg, uint32_t width, uint32_t height) const;

    Affine transform_;
    std::optional<Rect> clip_;
    GlyphRasterizer rasterizer_;
    GlyphCache glyphCache_;
    ImageCache imageCache_;
    uint64_t imagesDrawn_ = 0;
    bool cubicStrokeLogged_ = false;
};

}  // namespace tessera

#endif  // TESSERA_RECORDING_RENDERER_H
