// recording_renderer.cpp - Shape dispatch, brush resolution, text and image placement

#include "recording_renderer.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

#include "include/core/SkCanvas.h"
#include "include/core/SkColor.h"
#include "include/core/SkImageInfo.h"
#include "include/core/SkRect.h"
#include "include/core/SkSurface.h"

#include "variant_utils.h"

namespace tessera {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Flattening accuracy for cubic segments in fill(), logical units
constexpr double kFillCubicAccuracy = 0.1;

// Text is not drawn when the average scale falls below this
constexpr double kMinTextScale = 0.1;

SkRect sortedRect(SkPoint a, SkPoint b) {
    return SkRect::MakeLTRB(a.fX, a.fY, b.fX, b.fY).makeSorted();
}

bool hasCubic(const std::vector<PathSegment>& segments) {
    return std::any_of(segments.begin(), segments.end(),
                       [](const PathSegment& s) { return s.kind == PathSegment::Kind::Cubic; });
}

uint32_t roundedDimension(double value) {
    double r = std::round(value);
    return r < 1.0 ? 1u : static_cast<uint32_t>(r);
}

}  // namespace

const char* drawStatusName(DrawStatus status) {
    switch (status) {
        case DrawStatus::Drawn:
            return "drawn";
        case DrawStatus::NoPaint:
            return "no paint";
        case DrawStatus::Unsupported:
            return "unsupported";
    }
    return "unknown";
}

ResizeAction planResize(uint32_t currentWidth, uint32_t currentHeight, uint32_t width, uint32_t height) {
    if (width == currentWidth && height == currentHeight) {
        return ResizeAction::ScaleOnly;
    }
    if (width < MIN_TARGET_DIMENSION || height < MIN_TARGET_DIMENSION) {
        return ResizeAction::Ignore;
    }
    return ResizeAction::Recreate;
}

void clampSurfaceSize(Size size, uint32_t* width, uint32_t* height) {
    *width = size.width >= 1.0 ? static_cast<uint32_t>(size.width) : 1u;
    *height = size.height >= 1.0 ? static_cast<uint32_t>(size.height) : 1u;
}

RecordingRenderer::RecordingRenderer(std::shared_ptr<FontRegistry> fonts, double scale, float fontEmbolden)
    : scale_(scale), rasterizer_(std::move(fonts), fontEmbolden) {}

SkPoint RecordingRenderer::toDevice(Point p) const {
    Point t = transform_.apply(p) * scale_;
    return SkPoint::Make(static_cast<float>(t.x), static_cast<float>(t.y));
}

double RecordingRenderer::averageScale() const {
    const auto& c = transform_.coeffs();
    return (c[0] + c[3]) / 2.0 * scale_;
}

void RecordingRenderer::begin(bool capture) {
    onBegin(capture);

    transform_ = Affine::identity();
    clip_.reset();

    Size s = size();
    recorder().begin(static_cast<uint32_t>(s.width), static_cast<uint32_t>(s.height),
                     static_cast<float>(scale_));
}

void RecordingRenderer::transform(const Affine& affine) {
    transform_ = affine;
}

void RecordingRenderer::setZIndex(int32_t z) {
    recorder().setZIndex(z);
}

std::optional<PaintIndex> RecordingRenderer::brushToPaint(const Brush& brush) {
    return std::visit(Overloaded{
        [this](const Color& color) -> std::optional<PaintIndex> {
            return recorder().colorPaint(color);
        },
        [this](const Gradient& gradient) -> std::optional<PaintIndex> {
            if (gradient.kind != GradientKind::Linear || gradient.stops.size() < 2) {
                return std::nullopt;
            }
            const GradientStop& first = gradient.stops[0];
            const GradientStop& second = gradient.stops[1];

            // Stop offsets move the endpoints along the gradient axis. The
            // endpoints are in user space and follow the current transform.
            Point axis = gradient.end - gradient.start;
            Point start = gradient.start + axis * first.offset;
            Point end = gradient.start + axis * second.offset;
            return recorder().linearGradient(toDevice(start), toDevice(end), first.color, second.color);
        },
        [](const ImageBrush&) -> std::optional<PaintIndex> {
            return std::nullopt;
        },
    }, brush);
}

void RecordingRenderer::clip(const Shape& shape) {
    Rect rect;
    double radius = 0.0;

    if (const auto* r = std::get_if<Rect>(&shape)) {
        rect = *r;
    } else if (const auto* rr = std::get_if<RoundedRect>(&shape)) {
        rect = rr->rect;
        radius = rr->radii.topLeft;
    } else {
        rect = boundingBox(shape);
    }

    Rect clipped = Rect::fromPoints(transform_.apply(rect.origin()), transform_.apply(Point(rect.x1, rect.y1)));

    SkRect scissorRect = SkRect::MakeLTRB(
        static_cast<float>(clipped.x0 * scale_), static_cast<float>(clipped.y0 * scale_),
        static_cast<float>(clipped.x1 * scale_), static_cast<float>(clipped.y1 * scale_));
    recorder().scissor(scissorRect, static_cast<float>(radius * scale_));
    clip_ = clipped;
}

void RecordingRenderer::clearClip() {
    recorder().resetScissor();
    clip_.reset();
}

DrawStatus RecordingRenderer::stroke(const Shape& shape, const Brush& brush, double width) {
    std::vector<PathSegment> segments;
    if (const auto* path = std::get_if<BezPath>(&shape)) {
        segments = path->segments();
        if (hasCubic(segments)) {
            if (!cubicStrokeLogged_) {
                fprintf(stderr, "[Renderer] Warning: stroking cubic segments is not supported, path skipped\n");
                cubicStrokeLogged_ = true;
            }
            return DrawStatus::Unsupported;
        }
    }

    std::optional<PaintIndex> paint = brushToPaint(brush);
    if (!paint) {
        return DrawStatus::NoPaint;
    }

    const double avgScale = averageScale();
    const float strokeWidth = static_cast<float>(std::round(width * avgScale));
    PrimitiveRecorder& rec = recorder();

    std::visit(Overloaded{
        [&](const Rect& r) {
            rec.strokeRect(toDevice(r.origin()), toDevice(Point(r.x1, r.y1)), 0.0f, strokeWidth, *paint);
        },
        [&](const RoundedRect& rr) {
            rec.strokeRect(toDevice(rr.rect.origin()), toDevice(Point(rr.rect.x1, rr.rect.y1)),
                           static_cast<float>(rr.radii.topLeft * avgScale), strokeWidth, *paint);
        },
        [&](const Line& l) {
            rec.strokeSegment(toDevice(l.p0), toDevice(l.p1), strokeWidth, *paint);
        },
        [&](const Circle& c) {
            rec.strokeArc(toDevice(c.center), static_cast<float>(c.radius * avgScale), strokeWidth, 0.0f,
                          static_cast<float>(kPi), *paint);
        },
        [&](const BezPath&) {
            for (const PathSegment& seg : segments) {
                if (seg.kind == PathSegment::Kind::Line) {
                    rec.strokeSegment(toDevice(seg.points[0]), toDevice(seg.points[1]), strokeWidth, *paint);
                } else {
                    rec.strokeBezier(toDevice(seg.points[0]), toDevice(seg.points[1]), toDevice(seg.points[2]),
                                     strokeWidth, *paint);
                }
            }
        },
    }, shape);

    return DrawStatus::Drawn;
}

DrawStatus RecordingRenderer::fill(const Shape& shape, const Brush& brush, double blurRadius) {
    std::optional<PaintIndex> paint = brushToPaint(brush);
    if (!paint) {
        return DrawStatus::NoPaint;
    }

    const double avgScale = averageScale();
    const float blur = static_cast<float>(blurRadius * avgScale);
    PrimitiveRecorder& rec = recorder();

    std::visit(Overloaded{
        [&](const Rect& r) {
            rec.fillRect(sortedRect(toDevice(r.origin()), toDevice(Point(r.x1, r.y1))), 0.0f, *paint, blur);
        },
        [&](const RoundedRect& rr) {
            rec.fillRect(sortedRect(toDevice(rr.rect.origin()), toDevice(Point(rr.rect.x1, rr.rect.y1))),
                         static_cast<float>(rr.radii.topLeft * avgScale), *paint, blur);
        },
        [&](const Circle& c) {
            rec.fillCircle(toDevice(c.center), static_cast<float>(c.radius * avgScale), *paint);
        },
        [&](const Line& l) {
            PathSegment seg;
            seg.kind = PathSegment::Kind::Line;
            seg.points = {l.p0, l.p1, Point(), Point()};
            seg.startsSubpath = true;
            recordPathFill({seg}, *paint);
        },
        [&](const BezPath& path) {
            recordPathFill(path.segments(), *paint);
        },
    }, shape);

    return DrawStatus::Drawn;
}

void RecordingRenderer::recordPathFill(const std::vector<PathSegment>& segments, PaintIndex paint) {
    PrimitiveRecorder& rec = recorder();
    std::vector<std::array<Point, 2>> quads;

    for (const PathSegment& seg : segments) {
        if (seg.startsSubpath) {
            rec.moveTo(toDevice(seg.points[0]));
        }

        switch (seg.kind) {
            case PathSegment::Kind::Line:
                rec.quadTo(toDevice(seg.points[1]), toDevice(seg.points[1]));
                break;
            case PathSegment::Kind::Quad:
                rec.quadTo(toDevice(seg.points[1]), toDevice(seg.points[2]));
                break;
            case PathSegment::Kind::Cubic:
                quads.clear();
                cubicToQuads(seg, kFillCubicAccuracy, quads);
                for (const auto& q : quads) {
                    rec.quadTo(toDevice(q[0]), toDevice(q[1]));
                }
                break;
        }
    }

    rec.fill(paint);
}

void RecordingRenderer::drawText(const TextLayout& layout, Point pos) {
    const auto& c = transform_.coeffs();
    const double avgScale = averageScale();
    if (std::fabs(avgScale) < kMinTextScale) {
        return;
    }

    const Point origin = transform_.apply(pos);
    PrimitiveRecorder& rec = recorder();

    std::optional<Color> paintColor;
    PaintIndex paint = 0;

    for (const LayoutRun& run : layout.runs) {
        const double y = origin.y + run.lineY * c[3];
        if (clip_) {
            const double extent = run.lineHeight * c[3];
            if (y + extent < clip_->y0) {
                continue;
            }
            if (y - extent > clip_->y1) {
                break;
            }
        }

        for (const LayoutGlyph& glyph : run.glyphs) {
            const double x = origin.x + glyph.x * c[0];
            if (clip_) {
                if (x + glyph.w * c[0] < clip_->x0) {
                    continue;
                }
                if (x > clip_->x1) {
                    break;
                }
            }

            const float glyphX = static_cast<float>(x * scale_);
            const float glyphY = static_cast<float>(std::round(y * scale_));
            const uint32_t fontSize = static_cast<uint32_t>(std::max(0.0, std::round(glyph.fontSize * avgScale)));

            int32_t penX = 0;
            int32_t penY = 0;
            GlyphCacheKey key = GlyphCacheKey::make(glyph.fontId, glyph.glyphId, fontSize, glyphX, glyphY,
                                                    glyph.cacheKeyFlags, &penX, &penY);
            const GlyphImage& image = glyphCache_.findOrRasterize(key, rasterizer_);
            if (image.empty()) {
                continue;
            }

            const Color color = glyph.color.value_or(Color::BLACK);
            if (!paintColor || *paintColor != color) {
                paint = rec.colorPaint(color);
                paintColor = color;
            }
            rec.renderGlyph(static_cast<float>(penX), static_cast<float>(penY), image.mask, image.left, image.top,
                            paint);
        }
    }
}

void RecordingRenderer::drawImage(const Img& img, const Rect& rect) {
    if (!img.image) {
        return;
    }

    const auto& c = transform_.coeffs();
    const Point origin = transform_.apply(rect.origin()) * scale_;
    const float x = static_cast<float>(std::round(origin.x));
    const float y = static_cast<float>(std::round(origin.y));
    const uint32_t width = roundedDimension(rect.width() * c[0] * scale_);
    const uint32_t height = roundedDimension(rect.height() * c[3] * scale_);

    sk_sp<SkImage> image = imageCache_.findOrCreate("img:" + img.hash, [&]() {
        return prepareImage(img.image);
    });
    if (!image) {
        fprintf(stderr, "[Renderer] Error: failed to prepare image %s\n", img.hash.c_str());
        return;
    }

    recorder().renderImage(x, y, static_cast<float>(width), static_cast<float>(height), std::move(image));
    ++imagesDrawn_;
}

void RecordingRenderer::drawSvg(const Svg& svg, const Rect& rect, const std::optional<Brush>& brush) {
    if (!svg.dom) {
        return;
    }

    const auto& c = transform_.coeffs();
    const Point origin = transform_.apply(rect.origin()) * scale_;
    const float x = static_cast<float>(std::round(origin.x));
    const float y = static_cast<float>(std::round(origin.y));
    const uint32_t width = roundedDimension(rect.width() * c[0] * scale_);
    const uint32_t height = roundedDimension(rect.height() * c[3] * scale_);

    std::optional<PaintIndex> tint;
    if (brush) {
        tint = brushToPaint(*brush);
    }

    const std::string key = "svg:" + svg.hash + ":" + std::to_string(width) + "x" + std::to_string(height);
    sk_sp<SkImage> raster = imageCache_.findOrCreate(key, [&]() {
        return prepareImage(rasterizeSvg(svg, width, height));
    });
    if (!raster) {
        fprintf(stderr, "[Renderer] Error: failed to rasterize SVG %s at %ux%u\n", svg.hash.c_str(), width, height);
        return;
    }

    recorder().renderSvg(x, y, static_cast<float>(width), static_cast<float>(height), std::move(raster), tint);
    ++imagesDrawn_;
}

sk_sp<SkImage> RecordingRenderer::rasterizeSvg(const Svg& svg, uint32_t width, uint32_t height) const {
    SkSize svgSize = svg.intrinsicSize();
    if (svgSize.isEmpty()) {
        return nullptr;
    }

    SkImageInfo info = SkImageInfo::MakeN32Premul(static_cast<int>(width), static_cast<int>(height));
    sk_sp<SkSurface> surface = SkSurfaces::Raster(info);
    if (!surface) {
        return nullptr;
    }

    SkCanvas* canvas = surface->getCanvas();
    canvas->clear(SK_ColorTRANSPARENT);

    // Uniform scale, anchored at the top-left corner
    const float svgScale = std::min(static_cast<float>(width) / svgSize.width(),
                                    static_cast<float>(height) / svgSize.height());
    canvas->scale(svgScale, svgScale);
    svg.dom->setContainerSize(svgSize);
    svg.dom->render(canvas);

    return surface->makeImageSnapshot();
}

}  // namespace tessera
