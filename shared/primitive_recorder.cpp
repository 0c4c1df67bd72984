// primitive_recorder.cpp - Primitive recording and canvas replay

#include "primitive_recorder.h"

#include <algorithm>
#include <cmath>
#include <numeric>

#include "include/core/SkBlendMode.h"
#include "include/core/SkCanvas.h"
#include "include/core/SkColor.h"
#include "include/core/SkMaskFilter.h"
#include "include/core/SkRRect.h"
#include "include/core/SkSamplingOptions.h"
#include "include/core/SkShader.h"
#include "include/core/SkTileMode.h"
#include "include/effects/SkGradientShader.h"

namespace tessera {

namespace {

constexpr float kPi = 3.14159265358979323846f;

SkColor4f toColor4f(Color c) {
    return {c.r / 255.0f, c.g / 255.0f, c.b / 255.0f, c.a / 255.0f};
}

// Blur radius (pixels) to Gaussian sigma, Skia's usual conversion
float blurSigma(float radius) {
    return radius > 0.0f ? 0.57735f * radius + 0.5f : 0.0f;
}

bool isStroke(PrimitiveKind kind) {
    return kind == PrimitiveKind::StrokeRect || kind == PrimitiveKind::StrokeSegment ||
           kind == PrimitiveKind::StrokeArc || kind == PrimitiveKind::StrokeBezier;
}

SkRRect roundedRect(const SkRect& rect, float radius) {
    if (radius <= 0.0f) {
        return SkRRect::MakeRect(rect);
    }
    return SkRRect::MakeRectXY(rect, radius, radius);
}

}  // namespace

void PrimitiveRecorder::begin(uint32_t width, uint32_t height, float scale) {
    primitives_.clear();
    paints_.clear();
    scissors_.clear();
    pendingPath_.reset();
    currentScissor_ = -1;
    zIndex_ = 0;
    frameWidth_ = width;
    frameHeight_ = height;
    frameScale_ = scale;
}

PaintIndex PrimitiveRecorder::colorPaint(Color color) {
    PaintDesc desc;
    desc.kind = PaintDesc::Kind::Solid;
    desc.inner = color;
    desc.outer = color;
    paints_.push_back(desc);
    return static_cast<PaintIndex>(paints_.size() - 1);
}

PaintIndex PrimitiveRecorder::linearGradient(SkPoint start, SkPoint end, Color inner, Color outer) {
    PaintDesc desc;
    desc.kind = PaintDesc::Kind::LinearGradient;
    desc.inner = inner;
    desc.outer = outer;
    desc.start = start;
    desc.end = end;
    paints_.push_back(desc);
    return static_cast<PaintIndex>(paints_.size() - 1);
}

Primitive& PrimitiveRecorder::push(PrimitiveKind kind, PaintIndex paint) {
    primitives_.emplace_back();
    Primitive& prim = primitives_.back();
    prim.kind = kind;
    prim.paint = paint;
    prim.zIndex = zIndex_;
    prim.scissor = currentScissor_;
    return prim;
}

void PrimitiveRecorder::fillRect(const SkRect& rect, float radius, PaintIndex paint, float blur) {
    Primitive& prim = push(PrimitiveKind::FillRect, paint);
    prim.rect = rect;
    prim.radius = radius;
    prim.blur = blur;
}

void PrimitiveRecorder::strokeRect(SkPoint min, SkPoint max, float radius, float width, PaintIndex paint) {
    Primitive& prim = push(PrimitiveKind::StrokeRect, paint);
    prim.points[0] = min;
    prim.points[1] = max;
    prim.radius = radius;
    prim.width = width;
}

void PrimitiveRecorder::strokeSegment(SkPoint a, SkPoint b, float width, PaintIndex paint) {
    Primitive& prim = push(PrimitiveKind::StrokeSegment, paint);
    prim.points[0] = a;
    prim.points[1] = b;
    prim.width = width;
}

void PrimitiveRecorder::strokeArc(SkPoint center, float radius, float width, float rotation, float aperture,
                                  PaintIndex paint) {
    Primitive& prim = push(PrimitiveKind::StrokeArc, paint);
    prim.points[0] = center;
    prim.radius = radius;
    prim.width = width;
    prim.rotation = rotation;
    prim.aperture = aperture;
}

void PrimitiveRecorder::strokeBezier(SkPoint a, SkPoint b, SkPoint c, float width, PaintIndex paint) {
    Primitive& prim = push(PrimitiveKind::StrokeBezier, paint);
    prim.points[0] = a;
    prim.points[1] = b;
    prim.points[2] = c;
    prim.width = width;
}

void PrimitiveRecorder::fillCircle(SkPoint center, float radius, PaintIndex paint) {
    Primitive& prim = push(PrimitiveKind::FillCircle, paint);
    prim.points[0] = center;
    prim.radius = radius;
}

void PrimitiveRecorder::moveTo(SkPoint p) {
    pendingPath_.moveTo(p);
}

void PrimitiveRecorder::quadTo(SkPoint control, SkPoint end) {
    pendingPath_.quadTo(control, end);
}

void PrimitiveRecorder::fill(PaintIndex paint) {
    if (pendingPath_.isEmpty()) {
        return;
    }
    Primitive& prim = push(PrimitiveKind::FillPath, paint);
    prim.path = pendingPath_;
    pendingPath_.reset();
}

void PrimitiveRecorder::renderGlyph(float x, float y, const sk_sp<SkImage>& mask, int32_t left, int32_t top,
                                    PaintIndex paint) {
    if (!mask) {
        return;
    }
    Primitive& prim = push(PrimitiveKind::Glyph, paint);
    prim.points[0] = {x, y};
    prim.image = mask;
    prim.glyphLeft = left;
    prim.glyphTop = top;
}

void PrimitiveRecorder::renderImage(float x, float y, float width, float height, sk_sp<SkImage> image) {
    if (!image) {
        return;
    }
    Primitive& prim = push(PrimitiveKind::Image, 0);
    prim.hasPaint = false;
    prim.rect = SkRect::MakeXYWH(x, y, width, height);
    prim.image = std::move(image);
}

void PrimitiveRecorder::renderSvg(float x, float y, float width, float height, sk_sp<SkImage> raster,
                                  std::optional<PaintIndex> tint) {
    if (!raster) {
        return;
    }
    Primitive& prim = push(PrimitiveKind::Svg, tint.value_or(0));
    prim.hasPaint = tint.has_value();
    prim.rect = SkRect::MakeXYWH(x, y, width, height);
    prim.image = std::move(raster);
}

void PrimitiveRecorder::scissor(const SkRect& rect, float radius) {
    scissors_.push_back({rect, radius});
    currentScissor_ = static_cast<int32_t>(scissors_.size() - 1);
}

void PrimitiveRecorder::resetScissor() {
    currentScissor_ = -1;
}

SkPaint PrimitiveRecorder::makePaint(PaintIndex index) const {
    SkPaint paint;
    paint.setAntiAlias(true);
    if (index >= paints_.size()) {
        return paint;
    }

    const PaintDesc& desc = paints_[index];
    if (desc.kind == PaintDesc::Kind::Solid) {
        paint.setColor4f(toColor4f(desc.inner), nullptr);
        return paint;
    }

    const SkPoint pts[2] = {desc.start, desc.end};
    const SkColor colors[2] = {desc.inner.argb(), desc.outer.argb()};
    paint.setShader(SkGradientShader::MakeLinear(pts, colors, nullptr, 2, SkTileMode::kClamp));
    return paint;
}

void PrimitiveRecorder::encode(SkCanvas* canvas) const {
    if (!canvas) {
        return;
    }

    std::vector<size_t> order(primitives_.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [this](size_t a, size_t b) {
        return primitives_[a].zIndex < primitives_[b].zIndex;
    });

    const SkSamplingOptions sampling(SkFilterMode::kLinear);

    for (size_t index : order) {
        const Primitive& prim = primitives_[index];

        // Zero width would turn into a Skia hairline
        if (isStroke(prim.kind) && prim.width <= 0.0f) {
            continue;
        }

        canvas->save();
        if (prim.scissor >= 0) {
            const Scissor& s = scissors_[prim.scissor];
            canvas->clipRRect(roundedRect(s.rect, s.radius), true);
        }

        SkPaint paint = prim.hasPaint ? makePaint(prim.paint) : SkPaint();

        switch (prim.kind) {
            case PrimitiveKind::FillRect:
                if (prim.blur > 0.0f) {
                    paint.setMaskFilter(SkMaskFilter::MakeBlur(kNormal_SkBlurStyle, blurSigma(prim.blur)));
                }
                canvas->drawRRect(roundedRect(prim.rect, prim.radius), paint);
                break;

            case PrimitiveKind::StrokeRect:
                paint.setStyle(SkPaint::kStroke_Style);
                paint.setStrokeWidth(prim.width);
                canvas->drawRRect(roundedRect(SkRect::MakeLTRB(prim.points[0].fX, prim.points[0].fY,
                                                               prim.points[1].fX, prim.points[1].fY)
                                                  .makeSorted(),
                                              prim.radius),
                                  paint);
                break;

            case PrimitiveKind::StrokeSegment:
                paint.setStyle(SkPaint::kStroke_Style);
                paint.setStrokeWidth(prim.width);
                paint.setStrokeCap(SkPaint::kRound_Cap);
                canvas->drawLine(prim.points[0], prim.points[1], paint);
                break;

            case PrimitiveKind::StrokeArc: {
                paint.setStyle(SkPaint::kStroke_Style);
                paint.setStrokeWidth(prim.width);
                const SkPoint c = prim.points[0];
                if (prim.aperture >= kPi) {
                    canvas->drawCircle(c, prim.radius, paint);
                } else {
                    SkRect oval = SkRect::MakeLTRB(c.fX - prim.radius, c.fY - prim.radius,
                                                   c.fX + prim.radius, c.fY + prim.radius);
                    const float startDeg = (prim.rotation - prim.aperture) * 180.0f / kPi;
                    const float sweepDeg = 2.0f * prim.aperture * 180.0f / kPi;
                    paint.setStrokeCap(SkPaint::kRound_Cap);
                    canvas->drawArc(oval, startDeg, sweepDeg, false, paint);
                }
                break;
            }

            case PrimitiveKind::StrokeBezier: {
                paint.setStyle(SkPaint::kStroke_Style);
                paint.setStrokeWidth(prim.width);
                paint.setStrokeCap(SkPaint::kRound_Cap);
                SkPath curve;
                curve.moveTo(prim.points[0]);
                curve.quadTo(prim.points[1], prim.points[2]);
                canvas->drawPath(curve, paint);
                break;
            }

            case PrimitiveKind::FillCircle:
                canvas->drawCircle(prim.points[0], prim.radius, paint);
                break;

            case PrimitiveKind::FillPath:
                canvas->drawPath(prim.path, paint);
                break;

            case PrimitiveKind::Glyph:
                // Alpha-only images take their color from the paint
                canvas->drawImage(prim.image, prim.points[0].fX + static_cast<float>(prim.glyphLeft),
                                  prim.points[0].fY - static_cast<float>(prim.glyphTop), sampling, &paint);
                break;

            case PrimitiveKind::Image:
                canvas->drawImageRect(prim.image, prim.rect, sampling, nullptr);
                break;

            case PrimitiveKind::Svg:
                if (prim.hasPaint) {
                    canvas->saveLayer(prim.rect, nullptr);
                    canvas->drawImageRect(prim.image, prim.rect, sampling, nullptr);
                    paint.setBlendMode(SkBlendMode::kSrcIn);
                    canvas->drawRect(prim.rect, paint);
                    canvas->restore();
                } else {
                    canvas->drawImageRect(prim.image, prim.rect, sampling, nullptr);
                }
                break;
        }

        canvas->restore();
    }
}

}  // namespace tessera
