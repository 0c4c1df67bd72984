// glyph_cache.cpp - Glyph binning, outline rasterization and caching

#include "glyph_cache.h"

#include <cmath>
#include <cstdio>

#include "include/core/SkCanvas.h"
#include "include/core/SkFont.h"
#include "include/core/SkImageInfo.h"
#include "include/core/SkPaint.h"
#include "include/core/SkPath.h"
#include "include/core/SkSurface.h"

#include "font_registry.h"

namespace tessera {

std::pair<int32_t, SubpixelBin> subpixelBinFor(float pos) {
    const int32_t trunc = static_cast<int32_t>(pos);
    const float fract = pos - static_cast<float>(trunc);

    if (std::signbit(pos)) {
        if (fract > -0.125f) {
            return {trunc, SubpixelBin::Zero};
        } else if (fract > -0.375f) {
            return {trunc - 1, SubpixelBin::Three};
        } else if (fract > -0.625f) {
            return {trunc - 1, SubpixelBin::Two};
        } else if (fract > -0.875f) {
            return {trunc - 1, SubpixelBin::One};
        }
        return {trunc - 1, SubpixelBin::Zero};
    }

    if (fract < 0.125f) {
        return {trunc, SubpixelBin::Zero};
    } else if (fract < 0.375f) {
        return {trunc, SubpixelBin::One};
    } else if (fract < 0.625f) {
        return {trunc, SubpixelBin::Two};
    } else if (fract < 0.875f) {
        return {trunc, SubpixelBin::Three};
    }
    return {trunc + 1, SubpixelBin::Zero};
}

float subpixelOffset(SubpixelBin bin) {
    return static_cast<float>(static_cast<uint8_t>(bin)) * 0.25f;
}

GlyphCacheKey GlyphCacheKey::make(uint32_t fontId, uint16_t glyphId, uint32_t fontSize, float x, float y,
                                  uint32_t flags, int32_t* outX, int32_t* outY) {
    auto [px, xBin] = subpixelBinFor(x);
    auto [py, yBin] = subpixelBinFor(y);

    GlyphCacheKey key;
    key.fontId = fontId;
    key.glyphId = glyphId;
    key.fontSize = fontSize;
    key.xBin = xBin;
    key.yBin = yBin;
    key.flags = flags;

    if (outX) *outX = px;
    if (outY) *outY = py;
    return key;
}

GlyphRasterizer::GlyphRasterizer(std::shared_ptr<FontRegistry> fonts, float embolden)
    : fonts_(std::move(fonts)), embolden_(embolden) {}

std::optional<GlyphImage> GlyphRasterizer::rasterize(const GlyphCacheKey& key) const {
    sk_sp<SkTypeface> face = fonts_ ? fonts_->typeface(key.fontId) : nullptr;
    if (!face) {
        return std::nullopt;
    }

    SkFont font(face, static_cast<SkScalar>(key.fontSize));
    font.setSubpixel(true);
    font.setEdging(SkFont::Edging::kAntiAlias);

    SkPath outline;
    if (!font.getPath(key.glyphId, &outline) || outline.isEmpty()) {
        return GlyphImage{};
    }
    outline.offset(subpixelOffset(key.xBin), subpixelOffset(key.yBin));

    SkRect bounds = outline.getBounds();
    if (embolden_ > 0.0f) {
        bounds.outset(embolden_, embolden_);
    }
    SkIRect pixelBounds = bounds.roundOut();
    if (pixelBounds.isEmpty()) {
        return GlyphImage{};
    }

    SkImageInfo info = SkImageInfo::MakeA8(pixelBounds.width(), pixelBounds.height());
    sk_sp<SkSurface> surface = SkSurfaces::Raster(info);
    if (!surface) {
        fprintf(stderr, "[GlyphRasterizer] Error: failed to allocate %dx%d glyph surface\n",
                pixelBounds.width(), pixelBounds.height());
        return std::nullopt;
    }

    SkCanvas* canvas = surface->getCanvas();
    canvas->clear(SK_ColorTRANSPARENT);
    canvas->translate(-static_cast<SkScalar>(pixelBounds.left()), -static_cast<SkScalar>(pixelBounds.top()));

    SkPaint paint;
    paint.setAntiAlias(true);
    paint.setColor(SK_ColorBLACK);
    if (embolden_ > 0.0f) {
        paint.setStyle(SkPaint::kStrokeAndFill_Style);
        paint.setStrokeWidth(embolden_);
    }
    canvas->drawPath(outline, paint);

    GlyphImage glyph;
    glyph.mask = surface->makeImageSnapshot();
    glyph.left = pixelBounds.left();
    glyph.top = -pixelBounds.top();
    return glyph;
}

const GlyphImage& GlyphCache::findOrRasterize(const GlyphCacheKey& key, const GlyphRasterizer& rasterizer) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        ++hits_;
        return it->second;
    }

    ++misses_;
    std::optional<GlyphImage> image = rasterizer.rasterize(key);
    auto inserted = entries_.emplace(key, image ? std::move(*image) : GlyphImage{});
    return inserted.first->second;
}

void GlyphCache::clear() {
    entries_.clear();
    hits_ = 0;
    misses_ = 0;
}

}  // namespace tessera
