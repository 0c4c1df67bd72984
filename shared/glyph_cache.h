// glyph_cache.h - Sub-pixel aware glyph rasterization cache

#ifndef TESSERA_GLYPH_CACHE_H
#define TESSERA_GLYPH_CACHE_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <utility>

#include "include/core/SkImage.h"
#include "include/core/SkRefCnt.h"

namespace tessera {

class FontRegistry;

/**
 * Quarter-pixel position bins. A glyph drawn at x = 10.3 and x = 11.3 shares
 * one bitmap; x = 10.3 and x = 10.6 do not.
 */
enum class SubpixelBin : uint8_t {
    Zero = 0,
    One = 1,
    Two = 2,
    Three = 3
};

/**
 * Split a device coordinate into an integer pixel and a sub-pixel bin.
 * Fractions within 1/8 of a whole pixel snap to that pixel.
 */
std::pair<int32_t, SubpixelBin> subpixelBinFor(float pos);

float subpixelOffset(SubpixelBin bin);

struct GlyphCacheKey {
    uint32_t fontId = 0;
    uint16_t glyphId = 0;
    uint32_t fontSize = 0;  // whole device pixels
    SubpixelBin xBin = SubpixelBin::Zero;
    SubpixelBin yBin = SubpixelBin::Zero;
    uint32_t flags = 0;

    /**
     * Build the key for a glyph at a device position.
     * @param outX, outY receive the whole-pixel origin to draw the cached bitmap at
     */
    static GlyphCacheKey make(uint32_t fontId, uint16_t glyphId, uint32_t fontSize, float x, float y,
                              uint32_t flags, int32_t* outX, int32_t* outY);

    bool operator==(const GlyphCacheKey& o) const {
        return fontId == o.fontId && glyphId == o.glyphId && fontSize == o.fontSize && xBin == o.xBin &&
               yBin == o.yBin && flags == o.flags;
    }
};

struct GlyphCacheKeyHash {
    size_t operator()(const GlyphCacheKey& k) const {
        size_t h = std::hash<uint32_t>()(k.fontId);
        h = h * 31 + k.glyphId;
        h = h * 31 + k.fontSize;
        h = h * 31 + (static_cast<size_t>(k.xBin) << 2 | static_cast<size_t>(k.yBin));
        h = h * 31 + k.flags;
        return h;
    }
};

/**
 * Alpha-mask bitmap of one glyph. left/top place the bitmap relative to the
 * pen position: it covers (penX + left, penY - top) downward.
 * mask is null for glyphs without coverage (spaces).
 */
struct GlyphImage {
    sk_sp<SkImage> mask;
    int32_t left = 0;
    int32_t top = 0;

    bool empty() const { return !mask; }
};

/**
 * Rasterizes glyph outlines into A8 masks.
 * embolden widens every outline by that many device pixels.
 */
class GlyphRasterizer {
public:
    GlyphRasterizer(std::shared_ptr<FontRegistry> fonts, float embolden);

    /**
     * @return the rendered mask (empty for blank glyphs), or nullopt if the
     *         font id is unknown
     */
    std::optional<GlyphImage> rasterize(const GlyphCacheKey& key) const;

    float embolden() const { return embolden_; }
    const std::shared_ptr<FontRegistry>& fonts() const { return fonts_; }

private:
    std::shared_ptr<FontRegistry> fonts_;
    float embolden_;
};

/**
 * Backend-lifetime glyph cache. Grows without eviction; call clear() to drop
 * every entry (e.g. after a font change).
 */
class GlyphCache {
public:
    GlyphCache() = default;

    GlyphCache(const GlyphCache&) = delete;
    GlyphCache& operator=(const GlyphCache&) = delete;

    /**
     * Look up a glyph, rasterizing it on the first request.
     * Failed rasterizations are cached as empty glyphs so they are not retried.
     */
    const GlyphImage& findOrRasterize(const GlyphCacheKey& key, const GlyphRasterizer& rasterizer);

    bool contains(const GlyphCacheKey& key) const { return entries_.count(key) != 0; }
    size_t size() const { return entries_.size(); }
    size_t hitCount() const { return hits_; }
    size_t missCount() const { return misses_; }

    void clear();

private:
    std::unordered_map<GlyphCacheKey, GlyphImage, GlyphCacheKeyHash> entries_;
    size_t hits_ = 0;
    size_t misses_ = 0;
};

}  // namespace tessera

#endif  // TESSERA_GLYPH_CACHE_H
