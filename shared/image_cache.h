// image_cache.h - Images and SVG documents handed to drawImage()/drawSvg(),
// and the hash-keyed cache of their rasterized pixels

#ifndef TESSERA_IMAGE_CACHE_H
#define TESSERA_IMAGE_CACHE_H

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

#include "include/core/SkImage.h"
#include "include/core/SkRefCnt.h"
#include "include/core/SkSize.h"
#include "modules/svg/include/SkSVGDOM.h"

class SkFontMgr;

namespace tessera {

/**
 * A decoded image plus the caller's content hash.
 * Equal hashes must mean equal pixels; the renderer never re-reads a cached image.
 */
struct Img {
    sk_sp<SkImage> image;
    std::string hash;
};

/**
 * A parsed SVG document plus the caller's content hash.
 */
struct Svg {
    sk_sp<SkSVGDOM> dom;
    std::string hash;

    /**
     * Parse SVG markup. Text elements are shaped with the given font manager.
     * @return nullopt if the markup does not parse
     */
    static std::optional<Svg> parse(const void* data, size_t length, std::string hash, sk_sp<SkFontMgr> fontMgr);

    // Intrinsic size from the root element, falling back to the viewBox
    SkSize intrinsicSize() const;
};

/**
 * Content-hash keyed cache of ready-to-draw raster images.
 * Entries live as long as the owning backend.
 */
class ImageCache {
public:
    using Producer = std::function<sk_sp<SkImage>()>;

    ImageCache() = default;

    ImageCache(const ImageCache&) = delete;
    ImageCache& operator=(const ImageCache&) = delete;

    /**
     * Return the cached image for key, invoking producer only on a miss.
     * A null producer result is not cached.
     */
    sk_sp<SkImage> findOrCreate(const std::string& key, const Producer& producer);

    bool contains(const std::string& key) const { return entries_.count(key) != 0; }
    size_t size() const { return entries_.size(); }
    size_t missCount() const { return misses_; }

    void clear() { entries_.clear(); }

private:
    std::unordered_map<std::string, sk_sp<SkImage>> entries_;
    size_t misses_ = 0;
};

}  // namespace tessera

#endif  // TESSERA_IMAGE_CACHE_H
