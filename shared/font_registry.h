// font_registry.h - Maps caller font ids to Skia typefaces

#ifndef TESSERA_FONT_REGISTRY_H
#define TESSERA_FONT_REGISTRY_H

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <unordered_map>

#include "include/core/SkFontMgr.h"
#include "include/core/SkRefCnt.h"
#include "include/core/SkTypeface.h"

namespace tessera {

/**
 * Platform font manager (FontConfig + FreeType on Linux).
 * Returns an empty manager on platforms without a port.
 */
sk_sp<SkFontMgr> createPlatformFontMgr();

/**
 * Font id -> typeface table shared by every backend of a window.
 * Text layouts reference fonts only by id; the embedding application
 * registers the typefaces it shaped with.
 */
class FontRegistry {
public:
    FontRegistry();
    explicit FontRegistry(sk_sp<SkFontMgr> fontMgr);

    FontRegistry(const FontRegistry&) = delete;
    FontRegistry& operator=(const FontRegistry&) = delete;

    /**
     * Register a font from raw file bytes (TTF/OTF).
     * @return false if the font manager cannot decode the data
     */
    bool registerFontData(uint32_t fontId, const void* data, size_t length);

    /**
     * Register the best system match for a family name.
     * @return false if no typeface could be found
     */
    bool registerFamily(uint32_t fontId, const char* familyName);

    void registerTypeface(uint32_t fontId, sk_sp<SkTypeface> typeface);

    // nullptr when the id was never registered
    sk_sp<SkTypeface> typeface(uint32_t fontId) const;

    size_t size() const;

    const sk_sp<SkFontMgr>& fontMgr() const { return fontMgr_; }

private:
    sk_sp<SkFontMgr> fontMgr_;
    mutable std::mutex mutex_;
    std::unordered_map<uint32_t, sk_sp<SkTypeface>> typefaces_;
};

}  // namespace tessera

#endif  // TESSERA_FONT_REGISTRY_H
