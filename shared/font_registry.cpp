// font_registry.cpp - Typeface registration and platform font manager

#include "font_registry.h"

#include <cstdio>

#include "include/core/SkData.h"
#include "include/core/SkFontStyle.h"

#if defined(__linux__)
    #include "include/ports/SkFontMgr_fontconfig.h"
    #include "include/ports/SkFontScanner_FreeType.h"
#endif

namespace tessera {

sk_sp<SkFontMgr> createPlatformFontMgr() {
#if defined(__linux__)
    // FontConfig requires a FreeType font scanner as second parameter
    return SkFontMgr_New_FontConfig(nullptr, SkFontScanner_Make_FreeType());
#else
    return SkFontMgr::RefEmpty();
#endif
}

FontRegistry::FontRegistry() : FontRegistry(createPlatformFontMgr()) {}

FontRegistry::FontRegistry(sk_sp<SkFontMgr> fontMgr) : fontMgr_(std::move(fontMgr)) {
    if (!fontMgr_) {
        fontMgr_ = SkFontMgr::RefEmpty();
    }
}

bool FontRegistry::registerFontData(uint32_t fontId, const void* data, size_t length) {
    if (!data || length == 0) {
        fprintf(stderr, "[FontRegistry] Error: empty font data for id %u\n", fontId);
        return false;
    }

    sk_sp<SkTypeface> face = fontMgr_->makeFromData(SkData::MakeWithCopy(data, length));
    if (!face) {
        fprintf(stderr, "[FontRegistry] Error: could not decode font data for id %u\n", fontId);
        return false;
    }
    registerTypeface(fontId, std::move(face));
    return true;
}

bool FontRegistry::registerFamily(uint32_t fontId, const char* familyName) {
    sk_sp<SkTypeface> face = fontMgr_->matchFamilyStyle(familyName, SkFontStyle::Normal());
    if (!face) {
        // Fall back to the platform default family
        face = fontMgr_->matchFamilyStyle(nullptr, SkFontStyle::Normal());
    }
    if (!face) {
        fprintf(stderr, "[FontRegistry] Error: no typeface for family '%s'\n", familyName ? familyName : "(default)");
        return false;
    }
    registerTypeface(fontId, std::move(face));
    return true;
}

void FontRegistry::registerTypeface(uint32_t fontId, sk_sp<SkTypeface> typeface) {
    std::lock_guard<std::mutex> lock(mutex_);
    typefaces_[fontId] = std::move(typeface);
}

sk_sp<SkTypeface> FontRegistry::typeface(uint32_t fontId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = typefaces_.find(fontId);
    return it != typefaces_.end() ? it->second : nullptr;
}

size_t FontRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return typefaces_.size();
}

}  // namespace tessera
