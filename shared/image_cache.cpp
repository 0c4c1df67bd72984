// image_cache.cpp - SVG parsing and hash-keyed image caching

#include "image_cache.h"

#include <cstdio>

#include "include/core/SkData.h"
#include "include/core/SkFontMgr.h"
#include "include/core/SkStream.h"
#include "modules/skshaper/utils/FactoryHelpers.h"
#include "modules/svg/include/SkSVGRenderContext.h"
#include "modules/svg/include/SkSVGSVG.h"

namespace tessera {

namespace {

// Used when the root element carries neither width/height nor a viewBox
const SkSize kDefaultSvgSize = SkSize::Make(100, 100);

}  // namespace

std::optional<Svg> Svg::parse(const void* data, size_t length, std::string hash, sk_sp<SkFontMgr> fontMgr) {
    if (!data || length == 0) {
        fprintf(stderr, "[Svg] Error: empty SVG data\n");
        return std::nullopt;
    }

    SkMemoryStream stream(SkData::MakeWithCopy(data, length));
    sk_sp<SkSVGDOM> dom = SkSVGDOM::Builder()
                              .setFontManager(std::move(fontMgr))
                              .setTextShapingFactory(SkShapers::BestAvailable())
                              .make(stream);
    if (!dom || !dom->getRoot()) {
        fprintf(stderr, "[Svg] Error: failed to parse SVG document (%zu bytes)\n", length);
        return std::nullopt;
    }

    Svg svg;
    svg.dom = std::move(dom);
    svg.hash = std::move(hash);
    svg.dom->setContainerSize(svg.intrinsicSize());
    return svg;
}

SkSize Svg::intrinsicSize() const {
    if (!dom || !dom->getRoot()) {
        return SkSize::MakeEmpty();
    }

    SkSVGSVG* root = dom->getRoot();
    SkSize size = root->intrinsicSize(SkSVGLengthContext(kDefaultSvgSize));
    if (size.width() > 0 && size.height() > 0) {
        return size;
    }

    const auto& viewBox = root->getViewBox();
    if (viewBox.isValid() && !viewBox->isEmpty()) {
        return SkSize::Make(viewBox->width(), viewBox->height());
    }
    return kDefaultSvgSize;
}

sk_sp<SkImage> ImageCache::findOrCreate(const std::string& key, const Producer& producer) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        return it->second;
    }

    ++misses_;
    sk_sp<SkImage> image = producer ? producer() : nullptr;
    if (!image) {
        return nullptr;
    }
    entries_.emplace(key, image);
    return image;
}

}  // namespace tessera
