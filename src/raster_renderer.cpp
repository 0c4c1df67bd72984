// raster_renderer.cpp - Software backend surface management and presentation

#include "raster_renderer.h"

#include <cstdio>
#include <cstring>

#include "include/core/SkCanvas.h"
#include "include/core/SkColor.h"
#include "include/core/SkImageInfo.h"
#include "include/core/SkPixmap.h"

namespace tessera {

std::unique_ptr<RasterRenderer> RasterRenderer::create(SDL_Window* window,
                                                       std::shared_ptr<FontRegistry> fonts,
                                                       double scale,
                                                       uint32_t width,
                                                       uint32_t height,
                                                       const RendererOptions& options,
                                                       std::string* error) {
    std::unique_ptr<RasterRenderer> renderer(new RasterRenderer(window, std::move(fonts), scale,
                                                                options.fontEmbolden));

    if (window) {
        Uint32 flags = SDL_RENDERER_ACCELERATED;
        if (options.vsync) {
            flags |= SDL_RENDERER_PRESENTVSYNC;
        }
        renderer->sdlRenderer_ = SDL_CreateRenderer(window, -1, flags);
        if (!renderer->sdlRenderer_) {
            // Last resort: SDL's own software renderer
            renderer->sdlRenderer_ = SDL_CreateRenderer(window, -1, SDL_RENDERER_SOFTWARE);
        }
        if (!renderer->sdlRenderer_) {
            if (error) *error = std::string("failed to create SDL renderer: ") + SDL_GetError();
            fprintf(stderr, "[RasterRenderer] Error: Failed to create SDL renderer: %s\n", SDL_GetError());
            return nullptr;
        }
    }

    if (!renderer->createTargets(width, height, error)) {
        return nullptr;
    }

    printf("[RasterRenderer] Using Skia raster backend (%ux%u, scale %.2f%s)\n", width, height, scale,
           window ? "" : ", headless");
    return renderer;
}

RasterRenderer::RasterRenderer(SDL_Window* window, std::shared_ptr<FontRegistry> fonts, double scale,
                               float fontEmbolden)
    : RecordingRenderer(std::move(fonts), scale, fontEmbolden), window_(window) {}

RasterRenderer::~RasterRenderer() {
    if (texture_) {
        SDL_DestroyTexture(texture_);
    }
    if (sdlRenderer_) {
        SDL_DestroyRenderer(sdlRenderer_);
    }
}

bool RasterRenderer::createTargets(uint32_t width, uint32_t height, std::string* error) {
    // N32 is BGRA on little-endian hosts, the byte order of SDL_PIXELFORMAT_ARGB8888
    SkImageInfo imageInfo = SkImageInfo::MakeN32Premul(static_cast<int>(width), static_cast<int>(height));
    sk_sp<SkSurface> surface = SkSurfaces::Raster(imageInfo);
    if (!surface) {
        if (error) *error = "failed to allocate raster surface";
        fprintf(stderr, "[RasterRenderer] Error: Failed to create %ux%u Skia surface\n", width, height);
        return false;
    }

    SDL_Texture* texture = nullptr;
    if (sdlRenderer_) {
        texture = SDL_CreateTexture(sdlRenderer_, SDL_PIXELFORMAT_ARGB8888, SDL_TEXTUREACCESS_STREAMING,
                                    static_cast<int>(width), static_cast<int>(height));
        if (!texture) {
            if (error) *error = std::string("failed to create streaming texture: ") + SDL_GetError();
            fprintf(stderr, "[RasterRenderer] Error: Failed to create texture: %s\n", SDL_GetError());
            return false;
        }
    }

    if (texture_) {
        SDL_DestroyTexture(texture_);
    }
    texture_ = texture;
    surface_ = std::move(surface);
    width_ = width;
    height_ = height;
    return true;
}

sk_sp<SkImage> RasterRenderer::prepareImage(sk_sp<SkImage> image) {
    if (!image) {
        return nullptr;
    }
    // Decode lazily generated images once instead of on every draw
    sk_sp<SkImage> raster = image->makeRasterImage(nullptr);
    return raster ? raster : image;
}

void RasterRenderer::resize(double scale, Size size) {
    uint32_t width = 0;
    uint32_t height = 0;
    clampSurfaceSize(size, &width, &height);
    setScale(scale);

    if (planResize(width_, height_, width, height) != ResizeAction::Recreate) {
        return;
    }

    std::string error;
    if (!createTargets(width, height, &error)) {
        fprintf(stderr, "[RasterRenderer] Error: resize to %ux%u failed, keeping %ux%u\n", width, height,
                width_, height_);
    }
}

std::optional<RasterImage> RasterRenderer::finish(const FrameCallback& /*callback*/) {
    SkCanvas* canvas = surface_->getCanvas();
    canvas->clear(SK_ColorTRANSPARENT);
    recorder_.encode(canvas);

#ifdef TESSERA_RENDER_DEBUG
    printf("[RasterRenderer] Frame: %zu primitives%s\n", recorder_.primitives().size(), capture_ ? " (capture)" : "");
#endif

    if (capture_) {
        RasterImage image(width_, height_);
        SkImageInfo dstInfo = SkImageInfo::Make(static_cast<int>(width_), static_cast<int>(height_),
                                                kRGBA_8888_SkColorType, kUnpremul_SkAlphaType);
        if (!surface_->readPixels(dstInfo, image.pixels.data(), image.rowBytes(), 0, 0)) {
            fprintf(stderr, "[RasterRenderer] Error: Failed to read back %ux%u pixels\n", width_, height_);
            return std::nullopt;
        }
        return image;
    }

    if (sdlRenderer_) {
        present();
    }
    return std::nullopt;
}

void RasterRenderer::present() {
    SkPixmap pixmap;
    if (!surface_->peekPixels(&pixmap)) {
        fprintf(stderr, "[RasterRenderer] Error: surface pixels are not accessible\n");
        return;
    }

    void* pixels = nullptr;
    int pitch = 0;
    if (SDL_LockTexture(texture_, nullptr, &pixels, &pitch) != 0) {
        fprintf(stderr, "[RasterRenderer] Error: Failed to lock texture: %s\n", SDL_GetError());
        return;
    }

    const uint8_t* src = static_cast<const uint8_t*>(pixmap.addr());
    uint8_t* dst = static_cast<uint8_t*>(pixels);
    const size_t rowBytes = static_cast<size_t>(width_) * 4;

    for (uint32_t row = 0; row < height_; row++) {
        memcpy(dst + row * pitch, src + row * pixmap.rowBytes(), rowBytes);
    }

    SDL_UnlockTexture(texture_);

    SDL_SetRenderDrawColor(sdlRenderer_, 0, 0, 0, 255);
    SDL_RenderClear(sdlRenderer_);
    SDL_RenderCopy(sdlRenderer_, texture_, nullptr, nullptr);
    SDL_RenderPresent(sdlRenderer_);
}

} // namespace tessera
