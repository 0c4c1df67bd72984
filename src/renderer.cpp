// renderer.cpp - Backend selection and dispatch

#include "renderer.h"

#include <cstdio>
#include <utility>

#include "variant_utils.h"

namespace tessera {

namespace {

std::string initErrorMessage(const std::string& gpuCause, const std::string& softwareCause) {
    if (gpuCause.empty()) {
        return "software renderer failed: " + softwareCause;
    }
    return "GPU renderer failed: " + gpuCause + "; software renderer failed: " + softwareCause;
}

Size clampedSize(Size size) {
    uint32_t width = 0;
    uint32_t height = 0;
    clampSurfaceSize(size, &width, &height);
    return Size(width, height);
}

Renderer::Backend createBackend(SDL_Window* window,
                                std::shared_ptr<FontRegistry> fonts,
                                double scale,
                                Size size,
                                const RendererOptions& options) {
    uint32_t width = 0;
    uint32_t height = 0;
    clampSurfaceSize(size, &width, &height);

    std::string gpuCause;
    if (options.forceSoftware) {
        printf("[Renderer] TESSERA_FORCE_SOFTWARE set, skipping GPU backend\n");
    } else {
        std::unique_ptr<GpuRenderer> gpu =
            GpuRenderer::create(window, fonts, scale, width, height, options, &gpuCause);
        if (gpu) {
            return Renderer::Backend(std::move(gpu));
        }
        if (gpuCause.empty()) {
            gpuCause = "unknown error";
        }
        fprintf(stderr, "[Renderer] GPU backend unavailable (%s), falling back to software\n", gpuCause.c_str());
    }

    std::string softwareCause;
    std::unique_ptr<RasterRenderer> raster =
        RasterRenderer::create(window, std::move(fonts), scale, width, height, options, &softwareCause);
    if (raster) {
        return Renderer::Backend(std::move(raster));
    }
    if (softwareCause.empty()) {
        softwareCause = "unknown error";
    }
    throw RendererInitError(gpuCause, softwareCause);
}

} // namespace

RendererInitError::RendererInitError(std::string gpuCause, std::string softwareCause)
    : std::runtime_error(initErrorMessage(gpuCause, softwareCause)),
      gpuCause_(std::move(gpuCause)),
      softwareCause_(std::move(softwareCause)) {}

Renderer::Renderer(SDL_Window* window,
                   std::shared_ptr<FontRegistry> fonts,
                   double scale,
                   Size size,
                   const RendererOptions& options)
    : backend_(createBackend(window, std::move(fonts), scale, size, options)) {}

Renderer::Renderer(Backend backend) : backend_(std::move(backend)) {}

Renderer Renderer::uninitialized(double scale, Size size) {
    return Renderer(Backend(UninitializedRenderer{scale, clampedSize(size)}));
}

template <typename Fn>
void Renderer::forward(Fn&& fn) {
    std::visit(Overloaded{
                   [&](std::unique_ptr<GpuRenderer>& r) { fn(static_cast<PrimitiveRenderer&>(*r)); },
                   [&](std::unique_ptr<RasterRenderer>& r) { fn(static_cast<PrimitiveRenderer&>(*r)); },
                   [](UninitializedRenderer&) {},
               },
               backend_);
}

void Renderer::begin(bool capture) {
    forward([&](PrimitiveRenderer& r) { r.begin(capture); });
}

void Renderer::clip(const Shape& shape) {
    forward([&](PrimitiveRenderer& r) { r.clip(shape); });
}

void Renderer::clearClip() {
    forward([](PrimitiveRenderer& r) { r.clearClip(); });
}

DrawStatus Renderer::stroke(const Shape& shape, const Brush& brush, double width) {
    // Nothing is produced before a backend exists
    DrawStatus status = DrawStatus::NoPaint;
    forward([&](PrimitiveRenderer& r) { status = r.stroke(shape, brush, width); });
    return status;
}

DrawStatus Renderer::fill(const Shape& shape, const Brush& brush, double blurRadius) {
    DrawStatus status = DrawStatus::NoPaint;
    forward([&](PrimitiveRenderer& r) { status = r.fill(shape, brush, blurRadius); });
    return status;
}

void Renderer::drawText(const TextLayout& layout, Point pos) {
    forward([&](PrimitiveRenderer& r) { r.drawText(layout, pos); });
}

void Renderer::drawImage(const Img& img, const Rect& rect) {
    forward([&](PrimitiveRenderer& r) { r.drawImage(img, rect); });
}

void Renderer::drawSvg(const Svg& svg, const Rect& rect, const std::optional<Brush>& brush) {
    forward([&](PrimitiveRenderer& r) { r.drawSvg(svg, rect, brush); });
}

void Renderer::transform(const Affine& affine) {
    forward([&](PrimitiveRenderer& r) { r.transform(affine); });
}

void Renderer::setZIndex(int32_t z) {
    forward([&](PrimitiveRenderer& r) { r.setZIndex(z); });
}

void Renderer::resize(double scale, Size size) {
    const Size clamped = clampedSize(size);
    std::visit(Overloaded{
                   [&](std::unique_ptr<GpuRenderer>& r) { r->resize(scale, clamped); },
                   [&](std::unique_ptr<RasterRenderer>& r) { r->resize(scale, clamped); },
                   // Not a drawing call: the placeholder still tracks scale and size
                   [&](UninitializedRenderer& u) {
                       u.scale = scale;
                       u.size = clamped;
                   },
               },
               backend_);
}

void Renderer::setScale(double scale) {
    std::visit(Overloaded{
                   [&](std::unique_ptr<GpuRenderer>& r) { r->setScale(scale); },
                   [&](std::unique_ptr<RasterRenderer>& r) { r->setScale(scale); },
                   [&](UninitializedRenderer& u) { u.scale = scale; },
               },
               backend_);
}

double Renderer::scale() const {
    return std::visit(Overloaded{
                          [](const std::unique_ptr<GpuRenderer>& r) { return r->scale(); },
                          [](const std::unique_ptr<RasterRenderer>& r) { return r->scale(); },
                          [](const UninitializedRenderer& u) { return u.scale; },
                      },
                      backend_);
}

Size Renderer::size() const {
    return std::visit(Overloaded{
                          [](const std::unique_ptr<GpuRenderer>& r) { return r->size(); },
                          [](const std::unique_ptr<RasterRenderer>& r) { return r->size(); },
                          [](const UninitializedRenderer& u) { return u.size; },
                      },
                      backend_);
}

std::optional<RasterImage> Renderer::finish(const FrameCallback& callback) {
    return std::visit(Overloaded{
                          [&](std::unique_ptr<GpuRenderer>& r) { return r->finish(callback); },
                          [&](std::unique_ptr<RasterRenderer>& r) { return r->finish(callback); },
                          [](UninitializedRenderer&) { return std::optional<RasterImage>(); },
                      },
                      backend_);
}

Renderer::Kind Renderer::kind() const {
    return std::visit(Overloaded{
                          [](const std::unique_ptr<GpuRenderer>&) { return Kind::Hardware; },
                          [](const std::unique_ptr<RasterRenderer>&) { return Kind::Software; },
                          [](const UninitializedRenderer&) { return Kind::Uninitialized; },
                      },
                      backend_);
}

const char* Renderer::backendName() const {
    return std::visit(Overloaded{
                          [](const std::unique_ptr<GpuRenderer>& r) { return r->backendName(); },
                          [](const std::unique_ptr<RasterRenderer>& r) { return r->backendName(); },
                          [](const UninitializedRenderer&) { return "Uninitialized"; },
                      },
                      backend_);
}

GpuRenderer* Renderer::hardware() {
    auto* gpu = std::get_if<std::unique_ptr<GpuRenderer>>(&backend_);
    return gpu ? gpu->get() : nullptr;
}

RasterRenderer* Renderer::software() {
    auto* raster = std::get_if<std::unique_ptr<RasterRenderer>>(&backend_);
    return raster ? raster->get() : nullptr;
}

} // namespace tessera
