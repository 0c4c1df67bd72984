// gpu_renderer.cpp - Hardware backend frame lifecycle

#include "gpu_renderer.h"

#include <cstdio>

#include "include/core/SkCanvas.h"
#include "include/core/SkColor.h"

namespace tessera {

namespace {

std::unique_ptr<GpuRenderer::FrameRecorder> makeFrameRecorder(GpuContext& context, bool capture) {
    auto recorder = std::make_unique<GpuRenderer::FrameRecorder>();
    recorder->gpu = context.makeRecorder(capture ? TargetFormat::Capture : TargetFormat::Presentation);
    if (!recorder->gpu) {
        return nullptr;
    }
    return recorder;
}

} // namespace

std::unique_ptr<GpuRenderer> GpuRenderer::create(SDL_Window* window,
                                                 std::shared_ptr<FontRegistry> fonts,
                                                 double scale,
                                                 uint32_t width,
                                                 uint32_t height,
                                                 const RendererOptions& options,
                                                 std::string* error) {
    std::shared_ptr<GpuContext> context = createGpuContext(window, options.vsync, error);
    if (!context) {
        return nullptr;
    }

    if (!context->configureSurface(width, height)) {
        if (error) *error = "failed to configure the presentation surface";
        fprintf(stderr, "[GpuRenderer] Error: failed to configure %ux%u surface\n", width, height);
        return nullptr;
    }

    std::shared_ptr<MultisampledTarget> msaa = context->createMultisampledTarget(width, height);
    if (!msaa) {
        if (error) *error = "failed to create the multisampled target";
        return nullptr;
    }

    std::unique_ptr<FrameRecorder> normal = makeFrameRecorder(*context, false);
    if (!normal) {
        if (error) *error = "failed to create a frame recorder";
        return nullptr;
    }

    printf("[GpuRenderer] Using %s (%ux%u, scale %.2f)\n", context->getBackendName(), width, height, scale);
    return std::unique_ptr<GpuRenderer>(new GpuRenderer(std::move(context), std::move(normal), std::move(msaa),
                                                        std::move(fonts), scale, width, height,
                                                        options.fontEmbolden));
}

GpuRenderer::GpuRenderer(std::shared_ptr<GpuContext> context,
                         std::unique_ptr<FrameRecorder> normal,
                         std::shared_ptr<MultisampledTarget> msaa,
                         std::shared_ptr<FontRegistry> fonts,
                         double scale,
                         uint32_t width,
                         uint32_t height,
                         float fontEmbolden)
    : RecordingRenderer(std::move(fonts), scale, fontEmbolden),
      context_(std::move(context)),
      msaa_(std::move(msaa)),
      recorders_(std::move(normal),
                 [ctx = context_.get()](bool capture) { return makeFrameRecorder(*ctx, capture); }),
      width_(width),
      height_(height) {}

GpuRenderer::~GpuRenderer() {
    // Uploaded textures belong to this context
    dropCachedImages();
}

void GpuRenderer::onBegin(bool capture) {
    if (!recorders_.select(capture)) {
        fprintf(stderr, "[GpuRenderer] Error: could not create the %s frame recorder, staying in %s mode\n",
                capture ? "capture" : "normal", recorders_.capture() ? "capture" : "normal");
    }
}

sk_sp<SkImage> GpuRenderer::prepareImage(sk_sp<SkImage> image) {
    if (!image) {
        return nullptr;
    }
    sk_sp<SkImage> texture = recorders_.active().gpu->uploadImage(image);
    // Graphite draws raster images too, uploading them on every use
    return texture ? texture : image;
}

void GpuRenderer::resize(double scale, Size size) {
    uint32_t width = 0;
    uint32_t height = 0;
    clampSurfaceSize(size, &width, &height);
    setScale(scale);

    switch (planResize(width_, height_, width, height)) {
        case ResizeAction::ScaleOnly:
        case ResizeAction::Ignore:
            return;
        case ResizeAction::Recreate:
            break;
    }

    if (!context_->configureSurface(width, height)) {
        fprintf(stderr, "[GpuRenderer] Error: failed to reconfigure surface to %ux%u\n", width, height);
        return;
    }

    std::shared_ptr<MultisampledTarget> msaa = context_->createMultisampledTarget(width, height);
    if (!msaa) {
        fprintf(stderr, "[GpuRenderer] Error: failed to recreate multisampled target at %ux%u\n", width, height);
        return;
    }

    msaa_ = std::move(msaa);
    width_ = width;
    height_ = height;
}

std::optional<RasterImage> GpuRenderer::finish(const FrameCallback& callback) {
    if (recorders_.capture()) {
        return finishCapture();
    }
    finishPresent(callback);
    return std::nullopt;
}

std::optional<RasterImage> GpuRenderer::finishCapture() {
    FrameRecorder& frame = recorders_.active();

    sk_sp<SkSurface> surface = frame.gpu->makeOffscreen(width_, height_);
    if (!surface) {
        return std::nullopt;
    }

    SkCanvas* canvas = surface->getCanvas();
    canvas->clear(SK_ColorTRANSPARENT);
    frame.primitives.encode(canvas);

    if (!frame.gpu->submit(nullptr)) {
        return std::nullopt;
    }

#ifdef TESSERA_RENDER_DEBUG
    printf("[GpuRenderer] Capture frame: %zu primitives, %ux%u\n", frame.primitives.primitives().size(),
           width_, height_);
#endif

    return frame.gpu->readPixels(surface.get());
}

void GpuRenderer::finishPresent(const FrameCallback& callback) {
    FrameRecorder& frame = recorders_.active();

    // Nothing to present to; the frame's primitives are dropped
    if (context_->isHeadless()) {
        return;
    }

    std::optional<FramePass> acquired = context_->beginFrame(*msaa_);
    if (!acquired) {
        fprintf(stderr, "[GpuRenderer] Failed to get current surface texture, frame skipped\n");
        return;
    }

    FramePass pass = callback ? callback(*acquired) : *acquired;
    if (!pass.complete()) {
        fprintf(stderr, "[GpuRenderer] Frame callback did not return the full pass, frame skipped\n");
        context_->discardFrame(*acquired);
        return;
    }

    if (!context_->submitPass(pass, *msaa_)) {
        FramePass ended = pass;
        ended.encoder.reset();
        context_->discardFrame(ended);
        return;
    }

    sk_sp<SkSurface> surface = frame.gpu->wrapTarget(*msaa_);
    if (surface) {
        frame.primitives.encode(surface->getCanvas());
        surface.reset();
        if (!frame.gpu->submit(msaa_.get())) {
            fprintf(stderr, "[GpuRenderer] Error: primitives were not submitted, presenting the caller's pass only\n");
        }
    }

    if (!context_->resolveAndPresent(pass, *msaa_)) {
        fprintf(stderr, "[GpuRenderer] Error: failed to present frame\n");
    }
    context_->pollDevice();

#ifdef TESSERA_RENDER_DEBUG
    printf("[GpuRenderer] Presented frame: %zu primitives\n", frame.primitives.primitives().size());
#endif
}

} // namespace tessera
