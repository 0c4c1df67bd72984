/**
 * Hardware backend: primitives replayed through Skia Graphite on Vulkan
 */

#ifndef TESSERA_GPU_RENDERER_H
#define TESSERA_GPU_RENDERER_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <SDL.h>

#include "capture_switch.h"
#include "frame_pass.h"
#include "gpu_context.h"
#include "raster_image.h"
#include "recording_renderer.h"
#include "renderer_options.h"

namespace tessera {

/**
 * Renders frames into a 4x multisampled target that is resolved into the
 * swapchain image, or (capture mode) into an offscreen RGBA8 surface that is
 * read back to the CPU.
 *
 * Normal and capture frames use separate frame recorders. The capture
 * recorder is created on the first capture frame and kept afterwards.
 */
class GpuRenderer : public RecordingRenderer {
public:
    // Primitive list plus the Graphite recorder it is replayed through
    struct FrameRecorder {
        PrimitiveRecorder primitives;
        std::unique_ptr<GpuRecorder> gpu;
    };

    /**
     * Create the backend.
     *
     * @param window window to present into (SDL_WINDOW_VULKAN), or nullptr for capture only
     * @param fonts font table for text
     * @param scale device scale
     * @param width, height surface size in pixels (>= 1)
     * @param error receives the failure cause when nullptr is returned
     */
    static std::unique_ptr<GpuRenderer> create(SDL_Window* window,
                                               std::shared_ptr<FontRegistry> fonts,
                                               double scale,
                                               uint32_t width,
                                               uint32_t height,
                                               const RendererOptions& options,
                                               std::string* error);

    ~GpuRenderer() override;

    void resize(double scale, Size size) override;
    Size size() const override { return Size(width_, height_); }

    /**
     * Finish the frame.
     *
     * Normal mode: acquires a swapchain image, runs callback (if any) for the
     * caller's pass, draws the primitives over the multisampled target,
     * resolves and presents. Returns nullopt.
     *
     * Capture mode: draws into a transparent offscreen surface and returns its
     * pixels. Blocks until the readback completes.
     */
    std::optional<RasterImage> finish(const FrameCallback& callback);

    bool captureMode() const { return recorders_.capture(); }
    const FrameRecorder& activeFrameRecorder() const { return recorders_.active(); }
    const std::shared_ptr<MultisampledTarget>& multisampledTarget() const { return msaa_; }
    const std::shared_ptr<GpuContext>& context() const { return context_; }

    const char* backendName() const { return context_->getBackendName(); }

protected:
    PrimitiveRecorder& recorder() override { return recorders_.active().primitives; }
    const PrimitiveRecorder& recorder() const override { return recorders_.active().primitives; }
    void onBegin(bool capture) override;
    sk_sp<SkImage> prepareImage(sk_sp<SkImage> image) override;

private:
    GpuRenderer(std::shared_ptr<GpuContext> context,
                std::unique_ptr<FrameRecorder> normal,
                std::shared_ptr<MultisampledTarget> msaa,
                std::shared_ptr<FontRegistry> fonts,
                double scale,
                uint32_t width,
                uint32_t height,
                float fontEmbolden);

    std::optional<RasterImage> finishCapture();
    void finishPresent(const FrameCallback& callback);

    // Declared first: destroyed after the recorders and target that use it
    std::shared_ptr<GpuContext> context_;
    std::shared_ptr<MultisampledTarget> msaa_;
    CaptureSwitch<FrameRecorder> recorders_;
    uint32_t width_;
    uint32_t height_;
};

} // namespace tessera

#endif // TESSERA_GPU_RENDERER_H
