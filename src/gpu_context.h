/**
 * GPU Context for the Tessera hardware backend
 *
 * Owns the Vulkan device, queue, presentation surface and swapchain, and
 * the Skia Graphite context the recorded primitives are replayed through.
 *
 * This header is Vulkan-free: Vulkan details live in gpu_context_vulkan.cpp
 * and vulkan_frame.h.
 */

#ifndef TESSERA_GPU_CONTEXT_H
#define TESSERA_GPU_CONTEXT_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <SDL.h>

#include "include/core/SkImage.h"
#include "include/core/SkRefCnt.h"
#include "include/core/SkSurface.h"

#include "frame_pass.h"
#include "raster_image.h"

namespace tessera {

struct MultisampledTarget;

// Pixel formats of the two kinds of frame recorder
enum class TargetFormat {
    Presentation,  // BGRA8 sRGB, matches the swapchain
    Capture        // RGBA8, read back to the CPU
};

// Number of samples of the multisampled target
constexpr uint32_t MSAA_SAMPLE_COUNT = 4;

/**
 * A Graphite recorder bound to one target format.
 * Each frame recorder of the hardware backend owns one.
 */
class GpuRecorder {
public:
    virtual ~GpuRecorder() = default;

    GpuRecorder(const GpuRecorder&) = delete;
    GpuRecorder& operator=(const GpuRecorder&) = delete;

    /**
     * Wrap the multisampled target as a drawable surface. Existing contents
     * are loaded, not cleared.
     */
    virtual sk_sp<SkSurface> wrapTarget(MultisampledTarget& target) = 0;

    // Offscreen surface in this recorder's format, cleared by the caller
    virtual sk_sp<SkSurface> makeOffscreen(uint32_t width, uint32_t height) = 0;

    // Upload a CPU image as a texture; nullptr on failure
    virtual sk_sp<SkImage> uploadImage(const sk_sp<SkImage>& image) = 0;

    /**
     * Snap everything drawn so far and submit it to the GPU queue.
     * @param resolveSource when set, leaves that target ready to be resolved
     * @return true if the recording was inserted and submitted
     */
    virtual bool submit(MultisampledTarget* resolveSource) = 0;

    /**
     * Copy a surface's pixels to the CPU, blocking until the GPU is done.
     * There is no timeout.
     */
    virtual std::optional<RasterImage> readPixels(SkSurface* surface) = 0;

protected:
    GpuRecorder() = default;
};

/**
 * Abstract interface for the Vulkan/Graphite device context.
 * Shared by the hardware backend and its frame recorders.
 */
class GpuContext {
public:
    virtual ~GpuContext() = default;

    // Non-copyable
    GpuContext(const GpuContext&) = delete;
    GpuContext& operator=(const GpuContext&) = delete;

    /**
     * Create the instance, device and Graphite context.
     * A null window gives a headless context that can only capture.
     *
     * @param window SDL window created with SDL_WINDOW_VULKAN, or nullptr
     * @param vsync FIFO presentation when true, immediate otherwise
     * @return true if initialization succeeded; see lastError() otherwise
     */
    virtual bool initialize(SDL_Window* window, bool vsync) = 0;

    virtual void destroy() = 0;

    virtual bool isHeadless() const = 0;

    // Description of the last failure
    virtual const std::string& lastError() const = 0;

    /**
     * (Re)create the swapchain at the given size. No-op when headless or
     * when the size is unchanged.
     */
    virtual bool configureSurface(uint32_t width, uint32_t height) = 0;

    // 4x multisampled presentation-format target
    virtual std::shared_ptr<MultisampledTarget> createMultisampledTarget(uint32_t width, uint32_t height) = 0;

    virtual std::unique_ptr<GpuRecorder> makeRecorder(TargetFormat format) = 0;

    /**
     * Acquire the next swapchain image and begin a command encoder for the
     * caller's pass. The encoder starts by clearing the target to
     * transparent. nullopt if no image could be acquired (headless, or the
     * swapchain could not be recreated); the caller retries next frame.
     */
    virtual std::optional<FramePass> beginFrame(MultisampledTarget& target) = 0;

    /**
     * End and submit the pass's command encoder. The target's layout is
     * recorded as color attachment only when the submit succeeds.
     */
    virtual bool submitPass(const FramePass& pass, MultisampledTarget& target) = 0;

    /**
     * Resolve the multisampled target into the pass's resolve image and
     * present it. Does not wait for the GPU.
     */
    virtual bool resolveAndPresent(const FramePass& pass, MultisampledTarget& target) = 0;

    /**
     * Give back an acquired frame without drawing: the encoder is discarded
     * and the image is presented cleared.
     */
    virtual void discardFrame(const FramePass& pass) = 0;

    /**
     * Resolve the multisampled target and copy it to the CPU, blocking until
     * the device is idle. nullopt if the target was never rendered.
     */
    virtual std::optional<RasterImage> readTarget(MultisampledTarget& target) = 0;

    // Process finished GPU work without blocking
    virtual void pollDevice() = 0;

    /**
     * Get the name of the GPU backend being used.
     * @return "Vulkan Graphite"
     */
    virtual const char* getBackendName() const = 0;

protected:
    GpuContext() = default;
};

/**
 * Factory function to create and initialize a GpuContext.
 *
 * @param window SDL window to present into, or nullptr for a headless context
 * @param vsync FIFO presentation
 * @param error receives the failure cause when nullptr is returned
 * @return Initialized context, or nullptr if no usable GPU is available
 */
std::shared_ptr<GpuContext> createGpuContext(SDL_Window* window, bool vsync, std::string* error);

} // namespace tessera

#endif // TESSERA_GPU_CONTEXT_H
