/**
 * Renderer - backend selection and dispatch
 *
 * Prefers the GPU backend and falls back to the software backend when no
 * usable adapter exists or TESSERA_FORCE_SOFTWARE=1 is set.
 */

#ifndef TESSERA_RENDERER_H
#define TESSERA_RENDERER_H

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <SDL.h>

#include "frame_pass.h"
#include "gpu_renderer.h"
#include "primitive_renderer.h"
#include "raster_image.h"
#include "raster_renderer.h"
#include "renderer_options.h"

namespace tessera {

/**
 * Thrown when neither backend could be created.
 * what() names the cause of each backend that was attempted.
 */
class RendererInitError : public std::runtime_error {
public:
    RendererInitError(std::string gpuCause, std::string softwareCause);

    // Empty when the GPU backend was skipped
    const std::string& gpuCause() const { return gpuCause_; }
    const std::string& softwareCause() const { return softwareCause_; }

private:
    std::string gpuCause_;
    std::string softwareCause_;
};

// Placeholder used before a window exists. Records scale and size, draws nothing.
struct UninitializedRenderer {
    double scale = 1.0;
    Size size{1.0, 1.0};
};

class Renderer final : public PrimitiveRenderer {
public:
    enum class Kind {
        Hardware,
        Software,
        Uninitialized
    };

    using Backend = std::variant<std::unique_ptr<GpuRenderer>, std::unique_ptr<RasterRenderer>, UninitializedRenderer>;

    /**
     * Create a renderer for window (nullptr for headless capture only).
     * Sizes below one pixel are raised to one.
     *
     * @throws RendererInitError if the selected backends all fail
     */
    Renderer(SDL_Window* window,
             std::shared_ptr<FontRegistry> fonts,
             double scale,
             Size size,
             const RendererOptions& options = RendererOptions::fromEnvironment());

    static Renderer uninitialized(double scale, Size size);

    void begin(bool capture) override;
    void clip(const Shape& shape) override;
    void clearClip() override;
    DrawStatus stroke(const Shape& shape, const Brush& brush, double width) override;
    DrawStatus fill(const Shape& shape, const Brush& brush, double blurRadius) override;
    void drawText(const TextLayout& layout, Point pos) override;
    void drawImage(const Img& img, const Rect& rect) override;
    void drawSvg(const Svg& svg, const Rect& rect, const std::optional<Brush>& brush) override;
    void transform(const Affine& affine) override;
    void setZIndex(int32_t z) override;

    void resize(double scale, Size size) override;
    void setScale(double scale) override;
    double scale() const override;
    Size size() const override;

    /**
     * Finish the frame. Returns the captured image when the frame was begun
     * in capture mode, nullopt otherwise (and always for Uninitialized).
     * callback is only invoked by the hardware backend in normal mode.
     */
    std::optional<RasterImage> finish(const FrameCallback& callback = FrameCallback());

    Kind kind() const;
    const char* backendName() const;

    // Backend access for diagnostics; nullptr when another backend is active
    GpuRenderer* hardware();
    RasterRenderer* software();

private:
    explicit Renderer(Backend backend);

    // Calls fn on the active backend; no-op for Uninitialized
    template <typename Fn>
    void forward(Fn&& fn);

    Backend backend_;
};

} // namespace tessera

#endif // TESSERA_RENDERER_H
