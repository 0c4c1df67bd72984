/**
 * Software backend: primitives rasterized by Skia on the CPU
 */

#ifndef TESSERA_RASTER_RENDERER_H
#define TESSERA_RASTER_RENDERER_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <SDL.h>

#include "include/core/SkRefCnt.h"
#include "include/core/SkSurface.h"

#include "frame_pass.h"
#include "raster_image.h"
#include "recording_renderer.h"
#include "renderer_options.h"

namespace tessera {

/**
 * Replays each frame onto a Skia raster surface. Normal frames are copied
 * into an SDL streaming texture and presented; capture frames return the
 * surface pixels. A headless instance (no window) only captures.
 */
class RasterRenderer : public RecordingRenderer {
public:
    /**
     * @param window window to present into, or nullptr for a headless renderer
     * @param error receives the failure cause when nullptr is returned
     */
    static std::unique_ptr<RasterRenderer> create(SDL_Window* window,
                                                  std::shared_ptr<FontRegistry> fonts,
                                                  double scale,
                                                  uint32_t width,
                                                  uint32_t height,
                                                  const RendererOptions& options,
                                                  std::string* error);

    ~RasterRenderer() override;

    void resize(double scale, Size size) override;
    Size size() const override { return Size(width_, height_); }

    /**
     * Finish the frame. The callback is not invoked: there is no GPU pass to
     * hand out. Returns the frame's pixels in capture mode, nullopt otherwise.
     */
    std::optional<RasterImage> finish(const FrameCallback& callback);

    bool captureMode() const { return capture_; }
    bool isHeadless() const { return window_ == nullptr; }
    const char* backendName() const { return "Skia Raster"; }

protected:
    PrimitiveRecorder& recorder() override { return recorder_; }
    const PrimitiveRecorder& recorder() const override { return recorder_; }
    void onBegin(bool capture) override { capture_ = capture; }
    sk_sp<SkImage> prepareImage(sk_sp<SkImage> image) override;

private:
    RasterRenderer(SDL_Window* window, std::shared_ptr<FontRegistry> fonts, double scale, float fontEmbolden);

    bool createTargets(uint32_t width, uint32_t height, std::string* error);
    void present();

    SDL_Window* window_;
    SDL_Renderer* sdlRenderer_ = nullptr;
    SDL_Texture* texture_ = nullptr;
    sk_sp<SkSurface> surface_;
    PrimitiveRecorder recorder_;
    bool capture_ = false;
    uint32_t width_ = 0;
    uint32_t height_ = 0;
};

} // namespace tessera

#endif // TESSERA_RASTER_RENDERER_H
