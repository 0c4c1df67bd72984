/**
 * Frame Pass Handles
 *
 * The four per-frame GPU objects handed to the embedding application's
 * draw callback during a normal (presenting) finish(). Their contents are
 * API specific and declared in vulkan_frame.h; code that only forwards
 * them does not need Vulkan headers.
 */

#ifndef TESSERA_FRAME_PASS_H
#define TESSERA_FRAME_PASS_H

#include <functional>
#include <memory>

namespace tessera {

struct CommandEncoder;
struct SurfaceFrame;
struct TextureView;

struct FramePass {
    std::shared_ptr<CommandEncoder> encoder;
    std::shared_ptr<SurfaceFrame> frame;
    std::shared_ptr<TextureView> msaaView;
    std::shared_ptr<TextureView> resolveView;

    bool complete() const { return encoder && frame && msaaView && resolveView; }
};

/**
 * Records the caller's own pass before the renderer composites on top.
 * Return the pass (values may be replaced); leaving any of the four empty
 * skips the frame.
 */
using FrameCallback = std::function<FramePass(FramePass)>;

} // namespace tessera

#endif // TESSERA_FRAME_PASS_H
