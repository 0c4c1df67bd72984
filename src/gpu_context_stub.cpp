/**
 * GPU Context Stub Implementation
 *
 * Provides createGpuContext() when Tessera is built without Vulkan.
 * The build defines TESSERA_VULKAN_AVAILABLE when the Vulkan SDK and a
 * Graphite-enabled Skia are present; gpu_context_vulkan.cpp is used then.
 */

#ifndef TESSERA_VULKAN_AVAILABLE

#include "gpu_context.h"
#include <cstdio>

namespace tessera {

/**
 * Returns nullptr so the renderer falls back to the raster backend.
 */
std::shared_ptr<GpuContext> createGpuContext(SDL_Window* /*window*/, bool /*vsync*/, std::string* error) {
    fprintf(stderr, "[Vulkan Context] GPU backend not available (built without Vulkan)\n");
    if (error) {
        *error = "built without Vulkan support";
    }
    return nullptr;
}

} // namespace tessera

#endif // TESSERA_VULKAN_AVAILABLE
