/**
 * Renderer construction options
 *
 * Environment variables:
 *   TESSERA_FORCE_SOFTWARE=1     skip the GPU backend
 *   TESSERA_FONT_EMBOLDEN=<px>   widen glyph outlines by that many pixels
 *   TESSERA_VSYNC=0              immediate presentation instead of FIFO
 */

#ifndef TESSERA_RENDERER_OPTIONS_H
#define TESSERA_RENDERER_OPTIONS_H

#include <cstdlib>
#include <cstring>

namespace tessera {

struct RendererOptions {
    bool forceSoftware = false;
    float fontEmbolden = 0.0f;
    bool vsync = true;

    static RendererOptions fromEnvironment() {
        RendererOptions options;

        const char* force = std::getenv("TESSERA_FORCE_SOFTWARE");
        options.forceSoftware = force && std::strcmp(force, "1") == 0;

        if (const char* embolden = std::getenv("TESSERA_FONT_EMBOLDEN")) {
            char* end = nullptr;
            float value = std::strtof(embolden, &end);
            if (end != embolden && value > 0.0f) {
                options.fontEmbolden = value;
            }
        }

        const char* vsync = std::getenv("TESSERA_VSYNC");
        options.vsync = !(vsync && std::strcmp(vsync, "0") == 0);

        return options;
    }
};

} // namespace tessera

#endif // TESSERA_RENDERER_OPTIONS_H
