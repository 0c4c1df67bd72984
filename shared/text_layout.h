// text_layout.h - Shaped text handed to drawText()
// Shaping and line breaking happen in the caller; the renderer only places glyphs.

#ifndef TESSERA_TEXT_LAYOUT_H
#define TESSERA_TEXT_LAYOUT_H

#include <cstdint>
#include <optional>
#include <vector>

#include "brush.h"

namespace tessera {

struct LayoutGlyph {
    uint32_t fontId = 0;
    uint16_t glyphId = 0;
    float x = 0.0f;              // pen position within the line, layout units
    float w = 0.0f;              // advance width
    float fontSize = 0.0f;
    uint32_t cacheKeyFlags = 0;
    std::optional<Color> color;  // run color; black when unset
};

// One visual line. lineY is the baseline, measured from the layout origin.
struct LayoutRun {
    float lineY = 0.0f;
    float lineHeight = 0.0f;
    std::vector<LayoutGlyph> glyphs;
};

// Lines are ordered by increasing lineY
struct TextLayout {
    std::vector<LayoutRun> runs;
};

}  // namespace tessera

#endif  // TESSERA_TEXT_LAYOUT_H
