// gallery.cpp - Widget gallery drawn through the Tessera renderer
//
// Draws cards, alerts (success/info/error/warning), a checkbox, a gradient
// button, an SVG icon and an image with every primitive the renderer offers.
// Runs in a window, or headless with --capture to write one frame as PPM.

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <SDL.h>
#include <SDL_vulkan.h>

#include "include/core/SkCanvas.h"
#include "include/core/SkColor.h"
#include "include/core/SkFont.h"
#include "include/core/SkFontMetrics.h"
#include "include/core/SkImageInfo.h"
#include "include/core/SkPaint.h"
#include "include/core/SkRect.h"
#include "include/core/SkSurface.h"

#include "font_registry.h"
#include "renderer.h"
#include "screenshot_utils.h"
#include "version.h"

using namespace tessera;

namespace {

constexpr uint32_t kUiFont = 1;

enum class AlertVariant {
    Success,
    Info,
    Error,
    Warning
};

struct AlertPalette {
    Color background;
    Color text;
};

AlertPalette paletteFor(AlertVariant variant) {
    switch (variant) {
        case AlertVariant::Success:
            return {Color::rgb8(240, 253, 244), Color::rgb8(22, 163, 74)};
        case AlertVariant::Info:
            return {Color::rgb8(239, 246, 255), Color::rgb8(37, 99, 235)};
        case AlertVariant::Error:
            return {Color::rgb8(254, 242, 242), Color::rgb8(220, 38, 38)};
        case AlertVariant::Warning:
            return {Color::rgb8(254, 252, 232), Color::rgb8(202, 138, 4)};
    }
    return {Color::WHITE, Color::BLACK};
}

const char kCheckIconSvg[] =
    "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 24 24\">"
    "<circle cx=\"12\" cy=\"12\" r=\"11\" fill=\"#000\"/>"
    "<path d=\"M6 12l4 4 8-8\" stroke=\"#fff\" stroke-width=\"2.5\" fill=\"none\"/>"
    "</svg>";

struct GalleryOptions {
    bool software = false;
    const char* capturePath = nullptr;
    int frames = 0;  // 0: until the window is closed
    int width = 640;
    int height = 480;
    double scale = 1.0;
};

// Single-line layout with per-character advances. Enough for ASCII labels.
TextLayout layoutLine(const FontRegistry& fonts, const std::string& text, float fontSize, Color color) {
    TextLayout layout;
    sk_sp<SkTypeface> face = fonts.typeface(kUiFont);
    if (!face) {
        return layout;
    }

    SkFont font(face, fontSize);
    SkFontMetrics metrics;
    font.getMetrics(&metrics);

    LayoutRun run;
    run.lineY = -metrics.fAscent;
    run.lineHeight = metrics.fDescent - metrics.fAscent;

    float x = 0.0f;
    for (char ch : text) {
        LayoutGlyph glyph;
        glyph.fontId = kUiFont;
        glyph.glyphId = face->unicharToGlyph(static_cast<unsigned char>(ch));
        glyph.x = x;
        glyph.w = font.measureText(&ch, 1, SkTextEncoding::kUTF8);
        glyph.fontSize = fontSize;
        glyph.color = color;
        run.glyphs.push_back(glyph);
        x += glyph.w;
    }

    layout.runs.push_back(run);
    return layout;
}

Img makeCheckerImage() {
    sk_sp<SkSurface> surface = SkSurfaces::Raster(SkImageInfo::MakeN32Premul(16, 16));
    if (!surface) {
        return {};
    }
    SkCanvas* canvas = surface->getCanvas();
    canvas->clear(SK_ColorWHITE);
    SkPaint paint;
    paint.setColor(SkColorSetRGB(203, 213, 225));
    for (int y = 0; y < 16; y += 4) {
        for (int x = (y / 4) % 2 * 4; x < 16; x += 8) {
            canvas->drawRect(SkRect::MakeXYWH(x, y, 4, 4), paint);
        }
    }
    return {surface->makeImageSnapshot(), "gallery-checker-16"};
}

class Gallery {
public:
    explicit Gallery(std::shared_ptr<FontRegistry> fonts) : fonts_(std::move(fonts)), checker_(makeCheckerImage()) {
        std::optional<Svg> icon = Svg::parse(kCheckIconSvg, sizeof(kCheckIconSvg) - 1, "gallery-check-icon",
                                             fonts_->fontMgr());
        if (icon) {
            icon_ = std::move(*icon);
        } else {
            fprintf(stderr, "[Gallery] Error: built-in icon did not parse\n");
        }
    }

    void draw(PrimitiveRenderer& r, int frame) {
        r.setZIndex(0);
        r.fill(Rect(0, 0, 640, 480), Color::rgb8(248, 250, 252), 0.0);

        drawCard(r, Rect(20, 20, 300, 220), "Alerts");
        const AlertVariant variants[] = {AlertVariant::Success, AlertVariant::Info, AlertVariant::Error,
                                         AlertVariant::Warning};
        const char* messages[] = {"Saved successfully", "New version available", "Connection lost",
                                  "Disk almost full"};
        for (int i = 0; i < 4; ++i) {
            drawAlert(r, Rect(32, 56 + i * 40, 288, 88 + i * 40), variants[i], messages[i]);
        }

        drawCard(r, Rect(320, 20, 620, 220), "Controls");
        drawCheckbox(r, Point(340, 60), frame % 120 < 60, "Enable notifications");
        drawButton(r, Rect(340, 100, 480, 136), "Submit");

        // Pulsing dot inside a static ring
        const double progress = (frame % 100) / 100.0;
        r.stroke(Circle{{560, 118}, 26}, Color::rgb8(226, 232, 240), 6.0);
        r.transform(Affine::translate(560, 118) * Affine::scale(1.0 + 0.1 * progress) * Affine::translate(-560, -118));
        r.fill(Circle{{560, 118}, 14}, Color::rgb8(37, 99, 235), 0.0);
        r.transform(Affine::identity());

        drawCard(r, Rect(20, 240, 620, 460), "Media");
        if (icon_.dom) {
            r.drawSvg(icon_, Rect(40, 276, 88, 324), std::nullopt);
            r.drawSvg(icon_, Rect(100, 276, 148, 324), Brush(Color::rgb8(22, 163, 74)));
        }
        if (checker_.image) {
            r.drawImage(checker_, Rect(170, 276, 250, 356));
        }

        BezPath wave;
        wave.moveTo({280, 380});
        for (int i = 0; i < 6; ++i) {
            double x = 280 + i * 50;
            wave.quadTo({x + 25, i % 2 ? 410.0 : 350.0}, {x + 50, 380});
        }
        r.stroke(wave, Color::rgb8(37, 99, 235), 3.0);

        BezPath blob;
        blob.moveTo({40, 430}).curveTo({60, 370}, {140, 370}, {160, 430}).closePath();
        r.fill(blob, Gradient::linear({40, 380}, {160, 430}, Color::rgb8(220, 38, 38), Color::rgb8(202, 138, 4)),
               0.0);

        // Clipped text: only the part inside the card body is drawn
        r.clip(RoundedRect(Rect(280, 276, 600, 330), 8.0));
        r.drawText(layoutLine(*fonts_, "Clipped caption running past the edge of its card", 18.0f,
                              Color::rgb8(71, 85, 105)),
                   Point(290, 290));
        r.clearClip();
    }

private:
    void drawCard(PrimitiveRenderer& r, const Rect& rect, const char* title) {
        r.setZIndex(0);
        // Shadow below the card body
        r.fill(RoundedRect(Rect(rect.x0 + 2, rect.y0 + 4, rect.x1 + 2, rect.y1 + 4), 10.0),
               Color(15, 23, 42, 40), 6.0);
        r.fill(RoundedRect(rect, 10.0), Color::WHITE, 0.0);
        r.stroke(RoundedRect(rect, 10.0), Color::rgb8(226, 232, 240), 1.0);
        r.setZIndex(1);
        r.drawText(layoutLine(*fonts_, title, 16.0f, Color::rgb8(15, 23, 42)), Point(rect.x0 + 12, rect.y0 + 8));
        r.stroke(Line{{rect.x0 + 12, rect.y0 + 30}, {rect.x1 - 12, rect.y0 + 30}}, Color::rgb8(241, 245, 249), 1.0);
    }

    void drawAlert(PrimitiveRenderer& r, const Rect& rect, AlertVariant variant, const char* message) {
        const AlertPalette palette = paletteFor(variant);
        r.setZIndex(1);
        r.fill(RoundedRect(rect, 6.0), palette.background, 0.0);
        r.setZIndex(2);
        r.drawText(layoutLine(*fonts_, message, 14.0f, palette.text), Point(rect.x0 + 12, rect.y0 + 8));
    }

    void drawCheckbox(PrimitiveRenderer& r, Point origin, bool checked, const char* label) {
        const Rect box(origin.x, origin.y, origin.x + 20, origin.y + 20);
        r.setZIndex(1);
        if (checked) {
            r.fill(RoundedRect(box, 4.0), Color::rgb8(37, 99, 235), 0.0);
            BezPath tick;
            tick.moveTo({origin.x + 5, origin.y + 10}).lineTo({origin.x + 9, origin.y + 14}).lineTo(
                {origin.x + 15, origin.y + 6});
            r.setZIndex(2);
            r.stroke(tick, Color::WHITE, 2.0);
        } else {
            r.stroke(RoundedRect(box, 4.0), Color::rgb8(148, 163, 184), 1.5);
        }
        r.setZIndex(1);
        r.drawText(layoutLine(*fonts_, label, 14.0f, Color::rgb8(51, 65, 85)), Point(origin.x + 30, origin.y + 2));
    }

    void drawButton(PrimitiveRenderer& r, const Rect& rect, const char* label) {
        r.setZIndex(1);
        r.fill(RoundedRect(rect, 8.0),
               Gradient::linear(rect.origin(), Point(rect.x1, rect.y1), Color::rgb8(59, 130, 246),
                                Color::rgb8(37, 99, 235)),
               0.0);
        r.setZIndex(2);
        r.drawText(layoutLine(*fonts_, label, 15.0f, Color::WHITE), Point(rect.x0 + 40, rect.y0 + 8));
    }

    std::shared_ptr<FontRegistry> fonts_;
    Img checker_;
    Svg icon_;
};

void printHelp(const char* programName) {
    std::cerr << versionBanner(nullptr) << "\n\n";
    std::cerr << "USAGE:\n";
    std::cerr << "    " << programName << " [OPTIONS]\n\n";
    std::cerr << "OPTIONS:\n";
    std::cerr << "    -h, --help          Show this help message and exit\n";
    std::cerr << "    -v, --version       Show version information and exit\n";
    std::cerr << "    --software          Use the Skia raster backend\n";
    std::cerr << "    --capture FILE      Render one frame headless and write it as PPM\n";
    std::cerr << "    --frames N          Quit after N frames (default: run until closed)\n";
    std::cerr << "    --size WxH          Surface size in pixels (default: 640x480)\n";
    std::cerr << "    --scale S           Device scale factor (default: 1.0)\n\n";
    std::cerr << "KEYBOARD CONTROLS:\n";
    std::cerr << "    S             Save a screenshot of the next frame\n";
    std::cerr << "    Q, Escape     Quit\n\n";
    std::cerr << "ENVIRONMENT:\n";
    std::cerr << "    TESSERA_FORCE_SOFTWARE=1, TESSERA_FONT_EMBOLDEN=<px>, TESSERA_VSYNC=0\n";
}

// Returns -1 to continue, otherwise the exit code
int parseArguments(int argc, char* argv[], GalleryOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const bool hasValue = i + 1 < argc;
        if (strcmp(argv[i], "--version") == 0 || strcmp(argv[i], "-v") == 0) {
            std::cerr << versionBanner(nullptr) << std::endl;
            return 0;
        }
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            printHelp(argv[0]);
            return 0;
        }
        if (strcmp(argv[i], "--software") == 0) {
            options.software = true;
        } else if (strcmp(argv[i], "--capture") == 0 && hasValue) {
            options.capturePath = argv[++i];
        } else if (strcmp(argv[i], "--frames") == 0 && hasValue) {
            options.frames = std::atoi(argv[++i]);
            if (options.frames < 0) {
                std::cerr << "Error: --frames must not be negative" << std::endl;
                return 1;
            }
        } else if (strcmp(argv[i], "--size") == 0 && hasValue) {
            if (sscanf(argv[++i], "%dx%d", &options.width, &options.height) != 2 || options.width <= 0 ||
                options.height <= 0) {
                std::cerr << "Error: --size expects WxH, got " << argv[i] << std::endl;
                return 1;
            }
        } else if (strcmp(argv[i], "--scale") == 0 && hasValue) {
            options.scale = std::atof(argv[++i]);
            if (options.scale <= 0.0) {
                std::cerr << "Error: --scale must be positive" << std::endl;
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            std::cerr << "Use --help for usage information." << std::endl;
            return 1;
        }
    }
    return -1;
}

int runCapture(const GalleryOptions& options, const RendererOptions& rendererOptions,
               std::shared_ptr<FontRegistry> fonts) {
    Renderer renderer(nullptr, fonts, options.scale, Size(options.width, options.height), rendererOptions);
    std::cout << versionBanner(renderer.backendName()) << std::endl;

    Gallery gallery(fonts);
    renderer.begin(true);
    gallery.draw(renderer, 0);
    std::optional<RasterImage> image = renderer.finish();
    if (!image) {
        std::cerr << "Error: capture frame produced no image" << std::endl;
        return 1;
    }
    if (!saveImagePPM(*image, options.capturePath)) {
        return 1;
    }
    std::cout << "Saved " << image->width << "x" << image->height << " capture to " << options.capturePath
              << std::endl;
    return 0;
}

Size drawableSize(SDL_Window* window, bool vulkan) {
    int w = 0;
    int h = 0;
    if (vulkan) {
        SDL_Vulkan_GetDrawableSize(window, &w, &h);
    } else {
        SDL_GetWindowSize(window, &w, &h);
    }
    return Size(w, h);
}

int runWindow(const GalleryOptions& options, const RendererOptions& rendererOptions,
              std::shared_ptr<FontRegistry> fonts) {
    if (SDL_Init(SDL_INIT_VIDEO) < 0) {
        std::cerr << "SDL init failed: " << SDL_GetError() << std::endl;
        return 1;
    }

    const bool vulkan = !rendererOptions.forceSoftware;
    Uint32 windowFlags = SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI;
    if (vulkan) {
        windowFlags |= SDL_WINDOW_VULKAN;
    }
    SDL_Window* window = SDL_CreateWindow("Tessera Gallery", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                          options.width, options.height, windowFlags);
    if (!window) {
        std::cerr << "Window creation failed: " << SDL_GetError() << std::endl;
        SDL_Quit();
        return 1;
    }

    int exitCode = 0;
    try {
        // HiDPI scale = drawable pixels / window points
        Size pixels = drawableSize(window, vulkan);
        double scale = options.scale * (pixels.width / options.width);

        Renderer renderer(window, fonts, scale, pixels, rendererOptions);
        std::cout << versionBanner(renderer.backendName()) << std::endl;

        Gallery gallery(fonts);
        bool running = true;
        bool screenshotRequested = false;
        int frame = 0;

        while (running) {
            SDL_Event event;
            while (SDL_PollEvent(&event)) {
                switch (event.type) {
                    case SDL_QUIT:
                        running = false;
                        break;
                    case SDL_KEYDOWN:
                        if (event.key.keysym.sym == SDLK_ESCAPE || event.key.keysym.sym == SDLK_q) {
                            running = false;
                        } else if (event.key.keysym.sym == SDLK_s) {
                            screenshotRequested = true;
                        }
                        break;
                    case SDL_WINDOWEVENT:
                        if (event.window.event == SDL_WINDOWEVENT_RESIZED ||
                            event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
                            int windowW = 0;
                            int windowH = 0;
                            SDL_GetWindowSize(window, &windowW, &windowH);
                            Size actual = drawableSize(window, vulkan);
                            renderer.resize(options.scale * (windowW > 0 ? actual.width / windowW : 1.0), actual);
                        }
                        break;
                    default:
                        break;
                }
            }

            const bool capture = screenshotRequested;
            renderer.begin(capture);
            gallery.draw(renderer, frame);
            std::optional<RasterImage> image = renderer.finish();

            if (capture) {
                screenshotRequested = false;
                if (image) {
                    std::string filename = generateScreenshotFilename(image->width, image->height);
                    if (saveImagePPM(*image, filename)) {
                        std::cout << "Screenshot saved: " << filename << std::endl;
                    }
                } else {
                    std::cerr << "Screenshot failed: no frame available" << std::endl;
                }
            }

            ++frame;
            if (options.frames > 0 && frame >= options.frames) {
                running = false;
            }
        }
    } catch (const RendererInitError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exitCode = 1;
    }

    SDL_DestroyWindow(window);
    SDL_Quit();
    return exitCode;
}

}  // namespace

int main(int argc, char* argv[]) {
    GalleryOptions options;
    int parsed = parseArguments(argc, argv, options);
    if (parsed >= 0) {
        return parsed;
    }

    RendererOptions rendererOptions = RendererOptions::fromEnvironment();
    if (options.software) {
        rendererOptions.forceSoftware = true;
    }

    auto fonts = std::make_shared<FontRegistry>();
    if (!fonts->registerFamily(kUiFont, "sans-serif")) {
        std::cerr << "Warning: no system font found, labels will not be drawn" << std::endl;
    }

    if (options.capturePath) {
        try {
            return runCapture(options, rendererOptions, fonts);
        } catch (const RendererInitError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }
    return runWindow(options, rendererOptions, fonts);
}
