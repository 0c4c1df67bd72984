// test_raster_renderer.cpp - Headless software backend: capture frames, shapes, brushes,
// clipping, text culling, image/SVG caching and resize behaviour

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

#include "test_framework.h"

#include "include/core/SkCanvas.h"
#include "include/core/SkColor.h"
#include "include/core/SkFontMgr.h"
#include "include/core/SkImageInfo.h"
#include "include/core/SkSurface.h"

#include "font_registry.h"
#include "raster_renderer.h"
#include "screenshot_utils.h"

using namespace tessera;

static const Color kBlue(0, 0, 255);
static const Color kGreen(0, 255, 0);

static std::unique_ptr<RasterRenderer> headless(uint32_t w = 20, uint32_t h = 20, double scale = 1.0) {
    std::string error;
    auto renderer = RasterRenderer::create(nullptr, std::make_shared<FontRegistry>(SkFontMgr::RefEmpty()), scale, w,
                                           h, RendererOptions(), &error);
    if (!renderer) {
        throw std::runtime_error("raster renderer: " + error);
    }
    return renderer;
}

static RasterImage capture(RasterRenderer& renderer) {
    std::optional<RasterImage> image = renderer.finish(FrameCallback());
    if (!image) {
        throw std::runtime_error("capture frame returned no image");
    }
    return *image;
}

static bool isBlank(const RasterImage& image) {
    for (size_t i = 3; i < image.pixels.size(); i += 4) {
        if (image.pixels[i] != 0) {
            return false;
        }
    }
    return true;
}

static sk_sp<SkImage> solidImage(int w, int h, SkColor color) {
    sk_sp<SkSurface> surface = SkSurfaces::Raster(SkImageInfo::MakeN32Premul(w, h));
    if (!surface) {
        throw std::runtime_error("could not allocate image surface");
    }
    surface->getCanvas()->clear(color);
    return surface->makeImageSnapshot();
}

static const char kBlueSquareSvg[] =
    "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"10\" height=\"10\">"
    "<rect width=\"10\" height=\"10\" fill=\"#0000ff\"/>"
    "</svg>";

// =============================================================================
// Capture frames
// =============================================================================

TEST(capture_red_square) {
    auto renderer = headless();
    renderer->begin(true);
    ASSERT_TRUE(renderer->fill(Rect(0, 0, 10, 10), Color::RED, 0.0) == DrawStatus::Drawn);

    RasterImage image = capture(*renderer);
    ASSERT_EQ(image.width, 20u);
    ASSERT_EQ(image.height, 20u);
    ASSERT_EQ(image.pixels.size(), 20u * 20u * 4u);
    ASSERT_TRUE(image.pixelAt(5, 5) == Color::RED);
    ASSERT_TRUE(image.pixelAt(15, 15) == Color::TRANSPARENT);
}

TEST(normal_frame_on_headless_returns_nothing) {
    auto renderer = headless();
    renderer->begin(false);
    renderer->fill(Rect(0, 0, 10, 10), Color::RED, 0.0);
    ASSERT_FALSE(renderer->finish(FrameCallback()).has_value());
    ASSERT_FALSE(renderer->captureMode());
}

TEST(frame_callback_is_not_invoked) {
    auto renderer = headless();
    bool called = false;
    renderer->begin(true);
    std::optional<RasterImage> image = renderer->finish([&](FramePass pass) {
        called = true;
        return pass;
    });
    ASSERT_TRUE(image.has_value());
    ASSERT_FALSE(called);
}

TEST(frames_start_transparent) {
    auto renderer = headless();
    renderer->begin(true);
    renderer->fill(Rect(0, 0, 20, 20), Color::RED, 0.0);
    capture(*renderer);

    renderer->begin(true);
    ASSERT_TRUE(isBlank(capture(*renderer)));
}

TEST(repeated_capture_is_identical) {
    auto renderer = headless(32, 32);
    auto draw = [&]() {
        renderer->begin(true);
        renderer->fill(Circle{{16, 16}, 9}, kBlue, 0.0);
        renderer->stroke(Line{{2, 2}, {30, 28}}, Color::RED, 2.0);
        renderer->fill(RoundedRect(Rect(4, 20, 28, 30), 3.0), kGreen, 1.5);
        return capture(*renderer);
    };

    RasterImage first = draw();
    RasterImage second = draw();
    ASSERT_TRUE(first.pixels == second.pixels);
}

TEST(capture_matches_replay_of_recorded_frame) {
    auto renderer = headless(32, 32);
    renderer->begin(true);
    renderer->setZIndex(1);
    renderer->fill(Rect(4, 4, 20, 20), kBlue, 0.0);
    renderer->setZIndex(0);
    renderer->fill(Circle{{20, 20}, 8}, Color::RED, 2.0);
    renderer->stroke(Line{{0, 31}, {31, 0}}, kGreen, 1.5);
    RasterImage captured = capture(*renderer);

    sk_sp<SkSurface> surface = SkSurfaces::Raster(SkImageInfo::MakeN32Premul(32, 32));
    ASSERT_NOT_NULL(surface.get());
    surface->getCanvas()->clear(SK_ColorTRANSPARENT);
    renderer->frameRecorder().encode(surface->getCanvas());

    RasterImage replayed(32, 32);
    SkImageInfo dstInfo = SkImageInfo::Make(32, 32, kRGBA_8888_SkColorType, kUnpremul_SkAlphaType);
    ASSERT_TRUE(surface->readPixels(dstInfo, replayed.pixels.data(), replayed.rowBytes(), 0, 0));
    ASSERT_TRUE(captured.pixels == replayed.pixels);
}

TEST(begin_resets_transform_and_clip) {
    auto renderer = headless();
    renderer->begin(false);
    renderer->transform(Affine::translate(3, 4));
    renderer->clip(Rect(0, 0, 5, 5));

    renderer->begin(false);
    ASSERT_TRUE(renderer->currentTransform().isIdentity());
    ASSERT_FALSE(renderer->currentClip().has_value());
}

// =============================================================================
// Shapes and transforms
// =============================================================================

TEST(transform_moves_fill) {
    auto renderer = headless();
    renderer->begin(true);
    renderer->transform(Affine::translate(10, 10));
    renderer->fill(Rect(0, 0, 5, 5), Color::RED, 0.0);

    RasterImage image = capture(*renderer);
    ASSERT_TRUE(image.pixelAt(12, 12) == Color::RED);
    ASSERT_EQ(image.pixelAt(2, 2).a, 0);
}

TEST(transform_replaces_previous) {
    auto renderer = headless();
    renderer->begin(true);
    renderer->transform(Affine::translate(10, 10));
    renderer->transform(Affine::translate(0, 10));
    renderer->fill(Rect(0, 0, 5, 5), Color::RED, 0.0);

    RasterImage image = capture(*renderer);
    ASSERT_TRUE(image.pixelAt(2, 12) == Color::RED);
    ASSERT_EQ(image.pixelAt(12, 12).a, 0);
}

TEST(device_scale_enlarges_output) {
    auto renderer = headless(20, 20, 2.0);
    renderer->begin(true);
    renderer->fill(Rect(0, 0, 5, 5), Color::RED, 0.0);

    RasterImage image = capture(*renderer);
    ASSERT_TRUE(image.pixelAt(8, 8) == Color::RED);
    ASSERT_EQ(image.pixelAt(12, 12).a, 0);
}

TEST(stroke_line_and_circle) {
    auto renderer = headless(40, 40);
    renderer->begin(true);
    renderer->stroke(Line{{2, 10}, {38, 10}}, Color::RED, 2.0);
    renderer->stroke(Circle{{20, 28}, 8}, kBlue, 4.0);

    RasterImage image = capture(*renderer);
    ASSERT_TRUE(image.pixelAt(20, 10) == Color::RED);
    ASSERT_EQ(image.pixelAt(20, 4).a, 0);
    ASSERT_TRUE(image.pixelAt(28, 28) == kBlue);
    ASSERT_EQ(image.pixelAt(20, 28).a, 0);
}

TEST(fill_keeps_touching_open_subpaths_apart) {
    auto renderer = headless(60, 60);
    BezPath path;
    // Second triangle starts where the first one stopped
    path.moveTo({2, 2}).lineTo({40, 2}).lineTo({40, 40});
    path.moveTo({40, 40}).lineTo({20, 58}).lineTo({2, 40});

    renderer->begin(true);
    ASSERT_TRUE(renderer->fill(path, Color::RED, 0.0) == DrawStatus::Drawn);

    RasterImage image = capture(*renderer);
    ASSERT_TRUE(image.pixelAt(30, 10) == Color::RED);
    ASSERT_TRUE(image.pixelAt(20, 46) == Color::RED);
    // Inside the pentagon both contours would form if merged
    ASSERT_EQ(image.pixelAt(10, 30).a, 0);
}

TEST(fill_closed_path) {
    auto renderer = headless(40, 40);
    BezPath triangle;
    triangle.moveTo({0, 0}).lineTo({40, 0}).lineTo({0, 40}).closePath();

    renderer->begin(true);
    ASSERT_TRUE(renderer->fill(triangle, Color::RED, 0.0) == DrawStatus::Drawn);
    RasterImage image = capture(*renderer);
    ASSERT_TRUE(image.pixelAt(5, 5) == Color::RED);
    ASSERT_EQ(image.pixelAt(35, 35).a, 0);
}

TEST(fill_path_with_cubic_is_flattened) {
    auto renderer = headless(40, 40);
    BezPath blob;
    blob.moveTo({0, 20}).curveTo({0, 0}, {40, 0}, {40, 20}).lineTo({0, 20}).closePath();

    renderer->begin(true);
    ASSERT_TRUE(renderer->fill(blob, Color::RED, 0.0) == DrawStatus::Drawn);
    RasterImage image = capture(*renderer);
    ASSERT_TRUE(image.pixelAt(20, 15) == Color::RED);
    ASSERT_EQ(image.pixelAt(20, 30).a, 0);
}

TEST(stroke_with_cubic_is_unsupported) {
    auto renderer = headless();
    BezPath curve;
    curve.moveTo({0, 0}).lineTo({5, 5}).curveTo({10, 0}, {15, 20}, {20, 10});

    renderer->begin(true);
    ASSERT_TRUE(renderer->stroke(curve, Color::RED, 2.0) == DrawStatus::Unsupported);
    ASSERT_TRUE(renderer->frameRecorder().primitives().empty());
    ASSERT_TRUE(isBlank(capture(*renderer)));
}

TEST(stroke_quad_path) {
    auto renderer = headless(40, 40);
    BezPath curve;
    curve.moveTo({2, 20}).quadTo({20, 20}, {38, 20});

    renderer->begin(true);
    ASSERT_TRUE(renderer->stroke(curve, Color::RED, 4.0) == DrawStatus::Drawn);
    ASSERT_TRUE(renderer->frameRecorder().primitives()[0].kind == PrimitiveKind::StrokeBezier);
    RasterImage image = capture(*renderer);
    ASSERT_TRUE(image.pixelAt(20, 20) == Color::RED);
}

TEST(z_index_orders_output) {
    auto renderer = headless();
    renderer->begin(true);
    renderer->setZIndex(1);
    renderer->fill(Rect(0, 0, 20, 20), Color::RED, 0.0);
    renderer->setZIndex(0);
    renderer->fill(Rect(0, 0, 20, 20), kBlue, 0.0);

    ASSERT_TRUE(capture(*renderer).pixelAt(10, 10) == Color::RED);
}

// =============================================================================
// Brushes
// =============================================================================

TEST(unsupported_brushes_produce_no_paint) {
    auto renderer = headless();
    renderer->begin(true);

    Gradient radial;
    radial.kind = GradientKind::Radial;
    radial.radius = 5;
    radial.stops = {{0.0f, Color::RED}, {1.0f, kBlue}};

    Gradient oneStop = Gradient::linear({0, 0}, {10, 0}, Color::RED, kBlue);
    oneStop.stops.resize(1);

    ASSERT_TRUE(renderer->fill(Rect(0, 0, 10, 10), radial, 0.0) == DrawStatus::NoPaint);
    ASSERT_TRUE(renderer->fill(Rect(0, 0, 10, 10), oneStop, 0.0) == DrawStatus::NoPaint);
    ASSERT_TRUE(renderer->stroke(Rect(0, 0, 10, 10), ImageBrush{}, 1.0) == DrawStatus::NoPaint);
    ASSERT_TRUE(renderer->frameRecorder().primitives().empty());
    ASSERT_TRUE(isBlank(capture(*renderer)));
}

TEST(linear_gradient_runs_between_stops) {
    auto renderer = headless(40, 10);
    renderer->begin(true);
    renderer->fill(Rect(0, 0, 40, 10), Gradient::linear({0, 0}, {40, 0}, Color::RED, kBlue), 0.0);

    RasterImage image = capture(*renderer);
    Color left = image.pixelAt(1, 5);
    Color right = image.pixelAt(38, 5);
    ASSERT_TRUE(left.r > left.b);
    ASSERT_TRUE(right.b > right.r);
}

TEST(gradient_stop_offsets_move_endpoints) {
    auto renderer = headless(40, 10);
    renderer->begin(true);

    Gradient g = Gradient::linear({0, 0}, {40, 0}, Color::RED, kBlue);
    g.stops[0].offset = 0.5f;
    renderer->fill(Rect(0, 0, 40, 10), g, 0.0);

    const PaintDesc& paint = renderer->frameRecorder().paint(renderer->frameRecorder().primitives()[0].paint);
    ASSERT_TRUE(paint.kind == PaintDesc::Kind::LinearGradient);
    ASSERT_FLOAT_EQ(paint.start.fX, 20.0f, 1e-4f);
    ASSERT_FLOAT_EQ(paint.end.fX, 40.0f, 1e-4f);

    // Clamped: everything left of the first stop keeps its color
    ASSERT_TRUE(capture(*renderer).pixelAt(5, 5) == Color::RED);
}

TEST(gradient_endpoints_follow_transform_and_scale) {
    auto renderer = headless(80, 20, 2.0);
    renderer->begin(true);
    renderer->transform(Affine::translate(5, 0));

    Gradient g = Gradient::linear({0, 0}, {10, 0}, Color::RED, kBlue);
    renderer->fill(Rect(0, 0, 10, 10), g, 0.0);

    const PaintDesc& paint = renderer->frameRecorder().paint(renderer->frameRecorder().primitives()[0].paint);
    ASSERT_TRUE(paint.kind == PaintDesc::Kind::LinearGradient);
    ASSERT_FLOAT_EQ(paint.start.fX, 10.0f, 1e-4f);
    ASSERT_FLOAT_EQ(paint.end.fX, 30.0f, 1e-4f);
}

// =============================================================================
// Clipping
// =============================================================================

TEST(clip_limits_drawing) {
    auto renderer = headless();
    renderer->begin(true);
    renderer->clip(Rect(0, 0, 5, 20));
    renderer->fill(Rect(0, 0, 20, 20), Color::RED, 0.0);

    RasterImage image = capture(*renderer);
    ASSERT_TRUE(image.pixelAt(2, 10) == Color::RED);
    ASSERT_EQ(image.pixelAt(10, 10).a, 0);
}

TEST(clear_clip_restores_full_surface) {
    auto renderer = headless();
    renderer->begin(true);
    renderer->clip(Rect(0, 0, 5, 20));
    renderer->clearClip();
    renderer->fill(Rect(0, 0, 20, 20), Color::RED, 0.0);

    ASSERT_TRUE(capture(*renderer).pixelAt(10, 10) == Color::RED);
}

TEST(clip_is_stored_in_transform_space) {
    auto renderer = headless();
    renderer->begin(false);
    renderer->transform(Affine::translate(3, 4));
    renderer->clip(Circle{{5, 5}, 2});

    ASSERT_TRUE(renderer->currentClip().has_value());
    ASSERT_TRUE(*renderer->currentClip() == Rect(6, 7, 10, 11));
}

// =============================================================================
// Text
// =============================================================================

static TextLayout singleGlyphLayout(float lineY) {
    LayoutGlyph glyph;
    glyph.fontId = 99;
    glyph.glyphId = 1;
    glyph.x = 0;
    glyph.w = 8;
    glyph.fontSize = 12;

    LayoutRun run;
    run.lineY = lineY;
    run.lineHeight = 14;
    run.glyphs.push_back(glyph);

    TextLayout layout;
    layout.runs.push_back(run);
    return layout;
}

TEST(text_below_clip_is_not_rasterized) {
    auto renderer = headless(100, 100);
    renderer->begin(true);
    renderer->clip(Rect(0, 0, 100, 10));
    renderer->drawText(singleGlyphLayout(200), Point(0, 0));

    ASSERT_EQ(renderer->glyphCache().missCount(), 0u);
    ASSERT_TRUE(renderer->frameRecorder().primitives().empty());
}

TEST(text_right_of_clip_is_not_rasterized) {
    auto renderer = headless(100, 100);
    renderer->begin(true);
    renderer->clip(Rect(0, 0, 10, 100));
    renderer->drawText(singleGlyphLayout(20), Point(50, 0));

    ASSERT_EQ(renderer->glyphCache().missCount(), 0u);
}

TEST(text_inside_clip_is_looked_up) {
    auto renderer = headless(100, 100);
    renderer->begin(true);
    renderer->clip(Rect(0, 0, 100, 100));
    renderer->drawText(singleGlyphLayout(20), Point(0, 0));

    // Font 99 is unknown: looked up once, nothing drawn
    ASSERT_EQ(renderer->glyphCache().missCount(), 1u);
    ASSERT_TRUE(renderer->frameRecorder().primitives().empty());
}

TEST(only_lines_inside_clip_are_looked_up) {
    auto renderer = headless(100, 100);
    renderer->begin(true);
    renderer->clip(Rect(0, 50, 100, 100));

    // First line sits entirely above the clip, second one inside it
    TextLayout layout = singleGlyphLayout(20);
    layout.runs.push_back(singleGlyphLayout(70).runs[0]);
    layout.runs[1].glyphs[0].glyphId = 2;
    renderer->drawText(layout, Point(0, 0));

    ASSERT_EQ(renderer->glyphCache().missCount(), 1u);
    ASSERT_EQ(renderer->glyphCache().size(), 1u);
}

TEST(text_at_tiny_scale_is_skipped) {
    auto renderer = headless(100, 100);
    renderer->begin(true);
    renderer->transform(Affine::scale(0.05));
    renderer->drawText(singleGlyphLayout(20), Point(0, 0));
    ASSERT_EQ(renderer->glyphCache().missCount(), 0u);
}

TEST(system_text_draws_glyphs) {
    auto fonts = std::make_shared<FontRegistry>();
    if (!fonts->registerFamily(1, "sans-serif")) {
        SKIP_TEST("no system font available");
    }
    uint16_t glyphA = fonts->typeface(1)->unicharToGlyph('A');
    if (glyphA == 0) {
        SKIP_TEST("default font has no 'A'");
    }

    std::string error;
    auto renderer = RasterRenderer::create(nullptr, fonts, 1.0, 64, 64, RendererOptions(), &error);
    ASSERT_NOT_NULL(renderer.get());

    TextLayout layout = singleGlyphLayout(30);
    layout.runs[0].glyphs[0].fontId = 1;
    layout.runs[0].glyphs[0].glyphId = glyphA;
    layout.runs[0].glyphs[0].fontSize = 24;
    layout.runs[0].glyphs[0].color = Color::RED;
    layout.runs[0].glyphs.push_back(layout.runs[0].glyphs[0]);
    layout.runs[0].glyphs[1].x = 20;

    renderer->begin(true);
    renderer->drawText(layout, Point(4, 0));
    ASSERT_EQ(renderer->frameRecorder().primitives().size(), 2u);
    // Same bin at both positions: one rasterization, one hit
    ASSERT_EQ(renderer->glyphCache().missCount(), 1u);
    ASSERT_EQ(renderer->glyphCache().hitCount(), 1u);

    RasterImage image = capture(*renderer);
    bool sawRed = false;
    for (uint32_t y = 0; y < image.height && !sawRed; ++y) {
        for (uint32_t x = 0; x < image.width; ++x) {
            Color c = image.pixelAt(x, y);
            if (c.a > 0 && c.r > 0 && c.g == 0 && c.b == 0) {
                sawRed = true;
                break;
            }
        }
    }
    ASSERT_TRUE(sawRed);
}

// =============================================================================
// Images and SVG
// =============================================================================

TEST(image_is_drawn_and_cached_by_hash) {
    auto renderer = headless();
    Img img{solidImage(4, 4, SK_ColorGREEN), "green-4x4"};

    renderer->begin(true);
    renderer->drawImage(img, Rect(2, 2, 6, 6));
    renderer->drawImage(img, Rect(10, 10, 18, 18));

    ASSERT_TRUE(renderer->imageCache().contains("img:green-4x4"));
    ASSERT_EQ(renderer->imageCache().missCount(), 1u);
    ASSERT_EQ(renderer->imagesDrawn(), 2u);

    RasterImage image = capture(*renderer);
    ASSERT_TRUE(image.pixelAt(3, 3) == kGreen);
    ASSERT_TRUE(image.pixelAt(14, 14) == kGreen);
    ASSERT_EQ(image.pixelAt(8, 8).a, 0);
}

TEST(null_image_is_ignored) {
    auto renderer = headless();
    renderer->begin(true);
    renderer->drawImage(Img{nullptr, "none"}, Rect(0, 0, 5, 5));
    ASSERT_EQ(renderer->imagesDrawn(), 0u);
    ASSERT_EQ(renderer->imageCache().size(), 0u);
}

TEST(svg_is_rasterized_per_size) {
    std::optional<Svg> svg = Svg::parse(kBlueSquareSvg, sizeof(kBlueSquareSvg) - 1, "blue-square", SkFontMgr::RefEmpty());
    ASSERT_TRUE(svg.has_value());
    ASSERT_FLOAT_EQ(svg->intrinsicSize().width(), 10.0f, 1e-4f);

    auto renderer = headless();
    renderer->begin(true);
    renderer->drawSvg(*svg, Rect(0, 0, 10, 10), std::nullopt);
    renderer->drawSvg(*svg, Rect(10, 10, 20, 20), std::nullopt);
    renderer->drawSvg(*svg, Rect(0, 10, 5, 15), std::nullopt);

    ASSERT_TRUE(renderer->imageCache().contains("svg:blue-square:10x10"));
    ASSERT_TRUE(renderer->imageCache().contains("svg:blue-square:5x5"));
    ASSERT_EQ(renderer->imageCache().missCount(), 2u);

    RasterImage image = capture(*renderer);
    ASSERT_TRUE(image.pixelAt(5, 5) == kBlue);
    ASSERT_TRUE(image.pixelAt(15, 15) == kBlue);
    ASSERT_EQ(image.pixelAt(15, 5).a, 0);
}

TEST(svg_tint_replaces_color) {
    std::optional<Svg> svg = Svg::parse(kBlueSquareSvg, sizeof(kBlueSquareSvg) - 1, "blue-square", SkFontMgr::RefEmpty());
    ASSERT_TRUE(svg.has_value());

    auto renderer = headless();
    renderer->begin(true);
    renderer->drawSvg(*svg, Rect(0, 0, 10, 10), Brush(Color::RED));

    RasterImage image = capture(*renderer);
    ASSERT_TRUE(image.pixelAt(5, 5) == Color::RED);
    ASSERT_EQ(image.pixelAt(15, 15).a, 0);
}

TEST(invalid_svg_fails_to_parse) {
    const char junk[] = "this is not svg";
    ASSERT_FALSE(Svg::parse(junk, sizeof(junk) - 1, "junk", SkFontMgr::RefEmpty()).has_value());
    ASSERT_FALSE(Svg::parse(nullptr, 0, "empty", SkFontMgr::RefEmpty()).has_value());
}

// =============================================================================
// Resize
// =============================================================================

TEST(resize_below_minimum_keeps_target) {
    auto renderer = headless(20, 20);
    renderer->resize(2.0, Size(5, 5));
    ASSERT_TRUE(renderer->size() == Size(20, 20));
    ASSERT_FLOAT_EQ(renderer->scale(), 2.0, 1e-12);
}

TEST(resize_then_capture_uses_new_size) {
    auto renderer = headless(20, 20);
    renderer->resize(1.0, Size(40, 30));
    ASSERT_TRUE(renderer->size() == Size(40, 30));

    renderer->begin(true);
    renderer->fill(Rect(30, 20, 40, 30), Color::RED, 0.0);
    RasterImage image = capture(*renderer);
    ASSERT_EQ(image.width, 40u);
    ASSERT_EQ(image.height, 30u);
    ASSERT_TRUE(image.pixelAt(35, 25) == Color::RED);
}

TEST(set_scale_does_not_resize) {
    auto renderer = headless(20, 20);
    renderer->setScale(3.0);
    ASSERT_FLOAT_EQ(renderer->scale(), 3.0, 1e-12);
    ASSERT_TRUE(renderer->size() == Size(20, 20));
}

// =============================================================================
// PPM output
// =============================================================================

TEST(ppm_composites_alpha_over_white) {
    RasterImage image(2, 1);
    image.pixels = {255, 0, 0, 255, 0, 0, 0, 0};

    char path[] = "/tmp/tessera_ppm_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_TRUE(fd >= 0);
    close(fd);

    ASSERT_TRUE(saveImagePPM(image, path));

    std::ifstream in(path, std::ios::binary);
    std::vector<char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::remove(path);

    const std::string header = "P6\n2 1\n255\n";
    ASSERT_EQ(bytes.size(), header.size() + 6);
    ASSERT_TRUE(std::memcmp(bytes.data(), header.data(), header.size()) == 0);
    const unsigned char* rgb = reinterpret_cast<const unsigned char*>(bytes.data() + header.size());
    ASSERT_EQ(rgb[0], 255);
    ASSERT_EQ(rgb[1], 0);
    ASSERT_EQ(rgb[2], 0);
    ASSERT_EQ(rgb[3], 255);
    ASSERT_EQ(rgb[4], 255);
    ASSERT_EQ(rgb[5], 255);
}

TEST(ppm_rejects_empty_image) {
    ASSERT_FALSE(saveImagePPM(RasterImage(), "/tmp/tessera_never_written.ppm"));
}

TEST(screenshot_filename_has_size_suffix) {
    std::string name = generateScreenshotFilename(640, 480);
    ASSERT_TRUE(name.rfind("capture_", 0) == 0);
    ASSERT_TRUE(name.find("_640x480.ppm") != std::string::npos);
}

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;
    return runAllTests("Tessera - Raster Renderer Tests");
}
