// test_renderer_dispatch.cpp - Backend selection, the uninitialized placeholder and init errors

#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

#include "test_framework.h"

#include "include/core/SkFontMgr.h"

#include "font_registry.h"
#include "renderer.h"

using namespace tessera;

static std::shared_ptr<FontRegistry> emptyFonts() {
    return std::make_shared<FontRegistry>(SkFontMgr::RefEmpty());
}

// =============================================================================
// Uninitialized
// =============================================================================

TEST(uninitialized_records_scale_and_clamped_size) {
    Renderer renderer = Renderer::uninitialized(1.5, Size(0, 0.5));
    ASSERT_TRUE(renderer.kind() == Renderer::Kind::Uninitialized);
    ASSERT_FLOAT_EQ(renderer.scale(), 1.5, 1e-12);
    ASSERT_TRUE(renderer.size() == Size(1, 1));
    ASSERT_EQ(std::strcmp(renderer.backendName(), "Uninitialized"), 0);
    ASSERT_NULL(renderer.hardware());
    ASSERT_NULL(renderer.software());
}

TEST(uninitialized_ignores_drawing) {
    Renderer renderer = Renderer::uninitialized(1.0, Size(100, 100));
    renderer.begin(true);
    renderer.transform(Affine::translate(1, 1));
    renderer.clip(Rect(0, 0, 10, 10));
    ASSERT_TRUE(renderer.fill(Rect(0, 0, 10, 10), Color::RED, 0.0) == DrawStatus::NoPaint);
    ASSERT_TRUE(renderer.stroke(Line{{0, 0}, {10, 10}}, Color::RED, 1.0) == DrawStatus::NoPaint);
    renderer.drawText(TextLayout(), Point(0, 0));
    renderer.setZIndex(2);
    renderer.clearClip();
    ASSERT_FALSE(renderer.finish().has_value());
}

TEST(uninitialized_resize_and_set_scale) {
    Renderer renderer = Renderer::uninitialized(1.0, Size(100, 100));
    renderer.resize(2.0, Size(640.7, 480.2));
    ASSERT_TRUE(renderer.size() == Size(640, 480));
    ASSERT_FLOAT_EQ(renderer.scale(), 2.0, 1e-12);

    renderer.setScale(3.0);
    ASSERT_FLOAT_EQ(renderer.scale(), 3.0, 1e-12);
    ASSERT_TRUE(renderer.size() == Size(640, 480));
}

// =============================================================================
// Backend selection
// =============================================================================

TEST(forced_software_uses_raster_backend) {
    RendererOptions options;
    options.forceSoftware = true;
    Renderer renderer(nullptr, emptyFonts(), 1.0, Size(32, 24), options);

    ASSERT_TRUE(renderer.kind() == Renderer::Kind::Software);
    ASSERT_NOT_NULL(renderer.software());
    ASSERT_NULL(renderer.hardware());
    ASSERT_EQ(std::strcmp(renderer.backendName(), "Skia Raster"), 0);

    renderer.begin(true);
    renderer.fill(Rect(0, 0, 8, 8), Color::RED, 0.0);
    std::optional<RasterImage> image = renderer.finish();
    ASSERT_TRUE(image.has_value());
    ASSERT_EQ(image->width, 32u);
    ASSERT_EQ(image->height, 24u);
    ASSERT_TRUE(image->pixelAt(4, 4) == Color::RED);
}

TEST(force_software_from_environment) {
    setenv("TESSERA_FORCE_SOFTWARE", "1", 1);
    RendererOptions options = RendererOptions::fromEnvironment();
    unsetenv("TESSERA_FORCE_SOFTWARE");
    ASSERT_TRUE(options.forceSoftware);

    Renderer renderer(nullptr, emptyFonts(), 1.0, Size(16, 16), options);
    ASSERT_TRUE(renderer.kind() == Renderer::Kind::Software);
}

TEST(environment_options) {
    setenv("TESSERA_FORCE_SOFTWARE", "yes", 1);
    setenv("TESSERA_FONT_EMBOLDEN", "0.5", 1);
    setenv("TESSERA_VSYNC", "0", 1);
    RendererOptions options = RendererOptions::fromEnvironment();
    unsetenv("TESSERA_FORCE_SOFTWARE");
    unsetenv("TESSERA_FONT_EMBOLDEN");
    unsetenv("TESSERA_VSYNC");

    // Only "1" forces software
    ASSERT_FALSE(options.forceSoftware);
    ASSERT_FLOAT_EQ(options.fontEmbolden, 0.5f, 1e-6f);
    ASSERT_FALSE(options.vsync);

    RendererOptions defaults = RendererOptions::fromEnvironment();
    ASSERT_TRUE(defaults.vsync);
    ASSERT_FLOAT_EQ(defaults.fontEmbolden, 0.0f, 1e-6f);
}

TEST(default_selection_produces_a_backend) {
    RendererOptions options;
    Renderer renderer(nullptr, emptyFonts(), 1.0, Size(16, 16), options);
    ASSERT_TRUE(renderer.kind() != Renderer::Kind::Uninitialized);

    renderer.begin(true);
    renderer.fill(Rect(0, 0, 16, 16), Color::RED, 0.0);
    std::optional<RasterImage> image = renderer.finish();
    ASSERT_TRUE(image.has_value());
    ASSERT_TRUE(image->pixelAt(8, 8) == Color::RED);
}

TEST(zero_size_is_raised_to_one_pixel) {
    RendererOptions options;
    options.forceSoftware = true;
    Renderer renderer(nullptr, emptyFonts(), 1.0, Size(0, 0), options);
    ASSERT_TRUE(renderer.size() == Size(1, 1));

    renderer.begin(true);
    std::optional<RasterImage> image = renderer.finish();
    ASSERT_TRUE(image.has_value());
    ASSERT_EQ(image->width, 1u);
    ASSERT_EQ(image->height, 1u);
}

// =============================================================================
// Init errors
// =============================================================================

TEST(init_error_names_both_causes) {
    RendererInitError error("no adapter", "out of memory");
    std::string message = error.what();
    ASSERT_TRUE(message.find("GPU renderer failed: no adapter") != std::string::npos);
    ASSERT_TRUE(message.find("software renderer failed: out of memory") != std::string::npos);
    ASSERT_EQ(error.gpuCause(), std::string("no adapter"));
    ASSERT_EQ(error.softwareCause(), std::string("out of memory"));
}

TEST(init_error_without_gpu_attempt) {
    RendererInitError error("", "out of memory");
    ASSERT_EQ(std::string(error.what()), std::string("software renderer failed: out of memory"));
    ASSERT_TRUE(error.gpuCause().empty());
}

TEST(draw_status_names) {
    ASSERT_EQ(std::string(drawStatusName(DrawStatus::Drawn)), std::string("drawn"));
    ASSERT_EQ(std::string(drawStatusName(DrawStatus::NoPaint)), std::string("no paint"));
    ASSERT_EQ(std::string(drawStatusName(DrawStatus::Unsupported)), std::string("unsupported"));
}

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;
    return runAllTests("Tessera - Renderer Dispatch Tests");
}
