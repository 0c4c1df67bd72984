// test_primitive_recorder.cpp - Primitive recording, z ordering, replay and recorder switching

#include <memory>
#include <string>

#include "test_framework.h"

#include "include/core/SkBitmap.h"
#include "include/core/SkCanvas.h"
#include "include/core/SkColor.h"
#include "include/core/SkFontMgr.h"
#include "include/core/SkImageInfo.h"
#include "include/core/SkSurface.h"

#include "capture_switch.h"
#include "font_registry.h"
#include "primitive_recorder.h"
#include "raster_renderer.h"

using namespace tessera;

static sk_sp<SkSurface> makeSurface(int w, int h) {
    SkImageInfo info = SkImageInfo::Make(w, h, kRGBA_8888_SkColorType, kPremul_SkAlphaType);
    sk_sp<SkSurface> surface = SkSurfaces::Raster(info);
    if (!surface) {
        throw std::runtime_error("could not allocate raster surface");
    }
    surface->getCanvas()->clear(SK_ColorTRANSPARENT);
    return surface;
}

static SkColor pixel(const sk_sp<SkSurface>& surface, int x, int y) {
    SkBitmap bitmap;
    bitmap.allocPixels(SkImageInfo::MakeN32Premul(1, 1));
    if (!surface->readPixels(bitmap, x, y)) {
        throw std::runtime_error("readPixels failed");
    }
    return bitmap.getColor(0, 0);
}

// =============================================================================
// Recording
// =============================================================================

TEST(begin_resets_frame_state) {
    PrimitiveRecorder rec;
    rec.begin(50, 40, 2.0f);
    PaintIndex red = rec.colorPaint(Color::RED);
    rec.setZIndex(3);
    rec.scissor(SkRect::MakeWH(10, 10), 0.0f);
    rec.fillRect(SkRect::MakeWH(5, 5), 0.0f, red, 0.0f);
    rec.moveTo({0, 0});
    rec.quadTo({1, 1}, {2, 0});

    rec.begin(60, 30, 1.0f);
    ASSERT_TRUE(rec.primitives().empty());
    ASSERT_TRUE(rec.scissors().empty());
    ASSERT_EQ(rec.paintCount(), 0u);
    ASSERT_EQ(rec.zIndex(), 0);
    ASSERT_FALSE(rec.hasPendingPath());
    ASSERT_EQ(rec.frameWidth(), 60u);
    ASSERT_EQ(rec.frameHeight(), 30u);
}

TEST(primitives_carry_z_index_and_scissor) {
    PrimitiveRecorder rec;
    rec.begin(20, 20, 1.0f);
    PaintIndex red = rec.colorPaint(Color::RED);

    rec.fillCircle({5, 5}, 2.0f, red);
    rec.setZIndex(4);
    rec.scissor(SkRect::MakeLTRB(0, 0, 10, 10), 2.0f);
    rec.strokeSegment({0, 0}, {10, 10}, 1.0f, red);
    rec.resetScissor();
    rec.strokeBezier({0, 0}, {5, 10}, {10, 0}, 1.0f, red);

    const auto& prims = rec.primitives();
    ASSERT_EQ(prims.size(), 3u);
    ASSERT_EQ(prims[0].zIndex, 0);
    ASSERT_EQ(prims[0].scissor, -1);
    ASSERT_EQ(prims[1].zIndex, 4);
    ASSERT_EQ(prims[1].scissor, 0);
    ASSERT_FLOAT_EQ(rec.scissors()[0].radius, 2.0f, 1e-6f);
    ASSERT_EQ(prims[2].scissor, -1);
}

TEST(fill_without_contour_records_nothing) {
    PrimitiveRecorder rec;
    rec.begin(20, 20, 1.0f);
    rec.fill(rec.colorPaint(Color::RED));
    ASSERT_TRUE(rec.primitives().empty());

    rec.moveTo({1, 1});
    rec.quadTo({5, 1}, {5, 1});
    rec.quadTo({5, 5}, {5, 5});
    ASSERT_TRUE(rec.hasPendingPath());
    rec.fill(0);
    ASSERT_EQ(rec.primitives().size(), 1u);
    ASSERT_TRUE(rec.primitives()[0].kind == PrimitiveKind::FillPath);
    ASSERT_FALSE(rec.hasPendingPath());
}

TEST(null_images_are_not_recorded) {
    PrimitiveRecorder rec;
    rec.begin(20, 20, 1.0f);
    rec.renderImage(0, 0, 5, 5, nullptr);
    rec.renderSvg(0, 0, 5, 5, nullptr, std::nullopt);
    rec.renderGlyph(0, 0, nullptr, 0, 0, 0);
    ASSERT_TRUE(rec.primitives().empty());
}

// =============================================================================
// Replay
// =============================================================================

TEST(encode_orders_by_z_index) {
    PrimitiveRecorder rec;
    rec.begin(20, 20, 1.0f);
    PaintIndex red = rec.colorPaint(Color::RED);
    PaintIndex blue = rec.colorPaint(Color(0, 0, 255));

    rec.setZIndex(1);
    rec.fillRect(SkRect::MakeLTRB(0, 0, 20, 20), 0.0f, red, 0.0f);
    rec.setZIndex(0);
    rec.fillRect(SkRect::MakeLTRB(0, 0, 20, 20), 0.0f, blue, 0.0f);

    sk_sp<SkSurface> surface = makeSurface(20, 20);
    rec.encode(surface->getCanvas());
    ASSERT_EQ(pixel(surface, 10, 10), SK_ColorRED);
}

TEST(equal_z_keeps_recording_order) {
    PrimitiveRecorder rec;
    rec.begin(20, 20, 1.0f);
    PaintIndex red = rec.colorPaint(Color::RED);
    PaintIndex blue = rec.colorPaint(Color(0, 0, 255));

    rec.fillRect(SkRect::MakeLTRB(0, 0, 20, 20), 0.0f, red, 0.0f);
    rec.fillRect(SkRect::MakeLTRB(0, 0, 20, 20), 0.0f, blue, 0.0f);

    sk_sp<SkSurface> surface = makeSurface(20, 20);
    rec.encode(surface->getCanvas());
    ASSERT_EQ(pixel(surface, 10, 10), SK_ColorBLUE);
}

TEST(scissor_limits_replay) {
    PrimitiveRecorder rec;
    rec.begin(20, 20, 1.0f);
    PaintIndex red = rec.colorPaint(Color::RED);
    rec.scissor(SkRect::MakeLTRB(0, 0, 10, 20), 0.0f);
    rec.fillRect(SkRect::MakeLTRB(0, 0, 20, 20), 0.0f, red, 0.0f);

    sk_sp<SkSurface> surface = makeSurface(20, 20);
    rec.encode(surface->getCanvas());
    ASSERT_EQ(pixel(surface, 5, 10), SK_ColorRED);
    ASSERT_EQ(SkColorGetA(pixel(surface, 15, 10)), 0u);
}

TEST(zero_width_stroke_is_not_drawn) {
    PrimitiveRecorder rec;
    rec.begin(20, 20, 1.0f);
    rec.strokeSegment({0, 10}, {20, 10}, 0.0f, rec.colorPaint(Color::RED));

    sk_sp<SkSurface> surface = makeSurface(20, 20);
    rec.encode(surface->getCanvas());
    ASSERT_EQ(SkColorGetA(pixel(surface, 10, 10)), 0u);
}

TEST(full_aperture_arc_is_a_ring) {
    PrimitiveRecorder rec;
    rec.begin(40, 40, 1.0f);
    rec.strokeArc({20, 20}, 10.0f, 4.0f, 0.0f, 3.2f, rec.colorPaint(Color::RED));

    sk_sp<SkSurface> surface = makeSurface(40, 40);
    rec.encode(surface->getCanvas());
    ASSERT_EQ(pixel(surface, 30, 20), SK_ColorRED);
    ASSERT_EQ(pixel(surface, 10, 20), SK_ColorRED);
    ASSERT_EQ(SkColorGetA(pixel(surface, 20, 20)), 0u);
}

// =============================================================================
// Coordinates through the renderer
// =============================================================================

static std::unique_ptr<RasterRenderer> headless(double scale, uint32_t w, uint32_t h) {
    std::string error;
    auto renderer = RasterRenderer::create(nullptr, std::make_shared<FontRegistry>(SkFontMgr::RefEmpty()), scale, w,
                                           h, RendererOptions(), &error);
    if (!renderer) {
        throw std::runtime_error("raster renderer: " + error);
    }
    return renderer;
}

TEST(identity_transform_records_logical_coordinates) {
    auto renderer = headless(1.0, 64, 64);
    renderer->begin(false);
    renderer->fill(Rect(3, 4, 13, 14), Color::RED, 0.0);
    renderer->stroke(Line{{1, 2}, {30, 2}}, Color::RED, 3.0);
    renderer->fill(Circle{{20, 20}, 6}, Color::RED, 0.0);

    const auto& prims = renderer->frameRecorder().primitives();
    ASSERT_EQ(prims.size(), 3u);
    ASSERT_TRUE(prims[0].rect == SkRect::MakeLTRB(3, 4, 13, 14));
    ASSERT_TRUE(prims[1].kind == PrimitiveKind::StrokeSegment);
    ASSERT_FLOAT_EQ(prims[1].width, 3.0f, 1e-6f);
    ASSERT_TRUE(prims[1].points[1] == SkPoint::Make(30, 2));
    ASSERT_FLOAT_EQ(prims[2].radius, 6.0f, 1e-6f);
}

TEST(stroked_shapes_record_outline_primitives) {
    auto renderer = headless(2.0, 64, 64);
    renderer->begin(false);
    renderer->stroke(Rect(1, 2, 11, 12), Color::RED, 1.0);
    renderer->stroke(RoundedRect(Rect(0, 0, 10, 10), 3.0), Color::RED, 2.0);
    renderer->stroke(Circle{{10, 10}, 4}, Color::RED, 1.5);

    const auto& prims = renderer->frameRecorder().primitives();
    ASSERT_EQ(prims.size(), 3u);

    ASSERT_TRUE(prims[0].kind == PrimitiveKind::StrokeRect);
    ASSERT_TRUE(prims[0].points[0] == SkPoint::Make(2, 4));
    ASSERT_TRUE(prims[0].points[1] == SkPoint::Make(22, 24));
    ASSERT_FLOAT_EQ(prims[0].radius, 0.0f, 1e-6f);
    ASSERT_FLOAT_EQ(prims[0].width, 2.0f, 1e-6f);

    ASSERT_TRUE(prims[1].kind == PrimitiveKind::StrokeRect);
    ASSERT_TRUE(prims[1].points[1] == SkPoint::Make(20, 20));
    ASSERT_FLOAT_EQ(prims[1].radius, 6.0f, 1e-6f);
    ASSERT_FLOAT_EQ(prims[1].width, 4.0f, 1e-6f);

    // A circle is a full-aperture arc
    ASSERT_TRUE(prims[2].kind == PrimitiveKind::StrokeArc);
    ASSERT_TRUE(prims[2].points[0] == SkPoint::Make(20, 20));
    ASSERT_FLOAT_EQ(prims[2].radius, 8.0f, 1e-6f);
    ASSERT_FLOAT_EQ(prims[2].width, 3.0f, 1e-6f);
    ASSERT_FLOAT_EQ(prims[2].rotation, 0.0f, 1e-6f);
    ASSERT_FLOAT_EQ(prims[2].aperture, 3.14159265f, 1e-5f);
}

TEST(device_scale_multiplies_coordinates_and_widths) {
    auto renderer = headless(2.0, 64, 64);
    renderer->begin(false);
    renderer->transform(Affine::translate(5, 0));
    renderer->fill(Rect(0, 0, 10, 10), Color::RED, 4.0);
    renderer->stroke(Line{{0, 0}, {10, 0}}, Color::RED, 1.4);

    const auto& prims = renderer->frameRecorder().primitives();
    ASSERT_EQ(prims.size(), 2u);
    ASSERT_TRUE(prims[0].rect == SkRect::MakeLTRB(10, 0, 30, 20));
    ASSERT_FLOAT_EQ(prims[0].blur, 8.0f, 1e-6f);
    // round(1.4 * 2)
    ASSERT_FLOAT_EQ(prims[1].width, 3.0f, 1e-6f);
}

TEST(rounded_rect_radius_uses_top_left) {
    auto renderer = headless(1.0, 64, 64);
    renderer->begin(false);
    RoundedRectRadii radii;
    radii.topLeft = 4;
    radii.bottomRight = 9;
    renderer->fill(RoundedRect(Rect(0, 0, 20, 20), radii), Color::RED, 0.0);
    ASSERT_FLOAT_EQ(renderer->frameRecorder().primitives()[0].radius, 4.0f, 1e-6f);
}

TEST(fill_line_becomes_path) {
    auto renderer = headless(1.0, 64, 64);
    renderer->begin(false);
    ASSERT_TRUE(renderer->fill(Line{{0, 0}, {10, 10}}, Color::RED, 0.0) == DrawStatus::Drawn);
    ASSERT_TRUE(renderer->frameRecorder().primitives()[0].kind == PrimitiveKind::FillPath);
}

// =============================================================================
// CaptureSwitch
// =============================================================================

struct FakeRecorder {
    bool capture;
};

TEST(capture_switch_creates_standby_once) {
    int created = 0;
    CaptureSwitch<FakeRecorder> sw(std::make_unique<FakeRecorder>(FakeRecorder{false}), [&](bool capture) {
        ++created;
        return std::make_unique<FakeRecorder>(FakeRecorder{capture});
    });

    FakeRecorder* normal = &sw.active();
    ASSERT_FALSE(sw.hasStandby());

    ASSERT_TRUE(sw.select(true));
    FakeRecorder* capture = &sw.active();
    ASSERT_TRUE(capture->capture);
    ASSERT_TRUE(sw.capture());
    ASSERT_TRUE(sw.standby() == normal);

    ASSERT_TRUE(sw.select(false));
    ASSERT_TRUE(&sw.active() == normal);
    ASSERT_TRUE(sw.select(true));
    ASSERT_TRUE(&sw.active() == capture);

    ASSERT_EQ(created, 1);
}

TEST(capture_switch_same_mode_is_noop) {
    int created = 0;
    CaptureSwitch<FakeRecorder> sw(std::make_unique<FakeRecorder>(FakeRecorder{false}), [&](bool capture) {
        ++created;
        return std::make_unique<FakeRecorder>(FakeRecorder{capture});
    });
    ASSERT_TRUE(sw.select(false));
    ASSERT_EQ(created, 0);
    ASSERT_FALSE(sw.capture());
}

TEST(capture_switch_factory_failure_keeps_mode) {
    CaptureSwitch<FakeRecorder> sw(std::make_unique<FakeRecorder>(FakeRecorder{false}),
                                   [](bool) { return std::unique_ptr<FakeRecorder>(); });
    FakeRecorder* normal = &sw.active();

    ASSERT_FALSE(sw.select(true));
    ASSERT_FALSE(sw.capture());
    ASSERT_TRUE(&sw.active() == normal);
    ASSERT_FALSE(sw.hasStandby());
}

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;
    return runAllTests("Tessera - Primitive Recorder Tests");
}
