#include <cmath>
#include <gtest/gtest.h>
#include <limits>

#include <cutline/position_model.hpp>

using namespace cutline;
using namespace cutline::position;

namespace
{
constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}   // namespace

// ─── Zoom ────────────────────────────────────────────────────────────────────

TEST(PositionZoom, ClampedToBounds)
{
    EXPECT_DOUBLE_EQ(sanitize_zoom(100.0), 100.0);
    EXPECT_DOUBLE_EQ(sanitize_zoom(0.0), 0.1);
    EXPECT_DOUBLE_EQ(sanitize_zoom(-5.0), 0.1);
    EXPECT_DOUBLE_EQ(sanitize_zoom(1e9), 10000.0);
}

TEST(PositionZoom, NonFiniteUsesDefault)
{
    EXPECT_DOUBLE_EQ(sanitize_zoom(kNaN), 100.0);
    EXPECT_DOUBLE_EQ(sanitize_zoom(kInf), 100.0);

    PositionConfig cfg;
    cfg.default_zoom = 40.0;
    EXPECT_DOUBLE_EQ(sanitize_zoom(-kInf, cfg), 40.0);
}

// ─── Seconds <-> pixels ──────────────────────────────────────────────────────

TEST(PositionConvert, PixelsAndBack)
{
    EXPECT_DOUBLE_EQ(to_pixels(5.0, 100.0), 500.0);
    EXPECT_DOUBLE_EQ(to_seconds(500.0, 100.0), 5.0);
    EXPECT_DOUBLE_EQ(to_pixels(-2.0, 50.0), -100.0);
}

TEST(PositionConvert, ZeroZoomNeverDividesByZero)
{
    const double s = to_seconds(10.0, 0.0);
    EXPECT_TRUE(std::isfinite(s));
    EXPECT_DOUBLE_EQ(s, 100.0);   // zoom clamped to 0.1
}

TEST(PositionConvert, NonFiniteInputGivesZero)
{
    EXPECT_DOUBLE_EQ(to_pixels(kNaN, 100.0), 0.0);
    EXPECT_DOUBLE_EQ(to_pixels(kInf, 100.0), 0.0);
    EXPECT_DOUBLE_EQ(to_seconds(kNaN, 100.0), 0.0);
}

TEST(PositionConvert, PixelsBounded)
{
    EXPECT_DOUBLE_EQ(to_pixels(1e12, 10000.0), 1.0e7);
    EXPECT_DOUBLE_EQ(to_pixels(-1e12, 10000.0), -1.0e7);
}

// ─── Clip duration ───────────────────────────────────────────────────────────

TEST(PositionClipDuration, DividesBySpeed)
{
    EXPECT_DOUBLE_EQ(clip_duration({2.0, 12.0}, 1.0), 10.0);
    EXPECT_DOUBLE_EQ(clip_duration({2.0, 12.0}, 2.0), 5.0);
    EXPECT_DOUBLE_EQ(clip_duration({0.0, 3.0}, 0.5), 6.0);
}

TEST(PositionClipDuration, InvalidSpeedTreatedAsOne)
{
    EXPECT_DOUBLE_EQ(clip_duration({0.0, 4.0}, 0.0), 4.0);
    EXPECT_DOUBLE_EQ(clip_duration({0.0, 4.0}, -3.0), 4.0);
    EXPECT_DOUBLE_EQ(clip_duration({0.0, 4.0}, kNaN), 4.0);
}

TEST(PositionClipDuration, InvertedRangeIsZero)
{
    EXPECT_DOUBLE_EQ(clip_duration({5.0, 5.0}, 1.0), 0.0);
    EXPECT_DOUBLE_EQ(clip_duration({8.0, 2.0}, 1.0), 0.0);
    EXPECT_DOUBLE_EQ(clip_duration({0.0, kInf}, 1.0), 0.0);
}

// ─── Clip geometry ───────────────────────────────────────────────────────────

TEST(PositionClipGeometry, PlacementAtZoom100)
{
    const ClipGeometry g = clip_geometry({5.0, 10.0}, {0.0, 10.0}, 1.0, 100.0);
    EXPECT_DOUBLE_EQ(g.left, 500.0);
    EXPECT_DOUBLE_EQ(g.width, 1000.0);
}

TEST(PositionClipGeometry, FallsBackToSourceRange)
{
    const ClipGeometry g = clip_geometry({1.0, 0.0}, {0.0, 6.0}, 2.0, 100.0);
    EXPECT_DOUBLE_EQ(g.left, 100.0);
    EXPECT_DOUBLE_EQ(g.width, 300.0);
}

TEST(PositionClipGeometry, MinimumWidth)
{
    const ClipGeometry tiny = clip_geometry({0.0, 0.001}, {0.0, 0.001}, 1.0, 100.0);
    EXPECT_DOUBLE_EQ(tiny.width, 4.0);

    const ClipGeometry empty = clip_geometry({0.0, 0.0}, {3.0, 3.0}, 1.0, 100.0);
    EXPECT_DOUBLE_EQ(empty.width, 4.0);

    PositionConfig cfg;
    cfg.min_clip_width_px = 10.0;
    EXPECT_DOUBLE_EQ(clip_geometry({0.0, 0.01}, {}, 1.0, 100.0, cfg).width, 10.0);
}

TEST(PositionClipGeometry, NonFiniteZoomUsesDefault)
{
    const ClipGeometry g = clip_geometry({2.0, 1.0}, {0.0, 1.0}, 1.0, kNaN);
    EXPECT_DOUBLE_EQ(g.left, 200.0);
    EXPECT_DOUBLE_EQ(g.width, 100.0);
}

// ─── Viewport ────────────────────────────────────────────────────────────────

TEST(PositionViewport, ScrollOffset)
{
    EXPECT_DOUBLE_EQ(time_to_pixel(3.0, 100.0), 300.0);
    EXPECT_DOUBLE_EQ(time_to_pixel(3.0, 100.0, 250.0), 50.0);
    EXPECT_DOUBLE_EQ(pixel_to_time(50.0, 100.0, 250.0), 3.0);
}

TEST(PositionViewport, InvalidInput)
{
    EXPECT_DOUBLE_EQ(time_to_pixel(kNaN, 100.0), 0.0);
    EXPECT_DOUBLE_EQ(time_to_pixel(1.0, kInf), 0.0);
    EXPECT_DOUBLE_EQ(pixel_to_time(100.0, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(pixel_to_time(100.0, -1.0), 0.0);
    EXPECT_DOUBLE_EQ(pixel_to_time(kNaN, 100.0), 0.0);
}

// ─── Grid ────────────────────────────────────────────────────────────────────

TEST(PositionGrid, SnapsToNearestMultiple)
{
    EXPECT_DOUBLE_EQ(snap_to_grid(1.5, 1.0), 2.0);
    EXPECT_DOUBLE_EQ(snap_to_grid(1.4, 1.0), 1.0);
    EXPECT_DOUBLE_EQ(snap_to_grid(0.3, 0.5), 0.5);
    EXPECT_DOUBLE_EQ(snap_to_grid(0.2, 0.5), 0.0);
    EXPECT_DOUBLE_EQ(snap_to_grid(-1.2, 1.0), -1.0);
}

TEST(PositionGrid, NonPositiveIntervalPassesThrough)
{
    EXPECT_DOUBLE_EQ(snap_to_grid(1.37, 0.0), 1.37);
    EXPECT_DOUBLE_EQ(snap_to_grid(1.37, -1.0), 1.37);
    EXPECT_DOUBLE_EQ(snap_to_grid(1.37, kNaN), 1.37);
}

TEST(PositionGrid, IntervalForZoom)
{
    EXPECT_DOUBLE_EQ(grid_interval_for_zoom(1000.0), 1.0 / 30.0);
    EXPECT_DOUBLE_EQ(grid_interval_for_zoom(500.0), 1.0 / 30.0);
    EXPECT_DOUBLE_EQ(grid_interval_for_zoom(499.0), 0.1);
    EXPECT_DOUBLE_EQ(grid_interval_for_zoom(200.0), 0.1);
    EXPECT_DOUBLE_EQ(grid_interval_for_zoom(100.0), 0.25);
    EXPECT_DOUBLE_EQ(grid_interval_for_zoom(50.0), 0.5);
    EXPECT_DOUBLE_EQ(grid_interval_for_zoom(25.0), 1.0);
    EXPECT_DOUBLE_EQ(grid_interval_for_zoom(10.0), 5.0);
    EXPECT_DOUBLE_EQ(grid_interval_for_zoom(9.99), 10.0);
}

TEST(PositionGrid, ClampTime)
{
    EXPECT_DOUBLE_EQ(clamp_time(-3.0), 0.0);
    EXPECT_DOUBLE_EQ(clamp_time(1e9), 1e9);
    EXPECT_DOUBLE_EQ(clamp_time(12.0, 0.0, 10.0), 10.0);
    EXPECT_DOUBLE_EQ(clamp_time(4.0, 5.0, 10.0), 5.0);
    EXPECT_DOUBLE_EQ(clamp_time(7.0, 5.0, 10.0), 7.0);
}
