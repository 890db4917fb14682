#pragma once

#include <cutline/clip.hpp>
#include <cutline/config.hpp>
#include <limits>

namespace cutline::position
{

// Pure time <-> pixel math for the timeline. No state; every function
// tolerates NaN/infinity and returns a finite value.

// seconds * zoom, clamped to +/- max_pixels. Zoom is sanitized first
// (non-finite -> default_zoom, then clamped to [zoom_min, zoom_max]).
double to_pixels(double seconds, double zoom, const PositionConfig& cfg = {});

// pixels / zoom with the same zoom sanitation; never divides by zero.
double to_seconds(double pixels, double zoom, const PositionConfig& cfg = {});

// Non-finite zoom -> default_zoom; finite zoom clamped to the zoom bounds.
double sanitize_zoom(double zoom, const PositionConfig& cfg = {});

// (source_out - source_in) / speed. Zero, negative or non-finite speed is
// treated as 1. Never negative.
double clip_duration(const SourceRange& range, double speed);

// left = to_pixels(timeline_in). The width comes from placement.duration_sec
// when that is positive, otherwise from clip_duration(range, speed), and is
// floored to min_clip_width_px.
ClipGeometry clip_geometry(const ClipPlacement& placement,
                           const SourceRange&   range,
                           double               speed,
                           double               zoom,
                           const PositionConfig& cfg = {});

// ─── Viewport conversions ────────────────────────────────────────────────────

// time * zoom - scroll_x; 0 for non-finite input or result.
double time_to_pixel(double time, double zoom, double scroll_x = 0.0);

// (pixel + scroll_x) / zoom; 0 when zoom <= 0 or the result is not finite.
double pixel_to_time(double pixel, double zoom, double scroll_x = 0.0);

// ─── Grid ────────────────────────────────────────────────────────────────────

// Nearest multiple of interval, halves rounding up. interval <= 0 passes
// time through unchanged.
double snap_to_grid(double time, double interval);

// Finer grid at higher zoom: 1/30 s at >= 500 px/s down to 10 s below 10 px/s.
double grid_interval_for_zoom(double zoom);

double clamp_time(double time,
                  double min = 0.0,
                  double max = std::numeric_limits<double>::infinity());

}   // namespace cutline::position
