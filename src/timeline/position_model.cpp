#include <algorithm>
#include <cmath>
#include <cutline/numeric.hpp>
#include <cutline/position_model.hpp>

namespace cutline::position
{

namespace
{

constexpr double MIN_SPEED = 1e-6;

const PositionConfig& checked(const PositionConfig& cfg)
{
    static const PositionConfig defaults;
    return is_valid(cfg) ? cfg : defaults;
}

}   // namespace

double sanitize_zoom(double zoom, const PositionConfig& config)
{
    const PositionConfig& cfg = checked(config);
    if (!is_finite(zoom))
        zoom = cfg.default_zoom;
    return std::clamp(zoom, cfg.zoom_min, cfg.zoom_max);
}

double to_pixels(double seconds, double zoom, const PositionConfig& config)
{
    const PositionConfig& cfg = checked(config);
    if (!is_finite(seconds))
        return 0.0;
    const double px = seconds * sanitize_zoom(zoom, cfg);
    return std::clamp(px, -cfg.max_pixels, cfg.max_pixels);
}

double to_seconds(double pixels, double zoom, const PositionConfig& cfg)
{
    if (!is_finite(pixels))
        return 0.0;
    return pixels / sanitize_zoom(zoom, cfg);
}

double clip_duration(const SourceRange& range, double speed)
{
    if (!is_finite(speed) || speed <= 0.0)
        speed = 1.0;
    const double span = range.source_out_sec - range.source_in_sec;
    if (!is_finite(span) || span <= 0.0)
        return 0.0;
    return span / std::max(speed, MIN_SPEED);
}

ClipGeometry clip_geometry(const ClipPlacement& placement,
                           const SourceRange&   range,
                           double               speed,
                           double               zoom,
                           const PositionConfig& config)
{
    const PositionConfig& cfg      = checked(config);
    double                duration = placement.duration_sec;
    if (!is_finite(duration) || duration <= 0.0)
        duration = clip_duration(range, speed);

    ClipGeometry g;
    g.left  = to_pixels(placement.timeline_in_sec, zoom, cfg);
    g.width = std::max(to_pixels(duration, zoom, cfg), cfg.min_clip_width_px);
    return g;
}

// ─── Viewport conversions ────────────────────────────────────────────────────

double time_to_pixel(double time, double zoom, double scroll_x)
{
    if (!is_finite(time) || !is_finite(zoom) || !is_finite(scroll_x))
        return 0.0;
    const double px = time * zoom - scroll_x;
    return is_finite(px) ? px : 0.0;
}

double pixel_to_time(double pixel, double zoom, double scroll_x)
{
    if (!is_finite(zoom) || zoom <= 0.0)
        return 0.0;
    const double t = (pixel + scroll_x) / zoom;
    return is_finite(t) ? t : 0.0;
}

// ─── Grid ────────────────────────────────────────────────────────────────────

double snap_to_grid(double time, double interval)
{
    if (!is_finite(interval) || interval <= 0.0 || !is_finite(time))
        return time;
    return std::floor(time / interval + 0.5) * interval;
}

double grid_interval_for_zoom(double zoom)
{
    if (zoom >= 500.0)
        return 1.0 / 30.0;
    if (zoom >= 200.0)
        return 0.1;
    if (zoom >= 100.0)
        return 0.25;
    if (zoom >= 50.0)
        return 0.5;
    if (zoom >= 25.0)
        return 1.0;
    if (zoom >= 10.0)
        return 5.0;
    return 10.0;
}

double clamp_time(double time, double min, double max)
{
    return std::max(min, std::min(max, time));
}

}   // namespace cutline::position
