#include <algorithm>
#include <cmath>
#include <cutline/logger.hpp>
#include <cutline/numeric.hpp>
#include <cutline/position_model.hpp>
#include <cutline/snap_resolver.hpp>

namespace cutline
{

const char* to_string(SnapType type)
{
    switch (type)
    {
        case SnapType::Playhead:
            return "playhead";
        case SnapType::ClipStart:
            return "clip-start";
        case SnapType::ClipEnd:
            return "clip-end";
        case SnapType::Marker:
            return "marker";
        case SnapType::Grid:
            return "grid";
    }
    return "unknown";
}

int snap_priority(SnapType type)
{
    switch (type)
    {
        case SnapType::Playhead:
            return 0;
        case SnapType::ClipStart:
        case SnapType::ClipEnd:
            return 1;
        case SnapType::Marker:
            return 2;
        case SnapType::Grid:
            return 3;
    }
    return 4;
}

namespace snap
{

SnapResult resolve(double                     proposed_time,
                   std::span<const SnapPoint> candidates,
                   double                     threshold,
                   std::string_view           exclude_clip_id)
{
    SnapResult result;
    result.time = proposed_time;

    if (candidates.empty() || !is_finite(threshold) || threshold <= 0.0)
        return result;
    if (!is_finite(proposed_time))
    {
        CUTLINE_LOG_DEBUG("snap", "ignoring non-finite proposed time");
        return result;
    }

    const SnapPoint* best          = nullptr;
    double           best_distance = std::numeric_limits<double>::infinity();

    for (const auto& p : candidates)
    {
        if (!is_finite(p.time))
            continue;
        if (!exclude_clip_id.empty() && p.clip_id == exclude_clip_id)
            continue;

        const double d = std::fabs(proposed_time - p.time);
        if (d > threshold)
            continue;

        if (!best || d < best_distance - TIE_EPSILON)
        {
            best          = &p;
            best_distance = d;
        }
        else if (std::fabs(d - best_distance) <= TIE_EPSILON
                 && snap_priority(p.type) < snap_priority(best->type))
        {
            best          = &p;
            best_distance = std::min(best_distance, d);
        }
    }

    if (!best)
        return result;

    result.snapped  = true;
    result.time     = best->time;
    result.point    = *best;
    result.distance = best_distance;
    return result;
}

std::array<SnapPoint, 2> clip_snap_points(std::string_view clip_id, double start, double end)
{
    return {
        SnapPoint{.time = start, .type = SnapType::ClipStart, .label = {}, .clip_id = std::string(clip_id)},
        SnapPoint{.time = end, .type = SnapType::ClipEnd, .label = {}, .clip_id = std::string(clip_id)},
    };
}

SnapPoint playhead_snap_point(double time)
{
    return SnapPoint{.time = time, .type = SnapType::Playhead, .label = "playhead", .clip_id = {}};
}

SnapPoint marker_snap_point(double time, std::string label)
{
    return SnapPoint{.time = time, .type = SnapType::Marker, .label = std::move(label), .clip_id = {}};
}

SnapPoint grid_snap_point(double time)
{
    return SnapPoint{.time = time, .type = SnapType::Grid, .label = {}, .clip_id = {}};
}

double snap_threshold_for_zoom(double zoom, double threshold_px, const PositionConfig& cfg)
{
    if (!is_finite(threshold_px) || threshold_px <= 0.0)
        return 0.0;
    return position::to_seconds(threshold_px, zoom, cfg);
}

}   // namespace snap

}   // namespace cutline
