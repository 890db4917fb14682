#pragma once

#include <array>
#include <cutline/config.hpp>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace cutline
{

enum class SnapType
{
    Playhead,
    ClipStart,
    ClipEnd,
    Marker,
    Grid,
};

const char* to_string(SnapType type);

// Lower value wins a distance tie: playhead, then clip edges, then markers,
// then grid lines.
int snap_priority(SnapType type);

struct SnapPoint
{
    double      time = 0.0;
    SnapType    type = SnapType::Grid;
    std::string label;
    std::string clip_id;   // Owning clip for ClipStart/ClipEnd, empty otherwise
};

struct SnapResult
{
    bool                     snapped  = false;
    double                   time     = 0.0;   // Snapped time, or the proposal
    std::optional<SnapPoint> point;
    double                   distance = std::numeric_limits<double>::infinity();
};

namespace snap
{

// Two distances closer than this are considered equal and priority decides.
inline constexpr double TIE_EPSILON = 1e-9;

// Nearest candidate within `threshold` seconds of `proposed_time`.
//
// Empty candidates, a non-positive or non-finite threshold, or a non-finite
// proposal yield "no snap". Candidates with a non-finite time are skipped, as
// are the edges of `exclude_clip_id` so a dragged clip never snaps to itself.
SnapResult resolve(double                     proposed_time,
                   std::span<const SnapPoint> candidates,
                   double                     threshold,
                   std::string_view           exclude_clip_id = {});

// Start and end points of one clip.
std::array<SnapPoint, 2> clip_snap_points(std::string_view clip_id, double start, double end);

SnapPoint playhead_snap_point(double time);
SnapPoint marker_snap_point(double time, std::string label = {});
SnapPoint grid_snap_point(double time);

// Pixel tolerance expressed in seconds at `zoom` px/s.
double snap_threshold_for_zoom(double zoom, double threshold_px, const PositionConfig& cfg = {});

}   // namespace snap

}   // namespace cutline
