#pragma once

#include <string>

namespace cutline
{

// Where a clip sits on the timeline, in timeline seconds.
struct ClipPlacement
{
    double timeline_in_sec = 0.0;   // >= 0
    double duration_sec    = 0.0;   // > 0
};

// Trimmed window of the source media, in source seconds.
struct SourceRange
{
    double source_in_sec  = 0.0;
    double source_out_sec = 0.0;   // > source_in_sec
};

// On-screen extent of a clip, in pixels from the timeline origin.
struct ClipGeometry
{
    double left  = 0.0;
    double width = 0.0;
};

}   // namespace cutline
