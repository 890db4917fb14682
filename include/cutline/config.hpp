#pragma once

#include <string>

namespace cutline
{

// Playback clock tuning.
struct EngineConfig
{
    double max_frame_delta_ms = 250.0;   // Larger gaps (suspended host) are clamped
    double min_playback_rate  = 0.25;
    double max_playback_rate  = 4.0;
    double default_step_fps   = 30.0;    // Used when step_forward/backward get fps <= 0
};

// Engine <-> store reconciliation tuning.
struct SyncConfig
{
    double time_epsilon    = 1e-6;   // seconds
    double rate_epsilon    = 1e-9;
    double grace_window_ms = 50.0;   // Only consulted for UpdateOrigin::Untagged
    bool   origin_tagging  = true;   // false: treat every notification as Untagged
};

// Seconds <-> pixels conversion limits.
struct PositionConfig
{
    double zoom_min          = 0.1;     // px per second
    double zoom_max          = 10000.0;
    double default_zoom      = 100.0;   // Substituted for non-finite zoom
    double max_pixels        = 1.0e7;
    double min_clip_width_px = 4.0;
};

// Clip drag / trim interaction tuning.
struct DragConfig
{
    double activation_threshold_px = 3.0;
    double min_clip_duration       = 0.1;   // seconds of timeline time
    double snap_threshold_px       = 8.0;   // Used by snap_threshold_for_zoom()
};

// Positive limits with min <= max. Components given an invalid config fall
// back to the defaults; TimelineConfig::deserialize() keeps the previous
// section instead.
bool is_valid(const EngineConfig& config);
bool is_valid(const SyncConfig& config);
bool is_valid(const PositionConfig& config);
bool is_valid(const DragConfig& config);

// All tunables of the timeline core, persisted as a small versioned JSON file.
//
// Usage:
//   TimelineConfig cfg;
//   cfg.load(TimelineConfig::default_path());   // keeps defaults on failure
//   TimelineEngine engine(&scheduler, {}, cfg.engine);
struct TimelineConfig
{
    EngineConfig   engine;
    SyncConfig     sync;
    PositionConfig position;
    DragConfig     drag;

    std::string serialize() const;

    // Unknown keys are ignored. Missing, malformed or non-finite values keep
    // their current value, and a section that fails is_valid() is dropped
    // whole and logged. Returns false if the text is not a config object.
    bool deserialize(const std::string& json);

    bool save(const std::string& path) const;
    bool load(const std::string& path);

    // $XDG_CONFIG_HOME/cutline/timeline.json, else ~/.config/cutline/timeline.json.
    static std::string default_path();
};

}   // namespace cutline
