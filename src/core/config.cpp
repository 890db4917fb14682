#include <cstdlib>
#include <cutline/config.hpp>
#include <cutline/logger.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "core/json_util.hpp"

namespace cutline
{

namespace
{

constexpr int CONFIG_VERSION = 1;

void read_into(const std::string& section, std::string_view key, double& field)
{
    if (auto v = json::read_number(section, key))
        field = *v;
}

void read_into(const std::string& section, std::string_view key, bool& field)
{
    if (auto v = json::read_bool(section, key))
        field = *v;
}

}   // namespace

// ─── Validation ──────────────────────────────────────────────────────────────

bool is_valid(const EngineConfig& c)
{
    return c.max_frame_delta_ms > 0.0 && c.min_playback_rate > 0.0
           && c.min_playback_rate <= c.max_playback_rate && c.default_step_fps > 0.0;
}

bool is_valid(const SyncConfig& c)
{
    return c.time_epsilon >= 0.0 && c.rate_epsilon >= 0.0 && c.grace_window_ms >= 0.0;
}

bool is_valid(const PositionConfig& c)
{
    return c.zoom_min > 0.0 && c.zoom_min <= c.zoom_max && c.default_zoom > 0.0 && c.max_pixels > 0.0
           && c.min_clip_width_px >= 0.0;
}

bool is_valid(const DragConfig& c)
{
    return c.activation_threshold_px >= 0.0 && c.min_clip_duration >= 0.0 && c.snap_threshold_px >= 0.0;
}

// ─── JSON serialization ──────────────────────────────────────────────────────

std::string TimelineConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << CONFIG_VERSION << ",\n";

    os << "  \"engine\": {\n";
    os << "    \"max_frame_delta_ms\": " << json::number(engine.max_frame_delta_ms) << ",\n";
    os << "    \"min_playback_rate\": " << json::number(engine.min_playback_rate) << ",\n";
    os << "    \"max_playback_rate\": " << json::number(engine.max_playback_rate) << ",\n";
    os << "    \"default_step_fps\": " << json::number(engine.default_step_fps) << "\n";
    os << "  },\n";

    os << "  \"sync\": {\n";
    os << "    \"time_epsilon\": " << json::number(sync.time_epsilon) << ",\n";
    os << "    \"rate_epsilon\": " << json::number(sync.rate_epsilon) << ",\n";
    os << "    \"grace_window_ms\": " << json::number(sync.grace_window_ms) << ",\n";
    os << "    \"origin_tagging\": " << (sync.origin_tagging ? "true" : "false") << "\n";
    os << "  },\n";

    os << "  \"position\": {\n";
    os << "    \"zoom_min\": " << json::number(position.zoom_min) << ",\n";
    os << "    \"zoom_max\": " << json::number(position.zoom_max) << ",\n";
    os << "    \"default_zoom\": " << json::number(position.default_zoom) << ",\n";
    os << "    \"max_pixels\": " << json::number(position.max_pixels) << ",\n";
    os << "    \"min_clip_width_px\": " << json::number(position.min_clip_width_px) << "\n";
    os << "  },\n";

    os << "  \"drag\": {\n";
    os << "    \"activation_threshold_px\": " << json::number(drag.activation_threshold_px) << ",\n";
    os << "    \"min_clip_duration\": " << json::number(drag.min_clip_duration) << ",\n";
    os << "    \"snap_threshold_px\": " << json::number(drag.snap_threshold_px) << "\n";
    os << "  }\n";

    os << "}\n";
    return os.str();
}

bool TimelineConfig::deserialize(const std::string& text)
{
    auto first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos || text[first] != '{')
    {
        CUTLINE_LOG_ERROR("config", "timeline config is not a JSON object");
        return false;
    }

    if (auto version = json::read_number(text, "version"); version && *version > CONFIG_VERSION)
    {
        CUTLINE_LOG_WARN("config",
                         "timeline config version {} is newer than supported {}; reading known keys",
                         static_cast<int>(*version),
                         CONFIG_VERSION);
    }

    if (auto s = json::read_object(text, "engine"))
    {
        EngineConfig next = engine;
        read_into(*s, "max_frame_delta_ms", next.max_frame_delta_ms);
        read_into(*s, "min_playback_rate", next.min_playback_rate);
        read_into(*s, "max_playback_rate", next.max_playback_rate);
        read_into(*s, "default_step_fps", next.default_step_fps);
        if (is_valid(next))
            engine = next;
        else
            CUTLINE_LOG_ERROR("config", "invalid engine section ignored (rate bounds {}..{})",
                              next.min_playback_rate, next.max_playback_rate);
    }
    if (auto s = json::read_object(text, "sync"))
    {
        SyncConfig next = sync;
        read_into(*s, "time_epsilon", next.time_epsilon);
        read_into(*s, "rate_epsilon", next.rate_epsilon);
        read_into(*s, "grace_window_ms", next.grace_window_ms);
        read_into(*s, "origin_tagging", next.origin_tagging);
        if (is_valid(next))
            sync = next;
        else
            CUTLINE_LOG_ERROR("config", "invalid sync section ignored");
    }
    if (auto s = json::read_object(text, "position"))
    {
        PositionConfig next = position;
        read_into(*s, "zoom_min", next.zoom_min);
        read_into(*s, "zoom_max", next.zoom_max);
        read_into(*s, "default_zoom", next.default_zoom);
        read_into(*s, "max_pixels", next.max_pixels);
        read_into(*s, "min_clip_width_px", next.min_clip_width_px);
        if (is_valid(next))
            position = next;
        else
            CUTLINE_LOG_ERROR("config", "invalid position section ignored (zoom bounds {}..{})",
                              next.zoom_min, next.zoom_max);
    }
    if (auto s = json::read_object(text, "drag"))
    {
        DragConfig next = drag;
        read_into(*s, "activation_threshold_px", next.activation_threshold_px);
        read_into(*s, "min_clip_duration", next.min_clip_duration);
        read_into(*s, "snap_threshold_px", next.snap_threshold_px);
        if (is_valid(next))
            drag = next;
        else
            CUTLINE_LOG_ERROR("config", "invalid drag section ignored");
    }
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool TimelineConfig::save(const std::string& path) const
{
    std::error_code ec;
    auto            parent = std::filesystem::path(path).parent_path();
    if (!parent.empty())
        std::filesystem::create_directories(parent, ec);

    std::ofstream file(path);
    if (!file.is_open())
    {
        CUTLINE_LOG_ERROR("config", "cannot write timeline config '{}'", path);
        return false;
    }
    file << serialize();
    return file.good();
}

bool TimelineConfig::load(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        CUTLINE_LOG_DEBUG("config", "no timeline config at '{}', using defaults", path);
        return false;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return deserialize(ss.str());
}

std::string TimelineConfig::default_path()
{
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return (std::filesystem::path(xdg) / "cutline" / "timeline.json").string();
    if (const char* home = std::getenv("HOME"); home && *home)
        return (std::filesystem::path(home) / ".config" / "cutline" / "timeline.json").string();
    return "timeline.json";
}

}   // namespace cutline
