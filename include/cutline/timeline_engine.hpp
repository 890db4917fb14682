#pragma once

#include <cstdint>
#include <cutline/config.hpp>
#include <cutline/fwd.hpp>
#include <cutline/playback_state.hpp>
#include <functional>
#include <vector>

namespace cutline
{

enum class EngineEvent
{
    Play,
    Paused,
    Ended,
    TimeUpdate,           // value = new current time
    BeforeSetTime,        // value = clamped seek target
    AfterSetTime,         // value = new current time
    DurationChange,       // value = new duration
    PlaybackRateChange,   // value = new rate
    LoopChange,           // flag = new loop state
};

const char* to_string(EngineEvent event);

struct EngineEventData
{
    EngineEvent event;
    double      value = 0.0;
    bool        flag  = false;
};

using EngineListener = std::function<void(const EngineEventData&)>;

// External mirrors invoked on every internal state change. Any member may
// be empty.
struct StoreCallbacks
{
    std::function<void(double)> set_current_time;
    std::function<void(bool)>   set_is_playing;
    std::function<void(double)> set_duration;
};

struct EngineOptions
{
    double duration      = 0.0;
    double playback_rate = 1.0;
    bool   loop          = false;
};

// TimelineEngine: authoritative playback clock.
//
// Owns PlaybackState exclusively. While playing it requests one frame at a
// time from the host FrameScheduler and advances current_time by the
// (clamped) wall-clock delta scaled by the playback rate. Hosts without a
// scheduler may call tick() themselves.
//
// Invalid numeric input (NaN, infinity, non-positive rate, negative
// duration) is rejected and the previous value kept. Out-of-range seeks are
// clamped. Listener and store callback exceptions are caught and logged.
// After dispose() every mutator is a no-op.
//
// Not thread-safe: call from the host's frame thread only.
class TimelineEngine
{
   public:
    explicit TimelineEngine(FrameScheduler* scheduler = nullptr,
                            EngineOptions   options   = {},
                            EngineConfig    config    = {});
    ~TimelineEngine();

    TimelineEngine(const TimelineEngine&)            = delete;
    TimelineEngine& operator=(const TimelineEngine&) = delete;

    // ─── Playback ────────────────────────────────────────────────────────

    // No-op when already playing, disposed, duration <= 0, or the playhead
    // already sits at the end.
    void play();
    void pause();
    void toggle_playback();

    // ─── Seeking ─────────────────────────────────────────────────────────

    // Clamped to [0, duration]; non-finite input is ignored.
    void seek(double time);
    void seek_forward(double amount);
    void seek_backward(double amount);
    void go_to_start();
    void go_to_end();

    // One frame at `fps`; non-positive or non-finite fps uses
    // EngineConfig::default_step_fps.
    void step_forward(double fps);
    void step_backward(double fps);

    // ─── Properties ──────────────────────────────────────────────────────

    // Rejects negative or non-finite values. Pulls current_time down if it
    // now exceeds the new duration.
    void set_duration(double duration);

    // Rejects non-finite or <= 0; valid values are clamped to
    // [min_playback_rate, max_playback_rate].
    void set_playback_rate(double rate);

    void set_loop(bool loop);
    void toggle_loop();

    bool   is_playing() const { return state_.is_playing; }
    double current_time() const { return state_.current_time; }
    double duration() const { return state_.duration; }
    double playback_rate() const { return state_.playback_rate; }
    bool   loop() const { return state_.loop; }
    bool   is_disposed() const { return disposed_; }

    const PlaybackState& state() const { return state_; }
    const EngineConfig&  config() const { return config_; }

    // ─── Clock ───────────────────────────────────────────────────────────

    // Advance by the time elapsed since the previous tick. The first tick
    // after play() only records the baseline timestamp.
    void tick(double timestamp_ms);

    // ─── Events & store mirror ───────────────────────────────────────────

    ListenerId on(EngineEvent event, EngineListener listener);
    void       off(ListenerId id);
    size_t     listener_count() const { return listeners_.size(); }

    // Replaces any previous mirror and immediately pushes the duration.
    void sync_with_store(StoreCallbacks callbacks);
    void detach_store();

    // Stops the clock and drops all listeners and mirrors. Idempotent.
    void dispose();

   private:
    struct ListenerEntry
    {
        ListenerId     id = 0;
        EngineEvent    event;
        EngineListener callback;
    };

    FrameScheduler* scheduler_ = nullptr;   // not owned
    EngineConfig    config_;
    PlaybackState   state_;
    bool            disposed_ = false;

    FrameRequestId frame_request_      = 0;
    bool           has_last_frame_     = false;
    double         last_frame_time_ms_ = 0.0;

    std::vector<ListenerEntry> listeners_;
    ListenerId                 next_listener_id_ = 1;
    StoreCallbacks             store_;

    double clamp_time(double time) const;
    double clamp_rate(double rate) const;
    double safe_fps(double fps) const;

    void start_clock();
    void stop_clock();
    void schedule_next_frame();
    void on_frame(double timestamp_ms);

    void emit(EngineEvent event, double value = 0.0, bool flag = false);
    void push_current_time();
    void push_is_playing();
    void push_duration();
};

}   // namespace cutline
