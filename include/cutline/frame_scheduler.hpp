#pragma once

#include <chrono>
#include <cstdint>
#include <cutline/frame.hpp>
#include <cutline/fwd.hpp>
#include <functional>
#include <vector>

namespace cutline
{

using FrameCallback = std::function<void(double timestamp_ms)>;

// Host animation-frame source. Components that need per-frame work (the
// playback clock) register one-shot callbacks with request_frame(), the same
// contract as a browser's requestAnimationFrame. The host drives the loop
// either with run_frame() (real clock, paced to the target fps) or with
// dispatch_frame(timestamp) when it owns the timestamps (tests, offline
// rendering).
//
// Single-threaded: all calls must come from the host's frame thread.
class FrameScheduler
{
   public:
    enum class Mode
    {
        TargetFPS,   // Sleep until the next frame slot
        VSync,       // Host presentation already paces frames
        Uncapped,    // Run as fast as possible
    };

    explicit FrameScheduler(float target_fps = 60.0f, Mode mode = Mode::TargetFPS);

    FrameScheduler(const FrameScheduler&)            = delete;
    FrameScheduler& operator=(const FrameScheduler&) = delete;

    void  set_target_fps(float fps);
    float target_fps() const { return target_fps_; }

    void set_mode(Mode mode) { mode_ = mode; }
    Mode mode() const { return mode_; }

    // ─── Frame requests ──────────────────────────────────────────────────

    // Callback runs once, on the next dispatched frame.
    FrameRequestId request_frame(FrameCallback cb);

    // Unknown or already-dispatched ids are ignored.
    void cancel_frame(FrameRequestId id);

    size_t pending_count() const;
    bool   has_pending() const { return pending_count() > 0; }

    // Runs every callback that was pending when the call began, in request
    // order. Callbacks requested during dispatch wait for the next frame.
    // Returns the number of callbacks invoked.
    size_t dispatch_frame(double timestamp_ms);

    // ─── Host loop ───────────────────────────────────────────────────────

    // begin_frame() + dispatch_frame(now) + end_frame().
    void run_frame();

    void begin_frame();
    void end_frame();

    // Reset timing (e.g., after the host was suspended)
    void reset();

    // Milliseconds on the scheduler's monotonic clock.
    double now_ms() const;

    const Frame& current_frame() const { return frame_; }
    float        elapsed_seconds() const { return frame_.elapsed_sec; }
    float        dt() const { return frame_.dt; }
    uint64_t     frame_number() const { return frame_.number; }

    // Hitch detection stats (rolling window)
    struct FrameStats
    {
        float    max_frame_time_ms  = 0.0f;
        float    avg_frame_time_ms  = 0.0f;
        uint32_t hitch_count        = 0;   // frames > 2x target in window
        uint64_t window_frame_count = 0;
    };
    FrameStats frame_stats() const { return stats_; }
    float      last_dt_ms() const { return last_dt_ms_; }

   private:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::duration<double>;

    struct Request
    {
        FrameRequestId id = 0;
        FrameCallback  callback;
    };

    float target_fps_ = 60.0f;
    Mode  mode_       = Mode::TargetFPS;

    std::vector<Request> pending_;
    FrameRequestId       next_request_id_ = 1;

    // Timing
    TimePoint epoch_;
    TimePoint start_time_;
    TimePoint frame_start_;
    TimePoint last_frame_start_;
    bool      first_frame_ = true;

    Frame frame_;

    static constexpr size_t STATS_WINDOW_FRAMES = 600;   // ~10s at 60fps
    static constexpr float  MAX_FRAME_DT_SEC    = 0.25f;
    FrameStats              stats_;
    float                   last_dt_ms_        = 0.0f;
    float                   max_dt_in_window_  = 0.0f;
    double                  dt_sum_in_window_  = 0.0;
    uint32_t                hitches_in_window_ = 0;
    uint64_t                window_counter_    = 0;

    void update_stats(float dt_ms);
};

}   // namespace cutline
