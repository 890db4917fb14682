#include <algorithm>
#include <cutline/frame_scheduler.hpp>
#include <cutline/logger.hpp>
#include <exception>
#include <thread>

namespace cutline
{

FrameScheduler::FrameScheduler(float target_fps, Mode mode)
    : target_fps_(target_fps > 0.0f ? target_fps : 60.0f), mode_(mode), epoch_(Clock::now())
{
    reset();
}

void FrameScheduler::set_target_fps(float fps)
{
    if (fps > 0.0f)
    {
        target_fps_ = fps;
    }
}

// ─── Frame requests ──────────────────────────────────────────────────────────

FrameRequestId FrameScheduler::request_frame(FrameCallback cb)
{
    if (!cb)
        return 0;
    FrameRequestId id = next_request_id_++;
    pending_.push_back(Request{.id = id, .callback = std::move(cb)});
    return id;
}

void FrameScheduler::cancel_frame(FrameRequestId id)
{
    if (id == 0)
        return;
    std::erase_if(pending_, [id](const Request& r) { return r.id == id; });
}

size_t FrameScheduler::pending_count() const
{
    return pending_.size();
}

size_t FrameScheduler::dispatch_frame(double timestamp_ms)
{
    frame_.timestamp_ms = timestamp_ms;

    // Only requests that exist now belong to this frame; anything a callback
    // requests is appended after `last_id` and waits for the next dispatch.
    if (pending_.empty())
        return 0;
    const FrameRequestId last_id = pending_.back().id;

    size_t invoked = 0;
    while (!pending_.empty() && pending_.front().id <= last_id)
    {
        Request request = std::move(pending_.front());
        pending_.erase(pending_.begin());

        try
        {
            request.callback(timestamp_ms);
        }
        catch (const std::exception& e)
        {
            CUTLINE_LOG_ERROR("scheduler", "frame callback {} threw: {}", request.id, e.what());
        }
        catch (...)
        {
            CUTLINE_LOG_ERROR("scheduler", "frame callback {} threw a non-standard exception", request.id);
        }
        ++invoked;
    }
    return invoked;
}

// ─── Host loop ───────────────────────────────────────────────────────────────

void FrameScheduler::run_frame()
{
    begin_frame();
    dispatch_frame(now_ms());
    end_frame();
}

double FrameScheduler::now_ms() const
{
    return std::chrono::duration<double, std::milli>(Clock::now() - epoch_).count();
}

void FrameScheduler::begin_frame()
{
    CUTLINE_LOG_TRACE("scheduler", "begin_frame {}", frame_.number);
    frame_start_ = Clock::now();

    if (first_frame_)
    {
        first_frame_       = false;
        start_time_        = frame_start_;
        last_frame_start_  = frame_start_;
        frame_.dt          = 0.0f;
        frame_.elapsed_sec = 0.0f;
        frame_.number      = 0;
        return;
    }

    Duration elapsed_since_start = frame_start_ - start_time_;
    Duration dt_duration         = frame_start_ - last_frame_start_;
    last_frame_start_            = frame_start_;

    float raw_dt = static_cast<float>(dt_duration.count());

    // Clamp dt so a suspended host does not produce one giant step
    raw_dt = std::min(raw_dt, MAX_FRAME_DT_SEC);

    frame_.dt          = raw_dt;
    frame_.elapsed_sec = static_cast<float>(elapsed_since_start.count());
    frame_.number++;

    update_stats(raw_dt * 1000.0f);
}

void FrameScheduler::end_frame()
{
    if (mode_ != Mode::TargetFPS || target_fps_ <= 0.0f)
        return;

    Duration target_frame_time{1.0 / static_cast<double>(target_fps_)};
    Duration frame_duration = Clock::now() - frame_start_;

    // Yield the remainder of the slot; no spin-wait.
    if (frame_duration < target_frame_time)
    {
        std::this_thread::sleep_for(
            std::chrono::duration_cast<std::chrono::microseconds>(target_frame_time - frame_duration));
    }
}

void FrameScheduler::reset()
{
    first_frame_       = true;
    frame_             = Frame{};
    stats_             = FrameStats{};
    last_dt_ms_        = 0.0f;
    max_dt_in_window_  = 0.0f;
    dt_sum_in_window_  = 0.0;
    hitches_in_window_ = 0;
    window_counter_    = 0;
}

void FrameScheduler::update_stats(float dt_ms)
{
    last_dt_ms_ = dt_ms;
    if (dt_ms > max_dt_in_window_)
        max_dt_in_window_ = dt_ms;
    dt_sum_in_window_ += dt_ms;
    window_counter_++;

    float target_ms = (target_fps_ > 0.0f) ? (1000.0f / target_fps_) : 16.667f;
    if (dt_ms > target_ms * 2.0f)
    {
        hitches_in_window_++;
        CUTLINE_LOG_DEBUG("scheduler",
                          "frame {} hitch: {}ms (target: {}ms)",
                          frame_.number,
                          dt_ms,
                          target_ms);
    }

    if (window_counter_ >= STATS_WINDOW_FRAMES)
    {
        stats_.max_frame_time_ms  = max_dt_in_window_;
        stats_.avg_frame_time_ms  = static_cast<float>(dt_sum_in_window_ / window_counter_);
        stats_.hitch_count        = hitches_in_window_;
        stats_.window_frame_count = window_counter_;

        if (hitches_in_window_ > 0)
        {
            CUTLINE_LOG_INFO("scheduler",
                             "stats ({} frames): avg={}ms max={}ms hitches={}",
                             STATS_WINDOW_FRAMES,
                             stats_.avg_frame_time_ms,
                             stats_.max_frame_time_ms,
                             hitches_in_window_);
        }

        max_dt_in_window_  = 0.0f;
        dt_sum_in_window_  = 0.0;
        hitches_in_window_ = 0;
        window_counter_    = 0;
    }
}

}   // namespace cutline
