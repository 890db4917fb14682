#include <algorithm>
#include <cmath>
#include <cutline/frame_scheduler.hpp>
#include <cutline/logger.hpp>
#include <cutline/numeric.hpp>
#include <cutline/timeline_engine.hpp>
#include <exception>

namespace cutline
{

namespace
{

// Runs a user-supplied callback; failures are logged and never escape.
template <typename F>
void invoke_guarded(const char* what, F&& fn)
{
    try
    {
        fn();
    }
    catch (const std::exception& e)
    {
        CUTLINE_LOG_ERROR("engine", "{} threw: {}", what, e.what());
    }
    catch (...)
    {
        CUTLINE_LOG_ERROR("engine", "{} threw a non-standard exception", what);
    }
}

}   // namespace

const char* to_string(EngineEvent event)
{
    switch (event)
    {
        case EngineEvent::Play:
            return "play";
        case EngineEvent::Paused:
            return "paused";
        case EngineEvent::Ended:
            return "ended";
        case EngineEvent::TimeUpdate:
            return "timeUpdate";
        case EngineEvent::BeforeSetTime:
            return "beforeSetTime";
        case EngineEvent::AfterSetTime:
            return "afterSetTime";
        case EngineEvent::DurationChange:
            return "durationChange";
        case EngineEvent::PlaybackRateChange:
            return "playbackRateChange";
        case EngineEvent::LoopChange:
            return "loopChange";
    }
    return "unknown";
}

TimelineEngine::TimelineEngine(FrameScheduler* scheduler, EngineOptions options, EngineConfig config)
    : scheduler_(scheduler), config_(config)
{
    if (!is_valid(config_))
    {
        CUTLINE_LOG_WARN("engine", "invalid engine config, using defaults");
        config_ = EngineConfig{};
    }

    if (is_finite(options.duration) && options.duration >= 0.0)
        state_.duration = options.duration;
    else
        CUTLINE_LOG_DEBUG("engine", "ignoring invalid initial duration {}", options.duration);

    if (is_finite(options.playback_rate) && options.playback_rate > 0.0)
        state_.playback_rate = clamp_rate(options.playback_rate);
    else
        CUTLINE_LOG_DEBUG("engine", "ignoring invalid initial playback rate {}", options.playback_rate);

    state_.loop = options.loop;
}

TimelineEngine::~TimelineEngine()
{
    dispose();
}

// ─── Playback ────────────────────────────────────────────────────────────────

void TimelineEngine::play()
{
    if (disposed_ || state_.is_playing)
        return;
    if (state_.duration <= 0.0 || state_.current_time >= state_.duration)
    {
        CUTLINE_LOG_DEBUG("engine",
                          "play ignored at {} of {}",
                          state_.current_time,
                          state_.duration);
        return;
    }

    state_.is_playing = true;
    start_clock();
    emit(EngineEvent::Play);
    push_is_playing();
}

void TimelineEngine::pause()
{
    if (disposed_ || !state_.is_playing)
        return;

    state_.is_playing = false;
    stop_clock();
    emit(EngineEvent::Paused);
    push_is_playing();
}

void TimelineEngine::toggle_playback()
{
    if (state_.is_playing)
        pause();
    else
        play();
}

// ─── Seeking ─────────────────────────────────────────────────────────────────

void TimelineEngine::seek(double time)
{
    if (disposed_)
        return;
    if (!is_finite(time))
    {
        CUTLINE_LOG_DEBUG("engine", "rejecting non-finite seek target {}", time);
        return;
    }

    const double clamped = clamp_time(time);
    emit(EngineEvent::BeforeSetTime, clamped);

    state_.current_time = clamped;
    push_current_time();

    emit(EngineEvent::AfterSetTime, clamped);

    if (state_.is_playing && clamped >= state_.duration)
        pause();
}

void TimelineEngine::seek_forward(double amount)
{
    if (!is_finite(amount))
    {
        CUTLINE_LOG_DEBUG("engine", "rejecting non-finite seek amount {}", amount);
        return;
    }
    seek(state_.current_time + amount);
}

void TimelineEngine::seek_backward(double amount)
{
    if (!is_finite(amount))
    {
        CUTLINE_LOG_DEBUG("engine", "rejecting non-finite seek amount {}", amount);
        return;
    }
    seek(state_.current_time - amount);
}

void TimelineEngine::go_to_start()
{
    seek(0.0);
}

void TimelineEngine::go_to_end()
{
    seek(state_.duration);
}

void TimelineEngine::step_forward(double fps)
{
    seek(state_.current_time + 1.0 / safe_fps(fps));
}

void TimelineEngine::step_backward(double fps)
{
    seek(state_.current_time - 1.0 / safe_fps(fps));
}

// ─── Properties ──────────────────────────────────────────────────────────────

void TimelineEngine::set_duration(double duration)
{
    if (disposed_)
        return;
    if (!is_finite(duration) || duration < 0.0)
    {
        CUTLINE_LOG_DEBUG("engine", "rejecting invalid duration {}", duration);
        return;
    }

    state_.duration = duration;
    push_duration();
    emit(EngineEvent::DurationChange, duration);

    if (state_.current_time > state_.duration)
        seek(state_.duration);
}

void TimelineEngine::set_playback_rate(double rate)
{
    if (disposed_)
        return;
    if (!is_finite(rate) || rate <= 0.0)
    {
        CUTLINE_LOG_DEBUG("engine", "rejecting invalid playback rate {}", rate);
        return;
    }

    const double clamped = clamp_rate(rate);
    if (clamped == state_.playback_rate)
        return;

    state_.playback_rate = clamped;
    emit(EngineEvent::PlaybackRateChange, clamped);
}

void TimelineEngine::set_loop(bool loop)
{
    if (disposed_ || state_.loop == loop)
        return;
    state_.loop = loop;
    emit(EngineEvent::LoopChange, 0.0, loop);
}

void TimelineEngine::toggle_loop()
{
    set_loop(!state_.loop);
}

// ─── Clock ───────────────────────────────────────────────────────────────────

void TimelineEngine::tick(double timestamp_ms)
{
    if (disposed_ || !state_.is_playing)
        return;
    if (!is_finite(timestamp_ms))
    {
        CUTLINE_LOG_DEBUG("engine", "ignoring non-finite frame timestamp");
        return;
    }

    if (!has_last_frame_)
    {
        has_last_frame_     = true;
        last_frame_time_ms_ = timestamp_ms;
        return;
    }

    double dt_ms        = timestamp_ms - last_frame_time_ms_;
    last_frame_time_ms_ = timestamp_ms;
    dt_ms               = std::clamp(dt_ms, 0.0, config_.max_frame_delta_ms);

    double new_time = state_.current_time + dt_ms * state_.playback_rate / 1000.0;

    if (new_time >= state_.duration)
    {
        if (state_.loop)
        {
            new_time = state_.duration > 0.0 ? std::fmod(new_time, state_.duration) : 0.0;
        }
        else
        {
            state_.current_time = state_.duration;
            push_current_time();
            emit(EngineEvent::TimeUpdate, state_.current_time);
            pause();
            emit(EngineEvent::Ended);
            return;
        }
    }

    state_.current_time = new_time;
    push_current_time();
    emit(EngineEvent::TimeUpdate, new_time);
}

void TimelineEngine::start_clock()
{
    has_last_frame_ = false;
    schedule_next_frame();
}

void TimelineEngine::stop_clock()
{
    if (scheduler_ && frame_request_ != 0)
        scheduler_->cancel_frame(frame_request_);
    frame_request_  = 0;
    has_last_frame_ = false;
}

void TimelineEngine::schedule_next_frame()
{
    if (!scheduler_ || frame_request_ != 0)
        return;
    frame_request_ = scheduler_->request_frame([this](double ts) { on_frame(ts); });
}

void TimelineEngine::on_frame(double timestamp_ms)
{
    frame_request_ = 0;
    tick(timestamp_ms);
    if (state_.is_playing && !disposed_)
        schedule_next_frame();
}

// ─── Events & store mirror ───────────────────────────────────────────────────

ListenerId TimelineEngine::on(EngineEvent event, EngineListener listener)
{
    if (disposed_ || !listener)
        return 0;
    ListenerId id = next_listener_id_++;
    listeners_.push_back(ListenerEntry{.id = id, .event = event, .callback = std::move(listener)});
    return id;
}

void TimelineEngine::off(ListenerId id)
{
    std::erase_if(listeners_, [id](const ListenerEntry& l) { return l.id == id; });
}

void TimelineEngine::sync_with_store(StoreCallbacks callbacks)
{
    if (disposed_)
        return;
    store_ = std::move(callbacks);
    push_duration();
}

void TimelineEngine::detach_store()
{
    store_ = StoreCallbacks{};
}

void TimelineEngine::dispose()
{
    if (disposed_)
        return;

    pause();
    stop_clock();

    disposed_ = true;
    listeners_.clear();
    store_ = StoreCallbacks{};

    CUTLINE_LOG_DEBUG("engine", "disposed");
}

void TimelineEngine::emit(EngineEvent event, double value, bool flag)
{
    if (listeners_.empty())
        return;

    // Snapshot so listeners may call on()/off() while we iterate.
    std::vector<ListenerEntry> targets;
    for (const auto& l : listeners_)
    {
        if (l.event == event)
            targets.push_back(l);
    }

    const EngineEventData data{.event = event, .value = value, .flag = flag};
    for (const auto& l : targets)
    {
        if (disposed_)
            break;
        invoke_guarded(to_string(event), [&] { l.callback(data); });
    }
}

void TimelineEngine::push_current_time()
{
    if (store_.set_current_time)
        invoke_guarded("store.set_current_time", [&] { store_.set_current_time(state_.current_time); });
}

void TimelineEngine::push_is_playing()
{
    if (store_.set_is_playing)
        invoke_guarded("store.set_is_playing", [&] { store_.set_is_playing(state_.is_playing); });
}

void TimelineEngine::push_duration()
{
    if (store_.set_duration)
        invoke_guarded("store.set_duration", [&] { store_.set_duration(state_.duration); });
}

// ─── Helpers ─────────────────────────────────────────────────────────────────

double TimelineEngine::clamp_time(double time) const
{
    return std::clamp(time, 0.0, state_.duration);
}

double TimelineEngine::clamp_rate(double rate) const
{
    return std::clamp(rate, config_.min_playback_rate, config_.max_playback_rate);
}

double TimelineEngine::safe_fps(double fps) const
{
    if (is_finite(fps) && fps > 0.0)
        return fps;
    CUTLINE_LOG_DEBUG("engine", "step fps {} invalid, using {}", fps, config_.default_step_fps);
    return config_.default_step_fps > 0.0 ? config_.default_step_fps : 30.0;
}

}   // namespace cutline
