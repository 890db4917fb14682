#include <algorithm>
#include <cutline/logger.hpp>
#include <cutline/numeric.hpp>
#include <cutline/playback_store.hpp>
#include <exception>

namespace cutline
{

const char* to_string(UpdateOrigin origin)
{
    switch (origin)
    {
        case UpdateOrigin::Untagged:
            return "untagged";
        case UpdateOrigin::External:
            return "external";
        case UpdateOrigin::Engine:
            return "engine";
    }
    return "unknown";
}

namespace
{

double safe_duration(double duration)
{
    if (!is_finite(duration) || duration < 0.0)
        return 0.0;
    return duration;
}

double safe_delta(double delta)
{
    return is_finite(delta) ? delta : 0.0;
}

bool same_state(const PlaybackState& a, const PlaybackState& b)
{
    return a.current_time == b.current_time && a.duration == b.duration
           && a.is_playing == b.is_playing && a.playback_rate == b.playback_rate
           && a.loop == b.loop;
}

}   // namespace

PlaybackStore::PlaybackStore(EngineConfig limits) : limits_(limits)
{
    if (!is_valid(limits_))
    {
        CUTLINE_LOG_WARN("store", "invalid rate limits, using defaults");
        limits_ = EngineConfig{};
    }
}

// ─── Play/Pause ──────────────────────────────────────────────────────────────

void PlaybackStore::play(UpdateOrigin origin)
{
    set_is_playing(true, origin);
}

void PlaybackStore::pause(UpdateOrigin origin)
{
    set_is_playing(false, origin);
}

void PlaybackStore::toggle_playback(UpdateOrigin origin)
{
    set_is_playing(!state_.is_playing, origin);
}

void PlaybackStore::set_is_playing(bool playing, UpdateOrigin origin)
{
    PlaybackState next = state_;
    next.is_playing    = playing;
    commit(next, origin);
}

// ─── Seeking ─────────────────────────────────────────────────────────────────

void PlaybackStore::seek(double time, UpdateOrigin origin)
{
    set_current_time(time, origin);
}

void PlaybackStore::seek_forward(double amount, UpdateOrigin origin)
{
    set_current_time(state_.current_time + safe_delta(amount), origin);
}

void PlaybackStore::seek_backward(double amount, UpdateOrigin origin)
{
    set_current_time(state_.current_time - safe_delta(amount), origin);
}

void PlaybackStore::go_to_start(UpdateOrigin origin)
{
    set_current_time(0.0, origin);
}

void PlaybackStore::go_to_end(UpdateOrigin origin)
{
    set_current_time(state_.duration, origin);
}

void PlaybackStore::step_forward(double fps, UpdateOrigin origin)
{
    if (!is_finite(fps) || fps <= 0.0)
    {
        CUTLINE_LOG_DEBUG("store", "ignoring step with fps {}", fps);
        return;
    }
    set_current_time(state_.current_time + 1.0 / fps, origin);
}

void PlaybackStore::step_backward(double fps, UpdateOrigin origin)
{
    if (!is_finite(fps) || fps <= 0.0)
    {
        CUTLINE_LOG_DEBUG("store", "ignoring step with fps {}", fps);
        return;
    }
    set_current_time(state_.current_time - 1.0 / fps, origin);
}

void PlaybackStore::set_current_time(double time, UpdateOrigin origin)
{
    PlaybackState next = state_;
    next.current_time  = clamp_time(time, state_.duration);
    commit(next, origin);
}

// ─── Properties ──────────────────────────────────────────────────────────────

void PlaybackStore::set_duration(double duration, UpdateOrigin origin)
{
    PlaybackState next = state_;
    next.duration      = safe_duration(duration);
    next.current_time  = clamp_time(state_.current_time, next.duration);
    commit(next, origin);
}

void PlaybackStore::set_playback_rate(double rate, UpdateOrigin origin)
{
    if (!is_finite(rate))
    {
        CUTLINE_LOG_DEBUG("store", "ignoring non-finite playback rate");
        return;
    }
    PlaybackState next = state_;
    next.playback_rate = std::clamp(rate, limits_.min_playback_rate, limits_.max_playback_rate);
    commit(next, origin);
}

void PlaybackStore::toggle_loop(UpdateOrigin origin)
{
    set_loop(!state_.loop, origin);
}

void PlaybackStore::set_loop(bool loop, UpdateOrigin origin)
{
    PlaybackState next = state_;
    next.loop          = loop;
    commit(next, origin);
}

void PlaybackStore::reset(UpdateOrigin origin)
{
    commit(PlaybackState{}, origin);
}

// ─── Subscription ────────────────────────────────────────────────────────────

SubscriptionId PlaybackStore::subscribe(StoreListener listener)
{
    if (!listener)
        return 0;
    SubscriptionId id = next_id_++;
    listeners_.push_back(Subscription{.id = id, .callback = std::move(listener)});
    return id;
}

void PlaybackStore::unsubscribe(SubscriptionId id)
{
    std::erase_if(listeners_, [id](const Subscription& s) { return s.id == id; });
}

// ─── Internals ───────────────────────────────────────────────────────────────

double PlaybackStore::clamp_time(double time, double duration) const
{
    if (!is_finite(time))
        return 0.0;
    const double d = safe_duration(duration);
    if (d <= 0.0)
        return std::max(0.0, time);
    return std::clamp(time, 0.0, d);
}

void PlaybackStore::commit(const PlaybackState& next, UpdateOrigin origin)
{
    if (same_state(state_, next))
        return;

    StoreChange change{.state = next, .previous = state_, .origin = origin};
    state_ = next;
    ++write_count_;

    CUTLINE_LOG_TRACE("store",
                      "write #{} from {}: t={} playing={}",
                      write_count_,
                      to_string(origin),
                      state_.current_time,
                      state_.is_playing);

    if (notifying_)
    {
        queue_.push_back(change);
        return;
    }
    notify(change);
}

void PlaybackStore::notify(const StoreChange& change)
{
    struct NotifyScope
    {
        PlaybackStore& store;
        ~NotifyScope()
        {
            store.queue_.clear();
            store.notifying_ = false;
        }
    } scope{*this};

    notifying_ = true;
    queue_.push_back(change);

    size_t index = 0;
    while (index < queue_.size())
    {
        const StoreChange current = queue_[index++];

        // Snapshot: listeners may unsubscribe (or subscribe) while notified.
        std::vector<Subscription> targets = listeners_;
        for (const auto& sub : targets)
        {
            const bool still_subscribed =
                std::any_of(listeners_.begin(),
                            listeners_.end(),
                            [&](const Subscription& s) { return s.id == sub.id; });
            if (!still_subscribed)
                continue;

            try
            {
                sub.callback(current);
            }
            catch (const std::exception& e)
            {
                CUTLINE_LOG_ERROR("store", "subscriber {} threw: {}", sub.id, e.what());
            }
            catch (...)
            {
                CUTLINE_LOG_ERROR("store", "subscriber {} threw a non-standard exception", sub.id);
            }
        }
    }
}

}   // namespace cutline
