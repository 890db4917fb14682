#include <chrono>
#include <cutline/logger.hpp>
#include <cutline/numeric.hpp>
#include <cutline/playback_store.hpp>
#include <cutline/sync_bridge.hpp>
#include <cutline/timeline_engine.hpp>

namespace cutline
{

namespace
{

double steady_now_ms()
{
    using namespace std::chrono;
    return duration<double, std::milli>(steady_clock::now().time_since_epoch()).count();
}

}   // namespace

SyncBridge::SyncBridge(TimelineEngine& engine,
                       PlaybackStore&  store,
                       SyncConfig      config,
                       SyncClock       clock)
    : engine_(engine), store_(store), config_(config), clock_(std::move(clock))
{
    if (!clock_)
        clock_ = steady_now_ms;
    if (!is_valid(config_))
    {
        CUTLINE_LOG_WARN("sync", "invalid sync config, using defaults");
        config_ = SyncConfig{};
    }

    sync_.time_epsilon = config_.time_epsilon;
    sync_.rate_epsilon = config_.rate_epsilon;

    if (engine_.is_disposed())
    {
        CUTLINE_LOG_WARN("sync", "bridge created for a disposed engine; staying detached");
        disposed_ = true;
        return;
    }

    // The engine is authoritative: bring the store in line before listening.
    push_engine_state();

    engine_.sync_with_store(StoreCallbacks{
        .set_current_time = [this](double t) { push_current_time(t); },
        .set_is_playing   = [this](bool p) { push_is_playing(p); },
        .set_duration     = [this](double d) { push_duration(d); },
    });

    rate_listener_ = engine_.on(EngineEvent::PlaybackRateChange,
                                [this](const EngineEventData& e) { push_playback_rate(e.value); });
    loop_listener_ = engine_.on(EngineEvent::LoopChange,
                                [this](const EngineEventData& e) { push_loop(e.flag); });

    store_subscription_ = store_.subscribe([this](const StoreChange& c) { on_store_change(c); });

    CUTLINE_LOG_DEBUG("sync", "bridge attached (origin tagging {})", config_.origin_tagging);
}

SyncBridge::~SyncBridge()
{
    dispose();
}

void SyncBridge::dispose()
{
    if (disposed_)
        return;
    disposed_ = true;

    store_.unsubscribe(store_subscription_);
    engine_.off(rate_listener_);
    engine_.off(loop_listener_);
    engine_.detach_store();
    pending_.clear();

    store_subscription_ = 0;
    rate_listener_      = 0;
    loop_listener_      = 0;

    CUTLINE_LOG_DEBUG("sync",
                      "bridge disposed ({} pushes, {} applied, {} echoes skipped)",
                      stats_.engine_to_store,
                      stats_.store_to_engine,
                      stats_.skipped_echoes);
}

void SyncBridge::reconcile()
{
    if (disposed_)
        return;

    const PlaybackState& s = store_.state();
    apply_current_time(s.current_time);
    apply_playback_rate(s.playback_rate);
    apply_loop(s.loop);
    apply_is_playing(s.is_playing);

    push_engine_state();
}

// ─── Engine -> store ─────────────────────────────────────────────────────────

UpdateOrigin SyncBridge::write_origin() const
{
    return config_.origin_tagging ? UpdateOrigin::Engine : UpdateOrigin::Untagged;
}

void SyncBridge::mark_push()
{
    sync_.has_pushed          = true;
    sync_.last_engine_push_ms = clock_();
    ++stats_.engine_to_store;
}

void SyncBridge::push_current_time(double time)
{
    if (disposed_)
        return;
    if (!is_finite(time))
    {
        ++stats_.dropped_invalid;
        CUTLINE_LOG_DEBUG("sync", "dropping non-finite engine time");
        return;
    }
    if (nearly_equal(store_.current_time(), time, sync_.time_epsilon))
        return;

    mark_push();
    store_.set_current_time(time, write_origin());
}

void SyncBridge::push_is_playing(bool playing)
{
    if (disposed_ || store_.is_playing() == playing)
        return;

    mark_push();
    store_.set_is_playing(playing, write_origin());
}

void SyncBridge::push_duration(double duration)
{
    if (disposed_)
        return;
    if (!is_finite(duration))
    {
        ++stats_.dropped_invalid;
        CUTLINE_LOG_DEBUG("sync", "dropping non-finite engine duration");
        return;
    }
    if (nearly_equal(store_.duration(), duration, sync_.time_epsilon))
        return;

    mark_push();
    store_.set_duration(duration, write_origin());
}

void SyncBridge::push_playback_rate(double rate)
{
    if (disposed_)
        return;
    if (!is_finite(rate))
    {
        ++stats_.dropped_invalid;
        CUTLINE_LOG_DEBUG("sync", "dropping non-finite engine rate");
        return;
    }
    if (nearly_equal(store_.playback_rate(), rate, sync_.rate_epsilon))
        return;

    mark_push();
    store_.set_playback_rate(rate, write_origin());
}

void SyncBridge::push_loop(bool loop)
{
    if (disposed_ || store_.loop() == loop)
        return;

    mark_push();
    store_.set_loop(loop, write_origin());
}

void SyncBridge::push_engine_state()
{
    // Duration first so the store does not clamp the time against a stale
    // duration.
    push_duration(engine_.duration());
    push_current_time(engine_.current_time());
    push_playback_rate(engine_.playback_rate());
    push_loop(engine_.loop());
    push_is_playing(engine_.is_playing());
}

// ─── Store -> engine ─────────────────────────────────────────────────────────

bool SyncBridge::is_echo(UpdateOrigin origin) const
{
    const UpdateOrigin effective = config_.origin_tagging ? origin : UpdateOrigin::Untagged;

    switch (effective)
    {
        case UpdateOrigin::Engine:
            return true;
        case UpdateOrigin::External:
            return false;
        case UpdateOrigin::Untagged:
            break;
    }

    if (!sync_.has_pushed)
        return false;
    return clock_() - sync_.last_engine_push_ms < config_.grace_window_ms;
}

void SyncBridge::on_store_change(const StoreChange& change)
{
    if (disposed_)
        return;

    pending_.push_back(change);
    if (draining_)
        return;

    draining_ = true;
    while (!pending_.empty() && !disposed_)
    {
        StoreChange next = pending_.front();
        pending_.pop_front();
        apply(next);
    }
    draining_ = false;
}

void SyncBridge::apply(const StoreChange& change)
{
    if (is_echo(change.origin))
    {
        ++stats_.skipped_echoes;
        CUTLINE_LOG_TRACE("sync", "skipping {} notification", to_string(change.origin));

        // A genuine edit that hit the grace window is overridden rather than
        // left diverged.
        if (change.origin != UpdateOrigin::Engine || !config_.origin_tagging)
            push_engine_state();
        return;
    }

    const PlaybackState& now  = change.state;
    const PlaybackState& prev = change.previous;

    if (now.current_time != prev.current_time)
        apply_current_time(now.current_time);
    if (now.playback_rate != prev.playback_rate)
        apply_playback_rate(now.playback_rate);
    if (now.loop != prev.loop)
        apply_loop(now.loop);
    if (now.is_playing != prev.is_playing)
        apply_is_playing(now.is_playing);

    // Duration is engine-owned: an external reset or set_duration is
    // overwritten like any other refused value.
    if (!disposed_)
        push_engine_state();
}

void SyncBridge::apply_current_time(double time)
{
    if (!is_finite(time))
    {
        ++stats_.dropped_invalid;
        CUTLINE_LOG_DEBUG("sync", "dropping non-finite store time");
        return;
    }
    if (nearly_equal(engine_.current_time(), time, sync_.time_epsilon))
        return;

    ++stats_.store_to_engine;
    engine_.seek(time);
}

void SyncBridge::apply_playback_rate(double rate)
{
    if (!is_finite(rate))
    {
        ++stats_.dropped_invalid;
        CUTLINE_LOG_DEBUG("sync", "dropping non-finite store rate");
        return;
    }
    if (nearly_equal(engine_.playback_rate(), rate, sync_.rate_epsilon))
        return;

    ++stats_.store_to_engine;
    engine_.set_playback_rate(rate);
}

void SyncBridge::apply_loop(bool loop)
{
    if (engine_.loop() == loop)
        return;

    ++stats_.store_to_engine;
    engine_.set_loop(loop);
}

void SyncBridge::apply_is_playing(bool playing)
{
    if (engine_.is_playing() == playing)
        return;

    ++stats_.store_to_engine;
    if (playing)
        engine_.play();
    else
        engine_.pause();
}

}   // namespace cutline
