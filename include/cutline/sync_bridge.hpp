#pragma once

#include <cstdint>
#include <cutline/config.hpp>
#include <cutline/fwd.hpp>
#include <cutline/playback_state.hpp>
#include <cutline/playback_store.hpp>
#include <deque>
#include <functional>

namespace cutline
{

// Milliseconds on an arbitrary monotonic timeline.
using SyncClock = std::function<double()>;

// Bookkeeping shared by both directions of the bridge.
struct SyncState
{
    bool   has_pushed          = false;
    double last_engine_push_ms = 0.0;   // Valid only when has_pushed
    double time_epsilon        = 1e-6;
    double rate_epsilon        = 1e-9;
};

struct SyncStats
{
    uint64_t engine_to_store  = 0;   // Store writes performed for the engine
    uint64_t store_to_engine  = 0;   // Fields applied to the engine
    uint64_t skipped_echoes   = 0;   // Notifications recognised as our own writes
    uint64_t dropped_invalid  = 0;   // Non-finite values refused in either direction
};

// SyncBridge keeps a TimelineEngine and a PlaybackStore consistent.
//
// Engine -> store: the engine's mirror callbacks and rate/loop events are
// compared against the store's current values (epsilon for floats) and only
// real differences are written, tagged UpdateOrigin::Engine.
//
// Store -> engine: store notifications are queued and processed one at a
// time in emission order. Engine-tagged notifications are our own echoes and
// are skipped. Untagged notifications that arrive within the grace window
// after the bridge's last push are treated as echoes too. Everything else is
// applied through the engine's public methods (current time, rate, loop,
// then play state), after which the engine's full state (duration included)
// is written back so any refused or clamped value converges.
//
// The engine and store must outlive the bridge. dispose() (also run by the
// destructor) detaches from both immediately.
class SyncBridge
{
   public:
    SyncBridge(TimelineEngine& engine,
               PlaybackStore&  store,
               SyncConfig      config = {},
               SyncClock       clock  = {});
    ~SyncBridge();

    SyncBridge(const SyncBridge&)            = delete;
    SyncBridge& operator=(const SyncBridge&) = delete;

    // One full pass: store -> engine for the tracked fields, then the
    // engine's complete state (duration included) back to the store.
    void reconcile();

    void dispose();
    bool is_disposed() const { return disposed_; }

    const SyncState&  sync_state() const { return sync_; }
    const SyncStats&  stats() const { return stats_; }
    const SyncConfig& config() const { return config_; }

   private:
    TimelineEngine& engine_;
    PlaybackStore&  store_;
    SyncConfig      config_;
    SyncClock       clock_;
    SyncState       sync_;
    SyncStats       stats_;
    bool            disposed_ = false;

    SubscriptionId store_subscription_ = 0;
    ListenerId     rate_listener_      = 0;
    ListenerId     loop_listener_      = 0;

    std::deque<StoreChange> pending_;
    bool                    draining_ = false;

    // Engine -> store
    void push_current_time(double time);
    void push_is_playing(bool playing);
    void push_duration(double duration);
    void push_playback_rate(double rate);
    void push_loop(bool loop);
    void push_engine_state();
    UpdateOrigin write_origin() const;
    void         mark_push();

    // Store -> engine
    void on_store_change(const StoreChange& change);
    void apply(const StoreChange& change);
    void apply_current_time(double time);
    void apply_playback_rate(double rate);
    void apply_loop(bool loop);
    void apply_is_playing(bool playing);
    bool is_echo(UpdateOrigin origin) const;
};

}   // namespace cutline
