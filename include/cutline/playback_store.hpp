#pragma once

#include <cstddef>
#include <cstdint>
#include <cutline/config.hpp>
#include <cutline/fwd.hpp>
#include <cutline/playback_state.hpp>
#include <functional>
#include <vector>

namespace cutline
{

// Delivered to subscribers after every mutation that changed at least one
// field.
struct StoreChange
{
    PlaybackState state;
    PlaybackState previous;
    UpdateOrigin  origin = UpdateOrigin::Untagged;
};

using StoreListener = std::function<void(const StoreChange&)>;

// PlaybackStore: the UI-side mirror of playback state.
//
// Any collaborator (toolbar, keyboard shortcut, preview player) may mutate
// it directly. Values are sanitized on the way in:
//   - non-finite time becomes 0, time is clamped into [0, duration] when
//     duration > 0 and to >= 0 otherwise
//   - negative or non-finite duration becomes 0
//   - non-finite rate is ignored, finite rates are clamped to the rate bounds
//   - step with non-positive or non-finite fps is ignored
//
// Subscribers are notified synchronously. Notifications raised from inside a
// listener are delivered after the current one returns, never nested.
class PlaybackStore
{
   public:
    explicit PlaybackStore(EngineConfig limits = {});

    PlaybackStore(const PlaybackStore&)            = delete;
    PlaybackStore& operator=(const PlaybackStore&) = delete;

    const PlaybackState& state() const { return state_; }
    bool                 is_playing() const { return state_.is_playing; }
    double               current_time() const { return state_.current_time; }
    double               duration() const { return state_.duration; }
    double               playback_rate() const { return state_.playback_rate; }
    bool                 loop() const { return state_.loop; }

    // ─── Play/Pause ──────────────────────────────────────────────────────

    void play(UpdateOrigin origin = UpdateOrigin::Untagged);
    void pause(UpdateOrigin origin = UpdateOrigin::Untagged);
    void toggle_playback(UpdateOrigin origin = UpdateOrigin::Untagged);
    void set_is_playing(bool playing, UpdateOrigin origin = UpdateOrigin::Untagged);

    // ─── Seeking ─────────────────────────────────────────────────────────

    void seek(double time, UpdateOrigin origin = UpdateOrigin::Untagged);
    void seek_forward(double amount, UpdateOrigin origin = UpdateOrigin::Untagged);
    void seek_backward(double amount, UpdateOrigin origin = UpdateOrigin::Untagged);
    void go_to_start(UpdateOrigin origin = UpdateOrigin::Untagged);
    void go_to_end(UpdateOrigin origin = UpdateOrigin::Untagged);
    void step_forward(double fps, UpdateOrigin origin = UpdateOrigin::Untagged);
    void step_backward(double fps, UpdateOrigin origin = UpdateOrigin::Untagged);

    // Regular playback updates; same sanitation as seek().
    void set_current_time(double time, UpdateOrigin origin = UpdateOrigin::Untagged);

    // ─── Properties ──────────────────────────────────────────────────────

    void set_duration(double duration, UpdateOrigin origin = UpdateOrigin::Untagged);
    void set_playback_rate(double rate, UpdateOrigin origin = UpdateOrigin::Untagged);
    void toggle_loop(UpdateOrigin origin = UpdateOrigin::Untagged);
    void set_loop(bool loop, UpdateOrigin origin = UpdateOrigin::Untagged);

    // Back to a default-constructed PlaybackState.
    void reset(UpdateOrigin origin = UpdateOrigin::Untagged);

    // ─── Subscription ────────────────────────────────────────────────────

    SubscriptionId subscribe(StoreListener listener);
    void           unsubscribe(SubscriptionId id);
    size_t         subscriber_count() const { return listeners_.size(); }

    // Number of mutations that changed state (no-op writes are not counted).
    uint64_t write_count() const { return write_count_; }

   private:
    struct Subscription
    {
        SubscriptionId id = 0;
        StoreListener  callback;
    };

    EngineConfig  limits_;
    PlaybackState state_;
    uint64_t      write_count_ = 0;

    std::vector<Subscription> listeners_;
    SubscriptionId            next_id_ = 1;

    std::vector<StoreChange> queue_;
    bool                     notifying_ = false;

    double clamp_time(double time, double duration) const;

    void commit(const PlaybackState& next, UpdateOrigin origin);
    void notify(const StoreChange& change);
};

}   // namespace cutline
