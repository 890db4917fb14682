#pragma once

namespace cutline
{

// Authoritative playback values. Owned by a TimelineEngine; the same shape is
// mirrored by PlaybackStore.
//
// Invariants (engine side): 0 <= current_time <= duration, playback_rate > 0
// and finite.
struct PlaybackState
{
    double current_time  = 0.0;
    double duration      = 0.0;
    bool   is_playing    = false;
    double playback_rate = 1.0;
    bool   loop          = false;
};

// Who produced a store mutation. The bridge uses this tag to tell its own
// echoes apart from user edits without relying on timing.
enum class UpdateOrigin
{
    Untagged,   // Unknown source; falls back to the grace-window heuristic
    External,   // UI, keyboard shortcut, other collaborator
    Engine,     // Written by SyncBridge on behalf of the engine
};

const char* to_string(UpdateOrigin origin);

}   // namespace cutline
