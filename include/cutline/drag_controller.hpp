#pragma once

#include <cutline/clip.hpp>
#include <cutline/config.hpp>
#include <cutline/snap_resolver.hpp>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace cutline
{

enum class DragType
{
    Move,
    TrimLeft,
    TrimRight,
};

const char* to_string(DragType type);

// The clip a gesture starts on, as it is committed right now.
struct DragTarget
{
    std::string   clip_id;
    ClipPlacement placement;
    SourceRange   range;
    double        speed = 1.0;   // <= 0 or non-finite is treated as 1
};

// Per-frame inputs supplied by the timeline view.
struct DragConstraints
{
    double zoom                = 100.0;   // px per second
    double max_source_duration = std::numeric_limits<double>::infinity();
    double grid_interval       = 0.0;   // seconds; <= 0 disables grid rounding
    double snap_threshold      = 0.0;   // seconds; <= 0 disables snapping
    std::vector<SnapPoint> snap_points;
};

// Reported to every callback of one gesture.
struct DragData
{
    std::string clip_id;
    DragType    type                    = DragType::Move;
    double      start_x                 = 0.0;
    double      start_y                 = 0.0;
    double      original_timeline_in    = 0.0;
    double      original_source_in      = 0.0;
    double      original_source_out     = 0.0;
    bool        ignore_linked_selection = false;
};

// Candidate clip position while dragging. Never written back to the clip by
// the controller; the owner commits it from on_drag_end.
struct DragPreview
{
    double timeline_in = 0.0;
    double source_in   = 0.0;
    double source_out  = 0.0;
    double duration    = 0.0;
};

// ─── DragController ──────────────────────────────────────────────────────────
// Drag state machine for moving and trimming one clip.
//
//   Idle ──pointer_down──► PendingDrag ──pointer_up──► Idle   (plain click)
//                              │
//                 |dx| or |dy| > activation threshold
//                              │
//                              ▼
//                          Dragging ──pointer_up──► Committed
//                              │
//                           cancel()
//                              ▼
//                          Cancelled
//
// Committed and Cancelled end the gesture; the next pointer_down starts a
// new one. cancel() and dispose() are immediate: once they return no
// callback of the gesture fires again. A disposed controller ignores all
// input.
//
// Preview math, per drag type (dt = pointer dx / zoom):
//   Move       timeline_in = max(0, original + dt)
//   TrimLeft   source_in and timeline_in move together; source_in stays in
//              [0, source_out - min_span] and timeline_in >= 0
//   TrimRight  source_out in [source_in + min_span, max_source_duration]
// where min_span = min_clip_duration * speed source seconds. Grid
// rounding is applied first; a snap hit then overrides it.
class DragController
{
   public:
    enum class State
    {
        Idle,
        PendingDrag,
        Dragging,
        Committed,
        Cancelled,
    };

    using DragStartCallback = std::function<void(const DragData& data)>;
    using DragCallback      = std::function<void(const DragData& data, const DragPreview& preview)>;

    explicit DragController(DragConfig config = {}, PositionConfig position = {});
    ~DragController() = default;

    DragController(const DragController&)            = delete;
    DragController& operator=(const DragController&) = delete;

    // ── Configuration ───────────────────────────────────────────────────

    void set_on_drag_start(DragStartCallback cb) { on_drag_start_ = std::move(cb); }
    void set_on_drag(DragCallback cb) { on_drag_ = std::move(cb); }
    void set_on_drag_end(DragCallback cb) { on_drag_end_ = std::move(cb); }

    void update_constraints(DragConstraints constraints);
    void set_snap_points(std::vector<SnapPoint> points);
    const DragConstraints& constraints() const { return constraints_; }

    // A disabled controller refuses pointer_down; a gesture in flight is
    // not affected.
    void set_disabled(bool disabled) { disabled_ = disabled; }
    bool is_disabled() const { return disabled_; }

    const DragConfig& config() const { return config_; }

    // ── Input events ────────────────────────────────────────────────────

    // Returns false (and does nothing) when disabled, disposed, or a gesture
    // is already in progress.
    bool pointer_down(const DragTarget& target,
                      DragType          type,
                      double            x,
                      double            y,
                      bool              ignore_linked_selection = false);

    // Absolute pointer position; the drag delta is x - start_x.
    void pointer_move(double x, double y);

    // Returns true if the gesture committed.
    bool pointer_up();

    void cancel();

    // cancel() plus dropping every callback. Idempotent.
    void dispose();

    // ── Queries ─────────────────────────────────────────────────────────

    State state() const { return state_; }
    bool  is_pending() const { return state_ == State::PendingDrag; }
    bool  is_dragging() const { return state_ == State::Dragging; }
    bool  is_active() const { return is_pending() || is_dragging(); }
    bool  is_disposed() const { return disposed_; }

    std::optional<DragType> drag_type() const;

    // Valid while a gesture is active, and after commit until the next
    // pointer_down.
    const DragData&                   drag_data() const { return data_; }
    const std::optional<DragPreview>& preview() const { return preview_; }
    const std::optional<SnapPoint>&   active_snap_point() const { return active_snap_; }

    // Pure preview computation for a pointer delta against the current
    // gesture. Exposed for hit-testing and tests.
    DragPreview compute_preview(double delta_x, std::optional<SnapPoint>* snapped = nullptr) const;

   private:
    void transition_to_dragging(const DragPreview& preview, const std::optional<SnapPoint>& snap);
    void reset_gesture();

    double safe_speed() const;
    double min_source_span() const;
    DragPreview fallback_preview() const;
    DragPreview finish(double timeline_in, double source_in, double source_out) const;

    // ── State ───────────────────────────────────────────────────────────

    DragConfig      config_;
    PositionConfig  position_;
    DragConstraints constraints_;

    State state_    = State::Idle;
    bool  disabled_ = false;
    bool  disposed_ = false;

    DragTarget                 target_;
    DragData                   data_;
    std::optional<DragPreview> preview_;
    std::optional<SnapPoint>   active_snap_;

    // Callbacks
    DragStartCallback on_drag_start_;
    DragCallback      on_drag_;
    DragCallback      on_drag_end_;
};

const char* to_string(DragController::State state);

}   // namespace cutline
