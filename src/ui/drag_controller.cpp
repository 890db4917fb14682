#include <algorithm>
#include <cmath>
#include <cutline/drag_controller.hpp>
#include <cutline/logger.hpp>
#include <cutline/numeric.hpp>
#include <cutline/position_model.hpp>
#include <exception>

namespace cutline
{

namespace
{

template <typename Callback, typename... Args>
void fire(const char* name, const Callback& cb, const Args&... args)
{
    if (!cb)
        return;
    // Invoke a copy: the callback may replace or clear itself (dispose()).
    Callback copy = cb;
    try
    {
        copy(args...);
    }
    catch (const std::exception& e)
    {
        CUTLINE_LOG_ERROR("drag", "{} callback threw: {}", name, e.what());
    }
    catch (...)
    {
        CUTLINE_LOG_ERROR("drag", "{} callback threw a non-standard exception", name);
    }
}

double non_negative(double v)
{
    return is_finite(v) ? std::max(0.0, v) : 0.0;
}

}   // namespace

const char* to_string(DragType type)
{
    switch (type)
    {
        case DragType::Move:
            return "move";
        case DragType::TrimLeft:
            return "trim-left";
        case DragType::TrimRight:
            return "trim-right";
    }
    return "unknown";
}

const char* to_string(DragController::State state)
{
    switch (state)
    {
        case DragController::State::Idle:
            return "idle";
        case DragController::State::PendingDrag:
            return "pending";
        case DragController::State::Dragging:
            return "dragging";
        case DragController::State::Committed:
            return "committed";
        case DragController::State::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

DragController::DragController(DragConfig config, PositionConfig position)
    : config_(config), position_(position)
{
    if (!is_valid(config_))
    {
        CUTLINE_LOG_WARN("drag", "invalid drag config, using defaults");
        config_ = DragConfig{};
    }
    if (!is_valid(position_))
    {
        CUTLINE_LOG_WARN("drag", "invalid position config, using defaults");
        position_ = PositionConfig{};
    }
}

void DragController::update_constraints(DragConstraints constraints)
{
    constraints_ = std::move(constraints);
}

void DragController::set_snap_points(std::vector<SnapPoint> points)
{
    constraints_.snap_points = std::move(points);
}

std::optional<DragType> DragController::drag_type() const
{
    if (!is_active())
        return std::nullopt;
    return data_.type;
}

// ─── Input events ────────────────────────────────────────────────────────────

bool DragController::pointer_down(const DragTarget& target,
                                  DragType          type,
                                  double            x,
                                  double            y,
                                  bool              ignore_linked_selection)
{
    if (disposed_ || disabled_ || is_active())
        return false;
    if (!is_finite(x) || !is_finite(y))
    {
        CUTLINE_LOG_DEBUG("drag", "ignoring pointer_down at non-finite position");
        return false;
    }

    target_ = target;
    data_   = DragData{
          .clip_id                 = target.clip_id,
          .type                    = type,
          .start_x                 = x,
          .start_y                 = y,
          .original_timeline_in    = target.placement.timeline_in_sec,
          .original_source_in      = target.range.source_in_sec,
          .original_source_out     = target.range.source_out_sec,
          .ignore_linked_selection = ignore_linked_selection,
    };
    preview_.reset();
    active_snap_.reset();
    state_ = State::PendingDrag;

    CUTLINE_LOG_DEBUG("drag", "pending {} on clip '{}'", to_string(type), target.clip_id);
    return true;
}

void DragController::pointer_move(double x, double y)
{
    if (disposed_)
        return;

    if (state_ == State::PendingDrag)
    {
        const double dx = x - data_.start_x;
        const double dy = y - data_.start_y;
        const double th = config_.activation_threshold_px;
        // NaN comparisons are false, so a non-finite pointer never activates.
        if (!(std::fabs(dx) > th || std::fabs(dy) > th))
            return;

        std::optional<SnapPoint> snap;
        DragPreview              preview = compute_preview(dx, &snap);
        transition_to_dragging(preview, snap);
        return;
    }

    if (state_ != State::Dragging)
        return;

    std::optional<SnapPoint> snap;
    preview_     = compute_preview(x - data_.start_x, &snap);
    active_snap_ = std::move(snap);

    const DragData    data    = data_;
    const DragPreview preview = *preview_;
    fire("on_drag", on_drag_, data, preview);
}

bool DragController::pointer_up()
{
    if (disposed_)
        return false;

    if (state_ == State::PendingDrag)
    {
        // Never crossed the threshold: a plain click, nothing to commit.
        reset_gesture();
        return false;
    }
    if (state_ != State::Dragging)
        return false;

    state_ = State::Committed;
    const DragData    data    = data_;
    const DragPreview preview = preview_.value_or(fallback_preview());

    CUTLINE_LOG_DEBUG("drag",
                      "commit {} on clip '{}': in={} src=[{}, {}]",
                      to_string(data.type),
                      data.clip_id,
                      preview.timeline_in,
                      preview.source_in,
                      preview.source_out);

    fire("on_drag_end", on_drag_end_, data, preview);
    return true;
}

void DragController::cancel()
{
    if (!is_active())
        return;

    CUTLINE_LOG_DEBUG("drag", "cancel {} on clip '{}'", to_string(data_.type), data_.clip_id);
    state_ = State::Cancelled;
    preview_.reset();
    active_snap_.reset();
}

void DragController::dispose()
{
    if (disposed_)
        return;

    cancel();
    disposed_      = true;
    on_drag_start_ = nullptr;
    on_drag_       = nullptr;
    on_drag_end_   = nullptr;
}

// ─── State transitions ───────────────────────────────────────────────────────

void DragController::transition_to_dragging(const DragPreview& preview, const std::optional<SnapPoint>& snap)
{
    state_       = State::Dragging;
    preview_     = preview;
    active_snap_ = snap;

    CUTLINE_LOG_DEBUG("drag", "start {} on clip '{}'", to_string(data_.type), data_.clip_id);

    const DragData data = data_;
    fire("on_drag_start", on_drag_start_, data);

    // on_drag_start may have cancelled or disposed.
    if (state_ != State::Dragging)
        return;
    fire("on_drag", on_drag_, data, preview);
}

void DragController::reset_gesture()
{
    state_ = State::Idle;
    preview_.reset();
    active_snap_.reset();
}

// ─── Preview math ────────────────────────────────────────────────────────────

double DragController::safe_speed() const
{
    const double s = target_.speed;
    return (is_finite(s) && s > 0.0) ? s : 1.0;
}

double DragController::min_source_span() const
{
    return non_negative(config_.min_clip_duration) * safe_speed();
}

DragPreview DragController::fallback_preview() const
{
    DragPreview p;
    p.timeline_in = non_negative(data_.original_timeline_in);
    p.source_in   = non_negative(data_.original_source_in);
    p.source_out  = non_negative(data_.original_source_out);
    p.duration    = std::max(0.0, p.source_out - p.source_in);
    return p;
}

DragPreview DragController::finish(double timeline_in, double source_in, double source_out) const
{
    DragPreview p;
    p.timeline_in = timeline_in;
    p.source_in   = source_in;
    p.source_out  = source_out;
    p.duration    = position::clip_duration(SourceRange{source_in, source_out}, safe_speed());
    return p;
}

DragPreview DragController::compute_preview(double delta_x, std::optional<SnapPoint>* snapped) const
{
    if (snapped)
        snapped->reset();

    const double tin0  = data_.original_timeline_in;
    const double sin0  = data_.original_source_in;
    const double sout0 = data_.original_source_out;

    if (!is_finite(delta_x) || !is_finite(tin0) || !is_finite(sin0) || !is_finite(sout0))
    {
        CUTLINE_LOG_DEBUG("drag", "non-finite drag input on clip '{}', keeping original", data_.clip_id);
        return fallback_preview();
    }

    const double speed = safe_speed();
    const double dt    = position::to_seconds(delta_x, constraints_.zoom, position_);
    const double grid =
        (is_finite(constraints_.grid_interval) && constraints_.grid_interval > 0.0) ? constraints_.grid_interval : 0.0;
    const double max_source = (is_finite(constraints_.max_source_duration) && constraints_.max_source_duration > 0.0)
                                  ? constraints_.max_source_duration
                                  : std::numeric_limits<double>::infinity();

    auto try_snap = [&](double t) -> std::optional<double>
    {
        SnapResult r = snap::resolve(t, constraints_.snap_points, constraints_.snap_threshold, data_.clip_id);
        if (!r.snapped)
            return std::nullopt;
        if (snapped)
            *snapped = r.point;
        return r.time;
    };

    switch (data_.type)
    {
        case DragType::Move:
        {
            double tin = std::max(0.0, tin0 + dt);
            if (grid > 0.0)
                tin = position::snap_to_grid(tin, grid);
            if (auto s = try_snap(tin))
                tin = *s;
            return finish(std::max(0.0, tin), sin0, sout0);
        }

        case DragType::TrimLeft:
        {
            // Bounds on the timeline-side delta; source_in moves by delta * speed.
            const double max_in = std::min(sout0 - min_source_span(), max_source);
            const double lo     = std::max(-sin0 / speed, -tin0);
            const double hi     = (max_in - sin0) / speed;
            auto clamp_delta    = [&](double d) { return std::max(lo, std::min(hi, d)); };

            double tin = tin0 + clamp_delta(dt);
            if (grid > 0.0)
                tin = position::snap_to_grid(tin, grid);
            if (auto s = try_snap(tin))
                tin = *s;

            const double d   = clamp_delta(tin - tin0);
            const double sin = std::max(0.0, std::min(sin0 + d * speed, max_in));
            return finish(std::max(0.0, tin0 + d), sin, sout0);
        }

        case DragType::TrimRight:
        {
            const double min_out = sin0 + min_source_span();
            auto clamp_out       = [&](double v) { return std::max(min_out, std::min(max_source, v)); };

            double sout = clamp_out(sout0 + dt * speed);
            if (grid > 0.0)
            {
                const double duration = (sout - sin0) / speed;
                sout = clamp_out(sin0 + position::snap_to_grid(duration, grid) * speed);
            }

            const double end = tin0 + (sout - sin0) / speed;
            if (auto s = try_snap(end))
                sout = clamp_out(sin0 + (*s - tin0) * speed);

            return finish(tin0, sin0, sout);
        }
    }
    return fallback_preview();
}

}   // namespace cutline
