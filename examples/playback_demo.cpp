#include <cstdio>
#include <cutline/cutline.hpp>

// Headless playback: a 3 s timeline played at 1.5x through the frame
// scheduler, with a store mirroring the engine and a simulated trim gesture.
int main(int argc, char** argv)
{
    auto& logger = cutline::Logger::instance();
    logger.clear_sinks();
    logger.add_sink(cutline::sinks::console_sink());
    logger.set_level(cutline::LogLevel::Info);

    cutline::TimelineConfig cfg;
    const std::string       path = argc > 1 ? argv[1] : cutline::TimelineConfig::default_path();
    if (!cfg.load(path))
        CUTLINE_LOG_INFO("demo", "using default config ({} not loaded)", path);

    cutline::FrameScheduler scheduler(60.0f);
    cutline::TimelineEngine engine(&scheduler, {.duration = 3.0, .playback_rate = 1.5}, cfg.engine);
    cutline::PlaybackStore  store(cfg.engine);
    cutline::SyncBridge     bridge(engine, store, cfg.sync);

    double next_report = 0.0;
    engine.on(cutline::EngineEvent::TimeUpdate,
              [&](const cutline::EngineEventData& e)
              {
                  if (e.value < next_report)
                      return;
                  std::printf("  t=%.2fs  store=%.2fs  playing=%d\n",
                              e.value,
                              store.current_time(),
                              store.is_playing() ? 1 : 0);
                  next_report += 0.5;
              });
    engine.on(cutline::EngineEvent::Ended,
              [](const cutline::EngineEventData& e) { CUTLINE_LOG_INFO("demo", "ended at {}s", e.value); });

    store.play(cutline::UpdateOrigin::External);
    while (engine.is_playing())
        scheduler.run_frame();

    // Trim the right edge of a 4 s clip by 120 px at 100 px/s with a 0.25 s grid.
    cutline::DragController drag(cfg.drag, cfg.position);
    drag.update_constraints(cutline::DragConstraints{
        .zoom                = 100.0,
        .max_source_duration = 8.0,
        .grid_interval       = cutline::position::grid_interval_for_zoom(100.0),
        .snap_threshold      = cutline::snap::snap_threshold_for_zoom(100.0, cfg.drag.snap_threshold_px),
        .snap_points         = {cutline::snap::playhead_snap_point(engine.current_time())},
    });
    drag.set_on_drag_end(
        [](const cutline::DragData& d, const cutline::DragPreview& p)
        {
            std::printf("  %s '%s': source [%.2f, %.2f] -> duration %.2fs\n",
                        cutline::to_string(d.type),
                        d.clip_id.c_str(),
                        p.source_in,
                        p.source_out,
                        p.duration);
        });

    cutline::DragTarget clip;
    clip.clip_id   = "intro";
    clip.placement = {0.0, 4.0};
    clip.range     = {0.0, 4.0};
    drag.pointer_down(clip, cutline::DragType::TrimRight, 400.0, 20.0);
    drag.pointer_move(460.0, 21.0);
    drag.pointer_move(520.0, 22.0);
    drag.pointer_up();

    const auto& stats = bridge.stats();
    CUTLINE_LOG_INFO("demo",
                     "{} store writes, {} applied, {} echoes skipped",
                     stats.engine_to_store,
                     stats.store_to_engine,
                     stats.skipped_echoes);
    return 0;
}
