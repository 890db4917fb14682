#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>

#include "util/log_capture.hpp"
#include <cutline/frame_scheduler.hpp>
#include <cutline/playback_store.hpp>
#include <cutline/sync_bridge.hpp>
#include <cutline/timeline_engine.hpp>

using namespace cutline;
using cutline::test::LogCapture;
using cutline::test::ManualClock;

namespace
{

void expect_consistent(const TimelineEngine& engine, const PlaybackStore& store)
{
    EXPECT_EQ(engine.is_playing(), store.is_playing());
    EXPECT_NEAR(engine.current_time(), store.current_time(), 1e-6);
    EXPECT_DOUBLE_EQ(engine.playback_rate(), store.playback_rate());
    EXPECT_EQ(engine.loop(), store.loop());
}

}   // namespace

// ─── Attach ──────────────────────────────────────────────────────────────────

TEST(SyncBridgeAttach, StoreTakesEngineState)
{
    TimelineEngine engine(nullptr, {.duration = 60.0, .playback_rate = 2.0, .loop = true});
    engine.seek(12.0);
    PlaybackStore store;

    SyncBridge bridge(engine, store);
    EXPECT_DOUBLE_EQ(store.duration(), 60.0);
    EXPECT_DOUBLE_EQ(store.current_time(), 12.0);
    EXPECT_DOUBLE_EQ(store.playback_rate(), 2.0);
    EXPECT_TRUE(store.loop());
    EXPECT_EQ(store.subscriber_count(), 1u);
}

TEST(SyncBridgeAttach, DisposedEngineStaysDetached)
{
    LogCapture     logs;
    TimelineEngine engine(nullptr, {.duration = 60.0});
    engine.dispose();
    PlaybackStore store;

    SyncBridge bridge(engine, store);
    EXPECT_TRUE(bridge.is_disposed());
    EXPECT_EQ(store.subscriber_count(), 0u);
    EXPECT_EQ(logs.count(LogLevel::Warning, "sync"), 1u);
}

// ─── Engine -> store ─────────────────────────────────────────────────────────

TEST(SyncBridgeEngineToStore, OneStoreWritePerToggle)
{
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store);

    // A second synchronous subscriber must not cause a bounce either.
    int notifications = 0;
    store.subscribe([&](const StoreChange&) { ++notifications; });

    for (int i = 0; i < 10; ++i)
    {
        const auto before = store.write_count();
        engine.toggle_playback();
        EXPECT_EQ(store.write_count(), before + 1);
        EXPECT_EQ(store.is_playing(), engine.is_playing());
    }
    EXPECT_EQ(notifications, 10);
}

TEST(SyncBridgeEngineToStore, TicksMirrorTime)
{
    FrameScheduler sched;
    TimelineEngine engine(&sched, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store);

    engine.play();
    sched.dispatch_frame(0.0);
    sched.dispatch_frame(100.0);
    sched.dispatch_frame(200.0);
    EXPECT_NEAR(store.current_time(), 0.2, 1e-12);
    EXPECT_TRUE(store.is_playing());
}

TEST(SyncBridgeEngineToStore, EqualValuesAreNotRewritten)
{
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store);

    engine.seek(5.0);
    const auto writes = store.write_count();
    engine.seek(5.0);
    engine.seek(5.0 + 1e-9);   // within the time epsilon
    EXPECT_EQ(store.write_count(), writes);
}

TEST(SyncBridgeEngineToStore, RateLoopAndDurationFollowEngine)
{
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store);

    engine.set_playback_rate(1.5);
    engine.toggle_loop();
    engine.set_duration(90.0);
    EXPECT_DOUBLE_EQ(store.playback_rate(), 1.5);
    EXPECT_TRUE(store.loop());
    EXPECT_DOUBLE_EQ(store.duration(), 90.0);
}

TEST(SyncBridgeEngineToStore, PushesCarryEngineOrigin)
{
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store);

    UpdateOrigin last = UpdateOrigin::Untagged;
    store.subscribe([&](const StoreChange& c) { last = c.origin; });
    engine.seek(3.0);
    EXPECT_EQ(last, UpdateOrigin::Engine);
    EXPECT_GE(bridge.stats().skipped_echoes, 1u);
}

// ─── Store -> engine ─────────────────────────────────────────────────────────

TEST(SyncBridgeStoreToEngine, ExternalEditsApply)
{
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store);

    store.seek(20.0, UpdateOrigin::External);
    EXPECT_DOUBLE_EQ(engine.current_time(), 20.0);

    store.play(UpdateOrigin::External);
    EXPECT_TRUE(engine.is_playing());

    store.set_playback_rate(0.5, UpdateOrigin::External);
    EXPECT_DOUBLE_EQ(engine.playback_rate(), 0.5);

    store.set_loop(true, UpdateOrigin::External);
    EXPECT_TRUE(engine.loop());

    store.pause(UpdateOrigin::External);
    EXPECT_FALSE(engine.is_playing());
    expect_consistent(engine, store);
}

TEST(SyncBridgeStoreToEngine, RefusedPlayIsWrittenBack)
{
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store);

    engine.go_to_end();
    store.play(UpdateOrigin::External);
    EXPECT_FALSE(engine.is_playing());
    EXPECT_FALSE(store.is_playing());
}

TEST(SyncBridgeStoreToEngine, ResetThenPlayStartsFromZero)
{
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store);

    engine.go_to_end();
    store.reset(UpdateOrigin::External);
    store.set_duration(60.0, UpdateOrigin::External);
    store.play(UpdateOrigin::External);
    EXPECT_DOUBLE_EQ(engine.current_time(), 0.0);
    EXPECT_TRUE(engine.is_playing());
    expect_consistent(engine, store);
}

TEST(SyncBridgeStoreToEngine, EngineTaggedNotificationsSkipped)
{
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store);

    store.seek(30.0, UpdateOrigin::Engine);
    EXPECT_DOUBLE_EQ(engine.current_time(), 0.0);
    EXPECT_GE(bridge.stats().skipped_echoes, 1u);
}

TEST(SyncBridgeStoreToEngine, ExternalResetRestoresEngineDuration)
{
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store);

    engine.seek(10.0);
    store.reset(UpdateOrigin::External);
    EXPECT_DOUBLE_EQ(engine.current_time(), 0.0);
    EXPECT_DOUBLE_EQ(store.duration(), engine.duration());
    expect_consistent(engine, store);

    // The store clamps against the restored duration again.
    store.seek(500.0, UpdateOrigin::External);
    EXPECT_DOUBLE_EQ(store.current_time(), 60.0);
    EXPECT_DOUBLE_EQ(engine.current_time(), 60.0);
}

TEST(SyncBridgeStoreToEngine, ExternalDurationIsOverwritten)
{
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store);

    store.set_duration(5.0, UpdateOrigin::External);
    EXPECT_DOUBLE_EQ(engine.duration(), 60.0);
    EXPECT_DOUBLE_EQ(store.duration(), 60.0);
}

// ─── Grace window ────────────────────────────────────────────────────────────

TEST(SyncBridgeGraceWindow, UntaggedEditInsideWindowIsOverridden)
{
    ManualClock    clock;
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store, {}, clock.fn());

    // The bridge pushed the duration at t=0; an untagged edit at t=10ms is
    // indistinguishable from an echo.
    clock.advance(10.0);
    store.seek(25.0);
    EXPECT_DOUBLE_EQ(engine.current_time(), 0.0);
    EXPECT_DOUBLE_EQ(store.current_time(), 0.0);
}

TEST(SyncBridgeGraceWindow, UntaggedDurationInsideWindowIsOverridden)
{
    ManualClock    clock;
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store, {}, clock.fn());

    clock.advance(10.0);
    store.set_duration(5.0);
    EXPECT_DOUBLE_EQ(store.duration(), 60.0);
}

TEST(SyncBridgeGraceWindow, UntaggedEditAfterWindowApplies)
{
    ManualClock    clock;
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store, {}, clock.fn());

    clock.advance(51.0);
    store.seek(25.0);
    EXPECT_DOUBLE_EQ(engine.current_time(), 25.0);
    EXPECT_DOUBLE_EQ(bridge.sync_state().last_engine_push_ms, 0.0);
}

TEST(SyncBridgeGraceWindow, ExternalEditIgnoresWindow)
{
    ManualClock    clock;
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store, {}, clock.fn());

    store.seek(25.0, UpdateOrigin::External);
    EXPECT_DOUBLE_EQ(engine.current_time(), 25.0);
}

TEST(SyncBridgeGraceWindow, WithoutOriginTaggingEchoesStillDoNotBounce)
{
    ManualClock    clock;
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store, {.origin_tagging = false}, clock.fn());

    clock.advance(1000.0);
    const auto before = store.write_count();
    engine.play();
    EXPECT_EQ(store.write_count(), before + 1);
    EXPECT_TRUE(store.is_playing());

    // External tag is ignored when tagging is off: the window decides.
    clock.advance(10.0);
    store.seek(7.0, UpdateOrigin::External);
    EXPECT_DOUBLE_EQ(engine.current_time(), 0.0);

    clock.advance(100.0);
    store.seek(7.0, UpdateOrigin::External);
    EXPECT_DOUBLE_EQ(engine.current_time(), 7.0);
    expect_consistent(engine, store);
}

TEST(SyncBridgeGraceWindow, PushRecordsTimestamp)
{
    ManualClock    clock;
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store, {}, clock.fn());

    clock.set(500.0);
    engine.seek(1.0);
    EXPECT_TRUE(bridge.sync_state().has_pushed);
    EXPECT_DOUBLE_EQ(bridge.sync_state().last_engine_push_ms, 500.0);
}

// ─── Bursts ──────────────────────────────────────────────────────────────────

TEST(SyncBridgeBurst, ExternalSeekTogglePairsConverge)
{
    FrameScheduler sched;
    TimelineEngine engine(&sched, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store);

    for (int i = 0; i < 100; ++i)
    {
        store.seek(std::fmod(i * 0.7, 61.0), UpdateOrigin::External);
        store.toggle_playback(UpdateOrigin::External);
        sched.dispatch_frame(i * 16.0);
        expect_consistent(engine, store);
    }
    expect_consistent(engine, store);
}

TEST(SyncBridgeBurst, SeeksPastEndConvergeToStopped)
{
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store);

    for (int i = 0; i < 100; ++i)
    {
        store.seek(60.0 + i, UpdateOrigin::External);
        store.toggle_playback(UpdateOrigin::External);
    }
    EXPECT_DOUBLE_EQ(engine.current_time(), 60.0);
    EXPECT_FALSE(engine.is_playing());
    expect_consistent(engine, store);
}

TEST(SyncBridgeBurst, EngineSideBurstMirrorsEveryStep)
{
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store);

    for (int i = 0; i < 100; ++i)
    {
        engine.seek(i * 0.5);
        engine.toggle_playback();
        expect_consistent(engine, store);
    }
}

TEST(SyncBridgeBurst, UntaggedBurstConvergesToEngine)
{
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store);

    for (int i = 0; i < 100; ++i)
    {
        store.seek(i * 0.3);
        store.toggle_playback();
    }
    expect_consistent(engine, store);
}

// ─── Reconcile & dispose ─────────────────────────────────────────────────────

TEST(SyncBridgeLifecycle, ReconcileRestoresDuration)
{
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store);

    // An engine-tagged write is trusted as an echo and never corrected.
    store.set_duration(5.0, UpdateOrigin::Engine);
    EXPECT_DOUBLE_EQ(store.duration(), 5.0);
    bridge.reconcile();
    EXPECT_DOUBLE_EQ(store.duration(), 60.0);
}

TEST(SyncBridgeLifecycle, ReconcileWhenConsistentWritesNothing)
{
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store);
    engine.seek(3.0);

    const auto writes = store.write_count();
    bridge.reconcile();
    EXPECT_EQ(store.write_count(), writes);
}

TEST(SyncBridgeLifecycle, DisposeStopsBothDirections)
{
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    SyncBridge     bridge(engine, store);

    bridge.dispose();
    bridge.dispose();
    EXPECT_TRUE(bridge.is_disposed());
    EXPECT_EQ(store.subscriber_count(), 0u);
    EXPECT_EQ(engine.listener_count(), 0u);

    engine.seek(10.0);
    engine.set_playback_rate(2.0);
    EXPECT_DOUBLE_EQ(store.current_time(), 0.0);
    EXPECT_DOUBLE_EQ(store.playback_rate(), 1.0);

    store.seek(20.0, UpdateOrigin::External);
    EXPECT_DOUBLE_EQ(engine.current_time(), 10.0);
}

TEST(SyncBridgeLifecycle, DestructorDetaches)
{
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    {
        SyncBridge bridge(engine, store);
        EXPECT_EQ(store.subscriber_count(), 1u);
    }
    EXPECT_EQ(store.subscriber_count(), 0u);
    engine.seek(10.0);
    EXPECT_DOUBLE_EQ(store.current_time(), 0.0);
}

TEST(SyncBridgeLifecycle, ThrowingStoreSubscriberDoesNotBreakSync)
{
    LogCapture     logs;
    TimelineEngine engine(nullptr, {.duration = 60.0});
    PlaybackStore  store;
    store.subscribe([](const StoreChange&) { throw std::runtime_error("ui crashed"); });
    SyncBridge bridge(engine, store);

    engine.seek(4.0);
    store.seek(9.0, UpdateOrigin::External);
    EXPECT_DOUBLE_EQ(engine.current_time(), 9.0);
    EXPECT_TRUE(logs.contains("ui crashed"));
}
