#pragma once

#include <cstdint>

namespace cutline
{

// Handle returned by TimelineEngine::on(); 0 is never issued.
using ListenerId = uint64_t;

// Handle returned by PlaybackStore::subscribe(); 0 is never issued.
using SubscriptionId = uint64_t;

// Handle returned by FrameScheduler::request_frame(); 0 is never issued.
using FrameRequestId = uint64_t;

struct Frame;
struct PlaybackState;
struct TimelineConfig;
struct EngineConfig;
struct SyncConfig;
struct PositionConfig;
struct DragConfig;

struct ClipPlacement;
struct SourceRange;
struct ClipGeometry;
struct SnapPoint;
struct SnapResult;

class Logger;
class FrameScheduler;
class TimelineEngine;
class PlaybackStore;
class SyncBridge;
class DragController;

}   // namespace cutline
