#pragma once

// Umbrella header: the whole timeline core.

#include <cutline/clip.hpp>
#include <cutline/config.hpp>
#include <cutline/drag_controller.hpp>
#include <cutline/frame.hpp>
#include <cutline/frame_scheduler.hpp>
#include <cutline/fwd.hpp>
#include <cutline/logger.hpp>
#include <cutline/numeric.hpp>
#include <cutline/playback_state.hpp>
#include <cutline/playback_store.hpp>
#include <cutline/position_model.hpp>
#include <cutline/snap_resolver.hpp>
#include <cutline/sync_bridge.hpp>
#include <cutline/timeline_engine.hpp>
