#pragma once

/**
 * Default values for the timeline core.
 * Settings objects start from these; nothing else hardcodes them.
 */

namespace timeline_constants {

// Timeline
static const double DEFAULT_FPS = 30.0;

// Frame scheduler
static const int TICK_INTERVAL_MS = 16; // ~60fps updates

// Renderer
static const double BASE_PIXELS_PER_SECOND = 50.0;
static const double MIN_ZOOM_FLOOR = 0.1;
static const double MIN_ZOOM_CEILING = 0.25;
static const double MAX_ZOOM = 2.0;
static const double ZOOM_IN_FACTOR = 1.05;
static const double ZOOM_OUT_FACTOR = 0.95;
static const int TRACK_HEADER_WIDTH = 70;
static const int RULER_HEIGHT = 30;
static const int TRACK_HEIGHT = 50;
static const double VIEWPORT_BUFFER_PX = 200.0;
static const int SCRUBBER_TRANSITION_MS = 120;

// Snapping and input
static const double SNAP_THRESHOLD_PX = 5.0;
static const double DRAG_THRESHOLD_PX = 5.0;
static const double EDGE_HANDLE_PX = 6.0;
static const int ARROW_STEP_FRAMES = 1;
static const int LARGE_STEP_FRAMES = 10;

// Playback sync
static const double DRIFT_TOLERANCE_SECONDS = 0.1;
static const int RETRIES_PER_FAILURE = 1;
static const double PRELOAD_LEAD_SECONDS = 0.5;

// Edit session
static const int UNDO_DEPTH = 100;

// Settings keys
static const char* const SETTINGS_GROUP = "timeline";

} // namespace timeline_constants
