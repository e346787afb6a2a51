#pragma once

#include "timeline_constants.h"

#include <QLoggingCategory>

class QSettings;

Q_DECLARE_LOGGING_CATEGORY(cutlineConfig)

namespace cutline {

struct RendererSettings {
    double basePixelsPerSecond = timeline_constants::BASE_PIXELS_PER_SECOND;
    double minZoomFloor = timeline_constants::MIN_ZOOM_FLOOR;
    double minZoomCeiling = timeline_constants::MIN_ZOOM_CEILING;
    double maxZoom = timeline_constants::MAX_ZOOM;
    double zoomInFactor = timeline_constants::ZOOM_IN_FACTOR;
    double zoomOutFactor = timeline_constants::ZOOM_OUT_FACTOR;
    int headerWidth = timeline_constants::TRACK_HEADER_WIDTH;
    int rulerHeight = timeline_constants::RULER_HEIGHT;
    int trackHeight = timeline_constants::TRACK_HEIGHT;
    double viewportBufferPx = timeline_constants::VIEWPORT_BUFFER_PX;
    int scrubberTransitionMs = timeline_constants::SCRUBBER_TRANSITION_MS;
};

struct InputSettings {
    double snapThresholdPx = timeline_constants::SNAP_THRESHOLD_PX;
    double dragThresholdPx = timeline_constants::DRAG_THRESHOLD_PX;
    double edgeHandlePx = timeline_constants::EDGE_HANDLE_PX;
    int arrowStepFrames = timeline_constants::ARROW_STEP_FRAMES;
    int largeStepFrames = timeline_constants::LARGE_STEP_FRAMES;
    bool snapToPlayhead = true;
    bool snapToSeconds = true;
};

struct SyncSettings {
    double driftToleranceSeconds = timeline_constants::DRIFT_TOLERANCE_SECONDS;
    int retriesPerFailure = timeline_constants::RETRIES_PER_FAILURE;
    double preloadLeadSeconds = timeline_constants::PRELOAD_LEAD_SECONDS;
};

struct SessionSettings {
    int undoDepth = timeline_constants::UNDO_DEPTH;
};

struct SchedulerSettings {
    int tickIntervalMs = timeline_constants::TICK_INTERVAL_MS;
};

/**
 * EditorSettings: per-module configuration, persisted through QSettings.
 * Missing keys keep their defaults; out-of-range values are rejected and logged.
 */
struct EditorSettings {
    RendererSettings renderer;
    InputSettings input;
    SyncSettings sync;
    SessionSettings session;
    SchedulerSettings scheduler;

    static EditorSettings load(QSettings& settings);
    void save(QSettings& settings) const;
};

} // namespace cutline
