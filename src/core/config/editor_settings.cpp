#include "editor_settings.h"

#include <QSettings>

Q_LOGGING_CATEGORY(cutlineConfig, "cutline.config")

namespace cutline {

namespace {

double readPositive(QSettings& settings, const QString& key, double fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }
    bool ok = false;
    const double value = settings.value(key).toDouble(&ok);
    if (!ok || value <= 0.0) {
        qCWarning(cutlineConfig, "Ignoring invalid value for %s", qPrintable(key));
        return fallback;
    }
    return value;
}

int readPositiveInt(QSettings& settings, const QString& key, int fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }
    bool ok = false;
    const int value = settings.value(key).toInt(&ok);
    if (!ok || value <= 0) {
        qCWarning(cutlineConfig, "Ignoring invalid value for %s", qPrintable(key));
        return fallback;
    }
    return value;
}

} // namespace

EditorSettings EditorSettings::load(QSettings& settings)
{
    EditorSettings result;

    settings.beginGroup(QString::fromLatin1(timeline_constants::SETTINGS_GROUP));

    RendererSettings& r = result.renderer;
    r.basePixelsPerSecond = readPositive(settings, "renderer/pixels_per_second", r.basePixelsPerSecond);
    r.maxZoom = readPositive(settings, "renderer/max_zoom", r.maxZoom);
    r.trackHeight = readPositiveInt(settings, "renderer/track_height", r.trackHeight);
    r.viewportBufferPx = readPositive(settings, "renderer/viewport_buffer_px", r.viewportBufferPx);
    r.scrubberTransitionMs = readPositiveInt(settings, "renderer/scrubber_transition_ms", r.scrubberTransitionMs);

    InputSettings& in = result.input;
    in.snapThresholdPx = readPositive(settings, "input/snap_threshold_px", in.snapThresholdPx);
    in.dragThresholdPx = readPositive(settings, "input/drag_threshold_px", in.dragThresholdPx);
    in.arrowStepFrames = readPositiveInt(settings, "input/arrow_step_frames", in.arrowStepFrames);
    in.largeStepFrames = readPositiveInt(settings, "input/large_step_frames", in.largeStepFrames);
    in.snapToPlayhead = settings.value("input/snap_to_playhead", in.snapToPlayhead).toBool();
    in.snapToSeconds = settings.value("input/snap_to_seconds", in.snapToSeconds).toBool();

    SyncSettings& s = result.sync;
    s.driftToleranceSeconds = readPositive(settings, "sync/drift_tolerance_s", s.driftToleranceSeconds);
    s.preloadLeadSeconds = readPositive(settings, "sync/preload_lead_s", s.preloadLeadSeconds);

    result.session.undoDepth = readPositiveInt(settings, "session/undo_depth", result.session.undoDepth);
    result.scheduler.tickIntervalMs = readPositiveInt(settings, "scheduler/tick_interval_ms",
                                                      result.scheduler.tickIntervalMs);

    settings.endGroup();

    if (r.maxZoom < r.minZoomCeiling) {
        qCWarning(cutlineConfig, "max_zoom %g below minimum zoom ceiling, using default", r.maxZoom);
        r.maxZoom = timeline_constants::MAX_ZOOM;
    }

    qCDebug(cutlineConfig, "Settings loaded: %g px/s, snap %g px, undo depth %d",
            r.basePixelsPerSecond, in.snapThresholdPx, result.session.undoDepth);
    return result;
}

void EditorSettings::save(QSettings& settings) const
{
    settings.beginGroup(QString::fromLatin1(timeline_constants::SETTINGS_GROUP));

    settings.setValue("renderer/pixels_per_second", renderer.basePixelsPerSecond);
    settings.setValue("renderer/max_zoom", renderer.maxZoom);
    settings.setValue("renderer/track_height", renderer.trackHeight);
    settings.setValue("renderer/viewport_buffer_px", renderer.viewportBufferPx);
    settings.setValue("renderer/scrubber_transition_ms", renderer.scrubberTransitionMs);

    settings.setValue("input/snap_threshold_px", input.snapThresholdPx);
    settings.setValue("input/drag_threshold_px", input.dragThresholdPx);
    settings.setValue("input/arrow_step_frames", input.arrowStepFrames);
    settings.setValue("input/large_step_frames", input.largeStepFrames);
    settings.setValue("input/snap_to_playhead", input.snapToPlayhead);
    settings.setValue("input/snap_to_seconds", input.snapToSeconds);

    settings.setValue("sync/drift_tolerance_s", sync.driftToleranceSeconds);
    settings.setValue("sync/preload_lead_s", sync.preloadLeadSeconds);
    settings.setValue("session/undo_depth", session.undoDepth);
    settings.setValue("scheduler/tick_interval_ms", scheduler.tickIntervalMs);

    settings.endGroup();
    settings.sync();
}

} // namespace cutline
