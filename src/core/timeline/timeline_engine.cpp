#include "timeline_engine.h"

#include <QScopedValueRollback>
#include <QtMath>

#include <cmath>

Q_LOGGING_CATEGORY(cutlineEngine, "cutline.engine")

namespace cutline {

TimelineEngine::TimelineEngine(QObject* parent)
    : QObject(parent)
{
    qCDebug(cutlineEngine, "Initializing TimelineEngine");
}

void TimelineEngine::setTimeline(const Timeline& timeline)
{
    qCDebug(cutlineEngine, "Installing snapshot: %d tracks, %lld frames @ %g fps",
            timeline.trackCount(), static_cast<long long>(timeline.totalFrames()), timeline.fps());

    // Algorithm: Swap snapshot → Clamp playhead → Recompute active segments → Notify
    m_timeline = timeline;
    const double clamped = clampFrame(m_currentFrame);
    const bool moved = clamped != m_currentFrame;
    m_currentFrame = clamped;

    updateActiveSegments();
    emit timelineChanged(m_timeline);

    if (moved) {
        emit frameChanged(m_currentFrame);
    }
    if (m_playing && m_currentFrame >= static_cast<double>(totalFrames())) {
        setPlaying(false);
        emit ended();
    }
}

void TimelineEngine::play()
{
    if (m_playing) {
        return;
    }
    if (totalFrames() <= 0) {
        qCDebug(cutlineEngine, "Ignoring play on empty timeline");
        return;
    }

    // Playing from the end restarts the edit
    if (m_currentFrame >= static_cast<double>(totalFrames())) {
        seek(0.0);
    }

    qCDebug(cutlineEngine, "Starting playback at frame %g", m_currentFrame);
    setPlaying(true);
}

void TimelineEngine::pause()
{
    if (!m_playing) {
        return;
    }
    qCDebug(cutlineEngine, "Pausing playback at frame %g", m_currentFrame);
    setPlaying(false);
}

void TimelineEngine::togglePlayback()
{
    if (m_playing) {
        pause();
    } else {
        play();
    }
}

void TimelineEngine::seek(double frame)
{
    if (std::isnan(frame)) {
        qCWarning(cutlineEngine, "Ignoring seek to NaN frame");
        return;
    }

    const double clamped = clampFrame(frame);
    if (clamped != frame) {
        const Error error = Error::seek_out_of_range(frame, static_cast<double>(totalFrames()));
        qCDebug(cutlineEngine, "%s: %s, clamped to %g",
                error_code_to_string(error.code), qPrintable(error.message), clamped);
    }

    m_currentFrame = clamped;
    updateActiveSegments();
    emit seeked(m_currentFrame);
    emit frameChanged(m_currentFrame);
}

void TimelineEngine::stepFrames(double delta)
{
    seek(static_cast<double>(displayFrame()) + delta);
}

void TimelineEngine::tick(double deltaMs)
{
    if (m_inTick) {
        qCDebug(cutlineEngine, "Ignoring re-entrant tick");
        return;
    }
    if (!m_playing || !std::isfinite(deltaMs) || deltaMs < 0.0) {
        return;
    }
    QScopedValueRollback<bool> guard(m_inTick, true);

    // Algorithm: Advance → Clamp at end → Recompute active segments → Notify
    const double end = static_cast<double>(totalFrames());
    const double next = m_currentFrame + deltaMs * m_timeline.fps() / 1000.0;
    const bool reachedEnd = next >= end;
    m_currentFrame = reachedEnd ? end : next;

    updateActiveSegments();
    emit frameChanged(m_currentFrame);

    if (reachedEnd) {
        qCDebug(cutlineEngine, "Reached end of timeline at frame %g", m_currentFrame);
        setPlaying(false);
        emit ended();
    }
}

qint64 TimelineEngine::displayFrame() const
{
    return static_cast<qint64>(std::floor(m_currentFrame));
}

const Segment* TimelineEngine::activeSegment(const QString& trackId) const
{
    const QString segmentId = m_activeSegmentIds.value(trackId);
    return segmentId.isEmpty() ? nullptr : m_timeline.segment(segmentId);
}

PlaybackState TimelineEngine::state() const
{
    PlaybackState snapshot;
    snapshot.currentFrame = m_currentFrame;
    snapshot.isPlaying = m_playing;
    snapshot.activeSegmentIds = m_activeSegmentIds;
    return snapshot;
}

double TimelineEngine::clampFrame(double frame) const
{
    return qBound(0.0, frame, static_cast<double>(totalFrames()));
}

void TimelineEngine::setPlaying(bool playing)
{
    if (m_playing == playing) {
        return;
    }
    m_playing = playing;
    emit playStateChanged(m_playing);
}

void TimelineEngine::updateActiveSegments()
{
    // Drop tracks that left the snapshot
    for (auto it = m_activeSegmentIds.begin(); it != m_activeSegmentIds.end();) {
        if (m_timeline.trackIndex(it.key()) < 0) {
            it = m_activeSegmentIds.erase(it);
        } else {
            ++it;
        }
    }

    for (const Track& lane : m_timeline.tracks()) {
        const Segment* current = lane.segmentAt(m_currentFrame);
        const QString nextId = current ? current->id() : QString();
        const QString previousId = m_activeSegmentIds.value(lane.id());
        if (nextId == previousId) {
            continue;
        }

        if (nextId.isEmpty()) {
            m_activeSegmentIds.remove(lane.id());
        } else {
            m_activeSegmentIds.insert(lane.id(), nextId);
        }
        qCDebug(cutlineEngine, "Track %s boundary: '%s' -> '%s' at frame %g",
                qPrintable(lane.id()), qPrintable(previousId), qPrintable(nextId), m_currentFrame);
        emit boundaryCrossed(lane.id(), previousId, nextId);
    }
}

} // namespace cutline
