#pragma once

#include "core/models/timeline.h"

#include <QHash>
#include <QLoggingCategory>
#include <QObject>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(cutlineEngine)

namespace cutline {

struct PlaybackState {
    double currentFrame = 0.0;
    bool isPlaying = false;
    QHash<QString, QString> activeSegmentIds;  // trackId -> segmentId, absent in a gap
};

/**
 * TimelineEngine: the authoritative playhead of one editing session.
 *
 * - currentFrame is a continuous double, advanced only by tick() while playing
 *   and by discrete seeks; 0 <= currentFrame <= totalFrames always holds
 * - the active segment per track is recomputed on every position or snapshot
 *   change; changes are published as boundaryCrossed
 * - backends never write back into the engine
 */
class TimelineEngine : public QObject
{
    Q_OBJECT

public:
    explicit TimelineEngine(QObject* parent = nullptr);

    void setTimeline(const Timeline& timeline);
    const Timeline& timeline() const { return m_timeline; }

    // Playback control
    void play();
    void pause();
    void togglePlayback();
    void seek(double frame);
    void stepFrames(double delta);
    void tick(double deltaMs);

    // Playback state
    double currentFrame() const { return m_currentFrame; }
    qint64 displayFrame() const;
    bool isPlaying() const { return m_playing; }
    qint64 totalFrames() const { return m_timeline.totalFrames(); }
    double fps() const { return m_timeline.fps(); }

    const Segment* activeSegment(const QString& trackId) const;
    QString activeSegmentId(const QString& trackId) const { return m_activeSegmentIds.value(trackId); }
    PlaybackState state() const;

signals:
    void playStateChanged(bool playing);
    void frameChanged(double frame);
    void seeked(double frame);
    void boundaryCrossed(const QString& trackId, const QString& previousSegmentId, const QString& segmentId);
    void ended();
    void timelineChanged(const cutline::Timeline& timeline);

private:
    double clampFrame(double frame) const;
    void setPlaying(bool playing);
    void updateActiveSegments();

    Timeline m_timeline;
    double m_currentFrame = 0.0;
    bool m_playing = false;
    bool m_inTick = false;
    QHash<QString, QString> m_activeSegmentIds;
};

} // namespace cutline
