#pragma once

#include "clip.h"
#include "segment.h"
#include "track.h"
#include "core/common/cutline_errors.h"

#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>
#include <QStringList>

namespace cutline {

struct SegmentLocation {
    int trackIndex = -1;
    int segmentIndex = -1;

    bool isValid() const { return trackIndex >= 0 && segmentIndex >= 0; }
};

/**
 * Timeline - immutable edit snapshot: frame rate, duration, tracks and the
 * catalog of clips the segments reference.
 *
 * Invariants (checked by validate()):
 * - fps > 0, totalFrames >= 0
 * - per track: segments sorted by timelineStart, non-overlapping, inside [0, totalFrames)
 * - every segment references a catalogued clip and stays inside its source range
 *
 * Copies are cheap (implicitly shared Qt containers); edit operations build
 * new snapshots with the with*() helpers and never mutate an existing one.
 */
class Timeline
{
public:
    Timeline() = default;
    Timeline(double fps, qint64 totalFrames,
             const QList<Track>& tracks = {},
             const QHash<QString, Clip>& clips = {});

    // Empty timeline with the given track lanes
    static Timeline create(double fps, const QStringList& trackIds);

    double fps() const { return m_fps; }
    qint64 totalFrames() const { return m_totalFrames; }

    const QList<Track>& tracks() const { return m_tracks; }
    int trackCount() const { return m_tracks.size(); }
    int trackIndex(const QString& trackId) const;
    const Track* track(const QString& trackId) const;

    const QHash<QString, Clip>& clips() const { return m_clips; }
    const Clip* clip(const QString& clipId) const;

    SegmentLocation locate(const QString& segmentId) const;
    const Segment* segment(const QString& segmentId) const;
    const Segment* segmentAt(const QString& trackId, double frame) const;
    int segmentCount() const;

    // Furthest segment end over all tracks
    qint64 contentEnd() const;

    double framesToSeconds(double frames) const { return frames / m_fps; }

    Timeline withTrack(int trackIndex, const Track& track) const;
    Timeline withTrackAdded(const Track& track) const;
    Timeline withTotalFrames(qint64 totalFrames) const;
    Timeline withClip(const Clip& clip) const;

    Result<void> validate() const;

    // Persistence format consumed by export and autosave
    QJsonObject serialize() const;
    QJsonArray serializeClips() const;
    static Result<Timeline> deserialize(const QJsonObject& json, const QHash<QString, Clip>& clips);
    static Result<QHash<QString, Clip>> deserializeClips(const QJsonArray& json);

    bool operator==(const Timeline& other) const;
    bool operator!=(const Timeline& other) const { return !(*this == other); }

private:
    double m_fps = 30.0;
    qint64 m_totalFrames = 0;
    QList<Track> m_tracks;
    QHash<QString, Clip> m_clips;
};

} // namespace cutline

Q_DECLARE_METATYPE(cutline::Timeline)
