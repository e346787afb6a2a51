#pragma once

#include "core/models/timeline.h"

#include <QList>
#include <QString>

namespace cutline {

struct SnapResult {
    qint64 frame = 0;
    bool snapped = false;
    QString target;   // "segment:<id>:start|end", "playhead" or "second:<n>"
};

/**
 * SnapEngine: magnetic snapping for interactive drags.
 *
 * Candidate points are segment edges on every track (except the dragged
 * segment), optionally the playhead and whole seconds. The nearest candidate
 * within the threshold wins; ties go to the earlier candidate.
 */
class SnapEngine
{
public:
    explicit SnapEngine(const Timeline& timeline, const QString& excludedSegmentId = QString());

    void setPlayhead(qint64 frame);
    void setSnapToSeconds(bool enabled) { m_snapToSeconds = enabled; }

    SnapResult snap(qint64 frame, double thresholdFrames) const;

    // Snaps whichever edge of [start, start + length) lies closer to a candidate
    SnapResult snapRange(qint64 start, qint64 length, double thresholdFrames) const;

    int candidateCount() const { return m_candidates.size(); }

    static double pixelsToFrames(double pixels, double pixelsPerFrame);

private:
    struct Candidate {
        qint64 frame;
        QString target;
    };

    SnapResult nearestSecond(qint64 frame) const;

    QList<Candidate> m_candidates;
    double m_fps = 30.0;
    bool m_snapToSeconds = false;
};

} // namespace cutline
