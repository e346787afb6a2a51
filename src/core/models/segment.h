#pragma once

#include <QString>
#include <QtGlobal>

namespace cutline {

/**
 * Segment - a timeline-placed reference to a contiguous range of a clip.
 *
 * All positions are integer frames. timelineEnd is derived from the source
 * range, so timelineEnd - timelineStart == sourceOut - sourceIn always holds.
 * Segments are values: every mutation returns a modified copy.
 */
class Segment
{
public:
    Segment() = default;
    Segment(const QString& id, const QString& clipId, const QString& trackId,
            qint64 timelineStart, qint64 sourceIn, qint64 sourceOut, int order = 0);

    QString id() const { return m_id; }
    QString clipId() const { return m_clipId; }
    QString trackId() const { return m_trackId; }
    int order() const { return m_order; }

    qint64 timelineStart() const { return m_timelineStart; }
    qint64 timelineEnd() const { return m_timelineStart + duration(); }
    qint64 sourceIn() const { return m_sourceIn; }
    qint64 sourceOut() const { return m_sourceOut; }
    qint64 duration() const { return m_sourceOut - m_sourceIn; }

    // Half-open coverage: timelineStart <= frame < timelineEnd
    bool containsFrame(double frame) const;
    bool overlaps(qint64 start, qint64 end) const;

    // Source frame shown at a timeline position (continuous)
    double sourceFrameAt(double timelineFrame) const;

    Segment withId(const QString& id) const;
    Segment withTrack(const QString& trackId) const;
    Segment withOrder(int order) const;
    Segment withTimelineStart(qint64 start) const;
    Segment withSourceRange(qint64 sourceIn, qint64 sourceOut) const;

    bool isValid() const;

    bool operator==(const Segment& other) const;
    bool operator!=(const Segment& other) const { return !(*this == other); }

private:
    QString m_id;
    QString m_clipId;
    QString m_trackId;
    qint64 m_timelineStart = 0;
    qint64 m_sourceIn = 0;
    qint64 m_sourceOut = 0;
    int m_order = 0;
};

} // namespace cutline
