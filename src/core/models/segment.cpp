#include "segment.h"

namespace cutline {

Segment::Segment(const QString& id, const QString& clipId, const QString& trackId,
                 qint64 timelineStart, qint64 sourceIn, qint64 sourceOut, int order)
    : m_id(id)
    , m_clipId(clipId)
    , m_trackId(trackId)
    , m_timelineStart(timelineStart)
    , m_sourceIn(sourceIn)
    , m_sourceOut(sourceOut)
    , m_order(order)
{
}

bool Segment::containsFrame(double frame) const
{
    return frame >= static_cast<double>(m_timelineStart)
        && frame < static_cast<double>(timelineEnd());
}

bool Segment::overlaps(qint64 start, qint64 end) const
{
    return start < timelineEnd() && m_timelineStart < end;
}

double Segment::sourceFrameAt(double timelineFrame) const
{
    return timelineFrame - static_cast<double>(m_timelineStart) + static_cast<double>(m_sourceIn);
}

Segment Segment::withId(const QString& id) const
{
    Segment copy(*this);
    copy.m_id = id;
    return copy;
}

Segment Segment::withTrack(const QString& trackId) const
{
    Segment copy(*this);
    copy.m_trackId = trackId;
    return copy;
}

Segment Segment::withOrder(int order) const
{
    Segment copy(*this);
    copy.m_order = order;
    return copy;
}

Segment Segment::withTimelineStart(qint64 start) const
{
    Segment copy(*this);
    copy.m_timelineStart = start;
    return copy;
}

Segment Segment::withSourceRange(qint64 sourceIn, qint64 sourceOut) const
{
    Segment copy(*this);
    copy.m_sourceIn = sourceIn;
    copy.m_sourceOut = sourceOut;
    return copy;
}

bool Segment::isValid() const
{
    return !m_id.isEmpty() && !m_clipId.isEmpty()
        && m_timelineStart >= 0 && m_sourceIn >= 0 && m_sourceOut > m_sourceIn;
}

bool Segment::operator==(const Segment& other) const
{
    return m_id == other.m_id
        && m_clipId == other.m_clipId
        && m_trackId == other.m_trackId
        && m_timelineStart == other.m_timelineStart
        && m_sourceIn == other.m_sourceIn
        && m_sourceOut == other.m_sourceOut
        && m_order == other.m_order;
}

} // namespace cutline
