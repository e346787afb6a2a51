#include "track.h"

#include <algorithm>

namespace cutline {

Track::Track(const QString& id, const QList<Segment>& segments)
    : m_id(id)
{
    m_segments = withSegments(segments).m_segments;
}

int Track::indexOf(const QString& segmentId) const
{
    for (int i = 0; i < m_segments.size(); ++i) {
        if (m_segments.at(i).id() == segmentId) {
            return i;
        }
    }
    return -1;
}

const Segment* Track::segmentAt(double frame) const
{
    const int index = firstSegmentEndingAfter(frame);
    if (index < m_segments.size() && m_segments.at(index).containsFrame(frame)) {
        return &m_segments.at(index);
    }
    return nullptr;
}

int Track::firstSegmentEndingAfter(double frame) const
{
    auto it = std::upper_bound(m_segments.cbegin(), m_segments.cend(), frame,
                               [](double f, const Segment& segment) {
                                   return f < static_cast<double>(segment.timelineEnd());
                               });
    return static_cast<int>(std::distance(m_segments.cbegin(), it));
}

qint64 Track::contentEnd() const
{
    return m_segments.isEmpty() ? 0 : m_segments.last().timelineEnd();
}

Track Track::withSegments(QList<Segment> segments) const
{
    std::stable_sort(segments.begin(), segments.end(), [](const Segment& a, const Segment& b) {
        return a.timelineStart() < b.timelineStart();
    });

    Track copy;
    copy.m_id = m_id;
    copy.m_segments.reserve(segments.size());
    for (int i = 0; i < segments.size(); ++i) {
        copy.m_segments.append(segments.at(i).withTrack(m_id).withOrder(i));
    }
    return copy;
}

bool Track::operator==(const Track& other) const
{
    return m_id == other.m_id && m_segments == other.m_segments;
}

} // namespace cutline
