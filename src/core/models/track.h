#pragma once

#include "segment.h"

#include <QList>
#include <QString>

namespace cutline {

/**
 * Track - an ordered lane of segments.
 * Segments are kept sorted by timelineStart with order == index.
 */
class Track
{
public:
    Track() = default;
    explicit Track(const QString& id, const QList<Segment>& segments = {});

    QString id() const { return m_id; }
    const QList<Segment>& segments() const { return m_segments; }
    int segmentCount() const { return m_segments.size(); }
    bool isEmpty() const { return m_segments.isEmpty(); }

    int indexOf(const QString& segmentId) const;
    const Segment* segmentAt(double frame) const;

    // Index of the first segment whose end lies after frame (for viewport culling)
    int firstSegmentEndingAfter(double frame) const;

    qint64 contentEnd() const;

    // Returns a copy holding segments sorted and renumbered for this track
    Track withSegments(QList<Segment> segments) const;

    bool operator==(const Track& other) const;
    bool operator!=(const Track& other) const { return !(*this == other); }

private:
    QString m_id;
    QList<Segment> m_segments;
};

} // namespace cutline
