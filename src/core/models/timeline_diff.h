#pragma once

#include "timeline.h"

#include <QList>
#include <QStringList>

namespace cutline {

/**
 * Segment-level difference between two snapshots.
 * Applying upserted then removed to `before` reproduces `after`'s segments.
 */
struct TimelineDiff {
    QList<Segment> upserted;
    QStringList removedIds;
    QList<Clip> addedClips;
    QStringList trackIds;       // track order of the new snapshot
    qint64 totalFrames = 0;
    double fps = 0.0;

    bool isEmpty() const { return upserted.isEmpty() && removedIds.isEmpty() && addedClips.isEmpty(); }
};

TimelineDiff diffTimelines(const Timeline& before, const Timeline& after);

} // namespace cutline
