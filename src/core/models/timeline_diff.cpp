#include "timeline_diff.h"

#include <QHash>
#include <QSet>

namespace cutline {

namespace {

QHash<QString, Segment> indexSegments(const Timeline& timeline)
{
    QHash<QString, Segment> index;
    for (const Track& lane : timeline.tracks()) {
        for (const Segment& segment : lane.segments()) {
            index.insert(segment.id(), segment);
        }
    }
    return index;
}

} // namespace

TimelineDiff diffTimelines(const Timeline& before, const Timeline& after)
{
    const QHash<QString, Segment> previous = indexSegments(before);

    TimelineDiff diff;
    diff.totalFrames = after.totalFrames();
    diff.fps = after.fps();
    for (const Track& lane : after.tracks()) {
        diff.trackIds.append(lane.id());
    }

    QSet<QString> seen;
    for (const Track& lane : after.tracks()) {
        for (const Segment& segment : lane.segments()) {
            seen.insert(segment.id());
            auto it = previous.constFind(segment.id());
            if (it == previous.constEnd() || it.value() != segment) {
                diff.upserted.append(segment);
            }
        }
    }

    // Keep removal order stable: walk the old snapshot track by track
    for (const Track& lane : before.tracks()) {
        for (const Segment& segment : lane.segments()) {
            if (!seen.contains(segment.id())) {
                diff.removedIds.append(segment.id());
            }
        }
    }

    for (auto it = after.clips().constBegin(); it != after.clips().constEnd(); ++it) {
        const Clip* known = before.clip(it.key());
        if (!known || *known != it.value()) {
            diff.addedClips.append(it.value());
        }
    }
    return diff;
}

} // namespace cutline
