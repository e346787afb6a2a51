#include "edit_operations.h"

#include "snap_engine.h"
#include "core/common/uuid_generator.h"

#include <QtGlobal>

Q_LOGGING_CATEGORY(cutlineEdit, "cutline.edit")

namespace cutline {
namespace edit {

namespace {

Result<SegmentLocation> locateSegment(const Timeline& timeline, const QString& segmentId)
{
    const SegmentLocation location = timeline.locate(segmentId);
    if (!location.isValid()) {
        return Error::not_found(QStringLiteral("segment %1").arg(segmentId));
    }
    return location;
}

// Shift every segment after index by delta frames, recording which ones moved
void shiftAfter(QList<Segment>& segments, int index, qint64 delta, QStringList& affected)
{
    if (delta == 0) {
        return;
    }
    for (int i = index + 1; i < segments.size(); ++i) {
        segments[i] = segments.at(i).withTimelineStart(segments.at(i).timelineStart() + delta);
        affected.append(segments.at(i).id());
    }
}

const Segment* firstOverlap(const Track& lane, const QString& ignoreId, qint64 start, qint64 end)
{
    for (const Segment& other : lane.segments()) {
        if (other.id() != ignoreId && other.overlaps(start, end)) {
            return &other;
        }
    }
    return nullptr;
}

Result<EditOutcome> finalize(EditOutcome outcome, const char* operation)
{
    auto valid = outcome.timeline.validate();
    if (valid.is_error()) {
        qCWarning(cutlineEdit, "%s produced an invalid snapshot: %s",
                  operation, qPrintable(valid.error().message));
        return valid.error();
    }
    qCDebug(cutlineEdit, "%s applied, %d segment(s) affected",
            operation, static_cast<int>(outcome.affectedSegmentIds.size()));
    return outcome;
}

} // namespace

Result<EditOutcome> split(const Timeline& timeline, const QString& segmentId, qint64 atFrame)
{
    auto location = locateSegment(timeline, segmentId);
    if (location.is_error()) {
        return location.error();
    }
    const SegmentLocation at = location.value();
    const Track& lane = timeline.tracks().at(at.trackIndex);
    const Segment& original = lane.segments().at(at.segmentIndex);

    if (atFrame <= original.timelineStart() || atFrame >= original.timelineEnd()) {
        return Error::invalid_arg(QStringLiteral("Split frame %1 outside (%2, %3) of segment %4")
                                      .arg(atFrame)
                                      .arg(original.timelineStart())
                                      .arg(original.timelineEnd())
                                      .arg(segmentId));
    }

    // Algorithm: Cut source range at offset → Left keeps identity → Right gets fresh id
    const qint64 cut = original.sourceIn() + (atFrame - original.timelineStart());
    const Segment left = original.withSourceRange(original.sourceIn(), cut);
    const Segment right(UuidGenerator::instance().generateSegmentUuid(), original.clipId(), lane.id(),
                        atFrame, cut, original.sourceOut());

    QList<Segment> segments = lane.segments();
    segments[at.segmentIndex] = left;
    segments.insert(at.segmentIndex + 1, right);

    EditOutcome outcome;
    outcome.timeline = timeline.withTrack(at.trackIndex, lane.withSegments(segments));
    outcome.affectedSegmentIds = QStringList{left.id(), right.id()};
    outcome.createdSegmentId = right.id();
    outcome.appliedFrame = atFrame;
    return finalize(outcome, "split");
}

Result<EditOutcome> trim(const Timeline& timeline, const QString& segmentId, TrimEdge edge,
                         qint64 newFrame, const TrimOptions& options)
{
    auto location = locateSegment(timeline, segmentId);
    if (location.is_error()) {
        return location.error();
    }
    const SegmentLocation at = location.value();
    const Track& lane = timeline.tracks().at(at.trackIndex);
    QList<Segment> segments = lane.segments();
    const Segment original = segments.at(at.segmentIndex);
    const Clip* clip = timeline.clip(original.clipId());
    if (!clip) {
        return Error::not_found(QStringLiteral("clip %1").arg(original.clipId()));
    }

    const Segment* previous = at.segmentIndex > 0 ? &lane.segments().at(at.segmentIndex - 1) : nullptr;
    const Segment* next = at.segmentIndex + 1 < segments.size() ? &lane.segments().at(at.segmentIndex + 1) : nullptr;

    qint64 requested = newFrame;
    if (options.snapThresholdFrames > 0.0) {
        const SnapResult snapped = SnapEngine(timeline, segmentId).snap(newFrame, options.snapThresholdFrames);
        if (snapped.snapped) {
            qCDebug(cutlineEdit, "trim snapped %lld -> %lld (%s)", static_cast<long long>(newFrame),
                    static_cast<long long>(snapped.frame), qPrintable(snapped.target));
        }
        requested = snapped.frame;
    }

    const qint64 start = original.timelineStart();
    const qint64 end = original.timelineEnd();
    Segment updated = original;
    qint64 applied = 0;
    qint64 delta = 0;

    if (edge == TrimEdge::End) {
        // Algorithm: Bound by one frame, clip length and (no ripple) next segment
        qint64 maxEnd = start + (clip->durationFrames() - original.sourceIn());
        if (!options.ripple && next) {
            maxEnd = qMin(maxEnd, next->timelineStart());
        }
        applied = qBound(start + 1, requested, maxEnd);
        updated = original.withSourceRange(original.sourceIn(), original.sourceIn() + (applied - start));
        delta = applied - end;
    } else if (options.ripple) {
        // Ripple start trim keeps the segment anchored and slides the rest
        applied = qBound(start - original.sourceIn(), requested, end - 1);
        updated = original.withSourceRange(original.sourceIn() + (applied - start), original.sourceOut());
        delta = start - applied;
    } else {
        qint64 minStart = qMax<qint64>(0, start - original.sourceIn());
        if (previous) {
            minStart = qMax(minStart, previous->timelineEnd());
        }
        applied = qBound(minStart, requested, end - 1);
        updated = original.withTimelineStart(applied)
                      .withSourceRange(original.sourceIn() + (applied - start), original.sourceOut());
    }

    EditOutcome outcome;
    outcome.affectedSegmentIds.append(segmentId);
    segments[at.segmentIndex] = updated;
    if (options.ripple) {
        shiftAfter(segments, at.segmentIndex, delta, outcome.affectedSegmentIds);
    }

    Timeline result = timeline.withTrack(at.trackIndex, lane.withSegments(segments));
    const qint64 total = options.ripple ? timeline.totalFrames() + delta : timeline.totalFrames();
    result = result.withTotalFrames(qMax(total, result.contentEnd()));

    outcome.timeline = result;
    outcome.appliedFrame = applied;
    return finalize(outcome, options.ripple ? "ripple trim" : "trim");
}

Result<EditOutcome> deleteSegment(const Timeline& timeline, const QString& segmentId, bool ripple)
{
    auto location = locateSegment(timeline, segmentId);
    if (location.is_error()) {
        return location.error();
    }
    const SegmentLocation at = location.value();
    const Track& lane = timeline.tracks().at(at.trackIndex);
    QList<Segment> segments = lane.segments();
    const Segment removed = segments.at(at.segmentIndex);

    EditOutcome outcome;
    outcome.affectedSegmentIds.append(segmentId);
    if (ripple) {
        shiftAfter(segments, at.segmentIndex, -removed.duration(), outcome.affectedSegmentIds);
    }
    segments.removeAt(at.segmentIndex);

    Timeline result = timeline.withTrack(at.trackIndex, lane.withSegments(segments));
    if (ripple) {
        result = result.withTotalFrames(qMax(timeline.totalFrames() - removed.duration(), result.contentEnd()));
    }

    outcome.timeline = result;
    outcome.appliedFrame = removed.timelineStart();
    return finalize(outcome, ripple ? "ripple delete" : "delete");
}

Result<EditOutcome> move(const Timeline& timeline, const QString& segmentId, qint64 newStart,
                         const QString& targetTrackId)
{
    auto location = locateSegment(timeline, segmentId);
    if (location.is_error()) {
        return location.error();
    }
    const SegmentLocation at = location.value();
    const Track& sourceLane = timeline.tracks().at(at.trackIndex);
    const Segment original = sourceLane.segments().at(at.segmentIndex);

    const int targetIndex = targetTrackId.isEmpty() ? at.trackIndex : timeline.trackIndex(targetTrackId);
    if (targetIndex < 0) {
        return Error::not_found(QStringLiteral("track %1").arg(targetTrackId));
    }
    const Track& targetLane = timeline.tracks().at(targetIndex);

    const qint64 start = qMax<qint64>(0, newStart);
    const qint64 end = start + original.duration();
    if (const Segment* blocker = firstOverlap(targetLane, segmentId, start, end)) {
        qCDebug(cutlineEdit, "move of %s to [%lld, %lld) on %s rejected by %s", qPrintable(segmentId),
                static_cast<long long>(start), static_cast<long long>(end),
                qPrintable(targetLane.id()), qPrintable(blocker->id()));
        return Error::overlap(segmentId, blocker->id());
    }

    const Segment moved = original.withTimelineStart(start);
    QList<Segment> sourceSegments = sourceLane.segments();
    sourceSegments.removeAt(at.segmentIndex);

    Timeline result = timeline;
    if (targetIndex == at.trackIndex) {
        sourceSegments.append(moved);
        result = result.withTrack(at.trackIndex, sourceLane.withSegments(sourceSegments));
    } else {
        QList<Segment> targetSegments = targetLane.segments();
        targetSegments.append(moved);
        result = result.withTrack(at.trackIndex, sourceLane.withSegments(sourceSegments))
                     .withTrack(targetIndex, targetLane.withSegments(targetSegments));
    }
    result = result.withTotalFrames(qMax(timeline.totalFrames(), end));

    EditOutcome outcome;
    outcome.timeline = result;
    outcome.affectedSegmentIds.append(segmentId);
    outcome.appliedFrame = start;
    return finalize(outcome, "move");
}

Result<EditOutcome> insertClip(const Timeline& timeline, const Clip& clip, const QString& trackId, qint64 atFrame)
{
    if (!clip.isValid()) {
        return Error::invalid_arg(QStringLiteral("Cannot insert invalid clip '%1'").arg(clip.id()));
    }
    const Clip* known = timeline.clip(clip.id());
    if (known && *known != clip) {
        return Error::invalid_arg(QStringLiteral("Clip id %1 already names different media").arg(clip.id()));
    }
    const int trackIndex = timeline.trackIndex(trackId);
    if (trackIndex < 0) {
        return Error::not_found(QStringLiteral("track %1").arg(trackId));
    }
    const Track& lane = timeline.tracks().at(trackIndex);

    const qint64 start = qMax<qint64>(0, atFrame);
    const Segment placed(UuidGenerator::instance().generateSegmentUuid(), clip.id(), trackId,
                         start, 0, clip.durationFrames());
    if (const Segment* blocker = firstOverlap(lane, QString(), start, placed.timelineEnd())) {
        return Error::overlap(placed.id(), blocker->id());
    }

    QList<Segment> segments = lane.segments();
    segments.append(placed);
    Timeline result = timeline.withClip(clip).withTrack(trackIndex, lane.withSegments(segments));
    result = result.withTotalFrames(qMax(timeline.totalFrames(), placed.timelineEnd()));

    EditOutcome outcome;
    outcome.timeline = result;
    outcome.affectedSegmentIds.append(placed.id());
    outcome.createdSegmentId = placed.id();
    outcome.appliedFrame = start;
    return finalize(outcome, "insert clip");
}

} // namespace edit
} // namespace cutline
