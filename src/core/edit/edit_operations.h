#pragma once

#include "core/common/cutline_errors.h"
#include "core/models/timeline.h"

#include <QLoggingCategory>
#include <QString>
#include <QStringList>

Q_DECLARE_LOGGING_CATEGORY(cutlineEdit)

namespace cutline {

enum class TrimEdge {
    Start,
    End
};

struct TrimOptions {
    bool ripple = false;
    double snapThresholdFrames = 0.0;  // 0 disables snapping to segment edges
};

struct EditOutcome {
    Timeline timeline;
    QStringList affectedSegmentIds;
    QString createdSegmentId;
    qint64 appliedFrame = 0;   // position actually used after clamping/snapping
};

/**
 * Edit operations: pure functions from one Timeline snapshot to the next.
 *
 * Each returns either a validated snapshot or the reason the edit was refused;
 * the input snapshot is never touched. Applying them in order (single writer)
 * is the EditSession's job.
 */
namespace edit {

// Cut one segment into two contiguous segments at atFrame (start < atFrame < end)
Result<EditOutcome> split(const Timeline& timeline, const QString& segmentId, qint64 atFrame);

/**
 * Move one edge of a segment.
 * The frame is clamped to the clip's source range, to a one-frame minimum and,
 * without ripple, to the neighbouring segment. Ripple shifts every later
 * segment on the track by the length change.
 */
Result<EditOutcome> trim(const Timeline& timeline, const QString& segmentId, TrimEdge edge,
                         qint64 newFrame, const TrimOptions& options = TrimOptions());

Result<EditOutcome> deleteSegment(const Timeline& timeline, const QString& segmentId, bool ripple);

// Reposition without changing the source range; refuses overlaps rather than displacing
Result<EditOutcome> move(const Timeline& timeline, const QString& segmentId, qint64 newStart,
                         const QString& targetTrackId = QString());

// Import path: catalogue the clip and place one segment covering all of it
Result<EditOutcome> insertClip(const Timeline& timeline, const Clip& clip, const QString& trackId, qint64 atFrame);

} // namespace edit

} // namespace cutline
