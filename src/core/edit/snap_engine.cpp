#include "snap_engine.h"

#include <algorithm>
#include <cmath>

namespace cutline {

SnapEngine::SnapEngine(const Timeline& timeline, const QString& excludedSegmentId)
    : m_fps(timeline.fps())
{
    for (const Track& lane : timeline.tracks()) {
        for (const Segment& segment : lane.segments()) {
            if (segment.id() == excludedSegmentId) {
                continue;
            }
            m_candidates.append({segment.timelineStart(), QStringLiteral("segment:%1:start").arg(segment.id())});
            m_candidates.append({segment.timelineEnd(), QStringLiteral("segment:%1:end").arg(segment.id())});
        }
    }
    std::stable_sort(m_candidates.begin(), m_candidates.end(),
                     [](const Candidate& a, const Candidate& b) { return a.frame < b.frame; });
}

void SnapEngine::setPlayhead(qint64 frame)
{
    Candidate playhead{frame, QStringLiteral("playhead")};
    auto it = std::upper_bound(m_candidates.begin(), m_candidates.end(), playhead,
                               [](const Candidate& a, const Candidate& b) { return a.frame < b.frame; });
    m_candidates.insert(it, playhead);
}

SnapResult SnapEngine::snap(qint64 frame, double thresholdFrames) const
{
    SnapResult result;
    result.frame = frame;
    if (thresholdFrames <= 0.0) {
        return result;
    }

    double bestDistance = thresholdFrames;
    for (const Candidate& candidate : m_candidates) {
        const double distance = std::fabs(static_cast<double>(candidate.frame - frame));
        if (distance <= bestDistance && (!result.snapped || distance < bestDistance)) {
            bestDistance = distance;
            result.frame = candidate.frame;
            result.snapped = true;
            result.target = candidate.target;
        }
    }

    if (m_snapToSeconds) {
        const SnapResult second = nearestSecond(frame);
        const double distance = std::fabs(static_cast<double>(second.frame - frame));
        if (distance <= thresholdFrames && (!result.snapped || distance < bestDistance)) {
            result = second;
        }
    }
    return result;
}

SnapResult SnapEngine::snapRange(qint64 start, qint64 length, double thresholdFrames) const
{
    const SnapResult head = snap(start, thresholdFrames);
    const SnapResult tail = snap(start + length, thresholdFrames);

    if (!head.snapped && !tail.snapped) {
        return head;
    }
    const qint64 headShift = head.frame - start;
    const qint64 tailShift = tail.frame - (start + length);
    if (head.snapped && (!tail.snapped || std::llabs(headShift) <= std::llabs(tailShift))) {
        return head;
    }

    SnapResult shifted = tail;
    shifted.frame = start + tailShift;
    return shifted;
}

double SnapEngine::pixelsToFrames(double pixels, double pixelsPerFrame)
{
    return pixelsPerFrame > 0.0 ? pixels / pixelsPerFrame : 0.0;
}

SnapResult SnapEngine::nearestSecond(qint64 frame) const
{
    const double second = std::round(static_cast<double>(frame) / m_fps);
    SnapResult result;
    result.frame = static_cast<qint64>(std::llround(second * m_fps));
    result.snapped = true;
    result.target = QStringLiteral("second:%1").arg(static_cast<qint64>(second));
    return result;
}

} // namespace cutline
