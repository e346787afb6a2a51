#include "timeline_geometry.h"

#include <cmath>

namespace cutline {

FrameRange TimelineGeometry::visibleFrames(double bufferPx) const
{
    FrameRange range;
    range.first = qMax(0.0, (scrollX - bufferPx) / pixelsPerFrame());
    range.last = (scrollX + visibleContentWidth() + bufferPx) / pixelsPerFrame();
    return range;
}

int TimelineGeometry::trackIndexAt(double y) const
{
    if (y < rulerHeight || trackHeight <= 0) {
        return -1;
    }
    return static_cast<int>(std::floor((y - rulerHeight) / trackHeight));
}

double TimelineGeometry::minZoomFor(qint64 totalFrames, double fps, double basePixelsPerSecond,
                                    double availableWidth, double floor, double ceiling)
{
    if (totalFrames <= 0 || fps <= 0.0 || availableWidth <= 0.0) {
        return ceiling;
    }
    const double seconds = static_cast<double>(totalFrames) / fps;
    const double fitZoom = availableWidth / (seconds * basePixelsPerSecond);
    return qBound(floor, fitZoom, ceiling);
}

int TimelineGeometry::rulerIntervalSeconds(double zoom)
{
    if (zoom < 0.5) {
        return 10;
    }
    if (zoom < 0.75) {
        return 5;
    }
    if (zoom < 1.0) {
        return 2;
    }
    return 1;
}

} // namespace cutline
