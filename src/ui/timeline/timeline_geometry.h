#pragma once

#include "core/config/editor_settings.h"

#include <QtGlobal>

namespace cutline {

struct FrameRange {
    double first = 0.0;
    double last = 0.0;

    bool contains(double frame) const { return frame >= first && frame <= last; }
};

/**
 * Pixel <-> frame mapping of the timeline surface.
 *
 * Widget x of a frame = headerWidth + frame * pixelsPerFrame - scrollX.
 * The content area starts right of the track headers and below the ruler.
 */
struct TimelineGeometry {
    double fps = timeline_constants::DEFAULT_FPS;
    double zoom = 1.0;
    double basePixelsPerSecond = timeline_constants::BASE_PIXELS_PER_SECOND;
    double scrollX = 0.0;
    int headerWidth = timeline_constants::TRACK_HEADER_WIDTH;
    int rulerHeight = timeline_constants::RULER_HEIGHT;
    int trackHeight = timeline_constants::TRACK_HEIGHT;
    int viewportWidth = 0;
    int viewportHeight = 0;

    double pixelsPerFrame() const { return zoom * basePixelsPerSecond / fps; }
    double frameToX(double frame) const { return headerWidth + frame * pixelsPerFrame() - scrollX; }
    double xToFrame(double x) const { return (x - headerWidth + scrollX) / pixelsPerFrame(); }

    double contentWidth(qint64 totalFrames) const { return static_cast<double>(totalFrames) * pixelsPerFrame(); }
    double visibleContentWidth() const { return qMax(0, viewportWidth - headerWidth); }
    double maxScroll(qint64 totalFrames) const { return qMax(0.0, contentWidth(totalFrames) - visibleContentWidth()); }

    // Frames covered by the viewport widened by bufferPx on both sides
    FrameRange visibleFrames(double bufferPx) const;

    double trackTop(int trackIndex) const { return rulerHeight + trackIndex * trackHeight; }
    int trackIndexAt(double y) const;

    // Zoom at which the whole timeline fits, bounded to [floor, ceiling]
    static double minZoomFor(qint64 totalFrames, double fps, double basePixelsPerSecond,
                             double availableWidth, double floor, double ceiling);

    // Major ruler spacing in seconds for a zoom level
    static int rulerIntervalSeconds(double zoom);
    static bool showsMinorTicks(double zoom) { return zoom >= 0.75; }
};

} // namespace cutline
