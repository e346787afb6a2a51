#include "timeline_renderer.h"

#include "core/timeline/timeline_engine.h"

#include <QVariantAnimation>

#include <cmath>

Q_LOGGING_CATEGORY(cutlineRender, "cutline.render")

namespace cutline {

namespace {

QString timecodeLabel(int seconds)
{
    return QStringLiteral("%1:%2").arg(seconds / 60).arg(seconds % 60, 2, 10, QLatin1Char('0'));
}

QString clipLabel(const Timeline& timeline, const Segment& segment)
{
    const Clip* clip = timeline.clip(segment.clipId());
    if (!clip) {
        return segment.clipId();
    }
    const QString url = clip->sourceUrl();
    const int slash = url.lastIndexOf(QLatin1Char('/'));
    return slash >= 0 ? url.mid(slash + 1) : url;
}

} // namespace

TimelineRenderer::TimelineRenderer(TimelineEngine& engine, const RendererSettings& settings, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
    , m_settings(settings)
    , m_timeline(engine.timeline())
{
    m_geometry.fps = m_timeline.fps();
    m_geometry.basePixelsPerSecond = m_settings.basePixelsPerSecond;
    m_geometry.headerWidth = m_settings.headerWidth;
    m_geometry.rulerHeight = m_settings.rulerHeight;
    m_geometry.trackHeight = m_settings.trackHeight;

    m_transition = new QVariantAnimation(this);
    m_transition->setEasingCurve(QEasingCurve::OutCubic);
    connect(m_transition, &QVariantAnimation::valueChanged, this, [this](const QVariant& value) {
        m_scrubberX = value.toDouble();
        emit scrubberMoved(m_scrubberX);
    });

    m_connections.add(connect(&m_engine, &TimelineEngine::frameChanged, this, &TimelineRenderer::onFrameChanged));
    m_connections.add(connect(&m_engine, &TimelineEngine::seeked, this, &TimelineRenderer::onSeeked));
    m_connections.add(connect(&m_engine, &TimelineEngine::timelineChanged, this, &TimelineRenderer::onTimelineChanged));

    m_scrubberX = m_geometry.frameToX(m_engine.currentFrame());
}

TimelineRenderer::~TimelineRenderer()
{
    m_connections.disposeAll();
    m_transition->stop();
}

void TimelineRenderer::rebuild()
{
    // Algorithm: Compute visible range → Ruler → Tracks/segments → Drag ghost → Notify
    m_commands.clear();
    ++m_rebuildCount;

    const FrameRange visible = m_geometry.visibleFrames(m_settings.viewportBufferPx);
    buildRuler(visible);
    buildTracks(visible);
    buildPreview();

    qCDebug(cutlineRender, "Rebuilt %d commands for frames [%.1f, %.1f] at zoom %.3f",
            static_cast<int>(m_commands.size()), visible.first, visible.last, m_geometry.zoom);
    emit commandsChanged();
}

bool TimelineRenderer::isTransitionRunning() const
{
    return m_transition->state() == QAbstractAnimation::Running;
}

int TimelineRenderer::scrubberHeight() const
{
    return m_geometry.rulerHeight + m_timeline.trackCount() * m_geometry.trackHeight;
}

void TimelineRenderer::setViewport(int width, int height)
{
    if (width == m_geometry.viewportWidth && height == m_geometry.viewportHeight) {
        return;
    }
    m_geometry.viewportWidth = width;
    m_geometry.viewportHeight = height;

    const double bounded = qBound(minZoom(), m_geometry.zoom, maxZoom());
    if (bounded != m_geometry.zoom) {
        m_geometry.zoom = bounded;
        emit zoomChanged(bounded);
    }
    clampScroll();
    rebuild();
    refreshScrubber();
}

void TimelineRenderer::setScroll(double scrollX)
{
    const double previous = m_geometry.scrollX;
    m_geometry.scrollX = scrollX;
    clampScroll();
    if (m_geometry.scrollX == previous) {
        return;
    }
    rebuild();
    refreshScrubber();
}

void TimelineRenderer::setZoom(double zoom)
{
    const double clamped = qBound(minZoom(), zoom, maxZoom());
    if (clamped == m_geometry.zoom) {
        return;
    }

    // Keep the playhead in the middle of the viewport
    m_geometry.zoom = clamped;
    const double playheadContentX = m_engine.currentFrame() * m_geometry.pixelsPerFrame();
    m_geometry.scrollX = playheadContentX - m_geometry.visibleContentWidth() / 2.0;
    clampScroll();

    qCDebug(cutlineRender, "Zoom %.3f (range %.3f - %.3f)", clamped, minZoom(), maxZoom());
    rebuild();
    refreshScrubber();
    emit zoomChanged(clamped);
}

double TimelineRenderer::minZoom() const
{
    return TimelineGeometry::minZoomFor(m_timeline.totalFrames(), m_timeline.fps(),
                                        m_settings.basePixelsPerSecond, m_geometry.visibleContentWidth(),
                                        m_settings.minZoomFloor, m_settings.minZoomCeiling);
}

void TimelineRenderer::setInteractive(bool interactive)
{
    if (interactive) {
        cancelTransition();
    }
    m_interactive = interactive;
}

void TimelineRenderer::setSelection(const QString& segmentId)
{
    if (segmentId == m_selection) {
        return;
    }
    m_selection = segmentId;
    rebuild();
}

void TimelineRenderer::setPreview(const SegmentPreview& preview)
{
    m_preview = preview;
    m_hasPreview = true;
    rebuild();
}

void TimelineRenderer::clearPreview()
{
    if (!m_hasPreview) {
        return;
    }
    m_hasPreview = false;
    m_preview = SegmentPreview();
    rebuild();
}

HitResult TimelineRenderer::hitTest(const QPointF& pos, double edgeHandlePx) const
{
    HitResult hit;
    hit.frame = frameAtX(pos.x());

    if (pos.y() < m_geometry.rulerHeight) {
        hit.region = pos.x() >= m_geometry.headerWidth ? HitResult::Ruler : HitResult::None;
        return hit;
    }

    const int trackIndex = m_geometry.trackIndexAt(pos.y());
    if (trackIndex < 0 || trackIndex >= m_timeline.trackCount()) {
        return hit;
    }
    const Track& lane = m_timeline.tracks().at(trackIndex);
    hit.trackId = lane.id();
    if (pos.x() < m_geometry.headerWidth) {
        hit.region = HitResult::Header;
        return hit;
    }

    const Segment* segment = lane.segmentAt(m_geometry.xToFrame(pos.x()));
    if (!segment) {
        hit.region = HitResult::TrackBackground;
        return hit;
    }

    hit.segmentId = segment->id();
    const double fromStart = pos.x() - m_geometry.frameToX(static_cast<double>(segment->timelineStart()));
    const double toEnd = m_geometry.frameToX(static_cast<double>(segment->timelineEnd())) - pos.x();
    if (qMin(fromStart, toEnd) <= edgeHandlePx) {
        hit.region = fromStart <= toEnd ? HitResult::SegmentStartEdge : HitResult::SegmentEndEdge;
    } else {
        hit.region = HitResult::SegmentBody;
    }
    return hit;
}

double TimelineRenderer::frameAtX(double x) const
{
    return qBound(0.0, m_geometry.xToFrame(x), static_cast<double>(m_timeline.totalFrames()));
}

void TimelineRenderer::requestSeekAt(double x)
{
    emit seekRequested(frameAtX(x));
}

void TimelineRenderer::onFrameChanged(double frame)
{
    if (m_seekHandled) {
        m_seekHandled = false;
        return;
    }
    // Continuous update: follow the engine exactly
    cancelTransition();
    moveScrubberTo(m_geometry.frameToX(frame));
}

void TimelineRenderer::onSeeked(double frame)
{
    m_seekHandled = true;
    const double x = m_geometry.frameToX(frame);
    if (!m_engine.isPlaying() && !m_interactive) {
        animateScrubberTo(x);
    } else {
        cancelTransition();
        moveScrubberTo(x);
    }
}

void TimelineRenderer::onTimelineChanged(const Timeline& timeline)
{
    m_timeline = timeline;
    m_geometry.fps = timeline.fps();
    if (!m_selection.isEmpty() && !timeline.segment(m_selection)) {
        m_selection.clear();
    }

    const double bounded = qBound(minZoom(), m_geometry.zoom, maxZoom());
    if (bounded != m_geometry.zoom) {
        m_geometry.zoom = bounded;
        emit zoomChanged(bounded);
    }
    clampScroll();
    rebuild();
    refreshScrubber();
}

void TimelineRenderer::addRect(int x, int y, int width, int height, const QString& color)
{
    DrawCommand cmd;
    cmd.type = DrawCommand::RECT;
    cmd.x = x;
    cmd.y = y;
    cmd.width = width;
    cmd.height = height;
    cmd.color = QColor(color);
    m_commands.push_back(cmd);
}

void TimelineRenderer::addText(int x, int y, const QString& text, const QString& color)
{
    DrawCommand cmd;
    cmd.type = DrawCommand::TEXT;
    cmd.x = x;
    cmd.y = y;
    cmd.text = text;
    cmd.color = QColor(color);
    m_commands.push_back(cmd);
}

void TimelineRenderer::addLine(int x1, int y1, int x2, int y2, const QString& color, int width)
{
    DrawCommand cmd;
    cmd.type = DrawCommand::LINE;
    cmd.x = x1;
    cmd.y = y1;
    cmd.x2 = x2;
    cmd.y2 = y2;
    cmd.color = QColor(color);
    cmd.lineWidth = width;
    m_commands.push_back(cmd);
}

void TimelineRenderer::buildRuler(const FrameRange& visible)
{
    const int rulerHeight = m_geometry.rulerHeight;
    addRect(0, 0, m_geometry.viewportWidth, rulerHeight, "#444444");

    const double fps = m_timeline.fps();
    const double lastFrame = qMin(visible.last, static_cast<double>(m_timeline.totalFrames()));
    const int interval = TimelineGeometry::rulerIntervalSeconds(m_geometry.zoom);
    const int step = TimelineGeometry::showsMinorTicks(m_geometry.zoom) ? 1 : interval;

    const int firstSecond = static_cast<int>(std::floor(visible.first / fps));
    for (int second = (firstSecond / step) * step; second * fps <= lastFrame; second += step) {
        const int x = static_cast<int>(std::lround(m_geometry.frameToX(second * fps)));
        if (x < m_geometry.headerWidth) {
            continue;
        }
        if (second % interval == 0) {
            addLine(x, rulerHeight - 10, x, rulerHeight, "#cccccc", 1);
            addText(x + 2, rulerHeight - 15, timecodeLabel(second), "#cccccc");
        } else {
            addLine(x, rulerHeight - 5, x, rulerHeight, "#888888", 1);
        }
    }
}

void TimelineRenderer::buildTracks(const FrameRange& visible)
{
    const int header = m_geometry.headerWidth;
    const int laneWidth = qMax(0, m_geometry.viewportWidth - header);
    const int trackHeight = m_geometry.trackHeight;

    for (int i = 0; i < m_timeline.trackCount(); ++i) {
        const Track& lane = m_timeline.tracks().at(i);
        const int top = static_cast<int>(m_geometry.trackTop(i));

        addRect(header, top, laneWidth, trackHeight, i % 2 == 0 ? "#252525" : "#2a2a2a");

        // Segments are sorted: start at the first one ending inside the window
        const QList<Segment>& segments = lane.segments();
        for (int k = lane.firstSegmentEndingAfter(visible.first); k < segments.size(); ++k) {
            const Segment& segment = segments.at(k);
            if (static_cast<double>(segment.timelineStart()) > visible.last) {
                break;
            }
            const double left = m_geometry.frameToX(static_cast<double>(segment.timelineStart()));
            const double right = m_geometry.frameToX(static_cast<double>(segment.timelineEnd()));
            const int x = static_cast<int>(std::lround(qMax(left, static_cast<double>(header))));
            const int width = qMax(1, static_cast<int>(std::lround(right)) - x);
            if (right <= header) {
                continue;
            }

            const bool selected = segment.id() == m_selection;
            addRect(x, top + 5, width, trackHeight - 10, selected ? "#f5a623" : "#4a90e2");
            if (width > 40) {
                addText(x + 5, top + trackHeight / 2 + 4, clipLabel(m_timeline, segment), "#cccccc");
            }
        }

        addRect(0, top, header, trackHeight, "#333333");
        addText(10, top + trackHeight / 2 + 4, lane.id(), "#cccccc");
    }
}

void TimelineRenderer::buildPreview()
{
    if (!m_hasPreview) {
        return;
    }
    const int trackIndex = m_timeline.trackIndex(m_preview.trackId);
    if (trackIndex < 0) {
        return;
    }
    const int top = static_cast<int>(m_geometry.trackTop(trackIndex));
    const int x = static_cast<int>(std::lround(m_geometry.frameToX(static_cast<double>(m_preview.start))));
    const int width = qMax(1, static_cast<int>(std::lround(m_preview.length * m_geometry.pixelsPerFrame())));
    const QString color = m_preview.valid ? QStringLiteral("#7ed321") : QStringLiteral("#d0021b");

    addRect(x, top + 2, width, 3, color);
    addRect(x, top + m_geometry.trackHeight - 5, width, 3, color);
    addLine(x, top + 2, x, top + m_geometry.trackHeight - 2, color, 2);
    addLine(x + width, top + 2, x + width, top + m_geometry.trackHeight - 2, color, 2);
}

void TimelineRenderer::moveScrubberTo(double x)
{
    if (x == m_scrubberX) {
        return;
    }
    m_scrubberX = x;
    emit scrubberMoved(m_scrubberX);
}

void TimelineRenderer::animateScrubberTo(double x)
{
    m_transition->stop();
    if (m_settings.scrubberTransitionMs <= 0 || x == m_scrubberX) {
        moveScrubberTo(x);
        return;
    }
    m_transition->setStartValue(m_scrubberX);
    m_transition->setEndValue(x);
    m_transition->setDuration(m_settings.scrubberTransitionMs);
    m_transition->start();
}

void TimelineRenderer::cancelTransition()
{
    if (isTransitionRunning()) {
        m_transition->stop();
    }
}

void TimelineRenderer::refreshScrubber()
{
    cancelTransition();
    moveScrubberTo(m_geometry.frameToX(m_engine.currentFrame()));
}

void TimelineRenderer::clampScroll()
{
    m_geometry.scrollX = qBound(0.0, m_geometry.scrollX, m_geometry.maxScroll(m_timeline.totalFrames()));
}

} // namespace cutline
