#pragma once

#include "timeline_geometry.h"
#include "core/common/disposer.h"
#include "core/config/editor_settings.h"
#include "core/models/timeline.h"

#include <QColor>
#include <QLoggingCategory>
#include <QObject>
#include <QPointF>
#include <QString>

#include <vector>

class QVariantAnimation;

Q_DECLARE_LOGGING_CATEGORY(cutlineRender)

namespace cutline {

class TimelineEngine;

struct DrawCommand {
    enum Type { RECT, TEXT, LINE } type;
    int x = 0, y = 0, width = 0, height = 0;
    int x2 = 0, y2 = 0; // For lines
    QString text;
    QColor color;
    int lineWidth = 1;
};

// Ghost of an in-progress drag (move or trim)
struct SegmentPreview {
    QString segmentId;
    QString trackId;
    qint64 start = 0;
    qint64 length = 0;
    bool valid = true;
};

struct HitResult {
    enum Region { None, Ruler, Header, TrackBackground, SegmentBody, SegmentStartEdge, SegmentEndEdge };

    Region region = None;
    QString trackId;
    QString segmentId;
    double frame = 0.0;
};

/**
 * TimelineRenderer: virtualized draw lists for the ruler, tracks and segments.
 *
 * Only the frames inside the scroll viewport (plus a buffer) produce
 * commands, so the list size is independent of zoom and duration.
 * Playback ticks never rebuild the list: they only move the scrubber
 * translation. Discrete seeks while idle animate the scrubber; continuous
 * updates cancel the animation.
 */
class TimelineRenderer : public QObject
{
    Q_OBJECT

public:
    explicit TimelineRenderer(TimelineEngine& engine,
                              const RendererSettings& settings = RendererSettings(),
                              QObject* parent = nullptr);
    ~TimelineRenderer() override;

    // Drawing command interface
    const std::vector<DrawCommand>& commands() const { return m_commands; }
    int rebuildCount() const { return m_rebuildCount; }
    void rebuild();

    // Scrubber layer
    double scrubberX() const { return m_scrubberX; }
    bool isTransitionRunning() const;
    int scrubberHeight() const;

    // Viewport
    void setViewport(int width, int height);
    void setScroll(double scrollX);
    double scroll() const { return m_geometry.scrollX; }
    const TimelineGeometry& geometry() const { return m_geometry; }

    // Zoom (clamped to [minZoom, maxZoom], keeps the scrubber centred)
    void setZoom(double zoom);
    void zoomIn() { setZoom(zoom() * m_settings.zoomInFactor); }
    void zoomOut() { setZoom(zoom() * m_settings.zoomOutFactor); }
    double zoom() const { return m_geometry.zoom; }
    double minZoom() const;
    double maxZoom() const { return m_settings.maxZoom; }

    // Interaction state
    void setInteractive(bool interactive);
    bool isInteractive() const { return m_interactive; }
    void setSelection(const QString& segmentId);
    QString selection() const { return m_selection; }
    void setPreview(const SegmentPreview& preview);
    void clearPreview();
    bool hasPreview() const { return m_hasPreview; }
    const SegmentPreview& preview() const { return m_preview; }

    HitResult hitTest(const QPointF& pos, double edgeHandlePx) const;
    double frameAtX(double x) const;
    void requestSeekAt(double x);

signals:
    void commandsChanged();
    void scrubberMoved(double x);
    void zoomChanged(double zoom);
    void seekRequested(double frame);

private:
    void onFrameChanged(double frame);
    void onSeeked(double frame);
    void onTimelineChanged(const Timeline& timeline);

    void addRect(int x, int y, int width, int height, const QString& color);
    void addText(int x, int y, const QString& text, const QString& color);
    void addLine(int x1, int y1, int x2, int y2, const QString& color, int width = 1);

    void buildRuler(const FrameRange& visible);
    void buildTracks(const FrameRange& visible);
    void buildPreview();

    void moveScrubberTo(double x);
    void animateScrubberTo(double x);
    void cancelTransition();
    void refreshScrubber();
    void clampScroll();

    TimelineEngine& m_engine;
    RendererSettings m_settings;
    TimelineGeometry m_geometry;
    Timeline m_timeline;

    std::vector<DrawCommand> m_commands;
    int m_rebuildCount = 0;

    double m_scrubberX = 0.0;
    QVariantAnimation* m_transition = nullptr;
    bool m_seekHandled = false;

    bool m_interactive = false;
    QString m_selection;
    SegmentPreview m_preview;
    bool m_hasPreview = false;

    DisposerBag m_connections;
};

} // namespace cutline
