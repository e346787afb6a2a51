#pragma once

#include "core/common/disposer.h"

#include <QPainter>
#include <QWidget>

namespace cutline {

class TimelineRenderer;

/**
 * TimelineView - rendering surface for a TimelineRenderer.
 *
 * C++ responsibilities:
 * - Execute the renderer's draw list in paintEvent()
 * - Paint the scrubber as a translated overlay, repainting only the strip
 *   it leaves and enters
 * - Forward viewport size, wheel scroll and Ctrl+wheel zoom
 *
 * Pointer and keyboard handling is installed separately by
 * TimelineInputController through an event filter.
 */
class TimelineView : public QWidget
{
    Q_OBJECT

public:
    explicit TimelineView(TimelineRenderer& renderer, QWidget* parent = nullptr);
    ~TimelineView() override;

    TimelineRenderer& renderer() const { return renderer_; }

    // Qt layout system integration
    QSize sizeHint() const override;

    // Scrubber strip in widget coordinates (line plus handle)
    QRect scrubberRect(double x) const;

    int fullRepaintCount() const { return full_repaint_count_; }

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;

private:
    void executeDrawingCommands(QPainter& painter);
    void paintScrubber(QPainter& painter);
    void onScrubberMoved(double x);

    TimelineRenderer& renderer_;
    double painted_scrubber_x_ = 0.0;
    int full_repaint_count_ = 0;
    DisposerBag connections_;
};

} // namespace cutline
