#include "timeline_view.h"
#include "timeline_renderer.h"

#include <QPaintEvent>
#include <QResizeEvent>
#include <QWheelEvent>

#include <cmath>

namespace cutline {

namespace {

constexpr int kScrubberHandleWidth = 10;
constexpr int kScrubberLineWidth = 2;
const char* const kScrubberColor = "#ff6b6b";

} // namespace

TimelineView::TimelineView(TimelineRenderer& renderer, QWidget* parent)
    : QWidget(parent)
    , renderer_(renderer)
{
    // No hardcoded minimum size - let layout system and content determine size
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);

    painted_scrubber_x_ = renderer_.scrubberX();
    connections_.add(connect(&renderer_, &TimelineRenderer::commandsChanged, this, [this]() { update(); }));
    connections_.add(connect(&renderer_, &TimelineRenderer::scrubberMoved, this, &TimelineView::onScrubberMoved));
}

TimelineView::~TimelineView()
{
    connections_.disposeAll();
}

QSize TimelineView::sizeHint() const
{
    // Ruler plus every track lane
    return QSize(800, renderer_.scrubberHeight());
}

QRect TimelineView::scrubberRect(double x) const
{
    const int left = static_cast<int>(std::floor(x)) - kScrubberHandleWidth / 2 - 1;
    return QRect(left, 0, kScrubberHandleWidth + 2, height());
}

void TimelineView::paintEvent(QPaintEvent* event)
{
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);

    if (event->rect() == rect()) {
        ++full_repaint_count_;
    }

    // Fill background
    painter.fillRect(rect(), QColor(35, 35, 35));

    executeDrawingCommands(painter);
    paintScrubber(painter);
}

void TimelineView::executeDrawingCommands(QPainter& painter)
{
    for (const auto& cmd : renderer_.commands()) {
        switch (cmd.type) {
            case DrawCommand::RECT:
                painter.fillRect(cmd.x, cmd.y, cmd.width, cmd.height, cmd.color);
                break;

            case DrawCommand::TEXT:
                painter.setPen(cmd.color);
                painter.drawText(cmd.x, cmd.y, cmd.text);
                break;

            case DrawCommand::LINE:
                painter.setPen(QPen(cmd.color, cmd.lineWidth));
                painter.drawLine(cmd.x, cmd.y, cmd.x2, cmd.y2);
                break;
        }
    }
}

void TimelineView::paintScrubber(QPainter& painter)
{
    const double x = renderer_.scrubberX();
    if (x < renderer_.geometry().headerWidth) {
        return;
    }

    // Drawn at the origin and translated, so moving it never touches the draw list
    const QColor color(kScrubberColor);
    painter.save();
    painter.translate(x, 0);
    painter.setPen(QPen(color, kScrubberLineWidth));
    painter.drawLine(QPointF(0, 0), QPointF(0, renderer_.scrubberHeight()));
    painter.fillRect(QRectF(-kScrubberHandleWidth / 2.0, 0, kScrubberHandleWidth, kScrubberHandleWidth), color);
    painter.restore();
    painted_scrubber_x_ = x;
}

void TimelineView::onScrubberMoved(double x)
{
    update(scrubberRect(painted_scrubber_x_).united(scrubberRect(x)));
}

void TimelineView::resizeEvent(QResizeEvent* event)
{
    renderer_.setViewport(event->size().width(), event->size().height());
    QWidget::resizeEvent(event);
}

void TimelineView::wheelEvent(QWheelEvent* event)
{
    const QPoint delta = event->angleDelta();
    if (event->modifiers() & Qt::ControlModifier) {
        if (delta.y() > 0) {
            renderer_.zoomIn();
        } else if (delta.y() < 0) {
            renderer_.zoomOut();
        }
    } else {
        // Vertical wheel scrolls horizontally too: the timeline only scrolls in x
        const int step = delta.x() != 0 ? delta.x() : delta.y();
        renderer_.setScroll(renderer_.scroll() - step);
    }
    event->accept();
}

} // namespace cutline
