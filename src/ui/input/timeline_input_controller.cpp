#include "timeline_input_controller.h"
#include "keyboard_shortcuts.h"

#include "core/edit/edit_session.h"
#include "core/edit/snap_engine.h"
#include "core/timeline/timeline_engine.h"
#include "ui/timeline/timeline_renderer.h"

#include <QCoreApplication>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QWindow>

#include <cmath>

namespace cutline {

TimelineInputController::TimelineInputController(TimelineEngine& engine, EditSession& session,
                                                 TimelineRenderer& renderer, KeyboardShortcuts& shortcuts,
                                                 const InputSettings& settings, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
    , m_session(session)
    , m_renderer(renderer)
    , m_shortcuts(shortcuts)
    , m_settings(settings)
{
    m_connections.add(connect(&m_renderer, &TimelineRenderer::seekRequested, &m_engine, &TimelineEngine::seek));
    m_connections.add(connect(&m_session, &EditSession::editRejected, this, &TimelineInputController::onEditRejected));
    m_connections.add(connect(&m_session, &EditSession::timelineChanged, this,
                              &TimelineInputController::onSessionTimelineChanged));
}

TimelineInputController::~TimelineInputController()
{
    cancelGesture();
    m_connections.disposeAll();
    for (const QPointer<QWidget>& widget : m_attached) {
        if (widget) {
            widget->removeEventFilter(this);
        }
    }
}

Disposer TimelineInputController::attach(QWidget* widget)
{
    if (!widget) {
        return Disposer();
    }
    widget->installEventFilter(this);
    m_attached.append(widget);
    qCDebug(cutlineInput, "Attached to %s", widget->metaObject()->className());

    QPointer<TimelineInputController> self(this);
    QPointer<QWidget> guard(widget);
    return Disposer([self, guard]() {
        if (!self) {
            return;
        }
        if (self->m_gestureWidget == guard) {
            self->cancelGesture();
        }
        if (guard) {
            guard->removeEventFilter(self);
        }
        self->m_attached.removeAll(guard);
    });
}

int TimelineInputController::attachedCount() const
{
    int count = 0;
    for (const QPointer<QWidget>& widget : m_attached) {
        if (widget) {
            ++count;
        }
    }
    return count;
}

bool TimelineInputController::pointerDown(const QPointF& pos, Qt::KeyboardModifiers modifiers)
{
    if (m_gesture.mode != Mode::Idle) {
        return true;
    }

    // Algorithm: Hit test → Pick gesture → Capture origin
    const HitResult hit = m_renderer.hitTest(pos, m_settings.edgeHandlePx);
    switch (hit.region) {
        case HitResult::None:
        case HitResult::Header:
            return false;

        case HitResult::Ruler:
        case HitResult::TrackBackground:
            if (hit.region == HitResult::TrackBackground) {
                select(QString());
            }
            beginScrub(pos);
            return true;

        case HitResult::SegmentBody:
        case HitResult::SegmentStartEdge:
        case HitResult::SegmentEndEdge:
            break;
    }

    const Segment* segment = m_session.timeline().segment(hit.segmentId);
    if (!segment) {
        return false;
    }

    select(hit.segmentId);
    m_gesture = Gesture();
    m_gesture.pressPos = pos;
    m_gesture.segmentId = hit.segmentId;
    m_gesture.trackId = hit.trackId;
    m_gesture.targetTrackId = hit.trackId;
    m_gesture.originStart = segment->timelineStart();
    m_gesture.length = segment->duration();
    m_gesture.proposedStart = segment->timelineStart();

    if (hit.region == HitResult::SegmentBody) {
        m_gesture.mode = Mode::PendingSegment;
    } else {
        m_gesture.mode = Mode::Trimming;
        m_gesture.edge = hit.region == HitResult::SegmentStartEdge ? TrimEdge::Start : TrimEdge::End;
        m_gesture.ripple = modifiers.testFlag(Qt::ShiftModifier);
        m_gesture.proposedFrame = m_gesture.edge == TrimEdge::Start ? segment->timelineStart()
                                                                   : segment->timelineEnd();
    }
    installDragFilter();
    return true;
}

bool TimelineInputController::pointerMove(const QPointF& pos, Qt::KeyboardModifiers modifiers)
{
    Q_UNUSED(modifiers)

    switch (m_gesture.mode) {
        case Mode::Idle:
            return false;

        case Mode::Scrubbing:
            m_gesture.moved = true;
            m_renderer.requestSeekAt(pos.x());
            return true;

        case Mode::PendingSegment:
            if (std::abs(pos.x() - m_gesture.pressPos.x()) < m_settings.dragThresholdPx &&
                std::abs(pos.y() - m_gesture.pressPos.y()) < m_settings.dragThresholdPx) {
                return true;
            }
            m_gesture.mode = Mode::Moving;
            m_gesture.moved = true;
            qCDebug(cutlineInput, "Move drag started on %s", qPrintable(m_gesture.segmentId));
            updateMove(pos);
            return true;

        case Mode::Moving:
            updateMove(pos);
            return true;

        case Mode::Trimming:
            if (!m_gesture.moved &&
                std::abs(pos.x() - m_gesture.pressPos.x()) < m_settings.dragThresholdPx) {
                return true;
            }
            m_gesture.moved = true;
            updateTrim(pos);
            return true;
    }
    return false;
}

bool TimelineInputController::pointerUp(const QPointF& pos, Qt::KeyboardModifiers modifiers)
{
    Q_UNUSED(modifiers)

    switch (m_gesture.mode) {
        case Mode::Idle:
            return false;

        case Mode::Scrubbing:
            m_renderer.requestSeekAt(pos.x());
            endScrub();
            break;

        case Mode::PendingSegment:
            // Plain click: selection already happened on press
            break;

        case Mode::Moving:
            updateMove(pos);
            commitMove();
            break;

        case Mode::Trimming:
            if (m_gesture.moved) {
                updateTrim(pos);
                commitTrim();
            }
            break;
    }
    finishGesture();
    return true;
}

void TimelineInputController::cancelGesture()
{
    if (m_gesture.mode == Mode::Scrubbing) {
        endScrub();
    }
    finishGesture();
}

void TimelineInputController::beginScrub(const QPointF& pos)
{
    m_gesture = Gesture();
    m_gesture.mode = Mode::Scrubbing;
    m_gesture.pressPos = pos;
    m_gesture.wasPlaying = m_engine.isPlaying();

    m_engine.pause();
    m_renderer.setInteractive(true);
    m_renderer.requestSeekAt(pos.x());
    installDragFilter();

    qCDebug(cutlineInput, "Scrub started at %.2f (was %s)", m_engine.currentFrame(),
            m_gesture.wasPlaying ? "playing" : "paused");
}

void TimelineInputController::endScrub()
{
    m_renderer.setInteractive(false);
    // Released at the end: play() would restart from frame 0, so stay paused there
    const bool atEnd = m_engine.currentFrame() >= static_cast<double>(m_engine.totalFrames());
    if (m_gesture.wasPlaying && !atEnd) {
        m_engine.play();
    }
    qCDebug(cutlineInput, "Scrub ended at %.2f", m_engine.currentFrame());
}

void TimelineInputController::updateMove(const QPointF& pos)
{
    const Timeline& timeline = m_session.timeline();
    const double pixelsPerFrame = m_renderer.geometry().pixelsPerFrame();
    const qint64 delta = std::llround((pos.x() - m_gesture.pressPos.x()) / pixelsPerFrame);

    // Vertical drag retargets the track lane under the pointer
    const int trackIndex = m_renderer.geometry().trackIndexAt(pos.y());
    if (trackIndex >= 0 && trackIndex < timeline.trackCount()) {
        m_gesture.targetTrackId = timeline.tracks().at(trackIndex).id();
    }

    const qint64 requested = qMax<qint64>(0, m_gesture.originStart + delta);
    const SnapResult snapped =
        snapEngineFor(m_gesture.segmentId).snapRange(requested, m_gesture.length, snapThresholdFrames());
    m_gesture.proposedStart = qMax<qint64>(0, snapped.frame);

    // Dry run against the latest snapshot decides the preview colour
    const auto result = edit::move(timeline, m_gesture.segmentId, m_gesture.proposedStart, m_gesture.targetTrackId);
    m_gesture.valid = result.is_ok();

    SegmentPreview preview;
    preview.segmentId = m_gesture.segmentId;
    preview.trackId = m_gesture.targetTrackId;
    preview.start = m_gesture.proposedStart;
    preview.length = m_gesture.length;
    preview.valid = m_gesture.valid;
    m_renderer.setPreview(preview);
}

void TimelineInputController::updateTrim(const QPointF& pos)
{
    const Timeline& timeline = m_session.timeline();
    const qint64 requested = qMax<qint64>(0, std::llround(m_renderer.geometry().xToFrame(pos.x())));
    const SnapResult snapped = snapEngineFor(m_gesture.segmentId).snap(requested, snapThresholdFrames());
    m_gesture.proposedFrame = snapped.frame;

    TrimOptions options;
    options.ripple = m_gesture.ripple;
    const auto result = edit::trim(timeline, m_gesture.segmentId, m_gesture.edge, m_gesture.proposedFrame, options);

    SegmentPreview preview;
    preview.segmentId = m_gesture.segmentId;
    preview.trackId = m_gesture.trackId;
    if (result.is_ok()) {
        const Segment* trimmed = result.value().timeline.segment(m_gesture.segmentId);
        preview.start = trimmed ? trimmed->timelineStart() : m_gesture.originStart;
        preview.length = trimmed ? trimmed->duration() : m_gesture.length;
        preview.valid = true;
    } else {
        preview.start = m_gesture.edge == TrimEdge::Start ? m_gesture.proposedFrame : m_gesture.originStart;
        preview.length = m_gesture.edge == TrimEdge::Start
                             ? m_gesture.originStart + m_gesture.length - m_gesture.proposedFrame
                             : m_gesture.proposedFrame - m_gesture.originStart;
        preview.valid = false;
    }
    m_gesture.valid = preview.valid;
    m_renderer.setPreview(preview);
}

void TimelineInputController::commitMove()
{
    if (m_gesture.proposedStart == m_gesture.originStart && m_gesture.targetTrackId == m_gesture.trackId) {
        return;
    }
    qCDebug(cutlineInput, "Committing move of %s to %lld on %s", qPrintable(m_gesture.segmentId),
            static_cast<long long>(m_gesture.proposedStart), qPrintable(m_gesture.targetTrackId));
    // Rejections come back through editRejected
    m_session.move(m_gesture.segmentId, m_gesture.proposedStart, m_gesture.targetTrackId);
}

void TimelineInputController::commitTrim()
{
    TrimOptions options;
    options.ripple = m_gesture.ripple;
    qCDebug(cutlineInput, "Committing %s trim of %s to %lld", m_gesture.ripple ? "ripple" : "plain",
            qPrintable(m_gesture.segmentId), static_cast<long long>(m_gesture.proposedFrame));
    m_session.trim(m_gesture.segmentId, m_gesture.edge, m_gesture.proposedFrame, options);
}

void TimelineInputController::finishGesture()
{
    const bool hadPreview = m_gesture.mode == Mode::Moving || m_gesture.mode == Mode::Trimming;
    m_gesture = Gesture();
    removeDragFilter();
    if (hadPreview) {
        m_renderer.clearPreview();
    }
}

SnapEngine TimelineInputController::snapEngineFor(const QString& segmentId) const
{
    SnapEngine snap(m_session.timeline(), segmentId);
    if (m_settings.snapToPlayhead) {
        snap.setPlayhead(m_engine.displayFrame());
    }
    snap.setSnapToSeconds(m_settings.snapToSeconds);
    return snap;
}

double TimelineInputController::snapThresholdFrames() const
{
    return SnapEngine::pixelsToFrames(m_settings.snapThresholdPx, m_renderer.geometry().pixelsPerFrame());
}

void TimelineInputController::installDragFilter()
{
    if (m_dragFilterInstalled || !QCoreApplication::instance()) {
        return;
    }
    // Keeps the drag alive when the pointer leaves the widget
    QCoreApplication::instance()->installEventFilter(this);
    m_dragFilterInstalled = true;
}

void TimelineInputController::removeDragFilter()
{
    if (!m_dragFilterInstalled) {
        return;
    }
    if (QCoreApplication::instance()) {
        QCoreApplication::instance()->removeEventFilter(this);
    }
    m_dragFilterInstalled = false;
    m_gestureWidget.clear();
}

QPointF TimelineInputController::widgetPosition(const QObject* watched, const QEvent* event) const
{
    const auto* mouse = static_cast<const QMouseEvent*>(event);
    if (m_gestureWidget && watched != m_gestureWidget.data()) {
        return m_gestureWidget->mapFromGlobal(mouse->globalPosition());
    }
    return mouse->position();
}

bool TimelineInputController::eventFilter(QObject* watched, QEvent* event)
{
    const bool fromAttached = watched->isWidgetType() && m_attached.contains(static_cast<QWidget*>(watched));

    switch (event->type()) {
        case QEvent::MouseButtonPress: {
            if (!fromAttached) {
                break;
            }
            const auto* mouse = static_cast<QMouseEvent*>(event);
            if (mouse->button() != Qt::LeftButton) {
                break;
            }
            const bool handled = pointerDown(mouse->position(), mouse->modifiers());
            if (handled) {
                m_gestureWidget = static_cast<QWidget*>(watched);
            }
            return handled;
        }

        case QEvent::MouseMove:
        case QEvent::MouseButtonRelease: {
            if (m_gesture.mode == Mode::Idle) {
                break;
            }
            // While the drag filter is up it sees every event first; windows
            // forward to their widgets, so only widget deliveries count
            if (m_dragFilterInstalled && (qobject_cast<QWindow*>(watched) || !watched->isWidgetType())) {
                break;
            }
            const auto* mouse = static_cast<QMouseEvent*>(event);
            const QPointF pos = widgetPosition(watched, event);
            if (event->type() == QEvent::MouseMove) {
                return pointerMove(pos, mouse->modifiers());
            }
            if (mouse->button() != Qt::LeftButton) {
                break;
            }
            return pointerUp(pos, mouse->modifiers());
        }

        case QEvent::KeyPress:
            if (!fromAttached) {
                break;
            }
            return handleKey(static_cast<QKeyEvent*>(event));

        default:
            break;
    }
    return QObject::eventFilter(watched, event);
}

bool TimelineInputController::handleKey(const QKeyEvent* event)
{
    const QString action = m_shortcuts.actionFor(event);
    if (action.isEmpty()) {
        return false;
    }
    return triggerAction(action);
}

bool TimelineInputController::triggerAction(const QString& actionId)
{
    using namespace shortcut_ids;
    qCDebug(cutlineInput, "Action %s", qPrintable(actionId));

    if (actionId == TogglePlay) {
        m_engine.togglePlayback();
    } else if (actionId == StepBack) {
        m_engine.stepFrames(-m_settings.arrowStepFrames);
    } else if (actionId == StepForward) {
        m_engine.stepFrames(m_settings.arrowStepFrames);
    } else if (actionId == StepBackLarge) {
        m_engine.stepFrames(-m_settings.largeStepFrames);
    } else if (actionId == StepForwardLarge) {
        m_engine.stepFrames(m_settings.largeStepFrames);
    } else if (actionId == GoToStart) {
        m_engine.seek(0.0);
    } else if (actionId == GoToEnd) {
        m_engine.seek(static_cast<double>(m_engine.totalFrames()));
    } else if (actionId == MarkIn) {
        setMarkIn(m_engine.displayFrame());
    } else if (actionId == MarkOut) {
        setMarkOut(m_engine.displayFrame());
    } else if (actionId == ClearMarks) {
        clearMarks();
    } else if (actionId == Split) {
        return splitAtPlayhead();
    } else if (actionId == SplitAtMarks) {
        return splitAtMarks();
    } else if (actionId == Delete) {
        return deleteSelection(false);
    } else if (actionId == RippleDelete) {
        return deleteSelection(true);
    } else if (actionId == Undo) {
        return m_session.undo().is_ok();
    } else if (actionId == Redo) {
        return m_session.redo().is_ok();
    } else if (actionId == ZoomIn) {
        m_renderer.zoomIn();
    } else if (actionId == ZoomOut) {
        m_renderer.zoomOut();
    } else {
        qCWarning(cutlineInput, "Unknown action: %s", qPrintable(actionId));
        return false;
    }
    return true;
}

void TimelineInputController::select(const QString& segmentId)
{
    if (segmentId == m_selection) {
        return;
    }
    m_selection = segmentId;
    m_renderer.setSelection(segmentId);
    emit selectionChanged(segmentId);
}

void TimelineInputController::setMarkIn(qint64 frame)
{
    m_markIn = frame;
    if (m_markOut && *m_markOut <= frame) {
        m_markOut.reset();
    }
    emit marksChanged();
}

void TimelineInputController::setMarkOut(qint64 frame)
{
    m_markOut = frame;
    if (m_markIn && *m_markIn >= frame) {
        m_markIn.reset();
    }
    emit marksChanged();
}

void TimelineInputController::clearMarks()
{
    if (!m_markIn && !m_markOut) {
        return;
    }
    m_markIn.reset();
    m_markOut.reset();
    emit marksChanged();
}

std::optional<TimelineInputController::MarkRange> TimelineInputController::takeMarkRange()
{
    if (!m_markIn || !m_markOut) {
        return std::nullopt;
    }
    MarkRange range;
    range.in = *m_markIn;
    range.out = *m_markOut;
    m_markIn.reset();
    m_markOut.reset();

    qCInfo(cutlineInput, "Mark range [%lld, %lld) taken", static_cast<long long>(range.in),
           static_cast<long long>(range.out));
    emit marksChanged();
    emit markRangeTaken(range.in, range.out);
    return range;
}

bool TimelineInputController::splitAtPlayhead()
{
    const qint64 frame = m_engine.displayFrame();
    const Timeline& timeline = m_session.timeline();

    // Selected segment wins; otherwise the first track with a segment under the playhead
    QString target;
    const Segment* selected = m_selection.isEmpty() ? nullptr : timeline.segment(m_selection);
    if (selected && selected->timelineStart() < frame && frame < selected->timelineEnd()) {
        target = selected->id();
    } else {
        for (const Track& track : timeline.tracks()) {
            const Segment* segment = track.segmentAt(static_cast<double>(frame));
            if (segment && segment->timelineStart() < frame) {
                target = segment->id();
                break;
            }
        }
    }

    if (target.isEmpty()) {
        onEditRejected(QStringLiteral("split"), QStringLiteral("No segment under the playhead at frame %1").arg(frame));
        return false;
    }
    return m_session.split(target, frame).is_ok();
}

bool TimelineInputController::splitAtMarks()
{
    if (!m_markIn || !m_markOut) {
        onEditRejected(QStringLiteral("split"), QStringLiteral("Set both In and Out marks first"));
        return false;
    }

    // Algorithm: Split every track at In → Split every track at Out → Consume range
    for (const qint64 frame : {*m_markIn, *m_markOut}) {
        QStringList targets;
        for (const Track& track : m_session.timeline().tracks()) {
            const Segment* segment = track.segmentAt(static_cast<double>(frame));
            if (segment && segment->timelineStart() < frame) {
                targets.append(segment->id());
            }
        }
        for (const QString& segmentId : targets) {
            m_session.split(segmentId, frame);
        }
    }
    return takeMarkRange().has_value();
}

bool TimelineInputController::deleteSelection(bool ripple)
{
    if (m_selection.isEmpty()) {
        return false;
    }
    const auto result = m_session.deleteSegment(m_selection, ripple);
    if (result.is_error()) {
        return false;
    }
    select(QString());
    return true;
}

void TimelineInputController::onEditRejected(const QString& operation, const QString& message)
{
    m_lastFeedback = message;
    qCInfo(cutlineInput, "%s refused: %s", qPrintable(operation), qPrintable(message));
    emit feedback(message);
}

void TimelineInputController::onSessionTimelineChanged()
{
    if (!m_selection.isEmpty() && !m_session.timeline().segment(m_selection)) {
        select(QString());
    }
}

} // namespace cutline
