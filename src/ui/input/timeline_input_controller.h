#pragma once

#include "core/common/disposer.h"
#include "core/config/editor_settings.h"
#include "core/edit/edit_operations.h"

#include <QList>
#include <QObject>
#include <QPointF>
#include <QPointer>
#include <QString>
#include <QWidget>

#include <optional>

class QKeyEvent;

namespace cutline {

class EditSession;
class KeyboardShortcuts;
class SnapEngine;
class TimelineEngine;
class TimelineRenderer;

/**
 * TimelineInputController: maps pointer and keyboard gestures on the timeline
 * surface to engine commands and session edits.
 *
 * Pointer gestures:
 * - ruler / track background: scrub (playback paused for the drag, restored after)
 * - segment body: click selects, drag past the threshold moves with a snapped preview
 * - segment edge: trim with a snapped preview, Shift for ripple
 *
 * Previews are dry runs of the edit operations against the session's latest
 * snapshot; only the release commits through EditSession.
 */
class TimelineInputController : public QObject
{
    Q_OBJECT

public:
    enum class Mode {
        Idle,
        Scrubbing,
        PendingSegment,
        Moving,
        Trimming
    };

    struct MarkRange {
        qint64 in = 0;
        qint64 out = 0;
    };

    TimelineInputController(TimelineEngine& engine, EditSession& session, TimelineRenderer& renderer,
                            KeyboardShortcuts& shortcuts, const InputSettings& settings = InputSettings(),
                            QObject* parent = nullptr);
    ~TimelineInputController() override;

    // Installs the event filter on widget; disposing removes it again
    Disposer attach(QWidget* widget);
    int attachedCount() const;

    // Pointer gestures in widget coordinates
    bool pointerDown(const QPointF& pos, Qt::KeyboardModifiers modifiers = Qt::NoModifier);
    bool pointerMove(const QPointF& pos, Qt::KeyboardModifiers modifiers = Qt::NoModifier);
    bool pointerUp(const QPointF& pos, Qt::KeyboardModifiers modifiers = Qt::NoModifier);
    void cancelGesture();
    Mode mode() const { return m_gesture.mode; }
    bool isDragFilterInstalled() const { return m_dragFilterInstalled; }

    // Keyboard
    bool handleKey(const QKeyEvent* event);
    bool triggerAction(const QString& actionId);

    // Selection
    void select(const QString& segmentId);
    QString selection() const { return m_selection; }

    // Marks
    std::optional<qint64> markIn() const { return m_markIn; }
    std::optional<qint64> markOut() const { return m_markOut; }
    std::optional<MarkRange> takeMarkRange();

    QString lastFeedback() const { return m_lastFeedback; }

signals:
    void selectionChanged(const QString& segmentId);
    void marksChanged();
    void markRangeTaken(qint64 in, qint64 out);
    void feedback(const QString& message);

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    struct Gesture {
        Mode mode = Mode::Idle;
        QPointF pressPos;
        bool wasPlaying = false;
        bool moved = false;
        QString segmentId;
        QString trackId;
        TrimEdge edge = TrimEdge::End;
        bool ripple = false;
        qint64 originStart = 0;
        qint64 length = 0;
        QString targetTrackId;
        qint64 proposedStart = 0;
        qint64 proposedFrame = 0;
        bool valid = true;
    };

    void beginScrub(const QPointF& pos);
    void endScrub();
    void updateMove(const QPointF& pos);
    void updateTrim(const QPointF& pos);
    void commitMove();
    void commitTrim();
    void finishGesture();

    SnapEngine snapEngineFor(const QString& segmentId) const;
    double snapThresholdFrames() const;

    void installDragFilter();
    void removeDragFilter();
    QPointF widgetPosition(const QObject* watched, const QEvent* event) const;

    void setMarkIn(qint64 frame);
    void setMarkOut(qint64 frame);
    void clearMarks();
    bool splitAtPlayhead();
    bool splitAtMarks();
    bool deleteSelection(bool ripple);

    void onEditRejected(const QString& operation, const QString& message);
    void onSessionTimelineChanged();

    TimelineEngine& m_engine;
    EditSession& m_session;
    TimelineRenderer& m_renderer;
    KeyboardShortcuts& m_shortcuts;
    InputSettings m_settings;

    Gesture m_gesture;
    QPointer<QWidget> m_gestureWidget;
    bool m_dragFilterInstalled = false;
    QList<QPointer<QWidget>> m_attached;

    QString m_selection;
    std::optional<qint64> m_markIn;
    std::optional<qint64> m_markOut;
    QString m_lastFeedback;

    DisposerBag m_connections;
};

} // namespace cutline
