#pragma once

#include "edit_operations.h"
#include "core/config/editor_settings.h"
#include "core/models/timeline_diff.h"

#include <QJsonObject>
#include <QList>
#include <QLoggingCategory>
#include <QObject>
#include <QQueue>
#include <QString>
#include <QStringList>

#include <functional>

Q_DECLARE_LOGGING_CATEGORY(cutlineSession)

namespace cutline {

// One committed change to the session's timeline, as published to the journal
struct EditRecord {
    quint64 sequence = 0;
    QString operation;          // split, trim, delete, move, insert_clip, undo, redo, load
    QJsonObject parameters;
    QStringList affectedSegmentIds;
    TimelineDiff diff;
};

/**
 * EditSession: the single writer of a Timeline.
 *
 * Each request runs against the latest snapshot. Requests issued while an
 * edit is being applied (typically from a timelineChanged handler) are queued
 * in FIFO order, answered with Deferred and reported through
 * editApplied / editRejected once they run.
 */
class EditSession : public QObject
{
    Q_OBJECT

public:
    explicit EditSession(const Timeline& initial = Timeline(),
                         const SessionSettings& settings = SessionSettings(),
                         QObject* parent = nullptr);

    const Timeline& timeline() const { return m_timeline; }

    // Edit operations
    Result<EditOutcome> split(const QString& segmentId, qint64 atFrame);
    Result<EditOutcome> trim(const QString& segmentId, TrimEdge edge, qint64 newFrame,
                             const TrimOptions& options = TrimOptions());
    Result<EditOutcome> deleteSegment(const QString& segmentId, bool ripple = false);
    Result<EditOutcome> move(const QString& segmentId, qint64 newStart, const QString& targetTrackId = QString());
    Result<EditOutcome> insertClip(const Clip& clip, const QString& trackId, qint64 atFrame);

    // History
    Result<EditOutcome> undo();
    Result<EditOutcome> redo();
    bool canUndo() const { return !m_undoStack.isEmpty(); }
    bool canRedo() const { return !m_redoStack.isEmpty(); }
    int undoDepth() const { return m_undoStack.size(); }
    int redoDepth() const { return m_redoStack.size(); }

    // Replaces the timeline wholesale (project load) and clears history
    Result<EditOutcome> load(const Timeline& timeline);

    bool isApplying() const { return m_applying; }
    int pendingCount() const { return m_pending.size(); }
    quint64 sequence() const { return m_sequence; }

signals:
    void timelineChanged(const cutline::Timeline& timeline);
    void editCommitted(const cutline::EditRecord& record);
    void editApplied(const QString& operation, const QStringList& affectedSegmentIds);
    void editRejected(const QString& operation, const QString& message);

private:
    enum class RequestKind {
        Edit,
        Undo,
        Redo,
        Load
    };

    using Operation = std::function<Result<EditOutcome>(const Timeline&)>;

    struct Request {
        RequestKind kind = RequestKind::Edit;
        QString operation;
        QJsonObject parameters;
        Operation apply;
    };

    Result<EditOutcome> submit(const Request& request);
    Result<EditOutcome> execute(const Request& request);
    Result<EditOutcome> runRequest(const Request& request, const Timeline& before);
    void pushUndo(const Timeline& snapshot);
    void drainQueue();

    Timeline m_timeline;
    SessionSettings m_settings;
    QList<Timeline> m_undoStack;
    QList<Timeline> m_redoStack;
    QQueue<Request> m_pending;
    bool m_applying = false;
    bool m_draining = false;
    quint64 m_sequence = 0;
};

} // namespace cutline

Q_DECLARE_METATYPE(cutline::EditRecord)
