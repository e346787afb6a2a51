#include "edit_session.h"

#include <QScopedValueRollback>

Q_LOGGING_CATEGORY(cutlineSession, "cutline.session")

namespace cutline {

namespace {

QString edgeName(TrimEdge edge)
{
    return edge == TrimEdge::Start ? QStringLiteral("start") : QStringLiteral("end");
}

} // namespace

EditSession::EditSession(const Timeline& initial, const SessionSettings& settings, QObject* parent)
    : QObject(parent)
    , m_timeline(initial)
    , m_settings(settings)
{
    qCDebug(cutlineSession, "Initializing EditSession (undo depth %d)", m_settings.undoDepth);
}

Result<EditOutcome> EditSession::split(const QString& segmentId, qint64 atFrame)
{
    Request request;
    request.operation = QStringLiteral("split");
    request.parameters = QJsonObject{{"segmentId", segmentId}, {"atFrame", static_cast<double>(atFrame)}};
    request.apply = [segmentId, atFrame](const Timeline& timeline) {
        return edit::split(timeline, segmentId, atFrame);
    };
    return submit(request);
}

Result<EditOutcome> EditSession::trim(const QString& segmentId, TrimEdge edge, qint64 newFrame,
                                      const TrimOptions& options)
{
    Request request;
    request.operation = QStringLiteral("trim");
    request.parameters = QJsonObject{{"segmentId", segmentId},
                                     {"edge", edgeName(edge)},
                                     {"frame", static_cast<double>(newFrame)},
                                     {"ripple", options.ripple}};
    request.apply = [segmentId, edge, newFrame, options](const Timeline& timeline) {
        return edit::trim(timeline, segmentId, edge, newFrame, options);
    };
    return submit(request);
}

Result<EditOutcome> EditSession::deleteSegment(const QString& segmentId, bool ripple)
{
    Request request;
    request.operation = QStringLiteral("delete");
    request.parameters = QJsonObject{{"segmentId", segmentId}, {"ripple", ripple}};
    request.apply = [segmentId, ripple](const Timeline& timeline) {
        return edit::deleteSegment(timeline, segmentId, ripple);
    };
    return submit(request);
}

Result<EditOutcome> EditSession::move(const QString& segmentId, qint64 newStart, const QString& targetTrackId)
{
    Request request;
    request.operation = QStringLiteral("move");
    request.parameters = QJsonObject{{"segmentId", segmentId},
                                     {"start", static_cast<double>(newStart)},
                                     {"trackId", targetTrackId}};
    request.apply = [segmentId, newStart, targetTrackId](const Timeline& timeline) {
        return edit::move(timeline, segmentId, newStart, targetTrackId);
    };
    return submit(request);
}

Result<EditOutcome> EditSession::insertClip(const Clip& clip, const QString& trackId, qint64 atFrame)
{
    Request request;
    request.operation = QStringLiteral("insert_clip");
    request.parameters = QJsonObject{{"clipId", clip.id()},
                                     {"sourceUrl", clip.sourceUrl()},
                                     {"backendType", backendTypeToString(clip.backendType())},
                                     {"durationFrames", static_cast<double>(clip.durationFrames())},
                                     {"trackId", trackId},
                                     {"atFrame", static_cast<double>(atFrame)}};
    request.apply = [clip, trackId, atFrame](const Timeline& timeline) {
        return edit::insertClip(timeline, clip, trackId, atFrame);
    };
    return submit(request);
}

Result<EditOutcome> EditSession::undo()
{
    Request request;
    request.kind = RequestKind::Undo;
    request.operation = QStringLiteral("undo");
    return submit(request);
}

Result<EditOutcome> EditSession::redo()
{
    Request request;
    request.kind = RequestKind::Redo;
    request.operation = QStringLiteral("redo");
    return submit(request);
}

Result<EditOutcome> EditSession::load(const Timeline& timeline)
{
    Request request;
    request.kind = RequestKind::Load;
    request.operation = QStringLiteral("load");
    request.apply = [timeline](const Timeline&) -> Result<EditOutcome> {
        auto valid = timeline.validate();
        if (valid.is_error()) {
            return valid.error();
        }
        EditOutcome outcome;
        outcome.timeline = timeline;
        return outcome;
    };
    return submit(request);
}

Result<EditOutcome> EditSession::submit(const Request& request)
{
    if (m_applying) {
        qCDebug(cutlineSession, "Queueing %s behind in-flight edit (%d pending)",
                qPrintable(request.operation), static_cast<int>(m_pending.size()) + 1);
        m_pending.enqueue(request);
        return Error::deferred(request.operation);
    }

    auto result = execute(request);
    drainQueue();
    return result;
}

Result<EditOutcome> EditSession::execute(const Request& request)
{
    QScopedValueRollback<bool> guard(m_applying, true);

    // Algorithm: Run against latest snapshot → Update history → Swap → Notify
    const Timeline before = m_timeline;
    auto result = runRequest(request, before);
    if (result.is_error()) {
        qCInfo(cutlineSession, "%s rejected: %s [%s]", qPrintable(request.operation),
               qPrintable(result.error().message), error_code_to_string(result.error().code));
        emit editRejected(request.operation, result.error().message);
        return result;
    }

    m_timeline = result.value().timeline;

    EditRecord record;
    record.sequence = ++m_sequence;
    record.operation = request.operation;
    record.parameters = request.parameters;
    record.affectedSegmentIds = result.value().affectedSegmentIds;
    record.diff = diffTimelines(before, m_timeline);
    if (record.affectedSegmentIds.isEmpty()) {
        for (const Segment& segment : record.diff.upserted) {
            record.affectedSegmentIds.append(segment.id());
        }
        record.affectedSegmentIds.append(record.diff.removedIds);
    }

    qCDebug(cutlineSession, "Committed #%llu %s (%d upserted, %d removed)",
            static_cast<unsigned long long>(record.sequence), qPrintable(record.operation),
            static_cast<int>(record.diff.upserted.size()), static_cast<int>(record.diff.removedIds.size()));

    emit timelineChanged(m_timeline);
    emit editCommitted(record);
    emit editApplied(request.operation, record.affectedSegmentIds);
    return result;
}

Result<EditOutcome> EditSession::runRequest(const Request& request, const Timeline& before)
{
    switch (request.kind) {
        case RequestKind::Edit: {
            auto result = request.apply(before);
            if (result.is_ok()) {
                pushUndo(before);
                m_redoStack.clear();
            }
            return result;
        }
        case RequestKind::Undo: {
            if (m_undoStack.isEmpty()) {
                return Error::invalid_arg(QStringLiteral("Nothing to undo"));
            }
            EditOutcome outcome;
            outcome.timeline = m_undoStack.takeLast();
            m_redoStack.append(before);
            return outcome;
        }
        case RequestKind::Redo: {
            if (m_redoStack.isEmpty()) {
                return Error::invalid_arg(QStringLiteral("Nothing to redo"));
            }
            EditOutcome outcome;
            outcome.timeline = m_redoStack.takeLast();
            pushUndo(before);
            return outcome;
        }
        case RequestKind::Load: {
            auto result = request.apply(before);
            if (result.is_ok()) {
                m_undoStack.clear();
                m_redoStack.clear();
            }
            return result;
        }
    }
    return Error::internal(QStringLiteral("Unknown request kind"));
}

void EditSession::pushUndo(const Timeline& snapshot)
{
    m_undoStack.append(snapshot);
    while (m_undoStack.size() > m_settings.undoDepth) {
        m_undoStack.removeFirst();
    }
}

void EditSession::drainQueue()
{
    if (m_draining) {
        return;
    }
    QScopedValueRollback<bool> guard(m_draining, true);
    while (!m_pending.isEmpty()) {
        const Request next = m_pending.dequeue();
        // Outcome is reported through editApplied / editRejected
        execute(next);
    }
}

} // namespace cutline
