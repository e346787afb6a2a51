#include "journal_recorder.h"

#include "core/common/uuid_generator.h"
#include "cutline/journal/Reducer.hpp"
#include "cutline/journal/SqliteStore.hpp"

#include <QDateTime>
#include <QJsonDocument>

#include <nlohmann/json.hpp>

#include <stdexcept>

Q_LOGGING_CATEGORY(cutlineJournal, "cutline.journal")

using json = nlohmann::json;

namespace cutline {

namespace {

json segmentToJson(const Segment& segment)
{
    return json{{"id", segment.id().toStdString()},
                {"clipId", segment.clipId().toStdString()},
                {"trackId", segment.trackId().toStdString()},
                {"timelineStart", segment.timelineStart()},
                {"timelineEnd", segment.timelineEnd()},
                {"sourceIn", segment.sourceIn()},
                {"sourceOut", segment.sourceOut()},
                {"order", segment.order()}};
}

json clipToJson(const Clip& clip)
{
    return json{{"id", clip.id().toStdString()},
                {"sourceUrl", clip.sourceUrl().toStdString()},
                {"backendType", backendTypeToString(clip.backendType()).toStdString()},
                {"durationFrames", clip.durationFrames()}};
}

} // namespace

JournalRecorder::JournalRecorder(EditSession& session, sqlite3* db, const QString& author, QObject* parent)
    : QObject(parent)
    , m_db(db)
    , m_author(author)
{
    m_connection = connect(&session, &EditSession::editCommitted, this, &JournalRecorder::onEditCommitted);
}

JournalRecorder::~JournalRecorder()
{
    disconnect(m_connection);
    if (m_log.isOpen()) {
        m_log.close();
    }
}

bool JournalRecorder::setLogPath(const QString& path)
{
    if (m_log.isOpen()) {
        m_log.close();
    }
    m_log.setFileName(path);
    if (!m_log.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qCWarning(cutlineJournal, "Cannot open journal log %s: %s",
                  qPrintable(path), qPrintable(m_log.errorString()));
        return false;
    }
    return true;
}

journal::Event JournalRecorder::eventForRecord(const EditRecord& record, const QString& eventId,
                                               const QString& author, qint64 timestampMs,
                                               const QString& parentId)
{
    json payload;
    payload["operation"] = record.operation.toStdString();
    payload["sequence"] = record.sequence;
    payload["parameters"] = json::parse(QJsonDocument(record.parameters).toJson(QJsonDocument::Compact).toStdString());
    payload["fps"] = record.diff.fps;
    payload["totalFrames"] = record.diff.totalFrames;

    json tracks = json::array();
    for (const QString& trackId : record.diff.trackIds) {
        tracks.push_back(trackId.toStdString());
    }
    payload["tracks"] = tracks;

    json clips = json::array();
    for (const Clip& clip : record.diff.addedClips) {
        clips.push_back(clipToJson(clip));
    }
    payload["clips"] = clips;

    json upserted = json::array();
    for (const Segment& segment : record.diff.upserted) {
        upserted.push_back(segmentToJson(segment));
    }
    payload["upserted"] = upserted;

    json removed = json::array();
    for (const QString& id : record.diff.removedIds) {
        removed.push_back(id.toStdString());
    }
    payload["removed"] = removed;

    journal::Event event;
    event.id = eventId.toStdString();
    event.type = "EditCommitted";
    event.scope = "timeline";
    event.timestampMs = timestampMs;
    event.author = author.toStdString();
    if (!parentId.isEmpty()) {
        event.parents.push_back(parentId.toStdString());
    }
    event.payloadJson = payload.dump();
    return event;
}

void JournalRecorder::onEditCommitted(const EditRecord& record)
{
    const QString eventId = UuidGenerator::instance().generateEventUuid();
    const journal::Event event = eventForRecord(record, eventId, m_author,
                                                QDateTime::currentMSecsSinceEpoch(), m_lastEventId);
    try {
        journal::append_event(m_db, event);
    } catch (const std::exception& e) {
        qCCritical(cutlineJournal, "Failed to journal %s #%llu: %s", qPrintable(record.operation),
                   static_cast<unsigned long long>(record.sequence), e.what());
        emit journalError(QString::fromStdString(e.what()));
        return;
    }

    if (m_log.isOpen()) {
        const QByteArray line = QByteArray::fromStdString(journal::serializeEventJsonLine(event)) + '\n';
        if (m_log.write(line) != line.size() || !m_log.flush()) {
            qCWarning(cutlineJournal, "Journal log write failed: %s", qPrintable(m_log.errorString()));
            emit journalError(m_log.errorString());
        }
    }

    m_lastEventId = eventId;
    ++m_recorded;
    qCDebug(cutlineJournal, "Recorded %s as event %s", qPrintable(record.operation), qPrintable(eventId));
    emit eventRecorded(eventId);
}

Result<Timeline> JournalRecorder::restoreTimeline(sqlite3* db)
{
    journal::TimelineMetaRow meta;
    std::vector<journal::ClipRow> clipRows;
    std::vector<journal::SegmentRow> segmentRows;
    try {
        meta = journal::loadTimelineMeta(db);
        clipRows = journal::loadClipRows(db);
        segmentRows = journal::loadTimelineRows(db);
    } catch (const std::exception& e) {
        return Error::internal(QStringLiteral("Journal read failed: %1").arg(QString::fromStdString(e.what())));
    }
    if (meta.fps <= 0.0) {
        return Error::not_found(QStringLiteral("journaled timeline"));
    }

    QHash<QString, Clip> clips;
    for (const journal::ClipRow& row : clipRows) {
        const auto type = backendTypeFromString(QString::fromStdString(row.backendType));
        if (!type) {
            return Error::parse_error(QStringLiteral("Unknown backend type '%1'")
                                          .arg(QString::fromStdString(row.backendType)));
        }
        const QString id = QString::fromStdString(row.clipId);
        clips.insert(id, Clip(id, QString::fromStdString(row.sourceUrl), *type, row.durationFrames));
    }

    QStringList trackOrder;
    for (const std::string& id : meta.trackIds) {
        trackOrder.append(QString::fromStdString(id));
    }
    QHash<QString, QList<Segment>> segmentsByTrack;
    for (const journal::SegmentRow& row : segmentRows) {
        const QString trackId = QString::fromStdString(row.trackId);
        if (!trackOrder.contains(trackId)) {
            trackOrder.append(trackId);
        }
        segmentsByTrack[trackId].append(Segment(QString::fromStdString(row.segmentId),
                                                QString::fromStdString(row.clipId), trackId,
                                                row.timelineStart, row.sourceIn, row.sourceOut, row.order));
    }

    QList<Track> tracks;
    for (const QString& trackId : trackOrder) {
        tracks.append(Track(trackId, segmentsByTrack.value(trackId)));
    }

    Timeline timeline(meta.fps, meta.totalFrames, tracks, clips);
    auto valid = timeline.validate();
    if (valid.is_error()) {
        return valid.error();
    }
    return timeline;
}

} // namespace cutline
