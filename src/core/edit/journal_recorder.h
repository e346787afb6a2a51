#pragma once

#include "edit_session.h"
#include "cutline/journal/Event.hpp"

#include <QFile>
#include <QLoggingCategory>
#include <QObject>
#include <QString>

struct sqlite3;

Q_DECLARE_LOGGING_CATEGORY(cutlineJournal)

namespace cutline {

/**
 * JournalRecorder: appends every committed edit of an EditSession to the
 * SQLite edit journal, optionally mirrored to a JSONL log that foldLog can
 * replay into a fresh read model.
 *
 * Storage failures never reach the session; they are logged and emitted as
 * journalError.
 */
class JournalRecorder : public QObject
{
    Q_OBJECT

public:
    JournalRecorder(EditSession& session, sqlite3* db,
                    const QString& author = QStringLiteral("local"),
                    QObject* parent = nullptr);
    ~JournalRecorder() override;

    bool setLogPath(const QString& path);

    int recordedCount() const { return m_recorded; }
    QString lastEventId() const { return m_lastEventId; }

    static journal::Event eventForRecord(const EditRecord& record, const QString& eventId,
                                         const QString& author, qint64 timestampMs,
                                         const QString& parentId);

    // Rebuilds the last journaled snapshot from the read model
    static Result<Timeline> restoreTimeline(sqlite3* db);

signals:
    void eventRecorded(const QString& eventId);
    void journalError(const QString& message);

private slots:
    void onEditCommitted(const cutline::EditRecord& record);

private:
    sqlite3* m_db;
    QString m_author;
    QFile m_log;
    QString m_lastEventId;
    int m_recorded = 0;
    QMetaObject::Connection m_connection;
};

} // namespace cutline
