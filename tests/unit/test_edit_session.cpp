#include "../common/test_base.h"
#include "../common/timeline_fixtures.h"
#include "../../src/core/edit/edit_session.h"

#include <QSignalSpy>
#include <QStringList>
#include <QTest>

using namespace cutline;

/**
 * Unit Test: EditSession
 *
 * The session is the only writer of its timeline. Accepted edits publish
 * timelineChanged, editCommitted and editApplied in that order; refused
 * edits publish editRejected and leave the snapshot alone. Edits requested
 * from inside a notification are queued and run afterwards in FIFO order.
 */
class TestEditSession : public TestBase
{
    Q_OBJECT

private slots:
    void initTestCase() override;

    void testAcceptedEditSignalOrder();
    void testRejectedEditLeavesSnapshot();
    void testUndoRedoRestoresSnapshots();
    void testEmptyHistoryIsRejected();
    void testNewEditClearsRedo();
    void testUndoDepthIsBounded();
    void testReentrantEditsAreQueued();
    void testQueuedRejectionIsReported();
    void testLoadReplacesTimelineAndClearsHistory();
    void testLoadRejectsInvalidTimeline();
    void testCommittedRecordCarriesDiff();
};

void TestEditSession::initTestCase()
{
    TestBase::initTestCase();
    qRegisterMetaType<cutline::Timeline>();
    qRegisterMetaType<cutline::EditRecord>();
}

void TestEditSession::testAcceptedEditSignalOrder()
{
    EditSession session(fixtures::twoSegments());

    QStringList order;
    connect(&session, &EditSession::timelineChanged, this, [&order](const Timeline&) { order << "timelineChanged"; });
    connect(&session, &EditSession::editCommitted, this, [&order](const EditRecord&) { order << "editCommitted"; });
    connect(&session, &EditSession::editApplied, this,
            [&order](const QString& operation, const QStringList&) { order << "editApplied:" + operation; });

    auto result = session.split("seg1", 30);
    QVERIFY(result.is_ok());
    QCOMPARE(order, QStringList({"timelineChanged", "editCommitted", "editApplied:split"}));
    QCOMPARE(session.timeline().segmentCount(), 3);
    QCOMPARE(session.sequence(), quint64(1));
    QVERIFY(session.canUndo());
}

void TestEditSession::testRejectedEditLeavesSnapshot()
{
    EditSession session(fixtures::twoSegments());
    QSignalSpy rejected(&session, &EditSession::editRejected);
    QSignalSpy changed(&session, &EditSession::timelineChanged);

    auto result = session.move("seg2", 10);
    QVERIFY(result.is_error());
    QCOMPARE(result.error().code, ErrorCode::OverlapError);

    QCOMPARE(rejected.count(), 1);
    QCOMPARE(rejected.first().at(0).toString(), QString("move"));
    QCOMPARE(changed.count(), 0);
    QVERIFY(session.timeline() == fixtures::twoSegments());
    QVERIFY(!session.canUndo());
    QCOMPARE(session.sequence(), quint64(0));
}

void TestEditSession::testUndoRedoRestoresSnapshots()
{
    EditSession session(fixtures::twoSegments());
    QVERIFY(session.trim("seg1", TrimEdge::End, 60).is_ok());
    const Timeline trimmed = session.timeline();
    QVERIFY(session.deleteSegment("seg2", true).is_ok());

    QVERIFY(session.undo().is_ok());
    QVERIFY(session.timeline() == trimmed);

    QVERIFY(session.undo().is_ok());
    QVERIFY(session.timeline() == fixtures::twoSegments());
    QCOMPARE(session.redoDepth(), 2);

    QVERIFY(session.redo().is_ok());
    QVERIFY(session.timeline() == trimmed);
    QCOMPARE(session.undoDepth(), 1);
    QCOMPARE(session.redoDepth(), 1);
}

void TestEditSession::testEmptyHistoryIsRejected()
{
    EditSession session(fixtures::twoSegments());
    QSignalSpy rejected(&session, &EditSession::editRejected);

    QCOMPARE(session.undo().error().code, ErrorCode::InvalidArg);
    QCOMPARE(session.redo().error().code, ErrorCode::InvalidArg);
    QCOMPARE(rejected.count(), 2);
}

void TestEditSession::testNewEditClearsRedo()
{
    EditSession session(fixtures::twoSegments());
    QVERIFY(session.split("seg1", 30).is_ok());
    QVERIFY(session.undo().is_ok());
    QVERIFY(session.canRedo());

    QVERIFY(session.move("seg2", 200).is_ok());
    QVERIFY(!session.canRedo());
}

void TestEditSession::testUndoDepthIsBounded()
{
    SessionSettings settings;
    settings.undoDepth = 3;
    EditSession session(fixtures::twoSegments(), settings);

    for (qint64 start = 200; start < 260; start += 10) {
        QVERIFY(session.move("seg2", start).is_ok());
    }
    QCOMPARE(session.undoDepth(), 3);

    while (session.canUndo()) {
        QVERIFY(session.undo().is_ok());
    }
    QCOMPARE(session.timeline().segment("seg2")->timelineStart(), qint64(220));

    // Redo refills the undo stack under the same bound
    while (session.canRedo()) {
        QVERIFY(session.redo().is_ok());
        QVERIFY(session.undoDepth() <= 3);
    }
    QCOMPARE(session.undoDepth(), 3);
    QCOMPARE(session.timeline().segment("seg2")->timelineStart(), qint64(250));
}

void TestEditSession::testReentrantEditsAreQueued()
{
    EditSession session(fixtures::twoSegments());

    QList<ErrorCode> nestedCodes;
    bool issued = false;
    connect(&session, &EditSession::timelineChanged, this, [&](const Timeline& timeline) {
        if (issued) {
            return;
        }
        issued = true;
        // The handler sees the committed snapshot, not a half-applied one
        QCOMPARE(timeline.segment("seg1")->timelineEnd(), qint64(60));
        nestedCodes << session.move("seg2", 60).error().code;
        nestedCodes << session.trim("seg2", TrimEdge::End, 100).error().code;
        QCOMPARE(session.pendingCount(), 2);
    });

    QStringList applied;
    connect(&session, &EditSession::editApplied, this,
            [&applied](const QString& operation, const QStringList&) { applied << operation; });

    QVERIFY(session.trim("seg1", TrimEdge::End, 60).is_ok());
    QCOMPARE(nestedCodes, QList<ErrorCode>({ErrorCode::Deferred, ErrorCode::Deferred}));
    QCOMPARE(applied, QStringList({"trim", "move", "trim"}));
    QCOMPARE(session.pendingCount(), 0);

    // Queued edits ran against the snapshot left by the edit before them
    const Segment* seg2 = session.timeline().segment("seg2");
    QCOMPARE(seg2->timelineStart(), qint64(60));
    QCOMPARE(seg2->timelineEnd(), qint64(100));
    QCOMPARE(session.sequence(), quint64(3));
}

void TestEditSession::testQueuedRejectionIsReported()
{
    EditSession session(fixtures::twoSegments());
    bool issued = false;
    connect(&session, &EditSession::editCommitted, this, [&](const EditRecord&) {
        if (!issued) {
            issued = true;
            session.move("seg2", 0);
        }
    });

    QSignalSpy rejected(&session, &EditSession::editRejected);
    QVERIFY(session.split("seg1", 45).is_ok());
    QCOMPARE(rejected.count(), 1);
    QCOMPARE(rejected.first().at(0).toString(), QString("move"));
    QCOMPARE(session.timeline().segment("seg2")->timelineStart(), qint64(90));
}

void TestEditSession::testLoadReplacesTimelineAndClearsHistory()
{
    EditSession session(fixtures::twoSegments());
    QVERIFY(session.split("seg1", 30).is_ok());
    QVERIFY(session.undo().is_ok());

    QSignalSpy changed(&session, &EditSession::timelineChanged);
    QVERIFY(session.load(fixtures::twoTracksWithGap()).is_ok());
    QCOMPARE(changed.count(), 1);
    QVERIFY(session.timeline() == fixtures::twoTracksWithGap());
    QVERIFY(!session.canUndo());
    QVERIFY(!session.canRedo());
}

void TestEditSession::testLoadRejectsInvalidTimeline()
{
    EditSession session(fixtures::twoSegments());
    const Timeline broken(30.0, 10, {Track("V1", {Segment("x", "ghost", "V1", 0, 0, 5)})});

    auto result = session.load(broken);
    QVERIFY(result.is_error());
    QCOMPARE(result.error().code, ErrorCode::NotFound);
    QVERIFY(session.timeline() == fixtures::twoSegments());
}

void TestEditSession::testCommittedRecordCarriesDiff()
{
    EditSession session(fixtures::twoSegments());
    QSignalSpy committed(&session, &EditSession::editCommitted);

    QVERIFY(session.deleteSegment("seg1", true).is_ok());
    QCOMPARE(committed.count(), 1);

    const EditRecord record = committed.first().at(0).value<EditRecord>();
    QCOMPARE(record.sequence, quint64(1));
    QCOMPARE(record.operation, QString("delete"));
    QCOMPARE(record.parameters.value("ripple").toBool(), true);
    QCOMPARE(record.diff.removedIds, QStringList{"seg1"});
    QCOMPARE(record.diff.upserted.size(), 1);
    QCOMPARE(record.diff.upserted.first().timelineStart(), qint64(0));
    QCOMPARE(record.diff.totalFrames, qint64(60));
    QVERIFY(record.affectedSegmentIds.contains("seg2"));
}

QTEST_MAIN(TestEditSession)
#include "test_edit_session.moc"
