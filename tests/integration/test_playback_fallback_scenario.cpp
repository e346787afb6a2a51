#include "../common/test_base.h"
#include "../common/fake_video_backend.h"
#include "../common/timeline_fixtures.h"
#include "../../src/core/edit/edit_session.h"
#include "../../src/core/playback/playback_sync.h"
#include "../../src/core/timeline/timeline_engine.h"
#include "../../src/ui/timeline/timeline_renderer.h"

#include <QSignalSpy>
#include <QTest>

#include <memory>

using namespace cutline;
using cutline::testing::FakeBackendLog;
using cutline::testing::FakeVideoBackend;

/**
 * Integration Test: playback through a source that refuses to load
 *
 * Session, engine, sync and renderer wired as in the preview window. The
 * engine's clock is the only time source: a track that cannot load keeps
 * the playhead and the scrubber moving while it waits for its single retry.
 */
class TestPlaybackFallbackScenario : public TestBase
{
    Q_OBJECT

private slots:
    void initTestCase() override;

    void testPlayheadKeepsMovingThroughFailedSource();
    void testEditRemovingFailedSegmentClearsDegradedState();

private:
    static int loadsOf(const FakeBackendLog& log, const QString& url);
};

void TestPlaybackFallbackScenario::initTestCase()
{
    TestBase::initTestCase();
    qRegisterMetaType<cutline::Timeline>();
    qRegisterMetaType<cutline::EditRecord>();
    qRegisterMetaType<cutline::TrackSyncState>();
}

int TestPlaybackFallbackScenario::loadsOf(const FakeBackendLog& log, const QString& url)
{
    int count = 0;
    for (const auto& request : log.requests) {
        count += (request.kind == "load" && request.sourceUrl == url) ? 1 : 0;
    }
    return count;
}

void TestPlaybackFallbackScenario::testPlayheadKeepsMovingThroughFailedSource()
{
    EditSession session(fixtures::twoSegments());
    TimelineEngine engine;
    QObject::connect(&session, &EditSession::timelineChanged, &engine, &TimelineEngine::setTimeline);
    engine.setTimeline(session.timeline());

    auto log = std::make_shared<FakeBackendLog>();
    log->autoComplete = true;
    log->failingUrls.insert("media/b.mp4");
    PlaybackSync sync(engine, FakeVideoBackend::factory(log));
    TimelineRenderer renderer(engine);
    renderer.setViewport(870, 300);

    QSignalSpy errors(&sync, &PlaybackSync::loadError);
    QSignalSpy degraded(&sync, &PlaybackSync::degradedChanged);

    engine.play();
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Playing);
    engine.tick(1000.0);
    engine.tick(1000.0);
    QCOMPARE(engine.currentFrame(), 60.0);
    QVERIFY(errors.isEmpty());

    // Crossing into seg2: clip-b refuses, the track falls back
    engine.tick(1000.0);
    QCOMPARE(sync.segmentId("V1"), QString("seg2"));
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Fallback);
    QCOMPARE(errors.count(), 1);
    QCOMPARE(errors.at(0).at(1).toString(), QString("seg2"));
    QVERIFY(sync.isDegraded());
    QCOMPARE(degraded.count(), 1);

    // Playhead and scrubber keep going on the engine clock
    engine.tick(1000.0);
    QVERIFY(engine.isPlaying());
    QCOMPARE(engine.currentFrame(), 120.0);
    QVERIFY(sync.fallbackFrames("V1") >= 30.0);
    QCOMPARE(renderer.scrubberX(), renderer.geometry().frameToX(120.0));

    // Back into seg1: clip-a recovers the track
    engine.seek(30.0);
    QCOMPARE(sync.segmentId("V1"), QString("seg1"));
    QCOMPARE(sync.loadedClipId("V1"), QString("clip-a"));
    QVERIFY(sync.trackState("V1") != TrackSyncState::Fallback);
    QVERIFY(!sync.isDegraded());

    // One retry on the next crossing into clip-b, then it stays in fallback
    engine.seek(100.0);
    QCOMPARE(loadsOf(*log, "media/b.mp4"), 2);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Fallback);
    QCOMPARE(errors.count(), 2);

    engine.seek(30.0);
    engine.seek(100.0);
    QCOMPARE(loadsOf(*log, "media/b.mp4"), 2);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Fallback);
}

void TestPlaybackFallbackScenario::testEditRemovingFailedSegmentClearsDegradedState()
{
    EditSession session(fixtures::twoSegments());
    TimelineEngine engine;
    QObject::connect(&session, &EditSession::timelineChanged, &engine, &TimelineEngine::setTimeline);
    engine.setTimeline(session.timeline());

    auto log = std::make_shared<FakeBackendLog>();
    log->autoComplete = true;
    log->failingUrls.insert("media/b.mp4");
    PlaybackSync sync(engine, FakeVideoBackend::factory(log));

    engine.seek(100.0);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Fallback);
    QVERIFY(sync.isDegraded());

    // The playhead is left over a gap: nothing to show, nothing failing
    QVERIFY(session.deleteSegment("seg2").is_ok());
    QCOMPARE(engine.currentFrame(), 100.0);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Idle);
    QVERIFY(!sync.isDegraded());

    // Undo brings seg2 back under the playhead: that is its retry
    QVERIFY(session.undo().is_ok());
    QCOMPARE(sync.segmentId("V1"), QString("seg2"));
    QCOMPARE(loadsOf(*log, "media/b.mp4"), 2);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Fallback);
    QVERIFY(sync.isDegraded());
}

QTEST_MAIN(TestPlaybackFallbackScenario)
#include "test_playback_fallback_scenario.moc"
