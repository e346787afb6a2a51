#include "../common/test_base.h"
#include "../common/fake_video_backend.h"
#include "../common/timeline_fixtures.h"
#include "../../src/core/playback/clock_backend.h"
#include "../../src/core/playback/playback_sync.h"
#include "../../src/core/timeline/timeline_engine.h"

#include <QSignalSpy>
#include <QTest>

#include <memory>

using namespace cutline;
using cutline::testing::FakeBackendLog;
using cutline::testing::FakeVideoBackend;

namespace {

// V1: x1 [0,90) clip-a, y [90,150) clip-b, x2 [150,240) clip-a [100,190)
Timeline alternatingSources()
{
    const QList<Segment> segments{
        Segment("x1", "clip-a", "V1", 0, 0, 90),
        Segment("y", "clip-b", "V1", 90, 0, 60),
        Segment("x2", "clip-a", "V1", 150, 100, 190),
    };
    return Timeline(30.0, 240, {Track("V1", segments)}, fixtures::catalog());
}

} // namespace

/**
 * Unit Test: PlaybackSync
 *
 * Backends are driven from the engine's playhead and never the other way
 * round. Completions are scripted through FakeBackendLog so that stale
 * responses, failures and the single retry can be ordered precisely.
 */
class TestPlaybackSync : public TestBase
{
    Q_OBJECT

private slots:
    void initTestCase() override;

    void testInitialSegmentIsLoadedThenSeeked();
    void testSeekTargetsSourceTime();
    void testStaleCompletionIsDiscarded();
    void testBackendReusedForSameClip();
    void testSeekIntoSegmentIsIssuedOnce();
    void testGapPausesAndKeepsBackend();
    void testPlayIntentReadAtCompletion();
    void testPlayStateForwardedToReadyBackends();
    void testDriftTriggersReseek();
    void testFailureFallsBackAndAdvances();
    void testSingleRetryThenExhausted();
    void testSuccessfulRetryClearsFailure();
    void testRetryWithFailingSeekIsBounded();
    void testStandbyPreloadsNextSegment();
    void testStandbyFailureCountsTowardRetry();
    void testStandbyDroppedWhenSegmentEdited();
    void testEditRemapRepositionsBackend();
    void testRemovedTrackReleasesBackend();
    void testClockBackend();

private:
    static int loadsOf(const FakeBackendLog& log, const QString& url);
};

void TestPlaybackSync::initTestCase()
{
    TestBase::initTestCase();
    qRegisterMetaType<cutline::TrackSyncState>();
}

int TestPlaybackSync::loadsOf(const FakeBackendLog& log, const QString& url)
{
    int count = 0;
    for (const auto& request : log.requests) {
        count += (request.kind == "load" && request.sourceUrl == url) ? 1 : 0;
    }
    return count;
}

void TestPlaybackSync::testInitialSegmentIsLoadedThenSeeked()
{
    TimelineEngine engine;
    engine.setTimeline(fixtures::twoSegments());
    auto log = std::make_shared<FakeBackendLog>();
    PlaybackSync sync(engine, FakeVideoBackend::factory(log));

    QCOMPARE(log->requests.size(), size_t(1));
    QCOMPARE(log->requests.at(0).kind, QString("load"));
    QCOMPARE(log->requests.at(0).sourceUrl, QString("media/a.mp4"));
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Loading);
    QVERIFY(sync.loadedClipId("V1").isEmpty());

    log->complete(0);
    QCOMPARE(log->requests.size(), size_t(2));
    QCOMPARE(log->requests.at(1).kind, QString("seek"));
    QCOMPARE(log->requests.at(1).seconds, 0.0);
    QCOMPARE(sync.loadedClipId("V1"), QString("clip-a"));

    log->complete(1);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Paused);
    QCOMPARE(sync.segmentId("V1"), QString("seg1"));
    QVERIFY(!sync.isDegraded());
}

void TestPlaybackSync::testSeekTargetsSourceTime()
{
    TimelineEngine engine;
    engine.setTimeline(fixtures::twoSegments());
    auto log = std::make_shared<FakeBackendLog>();
    log->autoComplete = true;
    PlaybackSync sync(engine, FakeVideoBackend::factory(log));

    engine.seek(100.0);

    // seg2 starts at 90 and reads clip-b from 20: (100 - 90 + 20) / 30
    const int seek = log->lastIndexOf("seek");
    QCOMPARE(log->requests.at(seek).sourceUrl, QString("media/b.mp4"));
    QCOMPARE(log->requests.at(seek).seconds, 1.0);
    QCOMPARE(sync.backend("V1")->currentTime(), 1.0);
    QCOMPARE(sync.loadedClipId("V1"), QString("clip-b"));
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Paused);
    QCOMPARE(log->backends.size(), size_t(2));
}

void TestPlaybackSync::testStaleCompletionIsDiscarded()
{
    TimelineEngine engine;
    engine.setTimeline(fixtures::twoSegments());
    auto log = std::make_shared<FakeBackendLog>();
    PlaybackSync sync(engine, FakeVideoBackend::factory(log));
    log->completeAll();
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Paused);

    QSignalSpy stale(&sync, &PlaybackSync::staleCompletionDiscarded);

    engine.seek(100.0);
    const int loadB = log->lastIndexOf("load");
    QCOMPARE(log->requests.at(loadB).sourceUrl, QString("media/b.mp4"));

    engine.seek(10.0);
    const int loadA = log->lastIndexOf("load");
    QVERIFY(loadA > loadB);

    // The superseded clip-b load finishes last in wall time but first here
    log->complete(loadB);
    QCOMPARE(stale.count(), 1);
    QCOMPARE(log->countOf("seek"), 1);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Loading);

    log->complete(loadA);
    const int seek = log->lastIndexOf("seek");
    QCOMPARE(log->requests.at(seek).sourceUrl, QString("media/a.mp4"));
    QCOMPARE(log->requests.at(seek).seconds, 10.0 / 30.0);
    log->complete(seek);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Paused);
    QCOMPARE(sync.loadedClipId("V1"), QString("clip-a"));
    QCOMPARE(stale.count(), 1);
}

void TestPlaybackSync::testBackendReusedForSameClip()
{
    TimelineEngine engine;
    engine.setTimeline(fixtures::twoTracksWithGap());
    auto log = std::make_shared<FakeBackendLog>();
    log->autoComplete = true;
    PlaybackSync sync(engine, FakeVideoBackend::factory(log));
    VideoBackend* first = sync.backend("V1");
    QVERIFY(first);

    // seg3 reads the same clip as seg1
    engine.seek(150.0);
    QCOMPARE(sync.backend("V1"), first);
    QCOMPARE(loadsOf(*log, "media/a.mp4"), 1);
    QCOMPARE(sync.segmentId("V1"), QString("seg3"));
    QCOMPARE(first->currentTime(), (150.0 - 120.0 + 100.0) / 30.0);
}

void TestPlaybackSync::testSeekIntoSegmentIsIssuedOnce()
{
    TimelineEngine engine;
    engine.setTimeline(fixtures::twoTracksWithGap());
    auto log = std::make_shared<FakeBackendLog>();
    log->autoComplete = true;
    PlaybackSync sync(engine, FakeVideoBackend::factory(log));

    const int before = log->countOf("seek");
    engine.seek(150.0);
    QCOMPARE(log->countOf("seek"), before + 1);

    // Seeking within the same segment re-positions through seeked
    engine.seek(160.0);
    QCOMPARE(log->countOf("seek"), before + 2);

    // Same frame again is a fresh request
    engine.seek(160.0);
    QCOMPARE(log->countOf("seek"), before + 3);
}

void TestPlaybackSync::testGapPausesAndKeepsBackend()
{
    TimelineEngine engine;
    engine.setTimeline(fixtures::twoTracksWithGap());
    auto log = std::make_shared<FakeBackendLog>();
    log->autoComplete = true;
    PlaybackSync sync(engine, FakeVideoBackend::factory(log));

    const int pausesBefore = log->backends.front()->pauseCalls;
    engine.seek(100.0);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Idle);
    QVERIFY(sync.segmentId("V1").isEmpty());
    QVERIFY(sync.backend("V1") != nullptr);
    QVERIFY(log->backends.front()->pauseCalls > pausesBefore);

    // V2 entered seg4 on the same seek
    QCOMPARE(sync.segmentId("V2"), QString("seg4"));
    QCOMPARE(sync.backend("V2")->currentTime(), 70.0 / 30.0);
}

void TestPlaybackSync::testPlayIntentReadAtCompletion()
{
    TimelineEngine engine;
    engine.setTimeline(fixtures::twoSegments());
    auto log = std::make_shared<FakeBackendLog>();
    PlaybackSync sync(engine, FakeVideoBackend::factory(log));

    engine.play();
    log->complete(0);           // load
    engine.pause();             // pause lands while the seek is in flight
    log->complete(1);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Paused);
    QVERIFY(!log->backends.front()->playing);

    engine.seek(30.0);
    engine.play();
    log->complete(log->lastIndexOf("seek"));
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Playing);
    QVERIFY(log->backends.front()->playing);
}

void TestPlaybackSync::testPlayStateForwardedToReadyBackends()
{
    TimelineEngine engine;
    engine.setTimeline(fixtures::twoSegments());
    auto log = std::make_shared<FakeBackendLog>();
    log->autoComplete = true;
    PlaybackSync sync(engine, FakeVideoBackend::factory(log));
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Paused);

    QSignalSpy states(&sync, &PlaybackSync::trackStateChanged);
    engine.play();
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Playing);
    QCOMPARE(log->backends.front()->playCalls, 1);

    engine.pause();
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Paused);
    QCOMPARE(states.count(), 2);
}

void TestPlaybackSync::testDriftTriggersReseek()
{
    TimelineEngine engine;
    engine.setTimeline(fixtures::twoSegments());
    auto log = std::make_shared<FakeBackendLog>();
    log->autoComplete = true;
    PlaybackSync sync(engine, FakeVideoBackend::factory(log));
    engine.play();

    // The fake does not advance on its own, so drift equals elapsed time
    const int seeks = log->countOf("seek");
    engine.tick(60.0);
    QCOMPARE(log->countOf("seek"), seeks);

    engine.tick(1000.0);
    QCOMPARE(log->countOf("seek"), seeks + 1);
    QCOMPARE(sync.backend("V1")->currentTime(), engine.currentFrame() / 30.0);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Playing);
}

void TestPlaybackSync::testFailureFallsBackAndAdvances()
{
    TimelineEngine engine;
    engine.setTimeline(fixtures::twoSegments());
    auto log = std::make_shared<FakeBackendLog>();
    log->autoComplete = true;
    log->failingUrls.insert("media/a.mp4");
    QSignalSpy frames(&engine, &TimelineEngine::frameChanged);

    PlaybackSync sync(engine, FakeVideoBackend::factory(log));
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Fallback);
    QVERIFY(sync.isDegraded());

    engine.play();
    engine.tick(1000.0);
    engine.tick(500.0);

    // The playhead keeps real-time pace without a healthy backend
    QCOMPARE(engine.currentFrame(), 45.0);
    QVERIFY(engine.isPlaying());
    QCOMPARE(sync.fallbackFrames("V1"), 45.0);
    QCOMPARE(frames.count(), 2);

    // Crossing into seg2 (clip-b) loads normally
    engine.tick(1500.0);
    QCOMPARE(sync.segmentId("V1"), QString("seg2"));
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Playing);
    QVERIFY(!sync.isDegraded());
}

void TestPlaybackSync::testSingleRetryThenExhausted()
{
    TimelineEngine engine;
    engine.setTimeline(fixtures::twoTracksWithGap());
    auto log = std::make_shared<FakeBackendLog>();
    log->autoComplete = true;
    log->failingUrls.insert("media/a.mp4");
    PlaybackSync sync(engine, FakeVideoBackend::factory(log));

    QSignalSpy errors(&sync, &PlaybackSync::loadError);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Fallback);
    QCOMPARE(loadsOf(*log, "media/a.mp4"), 1);

    // Fallback runs through the whole of seg1 before any retry
    engine.play();
    engine.tick(1000.0);
    engine.tick(1000.0);
    engine.tick(900.0);
    QCOMPARE(sync.fallbackFrames("V1"), 87.0);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Fallback);

    engine.tick(100.0);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Idle);
    QCOMPARE(loadsOf(*log, "media/a.mp4"), 1);

    // Next crossing into the failed source: one retry
    engine.tick(1000.0);
    QCOMPARE(sync.segmentId("V1"), QString("seg3"));
    QCOMPARE(loadsOf(*log, "media/a.mp4"), 2);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Fallback);
    QCOMPARE(errors.count(), 1);

    // Exhausted: later crossings stay in fallback without new requests
    engine.seek(10.0);
    QCOMPARE(sync.segmentId("V1"), QString("seg1"));
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Fallback);
    QCOMPARE(loadsOf(*log, "media/a.mp4"), 2);
}

void TestPlaybackSync::testSuccessfulRetryClearsFailure()
{
    TimelineEngine engine;
    engine.setTimeline(fixtures::twoTracksWithGap());
    auto log = std::make_shared<FakeBackendLog>();
    log->autoComplete = true;
    log->failingUrls.insert("media/a.mp4");
    PlaybackSync sync(engine, FakeVideoBackend::factory(log));
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Fallback);

    log->failingUrls.clear();
    engine.seek(130.0);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Paused);
    QCOMPARE(sync.loadedClipId("V1"), QString("clip-a"));
    QVERIFY(!sync.isDegraded());

    // A later failure (here a seek) of the same source gets a fresh retry
    log->failingUrls.insert("media/a.mp4");
    engine.seek(10.0);
    engine.seek(100.0);
    engine.seek(150.0);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Fallback);
    engine.seek(100.0);
    engine.seek(10.0);
    QCOMPARE(loadsOf(*log, "media/a.mp4"), 3);
}

void TestPlaybackSync::testRetryWithFailingSeekIsBounded()
{
    TimelineEngine engine;
    engine.setTimeline(alternatingSources());
    auto log = std::make_shared<FakeBackendLog>();
    log->autoComplete = true;
    log->failingSeekUrls.insert("media/a.mp4");
    PlaybackSync sync(engine, FakeVideoBackend::factory(log));
    QSignalSpy errors(&sync, &PlaybackSync::loadError);

    // clip-a loads but cannot be positioned
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Fallback);
    QCOMPARE(loadsOf(*log, "media/a.mp4"), 1);

    engine.seek(100.0);
    QCOMPARE(sync.segmentId("V1"), QString("y"));
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Paused);

    // The retry's load succeeds, its seek fails: that ends the retry
    engine.seek(160.0);
    QCOMPARE(sync.segmentId("V1"), QString("x2"));
    QCOMPARE(loadsOf(*log, "media/a.mp4"), 2);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Fallback);
    QCOMPARE(errors.count(), 1);

    for (int i = 0; i < 3; ++i) {
        engine.seek(100.0);
        QCOMPARE(sync.trackState("V1"), TrackSyncState::Paused);
        engine.seek(160.0);
        QCOMPARE(sync.trackState("V1"), TrackSyncState::Fallback);
    }
    engine.seek(10.0);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Fallback);
    QCOMPARE(loadsOf(*log, "media/a.mp4"), 2);
    QCOMPARE(errors.count(), 1);
}

void TestPlaybackSync::testStandbyPreloadsNextSegment()
{
    TimelineEngine engine;
    engine.setTimeline(fixtures::twoSegments());
    auto log = std::make_shared<FakeBackendLog>();
    log->autoComplete = true;
    PlaybackSync sync(engine, FakeVideoBackend::factory(log));
    engine.play();

    // 30 frames before seg2: outside the 0.5s lead
    engine.tick(2000.0);
    QVERIFY(sync.standbyBackend("V1") == nullptr);
    QCOMPARE(loadsOf(*log, "media/b.mp4"), 0);

    // 12 frames before seg2: clip-b is loaded and parked on its first frame
    engine.tick(600.0);
    QCOMPARE(sync.standbySegmentId("V1"), QString("seg2"));
    QVERIFY(sync.isStandbyReady("V1"));
    VideoBackend* standby = sync.standbyBackend("V1");
    QVERIFY(standby);
    QCOMPARE(standby->currentTime(), 20.0 / 30.0);
    QCOMPARE(loadsOf(*log, "media/b.mp4"), 1);
    QCOMPARE(sync.loadedClipId("V1"), QString("clip-a"));
    QVERIFY(!log->backends.at(1)->playing);

    // The crossing swaps players without a new load
    const int loads = log->countOf("load");
    engine.tick(420.0);
    QCOMPARE(sync.segmentId("V1"), QString("seg2"));
    QCOMPARE(sync.backend("V1"), standby);
    QVERIFY(sync.standbyBackend("V1") == nullptr);
    QCOMPARE(log->countOf("load"), loads);
    QCOMPARE(sync.loadedClipId("V1"), QString("clip-b"));
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Playing);
    QVERIFY(log->backends.at(1)->playing);
    QVERIFY(!log->backends.at(0)->playing);
    QCOMPARE(log->pendingCount(), 0);
}

void TestPlaybackSync::testStandbyFailureCountsTowardRetry()
{
    TimelineEngine engine;
    engine.setTimeline(fixtures::twoSegments());
    auto log = std::make_shared<FakeBackendLog>();
    log->autoComplete = true;
    log->failingUrls.insert("media/b.mp4");
    PlaybackSync sync(engine, FakeVideoBackend::factory(log));
    QSignalSpy errors(&sync, &PlaybackSync::loadError);
    engine.play();

    // The failed preload leaves the playing track alone
    engine.tick(2000.0);
    engine.tick(600.0);
    QCOMPARE(loadsOf(*log, "media/b.mp4"), 1);
    QVERIFY(!sync.isStandbyReady("V1"));
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Playing);
    QVERIFY(errors.isEmpty());

    // No second preload for the same segment
    engine.tick(100.0);
    QCOMPARE(loadsOf(*log, "media/b.mp4"), 1);

    // The crossing is the single retry
    engine.tick(400.0);
    QCOMPARE(sync.segmentId("V1"), QString("seg2"));
    QCOMPARE(loadsOf(*log, "media/b.mp4"), 2);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Fallback);
    QCOMPARE(errors.count(), 1);

    engine.seek(10.0);
    engine.seek(100.0);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Fallback);
    QCOMPARE(loadsOf(*log, "media/b.mp4"), 2);
}

void TestPlaybackSync::testStandbyDroppedWhenSegmentEdited()
{
    TimelineEngine engine;
    engine.setTimeline(fixtures::twoSegments());
    auto log = std::make_shared<FakeBackendLog>();
    log->autoComplete = true;
    PlaybackSync sync(engine, FakeVideoBackend::factory(log));
    engine.play();
    engine.tick(2000.0);
    engine.tick(600.0);
    QVERIFY(sync.isStandbyReady("V1"));

    // seg2 now reads clip-b from frame 50
    const Timeline edited = engine.timeline().withTrack(
        0, Track("V1", {Segment("seg1", "clip-a", "V1", 0, 0, 90),
                        Segment("seg2", "clip-b", "V1", 90, 50, 110)}));
    engine.setTimeline(edited);
    QVERIFY(sync.standbyBackend("V1") == nullptr);

    engine.tick(100.0);
    QVERIFY(sync.isStandbyReady("V1"));
    QCOMPARE(sync.standbyBackend("V1")->currentTime(), 50.0 / 30.0);
    QCOMPARE(loadsOf(*log, "media/b.mp4"), 2);
}

void TestPlaybackSync::testEditRemapRepositionsBackend()
{
    TimelineEngine engine;
    engine.setTimeline(fixtures::twoSegments());
    auto log = std::make_shared<FakeBackendLog>();
    log->autoComplete = true;
    PlaybackSync sync(engine, FakeVideoBackend::factory(log));
    engine.seek(100.0);
    const int seeks = log->countOf("seek");

    // Same segment id under the playhead, different source mapping
    const Timeline edited = engine.timeline().withTrack(
        0, Track("V1", {Segment("seg1", "clip-a", "V1", 0, 0, 90),
                        Segment("seg2", "clip-b", "V1", 90, 50, 110)}));
    engine.setTimeline(edited);

    QCOMPARE(log->countOf("seek"), seeks + 1);
    QCOMPARE(sync.backend("V1")->currentTime(), (100.0 - 90.0 + 50.0) / 30.0);

    // Unchanged segments are left alone
    engine.setTimeline(edited.withTotalFrames(200));
    QCOMPARE(log->countOf("seek"), seeks + 1);
}

void TestPlaybackSync::testRemovedTrackReleasesBackend()
{
    TimelineEngine engine;
    engine.setTimeline(fixtures::twoTracksWithGap());
    auto log = std::make_shared<FakeBackendLog>();
    log->autoComplete = true;
    PlaybackSync sync(engine, FakeVideoBackend::factory(log));
    engine.seek(50.0);
    QCOMPARE(sync.trackIds(), QStringList({"V1", "V2"}));

    const Timeline withoutOverlay(30.0, 180, {engine.timeline().tracks().first()}, fixtures::catalog());
    engine.setTimeline(withoutOverlay);
    QCOMPARE(sync.trackIds(), QStringList({"V1"}));
    QVERIFY(sync.backend("V2") == nullptr);
}

void TestPlaybackSync::testClockBackend()
{
    ClockBackend backend;
    bool failed = false;
    backend.seek(1.0, [&failed](const Result<void>& result) { failed = result.is_error(); });
    QVERIFY(failed);

    backend.load(QString(), [&failed](const Result<void>& result) { failed = result.is_error(); });
    QVERIFY(failed);

    backend.load("media/a.mp4", [&failed](const Result<void>& result) { failed = result.is_error(); });
    QVERIFY(!failed);
    QCOMPARE(backend.sourceUrl(), QString("media/a.mp4"));

    backend.seek(2.5, [](const Result<void>&) {});
    QCOMPARE(backend.currentTime(), 2.5);
    backend.seek(-4.0, [](const Result<void>&) {});
    QCOMPARE(backend.currentTime(), 0.0);

    backend.play();
    QTest::qWait(30);
    backend.pause();
    const double paused = backend.currentTime();
    QVERIFY(paused > 0.0);
    QTest::qWait(20);
    QCOMPARE(backend.currentTime(), paused);

    // Drives a real sync end to end
    TimelineEngine engine;
    engine.setTimeline(fixtures::twoSegments());
    PlaybackSync sync(engine, ClockBackend::factory());
    engine.seek(120.0);
    QCOMPARE(sync.trackState("V1"), TrackSyncState::Paused);
    QCOMPARE(sync.backend("V1")->currentTime(), 50.0 / 30.0);
}

QTEST_MAIN(TestPlaybackSync)
#include "test_playback_sync.moc"
