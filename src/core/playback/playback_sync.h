#pragma once

#include "video_backend.h"
#include "core/common/disposer.h"
#include "core/config/editor_settings.h"
#include "core/models/timeline.h"

#include <QLoggingCategory>
#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>

#include <map>
#include <memory>

Q_DECLARE_LOGGING_CATEGORY(cutlineSync)

namespace cutline {

class TimelineEngine;

enum class TrackSyncState {
    Idle,      // no segment under the playhead
    Loading,   // load or seek in flight
    Ready,     // loaded, positioning not yet confirmed
    Playing,
    Paused,
    Fallback   // backend failed; playhead runs on the wall clock alone
};

QString trackSyncStateToString(TrackSyncState state);

/**
 * PlaybackSync: keeps one backend per track positioned at the engine's playhead.
 *
 * Algorithm per track:
 * - boundary crossing → reuse the backend for the same clip (seek only) or
 *   create a fresh one through the factory (load, then seek)
 * - every request carries the track's generation; completions for an older
 *   generation are discarded
 * - targets are computed from the engine when a completion arrives, not when
 *   the request was issued
 * - a failure degrades the track to Fallback; the next crossing into a segment
 *   of the failed source retries once, after which that source stays in fallback.
 *   A failure is only cleared once a seek on the source has succeeded
 * - while playing, the next segment's clip is loaded and seeked in a standby
 *   backend once the playhead is within the preload lead of its start; the
 *   crossing promotes the standby instead of loading
 *
 * The engine is never written to from here.
 */
class PlaybackSync : public QObject
{
    Q_OBJECT

public:
    PlaybackSync(TimelineEngine& engine, BackendFactory factory,
                 const SyncSettings& settings = SyncSettings(),
                 QObject* parent = nullptr);
    ~PlaybackSync() override;

    TrackSyncState trackState(const QString& trackId) const;
    quint64 generation(const QString& trackId) const;
    VideoBackend* backend(const QString& trackId) const;
    VideoBackend* standbyBackend(const QString& trackId) const;
    QString standbySegmentId(const QString& trackId) const;
    bool isStandbyReady(const QString& trackId) const;
    QString loadedClipId(const QString& trackId) const;
    QString segmentId(const QString& trackId) const;
    double fallbackFrames(const QString& trackId) const;
    QStringList trackIds() const;
    bool isDegraded() const;

    // Source seconds the backend of a track should show at the current playhead
    double targetSeconds(const Segment& segment) const;

signals:
    void trackStateChanged(const QString& trackId, cutline::TrackSyncState state);
    void loadError(const QString& trackId, const QString& segmentId, const QString& message);
    void degradedChanged(bool degraded);
    void staleCompletionDiscarded(const QString& trackId, quint64 generation);

private:
    // Player prepared for the segment after the playhead
    struct Standby {
        std::unique_ptr<VideoBackend> backend;
        Segment segment;
        QString clipId;
        QString sourceUrl;
        bool ready = false;            // loaded and seeked to the segment start
        bool failed = false;
    };

    struct TrackSync {
        std::unique_ptr<VideoBackend> backend;
        QString clipId;
        QString sourceUrl;
        bool loaded = false;
        Segment segment;               // segment the backend is positioned for
        quint64 generation = 0;
        double requestFrame = -1.0;    // playhead when the last seek was issued
        TrackSyncState state = TrackSyncState::Idle;
        QString failedSourceUrl;
        int retriesLeft = 0;
        QSet<QString> exhaustedSources;
        double fallbackFrames = 0.0;
        Standby standby;
        quint64 standbyGeneration = 0;
    };

    void onBoundaryCrossed(const QString& trackId, const QString& previousId, const QString& segmentId);
    void onSeeked(double frame);
    void onFrameChanged(double frame);
    void onPlayStateChanged(bool playing);
    void onTimelineChanged(const Timeline& timeline);

    void syncTrack(const QString& trackId);
    void enterGap(const QString& trackId, TrackSync& track);
    void issueLoad(const QString& trackId, TrackSync& track, const Clip& clip);
    void issueSeek(const QString& trackId, TrackSync& track);
    void onLoadFinished(const QString& trackId, quint64 generation, const Result<void>& result);
    void onSeekFinished(const QString& trackId, quint64 generation, const Result<void>& result);
    void handleFailure(const QString& trackId, TrackSync& track, const Error& error);
    void checkDrift(const QString& trackId, TrackSync& track);

    void preloadUpcoming(double frame);
    void prepareStandby(const QString& trackId, const Segment& segment);
    void onStandbyLoadFinished(const QString& trackId, quint64 generation, const Result<void>& result);
    void onStandbySeekFinished(const QString& trackId, quint64 generation, const Result<void>& result);
    void handleStandbyFailure(const QString& trackId, TrackSync& track, const Error& error);
    bool promoteStandby(const QString& trackId, TrackSync& track, const Segment& segment);
    void discardStandby(TrackSync& track);
    bool isStandbyCurrent(const QString& trackId, quint64 generation);

    TrackSync* findTrack(const QString& trackId);
    const TrackSync* findTrack(const QString& trackId) const;
    bool isCurrent(const QString& trackId, quint64 generation);
    void setState(const QString& trackId, TrackSync& track, TrackSyncState state);
    void updateDegraded();

    TimelineEngine& m_engine;
    BackendFactory m_factory;
    SyncSettings m_settings;
    std::map<QString, TrackSync> m_tracks;
    double m_lastFrame = 0.0;
    bool m_degraded = false;
    DisposerBag m_connections;
};

} // namespace cutline

Q_DECLARE_METATYPE(cutline::TrackSyncState)
