#include "playback_sync.h"

#include "core/timeline/timeline_engine.h"

#include <QPointer>

#include <cmath>

Q_LOGGING_CATEGORY(cutlineSync, "cutline.sync")

namespace cutline {

QString trackSyncStateToString(TrackSyncState state)
{
    switch (state) {
        case TrackSyncState::Idle:     return QStringLiteral("idle");
        case TrackSyncState::Loading:  return QStringLiteral("loading");
        case TrackSyncState::Ready:    return QStringLiteral("ready");
        case TrackSyncState::Playing:  return QStringLiteral("playing");
        case TrackSyncState::Paused:   return QStringLiteral("paused");
        case TrackSyncState::Fallback: return QStringLiteral("fallback");
    }
    return QStringLiteral("unknown");
}

PlaybackSync::PlaybackSync(TimelineEngine& engine, BackendFactory factory,
                           const SyncSettings& settings, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
    , m_factory(std::move(factory))
    , m_settings(settings)
    , m_lastFrame(engine.currentFrame())
{
    qCDebug(cutlineSync, "Initializing PlaybackSync (drift tolerance %gs, %d retries, preload lead %gs)",
            m_settings.driftToleranceSeconds, m_settings.retriesPerFailure, m_settings.preloadLeadSeconds);

    m_connections.add(connect(&m_engine, &TimelineEngine::boundaryCrossed, this, &PlaybackSync::onBoundaryCrossed));
    m_connections.add(connect(&m_engine, &TimelineEngine::seeked, this, &PlaybackSync::onSeeked));
    m_connections.add(connect(&m_engine, &TimelineEngine::frameChanged, this, &PlaybackSync::onFrameChanged));
    m_connections.add(connect(&m_engine, &TimelineEngine::playStateChanged, this, &PlaybackSync::onPlayStateChanged));
    m_connections.add(connect(&m_engine, &TimelineEngine::timelineChanged, this, &PlaybackSync::onTimelineChanged));

    // Position backends for whatever is already under the playhead
    for (const Track& lane : m_engine.timeline().tracks()) {
        if (m_engine.activeSegment(lane.id())) {
            syncTrack(lane.id());
        }
    }
}

PlaybackSync::~PlaybackSync()
{
    m_connections.disposeAll();
    for (auto& entry : m_tracks) {
        if (entry.second.backend) {
            entry.second.backend->pause();
        }
        if (entry.second.standby.backend) {
            entry.second.standby.backend->pause();
        }
    }
}

TrackSyncState PlaybackSync::trackState(const QString& trackId) const
{
    const TrackSync* track = findTrack(trackId);
    return track ? track->state : TrackSyncState::Idle;
}

quint64 PlaybackSync::generation(const QString& trackId) const
{
    const TrackSync* track = findTrack(trackId);
    return track ? track->generation : 0;
}

VideoBackend* PlaybackSync::backend(const QString& trackId) const
{
    const TrackSync* track = findTrack(trackId);
    return track ? track->backend.get() : nullptr;
}

VideoBackend* PlaybackSync::standbyBackend(const QString& trackId) const
{
    const TrackSync* track = findTrack(trackId);
    return track ? track->standby.backend.get() : nullptr;
}

QString PlaybackSync::standbySegmentId(const QString& trackId) const
{
    const TrackSync* track = findTrack(trackId);
    return track && track->standby.backend ? track->standby.segment.id() : QString();
}

bool PlaybackSync::isStandbyReady(const QString& trackId) const
{
    const TrackSync* track = findTrack(trackId);
    return track && track->standby.backend && track->standby.ready;
}

QString PlaybackSync::loadedClipId(const QString& trackId) const
{
    const TrackSync* track = findTrack(trackId);
    return track && track->loaded ? track->clipId : QString();
}

QString PlaybackSync::segmentId(const QString& trackId) const
{
    const TrackSync* track = findTrack(trackId);
    return track ? track->segment.id() : QString();
}

double PlaybackSync::fallbackFrames(const QString& trackId) const
{
    const TrackSync* track = findTrack(trackId);
    return track ? track->fallbackFrames : 0.0;
}

QStringList PlaybackSync::trackIds() const
{
    QStringList ids;
    for (const auto& entry : m_tracks) {
        ids.append(entry.first);
    }
    return ids;
}

bool PlaybackSync::isDegraded() const
{
    for (const auto& entry : m_tracks) {
        if (entry.second.state == TrackSyncState::Fallback) {
            return true;
        }
    }
    return false;
}

double PlaybackSync::targetSeconds(const Segment& segment) const
{
    return segment.sourceFrameAt(m_engine.currentFrame()) / m_engine.fps();
}

void PlaybackSync::onBoundaryCrossed(const QString& trackId, const QString& previousId, const QString& segmentId)
{
    qCDebug(cutlineSync, "Track %s crossed '%s' -> '%s'",
            qPrintable(trackId), qPrintable(previousId), qPrintable(segmentId));
    syncTrack(trackId);
}

void PlaybackSync::onSeeked(double frame)
{
    m_lastFrame = frame;

    for (auto& entry : m_tracks) {
        TrackSync& track = entry.second;
        if (!track.loaded || track.segment.id().isEmpty() || track.state == TrackSyncState::Fallback) {
            continue;
        }
        // Already positioned by the boundary crossing of this same seek
        if (track.requestFrame == frame) {
            continue;
        }
        issueSeek(entry.first, track);
    }
}

void PlaybackSync::onFrameChanged(double frame)
{
    const double delta = frame - m_lastFrame;
    m_lastFrame = frame;

    // A seek marker only holds for the seek that set it
    for (auto& entry : m_tracks) {
        entry.second.requestFrame = -1.0;
    }
    if (!m_engine.isPlaying()) {
        return;
    }

    for (auto& entry : m_tracks) {
        TrackSync& track = entry.second;
        if (track.state == TrackSyncState::Fallback && delta > 0.0) {
            track.fallbackFrames += delta;
        } else if (track.state == TrackSyncState::Playing) {
            checkDrift(entry.first, track);
        }
    }
    preloadUpcoming(frame);
}

void PlaybackSync::onPlayStateChanged(bool playing)
{
    for (auto& entry : m_tracks) {
        TrackSync& track = entry.second;
        if (track.state != TrackSyncState::Playing && track.state != TrackSyncState::Paused) {
            continue;
        }
        if (playing) {
            track.backend->play();
            setState(entry.first, track, TrackSyncState::Playing);
        } else {
            track.backend->pause();
            setState(entry.first, track, TrackSyncState::Paused);
        }
    }
}

void PlaybackSync::onTimelineChanged(const Timeline& timeline)
{
    // Algorithm: Release removed tracks → Re-position tracks whose segment mapping moved
    for (auto it = m_tracks.begin(); it != m_tracks.end();) {
        if (timeline.trackIndex(it->first) < 0) {
            qCDebug(cutlineSync, "Releasing backend of removed track %s", qPrintable(it->first));
            it = m_tracks.erase(it);
        } else {
            ++it;
        }
    }
    updateDegraded();

    for (auto& entry : m_tracks) {
        TrackSync& track = entry.second;
        // A standby prepared for a segment the edit changed or removed is useless
        if (track.standby.backend || track.standby.failed) {
            const Segment* prepared = timeline.segment(track.standby.segment.id());
            if (!prepared || *prepared != track.standby.segment) {
                qCDebug(cutlineSync, "Dropping standby of track %s for edited segment %s",
                        qPrintable(entry.first), qPrintable(track.standby.segment.id()));
                discardStandby(track);
            }
        }
        if (track.segment.id().isEmpty()) {
            continue;
        }
        const Segment* current = timeline.segment(track.segment.id());
        if (!current || current->trackId() != entry.first || *current == track.segment) {
            continue;
        }

        const bool remapped = current->clipId() != track.segment.clipId()
            || current->timelineStart() != track.segment.timelineStart()
            || current->sourceIn() != track.segment.sourceIn();
        track.segment = *current;
        if (!remapped || track.state == TrackSyncState::Fallback) {
            continue;
        }

        qCDebug(cutlineSync, "Segment %s remapped by edit, re-syncing track %s",
                qPrintable(current->id()), qPrintable(entry.first));
        const Clip* clip = timeline.clip(current->clipId());
        if (clip && clip->id() != track.clipId) {
            issueLoad(entry.first, track, *clip);
        } else if (track.loaded) {
            issueSeek(entry.first, track);
        }
    }
}

void PlaybackSync::syncTrack(const QString& trackId)
{
    TrackSync& track = m_tracks[trackId];
    const Segment* segment = m_engine.activeSegment(trackId);
    if (!segment) {
        enterGap(trackId, track);
        return;
    }

    track.segment = *segment;
    const Clip* clip = m_engine.timeline().clip(segment->clipId());
    if (!clip) {
        ++track.generation;
        handleFailure(trackId, track, Error::not_found(QStringLiteral("clip %1").arg(segment->clipId())));
        return;
    }

    // Failed sources: exhausted ones stay in fallback, others get their single retry now
    if (track.exhaustedSources.contains(clip->sourceUrl())) {
        ++track.generation;
        setState(trackId, track, TrackSyncState::Fallback);
        return;
    }
    if (track.failedSourceUrl == clip->sourceUrl()) {
        if (track.retriesLeft <= 0) {
            track.exhaustedSources.insert(clip->sourceUrl());
            track.failedSourceUrl.clear();
            ++track.generation;
            setState(trackId, track, TrackSyncState::Fallback);
            return;
        }
        --track.retriesLeft;
        track.loaded = false;
        qCInfo(cutlineSync, "Retrying source %s on track %s",
               qPrintable(clip->sourceUrl()), qPrintable(trackId));
    }

    if (track.standby.backend && track.standby.segment.id() == segment->id()) {
        if (promoteStandby(trackId, track, *segment)) {
            return;
        }
        discardStandby(track);
    }

    const bool reusable = track.backend && track.loaded
        && track.clipId == clip->id() && track.sourceUrl == clip->sourceUrl();
    if (reusable) {
        issueSeek(trackId, track);
    } else {
        issueLoad(trackId, track, *clip);
    }
}

void PlaybackSync::enterGap(const QString& trackId, TrackSync& track)
{
    // Supersede anything in flight; the backend is kept for a later reuse
    ++track.generation;
    track.segment = Segment();
    if (track.backend && track.loaded) {
        track.backend->pause();
    }
    setState(trackId, track, TrackSyncState::Idle);
}

void PlaybackSync::issueLoad(const QString& trackId, TrackSync& track, const Clip& clip)
{
    // Algorithm: Replace backend → Bump generation → Load → (completion) seek
    track.backend = m_factory ? m_factory(clip.backendType()) : nullptr;
    track.clipId = clip.id();
    track.sourceUrl = clip.sourceUrl();
    track.loaded = false;
    const quint64 generation = ++track.generation;

    if (!track.backend) {
        handleFailure(trackId, track,
                      Error::load_failed(QStringLiteral("No backend for %1").arg(backendTypeToString(clip.backendType()))));
        return;
    }

    qCDebug(cutlineSync, "Track %s loading %s (generation %llu)",
            qPrintable(trackId), qPrintable(clip.sourceUrl()), static_cast<unsigned long long>(generation));
    setState(trackId, track, TrackSyncState::Loading);

    QPointer<PlaybackSync> self(this);
    const QString id = trackId;
    track.backend->load(clip.sourceUrl(), [self, id, generation](const Result<void>& result) {
        if (self) {
            self->onLoadFinished(id, generation, result);
        }
    });
}

void PlaybackSync::issueSeek(const QString& trackId, TrackSync& track)
{
    const quint64 generation = ++track.generation;
    track.requestFrame = m_engine.currentFrame();
    const double seconds = targetSeconds(track.segment);

    qCDebug(cutlineSync, "Track %s seeking to %.3fs (generation %llu)",
            qPrintable(trackId), seconds, static_cast<unsigned long long>(generation));
    setState(trackId, track, TrackSyncState::Loading);

    QPointer<PlaybackSync> self(this);
    const QString id = trackId;
    track.backend->seek(seconds, [self, id, generation](const Result<void>& result) {
        if (self) {
            self->onSeekFinished(id, generation, result);
        }
    });
}

void PlaybackSync::onLoadFinished(const QString& trackId, quint64 generation, const Result<void>& result)
{
    if (!isCurrent(trackId, generation)) {
        return;
    }
    TrackSync& track = *findTrack(trackId);
    if (result.is_error()) {
        handleFailure(trackId, track, result.error());
        return;
    }

    // The failure record stays until a seek succeeds: a failed seek is the same failure
    track.loaded = true;
    setState(trackId, track, TrackSyncState::Ready);
    issueSeek(trackId, track);
}

void PlaybackSync::onSeekFinished(const QString& trackId, quint64 generation, const Result<void>& result)
{
    if (!isCurrent(trackId, generation)) {
        return;
    }
    TrackSync& track = *findTrack(trackId);
    if (result.is_error()) {
        handleFailure(trackId, track, result.error());
        return;
    }

    if (track.failedSourceUrl == track.sourceUrl) {
        qCInfo(cutlineSync, "Source %s recovered on track %s", qPrintable(track.sourceUrl), qPrintable(trackId));
        track.failedSourceUrl.clear();
        track.retriesLeft = 0;
    }

    // Play intent is read now: a pause issued while the request was in flight wins
    if (m_engine.isPlaying()) {
        track.backend->play();
        setState(trackId, track, TrackSyncState::Playing);
    } else {
        track.backend->pause();
        setState(trackId, track, TrackSyncState::Paused);
    }
}

void PlaybackSync::handleFailure(const QString& trackId, TrackSync& track, const Error& error)
{
    qCWarning(cutlineSync, "Track %s %s: %s", qPrintable(trackId),
              error_code_to_string(error.code), qPrintable(error.message));

    if (track.failedSourceUrl != track.sourceUrl) {
        track.failedSourceUrl = track.sourceUrl;
        track.retriesLeft = m_settings.retriesPerFailure;
    } else if (track.retriesLeft <= 0) {
        qCWarning(cutlineSync, "Source %s exhausted its retries, staying in fallback", qPrintable(track.sourceUrl));
        track.exhaustedSources.insert(track.sourceUrl);
        track.failedSourceUrl.clear();
    }

    track.loaded = false;
    if (track.backend) {
        track.backend->pause();
    }
    setState(trackId, track, TrackSyncState::Fallback);
    emit loadError(trackId, track.segment.id(), error.message);
}

void PlaybackSync::checkDrift(const QString& trackId, TrackSync& track)
{
    const double target = targetSeconds(track.segment);
    const double actual = track.backend->currentTime();
    if (std::fabs(actual - target) <= m_settings.driftToleranceSeconds) {
        return;
    }
    qCDebug(cutlineSync, "Track %s drifted %.3fs, re-seeking", qPrintable(trackId), actual - target);
    issueSeek(trackId, track);
}

void PlaybackSync::preloadUpcoming(double frame)
{
    const double leadFrames = m_settings.preloadLeadSeconds * m_engine.fps();
    for (const Track& lane : m_engine.timeline().tracks()) {
        // Segments are sorted and disjoint: the upcoming one is at or right after this index
        int index = lane.firstSegmentEndingAfter(frame);
        if (index < lane.segmentCount() && lane.segments().at(index).containsFrame(frame)) {
            ++index;
        }
        if (index >= lane.segmentCount()) {
            continue;
        }
        const Segment& upcoming = lane.segments().at(index);
        if (static_cast<double>(upcoming.timelineStart()) - frame <= leadFrames) {
            prepareStandby(lane.id(), upcoming);
        }
    }
}

void PlaybackSync::prepareStandby(const QString& trackId, const Segment& segment)
{
    TrackSync& track = m_tracks[trackId];
    if ((track.standby.backend || track.standby.failed) && track.standby.segment == segment) {
        return;
    }

    const Clip* clip = m_engine.timeline().clip(segment.clipId());
    if (!clip) {
        return;
    }
    // Same clip as the active backend: the crossing only seeks
    if (track.backend && track.loaded && track.clipId == clip->id() && track.sourceUrl == clip->sourceUrl()) {
        return;
    }
    // Failed sources are left to the crossing, which owns their retry
    if (track.exhaustedSources.contains(clip->sourceUrl()) || track.failedSourceUrl == clip->sourceUrl()) {
        return;
    }

    discardStandby(track);
    track.standby.segment = segment;
    track.standby.clipId = clip->id();
    track.standby.sourceUrl = clip->sourceUrl();
    track.standby.backend = m_factory ? m_factory(clip->backendType()) : nullptr;
    if (!track.standby.backend) {
        track.standby.failed = true;
        return;
    }

    const quint64 generation = ++track.standbyGeneration;
    qCDebug(cutlineSync, "Track %s preloading %s for segment %s (standby generation %llu)",
            qPrintable(trackId), qPrintable(clip->sourceUrl()), qPrintable(segment.id()),
            static_cast<unsigned long long>(generation));

    QPointer<PlaybackSync> self(this);
    const QString id = trackId;
    track.standby.backend->load(clip->sourceUrl(), [self, id, generation](const Result<void>& result) {
        if (self) {
            self->onStandbyLoadFinished(id, generation, result);
        }
    });
}

void PlaybackSync::onStandbyLoadFinished(const QString& trackId, quint64 generation, const Result<void>& result)
{
    if (!isStandbyCurrent(trackId, generation)) {
        return;
    }
    TrackSync& track = *findTrack(trackId);
    if (result.is_error()) {
        handleStandbyFailure(trackId, track, result.error());
        return;
    }

    // Position at the first frame the segment shows
    const double seconds = static_cast<double>(track.standby.segment.sourceIn()) / m_engine.fps();
    QPointer<PlaybackSync> self(this);
    const QString id = trackId;
    track.standby.backend->seek(seconds, [self, id, generation](const Result<void>& seeked) {
        if (self) {
            self->onStandbySeekFinished(id, generation, seeked);
        }
    });
}

void PlaybackSync::onStandbySeekFinished(const QString& trackId, quint64 generation, const Result<void>& result)
{
    if (!isStandbyCurrent(trackId, generation)) {
        return;
    }
    TrackSync& track = *findTrack(trackId);
    if (result.is_error()) {
        handleStandbyFailure(trackId, track, result.error());
        return;
    }
    track.standby.backend->pause();
    track.standby.ready = true;
    qCDebug(cutlineSync, "Track %s standby ready for segment %s",
            qPrintable(trackId), qPrintable(track.standby.segment.id()));
}

void PlaybackSync::handleStandbyFailure(const QString& trackId, TrackSync& track, const Error& error)
{
    qCWarning(cutlineSync, "Track %s standby %s: %s", qPrintable(trackId),
              error_code_to_string(error.code), qPrintable(error.message));

    // Counts as the source's first failure: the crossing into it is the retry
    if (track.failedSourceUrl.isEmpty()) {
        track.failedSourceUrl = track.standby.sourceUrl;
        track.retriesLeft = m_settings.retriesPerFailure;
    }

    // The backend may still be on the stack of this completion; it is released on the next discard
    ++track.standbyGeneration;
    track.standby.ready = false;
    track.standby.failed = true;
}

bool PlaybackSync::promoteStandby(const QString& trackId, TrackSync& track, const Segment& segment)
{
    if (!track.standby.ready || track.standby.segment != segment) {
        return false;
    }

    // Algorithm: Swap players → Bump generation → Re-seek only if the crossing landed away from the start
    qCDebug(cutlineSync, "Track %s promoting standby %s for segment %s",
            qPrintable(trackId), qPrintable(track.standby.sourceUrl), qPrintable(segment.id()));
    if (track.backend) {
        track.backend->pause();
    }
    track.backend = std::move(track.standby.backend);
    track.clipId = track.standby.clipId;
    track.sourceUrl = track.standby.sourceUrl;
    track.loaded = true;
    track.standby = Standby();
    ++track.standbyGeneration;
    ++track.generation;

    if (std::fabs(track.backend->currentTime() - targetSeconds(segment)) > m_settings.driftToleranceSeconds) {
        issueSeek(trackId, track);
        return true;
    }

    track.requestFrame = m_engine.currentFrame();
    if (m_engine.isPlaying()) {
        track.backend->play();
        setState(trackId, track, TrackSyncState::Playing);
    } else {
        track.backend->pause();
        setState(trackId, track, TrackSyncState::Paused);
    }
    return true;
}

void PlaybackSync::discardStandby(TrackSync& track)
{
    if (track.standby.backend) {
        track.standby.backend->pause();
    }
    track.standby = Standby();
    ++track.standbyGeneration;
}

bool PlaybackSync::isStandbyCurrent(const QString& trackId, quint64 generation)
{
    const TrackSync* track = findTrack(trackId);
    const quint64 current = track ? track->standbyGeneration : 0;
    if (track && track->standby.backend && generation == current) {
        return true;
    }
    const Error stale = Error::stale(generation, current);
    qCDebug(cutlineSync, "Track %s discarding standby completion: %s", qPrintable(trackId), qPrintable(stale.message));
    emit staleCompletionDiscarded(trackId, generation);
    return false;
}

PlaybackSync::TrackSync* PlaybackSync::findTrack(const QString& trackId)
{
    auto it = m_tracks.find(trackId);
    return it != m_tracks.end() ? &it->second : nullptr;
}

const PlaybackSync::TrackSync* PlaybackSync::findTrack(const QString& trackId) const
{
    auto it = m_tracks.find(trackId);
    return it != m_tracks.end() ? &it->second : nullptr;
}

bool PlaybackSync::isCurrent(const QString& trackId, quint64 generation)
{
    const TrackSync* track = findTrack(trackId);
    const quint64 current = track ? track->generation : 0;
    if (track && generation == current) {
        return true;
    }
    const Error stale = Error::stale(generation, current);
    qCDebug(cutlineSync, "Track %s discarding completion: %s", qPrintable(trackId), qPrintable(stale.message));
    emit staleCompletionDiscarded(trackId, generation);
    return false;
}

void PlaybackSync::setState(const QString& trackId, TrackSync& track, TrackSyncState state)
{
    if (track.state == state) {
        return;
    }
    qCDebug(cutlineSync, "Track %s: %s -> %s", qPrintable(trackId),
            qPrintable(trackSyncStateToString(track.state)), qPrintable(trackSyncStateToString(state)));
    track.state = state;
    emit trackStateChanged(trackId, state);
    updateDegraded();
}

void PlaybackSync::updateDegraded()
{
    const bool degraded = isDegraded();
    if (degraded != m_degraded) {
        m_degraded = degraded;
        emit degradedChanged(m_degraded);
    }
}

} // namespace cutline
