#include "timeline.h"

#include "core/common/uuid_generator.h"

#include <QSet>

#include <cmath>

namespace cutline {

namespace {

// Largest integer a JSON double carries exactly (2^53)
const double MAX_EXACT_FRAME = 9007199254740992.0;

Result<qint64> readFrame(const QJsonObject& json, const char* key)
{
    const QJsonValue value = json.value(QLatin1String(key));
    if (!value.isDouble()) {
        return Error::parse_error(QStringLiteral("Missing or non-numeric '%1'").arg(QLatin1String(key)));
    }
    const double number = value.toDouble();
    if (!std::isfinite(number) || std::fabs(number) > MAX_EXACT_FRAME) {
        return Error::parse_error(QStringLiteral("'%1' is out of range").arg(QLatin1String(key)));
    }
    if (number != std::floor(number)) {
        return Error::parse_error(QStringLiteral("'%1' must be an integer frame").arg(QLatin1String(key)));
    }
    return static_cast<qint64>(number);
}

Result<Segment> parseSegment(const QJsonObject& json, const QString& trackId)
{
    const QString clipId = json.value("clipId").toString();
    if (clipId.isEmpty()) {
        return Error::parse_error(QStringLiteral("Segment without clipId on track %1").arg(trackId));
    }

    auto start = readFrame(json, "timelineStart");
    auto end = readFrame(json, "timelineEnd");
    auto sourceIn = readFrame(json, "sourceIn");
    auto sourceOut = readFrame(json, "sourceOut");
    for (const auto* field : {&start, &end, &sourceIn, &sourceOut}) {
        if (field->is_error()) {
            return field->error();
        }
    }

    if (end.value() - start.value() != sourceOut.value() - sourceIn.value()) {
        return Error::parse_error(QStringLiteral("Segment on clip %1: timeline length %2 != source length %3")
                                      .arg(clipId)
                                      .arg(end.value() - start.value())
                                      .arg(sourceOut.value() - sourceIn.value()));
    }

    QString id = json.value("id").toString();
    if (id.isEmpty()) {
        id = UuidGenerator::instance().generateSegmentUuid();
    }
    return Segment(id, clipId, trackId, start.value(), sourceIn.value(), sourceOut.value());
}

} // namespace

Timeline::Timeline(double fps, qint64 totalFrames, const QList<Track>& tracks, const QHash<QString, Clip>& clips)
    : m_fps(fps)
    , m_totalFrames(totalFrames)
    , m_tracks(tracks)
    , m_clips(clips)
{
}

Timeline Timeline::create(double fps, const QStringList& trackIds)
{
    QList<Track> tracks;
    for (const QString& id : trackIds) {
        tracks.append(Track(id));
    }
    return Timeline(fps, 0, tracks);
}

int Timeline::trackIndex(const QString& trackId) const
{
    for (int i = 0; i < m_tracks.size(); ++i) {
        if (m_tracks.at(i).id() == trackId) {
            return i;
        }
    }
    return -1;
}

const Track* Timeline::track(const QString& trackId) const
{
    const int index = trackIndex(trackId);
    return index >= 0 ? &m_tracks.at(index) : nullptr;
}

const Clip* Timeline::clip(const QString& clipId) const
{
    auto it = m_clips.constFind(clipId);
    return it != m_clips.constEnd() ? &it.value() : nullptr;
}

SegmentLocation Timeline::locate(const QString& segmentId) const
{
    for (int t = 0; t < m_tracks.size(); ++t) {
        const int s = m_tracks.at(t).indexOf(segmentId);
        if (s >= 0) {
            return SegmentLocation{t, s};
        }
    }
    return SegmentLocation{};
}

const Segment* Timeline::segment(const QString& segmentId) const
{
    const SegmentLocation location = locate(segmentId);
    if (!location.isValid()) {
        return nullptr;
    }
    return &m_tracks.at(location.trackIndex).segments().at(location.segmentIndex);
}

const Segment* Timeline::segmentAt(const QString& trackId, double frame) const
{
    const Track* lane = track(trackId);
    return lane ? lane->segmentAt(frame) : nullptr;
}

int Timeline::segmentCount() const
{
    int count = 0;
    for (const Track& lane : m_tracks) {
        count += lane.segmentCount();
    }
    return count;
}

qint64 Timeline::contentEnd() const
{
    qint64 end = 0;
    for (const Track& lane : m_tracks) {
        end = qMax(end, lane.contentEnd());
    }
    return end;
}

Timeline Timeline::withTrack(int trackIndex, const Track& track) const
{
    Timeline copy(*this);
    copy.m_tracks[trackIndex] = track;
    return copy;
}

Timeline Timeline::withTrackAdded(const Track& track) const
{
    Timeline copy(*this);
    copy.m_tracks.append(track);
    return copy;
}

Timeline Timeline::withTotalFrames(qint64 totalFrames) const
{
    Timeline copy(*this);
    copy.m_totalFrames = totalFrames;
    return copy;
}

Timeline Timeline::withClip(const Clip& clip) const
{
    Timeline copy(*this);
    copy.m_clips.insert(clip.id(), clip);
    return copy;
}

Result<void> Timeline::validate() const
{
    if (!(m_fps > 0.0) || !std::isfinite(m_fps)) {
        return Error::invalid_arg(QStringLiteral("fps must be positive, got %1").arg(m_fps));
    }
    if (m_totalFrames < 0) {
        return Error::invalid_arg(QStringLiteral("totalFrames must be >= 0"));
    }

    // Ids resolve through segment()/trackIndex(), so they must be unique timeline-wide
    QSet<QString> trackIds;
    QSet<QString> segmentIds;
    for (const Track& lane : m_tracks) {
        if (trackIds.contains(lane.id())) {
            return Error::invalid_arg(QStringLiteral("Duplicate track id %1").arg(lane.id()));
        }
        trackIds.insert(lane.id());

        qint64 previousEnd = 0;
        for (int i = 0; i < lane.segmentCount(); ++i) {
            const Segment& segment = lane.segments().at(i);
            if (!segment.isValid()) {
                return Error::invalid_arg(QStringLiteral("Segment %1 is malformed").arg(segment.id()));
            }
            if (segmentIds.contains(segment.id())) {
                return Error::invalid_arg(QStringLiteral("Duplicate segment id %1 on track %2")
                                              .arg(segment.id(), lane.id()));
            }
            segmentIds.insert(segment.id());
            if (segment.order() != i || segment.trackId() != lane.id()) {
                return Error::internal(QStringLiteral("Segment %1 has stale order/track").arg(segment.id()));
            }
            if (segment.timelineStart() < previousEnd) {
                const QString otherId = i > 0 ? lane.segments().at(i - 1).id() : QString();
                return Error::overlap(segment.id(), otherId);
            }
            if (segment.timelineEnd() > m_totalFrames) {
                return Error::invalid_arg(QStringLiteral("Segment %1 ends at %2 past totalFrames %3")
                                              .arg(segment.id())
                                              .arg(segment.timelineEnd())
                                              .arg(m_totalFrames));
            }

            const Clip* source = clip(segment.clipId());
            if (!source) {
                return Error::not_found(QStringLiteral("clip %1 for segment %2").arg(segment.clipId(), segment.id()));
            }
            if (segment.sourceOut() > source->durationFrames()) {
                return Error::invalid_arg(QStringLiteral("Segment %1 reads past end of clip %2")
                                              .arg(segment.id(), source->id()));
            }
            previousEnd = segment.timelineEnd();
        }
    }
    return Result<void>();
}

QJsonObject Timeline::serialize() const
{
    QJsonArray tracks;
    for (const Track& lane : m_tracks) {
        QJsonArray segments;
        for (const Segment& segment : lane.segments()) {
            QJsonObject entry;
            entry["id"] = segment.id();
            entry["clipId"] = segment.clipId();
            entry["timelineStart"] = static_cast<double>(segment.timelineStart());
            entry["timelineEnd"] = static_cast<double>(segment.timelineEnd());
            entry["sourceIn"] = static_cast<double>(segment.sourceIn());
            entry["sourceOut"] = static_cast<double>(segment.sourceOut());
            segments.append(entry);
        }
        QJsonObject trackJson;
        trackJson["id"] = lane.id();
        trackJson["segments"] = segments;
        tracks.append(trackJson);
    }

    QJsonObject json;
    json["fps"] = m_fps;
    json["totalFrames"] = static_cast<double>(m_totalFrames);
    json["tracks"] = tracks;
    return json;
}

QJsonArray Timeline::serializeClips() const
{
    QJsonArray clips;
    for (auto it = m_clips.constBegin(); it != m_clips.constEnd(); ++it) {
        QJsonObject entry;
        entry["id"] = it->id();
        entry["sourceUrl"] = it->sourceUrl();
        entry["backendType"] = backendTypeToString(it->backendType());
        entry["durationFrames"] = static_cast<double>(it->durationFrames());
        clips.append(entry);
    }
    return clips;
}

Result<Timeline> Timeline::deserialize(const QJsonObject& json, const QHash<QString, Clip>& clips)
{
    const double fps = json.value("fps").toDouble(0.0);
    if (!(fps > 0.0)) {
        return Error::parse_error(QStringLiteral("Missing or invalid fps"));
    }
    auto totalFrames = readFrame(json, "totalFrames");
    if (totalFrames.is_error()) {
        return totalFrames.error();
    }

    QList<Track> tracks;
    const QJsonArray tracksJson = json.value("tracks").toArray();
    for (int t = 0; t < tracksJson.size(); ++t) {
        const QJsonObject trackJson = tracksJson.at(t).toObject();
        QString trackId = trackJson.value("id").toString();
        if (trackId.isEmpty()) {
            trackId = QStringLiteral("track-%1").arg(t + 1);
        }

        QList<Segment> segments;
        const QJsonArray segmentsJson = trackJson.value("segments").toArray();
        for (const QJsonValue& value : segmentsJson) {
            auto segment = parseSegment(value.toObject(), trackId);
            if (segment.is_error()) {
                return segment.error();
            }
            segments.append(segment.value());
        }
        tracks.append(Track(trackId, segments));
    }

    Timeline timeline(fps, totalFrames.value(), tracks, clips);
    auto valid = timeline.validate();
    if (valid.is_error()) {
        return Error::parse_error(QStringLiteral("Invalid timeline: %1").arg(valid.error().message));
    }
    return timeline;
}

Result<QHash<QString, Clip>> Timeline::deserializeClips(const QJsonArray& json)
{
    QHash<QString, Clip> clips;
    for (const QJsonValue& value : json) {
        const QJsonObject entry = value.toObject();
        const auto backend = backendTypeFromString(entry.value("backendType").toString(QStringLiteral("html5")));
        if (!backend) {
            return Error::parse_error(QStringLiteral("Unknown backendType '%1'")
                                          .arg(entry.value("backendType").toString()));
        }
        auto duration = readFrame(entry, "durationFrames");
        if (duration.is_error()) {
            return duration.error();
        }
        Clip clip(entry.value("id").toString(), entry.value("sourceUrl").toString(), *backend, duration.value());
        if (!clip.isValid()) {
            return Error::parse_error(QStringLiteral("Invalid clip entry '%1'").arg(clip.id()));
        }
        clips.insert(clip.id(), clip);
    }
    return clips;
}

bool Timeline::operator==(const Timeline& other) const
{
    return m_fps == other.m_fps
        && m_totalFrames == other.m_totalFrames
        && m_tracks == other.m_tracks
        && m_clips == other.m_clips;
}

} // namespace cutline
