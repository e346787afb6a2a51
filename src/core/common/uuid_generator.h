#pragma once

#include <QHash>
#include <QLoggingCategory>
#include <QMutex>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(cutlineUuidGenerator)

namespace cutline {

/**
 * Identifier source for clips, segments, tracks and journal events.
 *
 * - Production: random RFC 4122 UUIDs
 * - Testing: deterministic SHA-256 derived UUIDs from (namespace, count, seed),
 *   so a replayed edit sequence produces identical segment ids
 */
class UuidGenerator
{
public:
    enum GenerationMode {
        ProductionMode,
        TestingMode
    };

    enum EntityType {
        ClipEntity,
        SegmentEntity,
        TrackEntity,
        EventEntity
    };

    static UuidGenerator& instance();

    void setGenerationMode(GenerationMode mode);
    GenerationMode generationMode() const;
    void setSeed(quint32 seed);

    QString generateUuid(EntityType type);
    QString generateSegmentUuid() { return generateUuid(SegmentEntity); }
    QString generateClipUuid() { return generateUuid(ClipEntity); }
    QString generateEventUuid() { return generateUuid(EventEntity); }

    int generationCount(EntityType type) const;

private:
    UuidGenerator() = default;
    UuidGenerator(const UuidGenerator&) = delete;
    UuidGenerator& operator=(const UuidGenerator&) = delete;

    QString generateTestingUuid(EntityType type) const;

    mutable QMutex m_mutex;
    GenerationMode m_mode = ProductionMode;
    quint32 m_seed = 0;
    QHash<int, int> m_counts;
};

} // namespace cutline
