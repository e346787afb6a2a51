#include "uuid_generator.h"

#include <QCryptographicHash>
#include <QUuid>

Q_LOGGING_CATEGORY(cutlineUuidGenerator, "cutline.core.uuid")

namespace cutline {

namespace {

// Fixed namespaces per entity type for deterministic generation
const char* namespaceFor(UuidGenerator::EntityType type)
{
    switch (type) {
    case UuidGenerator::ClipEntity:    return "6ba7b810-9dad-11d1-80b4-00c04fd430c8";
    case UuidGenerator::SegmentEntity: return "6ba7b811-9dad-11d1-80b4-00c04fd430c8";
    case UuidGenerator::TrackEntity:   return "6ba7b812-9dad-11d1-80b4-00c04fd430c8";
    case UuidGenerator::EventEntity:   return "6ba7b813-9dad-11d1-80b4-00c04fd430c8";
    }
    return "6ba7b815-9dad-11d1-80b4-00c04fd430c8";
}

} // namespace

UuidGenerator& UuidGenerator::instance()
{
    static UuidGenerator generator;
    return generator;
}

void UuidGenerator::setGenerationMode(GenerationMode mode)
{
    QMutexLocker locker(&m_mutex);
    if (m_mode != mode) {
        qCDebug(cutlineUuidGenerator, "Generation mode changed from %d to %d", m_mode, mode);
        m_mode = mode;
        m_counts.clear();
    }
}

UuidGenerator::GenerationMode UuidGenerator::generationMode() const
{
    QMutexLocker locker(&m_mutex);
    return m_mode;
}

void UuidGenerator::setSeed(quint32 seed)
{
    QMutexLocker locker(&m_mutex);
    m_seed = seed;
    m_counts.clear();
    qCDebug(cutlineUuidGenerator, "UUID generator seeded with: %u", seed);
}

QString UuidGenerator::generateUuid(EntityType type)
{
    QMutexLocker locker(&m_mutex);

    QString uuid = m_mode == TestingMode
        ? generateTestingUuid(type)
        : QUuid::createUuid().toString(QUuid::WithoutBraces);

    m_counts[type] = m_counts.value(type, 0) + 1;
    return uuid;
}

int UuidGenerator::generationCount(EntityType type) const
{
    QMutexLocker locker(&m_mutex);
    return m_counts.value(type, 0);
}

QString UuidGenerator::generateTestingUuid(EntityType type) const
{
    const QString data = QStringLiteral("%1-%2-%3")
                             .arg(QString::fromLatin1(namespaceFor(type)))
                             .arg(m_counts.value(type, 0))
                             .arg(m_seed);

    const QByteArray hash = QCryptographicHash::hash(data.toUtf8(), QCryptographicHash::Sha256);

    // Format as UUID: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    return QStringLiteral("%1-%2-%3-%4-%5")
        .arg(QString::fromLatin1(hash.left(4).toHex()))
        .arg(QString::fromLatin1(hash.mid(4, 2).toHex()))
        .arg(QString::fromLatin1(hash.mid(6, 2).toHex()))
        .arg(QString::fromLatin1(hash.mid(8, 2).toHex()))
        .arg(QString::fromLatin1(hash.mid(10, 6).toHex()));
}

} // namespace cutline
