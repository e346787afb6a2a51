#include "clip.h"

#include "core/common/uuid_generator.h"

namespace cutline {

QString backendTypeToString(BackendType type)
{
    switch (type) {
    case BackendType::Html5:   return QStringLiteral("html5");
    case BackendType::YouTube: return QStringLiteral("youtube");
    }
    return QStringLiteral("html5");
}

std::optional<BackendType> backendTypeFromString(const QString& name)
{
    const QString normalized = name.trimmed().toLower();
    if (normalized == QLatin1String("html5")) {
        return BackendType::Html5;
    }
    if (normalized == QLatin1String("youtube")) {
        return BackendType::YouTube;
    }
    return std::nullopt;
}

Clip::Clip(const QString& id, const QString& sourceUrl, BackendType backendType, qint64 durationFrames)
    : m_id(id)
    , m_sourceUrl(sourceUrl)
    , m_backendType(backendType)
    , m_durationFrames(durationFrames)
{
}

Clip Clip::create(const QString& sourceUrl, BackendType backendType, qint64 durationFrames)
{
    return Clip(UuidGenerator::instance().generateClipUuid(), sourceUrl, backendType, durationFrames);
}

bool Clip::operator==(const Clip& other) const
{
    return m_id == other.m_id
        && m_sourceUrl == other.m_sourceUrl
        && m_backendType == other.m_backendType
        && m_durationFrames == other.m_durationFrames;
}

} // namespace cutline
