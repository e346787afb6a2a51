#pragma once

#include <QString>
#include <QtGlobal>

#include <optional>

namespace cutline {

enum class BackendType {
    Html5,
    YouTube
};

QString backendTypeToString(BackendType type);
std::optional<BackendType> backendTypeFromString(const QString& name);

/**
 * Clip entity - imported source media, immutable once created.
 * Many segments may reference the same clip.
 */
class Clip
{
public:
    Clip() = default;
    Clip(const QString& id, const QString& sourceUrl, BackendType backendType, qint64 durationFrames);

    /**
     * Create new clip for imported media
     * Algorithm: Generate UUID → Record source → Fix duration
     */
    static Clip create(const QString& sourceUrl, BackendType backendType, qint64 durationFrames);

    QString id() const { return m_id; }
    QString sourceUrl() const { return m_sourceUrl; }
    BackendType backendType() const { return m_backendType; }
    qint64 durationFrames() const { return m_durationFrames; }

    bool isValid() const { return !m_id.isEmpty() && !m_sourceUrl.isEmpty() && m_durationFrames > 0; }

    bool operator==(const Clip& other) const;
    bool operator!=(const Clip& other) const { return !(*this == other); }

private:
    QString m_id;
    QString m_sourceUrl;
    BackendType m_backendType = BackendType::Html5;
    qint64 m_durationFrames = 0;
};

} // namespace cutline
