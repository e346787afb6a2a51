#include "clock_backend.h"

namespace cutline {

void ClockBackend::load(const QString& sourceUrl, BackendCompletion done)
{
    if (sourceUrl.isEmpty()) {
        done(Error::load_failed(QStringLiteral("Empty source url")));
        return;
    }
    m_sourceUrl = sourceUrl;
    m_anchorSeconds = 0.0;
    m_playing = false;
    done(Result<void>());
}

void ClockBackend::seek(double seconds, BackendCompletion done)
{
    if (m_sourceUrl.isEmpty()) {
        done(Error::load_failed(QStringLiteral("Seek before load")));
        return;
    }
    m_anchorSeconds = qMax(0.0, seconds);
    if (m_playing) {
        m_clock.restart();
    }
    done(Result<void>());
}

void ClockBackend::play()
{
    if (m_playing) {
        return;
    }
    m_playing = true;
    m_clock.start();
}

void ClockBackend::pause()
{
    if (!m_playing) {
        return;
    }
    m_anchorSeconds = currentTime();
    m_playing = false;
}

double ClockBackend::currentTime() const
{
    if (!m_playing) {
        return m_anchorSeconds;
    }
    return m_anchorSeconds + static_cast<double>(m_clock.elapsed()) / 1000.0;
}

BackendFactory ClockBackend::factory()
{
    return [](BackendType) -> std::unique_ptr<VideoBackend> {
        return std::make_unique<ClockBackend>();
    };
}

} // namespace cutline
