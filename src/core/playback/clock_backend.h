#pragma once

#include "video_backend.h"

#include <QElapsedTimer>

namespace cutline {

/**
 * ClockBackend: media-less backend that reports source time from a wall
 * clock. Used by the headless preview tool; loads and seeks complete inline.
 */
class ClockBackend : public VideoBackend
{
public:
    ClockBackend() = default;

    void load(const QString& sourceUrl, BackendCompletion done) override;
    void seek(double seconds, BackendCompletion done) override;
    void play() override;
    void pause() override;
    double currentTime() const override;

    QString sourceUrl() const { return m_sourceUrl; }
    bool isPlaying() const { return m_playing; }

    static BackendFactory factory();

private:
    QString m_sourceUrl;
    double m_anchorSeconds = 0.0;
    bool m_playing = false;
    QElapsedTimer m_clock;
};

} // namespace cutline
