#include "frame_scheduler.h"

#include "timeline_engine.h"

Q_LOGGING_CATEGORY(cutlineScheduler, "cutline.scheduler")

namespace cutline {

FrameScheduler::FrameScheduler(TimelineEngine& engine, const SchedulerSettings& settings, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
{
    m_timer.setTimerType(Qt::PreciseTimer);
    m_timer.setSingleShot(false);
    m_timer.setInterval(settings.tickIntervalMs);

    connect(&m_timer, &QTimer::timeout, this, &FrameScheduler::onTimeout);
    m_connections.add(connect(&m_engine, &TimelineEngine::playStateChanged,
                              this, &FrameScheduler::onPlayStateChanged));

    if (m_engine.isPlaying()) {
        onPlayStateChanged(true);
    }
}

FrameScheduler::~FrameScheduler()
{
    m_timer.stop();
    m_connections.disposeAll();
}

void FrameScheduler::onPlayStateChanged(bool playing)
{
    if (playing) {
        qCDebug(cutlineScheduler, "Starting frame loop (%d ms)", m_timer.interval());
        m_clock.start();
        m_timer.start();
    } else {
        qCDebug(cutlineScheduler, "Stopping frame loop");
        m_timer.stop();
        m_clock.invalidate();
    }
}

void FrameScheduler::onTimeout()
{
    if (!m_clock.isValid()) {
        return;
    }
    const double elapsedMs = static_cast<double>(m_clock.nsecsElapsed()) / 1.0e6;
    m_clock.restart();
    m_engine.tick(elapsedMs);
}

} // namespace cutline
