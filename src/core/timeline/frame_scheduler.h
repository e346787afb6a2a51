#pragma once

#include "core/common/disposer.h"
#include "core/config/editor_settings.h"

#include <QElapsedTimer>
#include <QLoggingCategory>
#include <QObject>
#include <QTimer>

Q_DECLARE_LOGGING_CATEGORY(cutlineScheduler)

namespace cutline {

class TimelineEngine;

/**
 * FrameScheduler: wall-clock tick source for a TimelineEngine.
 * Runs only while the engine plays and feeds it the measured elapsed time,
 * so the playhead keeps real-time pace whether or not any backend is healthy.
 */
class FrameScheduler : public QObject
{
    Q_OBJECT

public:
    explicit FrameScheduler(TimelineEngine& engine,
                            const SchedulerSettings& settings = SchedulerSettings(),
                            QObject* parent = nullptr);
    ~FrameScheduler() override;

    bool isRunning() const { return m_timer.isActive(); }
    int intervalMs() const { return m_timer.interval(); }

private slots:
    void onPlayStateChanged(bool playing);
    void onTimeout();

private:
    TimelineEngine& m_engine;
    QTimer m_timer;
    QElapsedTimer m_clock;
    DisposerBag m_connections;
};

} // namespace cutline
