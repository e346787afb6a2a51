#pragma once

#include "core/playback/video_backend.h"

#include <QSet>
#include <QString>

#include <memory>
#include <vector>

namespace cutline::testing {

// Playback state of one fake backend, shared with its pending requests
struct FakeBackendState {
    int id = 0;
    BackendType type = BackendType::Html5;
    QString sourceUrl;
    double position = 0.0;
    bool playing = false;
    int playCalls = 0;
    int pauseCalls = 0;
};

/**
 * Scripted request log shared by every fake backend of a factory.
 *
 * Requests stay pending until the test completes them, in any order. With
 * autoComplete set they complete inline; every request on a URL in failingUrls
 * then fails, and seeks (only) on a URL in failingSeekUrls fail.
 */
struct FakeBackendLog {
    struct Request {
        std::shared_ptr<FakeBackendState> backend;
        QString kind;        // "load" or "seek"
        QString sourceUrl;
        double seconds = 0.0;
        BackendCompletion done;
        bool completed = false;
    };

    std::vector<Request> requests;
    std::vector<std::shared_ptr<FakeBackendState>> backends;
    bool autoComplete = false;
    QSet<QString> failingUrls;
    QSet<QString> failingSeekUrls;

    bool shouldFail(const Request& request) const {
        return failingUrls.contains(request.sourceUrl)
            || (request.kind == QLatin1String("seek") && failingSeekUrls.contains(request.sourceUrl));
    }

    int pendingCount() const {
        int count = 0;
        for (const Request& request : requests) {
            count += request.completed ? 0 : 1;
        }
        return count;
    }

    int countOf(const QString& kind) const {
        int count = 0;
        for (const Request& request : requests) {
            count += request.kind == kind ? 1 : 0;
        }
        return count;
    }

    int lastIndexOf(const QString& kind) const {
        for (int i = static_cast<int>(requests.size()) - 1; i >= 0; --i) {
            if (requests[i].kind == kind) {
                return i;
            }
        }
        return -1;
    }

    void complete(int index, bool ok = true) {
        Request& request = requests.at(index);
        if (request.completed) {
            return;
        }
        request.completed = true;
        if (ok && request.kind == QLatin1String("seek")) {
            request.backend->position = request.seconds;
        }
        // The completion may issue new requests and reallocate the log
        BackendCompletion done = request.done;
        const QString url = request.sourceUrl;
        done(ok ? Result<void>() : Result<void>(Error::load_failed(QStringLiteral("Cannot play %1").arg(url))));
    }

    void fail(int index) { complete(index, false); }

    // Completes pending requests in issue order until none remain
    void completeAll() {
        for (std::size_t i = 0; i < requests.size(); ++i) {
            if (!requests[i].completed) {
                complete(static_cast<int>(i), !shouldFail(requests[i]));
            }
        }
    }
};

class FakeVideoBackend : public VideoBackend
{
public:
    FakeVideoBackend(std::shared_ptr<FakeBackendLog> log, BackendType type)
        : m_log(std::move(log))
        , m_state(std::make_shared<FakeBackendState>())
    {
        m_state->id = static_cast<int>(m_log->backends.size()) + 1;
        m_state->type = type;
        m_log->backends.push_back(m_state);
    }

    void load(const QString& sourceUrl, BackendCompletion done) override {
        m_state->sourceUrl = sourceUrl;
        m_state->position = 0.0;
        enqueue(QStringLiteral("load"), 0.0, std::move(done));
    }

    void seek(double seconds, BackendCompletion done) override {
        enqueue(QStringLiteral("seek"), seconds, std::move(done));
    }

    void play() override {
        m_state->playing = true;
        ++m_state->playCalls;
    }

    void pause() override {
        m_state->playing = false;
        ++m_state->pauseCalls;
    }

    double currentTime() const override { return m_state->position; }

    static BackendFactory factory(std::shared_ptr<FakeBackendLog> log) {
        return [log](BackendType type) -> std::unique_ptr<VideoBackend> {
            return std::make_unique<FakeVideoBackend>(log, type);
        };
    }

private:
    void enqueue(const QString& kind, double seconds, BackendCompletion done) {
        FakeBackendLog::Request request;
        request.backend = m_state;
        request.kind = kind;
        request.sourceUrl = m_state->sourceUrl;
        request.seconds = seconds;
        request.done = std::move(done);
        m_log->requests.push_back(std::move(request));
        if (m_log->autoComplete) {
            const int index = static_cast<int>(m_log->requests.size()) - 1;
            m_log->complete(index, !m_log->shouldFail(m_log->requests.at(index)));
        }
    }

    std::shared_ptr<FakeBackendLog> m_log;
    std::shared_ptr<FakeBackendState> m_state;
};

} // namespace cutline::testing
