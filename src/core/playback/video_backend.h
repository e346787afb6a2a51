#pragma once

#include "core/common/cutline_errors.h"
#include "core/models/clip.h"

#include <QString>

#include <functional>
#include <memory>

namespace cutline {

// Invoked exactly once per request, possibly synchronously from inside the call
using BackendCompletion = std::function<void(const Result<void>&)>;

/**
 * VideoBackend: one concrete player (HTML5 element, embedded YouTube player,
 * software clock) driven by PlaybackSync. Time is in source seconds.
 */
class VideoBackend
{
public:
    virtual ~VideoBackend() = default;

    virtual void load(const QString& sourceUrl, BackendCompletion done) = 0;
    virtual void seek(double seconds, BackendCompletion done) = 0;
    virtual void play() = 0;
    virtual void pause() = 0;
    virtual double currentTime() const = 0;
};

using BackendFactory = std::function<std::unique_ptr<VideoBackend>(BackendType)>;

} // namespace cutline
