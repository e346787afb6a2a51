#pragma once

#include <QString>

#include <optional>
#include <stdexcept>
#include <variant>

namespace cutline {

// Error codes surfaced by the timeline core
enum class ErrorCode {
    Ok,
    SeekOutOfRange,   // recovered by clamping, never fatal
    OverlapError,     // edit rejected, reported to caller
    LoadError,        // backend failed to load/seek a segment
    StaleResponse,    // superseded backend completion, discarded
    NotFound,
    InvalidArg,
    ParseError,
    Deferred,         // edit queued behind an in-flight edit
    Internal
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:             return "Ok";
        case ErrorCode::SeekOutOfRange: return "SeekOutOfRange";
        case ErrorCode::OverlapError:   return "OverlapError";
        case ErrorCode::LoadError:      return "LoadError";
        case ErrorCode::StaleResponse:  return "StaleResponse";
        case ErrorCode::NotFound:       return "NotFound";
        case ErrorCode::InvalidArg:     return "InvalidArg";
        case ErrorCode::ParseError:     return "ParseError";
        case ErrorCode::Deferred:       return "Deferred";
        case ErrorCode::Internal:       return "Internal";
    }
    return "Unknown";
}

// Error with context message
struct Error {
    ErrorCode code;
    QString message;

    static Error ok() { return {ErrorCode::Ok, QString()}; }
    static Error seek_out_of_range(double frame, double totalFrames) {
        return {ErrorCode::SeekOutOfRange,
                QStringLiteral("Seek to %1 outside [0, %2]").arg(frame).arg(totalFrames)};
    }
    static Error overlap(const QString& segmentId, const QString& otherId) {
        return {ErrorCode::OverlapError,
                QStringLiteral("Segment %1 would overlap %2").arg(segmentId, otherId)};
    }
    static Error load_failed(const QString& detail) {
        return {ErrorCode::LoadError, detail};
    }
    static Error stale(quint64 generation, quint64 current) {
        return {ErrorCode::StaleResponse,
                QStringLiteral("Generation %1 superseded by %2").arg(generation).arg(current)};
    }
    static Error not_found(const QString& what) {
        return {ErrorCode::NotFound, QStringLiteral("Not found: %1").arg(what)};
    }
    static Error invalid_arg(const QString& detail) {
        return {ErrorCode::InvalidArg, detail};
    }
    static Error parse_error(const QString& detail) {
        return {ErrorCode::ParseError, detail};
    }
    static Error deferred(const QString& operation) {
        return {ErrorCode::Deferred,
                QStringLiteral("%1 queued behind in-flight edit").arg(operation)};
    }
    static Error internal(const QString& detail) {
        return {ErrorCode::Internal, detail};
    }
};

// Result type: either value T or Error
template<typename T>
class Result {
public:
    Result(T value) : m_data(std::move(value)) {}
    Result(Error error) : m_data(std::move(error)) {}

    bool is_ok() const { return std::holds_alternative<T>(m_data); }
    bool is_error() const { return std::holds_alternative<Error>(m_data); }

    T& value() { return std::get<T>(m_data); }
    const T& value() const { return std::get<T>(m_data); }

    Error& error() { return std::get<Error>(m_data); }
    const Error& error() const { return std::get<Error>(m_data); }

    // Unwrap value or throw (for convenience)
    T unwrap() {
        if (is_error()) {
            throw std::runtime_error(error().message.toStdString());
        }
        return std::move(value());
    }

private:
    std::variant<T, Error> m_data;
};

template<>
class Result<void> {
public:
    Result() : m_error(std::nullopt) {}
    Result(Error error) : m_error(std::move(error)) {}

    bool is_ok() const { return !m_error.has_value(); }
    bool is_error() const { return m_error.has_value(); }

    Error& error() { return *m_error; }
    const Error& error() const { return *m_error; }

private:
    std::optional<Error> m_error;
};

} // namespace cutline
