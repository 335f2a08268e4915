#pragma once

#include <QString>
#include <utility>

namespace keyfall::core {

enum class ErrorKind {
    None,
    MalformedTimeline,    // bad tick ordering / resolution; fatal to Loading
    InvalidConfiguration, // rejected at the boundary, prior value retained
    QueueOverflow,        // live queue saturated, oldest events dropped
    DeviceDisconnected,   // live source lost
    CacheMiss,
    CacheCorrupt,
};

inline const char* errorKindName(ErrorKind k) {
    switch (k) {
    case ErrorKind::None: return "None";
    case ErrorKind::MalformedTimeline: return "MalformedTimelineError";
    case ErrorKind::InvalidConfiguration: return "InvalidConfigurationError";
    case ErrorKind::QueueOverflow: return "QueueOverflow";
    case ErrorKind::DeviceDisconnected: return "DeviceDisconnected";
    case ErrorKind::CacheMiss: return "CacheMiss";
    case ErrorKind::CacheCorrupt: return "CacheCorrupt";
    }
    return "Unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::None;
    QString message;

    bool isError() const { return kind != ErrorKind::None; }
    QString toString() const {
        return message.isEmpty() ? QString::fromLatin1(errorKindName(kind))
                                 : QString("%1: %2").arg(errorKindName(kind), message);
    }
};

// Value + error pair returned by every fallible operation.
template <typename T>
struct Outcome {
    T value{};
    Error error;

    bool ok() const { return !error.isError(); }

    static Outcome success(T v) {
        Outcome o;
        o.value = std::move(v);
        return o;
    }
    static Outcome failure(ErrorKind kind, const QString& message) {
        Outcome o;
        o.error = Error{kind, message};
        return o;
    }
    static Outcome failure(const Error& e) {
        Outcome o;
        o.error = e;
        return o;
    }
};

} // namespace keyfall::core
