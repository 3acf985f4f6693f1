#pragma once

/**
 * Errors.hpp
 *
 * Exception taxonomy shared by the transfer engine.
 *
 * Connect, stream corruption and decode failures are retryable and are
 * turned into retry decisions inside the worker that owns the transfer.
 * Configuration errors are fatal for the component being constructed.
 * Cancellation is terminal.
 */

#include <stdexcept>
#include <string>

namespace homestream::core {

enum class ErrorKind {
    None,
    Connect,
    StreamCorruption,
    Decode,
    Config,
    Cancelled
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:             return "none";
        case ErrorKind::Connect:          return "connect";
        case ErrorKind::StreamCorruption: return "stream_corruption";
        case ErrorKind::Decode:           return "decode";
        case ErrorKind::Config:           return "config";
        case ErrorKind::Cancelled:        return "cancelled";
    }
    return "unknown";
}

inline bool isRetryable(ErrorKind kind) {
    return kind == ErrorKind::Connect ||
           kind == ErrorKind::StreamCorruption ||
           kind == ErrorKind::Decode;
}

/**
 * Base class of all engine errors
 */
class HomeStreamError : public std::runtime_error {
public:
    HomeStreamError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

    bool retryable() const { return isRetryable(m_kind); }

private:
    ErrorKind m_kind;
};

// Unreachable source, refused connection or timeout
class ConnectError : public HomeStreamError {
public:
    explicit ConnectError(const std::string& message)
        : HomeStreamError(ErrorKind::Connect, message) {}
};

// Transport stream sync loss or a byte count that does not match the transport
class StreamCorruptionError : public HomeStreamError {
public:
    explicit StreamCorruptionError(const std::string& message)
        : HomeStreamError(ErrorKind::StreamCorruption, message) {}
};

// External decode (or transcode) process failure
class DecodeError : public HomeStreamError {
public:
    explicit DecodeError(const std::string& message)
        : HomeStreamError(ErrorKind::Decode, message) {}
};

class ConfigError : public HomeStreamError {
public:
    explicit ConfigError(const std::string& message)
        : HomeStreamError(ErrorKind::Config, message) {}
};

/**
 * Naming template refers to a field that cannot be resolved, or uses a
 * format the field does not accept
 */
class TemplateFieldError : public ConfigError {
public:
    TemplateFieldError(const std::string& field, const std::string& message)
        : ConfigError(message), m_field(field) {}

    const std::string& field() const { return m_field; }

private:
    std::string m_field;
};

class CancelledError : public HomeStreamError {
public:
    CancelledError()
        : HomeStreamError(ErrorKind::Cancelled, "cancelled") {}
};

} // namespace homestream::core
