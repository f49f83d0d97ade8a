#ifndef ONIONCHAT_ERRORS_HPP
#define ONIONCHAT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace OnionChat {

/**
 * @brief Machine-readable classification carried by every OnionChat exception.
 */
enum class ErrorCode {
    UNKNOWN,
    INVALID_ARGUMENT,
    LOGIC,
    ENTROPY_FAILURE,
    CORRUPT_STORAGE,
    WRONG_PASSWORD,
    HANDSHAKE_TIMEOUT,
    HANDSHAKE_MALFORMED,
    KEY_EXCHANGE,
    AUTH_FAILURE,
    REPLAY_REJECTED,
    SESSION_UNKNOWN,
    SESSION_EXHAUSTED,
    MALFORMED_MESSAGE,
    NOT_CONNECTED,
    TRANSPORT_ERROR,
    CONFIG_ERROR
};

const char* to_string(ErrorCode code);

/**
 * @brief Base class for all OnionChat exceptions.
 */
class Exception : public std::exception {
public:
    explicit Exception(const std::string& message, ErrorCode code = ErrorCode::UNKNOWN)
        : msg_(message), code_(code) {}
    explicit Exception(const char* message, ErrorCode code = ErrorCode::UNKNOWN)
        : msg_(message), code_(code) {}
    virtual ~Exception() noexcept override = default;

    virtual const char* what() const noexcept override {
        return msg_.c_str();
    }

    ErrorCode code() const noexcept {
        return code_;
    }

protected:
    std::string msg_;
    ErrorCode code_;
};

/**
 * @brief Exception for errors that occur at runtime.
 */
class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& message, ErrorCode code = ErrorCode::UNKNOWN)
        : Exception(message, code) {}
    explicit RuntimeError(const char* message, ErrorCode code = ErrorCode::UNKNOWN)
        : Exception(message, code) {}
};

/**
 * @brief Exception for logic errors in the library's usage.
 */
class LogicError : public Exception {
public:
    explicit LogicError(const std::string& message, ErrorCode code = ErrorCode::LOGIC)
        : Exception(message, code) {}
    explicit LogicError(const char* message, ErrorCode code = ErrorCode::LOGIC)
        : Exception(message, code) {}
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgument : public LogicError {
public:
    explicit InvalidArgument(const std::string& message) : LogicError(message, ErrorCode::INVALID_ARGUMENT) {}
    explicit InvalidArgument(const char* message) : LogicError(message, ErrorCode::INVALID_ARGUMENT) {}
};

// The system random source could not produce key material. Not retryable.
class EntropyFailure : public RuntimeError {
public:
    explicit EntropyFailure(const std::string& message) : RuntimeError(message, ErrorCode::ENTROPY_FAILURE) {}
};

// A stored blob is truncated, has a bad header or inconsistent key material.
class CorruptStorage : public RuntimeError {
public:
    explicit CorruptStorage(const std::string& message) : RuntimeError(message, ErrorCode::CORRUPT_STORAGE) {}
};

class WrongPassword : public RuntimeError {
public:
    explicit WrongPassword(const std::string& message) : RuntimeError(message, ErrorCode::WRONG_PASSWORD) {}
};

/**
 * @brief A handshake attempt was abandoned. code() is HANDSHAKE_TIMEOUT or HANDSHAKE_MALFORMED.
 */
class HandshakeError : public RuntimeError {
public:
    explicit HandshakeError(const std::string& message, ErrorCode code = ErrorCode::HANDSHAKE_MALFORMED)
        : RuntimeError(message, code) {}
};

class KeyExchangeError : public RuntimeError {
public:
    explicit KeyExchangeError(const std::string& message) : RuntimeError(message, ErrorCode::KEY_EXCHANGE) {}
};

class AuthFailure : public RuntimeError {
public:
    explicit AuthFailure(const std::string& message) : RuntimeError(message, ErrorCode::AUTH_FAILURE) {}
};

class ReplayRejected : public RuntimeError {
public:
    explicit ReplayRejected(const std::string& message) : RuntimeError(message, ErrorCode::REPLAY_REJECTED) {}
};

class SessionUnknown : public RuntimeError {
public:
    explicit SessionUnknown(const std::string& message) : RuntimeError(message, ErrorCode::SESSION_UNKNOWN) {}
};

class SessionExhausted : public RuntimeError {
public:
    explicit SessionExhausted(const std::string& message) : RuntimeError(message, ErrorCode::SESSION_EXHAUSTED) {}
};

class MalformedMessage : public RuntimeError {
public:
    explicit MalformedMessage(const std::string& message) : RuntimeError(message, ErrorCode::MALFORMED_MESSAGE) {}
};

class NotConnected : public RuntimeError {
public:
    explicit NotConnected(const std::string& message) : RuntimeError(message, ErrorCode::NOT_CONNECTED) {}
};

class TransportError : public RuntimeError {
public:
    explicit TransportError(const std::string& message) : RuntimeError(message, ErrorCode::TRANSPORT_ERROR) {}
};

class ConfigError : public InvalidArgument {
public:
    explicit ConfigError(const std::string& message) : InvalidArgument(message) {
        code_ = ErrorCode::CONFIG_ERROR;
    }
};

} // namespace OnionChat

#endif // ONIONCHAT_ERRORS_HPP
