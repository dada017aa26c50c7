#ifndef BEAMPROTO_ERRORS_HPP
#define BEAMPROTO_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace BeamProto {

/**
 * @brief Error kinds reported by a transfer session.
 */
enum class ErrorCode {
    None,
    AuthFailure,
    MalformedHandshake,
    TruncatedStream,
    ProtocolError,
    TransportUnavailable,
    SessionAlreadyActive,
    InvalidToken,
    IoError,
    Cancelled,
    Unknown
};

const char* to_string(ErrorCode code);

/**
 * @brief Base class for all BeamProto exceptions.
 */
class Exception : public std::exception {
public:
    explicit Exception(const std::string& message, ErrorCode code = ErrorCode::Unknown)
        : msg_(message), code_(code) {}
    explicit Exception(const char* message, ErrorCode code = ErrorCode::Unknown)
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
    explicit RuntimeError(const std::string& message, ErrorCode code = ErrorCode::Unknown)
        : Exception(message, code) {}
    explicit RuntimeError(const char* message, ErrorCode code = ErrorCode::Unknown)
        : Exception(message, code) {}
};

/**
 * @brief Exception for logic errors in the library's usage.
 */
class LogicError : public Exception {
public:
    explicit LogicError(const std::string& message) : Exception(message) {}
    explicit LogicError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgument : public LogicError {
public:
    explicit InvalidArgument(const std::string& message) : LogicError(message) {}
    explicit InvalidArgument(const char* message) : LogicError(message) {}
};

/**
 * @brief The handshake could not be authenticated (wrong key, wrong session id or tampered data).
 * This is a security event and is never retried.
 */
class AuthFailure : public RuntimeError {
public:
    explicit AuthFailure(const std::string& message) : RuntimeError(message, ErrorCode::AuthFailure) {}
};

/**
 * @brief The decrypted handshake is missing required fields or has fields of the wrong type.
 */
class MalformedHandshake : public RuntimeError {
public:
    explicit MalformedHandshake(const std::string& message)
        : RuntimeError(message, ErrorCode::MalformedHandshake) {}
};

/**
 * @brief The stream closed before a frame field was fully read.
 */
class TruncatedStream : public RuntimeError {
public:
    explicit TruncatedStream(const std::string& message) : RuntimeError(message, ErrorCode::TruncatedStream) {}
};

/**
 * @brief A frame field holds a value outside its allowed range.
 */
class ProtocolError : public RuntimeError {
public:
    explicit ProtocolError(const std::string& message) : RuntimeError(message, ErrorCode::ProtocolError) {}
};

class TransportUnavailable : public RuntimeError {
public:
    explicit TransportUnavailable(const std::string& message)
        : RuntimeError(message, ErrorCode::TransportUnavailable) {}
};

class SessionAlreadyActive : public RuntimeError {
public:
    explicit SessionAlreadyActive(const std::string& message)
        : RuntimeError(message, ErrorCode::SessionAlreadyActive) {}
};

/**
 * @brief An out-of-band session record could not be parsed.
 */
class InvalidToken : public RuntimeError {
public:
    explicit InvalidToken(const std::string& message) : RuntimeError(message, ErrorCode::InvalidToken) {}
};

class IoError : public RuntimeError {
public:
    explicit IoError(const std::string& message) : RuntimeError(message, ErrorCode::IoError) {}
};

} // namespace BeamProto

#endif // BEAMPROTO_ERRORS_HPP
