#ifndef GFS_PROTOCOL_GFS_ERROR_HPP
#define GFS_PROTOCOL_GFS_ERROR_HPP

#include <stdexcept>
#include <string>

namespace gfs {
namespace protocol {

enum class ErrorCode {
    NOT_FOUND,
    CONFLICT,
    UNAVAILABLE,
    BAD_REQUEST,
    TRANSPORT_FAILURE,
    PERSISTENCE_FAILURE
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_FOUND: return "Not found";
        case ErrorCode::CONFLICT: return "Conflict";
        case ErrorCode::UNAVAILABLE: return "Unavailable";
        case ErrorCode::BAD_REQUEST: return "Bad request";
        case ErrorCode::TRANSPORT_FAILURE: return "Transport failure";
        case ErrorCode::PERSISTENCE_FAILURE: return "Persistence failure";
        default: return "Undefined error";
    }
}

class GfsError : public std::runtime_error {
public:
    GfsError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class NotFoundError : public GfsError {
public:
    explicit NotFoundError(const std::string& message)
        : GfsError(ErrorCode::NOT_FOUND, message) {}
};

class ConflictError : public GfsError {
public:
    explicit ConflictError(const std::string& message)
        : GfsError(ErrorCode::CONFLICT, message) {}
};

class UnavailableError : public GfsError {
public:
    explicit UnavailableError(const std::string& message)
        : GfsError(ErrorCode::UNAVAILABLE, message) {}
};

class BadRequestError : public GfsError {
public:
    explicit BadRequestError(const std::string& message)
        : GfsError(ErrorCode::BAD_REQUEST, message) {}
};

class TransportError : public GfsError {
public:
    explicit TransportError(const std::string& message)
        : GfsError(ErrorCode::TRANSPORT_FAILURE, message) {}
};

class PersistenceError : public GfsError {
public:
    explicit PersistenceError(const std::string& message)
        : GfsError(ErrorCode::PERSISTENCE_FAILURE, message) {}
};


// ---- HTTP STATUS MAPPING ----
// Status a server answers with when an operation fails with the given code
unsigned status_for_error(ErrorCode code);

// Throws the exception matching a non-2xx status received from a peer
void raise_for_status(unsigned status, const std::string& message);

} // namespace protocol
} // namespace gfs

#endif // GFS_PROTOCOL_GFS_ERROR_HPP
