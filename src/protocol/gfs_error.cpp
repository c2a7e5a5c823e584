#include "protocol/gfs_error.hpp"

namespace gfs {
namespace protocol {

unsigned status_for_error(ErrorCode code) {
  switch (code) {
    case ErrorCode::NOT_FOUND: return 404;
    case ErrorCode::CONFLICT: return 409;
    case ErrorCode::UNAVAILABLE: return 503;
    case ErrorCode::BAD_REQUEST: return 400;
    case ErrorCode::TRANSPORT_FAILURE: return 502;
    case ErrorCode::PERSISTENCE_FAILURE: return 500;
    default: return 500;
  }
}

void raise_for_status(unsigned status, const std::string& message) {
  const std::string detail = message.empty()
    ? "request failed with status " + std::to_string(status)
    : message;

  switch (status) {
    case 400: throw BadRequestError(detail);
    case 404: throw NotFoundError(detail);
    case 409: throw ConflictError(detail);
    case 503: throw UnavailableError(detail);
    case 500: throw PersistenceError(detail);
    // Anything else means the peer did not speak the expected protocol
    default: throw TransportError(detail);
  }
}

} // namespace protocol
} // namespace gfs
