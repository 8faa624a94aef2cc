#include "transport/scheduler_transport.hpp"

namespace schedctl::transport {

std::string_view ToString(const TransportErrorKind kind) {
  switch (kind) {
  case TransportErrorKind::kNone:
    return "none";
  case TransportErrorKind::kNegotiation:
    return "negotiation";
  case TransportErrorKind::kConnection:
    return "connection";
  case TransportErrorKind::kProtocol:
    return "protocol";
  }

  return "unknown";
}

} // namespace schedctl::transport
