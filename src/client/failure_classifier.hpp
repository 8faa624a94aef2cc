#pragma once

#include "core/errors/exit_codes.hpp"
#include "transport/scheduler_transport.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace schedctl::client {

// Everything the dispatcher learned from one invocation.
//
// Exactly one of the following holds:
// - `accepted` has a value: the scheduler answered
// - `transport_error` is not ok: no answer was obtained
struct CommandOutcome {
  std::string operation;
  std::optional<bool> accepted;
  transport::TransportError transport_error;

  bool completed() const {
    return accepted.has_value();
  }
};

// Resolves the process exit code for a finished invocation:
//   accepted                     => 0
//   answered but not accepted    => 1
//   TLS negotiation failure      => 2
//   other transport failures     => 1
core::errors::ExitCode ClassifyOutcome(const CommandOutcome& outcome);

struct TransportFailureMapping {
  std::string_view stable_code;
  std::string actionable_message;
  std::string detail;
};

// Maps a transport error to a stable, grep-friendly code and operator
// guidance. `operation` is the remote operation name, e.g. "reclone".
TransportFailureMapping MapTransportFailure(std::string_view operation,
                                            const transport::TransportError& error);

// Single-line diagnostic:
//   "<STABLE_CODE>: <actionable_message> detail: <raw_detail>"
// The detail suffix is omitted when the raw detail is empty.
std::string FormatTransportFailure(std::string_view operation,
                                   const transport::TransportError& error);

} // namespace schedctl::client
