#include "client/failure_classifier.hpp"

#include "client/result_interpreter.hpp"

#include <cctype>
#include <string>

namespace schedctl::client {

namespace {

std::string CollapseWhitespace(std::string_view text) {
  std::string normalized;
  normalized.reserve(text.size());
  bool previous_was_space = true;
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      if (!previous_was_space) {
        normalized.push_back(' ');
      }
      previous_was_space = true;
      continue;
    }
    normalized.push_back(c);
    previous_was_space = false;
  }
  if (!normalized.empty() && normalized.back() == ' ') {
    normalized.pop_back();
  }
  return normalized;
}

std::string_view StableCodeFor(const transport::TransportErrorKind kind) {
  switch (kind) {
  case transport::TransportErrorKind::kNegotiation:
    return "SCHED_TLS_NEGOTIATION_FAILED";
  case transport::TransportErrorKind::kConnection:
    return "SCHED_CONNECTION_FAILED";
  case transport::TransportErrorKind::kProtocol:
    return "SCHED_PROTOCOL_ERROR";
  case transport::TransportErrorKind::kNone:
  default:
    return "SCHED_UNKNOWN_ERROR";
  }
}

std::string BuildActionableMessage(const transport::TransportErrorKind kind,
                                   std::string_view operation) {
  const std::string operation_label =
      operation.empty() ? "requested operation" : std::string(operation);

  switch (kind) {
  case transport::TransportErrorKind::kNegotiation:
    return "SSL negotiation with the scheduler failed before " + operation_label +
           "; verify the scheduler speaks TLS, its certificate is trusted by --cacert (or the"
           " system store when --cacert is absent) and --addr matches its name.";
  case transport::TransportErrorKind::kConnection:
    return "Could not reach the scheduler for " + operation_label +
           "; check --addr/--port and that the scheduler is running.";
  case transport::TransportErrorKind::kProtocol:
    return "Scheduler reply to " + operation_label +
           " was not a valid HTTP response; check that --port points at the scheduler.";
  case transport::TransportErrorKind::kNone:
  default:
    return "Unexpected transport failure during " + operation_label + ".";
  }
}

} // namespace

core::errors::ExitCode ClassifyOutcome(const CommandOutcome& outcome) {
  if (outcome.completed()) {
    return ExitCodeForResult(outcome.accepted.value());
  }
  if (outcome.transport_error.kind == transport::TransportErrorKind::kNegotiation) {
    return core::errors::ExitCode::kNegotiationFailed;
  }
  return core::errors::ExitCode::kFailure;
}

TransportFailureMapping MapTransportFailure(std::string_view operation,
                                            const transport::TransportError& error) {
  TransportFailureMapping mapped;
  mapped.stable_code = StableCodeFor(error.kind);
  mapped.actionable_message = BuildActionableMessage(error.kind, operation);
  mapped.detail = CollapseWhitespace(error.detail);
  return mapped;
}

std::string FormatTransportFailure(std::string_view operation,
                                   const transport::TransportError& error) {
  const TransportFailureMapping mapped = MapTransportFailure(operation, error);
  std::string formatted = std::string(mapped.stable_code) + ": " + mapped.actionable_message;
  if (!mapped.detail.empty()) {
    formatted += " detail: " + mapped.detail;
  }
  return formatted;
}

} // namespace schedctl::client
