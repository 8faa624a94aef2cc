#include "client/command_dispatcher.hpp"

#include "transport/https_scheduler_transport.hpp"

#include <ostream>
#include <string>

namespace schedctl::client {

namespace {

bool InvokeRemoteOperation(const CommandRequest& request, transport::ISchedulerTransport& remote,
                           bool& accepted, transport::TransportError& error) {
  switch (request.kind) {
  case CommandKind::kFeature:
    return remote.SupportsFeature(request.feature.value(), accepted, error);
  case CommandKind::kOverride:
    return remote.ManualOverride(request.script.value(), accepted, error);
  case CommandKind::kProgress:
    return remote.Progress(request.script.value(), request.version, request.progress.value(),
                           accepted, error);
  case CommandKind::kReschedule:
    return remote.Reschedule(request.script.value(), accepted, error);
  case CommandKind::kReclone:
    return remote.Reclone(accepted, error);
  case CommandKind::kCancel:
    return remote.Cancel(accepted, error);
  }

  error.Set(transport::TransportErrorKind::kProtocol, "unsupported command kind");
  return false;
}

} // namespace

const CommandSpec* FindCommand(std::string_view name) {
  for (const CommandSpec& spec : kCommandTable) {
    if (spec.name == name) {
      return &spec;
    }
  }
  return nullptr;
}

const CommandSpec& SpecFor(const CommandKind kind) {
  for (const CommandSpec& spec : kCommandTable) {
    if (spec.kind == kind) {
      return spec;
    }
  }
  // Every enumerator has a table row.
  return kCommandTable.front();
}

bool ValidateCommandRequest(const CommandRequest& request, std::string& error) {
  error.clear();
  const CommandSpec& spec = SpecFor(request.kind);
  const std::string name(spec.name);

  if (spec.requires_script) {
    if (!request.script.has_value()) {
      error = name + " requires --script <name>";
      return false;
    }
    if (request.script->empty()) {
      error = "--script cannot be empty";
      return false;
    }
  } else if (request.script.has_value()) {
    error = name + " does not accept --script";
    return false;
  }

  if (spec.requires_progress) {
    if (!request.progress.has_value()) {
      error = name + " requires --progress <0-100>";
      return false;
    }
  } else if (request.progress.has_value()) {
    error = name + " does not accept --progress";
    return false;
  }

  if (spec.requires_feature) {
    if (!request.feature.has_value()) {
      error = name + " requires --feature <name>";
      return false;
    }
    if (request.feature->empty()) {
      error = "--feature cannot be empty";
      return false;
    }
  } else if (request.feature.has_value()) {
    error = name + " does not accept --feature";
    return false;
  }

  if (!spec.accepts_version && request.version.has_value()) {
    error = name + " does not accept --version";
    return false;
  }

  return true;
}

TransportFactory DefaultTransportFactory() {
  return [](const transport::SchedulerEndpoint& endpoint,
            const transport::SessionCredentials& credentials) {
    return transport::CreateHttpsTransport(endpoint, credentials);
  };
}

bool ExecuteCommand(const CommandRequest& request, const ClientConfig& config,
                    const TransportFactory& factory, core::logging::Logger& logger,
                    std::ostream& out, CommandOutcome& outcome, std::string& error) {
  outcome = CommandOutcome{};
  if (!ValidateCommandRequest(request, error)) {
    return false;
  }

  const CommandSpec& spec = SpecFor(request.kind);
  outcome.operation = std::string(spec.operation);

  const transport::SchedulerEndpoint endpoint = BuildEndpoint(config);
  const transport::SessionCredentials credentials = BuildSessionCredentials(config);
  logger.Debug("dispatching command",
               {{"operation", spec.operation},
                {"addr", endpoint.address},
                {"port", std::to_string(endpoint.port)},
                {"credentials", DescribeCredentials(credentials)}});

  std::unique_ptr<transport::ISchedulerTransport> remote =
      factory ? factory(endpoint, credentials) : nullptr;
  if (remote == nullptr) {
    outcome.transport_error.Set(transport::TransportErrorKind::kConnection,
                                "no transport available for " + endpoint.address);
    return true;
  }

  if (!remote->Open(outcome.transport_error)) {
    logger.Info("session could not be established",
                {{"operation", spec.operation},
                 {"error_kind", transport::ToString(outcome.transport_error.kind)},
                 {"detail", outcome.transport_error.detail}});
    return true;
  }

  bool accepted = false;
  if (!InvokeRemoteOperation(request, *remote, accepted, outcome.transport_error)) {
    logger.Info("remote call failed",
                {{"operation", spec.operation},
                 {"error_kind", transport::ToString(outcome.transport_error.kind)},
                 {"detail", outcome.transport_error.detail}});
    return true;
  }
  outcome.accepted = accepted;

  if (request.kind == CommandKind::kFeature) {
    out << request.feature.value() << (accepted ? " is supported." : " is not supported.")
        << '\n';
  }

  logger.Info("remote call completed",
              {{"operation", spec.operation}, {"accepted", accepted ? "true" : "false"}});
  return true;
}

} // namespace schedctl::client
