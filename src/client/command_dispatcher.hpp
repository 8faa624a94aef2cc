#pragma once

#include "client/client_config.hpp"
#include "client/failure_classifier.hpp"
#include "core/logging/logger.hpp"
#include "transport/scheduler_transport.hpp"

#include <array>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace schedctl::client {

enum class CommandKind {
  kFeature,
  kOverride,
  kProgress,
  kReschedule,
  kReclone,
  kCancel,
};

// Static description of one subcommand. The parameter flags drive both
// validation and usage text, so the two cannot drift apart.
struct CommandSpec {
  CommandKind kind;
  std::string_view name;
  // Remote operation name used in logs and diagnostics.
  std::string_view operation;
  bool requires_script;
  bool requires_progress;
  bool requires_feature;
  bool accepts_version;
  std::string_view summary;
};

inline constexpr std::array<CommandSpec, 6> kCommandTable = {{
    {CommandKind::kFeature, "feature", "supportsFeature", false, false, true, false,
     "ask whether the scheduler supports a named feature"},
    {CommandKind::kOverride, "override", "manualOverride", true, false, false, false,
     "mark a failed script as successful"},
    {CommandKind::kProgress, "progress", "progress", true, true, false, true,
     "report a script's execution progress (0-100)"},
    {CommandKind::kReschedule, "reschedule", "reschedule", true, false, false, false,
     "re-queue a previously failed script"},
    {CommandKind::kReclone, "reclone", "reclone", false, false, false, false,
     "make the scheduler refresh its source checkout"},
    {CommandKind::kCancel, "cancel", "cancel", false, false, false, false,
     "abort the run; unstarted work is dropped, started work finishes"},
}};

// Returns nullptr for unknown names.
const CommandSpec* FindCommand(std::string_view name);

const CommandSpec& SpecFor(CommandKind kind);

struct CommandRequest {
  CommandKind kind = CommandKind::kReclone;
  std::optional<std::string> script;
  std::optional<std::string> version;
  std::optional<int> progress;
  std::optional<std::string> feature;
};

// Checks required parameters are present and that no parameter was given to
// a command that does not take it. Progress values are not range-checked.
bool ValidateCommandRequest(const CommandRequest& request, std::string& error);

using TransportFactory = std::function<std::unique_ptr<transport::ISchedulerTransport>(
    const transport::SchedulerEndpoint&, const transport::SessionCredentials&)>;

// Factory for the real HTTP(S) transport.
TransportFactory DefaultTransportFactory();

// Runs one command: validate, build credentials, obtain a transport, open it,
// and invoke exactly one remote operation.
//
// Returns false only for an invalid request, before any transport is built.
// Otherwise returns true and fills `outcome`; transport failures are reported
// through `outcome.transport_error`, not through the return value.
//
// `feature` writes "<name> is supported." / "<name> is not supported." to `out`
// when the scheduler answers.
bool ExecuteCommand(const CommandRequest& request, const ClientConfig& config,
                    const TransportFactory& factory, core::logging::Logger& logger,
                    std::ostream& out, CommandOutcome& outcome, std::string& error);

} // namespace schedctl::client
