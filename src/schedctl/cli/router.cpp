#include "schedctl/cli/router.hpp"

#include "client/client_config.hpp"
#include "client/failure_classifier.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"

#include <charconv>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace schedctl::cli {

namespace {

constexpr std::string_view kVersionText = "schedctl 0.3.0";

// Keep local names for readability while using one shared core contract.
constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  schedctl [--addr <host>] [--port <port>] [--cacert <ca.pem>] [--token <token>]\n"
      << "           [--log-level <" << core::logging::ExpectedLogLevelList() << ">]"
      << " <command> [command options]\n"
      << "\n"
      << "commands:\n"
      << "  feature --feature <name>\n"
      << "  override --script <name>\n"
      << "  progress --script <name> --progress <0-100> [--version <version>]\n"
      << "  reschedule --script <name>\n"
      << "  reclone\n"
      << "  cancel\n"
      << "  version\n"
      << "\n";
  for (const client::CommandSpec& spec : client::kCommandTable) {
    out << "  " << spec.name << ": " << spec.summary << '\n';
  }
  out << "\n"
      << "defaults: --addr " << client::kDefaultAddress << " --port " << client::kDefaultPort
      << "; token falls back to $" << client::kTokenEnvVar << '\n';
}

std::string MakeRequestId() {
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  return "req-" + std::to_string(now_ms);
}

bool ParseProgressValue(std::string_view raw, int& value, std::string& error) {
  const char* begin = raw.data();
  const char* end = begin + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (raw.empty() || ec != std::errc() || ptr != end) {
    error = "invalid --progress '" + std::string(raw) + "' (expected an integer)";
    return false;
  }
  return true;
}

struct ParsedInvocation {
  client::ClientConfig config;
  std::optional<std::string> command_name;
  client::CommandRequest request;
  bool help = false;
  bool token_given = false;
};

// Parses global flags and command flags in one pass. Global flags may appear
// before or after the command name; `--flag value` and `--flag=value` are
// both accepted. Unknown flags and extra positionals are usage errors.
bool ParseInvocation(const std::vector<std::string_view>& args, ParsedInvocation& parsed,
                     std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view token = args[i];

    if (token == "--help" || token == "-h" || token == "help") {
      parsed.help = true;
      continue;
    }

    if (token.size() < 2U || token.substr(0, 2) != "--") {
      if (!token.empty() && token.front() == '-') {
        error = "unknown option: " + std::string(token);
        return false;
      }
      if (parsed.command_name.has_value()) {
        error = "unexpected argument: " + std::string(token);
        return false;
      }
      parsed.command_name = std::string(token);
      continue;
    }

    std::optional<std::string_view> inline_value;
    const std::size_t equals = token.find('=');
    if (equals != std::string_view::npos) {
      inline_value = token.substr(equals + 1);
      token = token.substr(0, equals);
    }

    const bool known = token == "--port" || token == "--addr" || token == "--cacert" ||
                       token == "--token" || token == "--log-level" || token == "--script" ||
                       token == "--version" || token == "--progress" || token == "--feature";
    if (!known) {
      error = "unknown option: " + std::string(token);
      return false;
    }

    std::string_view value;
    if (inline_value.has_value()) {
      value = inline_value.value();
    } else {
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(token);
        return false;
      }
      value = args[i + 1];
      ++i;
    }

    if (token == "--port") {
      if (!client::ParsePort(value, parsed.config.port, error)) {
        return false;
      }
    } else if (token == "--addr") {
      if (value.empty()) {
        error = "--addr cannot be empty";
        return false;
      }
      parsed.config.address = std::string(value);
    } else if (token == "--cacert") {
      if (value.empty()) {
        error = "--cacert cannot be empty";
        return false;
      }
      parsed.config.cacert = std::filesystem::path(value);
    } else if (token == "--token") {
      parsed.config.token = std::string(value);
      parsed.token_given = true;
    } else if (token == "--log-level") {
      if (!core::logging::ParseLogLevel(value, parsed.config.log_level, error)) {
        return false;
      }
    } else if (token == "--script") {
      parsed.request.script = std::string(value);
    } else if (token == "--version") {
      parsed.request.version = std::string(value);
    } else if (token == "--progress") {
      int progress = 0;
      if (!ParseProgressValue(value, progress, error)) {
        return false;
      }
      parsed.request.progress = progress;
    } else if (token == "--feature") {
      parsed.request.feature = std::string(value);
    }
  }

  return true;
}

int UsageError(std::string_view message) {
  std::cerr << "error: " << message << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace

int DispatchWithTransport(int argc, char** argv, const client::TransportFactory& factory) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::vector<std::string_view> args(argv + 1, argv + argc);

  ParsedInvocation parsed;
  std::string error;
  if (!ParseInvocation(args, parsed, error)) {
    return UsageError(error);
  }

  if (parsed.help) {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  if (!parsed.command_name.has_value()) {
    return UsageError("missing command");
  }

  const std::string& command_name = parsed.command_name.value();
  if (command_name == "version") {
    std::cout << kVersionText << '\n';
    return kExitSuccess;
  }

  const client::CommandSpec* spec = client::FindCommand(command_name);
  if (spec == nullptr) {
    return UsageError("unknown subcommand: " + command_name);
  }
  parsed.request.kind = spec->kind;

  if (!client::ValidateCommandRequest(parsed.request, error)) {
    return UsageError(error);
  }

  if (!parsed.token_given) {
    client::ApplyTokenEnvironmentFallback(parsed.config);
  }

  core::logging::Logger logger(parsed.config.log_level);
  logger.SetRequestId(MakeRequestId());
  logger.SetCommand(command_name);
  logger.Debug("configuration resolved",
               {{"addr", parsed.config.address},
                {"port", std::to_string(parsed.config.port)},
                {"cacert", parsed.config.cacert.has_value() ? parsed.config.cacert->string() : "-"},
                {"token_present", parsed.config.token.empty() ? "false" : "true"}});

  client::CommandOutcome outcome;
  if (!client::ExecuteCommand(parsed.request, parsed.config, factory, logger, std::cout, outcome,
                              error)) {
    return UsageError(error);
  }

  const core::errors::ExitCode exit_code = client::ClassifyOutcome(outcome);
  if (!outcome.completed()) {
    std::cerr << client::FormatTransportFailure(outcome.operation, outcome.transport_error)
              << '\n';
  }
  return core::errors::ToInt(exit_code);
}

int Dispatch(int argc, char** argv) {
  return DispatchWithTransport(argc, argv, client::DefaultTransportFactory());
}

} // namespace schedctl::cli
