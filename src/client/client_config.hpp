#pragma once

#include "core/logging/logger.hpp"
#include "transport/scheduler_transport.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace schedctl::client {

inline constexpr std::string_view kDefaultAddress = "localhost";
inline constexpr std::uint16_t kDefaultPort = 8002;

// Environment fallback for the bearer token so bots can keep it out of argv.
inline constexpr const char* kTokenEnvVar = "SCHEDCTL_TOKEN";

// Everything a single invocation needs to reach the scheduler. Built once from
// the command line and passed by value; nothing here is process-global.
struct ClientConfig {
  std::string address = std::string(kDefaultAddress);
  std::uint16_t port = kDefaultPort;
  std::optional<std::filesystem::path> cacert;
  std::string token;
  core::logging::LogLevel log_level = core::logging::LogLevel::kWarn;
};

transport::SchedulerEndpoint BuildEndpoint(const ClientConfig& config);

transport::SessionCredentials BuildSessionCredentials(const ClientConfig& config);

// Log-safe label for the credential mix, e.g. "ca_certificate+bearer_token".
// Never includes the token itself.
std::string DescribeCredentials(const transport::SessionCredentials& credentials);

// Parses a TCP port in 1..65535.
bool ParsePort(std::string_view raw, std::uint16_t& port, std::string& error);

// Fills `config.token` from SCHEDCTL_TOKEN when no token was given explicitly.
void ApplyTokenEnvironmentFallback(ClientConfig& config);

} // namespace schedctl::client
