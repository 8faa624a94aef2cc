#include "client/client_config.hpp"

#include <charconv>
#include <cstdlib>
#include <string>

namespace schedctl::client {

transport::SchedulerEndpoint BuildEndpoint(const ClientConfig& config) {
  transport::SchedulerEndpoint endpoint;
  endpoint.address = config.address;
  endpoint.port = config.port;
  return endpoint;
}

transport::SessionCredentials BuildSessionCredentials(const ClientConfig& config) {
  transport::SessionCredentials credentials;
  credentials.ca_certificate = config.cacert;
  credentials.bearer_token = config.token;
  return credentials;
}

std::string DescribeCredentials(const transport::SessionCredentials& credentials) {
  if (credentials.HasCaCertificate() && credentials.HasBearerToken()) {
    return "ca_certificate+bearer_token";
  }
  if (credentials.HasCaCertificate()) {
    return "ca_certificate";
  }
  if (credentials.HasBearerToken()) {
    return "bearer_token";
  }
  return "none";
}

bool ParsePort(std::string_view raw, std::uint16_t& port, std::string& error) {
  if (raw.empty()) {
    error = "missing value for --port";
    return false;
  }

  unsigned int parsed = 0;
  const char* begin = raw.data();
  const char* end = begin + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end || parsed == 0U || parsed > 65535U) {
    error = "invalid --port '" + std::string(raw) + "' (expected integer 1-65535)";
    return false;
  }

  port = static_cast<std::uint16_t>(parsed);
  return true;
}

void ApplyTokenEnvironmentFallback(ClientConfig& config) {
  if (!config.token.empty()) {
    return;
  }
  const char* env_token = std::getenv(kTokenEnvVar);
  if (env_token != nullptr && *env_token != '\0') {
    config.token = env_token;
  }
}

} // namespace schedctl::client
