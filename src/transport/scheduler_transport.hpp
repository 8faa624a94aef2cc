#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace schedctl::transport {

// Why a call produced no remote result.
//
// - kNegotiation: the secure session could not be established or broke at
//   the TLS layer (CA file unusable, handshake or verification failure)
// - kConnection: the peer could not be reached (DNS, refused, reset, timeout)
// - kProtocol: bytes arrived but were not a usable HTTP response
enum class TransportErrorKind {
  kNone,
  kNegotiation,
  kConnection,
  kProtocol,
};

std::string_view ToString(TransportErrorKind kind);

struct TransportError {
  TransportErrorKind kind = TransportErrorKind::kNone;
  std::string detail;

  bool ok() const {
    return kind == TransportErrorKind::kNone;
  }

  void Clear() {
    kind = TransportErrorKind::kNone;
    detail.clear();
  }

  void Set(TransportErrorKind new_kind, std::string new_detail) {
    kind = new_kind;
    detail = std::move(new_detail);
  }
};

// Credentials for one invocation. Either, both, or neither may be present:
// the CA file authenticates the server, the token authenticates the client.
struct SessionCredentials {
  std::optional<std::filesystem::path> ca_certificate;
  std::string bearer_token;

  bool HasCaCertificate() const {
    return ca_certificate.has_value();
  }

  bool HasBearerToken() const {
    return !bearer_token.empty();
  }
};

struct SchedulerEndpoint {
  std::string address = "localhost";
  std::uint16_t port = 8002;
};

// Remote operations exposed by the scheduler.
//
// Contract shared by every method:
// - returns true when the scheduler answered; `accepted` carries its verdict
// - returns false when no answer was obtained; `error` says why
// Implementations translate the scheduler's wire encoding into a native bool
// so nothing above this interface ever sees string-typed results.
class ISchedulerTransport {
public:
  virtual ~ISchedulerTransport() = default;

  // Prepares the authenticated session and fails early on unusable
  // credentials. Calls made without a prior Open() open it implicitly.
  virtual bool Open(TransportError& error) = 0;

  // Marks a failed script as successful without re-running it.
  virtual bool ManualOverride(const std::string& script, bool& accepted,
                              TransportError& error) = 0;

  // Reports execution progress. `version` is sent only when present.
  virtual bool Progress(const std::string& script, const std::optional<std::string>& version,
                        int value, bool& accepted, TransportError& error) = 0;

  // Re-queues a previously failed script.
  virtual bool Reschedule(const std::string& script, bool& accepted, TransportError& error) = 0;

  // Asks the scheduler to refresh its source checkout.
  virtual bool Reclone(bool& accepted, TransportError& error) = 0;

  // Aborts the run: unstarted work is dropped, started work finishes.
  virtual bool Cancel(bool& accepted, TransportError& error) = 0;

  // Capability query for one named feature.
  virtual bool SupportsFeature(const std::string& feature, bool& supported,
                               TransportError& error) = 0;
};

} // namespace schedctl::transport
