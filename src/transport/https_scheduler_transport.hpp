#pragma once

#include "transport/scheduler_transport.hpp"

#include <curl/curl.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace schedctl::transport {

// Remote operation paths served by the scheduler.
inline constexpr std::string_view kPathManualOverride = "/manualOverride";
inline constexpr std::string_view kPathProgress = "/progress";
inline constexpr std::string_view kPathReschedule = "/reschedule";
inline constexpr std::string_view kPathReclone = "/reclone";
inline constexpr std::string_view kPathCancel = "/cancel";
inline constexpr std::string_view kPathSupportsFeature = "/supportsFeature";

// Ordered name/value pairs of one form-encoded request body.
using FormFields = std::vector<std::pair<std::string, std::string>>;

// Builds the form fields for a progress report. `version` is omitted entirely
// when absent so the no-version call matches the scheduler's default-version
// signature.
FormFields BuildProgressFields(const std::string& script, const std::optional<std::string>& version,
                               int value);

// Joins `fields` as `name=value&...`, percent-encoding every component with
// curl_easy_escape.
bool EncodeFormBody(CURL* handle, const FormFields& fields, std::string& body,
                    std::string& error);

// Always an https URL. IPv6 literals are bracketed.
std::string BuildSchedulerUrl(const SchedulerEndpoint& endpoint, std::string_view path);

// Sorts a failed curl_easy_perform result into the kind that decides the
// exit code: TLS trouble is kNegotiation, unreachable peers are kConnection,
// anything else is kProtocol.
TransportErrorKind ClassifyCurlResult(CURLcode code);

struct CurlEasyDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};

struct CurlHeaderListDeleter {
  void operator()(curl_slist* headers) const {
    curl_slist_free_all(headers);
  }
};

using CurlEasyHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaderList = std::unique_ptr<curl_slist, CurlHeaderListDeleter>;

// libcurl client for the scheduler's control endpoints.
//
// Each remote operation is one `POST /<operation>` over TLS with a
// form-encoded body. The peer certificate is always verified: against the CA
// file when the credentials carry one, otherwise against the system trust
// store. The bearer token, when present, is sent in the Authorization header
// and therefore never leaves the process unencrypted.
class HttpsSchedulerTransport final : public ISchedulerTransport {
public:
  HttpsSchedulerTransport(SchedulerEndpoint endpoint, SessionCredentials credentials);

  // Checks the CA file is readable and creates the curl session. The network
  // is first touched by the remote call itself.
  bool Open(TransportError& error) override;

  bool ManualOverride(const std::string& script, bool& accepted, TransportError& error) override;
  bool Progress(const std::string& script, const std::optional<std::string>& version, int value,
                bool& accepted, TransportError& error) override;
  bool Reschedule(const std::string& script, bool& accepted, TransportError& error) override;
  bool Reclone(bool& accepted, TransportError& error) override;
  bool Cancel(bool& accepted, TransportError& error) override;
  bool SupportsFeature(const std::string& feature, bool& supported,
                       TransportError& error) override;

  const SchedulerEndpoint& endpoint() const {
    return endpoint_;
  }

private:
  bool Call(std::string_view path, const FormFields& fields, bool& accepted,
            TransportError& error);

  SchedulerEndpoint endpoint_;
  SessionCredentials credentials_;
  CurlEasyHandle curl_;
};

std::unique_ptr<ISchedulerTransport> CreateHttpsTransport(const SchedulerEndpoint& endpoint,
                                                          const SessionCredentials& credentials);

} // namespace schedctl::transport
