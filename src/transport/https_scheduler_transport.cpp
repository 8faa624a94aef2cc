#include "transport/https_scheduler_transport.hpp"

#include "client/result_interpreter.hpp"

#include <array>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>
#include <utility>

namespace schedctl::transport {

namespace {

constexpr long kConnectTimeoutSeconds = 15L;
constexpr const char* kUserAgent = "schedctl/0.3.0";

bool EnsureCurlGlobalInit(TransportError& error) {
  static std::once_flag once;
  static CURLcode init_result = CURLE_OK;
  std::call_once(once, [] { init_result = curl_global_init(CURL_GLOBAL_DEFAULT); });
  if (init_result != CURLE_OK) {
    error.Set(TransportErrorKind::kProtocol,
              std::string("curl_global_init() failed: ") + curl_easy_strerror(init_result));
    return false;
  }
  return true;
}

template <typename Value>
bool SetOption(CURL* curl, const CURLoption option, Value value, const char* name,
               TransportError& error) {
  const CURLcode rv = curl_easy_setopt(curl, option, value);
  if (rv != CURLE_OK) {
    error.Set(TransportErrorKind::kProtocol, std::string("curl_easy_setopt(") + name +
                                                 ") failed: " + curl_easy_strerror(rv));
    return false;
  }
  return true;
}

bool AppendHeader(CurlHeaderList& headers, const std::string& line, TransportError& error) {
  curl_slist* extended = curl_slist_append(headers.get(), line.c_str());
  if (extended == nullptr) {
    error.Set(TransportErrorKind::kProtocol, "curl_slist_append() failed");
    return false;
  }
  // curl_slist_append returns the original head once the list is non-empty.
  headers.release();
  headers.reset(extended);
  return true;
}

std::size_t AppendResponseBody(char* data, std::size_t size, std::size_t count, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(data, size * count);
  return size * count;
}

} // namespace

FormFields BuildProgressFields(const std::string& script, const std::optional<std::string>& version,
                               const int value) {
  FormFields fields;
  fields.emplace_back("script", script);
  if (version.has_value()) {
    fields.emplace_back("version", version.value());
  }
  fields.emplace_back("progress", std::to_string(value));
  return fields;
}

bool EncodeFormBody(CURL* handle, const FormFields& fields, std::string& body,
                    std::string& error) {
  body.clear();
  error.clear();

  const auto append_escaped = [&](const std::string& raw) {
    char* escaped = curl_easy_escape(handle, raw.c_str(), static_cast<int>(raw.size()));
    if (escaped == nullptr) {
      error = "unable to encode form component '" + raw + "'";
      return false;
    }
    body += escaped;
    curl_free(escaped);
    return true;
  };

  for (const auto& [name, value] : fields) {
    if (!body.empty()) {
      body.push_back('&');
    }
    if (!append_escaped(name)) {
      return false;
    }
    body.push_back('=');
    if (!append_escaped(value)) {
      return false;
    }
  }
  return true;
}

std::string BuildSchedulerUrl(const SchedulerEndpoint& endpoint, std::string_view path) {
  std::string url = "https://";
  if (endpoint.address.find(':') != std::string::npos) {
    url += "[" + endpoint.address + "]";
  } else {
    url += endpoint.address;
  }
  url += ":" + std::to_string(endpoint.port);
  url += path;
  return url;
}

TransportErrorKind ClassifyCurlResult(const CURLcode code) {
  switch (code) {
  case CURLE_OK:
    return TransportErrorKind::kNone;
  case CURLE_SSL_CONNECT_ERROR:
  case CURLE_PEER_FAILED_VERIFICATION:
  case CURLE_SSL_CACERT_BADFILE:
  case CURLE_SSL_CERTPROBLEM:
  case CURLE_SSL_CIPHER:
  case CURLE_SSL_ISSUER_ERROR:
  case CURLE_SSL_CRL_BADFILE:
  case CURLE_USE_SSL_FAILED:
    return TransportErrorKind::kNegotiation;
  case CURLE_COULDNT_RESOLVE_HOST:
  case CURLE_COULDNT_RESOLVE_PROXY:
  case CURLE_COULDNT_CONNECT:
  case CURLE_OPERATION_TIMEDOUT:
  case CURLE_SEND_ERROR:
  case CURLE_RECV_ERROR:
    return TransportErrorKind::kConnection;
  default:
    return TransportErrorKind::kProtocol;
  }
}

HttpsSchedulerTransport::HttpsSchedulerTransport(SchedulerEndpoint endpoint,
                                                 SessionCredentials credentials)
    : endpoint_(std::move(endpoint)), credentials_(std::move(credentials)) {}

bool HttpsSchedulerTransport::Open(TransportError& error) {
  error.Clear();

  if (credentials_.HasCaCertificate()) {
    const std::ifstream ca_file(credentials_.ca_certificate.value());
    if (!ca_file) {
      error.Set(TransportErrorKind::kNegotiation,
                "unable to read CA certificate '" + credentials_.ca_certificate->string() + "'");
      return false;
    }
  }

  if (!EnsureCurlGlobalInit(error)) {
    return false;
  }
  curl_.reset(curl_easy_init());
  if (curl_ == nullptr) {
    error.Set(TransportErrorKind::kProtocol, "curl_easy_init() failed");
    return false;
  }
  return true;
}

bool HttpsSchedulerTransport::ManualOverride(const std::string& script, bool& accepted,
                                             TransportError& error) {
  return Call(kPathManualOverride, {{"script", script}}, accepted, error);
}

bool HttpsSchedulerTransport::Progress(const std::string& script,
                                       const std::optional<std::string>& version, const int value,
                                       bool& accepted, TransportError& error) {
  return Call(kPathProgress, BuildProgressFields(script, version, value), accepted, error);
}

bool HttpsSchedulerTransport::Reschedule(const std::string& script, bool& accepted,
                                         TransportError& error) {
  return Call(kPathReschedule, {{"script", script}}, accepted, error);
}

bool HttpsSchedulerTransport::Reclone(bool& accepted, TransportError& error) {
  return Call(kPathReclone, {}, accepted, error);
}

bool HttpsSchedulerTransport::Cancel(bool& accepted, TransportError& error) {
  return Call(kPathCancel, {}, accepted, error);
}

bool HttpsSchedulerTransport::SupportsFeature(const std::string& feature, bool& supported,
                                              TransportError& error) {
  return Call(kPathSupportsFeature, {{"feature", feature}}, supported, error);
}

bool HttpsSchedulerTransport::Call(std::string_view path, const FormFields& fields,
                                   bool& accepted, TransportError& error) {
  accepted = false;
  error.Clear();

  if (curl_ == nullptr && !Open(error)) {
    return false;
  }
  CURL* curl = curl_.get();
  curl_easy_reset(curl);

  std::string body;
  std::string encode_error;
  if (!EncodeFormBody(curl, fields, body, encode_error)) {
    error.Set(TransportErrorKind::kProtocol, std::move(encode_error));
    return false;
  }

  CurlHeaderList headers;
  if (!AppendHeader(headers, "Accept: text/plain", error)) {
    return false;
  }
  if (credentials_.HasBearerToken() &&
      !AppendHeader(headers, "Authorization: Bearer " + credentials_.bearer_token, error)) {
    return false;
  }

  const std::string url = BuildSchedulerUrl(endpoint_, path);
  std::string response_body;
  std::array<char, CURL_ERROR_SIZE> error_buffer{};

  const bool configured =
      SetOption(curl, CURLOPT_ERRORBUFFER, error_buffer.data(), "CURLOPT_ERRORBUFFER", error) &&
      SetOption(curl, CURLOPT_URL, url.c_str(), "CURLOPT_URL", error) &&
      SetOption(curl, CURLOPT_NOPROGRESS, 1L, "CURLOPT_NOPROGRESS", error) &&
      SetOption(curl, CURLOPT_NOSIGNAL, 1L, "CURLOPT_NOSIGNAL", error) &&
      SetOption(curl, CURLOPT_USERAGENT, kUserAgent, "CURLOPT_USERAGENT", error) &&
      SetOption(curl, CURLOPT_HTTP_VERSION, static_cast<long>(CURL_HTTP_VERSION_1_1),
                "CURLOPT_HTTP_VERSION", error) &&
      SetOption(curl, CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSeconds, "CURLOPT_CONNECTTIMEOUT",
                error) &&
      SetOption(curl, CURLOPT_POST, 1L, "CURLOPT_POST", error) &&
      SetOption(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()),
                "CURLOPT_POSTFIELDSIZE", error) &&
      SetOption(curl, CURLOPT_POSTFIELDS, body.c_str(), "CURLOPT_POSTFIELDS", error) &&
      SetOption(curl, CURLOPT_HTTPHEADER, headers.get(), "CURLOPT_HTTPHEADER", error) &&
      SetOption(curl, CURLOPT_SSLVERSION, static_cast<long>(CURL_SSLVERSION_TLSv1_2),
                "CURLOPT_SSLVERSION", error) &&
      SetOption(curl, CURLOPT_SSL_VERIFYPEER, 1L, "CURLOPT_SSL_VERIFYPEER", error) &&
      SetOption(curl, CURLOPT_SSL_VERIFYHOST, 2L, "CURLOPT_SSL_VERIFYHOST", error) &&
      SetOption(curl, CURLOPT_WRITEFUNCTION, &AppendResponseBody, "CURLOPT_WRITEFUNCTION",
                error) &&
      SetOption(curl, CURLOPT_WRITEDATA, static_cast<void*>(&response_body),
                "CURLOPT_WRITEDATA", error);
  if (!configured) {
    return false;
  }

  if (credentials_.HasCaCertificate()) {
    const std::string ca_file = credentials_.ca_certificate->string();
    if (!SetOption(curl, CURLOPT_CAINFO, ca_file.c_str(), "CURLOPT_CAINFO", error)) {
      return false;
    }
  }

  const CURLcode rv = curl_easy_perform(curl);
  if (rv != CURLE_OK) {
    std::string detail = error_buffer[0] != '\0' ? std::string(error_buffer.data())
                                                 : std::string(curl_easy_strerror(rv));
    detail += " (curl code " + std::to_string(static_cast<int>(rv)) + ")";
    error.Set(ClassifyCurlResult(rv), std::move(detail));
    return false;
  }

  long status_code = 0;
  const CURLcode info_rv = curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
  if (info_rv != CURLE_OK) {
    error.Set(TransportErrorKind::kProtocol,
              std::string("curl_easy_getinfo(CURLINFO_RESPONSE_CODE) failed: ") +
                  curl_easy_strerror(info_rv));
    return false;
  }

  // A rejected request (bad token, unknown script) is still a scheduler
  // answer, just a negative one.
  accepted = status_code >= 200 && status_code < 300 &&
             client::InterpretSchedulerBoolean(response_body);
  return true;
}

std::unique_ptr<ISchedulerTransport> CreateHttpsTransport(const SchedulerEndpoint& endpoint,
                                                          const SessionCredentials& credentials) {
  return std::make_unique<HttpsSchedulerTransport>(endpoint, credentials);
}

} // namespace schedctl::transport
