#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/loopback_server.hpp"
#include "common/temp_dir.hpp"
#include "common/tls_fixtures.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace {

using schedctl::tests::common::AssertContains;
using schedctl::tests::common::AssertExitCode;
using schedctl::tests::common::AssertNotContains;
using schedctl::tests::common::DispatchCaptured;
using schedctl::tests::common::DispatchResult;
using schedctl::tests::common::LoopbackMode;
using schedctl::tests::common::OneShotServer;
using schedctl::tests::common::SchedulerReply;
using schedctl::tests::common::SelfSignedIdentity;

std::vector<std::string> Against(const OneShotServer& server, const SelfSignedIdentity& identity,
                                 const std::vector<std::string>& tail) {
  std::vector<std::string> argv = {"schedctl",
                                   "--addr",
                                   "127.0.0.1",
                                   "--port",
                                   std::to_string(server.port()),
                                   "--cacert",
                                   identity.certificate_pem.string()};
  argv.insert(argv.end(), tail.begin(), tail.end());
  return argv;
}

struct VerdictCase {
  std::string response;
  int expected_exit;
  std::string label;
};

} // namespace

int main() {
  using schedctl::tests::common::CreateSelfSignedIdentity;
  using schedctl::tests::common::CreateUniqueTempDir;
  using schedctl::tests::common::RemovePathBestEffort;

  ::unsetenv("SCHEDCTL_TOKEN");
  const std::filesystem::path dir = CreateUniqueTempDir("schedctl-https-smoke");
  const SelfSignedIdentity identity = CreateSelfSignedIdentity(dir, "scheduler", 1);

  // Only the literal "True" body on a 2xx reply counts as acceptance.
  const std::vector<VerdictCase> verdicts = {
      {SchedulerReply("True"), 0, "True"},
      {SchedulerReply("False"), 1, "False"},
      {SchedulerReply(""), 1, "empty body"},
      {SchedulerReply("true"), 1, "lowercase true"},
      {SchedulerReply("True\n"), 1, "True with newline"},
      {SchedulerReply("True", 403, "Forbidden"), 1, "403 with True body"},
  };
  for (const VerdictCase& verdict : verdicts) {
    OneShotServer server(LoopbackMode::kHttps, verdict.response, identity);
    const DispatchResult result =
        DispatchCaptured(Against(server, identity, {"override", "--script", "build-42"}));
    server.Join();
    AssertExitCode(result.exit_code, verdict.expected_exit, "override, " + verdict.label);
    AssertNotContains(result.stderr_text, "SCHED_");
    AssertContains(server.received(), "POST /manualOverride HTTP/1.1\r\n");
    AssertContains(server.received(), "script=build-42");
  }

  // Request shape: path per operation, bearer header only with a token.
  {
    OneShotServer server(LoopbackMode::kHttps, SchedulerReply("True"), identity);
    const DispatchResult result =
        DispatchCaptured(Against(server, identity, {"--token", "tok-123", "reclone"}));
    server.Join();
    AssertExitCode(result.exit_code, 0, "reclone with token");
    AssertContains(server.received(), "POST /reclone HTTP/1.1\r\n");
    AssertContains(server.received(), "Authorization: Bearer tok-123\r\n");
    AssertContains(server.received(), "Content-Type: application/x-www-form-urlencoded\r\n");
  }

  {
    OneShotServer server(LoopbackMode::kHttps, SchedulerReply("True"), identity);
    const DispatchResult result = DispatchCaptured(
        Against(server, identity, {"reschedule", "--script", "nightly tests&more"}));
    server.Join();
    AssertExitCode(result.exit_code, 0, "reschedule with encoded script");
    AssertContains(server.received(), "POST /reschedule HTTP/1.1\r\n");
    AssertContains(server.received(), "script=nightly%20tests%26more");
    AssertNotContains(server.received(), "Authorization:");
  }

  {
    OneShotServer server(LoopbackMode::kHttps, SchedulerReply("False"), identity);
    const DispatchResult result =
        DispatchCaptured(Against(server, identity, {"feature", "--feature", "reclone"}));
    server.Join();
    AssertExitCode(result.exit_code, 1, "feature over https");
    AssertContains(server.received(), "POST /supportsFeature HTTP/1.1\r\n");
    AssertContains(server.received(), "feature=reclone");
    AssertContains(result.stdout_text, "reclone is not supported.");
  }

  {
    OneShotServer server(LoopbackMode::kHttps, SchedulerReply("True"), identity);
    const DispatchResult result = DispatchCaptured(Against(server, identity, {"cancel"}));
    server.Join();
    AssertExitCode(result.exit_code, 0, "cancel over https");
    AssertContains(server.received(), "POST /cancel HTTP/1.1\r\n");
  }

  // Chunked replies are decoded before interpretation.
  {
    OneShotServer server(LoopbackMode::kHttps,
                         "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n2\r\nTr\r\n"
                         "2\r\nue\r\n0\r\n\r\n",
                         identity);
    const DispatchResult result = DispatchCaptured(Against(server, identity, {"cancel"}));
    server.Join();
    AssertExitCode(result.exit_code, 0, "cancel with chunked reply");
  }

  // A chunk size near the 64-bit limit must not be taken as a short chunk.
  {
    OneShotServer server(LoopbackMode::kHttps,
                         "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                         "FFFFFFFFFFFFFFFE\r\nTrue\r\n0\r\n\r\n",
                         identity);
    const DispatchResult result = DispatchCaptured(Against(server, identity, {"cancel"}));
    server.Join();
    AssertExitCode(result.exit_code, 1, "cancel with oversized chunk");
    AssertContains(result.stderr_text, "SCHED_");
  }

  // Nobody listening: a connection failure, not a negotiation failure.
  {
    const std::uint16_t port = schedctl::tests::common::ReserveClosedLoopbackPort();
    const DispatchResult result =
        DispatchCaptured({"schedctl", "--addr", "127.0.0.1", "--port", std::to_string(port),
                          "--cacert", identity.certificate_pem.string(), "cancel"});
    AssertExitCode(result.exit_code, 1, "cancel against closed port");
    AssertContains(result.stderr_text, "SCHED_CONNECTION_FAILED");
  }

  // Unresolvable host.
  {
    const DispatchResult result =
        DispatchCaptured({"schedctl", "--addr", "scheduler.invalid", "cancel"});
    AssertExitCode(result.exit_code, 1, "cancel against unresolvable host");
    AssertContains(result.stderr_text, "SCHED_CONNECTION_FAILED");
  }

  // Something answered inside TLS, but not with HTTP.
  {
    OneShotServer server(LoopbackMode::kHttps, "garbage without a status line\r\n\r\n", identity);
    const DispatchResult result = DispatchCaptured(Against(server, identity, {"cancel"}));
    server.Join();
    AssertExitCode(result.exit_code, 1, "cancel with garbage reply");
    AssertContains(result.stderr_text, "SCHED_PROTOCOL_ERROR");
  }

  {
    OneShotServer server(LoopbackMode::kHttps, "", identity);
    const DispatchResult result = DispatchCaptured(Against(server, identity, {"cancel"}));
    server.Join();
    AssertExitCode(result.exit_code, 1, "cancel with no reply");
    AssertContains(result.stderr_text, "SCHED_PROTOCOL_ERROR");
  }

  RemovePathBestEffort(dir);
  return 0;
}
