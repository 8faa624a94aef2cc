#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/fake_scheduler.hpp"

#include <cstdlib>
#include <memory>
#include <string>

int main() {
  using schedctl::tests::common::AssertContains;
  using schedctl::tests::common::AssertExitCode;
  using schedctl::tests::common::AssertNotContains;
  using schedctl::tests::common::DispatchCaptured;
  using schedctl::tests::common::Fail;
  using schedctl::tests::common::FakeSchedulerBehavior;
  using schedctl::tests::common::FakeSchedulerLog;
  using schedctl::tests::common::MakeFakeSchedulerFactory;
  using schedctl::transport::TransportErrorKind;

  ::unsetenv("SCHEDCTL_TOKEN");

  // Default level stays quiet on success.
  {
    auto log = std::make_shared<FakeSchedulerLog>();
    const auto result = DispatchCaptured({"schedctl", "--token", "s3cret-value", "reclone"},
                                         MakeFakeSchedulerFactory({}, log));
    AssertExitCode(result.exit_code, 0, "quiet reclone");
    if (!result.stderr_text.empty()) {
      Fail("expected no stderr output at the default log level, got: " + result.stderr_text);
    }
    if (log->credentials.bearer_token != "s3cret-value") {
      Fail("--token must reach the transport credentials");
    }
  }

  // Debug level carries correlation fields and never the token itself.
  {
    auto log = std::make_shared<FakeSchedulerLog>();
    const auto result =
        DispatchCaptured({"schedctl", "--log-level", "debug", "--token", "s3cret-value",
                          "reschedule", "--script", "build-42"},
                         MakeFakeSchedulerFactory({}, log));
    AssertExitCode(result.exit_code, 0, "debug reschedule");
    AssertContains(result.stderr_text, "level=DEBUG");
    AssertContains(result.stderr_text, "request_id=\"req-");
    AssertContains(result.stderr_text, "cmd=reschedule");
    AssertContains(result.stderr_text, "token_present=\"true\"");
    AssertContains(result.stderr_text, "credentials=\"bearer_token\"");
    AssertContains(result.stderr_text, "msg=\"remote call completed\"");
    AssertNotContains(result.stderr_text, "s3cret-value");
  }

  // Environment fallback supplies the token when --token is absent.
  {
    ::setenv("SCHEDCTL_TOKEN", "from-env", 1);
    auto log = std::make_shared<FakeSchedulerLog>();
    const auto result =
        DispatchCaptured({"schedctl", "cancel"}, MakeFakeSchedulerFactory({}, log));
    ::unsetenv("SCHEDCTL_TOKEN");
    AssertExitCode(result.exit_code, 0, "cancel with env token");
    if (log->credentials.bearer_token != "from-env") {
      Fail("token must fall back to SCHEDCTL_TOKEN");
    }
  }

  // An explicit --token wins over the environment, even when empty.
  {
    ::setenv("SCHEDCTL_TOKEN", "from-env", 1);
    auto log = std::make_shared<FakeSchedulerLog>();
    const auto result = DispatchCaptured({"schedctl", "--token=", "cancel"},
                                         MakeFakeSchedulerFactory({}, log));
    ::unsetenv("SCHEDCTL_TOKEN");
    AssertExitCode(result.exit_code, 0, "cancel with explicit empty token");
    if (!log->credentials.bearer_token.empty()) {
      Fail("explicit --token must override SCHEDCTL_TOKEN");
    }
  }

  // Failures still produce one diagnostic line at the default level.
  {
    auto log = std::make_shared<FakeSchedulerLog>();
    FakeSchedulerBehavior refused;
    refused.open_failure = TransportErrorKind::kConnection;
    refused.failure_detail = "connect to localhost:8002 failed: Connection refused";
    const auto result =
        DispatchCaptured({"schedctl", "cancel"}, MakeFakeSchedulerFactory(refused, log));
    AssertExitCode(result.exit_code, 1, "cancel refused");
    AssertContains(result.stderr_text, "SCHED_CONNECTION_FAILED");
    AssertContains(result.stderr_text, "Connection refused");
    AssertNotContains(result.stderr_text, "level=INFO");
  }

  return 0;
}
