#pragma once

namespace schedctl::core::errors {

// Stable process-exit contract for operators and bots driving the scheduler.
//
// The set is closed. Usage errors share code 2 with negotiation failures
// because both terminate before any remote result exists, and 2 is the
// conventional argument-parser exit code scripts already expect.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kNegotiationFailed = 2,
  kUsage = 2,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace schedctl::core::errors
