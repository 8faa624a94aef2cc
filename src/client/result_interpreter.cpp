#include "client/result_interpreter.hpp"

namespace schedctl::client {

namespace {

constexpr std::string_view kSchedulerTrueLiteral = "True";

} // namespace

bool InterpretSchedulerBoolean(std::string_view body) {
  return body == kSchedulerTrueLiteral;
}

core::errors::ExitCode ExitCodeForResult(const bool accepted) {
  return accepted ? core::errors::ExitCode::kSuccess : core::errors::ExitCode::kFailure;
}

} // namespace schedctl::client
