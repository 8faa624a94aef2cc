#pragma once

#include "core/errors/exit_codes.hpp"

#include <string_view>

namespace schedctl::client {

// The scheduler serializes its verdicts as the text of a boolean. Only the
// exact literal "True" is success; "true", " True", "True\n", "1" and the
// empty string are all failures. Applied at the transport boundary only.
bool InterpretSchedulerBoolean(std::string_view body);

// Maps a completed remote verdict to the process exit contract.
core::errors::ExitCode ExitCodeForResult(bool accepted);

} // namespace schedctl::client
