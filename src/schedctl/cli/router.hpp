#pragma once

#include "client/command_dispatcher.hpp"

namespace schedctl::cli {

// Routes `schedctl` subcommands and returns process exit codes with a stable
// contract for operators and bots:
//   0 => the scheduler accepted the request
//   1 => the scheduler answered negatively, or could not be reached
//   2 => TLS negotiation failed, or usage error (nothing was sent)
int Dispatch(int argc, char** argv);

// Same as Dispatch, with the transport supplied by the caller. Tests use this
// to substitute an in-process scheduler.
int DispatchWithTransport(int argc, char** argv, const client::TransportFactory& factory);

} // namespace schedctl::cli
