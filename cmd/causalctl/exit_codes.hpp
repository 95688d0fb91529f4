#pragma once

#include "internal/projection/handler_error.hpp"

namespace causal::cli {

// causalctl process exit codes.
enum ExitCode : int {
  kExitOk       = 0,
  kExitUsage    = 1, // bad arguments or a rejected request
  kExitFatal    = 2,
  kExitHandler  = 3, // event logged but its handler/hook failed
  kExitNotFound = 4,
};

// A request that never reached the log is the caller's fault.
inline int ExitCodeFor(const projection::HandlerError& error) {
  return error.kind == projection::ErrorKind::kValidation ? kExitUsage : kExitHandler;
}

} // namespace causal::cli
