#ifndef KEVAL_PROCESS_H
#define KEVAL_PROCESS_H

#include <boost/process/child.hpp>
#include <boost/process/environment.hpp>
#include "shim.h"

namespace keval {

using Process = boost::process::child;
using Environment = boost::process::environment;

// Exit codes the evaluation programs return on purpose. Anything else
// (segfault, signal, permissions) comes from the platform.
enum ExitCode {
  kExitSuccess = 0,
  kExitCudaFail = 110,
  kExitPipeFail = 111,
  kExitValidateFail = 112,
  kExitTestSpec = 113,
  kExitTimeoutExpired = 114,
};

const char* ExitCodeName(int exit_code);

// Returns |program| itself when it names a path, otherwise its location on
// PATH. Returns an empty path when nothing executable was found.
Path ResolveProgram(StringView program);

// Maps a raw wait status to an exit code; death by signal N becomes -N.
int NormalizeExitStatus(int native_status);

struct ProcessOutput {
  int exit_code = 0;
  String stdout_data;
  String stderr_data;
};

// Runs |args| (args[0] is the program) in |work_dir| until it exits and
// collects both output streams. Throws boost::process::process_error when
// the program cannot be launched.
ProcessOutput Execute(const Vector<String>& args, const Path& work_dir);

}  // namespace keval

#endif  // KEVAL_PROCESS_H
