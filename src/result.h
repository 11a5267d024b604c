#ifndef KEVAL_RESULT_H
#define KEVAL_RESULT_H

#include <nlohmann/json.hpp>
#include <ostream>

#include "shim.h"

namespace keval {

// Outcome of one native compile attempt.
struct CompileResult {
  bool toolchain_found = false;  // was the compiler located at all
  String toolchain_version;      // its --version output, verbatim
  bool success = false;          // did it compile successfully
  String command;                // shell-quoted compile command
  String stdout_data;
  String stderr_data;
  int exit_code = 0;
};

// Outcome of one execution of a prepared artifact or interpreter.
struct RunResult {
  bool success = false;  // did the harness run cleanly (exit 0 or 112)
  bool passed = false;   // did the child report "check: pass"
  String command;
  String stdout_data;
  String stderr_data;
  int exit_code = 0;
  double duration = 0.0;  // seconds, spawn to exit
  Map<String, String> result;  // parsed verdict lines
};

// The value handed back to whoever submitted the job.
struct FullResult {
  bool success = false;  // did the harness itself complete
  String error;          // set only when !success
  Optional<CompileResult> compile;
  Optional<RunResult> run;
};

// Placeholder run for a native job that never got to execute.
RunResult MakeSkippedRun();

Json ToJson(const CompileResult& result);
Json ToJson(const RunResult& result);
// Absent compile or run results are left out.
Json ToJson(const FullResult& result);

// Captured output that is not valid UTF-8 is written with U+FFFD in place
// of the offending bytes. Throws boost::filesystem::filesystem_error if
// |stream| fails.
void WriteJson(std::ostream& stream, const FullResult& result);

}  // namespace keval

#endif  // KEVAL_RESULT_H
