#ifndef KEVAL_PROCESS_RUNNER_H
#define KEVAL_PROCESS_RUNNER_H

#include <cstdint>

#include "result.h"
#include "shim.h"

namespace keval {

// Environment variable carrying the verdict pipe's write descriptor.
extern const char kVerdictFdVariable[];
// Environment variable carrying the seed for the child's input generator.
extern const char kSeedVariable[];

// One-way channel from an evaluated child back to the harness. Both ends are
// close-on-exec; the runner lets the write end through to its one child
// only. The parent keeps the read end and must close its write end right
// after the spawn, otherwise reading never sees end-of-stream.
class VerdictPipe {
 public:
  // Throws boost::system::system_error if the pipe cannot be created.
  VerdictPipe();
  ~VerdictPipe();

  int read_fd() const { return read_fd_; }
  int write_fd() const { return write_fd_; }

  void CloseWriteEnd();
  // Gives up ownership of the read end.
  int ReleaseReadEnd();

 private:
  int read_fd_;
  int write_fd_;

  VerdictPipe(const VerdictPipe&) = delete;
  VerdictPipe& operator=(const VerdictPipe&) = delete;
};

// Parses "key: value" lines, broken at any ASCII line boundary (\n, \r,
// \v, \f, \x1c-\x1e). Keys and values are trimmed, lines empty on both
// sides are dropped, later keys overwrite earlier ones.
Map<String, String> ParseVerdict(StringView report);

// True for the exit codes of a child that ran to completion, whether or
// not its check passed.
bool IsCleanExit(int exit_code);

class ProcessRunner {
 public:
  virtual ~ProcessRunner() = default;

  // Runs |args| inside |work_dir| with the verdict pipe and |seed| exported
  // and blocks until the child exits. Launch failures are reported in the
  // result, not thrown.
  virtual RunResult Run(const Vector<String>& args,
                        const Path& work_dir,
                        int64_t seed) = 0;

  ProcessRunner() = default;
  ProcessRunner(const ProcessRunner&) = delete;
  ProcessRunner& operator=(const ProcessRunner&) = delete;
};

Box<ProcessRunner> CreateProcessRunner();

}  // namespace keval

#endif  // KEVAL_PROCESS_RUNNER_H
