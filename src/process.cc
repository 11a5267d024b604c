#include "process.h"

#include <sys/wait.h>
#include <glog/logging.h>
#include <boost/process/args.hpp>
#include <boost/process/async.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>
#include <boost/process/start_dir.hpp>
#include <future>

#include "util.h"

namespace bp = boost::process;

namespace keval {

const char* ExitCodeName(int exit_code) {
  switch (exit_code) {
    case kExitSuccess:
      return "SUCCESS";
    case kExitCudaFail:
      return "CUDA_FAIL";
    case kExitPipeFail:
      return "PIPE_FAIL";
    case kExitValidateFail:
      return "VALIDATE_FAIL";
    case kExitTestSpec:
      return "TEST_SPEC";
    case kExitTimeoutExpired:
      return "TIMEOUT_EXPIRED";
    default:
      return "UNKNOWN";
  }
}

Path ResolveProgram(StringView program) {
  if (program.empty()) {
    return Path();
  }
  if (program.find('/') != StringView::npos) {
    Path path(program.to_string());
    return Exists(path) ? path : Path();
  }
  return bp::search_path(program.to_string());
}

int NormalizeExitStatus(int native_status) {
  if (WIFEXITED(native_status)) {
    return WEXITSTATUS(native_status);
  }
  if (WIFSIGNALED(native_status)) {
    return -WTERMSIG(native_status);
  }
  return native_status;
}

ProcessOutput Execute(const Vector<String>& args, const Path& work_dir) {
  CHECK(!args.empty());
  Path program = ResolveProgram(args[0]);
  if (program.empty()) {
    program = args[0];
  }
  VLOG(1) << "Executing " << MakeCommand(args) << " in " << work_dir;

  EventLoop loop;
  std::future<String> stdout_data;
  std::future<String> stderr_data;
  Process process(bp::exe = program.string(),
                  bp::args = Vector<String>(args.begin() + 1, args.end()),
                  bp::start_dir = work_dir.string(),
                  bp::std_in < bp::null,
                  bp::std_out > stdout_data,
                  bp::std_err > stderr_data,
                  loop);
  loop.run();
  process.wait();

  ProcessOutput output;
  output.exit_code = NormalizeExitStatus(process.native_exit_code());
  output.stdout_data = stdout_data.get();
  output.stderr_data = stderr_data.get();
  return output;
}

}  // namespace keval
