#include "process_runner.h"

#include <fcntl.h>
#include <unistd.h>
#include <glog/logging.h>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/process/args.hpp>
#include <boost/process/async.hpp>
#include <boost/process/env.hpp>
#include <boost/process/exception.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/extend.hpp>
#include <boost/process/io.hpp>
#include <boost/process/start_dir.hpp>
#include <boost/system/system_error.hpp>
#include <chrono>
#include <cstdlib>
#include <future>

#include "process.h"
#include "util.h"

namespace bp = boost::process;

namespace keval {

const char kVerdictFdVariable[] = "POPCORN_FD";
const char kSeedVariable[] = "POPCORN_SEED";

namespace {

void CloseFd(int& fd) {
  if (fd < 0) {
    return;
  }
  if (::close(fd) < 0) {
    PLOG(WARNING) << "close(" << fd << ")";
  }
  fd = -1;
}

String ToString(const boost::asio::streambuf& buffer) {
  auto data = buffer.data();
  return String(boost::asio::buffers_begin(data),
                boost::asio::buffers_end(data));
}

class PipeProcessRunner : public ProcessRunner {
 public:
  RunResult Run(const Vector<String>& args,
                const Path& work_dir,
                int64_t seed) override {
    CHECK(!args.empty());
    RunResult result;
    result.command = MakeCommand(args);

    VerdictPipe pipe;
    Environment env = boost::this_process::environment();
    env[kVerdictFdVariable] = std::to_string(pipe.write_fd());
    env[kSeedVariable] = std::to_string(seed);

    Path program = ResolveProgram(args[0]);
    if (program.empty()) {
      program = args[0];
    }

    // Both ends are close-on-exec in the parent, so no other child started
    // meanwhile inherits them. Only this child gets the write end.
    int write_fd = pipe.write_fd();
    auto inherit_write_end = [write_fd](auto& exec) {
      if (::fcntl(write_fd, F_SETFD, 0) < 0) {
        exec.set_error(bp::extend::get_last_error(), "fcntl");
        ::_exit(EXIT_FAILURE);
      }
    };

    LOG(INFO) << "Running " << result.command;
    EventLoop loop;
    std::future<String> stdout_data;
    std::future<String> stderr_data;
    Box<Process> process;
    auto start_time = std::chrono::steady_clock::now();
    try {
      process.reset(new Process(
          bp::exe = program.string(),
          bp::args = Vector<String>(args.begin() + 1, args.end()),
          bp::start_dir = work_dir.string(),
          bp::env = env,
          bp::std_in < bp::null,
          bp::std_out > stdout_data,
          bp::std_err > stderr_data,
          bp::extend::on_exec_setup = inherit_write_end,
          loop));
    } catch (const bp::process_error& error) {
      LOG(WARNING) << "Cannot launch " << result.command << ": "
                   << error.what();
      result.success = false;
      result.passed = false;
      result.exit_code = -1;
      result.stderr_data = error.what();
      return result;
    }
    pipe.CloseWriteEnd();

    boost::asio::posix::stream_descriptor verdict_stream(
        loop, pipe.ReleaseReadEnd());
    boost::asio::streambuf verdict_buffer;
    boost::asio::async_read(
        verdict_stream, verdict_buffer,
        [](const boost::system::error_code& error_code, size_t) {
          if (error_code && error_code != boost::asio::error::eof) {
            LOG(WARNING) << "Reading verdict: " << error_code.message();
          }
        });
    loop.run();
    process->wait();
    auto end_time = std::chrono::steady_clock::now();

    result.exit_code = NormalizeExitStatus(process->native_exit_code());
    result.duration =
        std::chrono::duration<double>(end_time - start_time).count();
    result.stdout_data = stdout_data.get();
    result.stderr_data = stderr_data.get();
    result.result = ParseVerdict(ToString(verdict_buffer));
    result.success = IsCleanExit(result.exit_code);
    auto check = result.result.find("check");
    result.passed = check != result.result.end() && check->second == "pass";

    LOG(INFO) << "Exited with " << result.exit_code << " ("
              << ExitCodeName(result.exit_code) << ") after "
              << result.duration << "s, check "
              << (result.passed ? "passed" : "not passed");
    if (!result.success) {
      LOG(WARNING) << result.command << " did not exit cleanly";
    }
    for (const auto& entry : result.result) {
      VLOG(1) << "verdict " << entry.first << ": " << entry.second;
    }
    return result;
  }
};

}  // namespace

VerdictPipe::VerdictPipe() {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) < 0) {
    throw boost::system::system_error(
        errno, boost::system::system_category(), "pipe2");
  }
  read_fd_ = fds[0];
  write_fd_ = fds[1];
}

VerdictPipe::~VerdictPipe() {
  CloseFd(read_fd_);
  CloseFd(write_fd_);
}

void VerdictPipe::CloseWriteEnd() {
  CloseFd(write_fd_);
}

int VerdictPipe::ReleaseReadEnd() {
  CHECK_GE(read_fd_, 0);
  int fd = read_fd_;
  read_fd_ = -1;
  return fd;
}

Map<String, String> ParseVerdict(StringView report) {
  // ASCII line boundaries; "\r\n" yields an empty line, which is dropped.
  static const StringView line_breaks = "\n\r\v\f\x1c\x1d\x1e";
  Map<String, String> verdict;
  while (!report.empty()) {
    size_t end = report.find_first_of(line_breaks);
    StringView line = report.substr(0, end);
    report = end == StringView::npos ? StringView() : report.substr(end + 1);

    size_t colon = line.find(':');
    StringView key = TrimWhitespace(line.substr(0, colon));
    StringView value = colon == StringView::npos
                           ? StringView()
                           : TrimWhitespace(line.substr(colon + 1));
    if (key.empty() && value.empty()) {
      continue;
    }
    verdict[key.to_string()] = value.to_string();
  }
  return verdict;
}

bool IsCleanExit(int exit_code) {
  return exit_code == kExitSuccess || exit_code == kExitValidateFail;
}

Box<ProcessRunner> CreateProcessRunner() {
  return Box<ProcessRunner>(new PipeProcessRunner());
}

}  // namespace keval
