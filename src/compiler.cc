#include "compiler.h"

#include <glog/logging.h>
#include <boost/format.hpp>
#include <boost/process/exception.hpp>

#include "process.h"
#include "util.h"

namespace keval {

namespace {

// Exit code a shell reports for a command it cannot find.
const int kCommandNotFound = 127;

CompileResult MakeResult(bool toolchain_found,
                         String toolchain_version,
                         const Vector<String>& args,
                         ProcessOutput output) {
  CompileResult result;
  result.toolchain_found = toolchain_found;
  result.toolchain_version = std::move(toolchain_version);
  result.success = false;
  result.command = MakeCommand(args);
  result.stdout_data = std::move(output.stdout_data);
  result.stderr_data = std::move(output.stderr_data);
  result.exit_code = output.exit_code;
  return result;
}

ProcessOutput MakeLaunchFailure(const String& message) {
  ProcessOutput output;
  output.exit_code = kCommandNotFound;
  output.stderr_data = message;
  return output;
}

class ToolchainCompiler : public Compiler {
 public:
  explicit ToolchainCompiler(const ToolchainOptions& options)
      : options_(options) {}

  CompileResult Compile(const Vector<String>& files,
                        const Optional<String>& arch,
                        const Vector<String>& include_dirs,
                        const Path& work_dir) const override {
    LOG(INFO) << "Checking toolchain " << options_.program;
    Path program = ResolveProgram(options_.program);
    if (program.empty()) {
      LOG(WARNING) << options_.program << " not found";
      return MakeResult(false, "", {options_.program},
                        MakeLaunchFailure(options_.program +
                                          ": not found in PATH"));
    }

    Vector<String> version_args = {program.string(), options_.version_flag};
    ProcessOutput version;
    try {
      version = Execute(version_args, work_dir);
    } catch (const boost::process::process_error& error) {
      LOG(WARNING) << "Cannot launch " << program << ": " << error.what();
      return MakeResult(false, "", version_args,
                        MakeLaunchFailure(error.what()));
    }
    if (version.exit_code != 0) {
      LOG(WARNING) << MakeCommand(version_args) << " exited with "
                   << version.exit_code;
      return MakeResult(false, "", version_args, std::move(version));
    }

    Vector<String> args =
        MakeCompileArgs(options_, program, files, arch, include_dirs);
    LOG(INFO) << "Compiling " << files.size() << " file(s)";
    VLOG(1) << MakeCommand(args);
    ProcessOutput output;
    try {
      output = Execute(args, work_dir);
    } catch (const boost::process::process_error& error) {
      return MakeResult(true, version.stdout_data, args,
                        MakeLaunchFailure(error.what()));
    }

    CompileResult result = MakeResult(true, std::move(version.stdout_data),
                                      args, std::move(output));
    result.success = result.exit_code == 0;
    if (!result.success) {
      LOG(INFO) << "Compilation failed with exit code " << result.exit_code;
    }
    return result;
  }

  const String& artifact_name() const override {
    return options_.artifact_name;
  }

 private:
  const ToolchainOptions options_;
};

}  // namespace

ToolchainOptions NvccToolchain() {
  ToolchainOptions options;
  options.program = "nvcc";
  options.version_flag = "--version";
  options.flags = {
      "--std=c++17",
      "-Xcompiler", "-Wno-psabi",
      "-Xcompiler", "-fno-strict-aliasing",
      "--expt-extended-lambda",
      "--expt-relaxed-constexpr",
      "-forward-unknown-to-host-compiler",
      "-O3",
      "-Xnvlink=--verbose",
      "-Xptxas=--verbose",
      "-Xptxas=--warn-on-spills",
  };
  options.native_arch_flag = "-arch=native";
  options.arch_flag_format = "-gencode=arch=compute_%1%,code=sm_%1%";
  options.artifact_name = "eval.out";
  return options;
}

Vector<String> MakeCompileArgs(const ToolchainOptions& options,
                               const Path& program,
                               const Vector<String>& files,
                               const Optional<String>& arch,
                               const Vector<String>& include_dirs) {
  Vector<String> args = {program.string()};
  args.insert(args.end(), options.flags.begin(), options.flags.end());
  for (const String& dir : include_dirs) {
    args.push_back("-I" + dir);
  }
  args.insert(args.end(), files.begin(), files.end());
  if (arch) {
    args.push_back((boost::format(options.arch_flag_format) % *arch).str());
  } else if (!options.native_arch_flag.empty()) {
    args.push_back(options.native_arch_flag);
  }
  args.push_back("-o");
  args.push_back(options.artifact_name);
  return args;
}

Box<Compiler> CreateCompiler(const ToolchainOptions& options) {
  return Box<Compiler>(new ToolchainCompiler(options));
}

}  // namespace keval
