#include <gflags/gflags.h>
#include <glog/logging.h>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <iostream>
#include <nlohmann/json.hpp>

#include "src/evaluator.h"
#include "src/job_config.h"
#include "src/result.h"
#include "src/util.h"

DEFINE_string(job, "-", "Job payload (JSON) to evaluate, - for stdin.");
DEFINE_string(result, "-", "Where to write the result (JSON), - for stdout.");
DEFINE_string(work_root, "",
              "Directory that receives one working directory per attempt. "
              "Defaults to the system temporary directory.");
DEFINE_string(toolchain, "nvcc", "Compiler for native jobs.");
DEFINE_string(toolchain_flags, "",
              "Comma separated baseline compiler flags. Empty keeps the "
              "built-in nvcc flags.");
DEFINE_string(artifact, "eval.out", "Executable the compiler produces.");
DEFINE_string(interpreter, "python3", "Interpreter for scripted jobs.");

namespace {

keval::ToolchainOptions MakeToolchainOptions() {
  keval::ToolchainOptions options = keval::NvccToolchain();
  options.program = FLAGS_toolchain;
  options.artifact_name = FLAGS_artifact;
  if (!FLAGS_toolchain_flags.empty()) {
    options.flags.clear();
    boost::split(options.flags, FLAGS_toolchain_flags,
                 boost::is_any_of(","));
  }
  return options;
}

keval::JobConfig ReadJob() {
  if (FLAGS_job == "-") {
    return keval::ReadJobConfig(std::cin);
  }
  boost::filesystem::ifstream stream(FLAGS_job);
  if (!stream) {
    throw boost::filesystem::filesystem_error(
        "cannot open job", keval::Path(FLAGS_job),
        boost::system::errc::make_error_code(
            boost::system::errc::no_such_file_or_directory));
  }
  return keval::ReadJobConfig(stream);
}

void WriteResult(const keval::FullResult& result) {
  if (FLAGS_result == "-") {
    keval::WriteJson(std::cout, result);
    return;
  }
  boost::filesystem::ofstream stream(FLAGS_result);
  if (!stream) {
    throw boost::filesystem::filesystem_error(
        "cannot open result", keval::Path(FLAGS_result),
        boost::system::errc::make_error_code(boost::system::errc::io_error));
  }
  keval::WriteJson(stream, result);
}

}  // namespace

int main(int argc, char* argv[]) {
  google::InitGoogleLogging(argv[0]);
  gflags::SetUsageMessage("Evaluates one kernel submission job.");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  keval::EvaluatorOptions options;
  options.work_root = FLAGS_work_root.empty() ? keval::TempPath()
                                              : keval::Path(FLAGS_work_root);
  options.interpreter = FLAGS_interpreter;
  keval::Box<keval::Evaluator> evaluator =
      keval::CreateEvaluator(options, MakeToolchainOptions());

  try {
    keval::JobConfig config = ReadJob();
    WriteResult(evaluator->Evaluate(config));
  } catch (const keval::ConfigurationError& error) {
    LOG(ERROR) << "Invalid job: " << error.what();
    return 2;
  } catch (const boost::filesystem::filesystem_error& error) {
    LOG(ERROR) << error.what();
    return 1;
  } catch (const keval::Json::exception& error) {
    LOG(ERROR) << "Cannot write result: " << error.what();
    return 1;
  }
  return 0;
}
