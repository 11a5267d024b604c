#include "evaluator.h"

#include <glog/logging.h>

#include "scoped_files.h"
#include "util.h"

namespace keval {

Evaluator::Evaluator(EvaluatorOptions options,
                     Box<Compiler> compiler,
                     Box<ProcessRunner> runner)
    : options_(std::move(options)),
      compiler_(std::move(compiler)),
      runner_(std::move(runner)) {
  CHECK(compiler_);
  CHECK(runner_);
}

FullResult Evaluator::Evaluate(const JobConfig& config) {
  ValidateJobConfig(config);
  LOG(INFO) << "Evaluating " << LanguageName(config.language) << " job with "
            << config.sources.size() << " source(s)";

  FullResult result;
  try {
    ScopedDirectory work_dir(
        CreateTempPath(options_.work_root, "keval.%%%%-%%%%-%%%%-%%%%"));
    switch (config.language) {
      case Language::kScripted:
        result.run = EvaluateScript(config, work_dir.path());
        break;
      case Language::kNative:
        EvaluateNative(config, work_dir.path(), result);
        break;
    }
    result.success = true;
  } catch (const ConfigurationError&) {
    throw;
  } catch (const std::exception& error) {
    LOG(ERROR) << "Evaluation aborted: " << error.what();
    result.success = false;
    result.error = error.what();
  }
  return result;
}

RunResult Evaluator::EvaluateScript(const JobConfig& config,
                                    const Path& work_dir) {
  if (!config.headers.empty()) {
    LOG(WARNING) << "Ignoring " << config.headers.size()
                 << " header(s) of a scripted job";
  }
  ScopedFiles files(work_dir);
  files.WriteAll(config.sources);
  // The interpreter reads its sources while running, so they stay until
  // it exits.
  return runner_->Run({options_.interpreter, config.entry_point}, work_dir,
                      config.seed);
}

void Evaluator::EvaluateNative(const JobConfig& config,
                               const Path& work_dir,
                               FullResult& result) {
  Vector<String> include_dirs;
  for (const String& dir : config.include_dirs) {
    include_dirs.push_back(AbsolutePath(dir).string());
  }
  {
    ScopedFiles files(work_dir);
    files.WriteAll(config.sources);
    files.WriteAll(config.headers);
    Vector<String> names;
    for (const auto& entry : config.sources) {
      names.push_back(entry.first);
    }
    result.compile =
        compiler_->Compile(names, config.arch, include_dirs, work_dir);
    // Sources and headers are removed here, before the artifact can run
    // and read them back.
  }
  if (!result.compile->success) {
    LOG(INFO) << "Skipping run, compilation did not succeed";
    result.run = MakeSkippedRun();
    return;
  }
  result.run = runner_->Run({"./" + compiler_->artifact_name()}, work_dir,
                            config.seed);
}

Box<Evaluator> CreateEvaluator(const EvaluatorOptions& options,
                               const ToolchainOptions& toolchain) {
  return Box<Evaluator>(new Evaluator(options, CreateCompiler(toolchain),
                                      CreateProcessRunner()));
}

}  // namespace keval
