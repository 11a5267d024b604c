#ifndef KEVAL_EVALUATOR_H
#define KEVAL_EVALUATOR_H

#include "compiler.h"
#include "job_config.h"
#include "process_runner.h"
#include "result.h"
#include "shim.h"

namespace keval {

struct EvaluatorOptions {
  // Every attempt gets its own fresh directory below this root.
  Path work_root;
  // Interpreter for scripted jobs, looked up on PATH.
  String interpreter = "python3";
};

class Evaluator {
 public:
  Evaluator(EvaluatorOptions options,
            Box<Compiler> compiler,
            Box<ProcessRunner> runner);

  // Evaluates one job from a fresh working directory and removes every
  // file it created before returning. Throws ConfigurationError for a job
  // that cannot be evaluated as given; any other failure is reported in
  // the returned result.
  FullResult Evaluate(const JobConfig& config);

 private:
  RunResult EvaluateScript(const JobConfig& config, const Path& work_dir);
  void EvaluateNative(const JobConfig& config,
                      const Path& work_dir,
                      FullResult& result);

  const EvaluatorOptions options_;
  const Box<Compiler> compiler_;
  const Box<ProcessRunner> runner_;

  Evaluator(const Evaluator&) = delete;
  Evaluator& operator=(const Evaluator&) = delete;
};

// Evaluator backed by the real toolchain and process runner.
Box<Evaluator> CreateEvaluator(const EvaluatorOptions& options,
                               const ToolchainOptions& toolchain);

}  // namespace keval

#endif  // KEVAL_EVALUATOR_H
