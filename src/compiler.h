#ifndef KEVAL_COMPILER_H
#define KEVAL_COMPILER_H

#include "result.h"
#include "shim.h"

namespace keval {

// How to drive one native toolchain.
struct ToolchainOptions {
  String program;
  String version_flag;
  Vector<String> flags;
  // Used when no architecture is requested; skipped when empty.
  String native_arch_flag;
  // Boost.Format pattern, %1% is replaced by the requested architecture.
  String arch_flag_format;
  String artifact_name;
};

// nvcc with the flags the leaderboard builds submissions with.
ToolchainOptions NvccToolchain();

// Assembles the full compile invocation, program first.
Vector<String> MakeCompileArgs(const ToolchainOptions& options,
                               const Path& program,
                               const Vector<String>& files,
                               const Optional<String>& arch,
                               const Vector<String>& include_dirs);

class Compiler {
 public:
  virtual ~Compiler() = default;

  // Compiles |files| (relative to |work_dir|) into the toolchain's artifact
  // inside |work_dir|. Failures, including a missing toolchain, are
  // reported in the result.
  virtual CompileResult Compile(const Vector<String>& files,
                                const Optional<String>& arch,
                                const Vector<String>& include_dirs,
                                const Path& work_dir) const = 0;

  virtual const String& artifact_name() const = 0;

  Compiler() = default;
  Compiler(const Compiler&) = delete;
  Compiler& operator=(const Compiler&) = delete;
};

Box<Compiler> CreateCompiler(const ToolchainOptions& options);

}  // namespace keval

#endif  // KEVAL_COMPILER_H
