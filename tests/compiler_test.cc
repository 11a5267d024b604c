#include <gtest/gtest.h>

#include "compiler.h"
#include "process.h"
#include "util.h"

namespace keval {
namespace {

// The host C++ compiler, driven through the same options as nvcc.
ToolchainOptions HostToolchain() {
  ToolchainOptions options;
  options.program = "c++";
  options.version_flag = "--version";
  options.flags = {"-std=c++14", "-O1"};
  options.native_arch_flag = "";
  options.arch_flag_format = "-march=%1%";
  options.artifact_name = "eval.out";
  return options;
}

// =============================================================================
// Command assembly
// =============================================================================

TEST(MakeCompileArgsTest, NativeArchByDefault) {
  ToolchainOptions options = NvccToolchain();
  Vector<String> args = MakeCompileArgs(options, "/usr/local/cuda/bin/nvcc",
                                        {"eval.cu", "submission.cu"},
                                        Optional<String>(), {"/opt/tk"});
  ASSERT_GE(args.size(), 6u);
  EXPECT_EQ(args.front(), "/usr/local/cuda/bin/nvcc");
  EXPECT_EQ(args[1], "--std=c++17");
  Vector<String> tail(args.end() - 6, args.end());
  Vector<String> expected = {"-I/opt/tk", "eval.cu", "submission.cu",
                             "-arch=native", "-o", "eval.out"};
  EXPECT_EQ(tail, expected);
  EXPECT_EQ(args.size(), 1 + options.flags.size() + 6);
}

TEST(MakeCompileArgsTest, ExplicitArchUsesGencode) {
  Vector<String> args = MakeCompileArgs(NvccToolchain(), "nvcc",
                                        {"eval.cu"}, String("80"), {});
  Vector<String> tail(args.end() - 4, args.end());
  Vector<String> expected = {"eval.cu", "-gencode=arch=compute_80,code=sm_80",
                             "-o", "eval.out"};
  EXPECT_EQ(tail, expected);
}

TEST(MakeCompileArgsTest, IncludeDirsKeepOrderBeforeSources) {
  Vector<String> args = MakeCompileArgs(HostToolchain(), "c++", {"main.cc"},
                                        Optional<String>(), {"/b", "/a"});
  Vector<String> expected = {"c++",  "-std=c++14", "-O1", "-I/b", "-I/a",
                             "main.cc", "-o", "eval.out"};
  EXPECT_EQ(args, expected);
}

TEST(NvccToolchainTest, Defaults) {
  ToolchainOptions options = NvccToolchain();
  EXPECT_EQ(options.program, "nvcc");
  EXPECT_EQ(options.native_arch_flag, "-arch=native");
  EXPECT_EQ(options.artifact_name, "eval.out");
  EXPECT_FALSE(options.flags.empty());
}

// =============================================================================
// Compiling
// =============================================================================

class CompilerTest : public ::testing::Test {
 protected:
  CompilerTest()
      : work_dir_(CreateTempPath(TempPath(), "keval-test.%%%%-%%%%-%%%%")) {}

  void SetUp() override {
    if (ResolveProgram("c++").empty()) {
      GTEST_SKIP() << "no host C++ compiler";
    }
  }

  ScopedDirectory work_dir_;
};

TEST_F(CompilerTest, MissingToolchainIsReportedNotThrown) {
  ToolchainOptions options = HostToolchain();
  options.program = "keval-no-such-compiler";
  CompileResult result = CreateCompiler(options)->Compile(
      {"main.cc"}, Optional<String>(), {}, work_dir_.path());
  EXPECT_FALSE(result.toolchain_found);
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.toolchain_version.empty());
  EXPECT_NE(result.exit_code, 0);
  EXPECT_NE(result.stderr_data.find("keval-no-such-compiler"), String::npos);
  EXPECT_FALSE(Exists(work_dir_.path() / "eval.out"));
}

TEST_F(CompilerTest, CompilesValidSource) {
  WriteFile(work_dir_.path() / "main.cc", "int main() { return 0; }\n");
  CompileResult result = CreateCompiler(HostToolchain())->Compile(
      {"main.cc"}, Optional<String>(), {}, work_dir_.path());
  EXPECT_TRUE(result.toolchain_found);
  EXPECT_FALSE(result.toolchain_version.empty());
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.command.find("main.cc -o eval.out"), String::npos);
  EXPECT_TRUE(Exists(work_dir_.path() / "eval.out"));
}

TEST_F(CompilerTest, HeadersAreFoundWithoutBeingCompiled) {
  WriteFile(work_dir_.path() / "answer.h", "inline int Answer() { return 0; }\n");
  WriteFile(work_dir_.path() / "main.cc",
            "#include \"answer.h\"\nint main() { return Answer(); }\n");
  CompileResult result = CreateCompiler(HostToolchain())->Compile(
      {"main.cc"}, Optional<String>(), {}, work_dir_.path());
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.command.find("answer.h"), String::npos);
}

TEST_F(CompilerTest, CompileErrorIsCaptured) {
  WriteFile(work_dir_.path() / "main.cc", "int main() { return }\n");
  CompileResult result = CreateCompiler(HostToolchain())->Compile(
      {"main.cc"}, Optional<String>(), {}, work_dir_.path());
  EXPECT_TRUE(result.toolchain_found);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.exit_code, 0);
  EXPECT_FALSE(result.stderr_data.empty());
  EXPECT_FALSE(Exists(work_dir_.path() / "eval.out"));
}

TEST_F(CompilerTest, VersionQueryFailureCountsAsMissing) {
  ToolchainOptions options = HostToolchain();
  options.version_flag = "--keval-not-a-flag";
  CompileResult result = CreateCompiler(options)->Compile(
      {"main.cc"}, Optional<String>(), {}, work_dir_.path());
  EXPECT_FALSE(result.toolchain_found);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.exit_code, 0);
  EXPECT_NE(result.command.find("--keval-not-a-flag"), String::npos);
}

}  // namespace
}  // namespace keval
