#include <gtest/gtest.h>
#include <sstream>

#include "job_config.h"

namespace keval {
namespace {

JobConfig ReadJob(const String& json) {
  std::istringstream stream(json);
  return ReadJobConfig(stream);
}

TEST(ParseLanguageTest, AcceptsBothSpellings) {
  EXPECT_EQ(ParseLanguage("cu"), Language::kNative);
  EXPECT_EQ(ParseLanguage("native"), Language::kNative);
  EXPECT_EQ(ParseLanguage("py"), Language::kScripted);
  EXPECT_EQ(ParseLanguage("scripted"), Language::kScripted);
}

TEST(ParseLanguageTest, RejectsUnknownLanguage) {
  EXPECT_THROW(ParseLanguage("zz"), ConfigurationError);
  EXPECT_THROW(ParseLanguage(""), ConfigurationError);
  EXPECT_THROW(ParseLanguage("CU"), ConfigurationError);
}

TEST(ReadJobConfigTest, ReadsNativeJob) {
  JobConfig config = ReadJob(R"({
    "lang": "cu",
    "sources": {"eval.cu": "int main() {}", "submission.cu": "// kernel"},
    "headers": {"reference.cuh": "#pragma once"},
    "arch": 80,
    "include_dirs": ["/ThunderKittens", "/cutlass/include"],
    "seed": 7
  })");
  EXPECT_EQ(config.language, Language::kNative);
  ASSERT_EQ(config.sources.size(), 2u);
  EXPECT_EQ(config.sources["eval.cu"], "int main() {}");
  EXPECT_EQ(config.headers["reference.cuh"], "#pragma once");
  ASSERT_TRUE(config.arch);
  EXPECT_EQ(*config.arch, "80");
  Vector<String> include_dirs = {"/ThunderKittens", "/cutlass/include"};
  EXPECT_EQ(config.include_dirs, include_dirs);
  EXPECT_EQ(config.seed, 7);
}

TEST(ReadJobConfigTest, ReadsScriptedJobWithDefaults) {
  JobConfig config = ReadJob(R"json({
    "lang": "py",
    "sources": {"eval.py": "print(1)", "submission.py": ""},
    "main": "eval.py"
  })json");
  EXPECT_EQ(config.language, Language::kScripted);
  EXPECT_EQ(config.entry_point, "eval.py");
  EXPECT_EQ(config.sources["submission.py"], "");
  EXPECT_FALSE(config.arch);
  EXPECT_EQ(config.seed, kDefaultSeed);
  EXPECT_TRUE(config.headers.empty());
  EXPECT_TRUE(config.include_dirs.empty());
}

TEST(ReadJobConfigTest, NullArchMeansNative) {
  JobConfig config =
      ReadJob(R"({"lang": "cu", "sources": {"a.cu": ""}, "arch": null})");
  EXPECT_FALSE(config.arch);
}

TEST(ReadJobConfigTest, EmptyArchMeansNative) {
  JobConfig config =
      ReadJob(R"({"lang": "cu", "sources": {"a.cu": ""}, "arch": ""})");
  EXPECT_FALSE(config.arch);
}

TEST(ReadJobConfigTest, StringArchIsKept) {
  JobConfig config =
      ReadJob(R"({"lang": "cu", "sources": {"a.cu": ""}, "arch": "90a"})");
  ASSERT_TRUE(config.arch);
  EXPECT_EQ(*config.arch, "90a");
}

TEST(ReadJobConfigTest, RejectsBadInput) {
  EXPECT_THROW(ReadJob("{not json"), ConfigurationError);
  EXPECT_THROW(ReadJob(R"({"sources": {"a.cu": ""}})"), ConfigurationError);
  EXPECT_THROW(ReadJob(R"({"lang": "zz", "sources": {"a.cu": ""}})"),
               ConfigurationError);
  EXPECT_THROW(ReadJob(R"({"lang": "cu", "sources": {"a.cu": {"x": "y"}}})"),
               ConfigurationError);
  EXPECT_THROW(
      ReadJob(R"({"lang": "cu", "sources": {"a.cu": ""}, "seed": "abc"})"),
      ConfigurationError);
  EXPECT_THROW(
      ReadJob(R"({"lang": "cu", "sources": {"a.cu": ""}, "arch": true})"),
      ConfigurationError);
  EXPECT_THROW(ReadJob(R"({"lang": "cu", "sources": ["a.cu"]})"),
               ConfigurationError);
  EXPECT_THROW(ReadJob(R"(["cu"])"), ConfigurationError);
}

TEST(ValidateJobConfigTest, AcceptsWellFormedJobs) {
  JobConfig native;
  native.language = Language::kNative;
  native.sources = {{"eval.cu", ""}};
  native.headers = {{"reference.cuh", ""}};
  EXPECT_NO_THROW(ValidateJobConfig(native));

  JobConfig scripted;
  scripted.language = Language::kScripted;
  scripted.sources = {{"eval.py", ""}};
  scripted.entry_point = "eval.py";
  EXPECT_NO_THROW(ValidateJobConfig(scripted));
}

TEST(ValidateJobConfigTest, RejectsMalformedJobs) {
  JobConfig config;
  config.language = Language::kNative;
  EXPECT_THROW(ValidateJobConfig(config), ConfigurationError);

  config.sources = {{"../eval.cu", ""}};
  EXPECT_THROW(ValidateJobConfig(config), ConfigurationError);

  config.sources = {{"eval.cu", ""}};
  config.headers = {{"eval.cu", ""}};
  EXPECT_THROW(ValidateJobConfig(config), ConfigurationError);

  config.headers.clear();
  config.language = static_cast<Language>(42);
  EXPECT_THROW(ValidateJobConfig(config), ConfigurationError);

  config.language = Language::kScripted;
  config.entry_point = "missing.py";
  EXPECT_THROW(ValidateJobConfig(config), ConfigurationError);
}

TEST(IsPlainFileNameTest, Classifies) {
  EXPECT_TRUE(IsPlainFileName("eval.cu"));
  EXPECT_TRUE(IsPlainFileName(".hidden"));
  EXPECT_FALSE(IsPlainFileName(""));
  EXPECT_FALSE(IsPlainFileName("."));
  EXPECT_FALSE(IsPlainFileName(".."));
  EXPECT_FALSE(IsPlainFileName("dir/eval.cu"));
  EXPECT_FALSE(IsPlainFileName("/etc/passwd"));
}

}  // namespace
}  // namespace keval
