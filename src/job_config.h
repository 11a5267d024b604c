#ifndef KEVAL_JOB_CONFIG_H
#define KEVAL_JOB_CONFIG_H

#include <cstdint>
#include <istream>
#include <stdexcept>

#include "shim.h"

namespace keval {

// A job the caller got wrong. Never turned into a result.
class ConfigurationError : public std::invalid_argument {
 public:
  explicit ConfigurationError(const String& message)
      : std::invalid_argument(message) {}
};

enum class Language {
  kNative,    // compiled with the native toolchain, then executed
  kScripted,  // handed to the interpreter as is
};

// Accepts "cu" / "native" and "py" / "scripted".
Language ParseLanguage(StringView name);

const char* LanguageName(Language language);

const int64_t kDefaultSeed = 42;

struct JobConfig {
  Language language = Language::kNative;
  Map<String, String> sources;
  Map<String, String> headers;
  Optional<String> arch;
  int64_t seed = kDefaultSeed;
  String entry_point;
  Vector<String> include_dirs;
};

// True for a single plain file name that stays inside its directory.
bool IsPlainFileName(StringView name);

// Throws ConfigurationError if |config| cannot be evaluated as given.
void ValidateJobConfig(const JobConfig& config);

// Reads the job payload format:
//   {"lang": "cu", "sources": {...}, "headers": {...}, "arch": 80,
//    "include_dirs": [...], "main": "eval.py", "seed": 42}
// "arch" may be a number, a string, or null for the native architecture.
// Throws ConfigurationError on missing or mistyped fields.
JobConfig ParseJobConfig(const Json& json);

// Same, from a JSON document. Malformed JSON is a ConfigurationError too.
JobConfig ReadJobConfig(std::istream& stream);

}  // namespace keval

#endif  // KEVAL_JOB_CONFIG_H
