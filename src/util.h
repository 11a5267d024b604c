#ifndef KEVAL_UTIL_H
#define KEVAL_UTIL_H

#include "shim.h"

namespace keval {

void WriteFile(const Path& file, StringView content);

String ReadFile(const Path& file);

// Creates a fresh directory named after |model| (see unique_path) under
// |root|. Throws boost::filesystem::filesystem_error once every attempt
// collided with an existing entry.
Path CreateTempPath(const Path& root, const Path& model, int num_attempts);

inline Path CreateTempPath(const Path& root, const Path& model) {
  return CreateTempPath(root, model, /*num_attempts=*/4);
}

// Quotes |arg| so a POSIX shell reads it back as a single word.
String ShellQuote(StringView arg);

// Joins |args| into one shell-quoted command line, for display only.
String MakeCommand(const Vector<String>& args);

StringView TrimWhitespace(StringView text);

// Removes |dir| and everything below it when the guard goes out of scope.
class ScopedDirectory {
 public:
  explicit ScopedDirectory(Path dir) : dir_(std::move(dir)) {}
  ~ScopedDirectory();

  const Path& path() const { return dir_; }

 private:
  Path dir_;

  ScopedDirectory(const ScopedDirectory&) = delete;
  ScopedDirectory& operator=(const ScopedDirectory&) = delete;
};

}  // namespace keval

#endif  // KEVAL_UTIL_H
