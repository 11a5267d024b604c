#ifndef KEVAL_SCOPED_FILES_H
#define KEVAL_SCOPED_FILES_H

#include "shim.h"

namespace keval {

// Files written into one directory for the duration of an evaluation.
// Everything written through the guard is removed by RemoveAll() or, at
// the latest, when the guard is destroyed.
class ScopedFiles {
 public:
  explicit ScopedFiles(Path dir) : dir_(std::move(dir)) {}
  ~ScopedFiles() { RemoveAll(); }

  // Writes |content| to |name| inside the directory. |name| must be a
  // plain file name; throws ConfigurationError otherwise and
  // boost::filesystem::filesystem_error if writing fails.
  void Write(StringView name, StringView content);

  void WriteAll(const Map<String, String>& files);

  // Removes every file written so far. Safe to call more than once.
  void RemoveAll();

  const Vector<Path>& paths() const { return paths_; }

 private:
  const Path dir_;
  Vector<Path> paths_;

  ScopedFiles(const ScopedFiles&) = delete;
  ScopedFiles& operator=(const ScopedFiles&) = delete;
};

}  // namespace keval

#endif  // KEVAL_SCOPED_FILES_H
