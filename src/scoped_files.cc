#include "scoped_files.h"

#include <glog/logging.h>

#include "job_config.h"
#include "util.h"

namespace keval {

void ScopedFiles::Write(StringView name, StringView content) {
  if (!IsPlainFileName(name)) {
    throw ConfigurationError("invalid file name '" + name.to_string() + "'");
  }
  Path path = dir_ / name.to_string();
  // Recorded first so a partial write is still cleaned up.
  paths_.push_back(path);
  WriteFile(path, content);
  VLOG(1) << "Wrote " << path << " (" << content.size() << " bytes)";
}

void ScopedFiles::WriteAll(const Map<String, String>& files) {
  for (const auto& entry : files) {
    Write(entry.first, entry.second);
  }
}

void ScopedFiles::RemoveAll() {
  for (const Path& path : paths_) {
    boost::system::error_code error_code;
    // A write that failed on a name already taken by a directory created
    // nothing to remove.
    if (boost::filesystem::is_directory(
            boost::filesystem::symlink_status(path, error_code))) {
      continue;
    }
    boost::filesystem::remove(path, error_code);
    if (error_code) {
      LOG(WARNING) << "Failed to remove " << path << ": "
                   << error_code.message();
    }
  }
  if (!paths_.empty()) {
    VLOG(1) << "Removed " << paths_.size() << " file(s) from " << dir_;
  }
  paths_.clear();
}

}  // namespace keval
