#include "util.h"

#include <glog/logging.h>
#include <boost/system/system_error.hpp>
#include <iterator>

namespace keval {

void WriteFile(const Path& file, StringView content) {
  OFStream sink(file, Ios::binary | Ios::trunc);
  sink.write(content.data(), content.size());
  sink.close();
  if (!sink) {
    throw boost::filesystem::filesystem_error(
        "cannot write file", file,
        boost::system::errc::make_error_code(boost::system::errc::io_error));
  }
}

String ReadFile(const Path& file) {
  boost::filesystem::ifstream source(file, Ios::binary);
  if (!source) {
    throw boost::filesystem::filesystem_error(
        "cannot read file", file,
        boost::system::errc::make_error_code(
            boost::system::errc::no_such_file_or_directory));
  }
  return String(std::istreambuf_iterator<char>(source),
                std::istreambuf_iterator<char>());
}

Path CreateTempPath(const Path& root, const Path& model, int num_attempts) {
  CHECK_GT(num_attempts, 0);
  MakeDirs(root);
  while (num_attempts--) {
    Path path = root / RandomPath(model);
    if (MakeDir(path)) {
      return path;
    }
  }
  throw boost::filesystem::filesystem_error(
      "cannot create a unique directory", root / model,
      boost::system::errc::make_error_code(
          boost::system::errc::file_exists));
}

String ShellQuote(StringView arg) {
  static const StringView safe_chars =
      "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789"
      "@%+=:,./-_";
  if (arg.empty()) {
    return "''";
  }
  if (arg.find_first_not_of(safe_chars) == StringView::npos) {
    return arg.to_string();
  }
  String quoted = "'";
  for (char c : arg) {
    if (c == '\'') {
      quoted += "'\"'\"'";
    } else {
      quoted += c;
    }
  }
  quoted += '\'';
  return quoted;
}

String MakeCommand(const Vector<String>& args) {
  String command;
  for (const String& arg : args) {
    if (!command.empty()) {
      command += ' ';
    }
    command += ShellQuote(arg);
  }
  return command;
}

StringView TrimWhitespace(StringView text) {
  static const StringView whitespace = " \t\r\n\v\f";
  size_t begin = text.find_first_not_of(whitespace);
  if (begin == StringView::npos) {
    return StringView();
  }
  size_t end = text.find_last_not_of(whitespace);
  return text.substr(begin, end - begin + 1);
}

ScopedDirectory::~ScopedDirectory() {
  boost::system::error_code error_code;
  boost::filesystem::remove_all(dir_, error_code);
  if (error_code) {
    LOG(WARNING) << "Failed to remove " << dir_ << ": "
                 << error_code.message();
  }
}

}  // namespace keval
