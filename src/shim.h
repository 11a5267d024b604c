#ifndef KEVAL_SHIM_H
#define KEVAL_SHIM_H

#include <boost/asio.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/optional.hpp>
#include <boost/utility/string_view.hpp>
#include <nlohmann/json_fwd.hpp>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace keval {

// Base.
template <typename Type>
using Box = std::unique_ptr<Type>;

template <typename Key, typename Value>
using Map = std::map<Key, Value>;

template <typename Type>
using Optional = boost::optional<Type>;

using String = std::string;
using StringView = boost::string_view;

template <typename Element>
using Vector = std::vector<Element>;

// File
using Path = boost::filesystem::path;
using Ios = std::ios;
using OFStream = boost::filesystem::ofstream;

inline Path AbsolutePath(const Path& path) {
  return boost::filesystem::absolute(path);
}

inline Path TempPath() {
  return boost::filesystem::temp_directory_path();
}

inline Path RandomPath(const Path& model) {
  return boost::filesystem::unique_path(model);
}

inline bool Exists(const Path& path) {
  return boost::filesystem::exists(path);
}

inline bool MakeDir(const Path& path) {
  return boost::filesystem::create_directory(path);
}

inline void MakeDirs(const Path& path) {
  boost::filesystem::create_directories(path);
}

// I/O
using EventLoop = boost::asio::io_service;

// Serialization
using Json = nlohmann::json;

}  // namespace keval

#endif  // KEVAL_SHIM_H
