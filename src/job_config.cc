#include "job_config.h"

#include <glog/logging.h>
#include <nlohmann/json.hpp>

namespace keval {

namespace {

Map<String, String> ReadFileMap(const Json& json, const char* key) {
  Map<String, String> files;
  auto node = json.find(key);
  if (node == json.end() || node->is_null()) {
    return files;
  }
  if (!node->is_object()) {
    throw ConfigurationError(String(key) +
                             " must map file names to contents");
  }
  for (auto entry = node->begin(); entry != node->end(); ++entry) {
    if (!entry.value().is_string()) {
      throw ConfigurationError(String(key) +
                               " must map file names to contents");
    }
    files[entry.key()] = entry.value().get<String>();
  }
  return files;
}

Optional<String> ReadArch(const Json& json) {
  auto node = json.find("arch");
  if (node == json.end() || node->is_null()) {
    return boost::none;
  }
  if (node->is_number_integer()) {
    return std::to_string(node->get<int64_t>());
  }
  if (node->is_string()) {
    String arch = node->get<String>();
    return arch.empty() ? Optional<String>() : Optional<String>(arch);
  }
  throw ConfigurationError("arch must be a number, a string or null");
}

void CheckFileNames(const Map<String, String>& files, const char* what) {
  for (const auto& entry : files) {
    if (!IsPlainFileName(entry.first)) {
      throw ConfigurationError(String("invalid ") + what + " file name '" +
                               entry.first + "'");
    }
  }
}

}  // namespace

Language ParseLanguage(StringView name) {
  if (name == "cu" || name == "native") {
    return Language::kNative;
  }
  if (name == "py" || name == "scripted") {
    return Language::kScripted;
  }
  throw ConfigurationError("invalid language '" + name.to_string() + "'");
}

const char* LanguageName(Language language) {
  switch (language) {
    case Language::kNative:
      return "native";
    case Language::kScripted:
      return "scripted";
  }
  return "invalid";
}

bool IsPlainFileName(StringView name) {
  return !name.empty() && name != "." && name != ".." &&
         name.find('/') == StringView::npos &&
         name.find('\0') == StringView::npos;
}

void ValidateJobConfig(const JobConfig& config) {
  switch (config.language) {
    case Language::kNative:
      break;
    case Language::kScripted:
      if (config.sources.count(config.entry_point) == 0) {
        throw ConfigurationError("entry point '" + config.entry_point +
                                 "' is not one of the sources");
      }
      break;
    default:
      throw ConfigurationError(
          "invalid language " +
          std::to_string(static_cast<int>(config.language)));
  }
  if (config.sources.empty()) {
    throw ConfigurationError("no sources given");
  }
  CheckFileNames(config.sources, "source");
  CheckFileNames(config.headers, "header");
  for (const auto& entry : config.headers) {
    if (config.sources.count(entry.first)) {
      throw ConfigurationError("'" + entry.first +
                               "' is both a source and a header");
    }
  }
}

JobConfig ParseJobConfig(const Json& json) {
  if (!json.is_object()) {
    throw ConfigurationError("job must be a JSON object");
  }
  JobConfig config;
  try {
    config.language = ParseLanguage(json.at("lang").get<String>());
    config.sources = ReadFileMap(json, "sources");
    config.headers = ReadFileMap(json, "headers");
    config.arch = ReadArch(json);
    config.seed = json.value("seed", kDefaultSeed);
    config.entry_point = json.value("main", String());
    config.include_dirs = json.value("include_dirs", Vector<String>());
  } catch (const Json::exception& error) {
    throw ConfigurationError(error.what());
  }
  VLOG(1) << "Parsed " << LanguageName(config.language) << " job with "
          << config.sources.size() << " source(s)";
  return config;
}

JobConfig ReadJobConfig(std::istream& stream) {
  Json json;
  try {
    json = Json::parse(stream);
  } catch (const Json::parse_error& error) {
    throw ConfigurationError(error.what());
  }
  return ParseJobConfig(json);
}

}  // namespace keval
