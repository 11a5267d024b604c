#include "result.h"

#include <boost/filesystem/exception.hpp>
#include <boost/system/error_code.hpp>

namespace keval {

RunResult MakeSkippedRun() {
  RunResult run;
  run.success = false;
  run.passed = false;
  run.exit_code = -1;
  run.duration = 0.0;
  return run;
}

Json ToJson(const CompileResult& result) {
  return Json{
      {"toolchain_found", result.toolchain_found},
      {"toolchain_version", result.toolchain_version},
      {"success", result.success},
      {"command", result.command},
      {"stdout", result.stdout_data},
      {"stderr", result.stderr_data},
      {"exit_code", result.exit_code},
  };
}

Json ToJson(const RunResult& result) {
  return Json{
      {"success", result.success},
      {"passed", result.passed},
      {"command", result.command},
      {"stdout", result.stdout_data},
      {"stderr", result.stderr_data},
      {"exit_code", result.exit_code},
      {"duration", result.duration},
      {"result", result.result},
  };
}

Json ToJson(const FullResult& result) {
  Json json = {
      {"success", result.success},
      {"error", result.error},
  };
  if (result.compile) {
    json["compile"] = ToJson(*result.compile);
  }
  if (result.run) {
    json["run"] = ToJson(*result.run);
  }
  return json;
}

void WriteJson(std::ostream& stream, const FullResult& result) {
  stream << ToJson(result).dump(2, ' ', false, Json::error_handler_t::replace)
         << '\n';
  stream.flush();
  if (!stream) {
    throw boost::filesystem::filesystem_error(
        "cannot write result",
        boost::system::errc::make_error_code(boost::system::errc::io_error));
  }
}

}  // namespace keval
