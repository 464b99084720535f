#include "Log.hpp"

#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace Log {

static std::shared_ptr<spdlog::logger> s_Logger;

void Init(const LogOptions &options) {
  std::vector<spdlog::sink_ptr> sinks;

  // Console sink goes to stderr so tool output on stdout stays parseable.
  if (options.console) {
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_pattern("%^[%T] %n: %v%$");
    sinks.push_back(consoleSink);
  }

  if (!options.filePath.empty()) {
    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options.filePath, true);
    fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %n: %v");
    sinks.push_back(fileSink);
  }

  if (s_Logger) {
    spdlog::drop(s_Logger->name());
  }
  s_Logger =
      std::make_shared<spdlog::logger>("COURSE", sinks.begin(), sinks.end());
  spdlog::register_logger(s_Logger);

  s_Logger->set_level(options.level);
  s_Logger->flush_on(spdlog::level::warn);

  LOG_DEBUG("Logging initialized (level {})",
            spdlog::level::to_string_view(options.level));
}

void Shutdown() {
  if (s_Logger) {
    s_Logger->flush();
  }
  s_Logger.reset();
  spdlog::shutdown();
}

spdlog::logger *GetLogger() {
  if (s_Logger) {
    return s_Logger.get();
  }
  return spdlog::default_logger_raw();
}

} // namespace Log
