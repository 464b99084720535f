#pragma once

#include <string>

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace Log {

struct LogOptions {
  std::string filePath = "training_course.log"; // empty disables the file sink
  spdlog::level::level_enum level = spdlog::level::info;
  bool console = true;
};

void Init(const LogOptions &options = LogOptions{});
void Shutdown();

// Returns the engine logger, or spdlog's default logger before Init().
spdlog::logger *GetLogger();

} // namespace Log

#define LOG_TRACE(...) ::Log::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::Log::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) ::Log::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) ::Log::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::Log::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::Log::GetLogger()->critical(__VA_ARGS__)
