#include "CrashHandler.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>

#include <backward.hpp>

#include "core/Log.hpp"

namespace CrashHandler {

// Dynamic allocation to keep it alive for the duration of the program
static backward::SignalHandling *s_SignalHandler = nullptr;

namespace {

[[noreturn]] void OnTerminate() {
  if (const std::exception_ptr current = std::current_exception()) {
    try {
      std::rethrow_exception(current);
    } catch (const std::exception &e) {
      LOG_CRITICAL("Unhandled exception: {}", e.what());
    } catch (...) {
      LOG_CRITICAL("Unhandled non-standard exception");
    }
  } else {
    LOG_CRITICAL("std::terminate called without an active exception");
  }
  Log::GetLogger()->flush();

  backward::StackTrace st;
  st.load_here(64);
  backward::Printer printer;
  printer.print(st, stderr);
  std::abort();
}

} // namespace

void Init() {
  if (!s_SignalHandler) {
    s_SignalHandler = new backward::SignalHandling();
    std::set_terminate(OnTerminate);
  }
}

} // namespace CrashHandler
