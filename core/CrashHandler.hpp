#pragma once

// Installs backward-cpp signal handlers and a std::terminate hook that logs
// the escaping exception and a stack trace before aborting.
namespace CrashHandler {

void Init();

} // namespace CrashHandler
