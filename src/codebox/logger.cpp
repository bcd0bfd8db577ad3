#include <codebox/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// Hold the console mutex (shared by all color console sinks) across fork()
// so that the child never inherits it locked by another thread
void Prepare() {
  spdlog::details::console_mutex::mutex().lock();
}

void Release() {
  spdlog::details::console_mutex::mutex().unlock();
}

bool atfork_registered = false;

} // namespace

void InitLogger(int verbosity) {
  spdlog::set_pattern("[%t] %+");
  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  if (!atfork_registered) {
    spdlog::debug("Setup logger pthread_atfork");
    pthread_atfork(Prepare, Release, Release);
    atfork_registered = true;
  }
}
