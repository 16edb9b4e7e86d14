#include <ibench/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// The process runner forks from worker threads. A console sink held by another
//   thread at fork time would stay locked forever in the child, so all console
//   sinks (which share one global mutex) are held across fork().
void Prepare() {
  spdlog::details::console_mutex::mutex().lock();
}

void Parent() {
  spdlog::details::console_mutex::mutex().unlock();
}

void Child() {
  spdlog::details::console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Parent, Child);
}
