#include <codejudge/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// A worker thread may fork while another thread is in the middle of logging;
// hold the console lock shared by all color sinks across fork() so the child
// never inherits it locked.
void Prepare() {
  spdlog::details::console_mutex::mutex().lock();
}

void AfterFork() {
  spdlog::details::console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, AfterFork, AfterFork);
}
