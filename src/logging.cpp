#include "cuesheet.h"

#include "cuesheet/config.hpp"
#include "cuesheet/logging.hpp"

#include <atomic>
#include <cstdarg>
#include <cstddef>
#include <cstdio>

namespace cuesheet {

static std::atomic<int> logging_enabled{0};
static std::atomic<enum CSH_LOG_LEVEL> log_level{CSH_LOG_LEVEL_ERROR};

static std::atomic<int> next_thread_id{1};
thread_local static int thread_id = 0;

static int getThreadId() {
  if (thread_id == 0) {
    thread_id = next_thread_id.fetch_add(1, std::memory_order_relaxed);
  }
  return thread_id;
}

void disableLogging() { logging_enabled.store(0); }

void logToStderr() { logging_enabled.store(1); }

enum CSH_LOG_LEVEL getLogLevel() { return log_level.load(std::memory_order_relaxed); }

void setLogLevel(enum CSH_LOG_LEVEL level) { log_level.store(level, std::memory_order_relaxed); }

static const char *logLevelAsString(enum CSH_LOG_LEVEL level) {
  switch (level) {
  case CSH_LOG_LEVEL_ERROR:
    return "error";
  case CSH_LOG_LEVEL_WARN:
    return "warn";
  case CSH_LOG_LEVEL_INFO:
    return "info";
  case CSH_LOG_LEVEL_DEBUG:
    return "debug";
  }
  return "";
}

thread_local static char log_message_buf[config::MAX_LOG_MESSAGE_LENGTH + 1];
void log(enum CSH_LOG_LEVEL level, const char *format, ...) {
  if (logging_enabled.load(std::memory_order_relaxed) == 0 || level > getLogLevel()) {
    return;
  }

  std::va_list args;
  va_start(args, format);
  int wrote = std::vsnprintf(log_message_buf, config::MAX_LOG_MESSAGE_LENGTH, format, args);
  va_end(args);

  if (wrote < 0) {
    return;
  }
  /* vsnprintf returns the untruncated length. */
  std::size_t end = static_cast<std::size_t>(wrote) < config::MAX_LOG_MESSAGE_LENGTH
                        ? static_cast<std::size_t>(wrote)
                        : config::MAX_LOG_MESSAGE_LENGTH - 1;
  log_message_buf[end] = '\0';
  std::fprintf(stderr, "%s(thread %i) %s\n", logLevelAsString(level), getThreadId(), log_message_buf);
}

} // namespace cuesheet

CSH_CAPI void csh_setLogLevel(enum CSH_LOG_LEVEL level) { cuesheet::setLogLevel(level); }
