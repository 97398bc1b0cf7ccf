#pragma once

#include "cuesheet.h"

/*
 * This function is printf-like. Argument m (1-based) is the format string, argument n is the first argument to be used
 * for formatting.
 * */
#if defined(__GNUC__) || defined(__clang__)
#define PRINTF_LIKE(m, n) [[gnu::format(printf, m, n)]]
#else
#define PRINTF_LIKE(m, n)
#endif

namespace cuesheet {

void logToStderr();
void disableLogging();

enum CSH_LOG_LEVEL getLogLevel();
void setLogLevel(enum CSH_LOG_LEVEL level);

/* Log a printf-style message at the given level, if logging is enabled and the level passes the filter. */
PRINTF_LIKE(2, 3) void log(enum CSH_LOG_LEVEL level, const char *format, ...);

#define logError(...) ::cuesheet::log(CSH_LOG_LEVEL_ERROR, __VA_ARGS__)
#define logWarn(...) ::cuesheet::log(CSH_LOG_LEVEL_WARN, __VA_ARGS__)
#define logInfo(...) ::cuesheet::log(CSH_LOG_LEVEL_INFO, __VA_ARGS__)
#define logDebug(...) ::cuesheet::log(CSH_LOG_LEVEL_DEBUG, __VA_ARGS__)

} // namespace cuesheet
