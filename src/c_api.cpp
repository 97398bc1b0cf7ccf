#include "cuesheet.h"

#include "cuesheet/c_api.hpp"
#include "cuesheet/c_handles.hpp"
#include "cuesheet/config.hpp"
#include "cuesheet/logging.hpp"

#include <atomic>
#include <cassert>
#include <string>

namespace cuesheet {

/* Error code management. */
thread_local csh_ErrorCode last_error_code = 0;
thread_local std::string last_error_message = "";

void setCThreadError(csh_ErrorCode error, const char *message) {
  last_error_code = error;
  last_error_message = message;
}

/**
 * -1 while uninitialized. Set to 0 by initialization. Thereafter, incremented every time a function which requires
 * initialization enters the library and decremented when it exits.
 *
 * Shutdown moves it from 0 back to -1, so shutdown can't happen while a call is in flight.
 * */
static std::atomic<int> is_initialized{-1};

void beginInitializedCall(bool require_init) {
  if (require_init == false) {
    return;
  }

  int expected = is_initialized.load(std::memory_order_relaxed);

  do {
    if (expected < 0) {
      throw EUninitialized();
    }
  } while (is_initialized.compare_exchange_weak(expected, expected + 1, std::memory_order_acquire,
                                                std::memory_order_relaxed) == false);
}

void endInitializedCall(bool require_init) {
  if (require_init == false) {
    return;
  }

  int old = is_initialized.fetch_sub(1, std::memory_order_release);
  (void)old;
  assert(old > 0);
}

} // namespace cuesheet

/* C stuff itself; note we're outside the namespace. */
using namespace cuesheet;

CSH_CAPI void csh_getVersion(unsigned int *major, unsigned int *minor, unsigned int *patch) {
  *major = config::VERSION_MAJOR;
  *minor = config::VERSION_MINOR;
  *patch = config::VERSION_PATCH;
}

CSH_CAPI void csh_libraryConfigSetDefaults(struct csh_LibraryConfig *cfg) {
  *cfg = csh_LibraryConfig{};
  cfg->log_level = CSH_LOG_LEVEL_ERROR;
  cfg->logging_backend = CSH_LOGGING_BACKEND_NONE;
}

CSH_CAPI csh_ErrorCode csh_initialize(void) {
  struct csh_LibraryConfig cfg;
  csh_libraryConfigSetDefaults(&cfg);
  return csh_initializeWithConfig(&cfg);
}

CSH_CAPI csh_ErrorCode csh_initializeWithConfig(const struct csh_LibraryConfig *config) {
  CSH_PROLOGUE_UNINIT

  switch (config->log_level) {
  case CSH_LOG_LEVEL_ERROR:
  case CSH_LOG_LEVEL_WARN:
  case CSH_LOG_LEVEL_INFO:
  case CSH_LOG_LEVEL_DEBUG:
    break;
  default:
    throw ERange("Invalid log_level");
  }

  if (config->logging_backend != CSH_LOGGING_BACKEND_NONE && config->logging_backend != CSH_LOGGING_BACKEND_STDERR) {
    throw ERange("Invalid logging_backend");
  }

  int expected = -1;
  if (is_initialized.compare_exchange_strong(expected, 0, std::memory_order_acq_rel, std::memory_order_relaxed) ==
      false) {
    throw Error("Library is already initialized");
  }

  if (config->logging_backend == CSH_LOGGING_BACKEND_STDERR) {
    logToStderr();
  } else {
    disableLogging();
  }
  setLogLevel((enum CSH_LOG_LEVEL)config->log_level);
  logInfo("Cuesheet %u.%u.%u initialized", config::VERSION_MAJOR, config::VERSION_MINOR, config::VERSION_PATCH);
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_shutdown(void) {
  CSH_PROLOGUE_UNINIT

  /* Spin until nothing is inside the library. */
  int expected = 0;
  while (is_initialized.compare_exchange_weak(expected, -1, std::memory_order_acq_rel, std::memory_order_relaxed) ==
         false) {
    if (expected < 0) {
      throw EUninitialized();
    }
    expected = 0;
  }

  clearAllCHandles();
  logDebug("Library shutdown complete");
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_getLastErrorCode(void) { return last_error_code; }

CSH_CAPI const char *csh_getLastErrorMessage(void) { return last_error_message.c_str(); }

/*
 * Handle management.
 * */
CSH_CAPI csh_ErrorCode csh_handleIncRef(csh_Handle handle) {
  CSH_PROLOGUE
  incRefCHandle(handle);
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_handleDecRef(csh_Handle handle) {
  CSH_PROLOGUE
  if (handle == 0) {
    return 0;
  }
  decRefCHandle(handle);
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_handleGetObjectType(int *out, csh_Handle handle) {
  CSH_PROLOGUE
  auto obj = getExposableFromHandle(handle);
  *out = obj->getObjectType();
  return 0;
  CSH_EPILOGUE
}
