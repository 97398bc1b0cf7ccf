#pragma once

#include "cuesheet.h"

#include "cuesheet/at_scope_exit.hpp"
#include "cuesheet/error.hpp"

#include <exception>
#include <new>

namespace cuesheet {

/*
 * Helper functions and macros for implementing the C API.
 * */

/* Infrastructure for setting this thread's last C error code and message. */
void setCThreadError(csh_ErrorCode error, const char *message);

template <typename C> csh_ErrorCode cWrapper(C &&callable) {
  try {
    return callable();
  } catch (const Error &e) {
    setCThreadError(e.cCode(), e.what());
    return e.cCode();
  } catch (const std::bad_alloc &e) {
    setCThreadError(CSH_ERROR_GENERIC, "Out of memory");
    return CSH_ERROR_GENERIC;
  } catch (const std::exception &e) {
    setCThreadError(CSH_ERROR_GENERIC, e.what());
    return CSH_ERROR_GENERIC;
  } catch (...) {
    setCThreadError(CSH_ERROR_GENERIC, "Unknown error");
    return CSH_ERROR_GENERIC;
  }
}

/**
 * Functions to bracket a call which will ensure that the library is initialized and can't deinitialize while a caller
 * is using it.
 * */
void beginInitializedCall(bool require_init);
void endInitializedCall(bool require_init);

/**
 * Version of CSH_PROLOGUE for functions that should work without the library being initialized.
 * */
#define CSH_PROLOGUE_ICHECK(NEEDS_INIT)                                                                                \
  auto _c_wrapper = [&]() -> csh_ErrorCode {                                                                           \
    beginInitializedCall((NEEDS_INIT));                                                                                \
    auto _init_guard = AtScopeExit([]() { endInitializedCall((NEEDS_INIT)); });

#define CSH_PROLOGUE_UNINIT CSH_PROLOGUE_ICHECK(false)

/*
 * Every C function should start with CSH_PROLOGUE as the very first line, and end with CSH_EPILOGUE as the very last
 * line.  These handle wrapping exception handling.  Don't do CSH_PROLOGUE;, it's literally CSH_PROLOGUE on its own.
 */
#define CSH_PROLOGUE CSH_PROLOGUE_ICHECK(true)

#define CSH_EPILOGUE                                                                                                   \
  }                                                                                                                    \
  ;                                                                                                                    \
  return cWrapper(_c_wrapper);

} // namespace cuesheet
