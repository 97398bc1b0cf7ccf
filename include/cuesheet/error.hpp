#pragma once
#include "cuesheet.h"

#include <exception>
#include <string>

namespace cuesheet {

/*
 * Base class for all cuesheet errors.
 *
 * Cuesheet reports programmer errors by throwing an instance of this class. The C API catches these at the boundary
 * and translates them into error codes and a thread-local message.
 * */
class Error : public std::exception {
public:
  Error(const std::string &message);
  virtual ~Error() {}

  const char *what() const noexcept override { return this->message.c_str(); }
  /* Get the code for the C API. */
  virtual csh_ErrorCode cCode() const { return CSH_ERROR_GENERIC; }

private:
  std::string message;
};

#define ERRDEF4(type, default_msg, base, code)                                                                         \
  class type : public base {                                                                                           \
  public:                                                                                                              \
    type(const std::string &msg = default_msg) : base(msg) {}                                                          \
    csh_ErrorCode cCode() const override { return code; }                                                              \
  }
#define ERRDEF(type, default_msg, code) ERRDEF4(type, default_msg, Error, code)

/* Some module agnostic errors. */
ERRDEF(EUninitialized, "The library is not initialized.", CSH_ERROR_UNINITIALIZED);

ERRDEF(EInvalidHandle, "C handle is invalid", CSH_ERROR_INVALID_HANDLE);
ERRDEF(EHandleType, "Handle of the wrong type provided", CSH_ERROR_HANDLE_TYPE);
ERRDEF(ERange, "Value out of range", CSH_ERROR_RANGE);
ERRDEF(EInvariant, "Invariant would be violated", CSH_ERROR_INVARIANT);
ERRDEF(EDestroyed, "Scheduler has been destroyed", CSH_ERROR_DESTROYED);

} // namespace cuesheet
