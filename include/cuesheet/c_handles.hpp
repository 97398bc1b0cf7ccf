#pragma once

#include "cuesheet.h"

#include "cuesheet/error.hpp"

#include <memory>

namespace cuesheet {

/**
 * Base class for everything which can be handed to C.
 *
 * Handles are small integers looked up in a global table rather than pointers, so a stale or made-up handle is reported
 * as EInvalidHandle instead of crashing.  The table holds one strong reference per handle, with a C-side reference
 * count on top: csh_handleIncRef/csh_handleDecRef move the count, and the table entry is dropped when it reaches 0.
 * Internal code holding a shared_ptr keeps the object alive past that point, but the handle is gone.
 * */
class CExposable {
public:
  virtual ~CExposable() {}

  /* Should return one of the CSH_OTYPE_ constants. */
  virtual int getObjectType() = 0;
};

/* Register an object with the handle table, with a reference count of 1, and return the new handle. */
csh_Handle registerCHandle(const std::shared_ptr<CExposable> &obj);

/* Throws EInvalidHandle. */
std::shared_ptr<CExposable> getExposableFromHandle(csh_Handle handle);

/* Both throw EInvalidHandle.  decRefCHandle returns the new count, and drops the handle at 0. */
void incRefCHandle(csh_Handle handle);
unsigned int decRefCHandle(csh_Handle handle);

/* Drop every handle. Used at library shutdown. */
void clearAllCHandles();

/*
 * Convert an object into a C handle which can be passed to the external world.
 *
 * Returns 0 if the object is nullptr.
 * */
template <typename T> csh_Handle toC(const std::shared_ptr<T> &obj) {
  if (obj == nullptr) {
    return 0;
  }
  return registerCHandle(std::static_pointer_cast<CExposable>(obj));
}

/* Throws EHandleType if the handle is of the wrong type. */
template <typename T> std::shared_ptr<T> fromC(csh_Handle handle) {
  auto h = getExposableFromHandle(handle);
  auto ret = std::dynamic_pointer_cast<T>(h);
  if (ret == nullptr) {
    throw EHandleType();
  }
  return ret;
}

} // namespace cuesheet
