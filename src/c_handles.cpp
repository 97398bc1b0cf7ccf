#include "cuesheet/c_handles.hpp"

#include "cuesheet/error.hpp"
#include "cuesheet/logging.hpp"

#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace cuesheet {

namespace {

struct HandleEntry {
  std::shared_ptr<CExposable> object;
  unsigned int reference_count;
};

std::mutex handles_lock{};
std::unordered_map<csh_Handle, HandleEntry> handles{};
/* 0 is never a valid handle. */
csh_Handle next_handle = 1;

} // namespace

csh_Handle registerCHandle(const std::shared_ptr<CExposable> &obj) {
  auto guard = std::lock_guard<std::mutex>(handles_lock);
  csh_Handle h = next_handle++;
  handles.emplace(h, HandleEntry{obj, 1});
  return h;
}

std::shared_ptr<CExposable> getExposableFromHandle(csh_Handle handle) {
  auto guard = std::lock_guard<std::mutex>(handles_lock);
  auto found = handles.find(handle);
  if (found == handles.end()) {
    throw EInvalidHandle("Handle doesn't exist or was already freed");
  }
  return found->second.object;
}

void incRefCHandle(csh_Handle handle) {
  auto guard = std::lock_guard<std::mutex>(handles_lock);
  auto found = handles.find(handle);
  if (found == handles.end()) {
    throw EInvalidHandle("Handle doesn't exist or was already freed");
  }
  found->second.reference_count++;
}

unsigned int decRefCHandle(csh_Handle handle) {
  /* Destroy the object outside the lock; destructors may end up back in here. */
  std::shared_ptr<CExposable> dying = nullptr;
  unsigned int remaining;

  {
    auto guard = std::lock_guard<std::mutex>(handles_lock);
    auto found = handles.find(handle);
    if (found == handles.end()) {
      throw EInvalidHandle("Handle doesn't exist or was already freed");
    }

    remaining = --found->second.reference_count;
    if (remaining == 0) {
      dying = std::move(found->second.object);
      handles.erase(found);
    }
  }

  return remaining;
}

void clearAllCHandles() {
  std::unordered_map<csh_Handle, HandleEntry> dying{};
  {
    auto guard = std::lock_guard<std::mutex>(handles_lock);
    dying.swap(handles);
  }
  logDebug("Dropping %zu outstanding handles", dying.size());
}

} // namespace cuesheet
