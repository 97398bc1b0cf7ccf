#pragma once

#include <utility>

namespace cuesheet {

/* Runs a callable when it goes out of scope. */
template <typename CALLABLE> class AtScopeExit {
public:
  AtScopeExit(CALLABLE _callable) : callable(std::move(_callable)) {}
  ~AtScopeExit() { this->callable(); }

  AtScopeExit(const AtScopeExit &) = delete;
  AtScopeExit &operator=(const AtScopeExit &) = delete;

private:
  CALLABLE callable;
};

} // namespace cuesheet
