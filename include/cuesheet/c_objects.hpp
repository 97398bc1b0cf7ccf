#pragma once

#include "cuesheet.h"
#include "cuesheet_constants.h"

#include "cuesheet/c_handles.hpp"
#include "cuesheet/cue.hpp"
#include "cuesheet/listener_registry.hpp"
#include "cuesheet/scheduler.hpp"

#include <variant>

namespace cuesheet {

/*
 * The C-facing wrappers.  C has no way to express the cue stages as types, so the C wrapper for a cue keeps the stage
 * in a variant and the C API checks it at runtime.
 * */

using CueStage = std::variant<OneShotCue, RepeatingCue, TerminatedCue>;

class CCue : public CExposable {
public:
  template <typename T> CCue(const T &_stage) : stage(_stage) {}

  int getObjectType() override { return CSH_OTYPE_CUE; }

  const Cue &getCue() const {
    return std::visit([](const auto &s) -> const Cue & { return s; }, this->stage);
  }

  CueStage stage;
};

class CScheduler : public CExposable {
public:
  int getObjectType() override { return CSH_OTYPE_SCHEDULER; }

  Scheduler scheduler;
};

class CSubscription : public CExposable {
public:
  CSubscription(const Subscription &_subscription) : subscription(_subscription) {}

  int getObjectType() override { return CSH_OTYPE_SUBSCRIPTION; }

  Subscription subscription;
};

} // namespace cuesheet
