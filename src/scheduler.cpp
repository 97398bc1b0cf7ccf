#include "cuesheet/scheduler.hpp"

#include "cuesheet/error.hpp"
#include "cuesheet/logging.hpp"

#include <cstdint>
#include <exception>
#include <limits>
#include <memory>
#include <utility>

namespace cuesheet {

namespace {

/* Whether from + step <= limit, without forming from + step, which can overflow near the end of the timeline. */
bool landsBy(CueTime from, CueTime step, CueTime limit) {
  if (limit < from) {
    return false;
  }
  return static_cast<std::uint64_t>(limit) - static_cast<std::uint64_t>(from) >= static_cast<std::uint64_t>(step);
}

} // namespace

Scheduler::Scheduler() : registry(std::make_shared<ListenerRegistry>()) {}

void Scheduler::checkAlive() const {
  if (this->destroyed) {
    throw EDestroyed();
  }
}

Subscription Scheduler::subscribe(const Cue &cue, CueCallback callback) {
  this->checkAlive();
  auto listener = this->registry->add(cue, std::move(callback), false);
  return Subscription(this->registry, listener);
}

Subscription Scheduler::subscribeOnce(const Cue &cue, CueCallback callback) {
  this->checkAlive();
  auto listener = this->registry->add(cue, std::move(callback), true);
  return Subscription(this->registry, listener);
}

void Scheduler::play() {
  this->checkAlive();
  if (this->playing) {
    return;
  }
  this->playing = true;
  this->last_driver_tick = std::nullopt;
  logDebug("Scheduler playing from %lld", (long long)this->virtual_time);
}

void Scheduler::pause() {
  this->checkAlive();
  if (this->playing) {
    logDebug("Scheduler paused at %lld", (long long)this->virtual_time);
  }
  this->playing = false;
  this->last_driver_tick = std::nullopt;
}

void Scheduler::seek(CueTime time) {
  this->checkAlive();
  CueTime prev_time = this->virtual_time;
  this->virtual_time = time;

  if (time < prev_time) {
    logDebug("Seek backward from %lld to %lld; resetting firing state", (long long)prev_time, (long long)time);
    this->resetFiringState();
  }
}

void Scheduler::advance(CueTime time) {
  this->checkAlive();
  if (this->playing == false) {
    return;
  }

  CueTime prev_time = this->virtual_time;
  this->virtual_time = time;

  if (time < prev_time) {
    logWarn("Scheduler advanced backward from %lld to %lld. Use seek to rewind", (long long)prev_time,
            (long long)time);
    return;
  }

  this->processCues(prev_time, time);
}

void Scheduler::driverTick(CueTime wall_time) {
  this->checkAlive();
  if (this->playing == false) {
    return;
  }

  if (this->last_driver_tick == std::nullopt) {
    this->last_driver_tick = wall_time;
  }

  CueTime delta = wall_time - *this->last_driver_tick;
  this->last_driver_tick = wall_time;
  if (delta < 0) {
    logWarn("Wall clock went backward by %lld ms; ignoring driver tick", (long long)-delta);
    return;
  }

  this->advance(this->virtual_time + delta);
}

CueTime Scheduler::getTime() const {
  this->checkAlive();
  return this->virtual_time;
}

bool Scheduler::isPlaying() const {
  this->checkAlive();
  return this->playing;
}

void Scheduler::destroy() {
  if (this->destroyed) {
    return;
  }

  this->playing = false;
  this->last_driver_tick = std::nullopt;
  this->registry->clear();
  this->resetFiringState();
  this->destroyed = true;
}

std::uint64_t Scheduler::getFireCount(const Cue &cue) const {
  this->checkAlive();
  if (cue.isRepeating()) {
    auto found = this->repeat_state.find(cue.getId());
    return found == this->repeat_state.end() ? 0 : found->second.count;
  }
  return this->fired_one_shots.count(cue.getId());
}

bool Scheduler::hasFired(const Cue &cue) const { return this->getFireCount(cue) != 0; }

void Scheduler::resetFiringState() {
  this->fired_one_shots.clear();
  this->repeat_state.clear();
  this->reset_generation++;
}

void Scheduler::processCues(CueTime prev_time, CueTime current_time) {
  /*
   * Callbacks may subscribe, unsubscribe, or seek, so walk a copy.  Listeners removed during the frame are skipped by
   * fireListeners; listeners added during the frame wait for the next one.
   * */
  auto entries = this->registry->snapshot();
  std::uint64_t generation = this->reset_generation;

  for (auto &e : entries) {
    if (this->reset_generation != generation) {
      logDebug("Firing state was reset by a callback; abandoning the rest of this frame");
      return;
    }

    if (e.cue.isRepeating()) {
      this->processRepeatingCue(e, prev_time, current_time, generation);
    } else {
      this->processOneShotCue(e, prev_time, current_time);
    }
  }
}

void Scheduler::processOneShotCue(const ListenerRegistry::Entry &entry, CueTime prev_time, CueTime current_time) {
  CueTime start = entry.cue.getStartTime();
  CueId id = entry.cue.getId();

  if (prev_time < start && current_time >= start && this->fired_one_shots.count(id) == 0) {
    this->fired_one_shots.insert(id);
    this->fireListeners(entry);
  }
}

void Scheduler::processRepeatingCue(const ListenerRegistry::Entry &entry, CueTime prev_time, CueTime current_time,
                                    std::uint64_t generation) {
  const Cue &cue = entry.cue;
  if (current_time < cue.getStartTime()) {
    return;
  }

  CueTime end_time = cue.getUntilTime().value_or(std::numeric_limits<CueTime>::max());
  if (prev_time >= end_time) {
    return;
  }

  CueTime interval = *cue.getInterval();
  std::optional<std::uint64_t> max_count = cue.getMaxCount();

  auto found = this->repeat_state.find(cue.getId());
  if (found == this->repeat_state.end()) {
    /* Seeded one interval early so that the first firing lands exactly on the start time. */
    found = this->repeat_state.emplace(cue.getId(), RepeatState{cue.getStartTime() - interval, 0}).first;
  }

  /*
   * Callbacks can reset the state map out from under us, so work on a copy and commit it before every callback rather
   * than holding an iterator across them.
   * */
  RepeatState state = found->second;

  while (landsBy(state.last_fire_time, interval, current_time) && landsBy(state.last_fire_time, interval, end_time)) {
    if (max_count && state.count >= *max_count) {
      break;
    }

    state.last_fire_time += interval;
    state.count++;
    this->repeat_state[cue.getId()] = state;

    this->fireListeners(entry);
    if (this->reset_generation != generation) {
      return;
    }
  }
}

void Scheduler::fireListeners(const ListenerRegistry::Entry &entry) {
  for (auto &l : entry.listeners) {
    if (l->active == false) {
      continue;
    }

    if (l->once) {
      this->registry->remove(l);
    }

    try {
      l->callback();
    } catch (const std::exception &e) {
      logError("Callback for cue %llu at %lld threw: %s", (unsigned long long)entry.cue.getId(),
               (long long)this->virtual_time, e.what());
    } catch (...) {
      logError("Callback for cue %llu at %lld threw something which isn't a std::exception",
               (unsigned long long)entry.cue.getId(), (long long)this->virtual_time);
    }
  }
}

} // namespace cuesheet
