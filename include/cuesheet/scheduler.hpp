#pragma once

#include "cuesheet/cue.hpp"
#include "cuesheet/listener_registry.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace cuesheet {

/**
 * Fires callbacks for cues as a virtual clock moves forward.
 *
 * The scheduler has no timing source of its own.  Something outside it (a frame loop, a timer, a test) calls `advance`
 * with the new virtual time, or `driverTick` with a wall-clock sample, and every cue which came due in between fires
 * synchronously before the call returns.
 *
 * Usage is like:
 *
 * - Build cues with createCue and the chain methods.
 * - subscribe() callbacks to them.
 * - play(), then drive time forward.
 *
 * Resolution works over the half-open span (previous time, new time].  Repeating cues catch up: a large jump fires
 * every tick that fell inside it, in order, rather than just the latest one.  Seeking is different: seeking forward is a
 * silent relocation which fires nothing, and seeking backward resets all firing state so that the timeline can be played
 * through again.
 *
 * Per-cue firing state is owned here and keyed by cue identity, so using one cue with two schedulers gives two
 * independent sets of firings.
 *
 * Not threadsafe.  One driver owns a scheduler.
 * */
class Scheduler {
public:
  Scheduler();
  /* Listener registries are never shared between schedulers. */
  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  Subscription subscribe(const Cue &cue, CueCallback callback);
  /* The callback is removed immediately before it is first called. */
  Subscription subscribeOnce(const Cue &cue, CueCallback callback);

  /* Idempotent.  Neither moves time. */
  void play();
  void pause();

  void seek(CueTime time);

  /**
   * Move the virtual clock to `time` and fire everything which came due.  Does nothing while paused.
   *
   * Time must not go backward while playing; use seek for that.
   * */
  void advance(CueTime time);

  /**
   * Advance by the wall-clock delta since the last driver tick.  The first tick after play() only records the
   * baseline, so time spent paused never leaks into the timeline.
   * */
  void driverTick(CueTime wall_time);

  CueTime getTime() const;
  bool isPlaying() const;

  /**
   * Stop playing and drop every listener and all firing state.  Everything but destroy throws EDestroyed afterward.
   * */
  void destroy();
  bool isDestroyed() const { return this->destroyed; }

  /* Fire counts, mostly for tests and debugging. */
  std::uint64_t getFireCount(const Cue &cue) const;
  bool hasFired(const Cue &cue) const;

private:
  struct RepeatState {
    CueTime last_fire_time;
    std::uint64_t count;
  };

  void checkAlive() const;
  void resetFiringState();
  void processCues(CueTime prev_time, CueTime current_time);
  void processOneShotCue(const ListenerRegistry::Entry &entry, CueTime prev_time, CueTime current_time);
  void processRepeatingCue(const ListenerRegistry::Entry &entry, CueTime prev_time, CueTime current_time,
                           std::uint64_t generation);
  void fireListeners(const ListenerRegistry::Entry &entry);

  CueTime virtual_time = 0;
  bool playing = false;
  bool destroyed = false;
  std::optional<CueTime> last_driver_tick = std::nullopt;

  /* Shared so that Subscription handles can outlive us. */
  std::shared_ptr<ListenerRegistry> registry;
  std::unordered_set<CueId> fired_one_shots;
  std::unordered_map<CueId, RepeatState> repeat_state;

  /* Incremented whenever firing state is reset, so that a frame can tell that a callback reset the timeline. */
  std::uint64_t reset_generation = 0;
};

} // namespace cuesheet
