#pragma once

#include "cuesheet/cue.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cuesheet {

using CueCallback = std::function<void()>;

/**
 * One registered callback.
 *
 * Listeners are shared between the registry and any frame snapshot which is currently being dispatched.  Removing a
 * listener clears `active`, which is what stops a snapshot that still holds it from calling it.
 * */
struct Listener {
  Listener(CueId _cue_id, CueCallback _callback, bool _once)
      : cue_id(_cue_id), callback(std::move(_callback)), once(_once) {}

  CueId cue_id;
  CueCallback callback;
  /* Remove before the first invocation. */
  bool once;
  bool active = true;
};

/**
 * The ordered mapping of cues to callbacks owned by a Scheduler.
 *
 * Cues are kept in the order they were first subscribed to, and this is the order in which a frame visits them.  A cue
 * whose last listener went away keeps its slot, so re-subscribing to it doesn't move it to the back, and a repeating cue
 * keeps counting its ticks while nobody listens.  The cost is that entries are only dropped by clear(): a caller which
 * keeps minting new cues grows the registry, and every frame's snapshot, until the scheduler is destroyed.  Listeners for
 * one cue are kept in subscription order.
 * */
class ListenerRegistry {
public:
  struct Entry {
    Cue cue;
    std::vector<std::shared_ptr<Listener>> listeners;
  };

  std::shared_ptr<Listener> add(const Cue &cue, CueCallback callback, bool once);

  /* Idempotent. Listeners which have already been removed are ignored. */
  void remove(const std::shared_ptr<Listener> &listener);

  /**
   * Copy the current entries.  The copy shares Listener objects with the registry, so removals made while a snapshot
   * is being walked are still visible through `Listener::active`.
   * */
  std::vector<Entry> snapshot() const;

  /* Deactivate every listener and forget every cue. */
  void clear();

  std::size_t getCueCount() const { return this->entries.size(); }
  std::size_t getListenerCount(CueId cue) const;

private:
  std::vector<Entry> entries;
  /* Cue id to index in entries. */
  std::unordered_map<CueId, std::size_t> index;
};

/**
 * The handle returned from subscribing.  Calling unsubscribe removes exactly the callback this handle was made for.
 *
 * Handles are cheap to copy; copies refer to the same registration.  unsubscribe is idempotent, and is safe to call
 * after the scheduler which made it has been destroyed or has gone away entirely.  A default-constructed handle refers
 * to nothing.
 * */
class Subscription {
public:
  Subscription() = default;

  void unsubscribe();

  /* True until unsubscribed, until a once subscription fires, or until the scheduler is destroyed. */
  bool isActive() const;

private:
  friend class Scheduler;
  Subscription(const std::shared_ptr<ListenerRegistry> &registry, const std::shared_ptr<Listener> &listener)
      : registry(registry), listener(listener) {}

  std::weak_ptr<ListenerRegistry> registry;
  std::weak_ptr<Listener> listener;
};

} // namespace cuesheet
