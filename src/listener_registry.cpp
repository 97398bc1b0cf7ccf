#include "cuesheet/listener_registry.hpp"

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

namespace cuesheet {

std::shared_ptr<Listener> ListenerRegistry::add(const Cue &cue, CueCallback callback, bool once) {
  auto listener = std::make_shared<Listener>(cue.getId(), std::move(callback), once);

  auto found = this->index.find(cue.getId());
  if (found == this->index.end()) {
    this->index.emplace(cue.getId(), this->entries.size());
    this->entries.push_back(Entry{cue, {}});
    this->entries.back().listeners.push_back(listener);
  } else {
    this->entries[found->second].listeners.push_back(listener);
  }

  return listener;
}

void ListenerRegistry::remove(const std::shared_ptr<Listener> &listener) {
  if (listener->active == false) {
    return;
  }
  listener->active = false;

  auto found = this->index.find(listener->cue_id);
  if (found == this->index.end()) {
    return;
  }

  auto &listeners = this->entries[found->second].listeners;
  listeners.erase(std::remove(listeners.begin(), listeners.end(), listener), listeners.end());
}

std::vector<ListenerRegistry::Entry> ListenerRegistry::snapshot() const { return this->entries; }

void ListenerRegistry::clear() {
  for (auto &e : this->entries) {
    for (auto &l : e.listeners) {
      l->active = false;
    }
  }
  this->entries.clear();
  this->index.clear();
}

std::size_t ListenerRegistry::getListenerCount(CueId cue) const {
  auto found = this->index.find(cue);
  if (found == this->index.end()) {
    return 0;
  }
  return this->entries[found->second].listeners.size();
}

void Subscription::unsubscribe() {
  auto l = this->listener.lock();
  if (l == nullptr) {
    return;
  }

  auto r = this->registry.lock();
  if (r == nullptr) {
    /* The scheduler is gone, so nothing can call this listener again. */
    l->active = false;
    return;
  }

  r->remove(l);
}

bool Subscription::isActive() const {
  auto l = this->listener.lock();
  return l != nullptr && l->active;
}

} // namespace cuesheet
