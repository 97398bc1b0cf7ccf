#include "cuesheet/cue.hpp"

#include "cuesheet/error.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <variant>

namespace cuesheet {

static std::atomic<CueId> next_cue_id{1};

Cue::Cue(CueTime _start_time, std::optional<CueTime> _interval, std::optional<Terminator> _terminator)
    : id(next_cue_id.fetch_add(1, std::memory_order_relaxed)), start_time(_start_time), interval(_interval),
      terminator(_terminator) {}

CueKind Cue::getKind() const {
  if (this->terminator) {
    return CueKind::Terminated;
  }
  if (this->interval) {
    return CueKind::Repeating;
  }
  return CueKind::OneShot;
}

std::optional<std::uint64_t> Cue::getMaxCount() const {
  if (this->terminator) {
    if (auto *c = std::get_if<CountTerminator>(&*this->terminator)) {
      return c->max_count;
    }
  }
  return std::nullopt;
}

std::optional<CueTime> Cue::getUntilTime() const {
  if (this->terminator) {
    if (auto *b = std::get_if<BoundaryTerminator>(&*this->terminator)) {
      return b->until_time;
    }
  }
  return std::nullopt;
}

OneShotCue::OneShotCue(CueTime start_time) : Cue(start_time, std::nullopt, std::nullopt) {}

RepeatingCue OneShotCue::repeats(CueTime interval) const {
  if (interval <= 0) {
    throw ERange("Cue interval must be positive");
  }
  return RepeatingCue(this->getStartTime(), interval);
}

RepeatingCue::RepeatingCue(CueTime start_time, CueTime interval) : Cue(start_time, interval, std::nullopt) {}

TerminatedCue RepeatingCue::times(std::uint64_t n) const {
  if (n == 0) {
    throw ERange("A repeating cue must be allowed to fire at least once");
  }
  return TerminatedCue(this->getStartTime(), *this->getInterval(), CountTerminator{n});
}

TerminatedCue RepeatingCue::until(const Cue &boundary) const {
  return TerminatedCue(this->getStartTime(), *this->getInterval(), BoundaryTerminator{boundary.getStartTime()});
}

TerminatedCue::TerminatedCue(CueTime start_time, CueTime interval, Terminator terminator)
    : Cue(start_time, interval, terminator) {}

OneShotCue createCue(CueTime start_time) {
  if (start_time < 0) {
    throw ERange("Cue start time must not be negative");
  }
  return OneShotCue(start_time);
}

} // namespace cuesheet
