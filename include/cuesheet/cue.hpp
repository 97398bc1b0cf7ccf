#pragma once

#include <cstdint>
#include <optional>
#include <variant>

namespace cuesheet {

/* Milliseconds on a scheduler's virtual timeline. */
using CueTime = std::int64_t;

/* Opaque identity of a cue. Never 0 for a constructed cue. */
using CueId = std::uint64_t;

enum class CueKind {
  OneShot,
  Repeating,
  Terminated,
};

/* Caps a repeating cue at a total number of firings. */
struct CountTerminator {
  std::uint64_t max_count;
};

/* Caps a repeating cue at a boundary time, inclusive. */
struct BoundaryTerminator {
  CueTime until_time;
};

using Terminator = std::variant<CountTerminator, BoundaryTerminator>;

class RepeatingCue;
class TerminatedCue;

/**
 * An immutable description of when something should happen on a timeline.
 *
 * Cues are compared by identity, not by value: every cue is stamped with a process-wide unique id when it is
 * constructed, and two cues built from the same arguments are different cues.  Copying a cue copies its id, so copies
 * refer to the same cue.  This is what the scheduler's registries key on.
 *
 * Cues are built with a chain which only moves forward:
 *
 * createCue(t) -> OneShotCue -> repeats(i) -> RepeatingCue -> times(n) or until(c) -> TerminatedCue
 *
 * Each stage is its own type and only exposes the operations valid for it, so it isn't possible to repeat a cue twice or
 * terminate it twice.  All stages are usable wherever a Cue is expected; the stage types add no data of their own.
 *
 * Cues hold no mutable state and are safe to share across threads and across schedulers.
 * */
class Cue {
public:
  CueId getId() const { return this->id; }
  CueKind getKind() const;
  CueTime getStartTime() const { return this->start_time; }

  bool isRepeating() const { return this->interval.has_value(); }
  std::optional<CueTime> getInterval() const { return this->interval; }
  std::optional<Terminator> getTerminator() const { return this->terminator; }

  /* Convenience accessors over the terminator. */
  std::optional<std::uint64_t> getMaxCount() const;
  std::optional<CueTime> getUntilTime() const;

  bool operator==(const Cue &other) const { return this->id == other.id; }
  bool operator!=(const Cue &other) const { return this->id != other.id; }

protected:
  Cue(CueTime start_time, std::optional<CueTime> interval, std::optional<Terminator> terminator);

private:
  CueId id;
  CueTime start_time;
  std::optional<CueTime> interval;
  std::optional<Terminator> terminator;
};

/**
 * A cue which fires once per reset cycle.
 * */
class OneShotCue : public Cue {
public:
  /* Throws ERange if interval isn't positive. */
  RepeatingCue repeats(CueTime interval) const;

private:
  friend OneShotCue createCue(CueTime start_time);
  explicit OneShotCue(CueTime start_time);
};

/**
 * A cue which fires every interval starting at its start time, forever.
 * */
class RepeatingCue : public Cue {
public:
  /* Cap at n total firings. Throws ERange if n is 0. */
  TerminatedCue times(std::uint64_t n) const;
  /* Cap at the start time of boundary, inclusive. The time is captured now. */
  TerminatedCue until(const Cue &boundary) const;

private:
  friend class OneShotCue;
  RepeatingCue(CueTime start_time, CueTime interval);
};

/**
 * A repeating cue with exactly one terminator.  Can't be chained further.
 * */
class TerminatedCue : public Cue {
private:
  friend class RepeatingCue;
  TerminatedCue(CueTime start_time, CueTime interval, Terminator terminator);
};

/* Create a one-shot cue. Throws ERange if start_time is negative. */
OneShotCue createCue(CueTime start_time);

} // namespace cuesheet
