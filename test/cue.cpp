#include "cuesheet/cue.hpp"
#include "cuesheet/error.hpp"

#include <catch2/catch_all.hpp>

#include <cstdint>
#include <variant>

using namespace cuesheet;

TEST_CASE("One-shot cues") {
  auto c = createCue(500);

  REQUIRE(c.getStartTime() == 500);
  REQUIRE(c.getKind() == CueKind::OneShot);
  REQUIRE_FALSE(c.isRepeating());
  REQUIRE_FALSE(c.getInterval());
  REQUIRE_FALSE(c.getMaxCount());
  REQUIRE_FALSE(c.getUntilTime());
  REQUIRE_FALSE(c.getTerminator());

  SECTION("zero is a valid start time") { REQUIRE(createCue(0).getStartTime() == 0); }

  SECTION("negative start times are rejected") { REQUIRE_THROWS_AS(createCue(-1), ERange); }
}

TEST_CASE("Cues are compared by identity") {
  auto a = createCue(500);
  auto b = createCue(500);

  REQUIRE(a.getId() != 0);
  REQUIRE(a != b);
  REQUIRE(a.getId() != b.getId());

  Cue copy = a;
  REQUIRE(copy == a);
  REQUIRE(copy.getId() == a.getId());

  /* Every stage of the chain is a new cue. */
  auto r = a.repeats(100);
  auto t = r.times(2);
  REQUIRE(r != a);
  REQUIRE(t != r);
}

TEST_CASE("Repeating cues") {
  auto c = createCue(1000).repeats(500);

  REQUIRE(c.getStartTime() == 1000);
  REQUIRE(c.getKind() == CueKind::Repeating);
  REQUIRE(c.isRepeating());
  REQUIRE(c.getInterval() == 500);
  REQUIRE_FALSE(c.getTerminator());

  SECTION("intervals must be positive") {
    REQUIRE_THROWS_AS(createCue(0).repeats(0), ERange);
    REQUIRE_THROWS_AS(createCue(0).repeats(-5), ERange);
  }
}

TEST_CASE("Terminated cues") {
  SECTION("times") {
    auto c = createCue(0).repeats(200).times(10);
    REQUIRE(c.getKind() == CueKind::Terminated);
    REQUIRE(c.getInterval() == 200);
    REQUIRE(c.getMaxCount() == 10u);
    REQUIRE_FALSE(c.getUntilTime());

    auto term = c.getTerminator();
    REQUIRE(term);
    REQUIRE(std::holds_alternative<CountTerminator>(*term));
  }

  SECTION("times must allow at least one firing") { REQUIRE_THROWS_AS(createCue(0).repeats(200).times(0), ERange); }

  SECTION("until captures the boundary's start time") {
    auto end = createCue(5000);
    auto c = createCue(1000).repeats(500).until(end);
    REQUIRE(c.getKind() == CueKind::Terminated);
    REQUIRE(c.getInterval() == 500);
    REQUIRE(c.getUntilTime() == 5000);
    REQUIRE_FALSE(c.getMaxCount());

    auto term = c.getTerminator();
    REQUIRE(term);
    REQUIRE(std::get<BoundaryTerminator>(*term).until_time == 5000);
  }

  SECTION("until accepts any stage as the boundary") {
    auto boundary = createCue(700).repeats(10).times(3);
    auto c = createCue(0).repeats(100).until(boundary);
    REQUIRE(c.getUntilTime() == 700);
  }
}
