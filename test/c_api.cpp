/**
 * Exercise the C API: handles, error reporting, and driving a scheduler through C.
 * */
#include "cuesheet.h"
#include "cuesheet_constants.h"

#include "cuesheet/c_api.hpp"
#include "cuesheet/logging.hpp"

#include <catch2/catch_all.hpp>

#include <string>

static void countingCallback(void *userdata) { (*static_cast<int *>(userdata))++; }

TEST_CASE("Cue chains through the C API") {
  csh_Handle cue, repeating, terminated, boundary, bounded;
  int kind, has_value;
  csh_Time time;
  unsigned long long count;

  REQUIRE_FALSE(csh_createCue(&cue, 100));
  REQUIRE_FALSE(csh_cueGetKind(&kind, cue));
  REQUIRE(kind == CSH_CUE_KIND_ONE_SHOT);
  REQUIRE_FALSE(csh_cueGetStartTime(&time, cue));
  REQUIRE(time == 100);
  REQUIRE_FALSE(csh_cueGetInterval(&has_value, &time, cue));
  REQUIRE(has_value == 0);

  REQUIRE_FALSE(csh_cueRepeats(&repeating, cue, 50));
  REQUIRE_FALSE(csh_cueGetKind(&kind, repeating));
  REQUIRE(kind == CSH_CUE_KIND_REPEATING);
  REQUIRE_FALSE(csh_cueGetInterval(&has_value, &time, repeating));
  REQUIRE(has_value == 1);
  REQUIRE(time == 50);

  REQUIRE_FALSE(csh_cueTimes(&terminated, repeating, 4));
  REQUIRE_FALSE(csh_cueGetMaxCount(&has_value, &count, terminated));
  REQUIRE(has_value == 1);
  REQUIRE(count == 4);
  REQUIRE_FALSE(csh_cueGetUntilTime(&has_value, &time, terminated));
  REQUIRE(has_value == 0);

  REQUIRE_FALSE(csh_createCue(&boundary, 900));
  REQUIRE_FALSE(csh_cueUntil(&bounded, repeating, boundary));
  REQUIRE_FALSE(csh_cueGetUntilTime(&has_value, &time, bounded));
  REQUIRE(has_value == 1);
  REQUIRE(time == 900);

  SECTION("chain misuse is reported") {
    csh_Handle ignored;
    REQUIRE(csh_cueRepeats(&ignored, repeating, 10) == CSH_ERROR_INVARIANT);
    REQUIRE(csh_getLastErrorCode() == CSH_ERROR_INVARIANT);
    REQUIRE(std::string(csh_getLastErrorMessage()) == "Cue is already repeating");

    REQUIRE(csh_cueRepeats(&ignored, terminated, 10) == CSH_ERROR_INVARIANT);
    REQUIRE(std::string(csh_getLastErrorMessage()) == "Cue is already terminated");
    REQUIRE(csh_cueTimes(&ignored, terminated, 2) == CSH_ERROR_INVARIANT);
    REQUIRE(csh_cueUntil(&ignored, bounded, boundary) == CSH_ERROR_INVARIANT);
    REQUIRE(csh_cueTimes(&ignored, cue, 2) == CSH_ERROR_INVARIANT);
  }

  SECTION("invalid values are reported") {
    csh_Handle ignored;
    REQUIRE(csh_createCue(&ignored, -5) == CSH_ERROR_RANGE);
    REQUIRE(csh_cueRepeats(&ignored, cue, 0) == CSH_ERROR_RANGE);
    REQUIRE(csh_cueTimes(&ignored, repeating, 0) == CSH_ERROR_RANGE);
  }

  REQUIRE_FALSE(csh_handleDecRef(cue));
  REQUIRE_FALSE(csh_handleDecRef(repeating));
  REQUIRE_FALSE(csh_handleDecRef(terminated));
  REQUIRE_FALSE(csh_handleDecRef(boundary));
  REQUIRE_FALSE(csh_handleDecRef(bounded));
}

TEST_CASE("Driving a scheduler through the C API") {
  csh_Handle scheduler, cue, tick, sub, once_sub;
  int fired = 0, once_fired = 0, active, playing;
  csh_Time time;

  REQUIRE_FALSE(csh_createScheduler(&scheduler));
  REQUIRE_FALSE(csh_createCue(&cue, 0));
  REQUIRE_FALSE(csh_cueRepeats(&tick, cue, 100));

  REQUIRE_FALSE(csh_schedulerSubscribe(&sub, scheduler, tick, countingCallback, &fired));
  REQUIRE_FALSE(csh_schedulerSubscribeOnce(&once_sub, scheduler, tick, countingCallback, &once_fired));

  REQUIRE_FALSE(csh_schedulerIsPlaying(&playing, scheduler));
  REQUIRE(playing == 0);
  REQUIRE_FALSE(csh_schedulerPlay(scheduler));
  REQUIRE_FALSE(csh_schedulerAdvance(scheduler, 450));
  REQUIRE(fired == 5);
  REQUIRE(once_fired == 1);

  REQUIRE_FALSE(csh_subscriptionIsActive(&active, once_sub));
  REQUIRE(active == 0);

  REQUIRE_FALSE(csh_schedulerSeek(scheduler, 0));
  REQUIRE_FALSE(csh_schedulerGetTime(&time, scheduler));
  REQUIRE(time == 0);

  REQUIRE_FALSE(csh_subscriptionCancel(sub));
  REQUIRE_FALSE(csh_subscriptionCancel(sub));
  REQUIRE_FALSE(csh_schedulerDriverTick(scheduler, 1000));
  REQUIRE_FALSE(csh_schedulerDriverTick(scheduler, 1300));
  REQUIRE_FALSE(csh_schedulerGetTime(&time, scheduler));
  REQUIRE(time == 300);
  REQUIRE(fired == 5);

  REQUIRE_FALSE(csh_schedulerPause(scheduler));
  REQUIRE_FALSE(csh_schedulerDestroy(scheduler));
  REQUIRE(csh_schedulerPlay(scheduler) == CSH_ERROR_DESTROYED);

  REQUIRE_FALSE(csh_handleDecRef(sub));
  REQUIRE_FALSE(csh_handleDecRef(once_sub));
  REQUIRE_FALSE(csh_handleDecRef(tick));
  REQUIRE_FALSE(csh_handleDecRef(cue));
  REQUIRE_FALSE(csh_handleDecRef(scheduler));
}

TEST_CASE("Handle management") {
  csh_Handle cue, scheduler;
  int type;

  REQUIRE_FALSE(csh_createCue(&cue, 10));
  REQUIRE_FALSE(csh_createScheduler(&scheduler));

  REQUIRE_FALSE(csh_handleGetObjectType(&type, cue));
  REQUIRE(type == CSH_OTYPE_CUE);
  REQUIRE_FALSE(csh_handleGetObjectType(&type, scheduler));
  REQUIRE(type == CSH_OTYPE_SCHEDULER);

  SECTION("wrong handle types are rejected") {
    csh_Handle ignored;
    REQUIRE(csh_schedulerPlay(cue) == CSH_ERROR_HANDLE_TYPE);
    REQUIRE(csh_schedulerSubscribe(&ignored, cue, scheduler, countingCallback, nullptr) == CSH_ERROR_HANDLE_TYPE);
  }

  SECTION("null callbacks are rejected") {
    csh_Handle ignored;
    REQUIRE(csh_schedulerSubscribe(&ignored, scheduler, cue, nullptr, nullptr) == CSH_ERROR_RANGE);
  }

  SECTION("double increments and decrements") {
    REQUIRE_FALSE(csh_handleIncRef(cue));
    REQUIRE_FALSE(csh_handleDecRef(cue));
    REQUIRE_FALSE(csh_handleGetObjectType(&type, cue));
    REQUIRE_FALSE(csh_handleIncRef(cue));
    REQUIRE_FALSE(csh_handleDecRef(cue));
  }

  REQUIRE_FALSE(csh_handleDecRef(cue));
  REQUIRE_FALSE(csh_handleDecRef(scheduler));

  SECTION("freed handles are invalid") {
    REQUIRE(csh_handleGetObjectType(&type, cue) == CSH_ERROR_INVALID_HANDLE);
    REQUIRE(csh_handleDecRef(cue) == CSH_ERROR_INVALID_HANDLE);
  }

  REQUIRE_FALSE(csh_handleDecRef(0));
}

TEST_CASE("Library lifecycle") {
  unsigned int major, minor, patch;
  csh_getVersion(&major, &minor, &patch);
  REQUIRE(major == 0);
  REQUIRE(minor == 3);
  REQUIRE(patch == 0);

  /* main() already initialized the library. */
  REQUIRE(csh_initialize() == CSH_ERROR_GENERIC);

  struct csh_LibraryConfig cfg;
  csh_libraryConfigSetDefaults(&cfg);
  cfg.logging_backend = 42;
  REQUIRE(csh_initializeWithConfig(&cfg) == CSH_ERROR_RANGE);
}

TEST_CASE("Anything thrown inside a C call becomes an error code") {
  auto code = cuesheet::cWrapper([]() -> csh_ErrorCode { throw 42; });
  REQUIRE(code == CSH_ERROR_GENERIC);
  REQUIRE(csh_getLastErrorCode() == CSH_ERROR_GENERIC);
  REQUIRE(std::string(csh_getLastErrorMessage()) == "Unknown error");
}

TEST_CASE("Changing the log level at runtime") {
  csh_setLogLevel(CSH_LOG_LEVEL_DEBUG);
  REQUIRE(cuesheet::getLogLevel() == CSH_LOG_LEVEL_DEBUG);
  csh_setLogLevel(CSH_LOG_LEVEL_WARN);
  REQUIRE(cuesheet::getLogLevel() == CSH_LOG_LEVEL_WARN);
}
