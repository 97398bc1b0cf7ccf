/**
 * A countdown: 3, 2, 1, GO, a few pulses, then finish.
 *
 * The library has no clock of its own, so this example is the driver: it samples a steady clock every frame and hands
 * it to csh_schedulerDriverTick.  Halfway through it pauses for a second to show that paused time doesn't leak into the
 * timeline, and at the end it rewinds and plays the countdown part again.
 *
 * Uses C++ because MSVC doesn't support threads.h and we need to sleep.
 * */
#include "example_common.h"

#include "cuesheet.h"
#include "cuesheet/config.hpp"

#include <chrono>
#include <thread>

#include <stdio.h>

struct Label {
  const char *text;
};

static void printLabel(void *userdata) {
  auto *label = static_cast<Label *>(userdata);
  printf("%s\n", label->text);
  fflush(stdout);
}

static void signalDone(void *userdata) { *static_cast<bool *>(userdata) = true; }

static csh_Time wallNow() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

static void runUntil(csh_Handle scheduler, bool *done) {
  while (*done == false) {
    CHECKED(csh_schedulerDriverTick(scheduler, wallNow()));
    std::this_thread::sleep_for(std::chrono::milliseconds(cuesheet::config::DEFAULT_DRIVER_STEP_MS));
  }
}

int main() {
  struct csh_LibraryConfig library_config;
  csh_Handle scheduler = 0, three = 0, two = 0, one = 0, go = 0, pulse_start = 0, pulse_repeating = 0, pulse = 0,
             pause_point = 0, finish = 0;
  csh_Handle subs[9] = {0};
  Label l_three{"3"}, l_two{"2"}, l_one{"1"}, l_go{"GO!"}, l_pulse{"  pulse"}, l_finish{"FINISH"};
  bool paused = false, finished = false;

  csh_libraryConfigSetDefaults(&library_config);
  library_config.log_level = CSH_LOG_LEVEL_DEBUG;
  library_config.logging_backend = CSH_LOGGING_BACKEND_STDERR;
  CHECKED(csh_initializeWithConfig(&library_config));

  CHECKED(csh_createCue(&three, 1000));
  CHECKED(csh_createCue(&two, 2000));
  CHECKED(csh_createCue(&one, 3000));
  CHECKED(csh_createCue(&go, 4000));
  CHECKED(csh_createCue(&pulse_start, 4500));
  CHECKED(csh_cueRepeats(&pulse_repeating, pulse_start, 500));
  CHECKED(csh_cueTimes(&pulse, pulse_repeating, 5));
  CHECKED(csh_createCue(&pause_point, 5200));
  CHECKED(csh_createCue(&finish, 7000));

  CHECKED(csh_createScheduler(&scheduler));
  CHECKED(csh_schedulerSubscribe(&subs[0], scheduler, three, printLabel, &l_three));
  CHECKED(csh_schedulerSubscribe(&subs[1], scheduler, two, printLabel, &l_two));
  CHECKED(csh_schedulerSubscribe(&subs[2], scheduler, one, printLabel, &l_one));
  CHECKED(csh_schedulerSubscribe(&subs[3], scheduler, go, printLabel, &l_go));
  CHECKED(csh_schedulerSubscribe(&subs[4], scheduler, pulse, printLabel, &l_pulse));
  CHECKED(csh_schedulerSubscribeOnce(&subs[5], scheduler, pause_point, signalDone, &paused));
  CHECKED(csh_schedulerSubscribe(&subs[6], scheduler, finish, printLabel, &l_finish));

  CHECKED(csh_schedulerPlay(scheduler));
  runUntil(scheduler, &paused);

  printf("(paused for a second)\n");
  CHECKED(csh_schedulerPause(scheduler));
  std::this_thread::sleep_for(std::chrono::seconds(1));
  CHECKED(csh_schedulerPlay(scheduler));

  CHECKED(csh_schedulerSubscribeOnce(&subs[7], scheduler, finish, signalDone, &finished));
  runUntil(scheduler, &finished);

  printf("(rewinding to 500)\n");
  finished = false;
  CHECKED(csh_schedulerSeek(scheduler, 500));
  CHECKED(csh_subscriptionCancel(subs[4]));
  CHECKED(csh_schedulerSubscribeOnce(&subs[8], scheduler, go, signalDone, &finished));
  runUntil(scheduler, &finished);

  CHECKED(csh_schedulerDestroy(scheduler));
  csh_shutdown();
  return 0;
}
