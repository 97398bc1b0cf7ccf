#include "cuesheet.h"

#include "cuesheet/c_api.hpp"
#include "cuesheet/c_handles.hpp"
#include "cuesheet/c_objects.hpp"
#include "cuesheet/scheduler.hpp"

#include <memory>

using namespace cuesheet;

namespace {

CueCallback wrapCCallback(csh_CueCallback *callback, void *userdata) {
  if (callback == nullptr) {
    throw ERange("Callback must not be NULL");
  }
  return [callback, userdata]() { callback(userdata); };
}

} // namespace

CSH_CAPI csh_ErrorCode csh_createScheduler(csh_Handle *out) {
  CSH_PROLOGUE
  auto s = std::make_shared<CScheduler>();
  *out = toC(s);
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_schedulerSubscribe(csh_Handle *out_subscription, csh_Handle scheduler, csh_Handle cue,
                                              csh_CueCallback *callback, void *userdata) {
  CSH_PROLOGUE
  auto s = fromC<CScheduler>(scheduler);
  auto c = fromC<CCue>(cue);
  auto sub = s->scheduler.subscribe(c->getCue(), wrapCCallback(callback, userdata));
  *out_subscription = toC(std::make_shared<CSubscription>(sub));
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_schedulerSubscribeOnce(csh_Handle *out_subscription, csh_Handle scheduler, csh_Handle cue,
                                                  csh_CueCallback *callback, void *userdata) {
  CSH_PROLOGUE
  auto s = fromC<CScheduler>(scheduler);
  auto c = fromC<CCue>(cue);
  auto sub = s->scheduler.subscribeOnce(c->getCue(), wrapCCallback(callback, userdata));
  *out_subscription = toC(std::make_shared<CSubscription>(sub));
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_schedulerPlay(csh_Handle scheduler) {
  CSH_PROLOGUE
  fromC<CScheduler>(scheduler)->scheduler.play();
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_schedulerPause(csh_Handle scheduler) {
  CSH_PROLOGUE
  fromC<CScheduler>(scheduler)->scheduler.pause();
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_schedulerSeek(csh_Handle scheduler, csh_Time time) {
  CSH_PROLOGUE
  fromC<CScheduler>(scheduler)->scheduler.seek(time);
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_schedulerAdvance(csh_Handle scheduler, csh_Time time) {
  CSH_PROLOGUE
  /* Hold a strong reference: callbacks may drop the handle while we're inside. */
  auto s = fromC<CScheduler>(scheduler);
  s->scheduler.advance(time);
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_schedulerDriverTick(csh_Handle scheduler, csh_Time wall_time) {
  CSH_PROLOGUE
  auto s = fromC<CScheduler>(scheduler);
  s->scheduler.driverTick(wall_time);
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_schedulerGetTime(csh_Time *out, csh_Handle scheduler) {
  CSH_PROLOGUE
  *out = fromC<CScheduler>(scheduler)->scheduler.getTime();
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_schedulerIsPlaying(int *out, csh_Handle scheduler) {
  CSH_PROLOGUE
  *out = fromC<CScheduler>(scheduler)->scheduler.isPlaying();
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_schedulerDestroy(csh_Handle scheduler) {
  CSH_PROLOGUE
  fromC<CScheduler>(scheduler)->scheduler.destroy();
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_subscriptionCancel(csh_Handle subscription) {
  CSH_PROLOGUE
  fromC<CSubscription>(subscription)->subscription.unsubscribe();
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_subscriptionIsActive(int *out, csh_Handle subscription) {
  CSH_PROLOGUE
  *out = fromC<CSubscription>(subscription)->subscription.isActive();
  return 0;
  CSH_EPILOGUE
}
