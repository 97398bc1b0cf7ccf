#include "cuesheet.h"
#include "cuesheet_constants.h"

#include "cuesheet/c_api.hpp"
#include "cuesheet/c_handles.hpp"
#include "cuesheet/c_objects.hpp"
#include "cuesheet/cue.hpp"

#include <memory>
#include <variant>

using namespace cuesheet;

namespace {

/* The C side can name any stage, so chain misuse has to be caught here rather than by the type system. */
const OneShotCue &expectOneShot(const CCue &c) {
  if (std::holds_alternative<RepeatingCue>(c.stage)) {
    throw EInvariant("Cue is already repeating");
  }
  if (std::holds_alternative<TerminatedCue>(c.stage)) {
    throw EInvariant("Cue is already terminated");
  }
  return std::get<OneShotCue>(c.stage);
}

const RepeatingCue &expectRepeating(const CCue &c) {
  if (std::holds_alternative<OneShotCue>(c.stage)) {
    throw EInvariant("Cue doesn't repeat");
  }
  if (std::holds_alternative<TerminatedCue>(c.stage)) {
    throw EInvariant("Cue is already terminated");
  }
  return std::get<RepeatingCue>(c.stage);
}

} // namespace

CSH_CAPI csh_ErrorCode csh_createCue(csh_Handle *out, csh_Time start_time) {
  CSH_PROLOGUE
  auto c = std::make_shared<CCue>(createCue(start_time));
  *out = toC(c);
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_cueRepeats(csh_Handle *out, csh_Handle cue, csh_Time interval) {
  CSH_PROLOGUE
  auto c = fromC<CCue>(cue);
  auto r = std::make_shared<CCue>(expectOneShot(*c).repeats(interval));
  *out = toC(r);
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_cueTimes(csh_Handle *out, csh_Handle cue, unsigned long long count) {
  CSH_PROLOGUE
  auto c = fromC<CCue>(cue);
  auto t = std::make_shared<CCue>(expectRepeating(*c).times(count));
  *out = toC(t);
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_cueUntil(csh_Handle *out, csh_Handle cue, csh_Handle boundary) {
  CSH_PROLOGUE
  auto c = fromC<CCue>(cue);
  auto b = fromC<CCue>(boundary);
  auto t = std::make_shared<CCue>(expectRepeating(*c).until(b->getCue()));
  *out = toC(t);
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_cueGetKind(int *out, csh_Handle cue) {
  CSH_PROLOGUE
  auto c = fromC<CCue>(cue);
  switch (c->getCue().getKind()) {
  case CueKind::OneShot:
    *out = CSH_CUE_KIND_ONE_SHOT;
    break;
  case CueKind::Repeating:
    *out = CSH_CUE_KIND_REPEATING;
    break;
  case CueKind::Terminated:
    *out = CSH_CUE_KIND_TERMINATED;
    break;
  }
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_cueGetStartTime(csh_Time *out, csh_Handle cue) {
  CSH_PROLOGUE
  auto c = fromC<CCue>(cue);
  *out = c->getCue().getStartTime();
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_cueGetInterval(int *has_value, csh_Time *out, csh_Handle cue) {
  CSH_PROLOGUE
  auto c = fromC<CCue>(cue);
  auto v = c->getCue().getInterval();
  *has_value = v.has_value();
  if (v) {
    *out = *v;
  }
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_cueGetMaxCount(int *has_value, unsigned long long *out, csh_Handle cue) {
  CSH_PROLOGUE
  auto c = fromC<CCue>(cue);
  auto v = c->getCue().getMaxCount();
  *has_value = v.has_value();
  if (v) {
    *out = *v;
  }
  return 0;
  CSH_EPILOGUE
}

CSH_CAPI csh_ErrorCode csh_cueGetUntilTime(int *has_value, csh_Time *out, csh_Handle cue) {
  CSH_PROLOGUE
  auto c = fromC<CCue>(cue);
  auto v = c->getCue().getUntilTime();
  *has_value = v.has_value();
  if (v) {
    *out = *v;
  }
  return 0;
  CSH_EPILOGUE
}
