#pragma once

#ifdef __cplusplus
extern "C" {
#endif

/* Inject DLL attributes etc here. */
#ifdef _WIN32
#ifdef CUESHEET_SHARED
#ifdef BUILDING_CUESHEET
#define CSH_CAPI __declspec(dllexport)
#else
#define CSH_CAPI __declspec(dllimport)
#endif
#endif
#endif
#ifndef CSH_CAPI
#define CSH_CAPI
#endif

/*
 * Note to maintainers: C API methods that obviously go with a type live in src/c_api/ next to the other functions for
 * that type.
 *
 * Other methods (initialization, errors, handle reference counting) are in src/c_api.cpp.
 * */

CSH_CAPI void csh_getVersion(unsigned int *major, unsigned int *minor, unsigned int *patch);

typedef unsigned long long csh_Handle;
typedef int csh_ErrorCode;

/* All times are integer milliseconds on the scheduler's virtual timeline. */
typedef long long csh_Time;

enum CSH_ERRORS {
  CSH_ERROR_GENERIC = 1,
  CSH_ERROR_UNINITIALIZED = 2,
  CSH_ERROR_INVALID_HANDLE = 3,
  CSH_ERROR_HANDLE_TYPE = 4,
  CSH_ERROR_RANGE = 5,
  CSH_ERROR_INVARIANT = 6,
  CSH_ERROR_DESTROYED = 7,
};

enum CSH_LOGGING_BACKEND {
  CSH_LOGGING_BACKEND_NONE,
  CSH_LOGGING_BACKEND_STDERR,
};

enum CSH_LOG_LEVEL {
  CSH_LOG_LEVEL_ERROR = 0,
  CSH_LOG_LEVEL_WARN = 10,
  CSH_LOG_LEVEL_INFO = 20,
  CSH_LOG_LEVEL_DEBUG = 30,
};

struct csh_LibraryConfig {
  unsigned int log_level;
  unsigned int logging_backend;
};

CSH_CAPI void csh_libraryConfigSetDefaults(struct csh_LibraryConfig *config);

CSH_CAPI csh_ErrorCode csh_initialize(void);
CSH_CAPI csh_ErrorCode csh_initializeWithConfig(const struct csh_LibraryConfig *config);
CSH_CAPI csh_ErrorCode csh_shutdown(void);

CSH_CAPI csh_ErrorCode csh_getLastErrorCode(void);
CSH_CAPI const char *csh_getLastErrorMessage(void);

CSH_CAPI void csh_setLogLevel(enum CSH_LOG_LEVEL level);

CSH_CAPI csh_ErrorCode csh_handleIncRef(csh_Handle handle);
CSH_CAPI csh_ErrorCode csh_handleDecRef(csh_Handle handle);
CSH_CAPI csh_ErrorCode csh_handleGetObjectType(int *out, csh_Handle handle);

/*
 * Cues.
 *
 * Cues are immutable.  Every chain operation returns a new handle and leaves the input alone.  A cue moves through
 * one-shot -> repeating -> terminated, and calling a chain operation on a cue which is already past that stage is an
 * error.
 * */
CSH_CAPI csh_ErrorCode csh_createCue(csh_Handle *out, csh_Time start_time);
CSH_CAPI csh_ErrorCode csh_cueRepeats(csh_Handle *out, csh_Handle cue, csh_Time interval);
CSH_CAPI csh_ErrorCode csh_cueTimes(csh_Handle *out, csh_Handle cue, unsigned long long count);
CSH_CAPI csh_ErrorCode csh_cueUntil(csh_Handle *out, csh_Handle cue, csh_Handle boundary);

CSH_CAPI csh_ErrorCode csh_cueGetKind(int *out, csh_Handle cue);
CSH_CAPI csh_ErrorCode csh_cueGetStartTime(csh_Time *out, csh_Handle cue);
/* The optional getters write 0 to has_value and leave out alone when the cue doesn't carry the field. */
CSH_CAPI csh_ErrorCode csh_cueGetInterval(int *has_value, csh_Time *out, csh_Handle cue);
CSH_CAPI csh_ErrorCode csh_cueGetMaxCount(int *has_value, unsigned long long *out, csh_Handle cue);
CSH_CAPI csh_ErrorCode csh_cueGetUntilTime(int *has_value, csh_Time *out, csh_Handle cue);

/*
 * Schedulers.
 *
 * Callbacks are invoked synchronously from inside csh_schedulerAdvance or csh_schedulerDriverTick, on the calling
 * thread.
 * */
typedef void csh_CueCallback(void *userdata);

CSH_CAPI csh_ErrorCode csh_createScheduler(csh_Handle *out);
CSH_CAPI csh_ErrorCode csh_schedulerSubscribe(csh_Handle *out_subscription, csh_Handle scheduler, csh_Handle cue,
                                              csh_CueCallback *callback, void *userdata);
CSH_CAPI csh_ErrorCode csh_schedulerSubscribeOnce(csh_Handle *out_subscription, csh_Handle scheduler, csh_Handle cue,
                                                  csh_CueCallback *callback, void *userdata);
CSH_CAPI csh_ErrorCode csh_schedulerPlay(csh_Handle scheduler);
CSH_CAPI csh_ErrorCode csh_schedulerPause(csh_Handle scheduler);
CSH_CAPI csh_ErrorCode csh_schedulerSeek(csh_Handle scheduler, csh_Time time);
CSH_CAPI csh_ErrorCode csh_schedulerAdvance(csh_Handle scheduler, csh_Time time);
CSH_CAPI csh_ErrorCode csh_schedulerDriverTick(csh_Handle scheduler, csh_Time wall_time);
CSH_CAPI csh_ErrorCode csh_schedulerGetTime(csh_Time *out, csh_Handle scheduler);
CSH_CAPI csh_ErrorCode csh_schedulerIsPlaying(int *out, csh_Handle scheduler);
CSH_CAPI csh_ErrorCode csh_schedulerDestroy(csh_Handle scheduler);

CSH_CAPI csh_ErrorCode csh_subscriptionCancel(csh_Handle subscription);
CSH_CAPI csh_ErrorCode csh_subscriptionIsActive(int *out, csh_Handle subscription);

#ifdef __cplusplus
}
#endif
