#pragma once

#include <cstddef>
#include <cstdint>

namespace cuesheet {

/* Usage, from inside the cuesheet namespace, is config::THING. */
namespace config {

const unsigned int VERSION_MAJOR = 0;
const unsigned int VERSION_MINOR = 3;
const unsigned int VERSION_PATCH = 0;

/*
 * Step, in milliseconds, that wall-clock drivers should use between calls to Scheduler::driverTick.
 *
 * 16ms is roughly one frame at 60 FPS.  The scheduler itself doesn't care: catch-up firing makes any step correct, this
 * only controls how late a cue can be observed.
 * */
const std::int64_t DEFAULT_DRIVER_STEP_MS = 16;

/*
 * Longest log message, in bytes, before truncation.
 * */
const std::size_t MAX_LOG_MESSAGE_LENGTH = 1025;

} // namespace config
} // namespace cuesheet
