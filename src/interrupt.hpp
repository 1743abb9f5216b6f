#pragma once

#include <chrono>

namespace issue_harvest {

/// Process-wide "stop requested" flag.  Set from a signal handler (SIGINT,
/// SIGTERM) and polled by the fetch loop and by every deliberate sleep.

/// Install handlers for SIGINT and SIGTERM that call requestInterrupt().
void installInterruptHandlers();

void requestInterrupt() noexcept;
void clearInterrupt() noexcept;
bool interruptRequested() noexcept;

/// Sleep for @p duration in short slices, waking early on interrupt.
/// Returns false if the sleep was cut short.
bool sleepInterruptibly(std::chrono::milliseconds duration);

} // namespace issue_harvest
