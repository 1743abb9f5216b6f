#include "interrupt.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <thread>

namespace issue_harvest {

namespace {

std::atomic<bool> gInterrupted{false};

static_assert(std::atomic<bool>::is_always_lock_free,
              "interrupt flag must be usable from a signal handler");

extern "C" void onInterruptSignal(int) {
    gInterrupted.store(true, std::memory_order_relaxed);
}

constexpr std::chrono::milliseconds kSleepSlice{100};

} // namespace

void installInterruptHandlers() {
    std::signal(SIGINT, onInterruptSignal);
    std::signal(SIGTERM, onInterruptSignal);
}

void requestInterrupt() noexcept {
    gInterrupted.store(true, std::memory_order_relaxed);
}

void clearInterrupt() noexcept {
    gInterrupted.store(false, std::memory_order_relaxed);
}

bool interruptRequested() noexcept {
    return gInterrupted.load(std::memory_order_relaxed);
}

bool sleepInterruptibly(std::chrono::milliseconds duration) {
    const auto deadline = std::chrono::steady_clock::now() + duration;

    while (!interruptRequested()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;

        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - now);
        std::this_thread::sleep_for(std::min(left, kSleepSlice));
    }
    return false;
}

} // namespace issue_harvest
