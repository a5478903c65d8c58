#pragma once

#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>

namespace geoupdate {

// Uniform value in [0, max) from OpenSSL's CSPRNG. max <= 0 yields 0.
Result RandomDelayBelow(std::chrono::nanoseconds max, std::chrono::nanoseconds& out);

using SleepFn = std::function<void(std::chrono::nanoseconds)>;

// Pre-run jitter: sleeps for RandomDelayBelow(max). `sleep` defaults to
// std::this_thread::sleep_for.
Result SleepRandomDelay(std::chrono::nanoseconds max, const SleepFn& sleep = {});

} // namespace geoupdate
