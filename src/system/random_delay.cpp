#include "system/random_delay.hpp"

#include "util/duration.hpp"
#include "util/logger.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <limits>
#include <thread>

namespace geoupdate {

namespace {

Result RandomU64(std::uint64_t& out) {
    unsigned char buf[sizeof(std::uint64_t)];
    if (RAND_bytes(buf, static_cast<int>(sizeof(buf))) != 1) {
        char err[256]{};
        ERR_error_string_n(ERR_get_error(), err, sizeof(err));
        return Result::Fail(-1, std::string("RAND_bytes failed: ") + err);
    }
    out = 0;
    for (unsigned char b : buf) {
        out = (out << 8) | b;
    }
    return Result::Ok();
}

} // namespace

Result RandomDelayBelow(std::chrono::nanoseconds max, std::chrono::nanoseconds& out) {
    out = std::chrono::nanoseconds(0);
    if (max.count() <= 0) return Result::Ok();

    const auto bound = static_cast<std::uint64_t>(max.count());
    // Reject the tail of the 64-bit range that would bias the modulo.
    const std::uint64_t limit =
        std::numeric_limits<std::uint64_t>::max() - (std::numeric_limits<std::uint64_t>::max() % bound);

    std::uint64_t v = 0;
    do {
        auto r = RandomU64(v);
        if (!r.is_ok()) return r;
    } while (v >= limit);

    out = std::chrono::nanoseconds(static_cast<std::int64_t>(v % bound));
    return Result::Ok();
}

Result SleepRandomDelay(std::chrono::nanoseconds max, const SleepFn& sleep) {
    std::chrono::nanoseconds delay{};
    auto r = RandomDelayBelow(max, delay);
    if (!r.is_ok()) return r;

    LogInfo("Waiting for %s of %s", FormatDuration(delay).c_str(), FormatDuration(max).c_str());
    if (sleep) {
        sleep(delay);
    } else {
        std::this_thread::sleep_for(delay);
    }
    return Result::Ok();
}

} // namespace geoupdate
