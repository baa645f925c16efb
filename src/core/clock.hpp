#pragma once

#include "core/core_export.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

namespace cipherledger::core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Source of the current time for expiry checks
 *
 * Expiry is evaluated lazily against whatever the source reports at
 * query time; nothing is scheduled.
 */
class CIPHERLEDGER_CORE_EXPORT TimeSource {
public:
    virtual ~TimeSource() = default;
    virtual TimePoint now() const = 0;
};

/**
 * @brief Wall clock
 */
class CIPHERLEDGER_CORE_EXPORT SystemTimeSource : public TimeSource {
public:
    TimePoint now() const override;
};

/**
 * @brief Clock that only moves when told to
 */
class CIPHERLEDGER_CORE_EXPORT ManualTimeSource : public TimeSource {
public:
    explicit ManualTimeSource(TimePoint start = Clock::now());

    TimePoint now() const override;

    void advance(std::chrono::seconds delta);
    void set(TimePoint tp);

private:
    std::atomic<int64_t> nanos_;
};

/**
 * @brief Add a duration to a time point
 * @return Sum, or nullopt if it is not representable
 */
CIPHERLEDGER_CORE_EXPORT std::optional<TimePoint> addSeconds(
    TimePoint base, std::chrono::seconds duration);

CIPHERLEDGER_CORE_EXPORT int64_t toUnixNanos(TimePoint tp);
CIPHERLEDGER_CORE_EXPORT TimePoint fromUnixNanos(int64_t nanos);
CIPHERLEDGER_CORE_EXPORT int64_t toUnixSeconds(TimePoint tp);
CIPHERLEDGER_CORE_EXPORT TimePoint fromUnixSeconds(int64_t seconds);

} // namespace cipherledger::core
