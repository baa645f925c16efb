#include "core/clock.hpp"

namespace cipherledger::core {

TimePoint SystemTimeSource::now() const {
    return Clock::now();
}

ManualTimeSource::ManualTimeSource(TimePoint start)
    : nanos_(toUnixNanos(start)) {}

TimePoint ManualTimeSource::now() const {
    return fromUnixNanos(nanos_.load());
}

void ManualTimeSource::advance(std::chrono::seconds delta) {
    nanos_ += std::chrono::duration_cast<std::chrono::nanoseconds>(delta).count();
}

void ManualTimeSource::set(TimePoint tp) {
    nanos_ = toUnixNanos(tp);
}

std::optional<TimePoint> addSeconds(TimePoint base, std::chrono::seconds duration) {
    if (duration.count() < 0) {
        return std::nullopt;
    }

    // Headroom left before TimePoint::max(), truncated to whole seconds
    auto headroom = std::chrono::duration_cast<std::chrono::seconds>(
        TimePoint::max() - base);
    if (duration > headroom) {
        return std::nullopt;
    }

    return base + std::chrono::duration_cast<Clock::duration>(duration);
}

int64_t toUnixNanos(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        tp.time_since_epoch()).count();
}

TimePoint fromUnixNanos(int64_t nanos) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::nanoseconds(nanos)));
}

int64_t toUnixSeconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(
        tp.time_since_epoch()).count();
}

TimePoint fromUnixSeconds(int64_t seconds) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::seconds(seconds)));
}

} // namespace cipherledger::core
