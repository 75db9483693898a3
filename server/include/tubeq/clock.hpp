#pragma once

#include <chrono>
#include <mutex>

namespace tubeq {

using TimePoint = std::chrono::steady_clock::time_point;

/**
 * Time source for job deadlines. Tubes never read the system clock directly.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SteadyClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::steady_clock::now(); }
};

/**
 * Clock that only moves when told to. Used to drive delays and TTR expiry
 * without sleeping.
 */
class ManualClock : public Clock {
public:
    ManualClock() : now_(std::chrono::steady_clock::now()) {}
    explicit ManualClock(TimePoint start) : now_(start) {}

    TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }

    void set(TimePoint t) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = t;
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

} // namespace tubeq
