#pragma once

#include "tubeq/clock.hpp"
#include "tubeq/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace tubeq {

/**
 * Per-job event counters
 */
struct JobCounters {
    std::uint32_t reserves = 0;
    std::uint32_t releases = 0;
    std::uint32_t timeouts = 0;
    std::uint32_t buries = 0;
    std::uint32_t kicks = 0;
};

/**
 * Unit of work held by a Tube.
 *
 * Legal transitions:
 *   READY    <- RESERVED, DELAYED, BURIED
 *   DELAYED  <- RESERVED
 *   RESERVED <- READY
 *   BURIED   <- RESERVED
 *
 * A Job carries no synchronization of its own. Every mutation happens under
 * the lock of the owning Tube; callers outside the tube only ever see copies.
 */
class Job {
public:
    /**
     * Create a job. It starts READY when delay_seconds <= 0, otherwise
     * DELAYED with the delay counted from created_at.
     */
    Job(JobId id,
        std::int64_t priority,
        std::int64_t delay_seconds,
        std::int64_t ttr_seconds,
        std::string payload,
        TimePoint created_at);

    const JobId& id() const { return id_; }
    std::int64_t priority() const { return priority_; }
    std::int64_t delay_seconds() const { return delay_seconds_; }
    std::int64_t ttr_seconds() const { return ttr_seconds_; }
    const std::string& payload() const { return payload_; }
    std::size_t bytes() const { return payload_.size(); }
    JobState state() const { return state_; }
    TimePoint created_at() const { return created_at_; }

    std::optional<TimePoint> delay_started_at() const { return delay_started_at_; }
    std::optional<TimePoint> reserve_started_at() const { return reserve_started_at_; }

    // Absolute deadlines. Only meaningful in DELAYED / RESERVED respectively.
    TimePoint ready_at() const { return ready_at_; }
    TimePoint expires_at() const { return expires_at_; }

    const std::string& reserved_by() const { return reserved_by_; }
    void set_reserved_by(std::string consumer) { reserved_by_ = std::move(consumer); }

    const JobCounters& counters() const { return counters_; }
    JobCounters& counters() { return counters_; }

    /**
     * Move to target state. Throws TubeError(INVALID_TRANSITION) and leaves
     * the job untouched when the edge is not legal.
     */
    void transition(JobState target, TimePoint now);

    /**
     * RESERVED -> DELAYED with an explicit delay (release with delay).
     * The new delay period starts at now and replaces delay_seconds().
     */
    void delay_for(std::chrono::seconds delay, TimePoint now);

    /**
     * Restart the TTR window of a reserved job
     */
    void touch(TimePoint now);

    // Release may carry a new priority and delay
    void set_priority(std::int64_t priority) { priority_ = priority; }
    void set_delay_seconds(std::int64_t delay_seconds) { delay_seconds_ = delay_seconds; }

    /**
     * Ordering key for the current state, in seconds for the timed states:
     *   READY    -> priority
     *   DELAYED  -> seconds until ready_at (<= 0 once elapsed)
     *   RESERVED -> seconds until expires_at (<= 0 once elapsed)
     *   BURIED   -> 0
     */
    std::int64_t key(TimePoint now) const;

    /**
     * Whether a transition from the current state to target is legal
     */
    bool can_transition(JobState target) const;

private:
    JobId id_;
    std::int64_t priority_;
    std::int64_t delay_seconds_;
    std::int64_t ttr_seconds_;
    std::string payload_;
    JobState state_;
    TimePoint created_at_;

    std::optional<TimePoint> delay_started_at_;
    std::optional<TimePoint> reserve_started_at_;
    TimePoint ready_at_;
    TimePoint expires_at_;

    std::string reserved_by_;
    JobCounters counters_;
};

} // namespace tubeq
