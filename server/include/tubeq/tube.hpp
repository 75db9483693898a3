#pragma once

#include "tubeq/clock.hpp"
#include "tubeq/config.hpp"
#include "tubeq/id_generator.hpp"
#include "tubeq/job.hpp"
#include "tubeq/transition_listener.hpp"
#include "tubeq/types.hpp"
#include "tubeq/waiting_consumer.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>

namespace tubeq {

/**
 * Outcome of a reserve. An empty job means the consumer timeout elapsed.
 */
struct ReserveResult {
    std::optional<Job> job;

    bool timed_out() const { return !job.has_value(); }
};

/**
 * First phase of a reserve: either a job right away, or a registered waiter
 * to block on. Both empty when the tube refuses more waiters or the caller
 * asked not to wait.
 */
struct Reservation {
    std::optional<Job> job;
    std::shared_ptr<WaitingConsumer> waiter;
};

struct SweepResult {
    std::size_t promoted = 0;   // DELAYED -> READY
    std::size_t timed_out = 0;  // RESERVED -> READY
    std::size_t skipped = 0;    // inconsistent entries dropped
};

struct TubeCounts {
    std::size_t ready = 0;
    std::size_t delayed = 0;
    std::size_t reserved = 0;
    std::size_t buried = 0;
    std::size_t waiting = 0;

    std::size_t total_jobs() const { return ready + delayed + reserved + buried; }
};

/**
 * A named, independently locked job queue.
 *
 * Every job lives in exactly one of ready / delayed / reserved / buried.
 * All operations, including sweeps, run under the tube's single mutex; a
 * blocked reserve waits on its own WaitingConsumer, not on that mutex.
 *
 * Operations report failures by throwing TubeError:
 *   NOT_FOUND          unknown job id
 *   NOT_RESERVED       release / bury / touch / delete of a job not reserved
 *                      (by this consumer, when one is given)
 *   INVALID_TRANSITION kick_job of a job that is not buried
 *   INVALID_DELETION   delete of a READY / DELAYED job when not allowed
 *   CAPACITY_EXCEEDED  put on a full tube
 */
class Tube {
public:
    Tube(std::string name,
         TubeConfig config,
         std::shared_ptr<Clock> clock,
         std::shared_ptr<IdGenerator> id_generator,
         std::shared_ptr<TransitionListener> listener = nullptr);

    ~Tube();

    Tube(const Tube&) = delete;
    Tube& operator=(const Tube&) = delete;

    const std::string& name() const { return name_; }

    /**
     * Create a job. delay <= 0 makes it READY and hands it to the oldest
     * waiting consumer if there is one; otherwise it is DELAYED.
     * A ttr <= 0 is replaced by the configured default.
     */
    JobId put(std::int64_t priority, std::int64_t delay_seconds, std::int64_t ttr_seconds,
              std::string payload);

    /**
     * Reserve the highest-priority ready job, blocking up to timeout for one
     * to arrive. A zero timeout never blocks.
     */
    ReserveResult reserve(std::chrono::milliseconds timeout, const std::string& consumer = "");

    /**
     * Non-blocking first half of reserve. With register_waiter the caller
     * gets a waiter when no job is ready and must finish with await() or
     * cancel_wait().
     */
    Reservation try_reserve(const std::string& consumer = "", bool register_waiter = true);

    /**
     * Block on a waiter from try_reserve. On timeout the waiter is removed
     * from the queue atomically; a job delivered in the meantime is
     * returned rather than lost, unless its reservation has already
     * expired (the job may then be held by another consumer).
     */
    ReserveResult await(const std::shared_ptr<WaitingConsumer>& waiter,
                        std::chrono::milliseconds timeout);

    /**
     * Abandon a waiter (client went away). A job already delivered to it is
     * put back to READY and dispatched again, provided the delivery's
     * reservation is still the current one.
     */
    void cancel_wait(const std::shared_ptr<WaitingConsumer>& waiter);

    void release(const JobId& id, std::int64_t priority, std::int64_t delay_seconds,
                 const std::string& consumer = "");
    void bury(const JobId& id, const std::string& consumer = "");
    void touch(const JobId& id, const std::string& consumer = "");

    /**
     * Kick up to bound buried jobs, oldest first. Returns how many moved.
     */
    std::size_t kick(std::size_t bound);
    void kick_job(const JobId& id);

    void delete_job(const JobId& id, const std::string& consumer = "");

    std::optional<Job> peek(const JobId& id);
    std::optional<Job> peek_ready();
    std::optional<Job> peek_delayed();
    std::optional<Job> peek_buried();

    /**
     * Promote elapsed delayed jobs and time out expired reservations
     */
    SweepResult sweep();

    TubeCounts counts() const;

private:
    struct ReadyKey {
        std::int64_t priority;
        std::uint64_t seq;
        JobId id;

        bool operator<(const ReadyKey& other) const {
            return std::tie(priority, seq) < std::tie(other.priority, other.seq);
        }
    };

    struct DeadlineKey {
        TimePoint deadline;
        std::uint64_t seq;
        JobId id;

        bool operator<(const DeadlineKey& other) const {
            return std::tie(deadline, seq) < std::tie(other.deadline, other.seq);
        }
    };

    // Arena entry: owns the job and remembers where it is filed
    struct Slot {
        std::unique_ptr<Job> job;
        std::uint64_t seq = 0;
        std::list<JobId>::iterator buried_pos;
    };

    Slot& find_slot_locked(const JobId& id);
    Slot& reserved_slot_locked(const JobId& id, const std::string& consumer);
    // Slot of a job still held under the reservation that produced delivered
    const Slot* delivered_slot_locked(const Job& delivered) const;

    void file_locked(Slot& slot);
    void unfile_locked(Slot& slot);

    void reserve_locked(Slot& slot, const std::string& consumer, TimePoint now);
    void dispatch_locked(TimePoint now);
    SweepResult sweep_locked(TimePoint now);
    void requeue_locked(const JobId& id, TimePoint now);

    void notify_locked(TransitionKind kind, const Job& job,
                       std::optional<JobState> from, TimePoint now,
                       bool deleted = false);

    const std::string name_;
    const TubeConfig config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<IdGenerator> id_generator_;
    std::shared_ptr<TransitionListener> listener_;

    mutable std::mutex mutex_;
    std::unordered_map<JobId, Slot> jobs_;
    std::set<ReadyKey> ready_;
    std::set<DeadlineKey> delayed_;
    std::set<DeadlineKey> reserved_;
    std::list<JobId> buried_;
    std::deque<std::shared_ptr<WaitingConsumer>> waiting_;
    std::uint64_t next_seq_ = 0;
};

} // namespace tubeq
