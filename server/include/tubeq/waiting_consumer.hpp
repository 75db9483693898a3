#pragma once

#include "tubeq/clock.hpp"
#include "tubeq/job.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

namespace tubeq {

/**
 * A client blocked on reserve, holding a one-shot delivery slot.
 *
 * The slot moves PENDING -> DELIVERED -> TAKEN, or to CANCELLED from
 * PENDING/DELIVERED. At most one job is ever written to it. The dispatcher
 * writes under the tube lock; the blocked client waits on the slot's own
 * condition variable, never on the tube lock.
 */
class WaitingConsumer {
public:
    enum class SlotState {
        PENDING,
        DELIVERED,
        TAKEN,
        CANCELLED
    };

    WaitingConsumer(std::string id, std::string consumer, TimePoint registered_at)
        : id_(std::move(id)), consumer_(std::move(consumer)), registered_at_(registered_at) {}

    WaitingConsumer(const WaitingConsumer&) = delete;
    WaitingConsumer& operator=(const WaitingConsumer&) = delete;

    const std::string& id() const { return id_; }
    const std::string& consumer() const { return consumer_; }
    TimePoint registered_at() const { return registered_at_; }

    /**
     * Hand a job to the waiter. Returns false if the slot is no longer
     * PENDING, in which case the caller keeps ownership of the job.
     */
    bool deliver(const Job& job);

    /**
     * Block until a job is delivered or timeout elapses.
     * @return true if a job is waiting in the slot
     */
    bool wait_for(std::chrono::milliseconds timeout);

    /**
     * Take the delivered job, closing the slot
     */
    std::optional<Job> take();

    /**
     * Close the slot. Returns the job if one had been delivered but not
     * taken, so the tube can put it back.
     */
    std::optional<Job> cancel();

    SlotState state() const;
    bool is_pending() const { return state() == SlotState::PENDING; }

private:
    std::string id_;
    std::string consumer_;
    TimePoint registered_at_;

    mutable std::mutex mutex_;
    std::condition_variable delivered_cv_;
    SlotState state_ = SlotState::PENDING;
    std::optional<Job> job_;
};

} // namespace tubeq
