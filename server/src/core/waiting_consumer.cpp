#include "tubeq/waiting_consumer.hpp"

namespace tubeq {

bool WaitingConsumer::deliver(const Job& job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SlotState::PENDING) {
            return false;
        }
        job_ = job;
        state_ = SlotState::DELIVERED;
    }
    delivered_cv_.notify_one();
    return true;
}

bool WaitingConsumer::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return delivered_cv_.wait_for(lock, timeout, [this] {
        return state_ != SlotState::PENDING;
    }) && state_ == SlotState::DELIVERED;
}

std::optional<Job> WaitingConsumer::take() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SlotState::DELIVERED) {
        return std::nullopt;
    }
    state_ = SlotState::TAKEN;
    std::optional<Job> job = std::move(job_);
    job_.reset();
    return job;
}

std::optional<Job> WaitingConsumer::cancel() {
    std::optional<Job> orphan;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SlotState::DELIVERED) {
            orphan = std::move(job_);
            job_.reset();
        }
        if (state_ != SlotState::TAKEN) {
            state_ = SlotState::CANCELLED;
        }
    }
    delivered_cv_.notify_all();
    return orphan;
}

WaitingConsumer::SlotState WaitingConsumer::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

} // namespace tubeq
