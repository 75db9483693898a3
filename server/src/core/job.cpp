#include "tubeq/job.hpp"

namespace tubeq {

namespace {

std::int64_t seconds_until(TimePoint deadline, TimePoint now) {
    // Round up so a key of 0 means the deadline has been reached
    return std::chrono::ceil<std::chrono::seconds>(deadline - now).count();
}

} // namespace

Job::Job(JobId id,
         std::int64_t priority,
         std::int64_t delay_seconds,
         std::int64_t ttr_seconds,
         std::string payload,
         TimePoint created_at)
    : id_(std::move(id)),
      priority_(priority),
      delay_seconds_(delay_seconds),
      ttr_seconds_(ttr_seconds),
      payload_(std::move(payload)),
      state_(JobState::READY),
      created_at_(created_at),
      ready_at_(created_at),
      expires_at_(created_at) {
    if (delay_seconds_ > 0) {
        state_ = JobState::DELAYED;
        delay_started_at_ = created_at;
        ready_at_ = created_at + std::chrono::seconds(delay_seconds_);
    }
}

bool Job::can_transition(JobState target) const {
    switch (target) {
        case JobState::READY:
            return state_ == JobState::RESERVED ||
                   state_ == JobState::DELAYED ||
                   state_ == JobState::BURIED;
        case JobState::DELAYED:
        case JobState::BURIED:
            return state_ == JobState::RESERVED;
        case JobState::RESERVED:
            return state_ == JobState::READY;
    }
    return false;
}

void Job::transition(JobState target, TimePoint now) {
    if (!can_transition(target)) {
        throw TubeError(ErrorCode::INVALID_TRANSITION,
                        std::string("Invalid state transition for job ") + id_ + ": " +
                        job_state_to_string(state_) + " -> " + job_state_to_string(target));
    }

    switch (target) {
        case JobState::READY:
            delay_started_at_.reset();
            reserve_started_at_.reset();
            reserved_by_.clear();
            break;
        case JobState::DELAYED:
            delay_started_at_ = now;
            reserve_started_at_.reset();
            ready_at_ = now + std::chrono::seconds(delay_seconds_);
            reserved_by_.clear();
            break;
        case JobState::RESERVED:
            reserve_started_at_ = now;
            delay_started_at_.reset();
            expires_at_ = now + std::chrono::seconds(ttr_seconds_);
            break;
        case JobState::BURIED:
            delay_started_at_.reset();
            reserve_started_at_.reset();
            reserved_by_.clear();
            break;
    }
    state_ = target;
}

void Job::delay_for(std::chrono::seconds delay, TimePoint now) {
    transition(JobState::DELAYED, now);
    delay_seconds_ = delay.count();
    ready_at_ = now + delay;
}

void Job::touch(TimePoint now) {
    if (state_ != JobState::RESERVED) {
        throw TubeError(ErrorCode::NOT_RESERVED, "Job " + id_ + " is not reserved");
    }
    reserve_started_at_ = now;
    expires_at_ = now + std::chrono::seconds(ttr_seconds_);
}

std::int64_t Job::key(TimePoint now) const {
    switch (state_) {
        case JobState::READY:
            return priority_;
        case JobState::DELAYED:
            return seconds_until(ready_at_, now);
        case JobState::RESERVED:
            return seconds_until(expires_at_, now);
        case JobState::BURIED:
            return 0;
    }
    return 0;
}

} // namespace tubeq
