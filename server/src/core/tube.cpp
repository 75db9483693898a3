#include "tubeq/tube.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>

namespace tubeq {

Tube::Tube(std::string name,
           TubeConfig config,
           std::shared_ptr<Clock> clock,
           std::shared_ptr<IdGenerator> id_generator,
           std::shared_ptr<TransitionListener> listener)
    : name_(std::move(name)),
      config_(config),
      clock_(std::move(clock)),
      id_generator_(std::move(id_generator)),
      listener_(std::move(listener)) {
    if (!clock_) {
        clock_ = std::make_shared<SteadyClock>();
    }
    if (!id_generator_) {
        id_generator_ = std::make_shared<SequentialIdGenerator>();
    }
    spdlog::debug("Tube '{}' created (max_jobs={}, max_waiters={})",
                  name_, config_.max_jobs, config_.max_waiters);
}

Tube::~Tube() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& waiter : waiting_) {
        waiter->cancel();
    }
    waiting_.clear();
}

// ============================================================
// Client operations
// ============================================================

JobId Tube::put(std::int64_t priority, std::int64_t delay_seconds, std::int64_t ttr_seconds,
                std::string payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();

    if (config_.max_jobs > 0 && jobs_.size() >= config_.max_jobs) {
        spdlog::warn("Tube '{}' at max capacity ({}), rejecting put", name_, config_.max_jobs);
        throw TubeError(ErrorCode::CAPACITY_EXCEEDED,
                        "Tube " + name_ + " is full (" + std::to_string(config_.max_jobs) + " jobs)");
    }

    if (ttr_seconds <= 0) {
        ttr_seconds = config_.default_ttr > 0 ? config_.default_ttr : 1;
    }

    JobId id = id_generator_->next_id();
    auto job = std::make_unique<Job>(id, priority, delay_seconds, ttr_seconds,
                                     std::move(payload), now);

    Slot& slot = jobs_[id];
    slot.job = std::move(job);
    file_locked(slot);
    notify_locked(TransitionKind::PUT, *slot.job, std::nullopt, now);

    spdlog::debug("Tube '{}': put job {} (pri={}, delay={}s, ttr={}s, state={})",
                  name_, id, priority, delay_seconds, ttr_seconds,
                  job_state_to_string(slot.job->state()));

    if (slot.job->state() == JobState::READY) {
        dispatch_locked(now);
    }
    return id;
}

ReserveResult Tube::reserve(std::chrono::milliseconds timeout, const std::string& consumer) {
    bool may_wait = timeout.count() > 0;
    Reservation reservation = try_reserve(consumer, may_wait);

    if (reservation.job) {
        return ReserveResult{std::move(reservation.job)};
    }
    if (!reservation.waiter) {
        return ReserveResult{};
    }
    return await(reservation.waiter, timeout);
}

Reservation Tube::try_reserve(const std::string& consumer, bool register_waiter) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();

    // Lazy sweep so reserve never misses a job whose deadline has passed
    sweep_locked(now);

    Reservation reservation;

    if (!ready_.empty()) {
        Slot& slot = jobs_.at(ready_.begin()->id);
        reserve_locked(slot, consumer, now);
        reservation.job = *slot.job;
        return reservation;
    }

    if (!register_waiter) {
        return reservation;
    }

    if (waiting_.size() >= config_.max_waiters) {
        spdlog::warn("Tube '{}' has max waiters ({}), rejecting reserve",
                     name_, config_.max_waiters);
        return reservation;
    }

    reservation.waiter = std::make_shared<WaitingConsumer>(id_generator_->next_id(), consumer, now);
    waiting_.push_back(reservation.waiter);

    spdlog::debug("Tube '{}': registered waiter {} ({} waiting)",
                  name_, reservation.waiter->id(), waiting_.size());
    return reservation;
}

ReserveResult Tube::await(const std::shared_ptr<WaitingConsumer>& waiter,
                          std::chrono::milliseconds timeout) {
    bool delivered = waiter->wait_for(timeout);

    // Settle under the tube lock: the waiter is either still queued, or it
    // was handed a job whose reservation may since have expired.
    std::lock_guard<std::mutex> lock(mutex_);

    if (!delivered) {
        auto it = std::find(waiting_.begin(), waiting_.end(), waiter);
        if (it != waiting_.end()) {
            waiting_.erase(it);
            waiter->cancel();
            spdlog::debug("Tube '{}': waiter {} timed out", name_, waiter->id());
            return ReserveResult{};
        }
    }

    auto job = waiter->take();
    if (!job) {
        return ReserveResult{};
    }

    const Slot* slot = delivered_slot_locked(*job);
    if (!slot) {
        spdlog::debug("Tube '{}': reservation of job {} for waiter {} lapsed before it was taken",
                      name_, job->id(), waiter->id());
        return ReserveResult{};
    }
    return ReserveResult{*slot->job};
}

void Tube::cancel_wait(const std::shared_ptr<WaitingConsumer>& waiter) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();

    auto it = std::find(waiting_.begin(), waiting_.end(), waiter);
    if (it != waiting_.end()) {
        waiting_.erase(it);
    }

    if (auto orphan = waiter->cancel()) {
        if (!delivered_slot_locked(*orphan)) {
            spdlog::debug("Tube '{}': waiter {} abandoned job {}, reservation already lapsed",
                          name_, waiter->id(), orphan->id());
            return;
        }
        spdlog::info("Tube '{}': waiter {} abandoned delivered job {}, requeueing",
                     name_, waiter->id(), orphan->id());
        requeue_locked(orphan->id(), now);
    }
}

void Tube::release(const JobId& id, std::int64_t priority, std::int64_t delay_seconds,
                   const std::string& consumer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();

    Slot& slot = reserved_slot_locked(id, consumer);
    Job& job = *slot.job;

    unfile_locked(slot);
    job.set_priority(priority);
    job.counters().releases++;
    if (delay_seconds > 0) {
        job.delay_for(std::chrono::seconds(delay_seconds), now);
    } else {
        job.transition(JobState::READY, now);
        job.set_delay_seconds(0);
    }
    file_locked(slot);
    notify_locked(TransitionKind::RELEASE, job, JobState::RESERVED, now);

    if (job.state() == JobState::READY) {
        dispatch_locked(now);
    }
}

void Tube::bury(const JobId& id, const std::string& consumer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();

    Slot& slot = reserved_slot_locked(id, consumer);
    unfile_locked(slot);
    slot.job->transition(JobState::BURIED, now);
    slot.job->counters().buries++;
    file_locked(slot);
    notify_locked(TransitionKind::BURY, *slot.job, JobState::RESERVED, now);
}

void Tube::touch(const JobId& id, const std::string& consumer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();

    Slot& slot = reserved_slot_locked(id, consumer);
    unfile_locked(slot);
    slot.job->touch(now);
    file_locked(slot);
    notify_locked(TransitionKind::TOUCH, *slot.job, JobState::RESERVED, now);
}

std::size_t Tube::kick(std::size_t bound) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();

    std::size_t kicked = 0;
    while (kicked < bound && !buried_.empty()) {
        Slot& slot = find_slot_locked(buried_.front());
        unfile_locked(slot);
        slot.job->transition(JobState::READY, now);
        slot.job->counters().kicks++;
        file_locked(slot);
        notify_locked(TransitionKind::KICK, *slot.job, JobState::BURIED, now);
        dispatch_locked(now);
        ++kicked;
    }

    if (kicked > 0) {
        spdlog::debug("Tube '{}': kicked {} buried jobs", name_, kicked);
    }
    return kicked;
}

void Tube::kick_job(const JobId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();

    Slot& slot = find_slot_locked(id);
    if (slot.job->state() != JobState::BURIED) {
        throw TubeError(ErrorCode::INVALID_TRANSITION,
                        "Job " + id + " is " + job_state_to_string(slot.job->state()) +
                        ", only buried jobs can be kicked");
    }
    unfile_locked(slot);
    slot.job->transition(JobState::READY, now);
    slot.job->counters().kicks++;
    file_locked(slot);
    notify_locked(TransitionKind::KICK, *slot.job, JobState::BURIED, now);
    dispatch_locked(now);
}

void Tube::delete_job(const JobId& id, const std::string& consumer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();

    Slot& slot = find_slot_locked(id);
    JobState state = slot.job->state();

    switch (state) {
        case JobState::RESERVED:
            reserved_slot_locked(id, consumer);
            break;
        case JobState::BURIED:
            break;
        case JobState::READY:
        case JobState::DELAYED:
            if (!config_.allow_unreserved_delete) {
                throw TubeError(ErrorCode::INVALID_DELETION,
                                "Job " + id + " is " + job_state_to_string(state) +
                                ", reserve it before deleting");
            }
            break;
    }

    unfile_locked(slot);
    notify_locked(TransitionKind::DELETE, *slot.job, state, now, true);
    jobs_.erase(id);

    spdlog::debug("Tube '{}': deleted job {} (was {})", name_, id, job_state_to_string(state));
}

std::optional<Job> Tube::peek(const JobId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sweep_locked(clock_->now());

    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return *it->second.job;
}

std::optional<Job> Tube::peek_ready() {
    std::lock_guard<std::mutex> lock(mutex_);
    sweep_locked(clock_->now());

    if (ready_.empty()) {
        return std::nullopt;
    }
    return *jobs_.at(ready_.begin()->id).job;
}

std::optional<Job> Tube::peek_delayed() {
    std::lock_guard<std::mutex> lock(mutex_);
    sweep_locked(clock_->now());

    if (delayed_.empty()) {
        return std::nullopt;
    }
    return *jobs_.at(delayed_.begin()->id).job;
}

std::optional<Job> Tube::peek_buried() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (buried_.empty()) {
        return std::nullopt;
    }
    return *jobs_.at(buried_.front()).job;
}

SweepResult Tube::sweep() {
    std::lock_guard<std::mutex> lock(mutex_);
    return sweep_locked(clock_->now());
}

TubeCounts Tube::counts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    TubeCounts counts;
    counts.ready = ready_.size();
    counts.delayed = delayed_.size();
    counts.reserved = reserved_.size();
    counts.buried = buried_.size();
    counts.waiting = waiting_.size();
    return counts;
}

// ============================================================
// Internals (mutex_ held)
// ============================================================

Tube::Slot& Tube::find_slot_locked(const JobId& id) {
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        throw TubeError(ErrorCode::NOT_FOUND, "Job " + id + " not found in tube " + name_);
    }
    return it->second;
}

Tube::Slot& Tube::reserved_slot_locked(const JobId& id, const std::string& consumer) {
    Slot& slot = find_slot_locked(id);
    const Job& job = *slot.job;

    if (job.state() != JobState::RESERVED) {
        throw TubeError(ErrorCode::NOT_RESERVED,
                        "Job " + id + " is " + job_state_to_string(job.state()) + ", not reserved");
    }
    if (!consumer.empty() && !job.reserved_by().empty() && job.reserved_by() != consumer) {
        throw TubeError(ErrorCode::NOT_RESERVED,
                        "Job " + id + " is reserved by another consumer");
    }
    return slot;
}

const Tube::Slot* Tube::delivered_slot_locked(const Job& delivered) const {
    auto it = jobs_.find(delivered.id());
    if (it == jobs_.end()) {
        return nullptr;
    }
    const Job& job = *it->second.job;
    // Every reserve bumps the counter, so a match means the same reservation
    if (job.state() != JobState::RESERVED ||
        job.counters().reserves != delivered.counters().reserves) {
        return nullptr;
    }
    return &it->second;
}

void Tube::file_locked(Slot& slot) {
    const Job& job = *slot.job;
    slot.seq = next_seq_++;

    switch (job.state()) {
        case JobState::READY:
            ready_.insert(ReadyKey{job.priority(), slot.seq, job.id()});
            break;
        case JobState::DELAYED:
            delayed_.insert(DeadlineKey{job.ready_at(), slot.seq, job.id()});
            break;
        case JobState::RESERVED:
            reserved_.insert(DeadlineKey{job.expires_at(), slot.seq, job.id()});
            break;
        case JobState::BURIED:
            buried_.push_back(job.id());
            slot.buried_pos = std::prev(buried_.end());
            break;
    }
}

void Tube::unfile_locked(Slot& slot) {
    const Job& job = *slot.job;

    switch (job.state()) {
        case JobState::READY:
            ready_.erase(ReadyKey{job.priority(), slot.seq, job.id()});
            break;
        case JobState::DELAYED:
            delayed_.erase(DeadlineKey{job.ready_at(), slot.seq, job.id()});
            break;
        case JobState::RESERVED:
            reserved_.erase(DeadlineKey{job.expires_at(), slot.seq, job.id()});
            break;
        case JobState::BURIED:
            buried_.erase(slot.buried_pos);
            slot.buried_pos = buried_.end();
            break;
    }
}

void Tube::reserve_locked(Slot& slot, const std::string& consumer, TimePoint now) {
    Job& job = *slot.job;
    unfile_locked(slot);
    job.transition(JobState::RESERVED, now);
    job.set_reserved_by(consumer);
    job.counters().reserves++;
    file_locked(slot);
    notify_locked(TransitionKind::RESERVE, job, JobState::READY, now);
}

void Tube::dispatch_locked(TimePoint now) {
    while (!ready_.empty() && !waiting_.empty()) {
        std::shared_ptr<WaitingConsumer> waiter = waiting_.front();
        waiting_.pop_front();

        if (!waiter->is_pending()) {
            continue;
        }

        Slot& slot = jobs_.at(ready_.begin()->id);
        reserve_locked(slot, waiter->consumer(), now);

        if (!waiter->deliver(*slot.job)) {
            // Waiter closed between the check and the hand-off
            requeue_locked(slot.job->id(), now);
            continue;
        }

        spdlog::debug("Tube '{}': delivered job {} to waiter {}",
                      name_, slot.job->id(), waiter->id());
    }
}

SweepResult Tube::sweep_locked(TimePoint now) {
    SweepResult result;

    while (!delayed_.empty() && delayed_.begin()->deadline <= now) {
        JobId id = delayed_.begin()->id;
        auto it = jobs_.find(id);
        if (it == jobs_.end() || it->second.job->state() != JobState::DELAYED) {
            spdlog::warn("Tube '{}': sweep skipped delayed entry {} (job missing or moved)", name_, id);
            delayed_.erase(delayed_.begin());
            result.skipped++;
            continue;
        }

        Slot& slot = it->second;
        unfile_locked(slot);
        slot.job->transition(JobState::READY, now);
        file_locked(slot);
        notify_locked(TransitionKind::PROMOTE, *slot.job, JobState::DELAYED, now);
        result.promoted++;
    }

    while (!reserved_.empty() && reserved_.begin()->deadline <= now) {
        JobId id = reserved_.begin()->id;
        auto it = jobs_.find(id);
        if (it == jobs_.end() || it->second.job->state() != JobState::RESERVED) {
            spdlog::warn("Tube '{}': sweep skipped reserved entry {} (job missing or moved)", name_, id);
            reserved_.erase(reserved_.begin());
            result.skipped++;
            continue;
        }

        Slot& slot = it->second;
        std::string holder = slot.job->reserved_by();
        unfile_locked(slot);
        slot.job->transition(JobState::READY, now);
        slot.job->counters().timeouts++;
        file_locked(slot);
        notify_locked(TransitionKind::TIMEOUT, *slot.job, JobState::RESERVED, now);
        result.timed_out++;

        spdlog::info("Tube '{}': job {} TTR expired{}{}", name_, id,
                     holder.empty() ? "" : ", was reserved by ", holder);
    }

    if (result.promoted > 0 || result.timed_out > 0) {
        dispatch_locked(now);
    }
    return result;
}

void Tube::requeue_locked(const JobId& id, TimePoint now) {
    auto it = jobs_.find(id);
    if (it == jobs_.end() || it->second.job->state() != JobState::RESERVED) {
        // Deleted or already timed out back to ready
        return;
    }

    Slot& slot = it->second;
    unfile_locked(slot);
    slot.job->transition(JobState::READY, now);
    file_locked(slot);
    notify_locked(TransitionKind::REQUEUE, *slot.job, JobState::RESERVED, now);
    dispatch_locked(now);
}

void Tube::notify_locked(TransitionKind kind, const Job& job,
                         std::optional<JobState> from, TimePoint now, bool deleted) {
    if (!listener_) return;

    TransitionEvent event;
    event.kind = kind;
    event.tube = name_;
    event.job_id = job.id();
    event.from = from;
    if (!deleted) {
        event.to = job.state();
    }
    event.priority = job.priority();
    event.delay_seconds = job.delay_seconds();
    event.ttr_seconds = job.ttr_seconds();
    event.bytes = job.bytes();
    event.consumer = job.reserved_by();
    event.at = now;

    try {
        listener_->on_transition(event);
    } catch (const std::exception& e) {
        spdlog::warn("Tube '{}': transition listener failed for job {}: {}", name_, job.id(), e.what());
    }
}

} // namespace tubeq
