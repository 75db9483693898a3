#pragma once

#include "tubeq/clock.hpp"
#include "tubeq/job.hpp"
#include "tubeq/types.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace tubeq {

/**
 * What caused a committed transition
 */
enum class TransitionKind : std::uint8_t {
    PUT,
    RESERVE,
    RELEASE,
    BURY,
    KICK,
    TOUCH,
    DELETE,
    PROMOTE,   // sweeper: delay elapsed
    TIMEOUT,   // sweeper: TTR elapsed
    REQUEUE    // job recovered from a cancelled waiter
};

const char* transition_kind_to_string(TransitionKind kind);

/**
 * Copy of a committed job transition. `from` is empty for PUT, `to` is
 * empty for DELETE.
 */
struct TransitionEvent {
    TransitionKind kind;
    std::string tube;
    JobId job_id;
    std::optional<JobState> from;
    std::optional<JobState> to;
    std::int64_t priority = 0;
    std::int64_t delay_seconds = 0;
    std::int64_t ttr_seconds = 0;
    std::size_t bytes = 0;
    std::string consumer;
    TimePoint at;

    nlohmann::json to_json() const;
};

/**
 * Snapshot of a job's fields, without the payload body
 */
nlohmann::json job_to_json(const Job& job);

/**
 * Receives every committed transition, e.g. for write-ahead logging.
 *
 * Called under the tube lock: implementations must not block and must not
 * call back into the tube. Exceptions are logged by the tube and dropped.
 */
class TransitionListener {
public:
    virtual ~TransitionListener() = default;
    virtual void on_transition(const TransitionEvent& event) = 0;
};

/**
 * Writes each transition to the debug log as a JSON line
 */
class LoggingTransitionListener : public TransitionListener {
public:
    void on_transition(const TransitionEvent& event) override;
};

} // namespace tubeq
