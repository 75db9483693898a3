#include "tubeq/transition_listener.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace tubeq {

namespace {

std::int64_t to_ms(TimePoint t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

} // namespace

const char* transition_kind_to_string(TransitionKind kind) {
    switch (kind) {
        case TransitionKind::PUT: return "put";
        case TransitionKind::RESERVE: return "reserve";
        case TransitionKind::RELEASE: return "release";
        case TransitionKind::BURY: return "bury";
        case TransitionKind::KICK: return "kick";
        case TransitionKind::TOUCH: return "touch";
        case TransitionKind::DELETE: return "delete";
        case TransitionKind::PROMOTE: return "promote";
        case TransitionKind::TIMEOUT: return "timeout";
        case TransitionKind::REQUEUE: return "requeue";
        default: return "unknown";
    }
}

nlohmann::json TransitionEvent::to_json() const {
    nlohmann::json out = {
        {"kind", transition_kind_to_string(kind)},
        {"tube", tube},
        {"id", job_id},
        {"from", from ? nlohmann::json(job_state_to_string(*from)) : nlohmann::json(nullptr)},
        {"to", to ? nlohmann::json(job_state_to_string(*to)) : nlohmann::json(nullptr)},
        {"pri", priority},
        {"delay", delay_seconds},
        {"ttr", ttr_seconds},
        {"bytes", bytes},
        {"at_ms", to_ms(at)}
    };
    if (!consumer.empty()) {
        out["consumer"] = consumer;
    }
    return out;
}

nlohmann::json job_to_json(const Job& job) {
    nlohmann::json out = {
        {"id", job.id()},
        {"state", job_state_to_string(job.state())},
        {"pri", job.priority()},
        {"delay", job.delay_seconds()},
        {"ttr", job.ttr_seconds()},
        {"bytes", job.bytes()},
        {"reserves", job.counters().reserves},
        {"releases", job.counters().releases},
        {"timeouts", job.counters().timeouts},
        {"buries", job.counters().buries},
        {"kicks", job.counters().kicks}
    };
    if (job.state() == JobState::DELAYED) {
        out["ready_at_ms"] = to_ms(job.ready_at());
    } else if (job.state() == JobState::RESERVED) {
        out["expires_at_ms"] = to_ms(job.expires_at());
        if (!job.reserved_by().empty()) {
            out["reserved_by"] = job.reserved_by();
        }
    }
    return out;
}

void LoggingTransitionListener::on_transition(const TransitionEvent& event) {
    spdlog::debug("transition {}",
                  event.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace tubeq
