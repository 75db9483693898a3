#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tubeq {

using JobId = std::string;

/**
 * Job lifecycle states
 */
enum class JobState : std::uint8_t {
    READY,
    DELAYED,
    RESERVED,
    BURIED
};

inline const char* job_state_to_string(JobState state) {
    switch (state) {
        case JobState::READY: return "ready";
        case JobState::DELAYED: return "delayed";
        case JobState::RESERVED: return "reserved";
        case JobState::BURIED: return "buried";
        default: return "unknown";
    }
}

/**
 * Error kinds reported to the command layer
 */
enum class ErrorCode : std::uint8_t {
    INVALID_TRANSITION,
    INVALID_DELETION,
    NOT_RESERVED,
    NOT_FOUND,
    CAPACITY_EXCEEDED,
    TIMED_OUT
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_TRANSITION: return "INVALID_TRANSITION";
        case ErrorCode::INVALID_DELETION: return "INVALID_DELETION";
        case ErrorCode::NOT_RESERVED: return "NOT_RESERVED";
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::CAPACITY_EXCEEDED: return "CAPACITY_EXCEEDED";
        case ErrorCode::TIMED_OUT: return "TIMED_OUT";
        default: return "UNKNOWN";
    }
}

/**
 * Thrown by tube and job operations. The command layer maps code() to a
 * client-visible response.
 */
class TubeError : public std::runtime_error {
public:
    TubeError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace tubeq
