// modules/protocol/execution_tracker.h
#ifndef COMFYFLOW_MODULES_PROTOCOL_EXECUTION_TRACKER_H
#define COMFYFLOW_MODULES_PROTOCOL_EXECUTION_TRACKER_H

#include "protocol/event_channel.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace comfyflow {

using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

enum class EventType : uint8_t {
    EXECUTING,
    EXECUTION_ERROR,
    OTHER
};

struct ExecutionEvent {
    EventType type = EventType::OTHER;
    std::string prompt_id;
    std::optional<std::string> node; // EXECUTING only; nullopt signals completion
    std::string message;             // EXECUTION_ERROR only
};

// Binary frames and malformed JSON yield EventType::OTHER
ExecutionEvent parse_execution_event(const EventFrame& frame);

enum class TrackState : uint8_t {
    AWAITING_START,
    RUNNING,
    DONE,
    FAILED,
    TIMED_OUT
};

struct ExecutionTiming {
    double queue_duration_sec = 0.0;
    double exec_duration_sec = 0.0;
};

// Await-loop state machine for one prompt id. Time comes from an injected
// clock; the run deadline is measured from construction, which happens right
// after the prompt was accepted.
class ExecutionTracker {
public:
    ExecutionTracker(std::string prompt_id, std::chrono::milliseconds run_timeout, SteadyClock clock);

    // Returns the state after consuming the event. Events for other prompt ids
    // and OTHER events never change state.
    TrackState on_event(const ExecutionEvent& event);

    // Moves to TIMED_OUT if the deadline has passed while still waiting
    TrackState check_deadline();

    // Time left before the run deadline, never negative
    std::chrono::milliseconds remaining() const;

    TrackState state() const { return state_; }
    bool finished() const;
    const std::string& error_message() const { return error_message_; }
    const std::string& prompt_id() const { return prompt_id_; }

    // Only meaningful once state() == DONE
    ExecutionTiming timing() const;

private:
    std::string prompt_id_;
    std::chrono::milliseconds run_timeout_;
    SteadyClock clock_;
    TrackState state_ = TrackState::AWAITING_START;
    std::string error_message_;

    std::chrono::steady_clock::time_point t_submitted_;
    std::optional<std::chrono::steady_clock::time_point> t_exec_start_;
    std::optional<std::chrono::steady_clock::time_point> t_exec_done_;
};

} // namespace comfyflow

#endif // COMFYFLOW_MODULES_PROTOCOL_EXECUTION_TRACKER_H
