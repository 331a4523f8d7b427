// modules/protocol/execution_tracker.cpp
#include "protocol/execution_tracker.h"
#include "common/logging/logger.h"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace comfyflow {

ExecutionEvent parse_execution_event(const EventFrame& frame) {
    ExecutionEvent event;
    if (frame.binary) {
        return event; // preview images
    }

    nlohmann::json data = nlohmann::json::parse(frame.payload, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return event;
    }

    const std::string type = (data.contains("type") && data["type"].is_string()) ? data["type"].get<std::string>() : "";
    const nlohmann::json body = (data.contains("data") && data["data"].is_object()) ? data["data"] : nlohmann::json::object();
    if (body.contains("prompt_id") && body["prompt_id"].is_string()) {
        event.prompt_id = body["prompt_id"].get<std::string>();
    }

    if (type == "executing") {
        event.type = EventType::EXECUTING;
        if (body.contains("node") && body["node"].is_string()) {
            event.node = body["node"].get<std::string>();
        } else if (body.contains("node") && body["node"].is_number()) {
            event.node = body["node"].dump();
        }
    } else if (type == "execution_error") {
        event.type = EventType::EXECUTION_ERROR;
        if (body.contains("exception_message") && body["exception_message"].is_string()) {
            event.message = body["exception_message"].get<std::string>();
        }
        if (event.message.empty()) {
            event.message = "Remote execution error";
        }
    }
    return event;
}

ExecutionTracker::ExecutionTracker(std::string prompt_id, std::chrono::milliseconds run_timeout, SteadyClock clock)
    : prompt_id_(std::move(prompt_id)),
      run_timeout_(run_timeout),
      clock_(clock ? std::move(clock) : SteadyClock([] { return std::chrono::steady_clock::now(); })) {
    t_submitted_ = clock_();
}

bool ExecutionTracker::finished() const {
    return state_ == TrackState::DONE || state_ == TrackState::FAILED || state_ == TrackState::TIMED_OUT;
}

TrackState ExecutionTracker::on_event(const ExecutionEvent& event) {
    if (finished() || event.prompt_id != prompt_id_) {
        return state_;
    }

    switch (event.type) {
        case EventType::EXECUTING:
            if (event.node) {
                if (!t_exec_start_) {
                    t_exec_start_ = clock_();
                    state_ = TrackState::RUNNING;
                    COMFYFLOW_DEBUG("Execution start: prompt_id={} node={}", prompt_id_, *event.node);
                }
            } else {
                t_exec_done_ = clock_();
                state_ = TrackState::DONE;
                COMFYFLOW_DEBUG("Execution done: prompt_id={}", prompt_id_);
            }
            break;
        case EventType::EXECUTION_ERROR:
            error_message_ = event.message;
            state_ = TrackState::FAILED;
            COMFYFLOW_DEBUG("Execution error for prompt_id={}: {}", prompt_id_, error_message_);
            break;
        case EventType::OTHER:
            break;
    }
    return state_;
}

TrackState ExecutionTracker::check_deadline() {
    if (!finished() && clock_() - t_submitted_ >= run_timeout_) {
        state_ = TrackState::TIMED_OUT;
    }
    return state_;
}

std::chrono::milliseconds ExecutionTracker::remaining() const {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(t_submitted_ + run_timeout_ - clock_());
    return std::max(left, std::chrono::milliseconds(0));
}

ExecutionTiming ExecutionTracker::timing() const {
    using seconds = std::chrono::duration<double>;
    const auto done = t_exec_done_.value_or(clock_());

    ExecutionTiming timing;
    if (!t_exec_start_) {
        timing.queue_duration_sec = std::max(0.0, seconds(done - t_submitted_).count());
        timing.exec_duration_sec = 0.0;
    } else {
        timing.queue_duration_sec = std::max(0.0, seconds(*t_exec_start_ - t_submitted_).count());
        timing.exec_duration_sec = std::max(0.0, seconds(done - *t_exec_start_).count());
    }
    return timing;
}

} // namespace comfyflow
