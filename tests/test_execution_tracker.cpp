// tests/test_execution_tracker.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "fakes.h"
#include "protocol/execution_tracker.h"

using namespace comfyflow;
using namespace comfyflow::testing;
using namespace std::chrono_literals;
using Catch::Approx;

namespace {

ExecutionEvent executing(const std::string& prompt_id, std::optional<std::string> node) {
    return parse_execution_event({false, executing_frame(prompt_id, node)});
}

} // namespace

TEST_CASE("Frames are parsed into execution events", "[tracker]") {
    auto start = executing("p1", std::string("3"));
    REQUIRE(start.type == EventType::EXECUTING);
    REQUIRE(start.prompt_id == "p1");
    REQUIRE(start.node == std::optional<std::string>("3"));

    auto done = executing("p1", std::nullopt);
    REQUIRE(done.type == EventType::EXECUTING);
    REQUIRE_FALSE(done.node.has_value());

    auto err = parse_execution_event({false, error_frame("p1", "OOM")});
    REQUIRE(err.type == EventType::EXECUTION_ERROR);
    REQUIRE(err.message == "OOM");

    auto no_message = parse_execution_event({false, R"({"type":"execution_error","data":{"prompt_id":"p1"}})"});
    REQUIRE(no_message.message == "Remote execution error");

    REQUIRE(parse_execution_event({true, "\x01\x02"}).type == EventType::OTHER);
    REQUIRE(parse_execution_event({false, "not json"}).type == EventType::OTHER);
    REQUIRE(parse_execution_event({false, R"({"type":"progress","data":{"value":3}})"}).type == EventType::OTHER);
}

TEST_CASE("Tracker measures queue and execution time", "[tracker]") {
    auto clock = std::make_shared<FakeClock>();
    ExecutionTracker tracker("p1", 300s, FakeClock::bind(clock));
    REQUIRE(tracker.state() == TrackState::AWAITING_START);

    clock->advance(1500ms);
    REQUIRE(tracker.on_event(executing("p1", std::string("3"))) == TrackState::RUNNING);
    clock->advance(500ms);
    // later nodes do not move the start
    tracker.on_event(executing("p1", std::string("8")));
    clock->advance(2000ms);
    REQUIRE(tracker.on_event(executing("p1", std::nullopt)) == TrackState::DONE);
    REQUIRE(tracker.finished());

    auto timing = tracker.timing();
    REQUIRE(timing.queue_duration_sec == Approx(1.5));
    REQUIRE(timing.exec_duration_sec == Approx(2.5));
}

TEST_CASE("Completion without a start event counts as queue time", "[tracker]") {
    auto clock = std::make_shared<FakeClock>();
    ExecutionTracker tracker("p1", 300s, FakeClock::bind(clock));
    clock->advance(4s);
    tracker.on_event(executing("p1", std::nullopt));

    auto timing = tracker.timing();
    REQUIRE(timing.queue_duration_sec == Approx(4.0));
    REQUIRE(timing.exec_duration_sec == Approx(0.0));
}

TEST_CASE("Events for other prompts are ignored", "[tracker]") {
    auto clock = std::make_shared<FakeClock>();
    ExecutionTracker tracker("p1", 300s, FakeClock::bind(clock));

    tracker.on_event(executing("other", std::nullopt));
    tracker.on_event(parse_execution_event({false, error_frame("other", "boom")}));
    REQUIRE(tracker.state() == TrackState::AWAITING_START);

    tracker.on_event(parse_execution_event({false, error_frame("p1", "OOM")}));
    REQUIRE(tracker.state() == TrackState::FAILED);
    REQUIRE(tracker.error_message() == "OOM");
    // terminal
    tracker.on_event(executing("p1", std::nullopt));
    REQUIRE(tracker.state() == TrackState::FAILED);
}

TEST_CASE("Deadline is measured from submission", "[tracker]") {
    auto clock = std::make_shared<FakeClock>();
    ExecutionTracker tracker("p1", 10s, FakeClock::bind(clock));

    clock->advance(4s);
    tracker.on_event(executing("p1", std::string("3")));
    REQUIRE(tracker.remaining() == 6s);
    REQUIRE(tracker.check_deadline() == TrackState::RUNNING);

    clock->advance(6s);
    REQUIRE(tracker.remaining() == 0ms);
    REQUIRE(tracker.check_deadline() == TrackState::TIMED_OUT);
    REQUIRE(tracker.finished());
}
