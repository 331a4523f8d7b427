// tests/test_admission_controller.cpp
#include <catch2/catch_test_macros.hpp>
#include "scheduler/admission_controller.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace comfyflow;
using namespace std::chrono_literals;

namespace {

bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

std::shared_ptr<Job> make_job(MessageId id, RequesterId requester, const std::string& alias = "flux") {
    auto job = std::make_shared<Job>();
    job->message_id = id;
    job->requester_id = requester;
    job->topic_alias = alias;
    job->correlation_id = "job-" + std::to_string(id);
    return job;
}

// Processor that parks every job until release() is called for its id
class Gate {
public:
    void operator()(const Job& job) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            started_.push_back(job.message_id);
        }
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return released_all_ || std::find(released_.begin(), released_.end(), job.message_id) != released_.end(); });
        finished_.push_back(job.message_id);
    }

    void release(MessageId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        released_.push_back(id);
        cv_.notify_all();
    }

    void release_all() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_all_ = true;
        cv_.notify_all();
    }

    std::vector<MessageId> started() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_;
    }

    std::vector<MessageId> finished() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return finished_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<MessageId> started_;
    std::vector<MessageId> finished_;
    std::vector<MessageId> released_;
    bool released_all_ = false;
};

} // namespace

TEST_CASE("Pending limit blocks and frees requester slots", "[admission]") {
    AdmissionController controller({2, 1});

    REQUIRE(controller.can_enqueue(7, 2));
    REQUIRE(controller.reserve_slot(7, 2));
    REQUIRE(controller.reserve_slot(7, 2));
    REQUIRE_FALSE(controller.can_enqueue(7, 2));
    REQUIRE_FALSE(controller.reserve_slot(7, 2));
    REQUIRE(controller.pending_count(7) == 2);

    // other requesters are independent
    REQUIRE(controller.can_enqueue(8, 2));

    controller.release_slot(7);
    REQUIRE(controller.can_enqueue(7, 2));
    controller.release_slot(7);
    controller.release_slot(7); // nothing left, no-op
    REQUIRE(controller.pending_count(7) == 0);

    // limit disabled or requester unknown
    REQUIRE(controller.can_enqueue(7, 0));
    REQUIRE(controller.can_enqueue(0, 1));
    REQUIRE_FALSE(controller.reserve_slot(0, 1));
    REQUIRE_FALSE(controller.reserve_slot(7, 0));
}

TEST_CASE("Enqueue fails without a processor or after shutdown", "[admission]") {
    AdmissionController controller({1, 1});
    REQUIRE_FALSE(controller.enqueue("flux", make_job(1, 5), false));
    REQUIRE(controller.pending_count(5) == 0);

    controller.set_processor([](const Job&) {});
    controller.shutdown();
    REQUIRE_FALSE(controller.enqueue("flux", make_job(2, 5), false));
    REQUIRE_FALSE(controller.enqueue_limited("flux", make_job(3, 5), 3));
}

TEST_CASE("Single permit serializes jobs of one topic", "[admission][scenario]") {
    Gate gate;
    AdmissionController controller({1, 1});
    controller.set_processor(std::ref(gate));

    REQUIRE(controller.enqueue("flux", make_job(1, 10), false));
    REQUIRE(controller.enqueue("flux", make_job(2, 11), false));

    REQUIRE(wait_until([&] { return gate.started().size() == 1; }));
    std::this_thread::sleep_for(50ms);
    REQUIRE(gate.started() == std::vector<MessageId>{1});
    REQUIRE(controller.get_job(2).has_value());
    REQUIRE_FALSE(controller.get_job(2)->started);
    REQUIRE(controller.pending_count(10) == 0);
    REQUIRE(controller.pending_count(11) == 1);
    REQUIRE(controller.will_queue("flux"));

    gate.release(1);
    REQUIRE(wait_until([&] { return gate.started().size() == 2; }));
    REQUIRE(gate.finished() == std::vector<MessageId>{1});
    REQUIRE(controller.pending_count(11) == 0);

    gate.release(2);
    REQUIRE(wait_until([&] { return !controller.get_job(2).has_value(); }));
    REQUIRE(gate.finished() == std::vector<MessageId>{1, 2});
    REQUIRE(controller.active_count() == 0);
    REQUIRE_FALSE(controller.will_queue("flux"));
}

TEST_CASE("Global permit is shared across topics", "[admission]") {
    Gate gate;
    AdmissionController controller({1, 2});
    controller.set_processor(std::ref(gate));

    REQUIRE(controller.enqueue("flux", make_job(1, 1), false));
    REQUIRE(wait_until([&] { return gate.started().size() == 1; }));
    REQUIRE(controller.enqueue("sdxl", make_job(2, 1), false));
    std::this_thread::sleep_for(50ms);
    REQUIRE(gate.started().size() == 1);
    REQUIRE(controller.will_queue("sdxl"));

    gate.release_all();
    REQUIRE(wait_until([&] { return gate.finished().size() == 2; }));
}

TEST_CASE("Queued jobs can be canceled exactly once", "[admission][cancel]") {
    Gate gate;
    std::atomic<int> processed_3{0};
    AdmissionController controller({1, 1});
    controller.set_processor([&](const Job& job) {
        if (job.message_id == 3) ++processed_3;
        gate(job);
    });

    REQUIRE(controller.enqueue("flux", make_job(1, 20), false));
    REQUIRE(wait_until([&] { return gate.started().size() == 1; }));
    REQUIRE(controller.enqueue("flux", make_job(3, 21), false));
    REQUIRE(controller.pending_count(21) == 1);
    REQUIRE_FALSE(controller.can_enqueue(21, 1));

    REQUIRE(controller.cancel_job(3, true));
    REQUIRE_FALSE(controller.cancel_job(3, true));
    REQUIRE(controller.pending_count(21) == 0);
    REQUIRE(controller.can_enqueue(21, 1));
    REQUIRE(controller.get_job(3)->canceled_by_admin);

    // running job cannot be canceled
    REQUIRE_FALSE(controller.cancel_job(1, false));
    // unknown id
    REQUIRE_FALSE(controller.cancel_job(42, false));

    gate.release_all();
    REQUIRE(wait_until([&] { return !controller.get_job(3).has_value(); }));
    REQUIRE(processed_3 == 0);
    REQUIRE(controller.pending_count(21) == 0);
}

TEST_CASE("Reserved enqueue does not count twice", "[admission]") {
    Gate gate;
    AdmissionController controller({1, 1});
    controller.set_processor(std::ref(gate));

    REQUIRE(controller.enqueue("flux", make_job(1, 30), false));
    REQUIRE(wait_until([&] { return gate.started().size() == 1; }));

    REQUIRE(controller.reserve_slot(31, 1));
    REQUIRE(controller.enqueue("flux", make_job(2, 31), true));
    REQUIRE(controller.pending_count(31) == 1);

    REQUIRE_FALSE(controller.enqueue_limited("flux", make_job(3, 31), 1));
    REQUIRE(controller.enqueue_limited("flux", make_job(4, 31), 2));
    REQUIRE(controller.pending_count(31) == 2);

    gate.release_all();
    REQUIRE(wait_until([&] { return gate.finished().size() == 3; }));
    REQUIRE(controller.pending_count(31) == 0);
}

TEST_CASE("Processor exceptions do not stop the worker", "[admission]") {
    std::atomic<int> calls{0};
    AdmissionController controller({1, 1});
    controller.set_processor([&](const Job& job) {
        ++calls;
        if (job.message_id == 1) throw std::runtime_error("boom");
        if (job.message_id == 2) throw 42;
    });

    REQUIRE(controller.enqueue("flux", make_job(1, 1), false));
    REQUIRE(controller.enqueue("flux", make_job(2, 1), false));
    REQUIRE(controller.enqueue("flux", make_job(3, 1), false));
    REQUIRE(wait_until([&] { return calls == 3 && !controller.get_job(3).has_value(); }));
    REQUIRE(controller.active_count() == 0);
    REQUIRE_FALSE(controller.will_queue("flux"));
}

TEST_CASE("Job canceled while waiting for the global permit is dropped", "[admission][cancel]") {
    Gate gate;
    AdmissionController controller({1, 1});
    controller.set_processor(std::ref(gate));

    // topic A holds the only permit
    REQUIRE(controller.enqueue("flux", make_job(1, 40), false));
    REQUIRE(wait_until([&] { return gate.started().size() == 1; }));

    // topic B's worker pops job 2 and blocks on the permit; 3 and 4 stay queued
    REQUIRE(controller.enqueue("sdxl", make_job(2, 41), false));
    std::this_thread::sleep_for(100ms);
    REQUIRE(controller.enqueue("sdxl", make_job(3, 41), false));
    REQUIRE(controller.enqueue("sdxl", make_job(4, 41), false));
    REQUIRE(controller.pending_count(41) == 3);

    REQUIRE(controller.cancel_job(2, false));
    REQUIRE(controller.pending_count(41) == 2);

    gate.release(1);
    REQUIRE(wait_until([&] { return gate.started().size() == 2; }));
    REQUIRE(gate.started() == std::vector<MessageId>{1, 3});
    REQUIRE_FALSE(controller.get_job(2).has_value());
    // only job 4 is still pending
    REQUIRE(controller.pending_count(41) == 1);

    gate.release_all();
    REQUIRE(wait_until([&] { return gate.finished().size() == 3; }));
    REQUIRE(controller.pending_count(41) == 0);
    const auto started = gate.started();
    REQUIRE(std::find(started.begin(), started.end(), 2) == started.end());
}

TEST_CASE("Shutdown drops queued jobs", "[admission]") {
    Gate gate;
    auto controller = std::make_unique<AdmissionController>(AdmissionController::Config{1, 1});
    controller->set_processor(std::ref(gate));

    REQUIRE(controller->enqueue("flux", make_job(1, 1), false));
    REQUIRE(wait_until([&] { return gate.started().size() == 1; }));
    REQUIRE(controller->enqueue("flux", make_job(2, 1), false));

    std::thread releaser([&] {
        std::this_thread::sleep_for(50ms);
        gate.release_all();
    });
    controller->shutdown();
    releaser.join();

    REQUIRE(gate.started() == std::vector<MessageId>{1});
    REQUIRE_FALSE(controller->get_job(2).has_value());
    REQUIRE(controller->pending_count(1) == 0);
}
