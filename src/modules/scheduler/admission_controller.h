// modules/scheduler/admission_controller.h
#ifndef COMFYFLOW_MODULES_SCHEDULER_ADMISSION_CONTROLLER_H
#define COMFYFLOW_MODULES_SCHEDULER_ADMISSION_CONTROLLER_H

#include "core/types/job.h"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <semaphore>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace comfyflow {

// Per-topic worker pools under a global concurrency cap, plus a per-requester
// cap on accepted-but-not-started jobs and cancellation of queued jobs.
//
// Job lifecycle: queued -> (canceled | started -> finished). All bookkeeping
// (pending counters, job registry, queues, started/canceled flags) lives
// behind one mutex.
class AdmissionController {
public:
    struct Config {
        int max_workers = 2;     // global concurrency permits
        int per_topic_limit = 1; // worker threads per topic alias
    };

    // Runs templating + submission + delivery for one job and reports its own
    // failures. Exceptions that escape are logged and dropped.
    using Processor = std::function<void(const Job&)>;

    explicit AdmissionController(Config config);
    ~AdmissionController();

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    void set_processor(Processor processor);

    // Read-only limit check; limit <= 0 or requester <= 0 always allows
    bool can_enqueue(RequesterId requester, int per_requester_limit) const;

    // Check-and-increment the pending counter. Returns false when the limit is
    // reached, or when limiting does not apply (nothing reserved).
    bool reserve_slot(RequesterId requester, int per_requester_limit);

    // Undo one reservation; no-op if nothing is pending
    void release_slot(RequesterId requester);

    // Register + count (unless `reserved`) + append to the topic queue.
    // False if shut down or no processor is set; the caller then releases
    // its reservation.
    bool enqueue(const std::string& alias, std::shared_ptr<Job> job, bool reserved);

    // Limit check and enqueue in one critical section
    bool enqueue_limited(const std::string& alias, std::shared_ptr<Job> job, int per_requester_limit);

    // Best-effort guess whether a new job for `alias` would wait; only used
    // to pick a status label
    bool will_queue(const std::string& alias) const;

    // Succeeds only for a registered job that has neither started nor been
    // canceled; frees the requester's pending slot immediately
    bool cancel_job(MessageId message_id, bool by_admin);

    // Snapshot of a queued or running job
    std::optional<Job> get_job(MessageId message_id) const;

    int pending_count(RequesterId requester) const;
    size_t active_count() const;

    // Stop accepting work, let workers finish their current job and exit,
    // then clear all state. Jobs still queued are dropped.
    void shutdown();

private:
    struct TopicPool {
        std::deque<std::shared_ptr<Job>> queue;
        std::vector<std::thread> workers;
        std::condition_variable cv;
        size_t active = 0;
    };

    Config config_;
    Processor processor_;
    bool closed_ = false;

    mutable std::mutex mutex_;
    std::counting_semaphore<> global_permits_;
    size_t active_global_ = 0;

    std::unordered_map<std::string, std::unique_ptr<TopicPool>> pools_;
    std::unordered_map<MessageId, std::shared_ptr<Job>> registry_;
    std::unordered_map<RequesterId, int> pending_by_requester_;

    // Callers hold mutex_
    TopicPool& ensure_pool_locked(const std::string& alias);
    void inc_pending_locked(RequesterId requester);
    void dec_pending_locked(RequesterId requester);
    bool push_locked(const std::string& alias, std::shared_ptr<Job> job, bool count_pending);

    void worker_loop(std::string alias, TopicPool* pool);
};

} // namespace comfyflow

#endif // COMFYFLOW_MODULES_SCHEDULER_ADMISSION_CONTROLLER_H
