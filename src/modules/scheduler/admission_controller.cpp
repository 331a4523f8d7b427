// modules/scheduler/admission_controller.cpp
#include "scheduler/admission_controller.h"
#include "common/logging/logger.h"
#include <algorithm>
#include <chrono>

namespace comfyflow {

namespace {

constexpr std::chrono::milliseconds kPermitPollInterval{100};

} // namespace

AdmissionController::AdmissionController(Config config)
    : config_(config),
      global_permits_(std::max(1, config.max_workers)) {
    config_.max_workers = std::max(1, config_.max_workers);
    config_.per_topic_limit = std::max(1, config_.per_topic_limit);
    COMFYFLOW_INFO("AdmissionController init: max_workers={}, per_topic_limit={}",
                   config_.max_workers, config_.per_topic_limit);
}

AdmissionController::~AdmissionController() {
    shutdown();
}

void AdmissionController::set_processor(Processor processor) {
    std::lock_guard<std::mutex> lock(mutex_);
    processor_ = std::move(processor);
}

// --- pending counters ---

void AdmissionController::inc_pending_locked(RequesterId requester) {
    if (requester <= 0) return;
    ++pending_by_requester_[requester];
}

void AdmissionController::dec_pending_locked(RequesterId requester) {
    if (requester <= 0) return;
    auto it = pending_by_requester_.find(requester);
    if (it == pending_by_requester_.end()) return;
    if (it->second <= 1) {
        pending_by_requester_.erase(it);
    } else {
        --it->second;
    }
}

bool AdmissionController::can_enqueue(RequesterId requester, int per_requester_limit) const {
    if (requester <= 0 || per_requester_limit <= 0) {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_by_requester_.find(requester);
    const int pending = it == pending_by_requester_.end() ? 0 : it->second;
    return pending < per_requester_limit;
}

bool AdmissionController::reserve_slot(RequesterId requester, int per_requester_limit) {
    if (requester <= 0 || per_requester_limit <= 0) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_by_requester_.find(requester);
    const int pending = it == pending_by_requester_.end() ? 0 : it->second;
    if (pending >= per_requester_limit) {
        return false;
    }
    inc_pending_locked(requester);
    return true;
}

void AdmissionController::release_slot(RequesterId requester) {
    std::lock_guard<std::mutex> lock(mutex_);
    dec_pending_locked(requester);
}

int AdmissionController::pending_count(RequesterId requester) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_by_requester_.find(requester);
    return it == pending_by_requester_.end() ? 0 : it->second;
}

size_t AdmissionController::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_global_;
}

// --- enqueue ---

AdmissionController::TopicPool& AdmissionController::ensure_pool_locked(const std::string& alias) {
    auto it = pools_.find(alias);
    if (it != pools_.end()) {
        return *it->second;
    }
    auto pool = std::make_unique<TopicPool>();
    TopicPool* raw = pool.get();
    pools_.emplace(alias, std::move(pool));
    for (int i = 0; i < config_.per_topic_limit; ++i) {
        raw->workers.emplace_back(&AdmissionController::worker_loop, this, alias, raw);
    }
    return *raw;
}

bool AdmissionController::push_locked(const std::string& alias, std::shared_ptr<Job> job, bool count_pending) {
    if (closed_ || !processor_ || !job) {
        return false;
    }
    TopicPool& pool = ensure_pool_locked(alias);
    registry_[job->message_id] = job;
    if (count_pending) {
        inc_pending_locked(job->requester_id);
    }
    pool.queue.push_back(std::move(job));
    pool.cv.notify_one();
    return true;
}

bool AdmissionController::enqueue(const std::string& alias, std::shared_ptr<Job> job, bool reserved) {
    std::lock_guard<std::mutex> lock(mutex_);
    return push_locked(alias, std::move(job), !reserved);
}

bool AdmissionController::enqueue_limited(const std::string& alias, std::shared_ptr<Job> job, int per_requester_limit) {
    if (!job) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    if (per_requester_limit > 0 && job->requester_id > 0) {
        auto it = pending_by_requester_.find(job->requester_id);
        const int pending = it == pending_by_requester_.end() ? 0 : it->second;
        if (pending >= per_requester_limit) {
            return false;
        }
    }
    return push_locked(alias, std::move(job), true);
}

bool AdmissionController::will_queue(const std::string& alias) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(alias);
    if (it != pools_.end()) {
        const TopicPool& pool = *it->second;
        if (!pool.queue.empty()) return true;
        if (pool.active >= static_cast<size_t>(config_.per_topic_limit)) return true;
    }
    return active_global_ >= static_cast<size_t>(config_.max_workers);
}

// --- cancellation / lookup ---

bool AdmissionController::cancel_job(MessageId message_id, bool by_admin) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(message_id);
    if (it == registry_.end()) {
        return false;
    }
    Job& job = *it->second;
    if (job.started || job.canceled) {
        return false;
    }
    job.canceled = true;
    job.canceled_by_admin = by_admin;
    dec_pending_locked(job.requester_id);
    COMFYFLOW_INFO("Job canceled (message_id={}, by_admin={}, corr={})", message_id, by_admin, job.correlation_id);
    return true;
}

std::optional<Job> AdmissionController::get_job(MessageId message_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(message_id);
    if (it == registry_.end()) {
        return std::nullopt;
    }
    return *it->second;
}

// --- workers ---

void AdmissionController::worker_loop(std::string alias, TopicPool* pool) {
    COMFYFLOW_INFO("Worker started for topic: {}", alias);
    for (;;) {
        std::shared_ptr<Job> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            pool->cv.wait(lock, [&] { return closed_ || !pool->queue.empty(); });
            if (closed_) break;
            job = std::move(pool->queue.front());
            pool->queue.pop_front();
            if (job->canceled) {
                // pending was already released by cancel_job
                registry_.erase(job->message_id);
                continue;
            }
        }

        bool acquired = false;
        while (!acquired) {
            acquired = global_permits_.try_acquire_for(kPermitPollInterval);
            if (!acquired) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_) break;
            }
        }
        if (!acquired) break;

        Processor processor;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                global_permits_.release();
                break;
            }
            // canceled while waiting for a permit
            if (job->canceled) {
                registry_.erase(job->message_id);
                global_permits_.release();
                continue;
            }
            dec_pending_locked(job->requester_id);
            job->started = true;
            ++active_global_;
            ++pool->active;
            processor = processor_;
        }

        try {
            if (!processor) {
                COMFYFLOW_ERROR("Processor is not set; dropping job (topic={}, corr={})", alias, job->correlation_id);
            } else {
                processor(*job);
            }
        } catch (const std::exception& e) {
            COMFYFLOW_ERROR("Job failed (topic={}, corr={}): {}", alias, job->correlation_id, e.what());
        } catch (...) {
            COMFYFLOW_ERROR("Job failed (topic={}, corr={}): unknown exception", alias, job->correlation_id);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (active_global_ > 0) --active_global_;
            if (pool->active > 0) --pool->active;
            registry_.erase(job->message_id);
        }
        global_permits_.release();
    }
    COMFYFLOW_INFO("Worker stopped for topic: {}", alias);
}

void AdmissionController::shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        for (auto& [alias, pool] : pools_) {
            if (!pool->queue.empty()) {
                COMFYFLOW_WARN("Dropping {} queued job(s) for topic {} on shutdown", pool->queue.size(), alias);
            }
            for (auto& t : pool->workers) {
                workers.push_back(std::move(t));
            }
            pool->workers.clear();
            pool->cv.notify_all();
        }
    }

    for (auto& t : workers) {
        if (!t.joinable()) continue;
        if (t.get_id() == std::this_thread::get_id()) {
            // shutdown() called from inside a processor
            t.detach();
        } else {
            t.join();
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [alias, pool] : pools_) {
        pool->queue.clear();
    }
    registry_.clear();
    pending_by_requester_.clear();
}

} // namespace comfyflow
