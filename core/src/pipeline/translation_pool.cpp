//! # Translation Pool Implementation
//!
//! ## Thread Safety
//!
//! | Component     | Synchronization                          |
//! |---------------|------------------------------------------|
//! | JobQueue      | Mutex-protected queue                    |
//! | Cancellation  | Atomic flag checked before each job      |
//! | Job results   | Each job is owned by one worker at a time |

#include "pipeline/translation_pool.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <thread>

namespace polydoc::pipeline {

// ============================================================================
// JobQueue Implementation
// ============================================================================

void JobQueue::push(std::shared_ptr<TranslationJob> job) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(job));
}

auto JobQueue::pop() -> std::shared_ptr<TranslationJob> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return nullptr;
    }
    auto job = queue_.front();
    queue_.pop();
    return job;
}

auto JobQueue::size() -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// ============================================================================
// TranslationPool Implementation
// ============================================================================

TranslationPool::TranslationPool(size_t max_workers) : max_workers_(max_workers) {
    if (max_workers_ == 0) {
        max_workers_ = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
}

void TranslationPool::worker(const std::string& stage) {
    while (auto job = queue_.pop()) {
        if (cancelled_) {
            job->skipped = true;
            continue;
        }

        try {
            job->result = job->task();
        } catch (const std::exception& e) {
            job->result = PipelineError::stage_failure(stage, e.what());
        }

        if (is_err(*job->result)) {
            if (!cancelled_.exchange(true)) {
                POLYDOC_LOG_DEBUG("docgen", "translation job " << job->index
                                                               << " failed, cancelling the rest");
            }
        } else {
            ++completed_;
        }
    }
}

auto TranslationPool::run(std::vector<TranslationTask> tasks, const std::string& stage)
    -> PipelineResult<std::vector<PlatformTranslation>> {
    cancelled_ = false;
    completed_ = 0;

    std::vector<std::shared_ptr<TranslationJob>> jobs;
    jobs.reserve(tasks.size());
    for (size_t i = 0; i < tasks.size(); ++i) {
        auto job = std::make_shared<TranslationJob>();
        job->index = i;
        job->task = std::move(tasks[i]);
        jobs.push_back(job);
        queue_.push(job);
    }

    size_t thread_count = std::min(jobs.size(), max_workers_);
    POLYDOC_LOG_DEBUG("docgen", "translating " << jobs.size() << " platform(s) with "
                                               << thread_count << " worker(s)");

    std::vector<std::thread> workers;
    workers.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        workers.emplace_back(&TranslationPool::worker, this, std::cref(stage));
    }
    for (auto& worker : workers) {
        worker.join();
    }

    std::vector<PlatformTranslation> results;
    results.reserve(jobs.size());
    for (auto& job : jobs) {
        if (job->result && is_err(*job->result)) {
            auto err = unwrap_err(*job->result);
            if (err.stage.empty()) {
                err.stage = stage;
            }
            return err;
        }
    }
    for (auto& job : jobs) {
        if (!job->result) {
            return PipelineError::stage_failure(stage, "translation was cancelled");
        }
        results.push_back(std::move(unwrap(*job->result)));
    }
    return results;
}

} // namespace polydoc::pipeline
