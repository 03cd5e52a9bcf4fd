//! # Translation Pool
//!
//! Runs the per-platform translations on a bounded set of worker threads.
//!
//! ## Components
//!
//! | Class             | Description                                 |
//! |-------------------|---------------------------------------------|
//! | `TranslationJob`  | One platform's translation task and result  |
//! | `JobQueue`        | Thread-safe queue of pending jobs           |
//! | `TranslationPool` | Fans jobs out to workers and joins them     |
//!
//! The first failing job cancels the run: queued jobs are skipped, jobs
//! already running finish, and `run()` returns the failure of the earliest
//! failed job (in submission order).

#ifndef POLYDOC_PIPELINE_TRANSLATION_POOL_HPP
#define POLYDOC_PIPELINE_TRANSLATION_POOL_HPP

#include "model/documentable.hpp"
#include "pipeline/error.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

namespace polydoc::pipeline {

/// The two modules produced for one platform.
struct PlatformTranslation {
    model::PlatformData platform;
    model::Module symbol_module;
    model::Module file_module;
};

using TranslationTask = std::function<PipelineResult<PlatformTranslation>()>;

struct TranslationJob {
    size_t index = 0;
    TranslationTask task;
    std::optional<PipelineResult<PlatformTranslation>> result;
    bool skipped = false;
};

class JobQueue {
public:
    void push(std::shared_ptr<TranslationJob> job);

    /// Pops the next job, or nullptr once the queue is drained.
    auto pop() -> std::shared_ptr<TranslationJob>;

    [[nodiscard]] auto size() -> size_t;

private:
    std::queue<std::shared_ptr<TranslationJob>> queue_;
    std::mutex mutex_;
};

class TranslationPool {
public:
    /// `max_workers == 0` uses the hardware concurrency.
    explicit TranslationPool(size_t max_workers = 0);

    /// Runs every task and waits for all workers.
    ///
    /// Results are returned in submission order. An escaping
    /// `std::exception` counts as a stage failure of that task.
    [[nodiscard]] auto run(std::vector<TranslationTask> tasks, const std::string& stage)
        -> PipelineResult<std::vector<PlatformTranslation>>;

    [[nodiscard]] auto cancelled() const -> bool {
        return cancelled_.load();
    }

    /// Number of tasks that ran to completion in the last `run()`.
    [[nodiscard]] auto completed() const -> size_t {
        return completed_.load();
    }

private:
    void worker(const std::string& stage);

    size_t max_workers_;
    JobQueue queue_;
    std::atomic<bool> cancelled_{false};
    std::atomic<size_t> completed_{0};
};

} // namespace polydoc::pipeline

#endif // POLYDOC_PIPELINE_TRANSLATION_POOL_HPP
