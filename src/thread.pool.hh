#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace volzarr {
/**
 * @brief Runs batches of independent jobs to completion.
 * @details The calling thread works on the batch alongside n_threads - 1
 * workers, so a pool of one runs every job inline.
 */
class ThreadPool
{
  public:
    // A job fails by throwing; the exception message becomes its outcome.
    using Job = std::function<void()>;

    explicit ThreadPool(unsigned int n_threads);
    ~ThreadPool() noexcept;

    /**
     * @brief Run every job in @p jobs and block until all have finished.
     * @return One entry per job, in order: empty if the job succeeded, the
     * diagnostic message otherwise.
     */
    std::vector<std::string> run_all(std::vector<Job>& jobs);

    /**
     * @brief Number of threads working on a batch, the caller included.
     */
    size_t n_threads() const noexcept;

  private:
    struct Batch
    {
        std::vector<Job>* jobs{ nullptr };
        size_t n_jobs{ 0 };
        size_t next{ 0 };
        size_t finished{ 0 };
        std::vector<std::string> errors;
        std::condition_variable done_cv;
    };

    std::vector<std::thread> workers_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::shared_ptr<Batch> batch_;
    bool stopping_{ false };

    std::mutex run_mutex_; // one batch at a time

    // runs jobs from @p batch until none are left; expects mutex_ held
    void drain_(const std::shared_ptr<Batch>& batch,
                std::unique_lock<std::mutex>& lock);
    void process_batches_();
};
} // namespace volzarr
