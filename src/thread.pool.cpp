#include "thread.pool.hh"

#include <algorithm>
#include <exception>

namespace {
std::string
run_job(const volzarr::ThreadPool::Job& job)
{
    try {
        job();
    } catch (const std::exception& exc) {
        return exc.what()[0] == '\0' ? "Job failed" : exc.what();
    }
    return {};
}
} // namespace

volzarr::ThreadPool::ThreadPool(unsigned int n_threads)
{
    const auto max_threads = std::max(std::thread::hardware_concurrency(), 1u);
    n_threads = std::clamp(n_threads, 1u, max_threads);

    for (auto i = 1u; i < n_threads; ++i) {
        workers_.emplace_back([this] { process_batches_(); });
    }
}

volzarr::ThreadPool::~ThreadPool() noexcept
{
    {
        std::scoped_lock lock(mutex_);
        stopping_ = true;
        cv_.notify_all();
    }

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::vector<std::string>
volzarr::ThreadPool::run_all(std::vector<Job>& jobs)
{
    std::scoped_lock run_lock(run_mutex_);

    auto batch = std::make_shared<Batch>();
    batch->jobs = &jobs;
    batch->n_jobs = jobs.size();
    batch->errors.resize(jobs.size());
    if (jobs.empty()) {
        return {};
    }

    std::unique_lock lock(mutex_);
    batch_ = batch;
    cv_.notify_all();

    drain_(batch, lock);
    batch->done_cv.wait(lock,
                        [&] { return batch->finished == batch->n_jobs; });
    batch_.reset();

    return std::move(batch->errors);
}

size_t
volzarr::ThreadPool::n_threads() const noexcept
{
    return workers_.size() + 1;
}

void
volzarr::ThreadPool::drain_(const std::shared_ptr<Batch>& batch,
                            std::unique_lock<std::mutex>& lock)
{
    while (batch->next < batch->n_jobs) {
        const auto index = batch->next++;
        const auto& job = (*batch->jobs)[index];

        lock.unlock();
        auto error = run_job(job);
        lock.lock();

        batch->errors[index] = std::move(error);
        if (++batch->finished == batch->n_jobs) {
            batch->done_cv.notify_all();
        }
    }
}

void
volzarr::ThreadPool::process_batches_()
{
    std::unique_lock lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] {
            return stopping_ ||
                   (batch_ && batch_->next < batch_->n_jobs);
        });

        if (stopping_) {
            break;
        }

        auto batch = batch_;
        drain_(batch, lock);
    }
}
