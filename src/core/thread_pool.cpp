#include <codeloop/core/thread_pool.hpp>
#include <codeloop/core/logger.hpp>
#include <exception>

namespace codeloop {

ThreadPool::ThreadPool(size_t num_threads)
    : active_(0)
    , stopping_(false)
{
    if (num_threads == 0) {
        num_threads = 1;
    }
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.push_back(std::thread(&ThreadPool::worker_loop, this));
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::enqueue(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        jobs_.push_back(job);
    }
    job_cv_.notify_one();
    return true;
}

size_t ThreadPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void ThreadPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return jobs_.empty() && active_ == 0; });
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
    }
    job_cv_.notify_all();
    for (size_t i = 0; i < workers_.size(); ++i) {
        if (workers_[i].joinable()) {
            workers_[i].join();
        }
    }
    workers_.clear();
}

void ThreadPool::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            job_cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                return;   // stopping and drained
            }
            job = jobs_.front();
            jobs_.pop_front();
            ++active_;
        }

        try {
            job();
        } catch (const std::exception& e) {
            LOG_ERROR("[ThreadPool] Job threw: %s", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
            if (jobs_.empty() && active_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}

} // namespace codeloop
