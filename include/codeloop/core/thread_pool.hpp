/*
 * codeloop - Fixed-size thread pool
 *
 * FIFO job queue drained by N worker threads. shutdown() lets queued
 * jobs finish before joining.
 */
#ifndef codeloop_CORE_THREAD_POOL_HPP
#define codeloop_CORE_THREAD_POOL_HPP

#include <functional>
#include <vector>
#include <deque>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <cstddef>

namespace codeloop {

class ThreadPool {
public:
    typedef std::function<void()> Job;

    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    // Returns false once shutdown() has been called.
    bool enqueue(Job job);

    // Jobs queued but not yet started
    size_t pending() const;

    // Block until the queue is empty and no job is running.
    void wait_idle();

    // Finish queued jobs, then join all workers. Idempotent.
    void shutdown();

    size_t size() const { return workers_.size(); }

private:
    ThreadPool(const ThreadPool&);
    ThreadPool& operator=(const ThreadPool&);

    void worker_loop();

    std::vector<std::thread> workers_;
    std::deque<Job> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable job_cv_;
    std::condition_variable idle_cv_;
    size_t active_;
    bool stopping_;
};

} // namespace codeloop

#endif // codeloop_CORE_THREAD_POOL_HPP
