#include "memobuild/worker_pool.hpp"

namespace memobuild {

WorkerPool::WorkerPool(size_t threads) {
    if (threads == 0)
        threads = std::thread::hardware_concurrency();
    if (threads == 0)
        threads = 1;

    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) { worker_loop(stop); });
    }
}

WorkerPool::~WorkerPool() {
    for (auto &w : workers_)
        w.request_stop();
    cv_ready_.notify_all();
    workers_.clear(); // joins
}

void WorkerPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard lock(mtx_);
        tasks_.push(std::move(task));
    }
    cv_ready_.notify_one();
}

void WorkerPool::wait_idle() {
    std::unique_lock lock(mtx_);
    cv_idle_.wait(lock, [&] { return tasks_.empty() && active_ == 0; });
}

void WorkerPool::worker_loop(std::stop_token stop) {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(mtx_);
            // returns false when stop was requested and nothing is left to do
            if (!cv_ready_.wait(lock, stop, [&] { return !tasks_.empty(); }))
                return;
            task = std::move(tasks_.front());
            tasks_.pop();
            active_++;
        }

        task();

        {
            std::lock_guard lock(mtx_);
            active_--;
            if (tasks_.empty() && active_ == 0)
                cv_idle_.notify_all();
        }
    }
}

} // namespace memobuild
