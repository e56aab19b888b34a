#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace memobuild {

/**
 * @brief Fixed-size pool of worker threads draining a FIFO task queue.
 *
 * Tasks must not block on futures of other tasks submitted to the same pool; callers fan out
 * from outside the pool and join there.
 */
class WorkerPool {
public:
    /** @param threads Number of workers; 0 picks std::thread::hardware_concurrency(). */
    explicit WorkerPool(size_t threads = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    template <typename Fn>
    std::future<std::invoke_result_t<Fn>> submit(Fn &&fn) {
        using R = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
        std::future<R> fut = task->get_future();
        enqueue([task] { (*task)(); });
        return fut;
    }

    size_t size() const {
        return workers_.size();
    }

    /** @brief Blocks until the queue is empty and no task is running. */
    void wait_idle();

private:
    void enqueue(std::function<void()> task);
    void worker_loop(std::stop_token stop);

    std::mutex mtx_;
    std::condition_variable_any cv_ready_;
    std::condition_variable cv_idle_;
    std::queue<std::function<void()>> tasks_;
    size_t active_ = 0;
    std::vector<std::jthread> workers_;
};

} // namespace memobuild
