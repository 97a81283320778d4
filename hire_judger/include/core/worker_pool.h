/**
 * @file worker_pool.h
 * @brief 固定大小的评测线程池
 *
 * 每个任务是一次测试点执行。任务之间只共享只读的题库和配置，
 * 结果由调用方写回预先分配好的槽位，不需要额外同步。
 */

#ifndef HIRE_CORE_WORKER_POOL_H
#define HIRE_CORE_WORKER_POOL_H

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>

namespace hire {

class WorkerPool {
private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cond_;
    bool stop_ = false;

    void worker_loop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cond_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
        }
    }

public:
    /**
     * @param threads 线程数，0 表示按 CPU 数（取不到时为 2）
     */
    explicit WorkerPool(unsigned threads) {
        if (threads == 0) {
            threads = std::thread::hardware_concurrency();
            if (threads == 0) threads = 2;
        }
        workers_.reserve(threads);
        for (unsigned i = 0; i < threads; i++) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief 析构时先执行完队列中剩余的任务
     */
    ~WorkerPool() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cond_.notify_all();
        for (auto &w : workers_) {
            if (w.joinable()) {
                w.join();
            }
        }
    }

    size_t size() const { return workers_.size(); }

    /**
     * @brief 提交任务，任务内抛出的异常由 future::get() 重新抛出
     */
    template<typename F>
    auto submit(F &&fn) -> std::future<decltype(fn())> {
        using R = decltype(fn());
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> fut = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_) {
                throw std::runtime_error("submit on stopped WorkerPool");
            }
            tasks_.emplace([task] { (*task)(); });
        }
        cond_.notify_one();
        return fut;
    }
};

} // namespace hire

#endif // HIRE_CORE_WORKER_POOL_H
