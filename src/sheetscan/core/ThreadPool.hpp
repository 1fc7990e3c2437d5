#pragma once

#include <vector>
#include <queue>
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future>
#include <functional>
#include <type_traits>
#include "sheetscan/core/Exception.hpp"

namespace sheetscan {
namespace core {

/**
 * @brief 固定大小线程池
 *
 * 工作簿级并行处理使用：每个工作表一个任务，结果通过 future 按提交顺序取回。
 */
class ThreadPool {
public:
    /**
     * @brief 构造函数
     * @param threads 线程数量，0 表示硬件并发数
     */
    explicit ThreadPool(size_t threads = 0);

    /**
     * @brief 析构函数，执行完队列中剩余任务后回收线程
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief 提交任务
     * @return std::future 用于获取任务结果，任务抛出的异常在 get() 时重新抛出
     * @throws OperationException 线程池已停止
     */
    template<class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    size_t size() const { return workers_.size(); }

    size_t pending_tasks() const {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        return tasks_.size();
    }

    /**
     * @brief 等待所有任务完成
     */
    void wait_for_all_tasks();

    /**
     * @brief 停止接收新任务并回收线程（幂等）
     */
    void shutdown();

    bool is_stopped() const {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        return stop_;
    }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::condition_variable finished_;

    bool stop_;
    size_t active_tasks_;
};

template<class F, class... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {

    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> res = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        if (stop_) {
            throw OperationException("enqueue on stopped ThreadPool", "enqueue",
                                     ErrorCode::PoolStopped, __FILE__, __LINE__);
        }

        tasks_.emplace([task]() { (*task)(); });
        ++active_tasks_;
    }

    condition_.notify_one();
    return res;
}

}} // namespace sheetscan::core
