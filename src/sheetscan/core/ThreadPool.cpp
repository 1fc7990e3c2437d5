#include "sheetscan/core/ThreadPool.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

namespace sheetscan {
namespace core {

ThreadPool::ThreadPool(size_t threads)
    : stop_(false), active_tasks_(0) {

    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
        if (threads == 0) threads = 4; // 默认4个线程
    }

    UTILS_DEBUG("Creating ThreadPool with {} threads", threads);

    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::worker_loop() {
    for (;;) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            // 等待任务或停止信号
            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            // 停止且队列已空时退出
            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // packaged_task 会把任务异常存入 future，这里只会看到 future_error 之类
        try {
            task();
        } catch (const std::exception& e) {
            UTILS_ERROR("ThreadPool task exception: {}", e.what());
        }

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            --active_tasks_;
            if (active_tasks_ == 0 && tasks_.empty()) {
                finished_.notify_all();
            }
        }
    }
}

void ThreadPool::wait_for_all_tasks() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    finished_.wait(lock, [this] {
        return tasks_.empty() && active_tasks_ == 0;
    });
}

void ThreadPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_ && workers_.empty()) {
            return;
        }
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    UTILS_DEBUG("ThreadPool stopped, {} threads joined", workers_.size());
    workers_.clear();
}

}} // namespace sheetscan::core
