#include "internal.h"

namespace ferry {

WorkerPool::WorkerPool(size_t threads, size_t queue_limit)
    : queue_limit_(queue_limit == 0 ? 1 : queue_limit)
{
    if (threads == 0) threads = 1;
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { run(); });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stop_ = true;
    }
    task_ready_.notify_all();
    space_ready_.notify_all();
    for (auto& t : workers_) t.join();
}

void WorkerPool::submit(std::function<void()> task) {
    std::unique_lock<std::mutex> lk(mutex_);
    space_ready_.wait(lk, [this] { return stop_ || tasks_.size() < queue_limit_; });
    if (stop_) return;
    tasks_.push(std::move(task));
    task_ready_.notify_one();
}

void WorkerPool::wait() {
    std::unique_lock<std::mutex> lk(mutex_);
    idle_.wait(lk, [this] { return tasks_.empty() && active_ == 0; });
    if (error_) {
        auto err = error_;
        error_ = nullptr;
        std::rethrow_exception(err);
    }
}

void WorkerPool::run() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lk(mutex_);
            task_ready_.wait(lk, [this] { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }
        space_ready_.notify_one();

        std::exception_ptr err;
        try {
            task();
        } catch (...) {
            err = std::current_exception();
        }

        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (err && !error_) error_ = err;
            --active_;
            if (tasks_.empty() && active_ == 0) idle_.notify_all();
        }
    }
}

} // namespace ferry
