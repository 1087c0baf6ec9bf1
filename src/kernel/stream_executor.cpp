// nativebridge kernel: StreamExecutor implementation
#include "kernel/stream_executor.hpp"

#include <algorithm>

namespace nb {

StreamExecutor::StreamExecutor(unsigned int num_workers) : num_workers_(num_workers) {
    if (num_workers_ == 0) num_workers_ = std::max(2u, std::thread::hardware_concurrency());
}

StreamExecutor::~StreamExecutor() { stop(); }

void StreamExecutor::start() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (running_) return;
    running_ = true;
    stopping_ = false;
    for (unsigned int i = 0; i < num_workers_; ++i) {
        workers_.emplace_back(&StreamExecutor::run_loop, this);
    }
}

void StreamExecutor::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!running_) return;
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
    workers_.clear();
    running_ = false;
}

void StreamExecutor::submit(Task&& task) {
    if (!running_) start();
    pending_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        queue_.push(std::move(task));
    }
    cv_.notify_one();
}

void StreamExecutor::wait_idle() {
    std::unique_lock<std::mutex> lk(idle_mtx_);
    cv_idle_.wait(lk, [&] { return pending_.load() == 0; });
}

void StreamExecutor::run_loop() {
    while (true) {
        Task job;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [&] { return stopping_ || !queue_.empty(); });
            // Drain the queue before honoring stop so no stream loses its sentinel.
            if (queue_.empty()) break;
            job = std::move(queue_.front());
            queue_.pop();
        }
        try {
            job();
        } catch (const std::exception&) {
            // Exceptions are propagated to futures via packaged_task when callers use get().
        } catch (...) {
            // Unknown exception type; keep the worker alive.
        }
        {
            std::lock_guard<std::mutex> lk(idle_mtx_);
            pending_.fetch_sub(1);
        }
        cv_idle_.notify_all();
    }
}

} // namespace nb
