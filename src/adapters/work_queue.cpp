#include "work_queue.hpp"
#include <exception>

namespace grace::adapters {

WorkQueue::WorkQueue(std::size_t nthreads) {
    if (nthreads == 0) nthreads = 1;
    workers_.reserve(nthreads);
    for (std::size_t i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this] { worker_loop_(); });
    }
}

WorkQueue::~WorkQueue() {
    bool running = false;
    {
        std::lock_guard lock(queue_mutex_);
        running = !stop_;
    }
    if (running) {
        if (auto res = close(); !res) {
            spdlog::warn("Work queue shutdown: {}", res.error().message);
        }
    }
}

void WorkQueue::worker_loop_() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lock(queue_mutex_);
            cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            // stop_ выставлен, но очередь дорабатываем до конца
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Work queue task failed: {}", e.what());
        }
        completed_.fetch_add(1, std::memory_order_relaxed);
    }
}

auto WorkQueue::close() -> infra::VoidResult {
    {
        std::lock_guard lock(queue_mutex_);
        if (stop_) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ResourceCloseFailure,
                                                     "work queue already closed"));
        }
        stop_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    spdlog::debug("Work queue drained, {} task(s) completed", completed());
    return {};
}

auto WorkQueue::pending() const -> std::size_t {
    std::lock_guard lock(queue_mutex_);
    return tasks_.size();
}

} // namespace grace::adapters
