#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <utility>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>
#include "../core/shutdown/closeable.hpp"

namespace grace::adapters {

// Пул воркеров, который при close() дорабатывает очередь до конца и только
// потом останавливает потоки. Закрывать раньше того, от чего зависят задачи.
class WorkQueue final : public core::Closeable {
public:
    explicit WorkQueue(std::size_t nthreads = 1);
    ~WorkQueue() override;

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    // После close() задачи не принимаются
    template<typename F>
    [[nodiscard]] auto submit(F&& f) -> infra::VoidResult;

    [[nodiscard]] auto close() -> infra::VoidResult override;

    [[nodiscard]] auto pending() const -> std::size_t;
    [[nodiscard]] auto completed() const -> std::uint64_t {
        return completed_.load(std::memory_order_relaxed);
    }

private:
    void worker_loop_();

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::atomic<std::uint64_t> completed_{0};
};

// =============== Реализация шаблонов ===============

template<typename F>
auto WorkQueue::submit(F&& f) -> infra::VoidResult {
    {
        std::lock_guard lock(queue_mutex_);
        if (stop_) {
            return std::unexpected(infra::make_error(infra::ErrorCode::QueueClosed,
                                                     "work queue is closed"));
        }
        tasks_.emplace(std::forward<F>(f));
    }
    cv_.notify_one();
    return {};
}

} // namespace grace::adapters
