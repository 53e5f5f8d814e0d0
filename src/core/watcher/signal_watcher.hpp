#pragma once

#include <future>
#include <thread>
#include "../../infra/interrupt.hpp"

namespace grace::core {

// Слушает SignalSource в отдельном потоке и отдаёт первый сигнал ровно один раз.
// Результат кладётся в слот ёмкостью 1 (promise), так что поток-наблюдатель
// никогда не блокируется на записи, даже если wait() ещё не вызван.
class SignalWatcher {
public:
    explicit SignalWatcher(infra::SignalSource& source);
    ~SignalWatcher() = default;

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    /// Блокирует до первого сигнала. Повторные вызовы возвращают тот же сигнал.
    [[nodiscard]] auto wait() const -> infra::SignalEvent;

    [[nodiscard]] auto ready() const -> bool;

private:
    std::promise<infra::SignalEvent> slot_;
    std::shared_future<infra::SignalEvent> event_;
    std::jthread task_; // последним: поток стартует, когда слот уже готов
};

} // namespace grace::core
