#pragma once

#include <array>
#include <atomic>
#include <concepts>
#include <functional>
#include <future>
#include <optional>
#include <spdlog/logger.h>
#include "closeable.hpp"
#include "../../infra/interrupt.hpp"

namespace grace::core {

enum class ShutdownState {
    Idle,
    WaitingForSignal,
    Closing,
    Finished,
};

// Одноразовое уведомление о завершении: значение уже лежит внутри,
// читать можно сколько угодно раз.
using Completion = std::shared_future<bool>;

// Шов для завершения процесса (по умолчанию std::exit)
using Terminator = std::function<void(int)>;

[[nodiscard]] auto default_terminator() -> Terminator;

class ShutdownOrchestrator {
public:
    ShutdownOrchestrator(spdlog::logger& logger,
                         infra::SignalSource& source,
                         Terminator terminator = default_terminator());

    ShutdownOrchestrator(const ShutdownOrchestrator&) = delete;
    ShutdownOrchestrator& operator=(const ShutdownOrchestrator&) = delete;

    /// Ждёт сигнал, закрывает ресурсы по порядку, возвращает управление вызывающему.
    /// Ошибки закрытия только логируются. Объект одноразовый: повторный вызов
    /// бросает std::logic_error.
    [[nodiscard]] auto handle(ResourceList resources) -> Completion;

    template<std::derived_from<Closeable>... Rs>
    [[nodiscard]] auto handle(Rs&... resources) -> Completion {
        const std::array<std::reference_wrapper<Closeable>, sizeof...(Rs)> list{resources...};
        return handle(ResourceList{list});
    }

    /// То же самое, затем завершает процесс с EXIT_SUCCESS.
    [[noreturn]] void handle_and_terminate(ResourceList resources);

    template<std::derived_from<Closeable>... Rs>
    [[noreturn]] void handle_and_terminate(Rs&... resources) {
        const std::array<std::reference_wrapper<Closeable>, sizeof...(Rs)> list{resources...};
        handle_and_terminate(ResourceList{list});
    }

    [[nodiscard]] auto state() const -> ShutdownState {
        return state_.load(std::memory_order_acquire);
    }

    // Сигнал, прервавший ожидание (после возврата из handle)
    [[nodiscard]] auto received() const -> std::optional<infra::SignalEvent> {
        return received_;
    }

private:
    void run_(ResourceList resources);
    void close_all_(ResourceList resources);

    spdlog::logger& logger_;
    infra::SignalSource& source_;
    Terminator terminator_;
    std::atomic<ShutdownState> state_{ShutdownState::Idle};
    std::optional<infra::SignalEvent> received_;
};

[[nodiscard]] auto to_string(ShutdownState state) -> std::string_view;

} // namespace grace::core
