#pragma once

#include <csignal>
#include <signal.h>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "error_handler/error.hpp"

namespace grace::infra {

enum class SignalEvent {
    Interrupt,  // SIGINT
    Terminate,  // SIGTERM
    Quit,       // SIGQUIT
};

[[nodiscard]] auto signal_name(SignalEvent event) -> std::string_view;
[[nodiscard]] auto to_signal_event(int signo) -> std::optional<SignalEvent>;
[[nodiscard]] auto to_signal_number(SignalEvent event) -> int;

/// SIGTERM, SIGQUIT, SIGINT
[[nodiscard]] auto default_termination_signals() -> std::vector<int>;

/// Источник сигналов завершения. next() блокирует до прихода сигнала.
class SignalSource {
public:
    virtual ~SignalSource() = default;

    [[nodiscard]] virtual auto next() -> SignalEvent = 0;
};

// Источник на весь процесс: обработчики через sigaction + self-pipe.
// Обработчики живут ровно столько, сколько объект; прежние struct sigaction
// (флаги и маска тоже) возвращаются в деструкторе. Живой экземпляр только один.
class PosixSignalSource final : public SignalSource {
public:
    using Disposition = std::pair<int, struct sigaction>;

    /// Повторы в списке допустимы и схлопываются (SIGQUIT дважды = один раз).
    [[nodiscard]] static auto open(std::vector<int> signals = default_termination_signals())
        -> Result<std::unique_ptr<PosixSignalSource>>;

    ~PosixSignalSource() override;

    PosixSignalSource(const PosixSignalSource&) = delete;
    PosixSignalSource& operator=(const PosixSignalSource&) = delete;

    [[nodiscard]] auto next() -> SignalEvent override;

    [[nodiscard]] auto registered() const -> const std::vector<int>& { return signals_; }

private:
    PosixSignalSource(std::vector<int> signals,
                      std::vector<Disposition> previous,
                      int read_fd, int write_fd);

    std::vector<int> signals_;
    std::vector<Disposition> previous_;
    int read_fd_;
    int write_fd_;
};

} // namespace grace::infra
