#include "interrupt.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace grace::infra {

namespace {

// Хендлер видит только эти атомики: пишем номер сигнала в pipe и выходим.
std::atomic<int> g_write_fd{-1};
std::atomic<int> g_handlers_running{0};
std::atomic<bool> g_source_active{false};

static_assert(std::atomic<int>::is_always_lock_free);

void signal_handler(int sig) {
    const int saved_errno = errno;
    // счётчик поднимаем до чтения fd: деструктор ждёт его обнуления перед close()
    g_handlers_running.fetch_add(1);
    const int fd = g_write_fd.load();
    if (fd >= 0) {
        const auto byte = static_cast<unsigned char>(sig);
        // write end в O_NONBLOCK: при полном pipe лишнее уведомление теряется
        [[maybe_unused]] auto written = ::write(fd, &byte, 1);
    }
    g_handlers_running.fetch_sub(1);
    errno = saved_errno;
}

bool is_termination_signal(int signo) {
    return to_signal_event(signo).has_value();
}

void restore_handlers(const std::vector<PosixSignalSource::Disposition>& previous) {
    for (auto it = previous.rbegin(); it != previous.rend(); ++it) {
        ::sigaction(it->first, &it->second, nullptr);
    }
}

// После этого ни один хендлер уже не держит в руках старый write fd
void detach_write_end() {
    g_write_fd.store(-1);
    while (g_handlers_running.load() != 0) {
        std::this_thread::yield();
    }
}

void close_fd(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

} // namespace

std::string_view signal_name(SignalEvent event) {
    switch (event) {
        case SignalEvent::Interrupt: return "interrupt";
        case SignalEvent::Terminate: return "terminated";
        case SignalEvent::Quit:      return "quit";
    }
    return "unknown";
}

std::optional<SignalEvent> to_signal_event(int signo) {
    switch (signo) {
        case SIGINT:  return SignalEvent::Interrupt;
        case SIGTERM: return SignalEvent::Terminate;
        case SIGQUIT: return SignalEvent::Quit;
        default:      return std::nullopt;
    }
}

int to_signal_number(SignalEvent event) {
    switch (event) {
        case SignalEvent::Interrupt: return SIGINT;
        case SignalEvent::Terminate: return SIGTERM;
        case SignalEvent::Quit:      return SIGQUIT;
    }
    return SIGTERM;
}

std::vector<int> default_termination_signals() {
    return {SIGTERM, SIGQUIT, SIGINT};
}

auto PosixSignalSource::open(std::vector<int> signals)
    -> Result<std::unique_ptr<PosixSignalSource>>
{
    // Дубликаты убираем, порядок первой регистрации сохраняем
    std::vector<int> unique;
    unique.reserve(signals.size());
    for (int signo : signals) {
        if (!is_termination_signal(signo)) {
            return std::unexpected(make_error(ErrorCode::UnsupportedSignal,
                fmt::format("signal {} is not a termination signal", signo)));
        }
        if (std::find(unique.begin(), unique.end(), signo) == unique.end()) {
            unique.push_back(signo);
        }
    }
    if (unique.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "no termination signals requested"));
    }

    bool expected = false;
    if (!g_source_active.compare_exchange_strong(expected, true)) {
        return std::unexpected(make_error(ErrorCode::SignalSourceBusy,
            "another signal source is already listening"));
    }

    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        g_source_active.store(false);
        return std::unexpected(make_system_error(ErrorCode::SignalSetupFailed,
            "pipe2", std::error_code(errno, std::generic_category())));
    }
    const int flags = ::fcntl(fds[1], F_GETFL);
    if (flags < 0 || ::fcntl(fds[1], F_SETFL, flags | O_NONBLOCK) != 0) {
        auto err = make_system_error(ErrorCode::SignalSetupFailed,
            "fcntl(O_NONBLOCK)", std::error_code(errno, std::generic_category()));
        close_fd(fds[0]);
        close_fd(fds[1]);
        g_source_active.store(false);
        return std::unexpected(std::move(err));
    }
    g_write_fd.store(fds[1]);

    struct sigaction action {};
    action.sa_handler = signal_handler;
    action.sa_flags = SA_RESTART;
    ::sigemptyset(&action.sa_mask);

    std::vector<Disposition> previous;
    previous.reserve(unique.size());
    for (int signo : unique) {
        struct sigaction old {};
        if (::sigaction(signo, &action, &old) != 0) {
            auto err = make_system_error(ErrorCode::SignalSetupFailed,
                fmt::format("sigaction({})", signo),
                std::error_code(errno, std::generic_category()));
            restore_handlers(previous);
            detach_write_end();
            close_fd(fds[0]);
            close_fd(fds[1]);
            g_source_active.store(false);
            return std::unexpected(std::move(err));
        }
        previous.emplace_back(signo, old);
    }

    spdlog::debug("Signal source listening on {} signal(s)", unique.size());
    return std::unique_ptr<PosixSignalSource>(
        new PosixSignalSource(std::move(unique), std::move(previous), fds[0], fds[1]));
}

PosixSignalSource::PosixSignalSource(std::vector<int> signals,
                                     std::vector<Disposition> previous,
                                     int read_fd, int write_fd)
    : signals_(std::move(signals))
    , previous_(std::move(previous))
    , read_fd_(read_fd)
    , write_fd_(write_fd)
{}

PosixSignalSource::~PosixSignalSource() {
    restore_handlers(previous_);
    detach_write_end();
    close_fd(read_fd_);
    close_fd(write_fd_);
    g_source_active.store(false);
    spdlog::debug("Signal source released");
}

auto PosixSignalSource::next() -> SignalEvent {
    for (;;) {
        unsigned char byte = 0;
        const auto n = ::read(read_fd_, &byte, 1);
        if (n == 1) {
            if (auto event = to_signal_event(byte)) {
                return *event;
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        // EOF или ошибка на собственном pipe: инвариант нарушен
        throw std::system_error(n < 0 ? errno : EPIPE, std::generic_category(),
                                "signal pipe read");
    }
}

} // namespace grace::infra
