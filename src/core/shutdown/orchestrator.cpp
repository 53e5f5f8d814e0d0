#include "orchestrator.hpp"
#include <cstdlib>
#include <stdexcept>
#include <utility>
#include "../watcher/signal_watcher.hpp"

namespace grace::core {

auto default_terminator() -> Terminator {
    return [](int code) { std::exit(code); };
}

ShutdownOrchestrator::ShutdownOrchestrator(spdlog::logger& logger,
                                           infra::SignalSource& source,
                                           Terminator terminator)
    : logger_(logger)
    , source_(source)
    , terminator_(std::move(terminator))
{}

auto ShutdownOrchestrator::handle(ResourceList resources) -> Completion {
    run_(resources);

    std::promise<bool> terminated;
    terminated.set_value(true);
    return terminated.get_future().share();
}

void ShutdownOrchestrator::handle_and_terminate(ResourceList resources) {
    run_(resources);

    logger_.flush();
    if (terminator_) {
        terminator_(EXIT_SUCCESS);
    }
    // терминатор вернул управление (тестовый шов), всё равно не возвращаемся
    std::exit(EXIT_SUCCESS);
}

void ShutdownOrchestrator::run_(ResourceList resources) {
    auto expected = ShutdownState::Idle;
    if (!state_.compare_exchange_strong(expected, ShutdownState::WaitingForSignal,
                                        std::memory_order_acq_rel)) {
        throw std::logic_error("shutdown orchestrator is single-use");
    }

    {
        SignalWatcher watcher(source_);
        received_ = watcher.wait();
    }
    logger_.warn("system call receipt -> {}", infra::signal_name(*received_));

    state_.store(ShutdownState::Closing, std::memory_order_release);
    close_all_(resources);

    logger_.warn("system was terminated by a system call");
    state_.store(ShutdownState::Finished, std::memory_order_release);
}

void ShutdownOrchestrator::close_all_(ResourceList resources) {
    logger_.info("closing resources...");
    for (std::size_t i = 0; i < resources.size(); ++i) {
        logger_.info("trying to close resource {}", i);
        if (auto res = resources[i].get().close(); !res) {
            logger_.error("error on close resource: {}", res.error().message);
        }
    }
}

std::string_view to_string(ShutdownState state) {
    switch (state) {
        case ShutdownState::Idle:             return "idle";
        case ShutdownState::WaitingForSignal: return "waiting-for-signal";
        case ShutdownState::Closing:          return "closing";
        case ShutdownState::Finished:         return "finished";
    }
    return "unknown";
}

} // namespace grace::core
