#include "graceful.hpp"
#include <memory>
#include <system_error>
#include <csignal>
#include "../../infra/interrupt.hpp"

namespace grace {

namespace {

auto to_errc(infra::ErrorCode code) -> std::errc {
    switch (code) {
        case infra::ErrorCode::SignalSourceBusy:  return std::errc::device_or_resource_busy;
        case infra::ErrorCode::UnsupportedSignal:
        case infra::ErrorCode::InvalidArgument:   return std::errc::invalid_argument;
        default:                                  return std::errc::io_error;
    }
}

auto open_termination_source() -> std::unique_ptr<infra::PosixSignalSource> {
    // SIGQUIT указан дважды: источник сам схлопывает повтор
    auto source = infra::PosixSignalSource::open({SIGTERM, SIGQUIT, SIGQUIT, SIGINT});
    if (!source) {
        auto err = infra::log_and_return(std::move(source.error()));
        throw std::system_error(std::make_error_code(to_errc(err.code)), err.message);
    }
    return std::move(*source);
}

} // namespace

auto handle(spdlog::logger& logger, core::ResourceList resources) -> core::Completion {
    auto source = open_termination_source();
    core::ShutdownOrchestrator orchestrator(logger, *source);
    return orchestrator.handle(resources);
}

void handle_and_terminate(spdlog::logger& logger, core::ResourceList resources) {
    auto source = open_termination_source();
    core::ShutdownOrchestrator orchestrator(logger, *source);
    orchestrator.handle_and_terminate(resources);
}

} // namespace grace
