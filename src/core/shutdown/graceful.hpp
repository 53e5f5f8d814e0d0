#pragma once

#include <array>
#include <concepts>
#include <functional>
#include <spdlog/logger.h>
#include "orchestrator.hpp"

namespace grace {

/*

    DbConnection db = ...;
    BrokerClient broker = ...;
    auto done = grace::handle(*logger, broker, db);   // блокирует до SIGINT/SIGTERM/SIGQUIT
    done.get();

*/

/// Слушает SIGINT, SIGTERM и SIGQUIT на время вызова, затем закрывает ресурсы
/// по порядку. Бросает std::system_error, если ОС не дала поставить обработчики.
[[nodiscard]] auto handle(spdlog::logger& logger, core::ResourceList resources)
    -> core::Completion;

[[noreturn]] void handle_and_terminate(spdlog::logger& logger, core::ResourceList resources);

template<std::derived_from<core::Closeable>... Rs>
[[nodiscard]] auto handle(spdlog::logger& logger, Rs&... resources) -> core::Completion {
    const std::array<std::reference_wrapper<core::Closeable>, sizeof...(Rs)> list{resources...};
    return handle(logger, core::ResourceList{list});
}

template<std::derived_from<core::Closeable>... Rs>
[[noreturn]] void handle_and_terminate(spdlog::logger& logger, Rs&... resources) {
    const std::array<std::reference_wrapper<core::Closeable>, sizeof...(Rs)> list{resources...};
    handle_and_terminate(logger, core::ResourceList{list});
}

} // namespace grace
