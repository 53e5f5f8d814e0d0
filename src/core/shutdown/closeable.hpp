#pragma once

#include <functional>
#include <span>
#include "../../infra/error_handler/error.hpp"

namespace grace::core {

/// Любой освобождаемый ресурс: соединение с БД, клиент брокера, файл и т.д.
class Closeable {
public:
    virtual ~Closeable() = default;

    // Ошибка закрытия описывается ErrorCode::ResourceCloseFailure
    [[nodiscard]] virtual auto close() -> infra::VoidResult = 0;
};

// Упорядоченный список заимствованных ресурсов, закрываются по порядку.
using ResourceList = std::span<const std::reference_wrapper<Closeable>>;

} // namespace grace::core
