#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace grace::infra {

enum class ErrorCode {
    // Фатальные ошибки (процесс не может корректно стартовать)
    SignalSetupFailed,
    SignalSourceBusy,
    UnsupportedSignal,
    ConfigParse,
    InvalidArgument,

    // Восстанавливаемые (логируем и идём дальше)
    ResourceOpenFailure,
    ResourceCloseFailure,
    QueueClosed,

    // Системные
    Unknown,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// Ошибка из errno (или любого std::error_code): текст берётся из category().message()
[[nodiscard]] auto make_system_error(
    ErrorCode code,
    std::string_view context,
    std::error_code ec,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

} // namespace grace::infra
