#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>
#include <filesystem>
#include "../error_handler/error.hpp"

namespace grace::args_parser {
    struct CLIArgs;
}

namespace grace::infra {

struct Config {
    // Логирование
    std::optional<std::string> log_level;     // trace|debug|info|warn|error
    std::optional<std::string> log_pattern;

    // Поведение
    bool terminate = false;                   // true: handle_and_terminate, иначе handle

    // Ресурсы демо-приложения
    std::optional<std::uint32_t> workers;
    std::optional<std::uint32_t> heartbeat_ms;
    std::vector<std::string> files;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);
};

inline constexpr std::string_view kDefaultLogPattern = "[%Y-%m-%d %H:%M:%S] [%l] %v";
inline constexpr std::uint32_t kDefaultWorkers = 1;
inline constexpr std::uint32_t kDefaultHeartbeatMs = 1000;

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.grace.yaml
///   2. $XDG_CONFIG_HOME/grace/config.yaml
///   3. ~/.config/grace/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> Result<Config>;

/// Явно указанный файл (--config). Отсутствие файла здесь считается ошибкой.
[[nodiscard]] auto load_config_from_path(const std::filesystem::path& path) -> Result<Config>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const grace::args_parser::CLIArgs& args) -> Config;

} // namespace grace::infra
