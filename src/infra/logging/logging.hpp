#pragma once

#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include "../config/config.hpp"

namespace grace::infra {

/// Логгер приложения: цветной stdout, уровень и паттерн из Config.
/// Регистрируется как default, чтобы spdlog::debug(...) из библиотеки шёл туда же.
[[nodiscard]] auto make_logger(const Config& config, const std::string& name = "grace")
    -> std::shared_ptr<spdlog::logger>;

[[nodiscard]] auto parse_level(const std::optional<std::string>& level) -> spdlog::level::level_enum;

} // namespace grace::infra
