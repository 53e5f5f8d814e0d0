#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace grace::infra {
    void Config::merge_with(const Config& other) {
        if (other.log_level) log_level = other.log_level;
        if (other.log_pattern) log_pattern = other.log_pattern;
        if (other.terminate) terminate = true;
        if (other.workers) workers = other.workers;
        if (other.heartbeat_ms) heartbeat_ms = other.heartbeat_ms;

        if (!other.files.empty()) files = other.files;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".grace.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "grace" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "grace" / "config.yaml");
            }
        }

        return paths;
    }

    static auto parse_config(const std::filesystem::path& path) -> Result<Config> {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();
            if (config["log_pattern"]) cfg.log_pattern = config["log_pattern"].as<std::string>();
            if (config["terminate"]) cfg.terminate = config["terminate"].as<bool>();
            if (config["workers"]) cfg.workers = config["workers"].as<std::uint32_t>();
            if (config["heartbeat_ms"]) cfg.heartbeat_ms = config["heartbeat_ms"].as<std::uint32_t>();

            if (config["files"]) {
                for (const auto& file : config["files"]) {
                    cfg.files.push_back(file.as<std::string>());
                }
            }

            if (cfg.log_level && spdlog::level::from_str(*cfg.log_level) == spdlog::level::off
                && *cfg.log_level != "off") {
                return std::unexpected(make_error(ErrorCode::ConfigParse,
                    fmt::format("{}: unknown log_level '{}'", path.string(), *cfg.log_level)));
            }

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const YAML::Exception& e) {
            return std::unexpected(make_error(ErrorCode::ConfigParse,
                fmt::format("Failed to parse {}: {}", path.string(), e.what())));
        }
    }

    auto load_config_from_file() -> Result<Config> {
        for (const auto& path : get_config_paths()) {
            if (!std::filesystem::exists(path)) continue;
            return parse_config(path);
        }

        // Файл не найден: возвращаем пустой конфиг (не ошибка!)
        return Config{};
    }

    auto load_config_from_path(const std::filesystem::path& path) -> Result<Config> {
        if (!std::filesystem::exists(path)) {
            return std::unexpected(make_error(ErrorCode::ConfigParse,
                fmt::format("Config file not found: {}", path.string())));
        }
        return parse_config(path);
    }

    auto config_from_cli(const grace::args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.log_level = args.log_level;
        cfg.terminate = args.terminate;
        cfg.workers = args.workers;
        cfg.heartbeat_ms = args.heartbeat_ms;
        cfg.files = args.files;
        return cfg;
    }

} // namespace grace::infra
