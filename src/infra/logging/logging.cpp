#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace grace::infra {

auto parse_level(const std::optional<std::string>& level) -> spdlog::level::level_enum {
    if (!level) return spdlog::level::info;
    return spdlog::level::from_str(*level);
}

auto make_logger(const Config& config, const std::string& name)
    -> std::shared_ptr<spdlog::logger>
{
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stdout_color_mt(name);
    }
    logger->set_level(parse_level(config.log_level));
    logger->set_pattern(config.log_pattern.value_or(std::string(kDefaultLogPattern)));
    // warn и выше сбрасываем сразу: после них процесс может завершиться
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    return logger;
}

} // namespace grace::infra
