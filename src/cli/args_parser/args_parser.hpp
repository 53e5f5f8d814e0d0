#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>



namespace grace::args_parser {
    struct CLIArgs
{
    std::optional<std::string> config_path;   // -c, --config
    std::optional<std::string> log_level;     // -l, --log-level
    bool terminate{false};                    // --terminate
    std::optional<std::uint32_t> workers;     // -w, --workers=N
    std::optional<std::uint32_t> heartbeat_ms;// --heartbeat-ms=MS
    std::vector<std::string> files;           // -f, --file (можно повторять)
    bool version{false};                      // -V, --version
};



/// Разбирает аргументы командной строки в CLIArgs.
/// std::nullopt означает немедленный выход (--help или ошибка разбора);
/// в exit_code тогда лежит статус от CLI11.
std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int* exit_code = nullptr);

} // namespace grace::args_parser
