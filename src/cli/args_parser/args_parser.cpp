#include "args_parser.hpp"
#include <CLI/CLI.hpp>

namespace grace::args_parser {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int* exit_code)
{
    CLIArgs args;
    CLI::App app{"grace_demo - keeps resources open until SIGINT/SIGTERM/SIGQUIT, then closes them in order"};

    std::string config_path;
    std::string log_level;
    std::uint32_t workers = 0;
    std::uint32_t heartbeat_ms = 0;

    auto* config_opt = app.add_option("-c,--config", config_path, "YAML config file")
        ->check(CLI::ExistingFile);
    auto* level_opt = app.add_option("-l,--log-level", log_level, "Log level")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning", "error", "critical", "off"}));
    app.add_flag("--terminate", args.terminate, "Exit the process after cleanup instead of returning");
    auto* workers_opt = app.add_option("-w,--workers", workers, "Worker threads in the work queue")
        ->check(CLI::Range(1u, 256u));
    auto* heartbeat_opt = app.add_option("--heartbeat-ms", heartbeat_ms, "Heartbeat period in milliseconds")
        ->check(CLI::PositiveNumber);
    app.add_option("-f,--file", args.files, "Output file kept open until shutdown (repeatable)");
    app.add_flag("-V,--version", args.version, "Print build information and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int code = app.exit(e);
        if (exit_code) *exit_code = code;
        return std::nullopt;
    }

    if (*config_opt) args.config_path = config_path;
    if (*level_opt) args.log_level = log_level;
    if (*workers_opt) args.workers = workers;
    if (*heartbeat_opt) args.heartbeat_ms = heartbeat_ms;

    if (exit_code) *exit_code = 0;
    return args;
}

} // namespace grace::args_parser
