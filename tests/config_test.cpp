#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

#include "cli/args_parser/args_parser.hpp"
#include "infra/config/config.hpp"
#include "infra/logging/logging.hpp"

using grace::args_parser::CLIArgs;
using grace::infra::Config;
using grace::infra::ErrorCode;

namespace {

std::filesystem::path write_temp_yaml(const std::string& name, const std::string& body) {
    auto path = std::filesystem::temp_directory_path()
              / ("grace_cfg_" + std::to_string(::getpid()) + "_" + name + ".yaml");
    std::ofstream out(path);
    out << body;
    return path;
}

} // namespace

TEST(Config, LoadsAllKeysFromYaml)
{
    const auto path = write_temp_yaml("full",
        "log_level: debug\n"
        "log_pattern: \"%l %v\"\n"
        "terminate: true\n"
        "workers: 4\n"
        "heartbeat_ms: 250\n"
        "files:\n"
        "  - /tmp/a.log\n"
        "  - /tmp/b.log\n");

    auto cfg = grace::infra::load_config_from_path(path);
    std::filesystem::remove(path);
    ASSERT_TRUE(cfg) << cfg.error().message;

    EXPECT_EQ(cfg->log_level, "debug");
    EXPECT_EQ(cfg->log_pattern, "%l %v");
    EXPECT_TRUE(cfg->terminate);
    EXPECT_EQ(cfg->workers, 4u);
    EXPECT_EQ(cfg->heartbeat_ms, 250u);
    ASSERT_EQ(cfg->files.size(), 2u);
    EXPECT_EQ(cfg->files[1], "/tmp/b.log");
}

TEST(Config, MalformedYamlIsConfigParseError)
{
    const auto path = write_temp_yaml("broken", "workers: [1, 2\n");
    auto cfg = grace::infra::load_config_from_path(path);
    std::filesystem::remove(path);

    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::ConfigParse);
    EXPECT_TRUE(cfg.error().is_fatal());
}

TEST(Config, UnknownLogLevelIsRejected)
{
    const auto path = write_temp_yaml("level", "log_level: loud\n");
    auto cfg = grace::infra::load_config_from_path(path);
    std::filesystem::remove(path);

    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::ConfigParse);
}

TEST(Config, MissingExplicitPathIsError)
{
    auto cfg = grace::infra::load_config_from_path("/nonexistent/grace/config.yaml");
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::ConfigParse);
}

TEST(Config, CliOverridesFile)
{
    Config file;
    file.log_level = "info";
    file.workers = 2;
    file.files = {"/var/log/a.log"};

    Config cli;
    cli.log_level = "debug";
    cli.terminate = true;

    file.merge_with(cli);
    EXPECT_EQ(file.log_level, "debug");
    EXPECT_TRUE(file.terminate);
    EXPECT_EQ(file.workers, 2u);
    ASSERT_EQ(file.files.size(), 1u);
    EXPECT_EQ(file.files[0], "/var/log/a.log");
}

TEST(ArgsParser, ParsesOptions)
{
    const char* argv[] = {"grace_demo", "--terminate", "-w", "3", "-f", "a.log", "-f", "b.log",
                          "--log-level", "warn", "--heartbeat-ms", "100"};
    int code = -1;
    auto args = grace::args_parser::parse_args(static_cast<int>(std::size(argv)), argv, &code);
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(code, 0);

    EXPECT_TRUE(args->terminate);
    EXPECT_EQ(args->workers, 3u);
    EXPECT_EQ(args->heartbeat_ms, 100u);
    EXPECT_EQ(args->log_level, "warn");
    ASSERT_EQ(args->files.size(), 2u);
    EXPECT_FALSE(args->config_path.has_value());

    auto cfg = grace::infra::config_from_cli(*args);
    EXPECT_TRUE(cfg.terminate);
    EXPECT_EQ(cfg.workers, 3u);
    EXPECT_EQ(cfg.files, args->files);
}

TEST(ArgsParser, RejectsInvalidWorkerCount)
{
    const char* argv[] = {"grace_demo", "--workers", "0"};
    int code = 0;
    auto args = grace::args_parser::parse_args(static_cast<int>(std::size(argv)), argv, &code);
    EXPECT_FALSE(args.has_value());
    EXPECT_NE(code, 0);
}

TEST(ArgsParser, HelpExitsCleanly)
{
    const char* argv[] = {"grace_demo", "--help"};
    int code = -1;
    auto args = grace::args_parser::parse_args(static_cast<int>(std::size(argv)), argv, &code);
    EXPECT_FALSE(args.has_value());
    EXPECT_EQ(code, 0);
}

TEST(Logging, LoggerFollowsConfig)
{
    Config cfg;
    cfg.log_level = "error";
    auto logger = grace::infra::make_logger(cfg, "grace_test_logger");
    ASSERT_TRUE(logger);
    EXPECT_EQ(logger->level(), spdlog::level::err);
    EXPECT_EQ(spdlog::default_logger().get(), logger.get());

    cfg.log_level = "debug";
    auto same = grace::infra::make_logger(cfg, "grace_test_logger");
    EXPECT_EQ(same.get(), logger.get());
    EXPECT_EQ(same->level(), spdlog::level::debug);

    EXPECT_EQ(grace::infra::parse_level(std::nullopt), spdlog::level::info);
}
