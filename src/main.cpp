#include <fmt/core.h>
#include <fmt/ranges.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/logging/logging.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/shutdown/graceful.hpp"
#include "adapters/closeables.hpp"
#include "adapters/work_queue.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>
#include <unistd.h>

using GIT = grace::build_info::GitInfo;
using ARGS = grace::args_parser::CLIArgs;

constexpr auto load_from_cli = grace::infra::config_from_cli;
constexpr auto load_config_file = grace::infra::load_config_from_file;
constexpr auto args_parser = grace::args_parser::parse_args;
constexpr auto git = grace::build_info::get_git_info();

static auto
__out_git_verse(const GIT& git)
-> void {
    fmt::print("Git branch: {}\n", git.branch);
    fmt::print("Git commit: {}\n", git.commit);
    fmt::print("Git commit short: {}\n", git.commit_short);
    fmt::print("Git dirty: {}\n", git.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", git.timestamp);
}

static auto
__load_config(const ARGS& args)
-> grace::infra::Result<grace::infra::Config> {
    if (args.config_path) {
        return grace::infra::load_config_from_path(*args.config_path);
    }
    return load_config_file();
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern(std::string(grace::infra::kDefaultLogPattern));

        int parse_exit = 0;
        auto args_opt = args_parser(argc, argv, &parse_exit);
        if (!args_opt) {
            return parse_exit; // --help или ошибка
        }
        const auto& args = *args_opt;

        if (args.version) {
            __out_git_verse(git);
            return 0;
        }

        // 1. Загрузить из файла
        auto config_res = __load_config(args);
        if (!config_res) {
            auto err = grace::infra::log_and_return(std::move(config_res.error()));
            return err.to_exit_code();
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args));

        auto logger = grace::infra::make_logger(config);
        logger->info("grace_demo {} ({}), pid {}", git.commit_short, git.branch, ::getpid());

        // Ресурсы в порядке закрытия: сначала источник работы, потом очередь, потом файлы
        std::vector<std::unique_ptr<grace::adapters::FileResource>> files;
        for (const auto& path : config.files) {
            auto file = grace::adapters::FileResource::open(path);
            if (!file) {
                auto err = grace::infra::log_and_return(std::move(file.error()));
                return err.to_exit_code();
            }
            files.push_back(std::move(*file));
        }
        logger->debug("Output files: {}", config.files);

        grace::adapters::WorkQueue queue(config.workers.value_or(grace::infra::kDefaultWorkers));

        const auto period = std::chrono::milliseconds(
            config.heartbeat_ms.value_or(grace::infra::kDefaultHeartbeatMs));
        std::jthread heartbeat([&](std::stop_token st) {
            std::mutex m;
            std::condition_variable_any cv;
            std::uint64_t beat = 0;
            while (!st.stop_requested()) {
                {
                    std::unique_lock lock(m);
                    cv.wait_for(lock, st, period, [] { return false; });
                }
                if (st.stop_requested()) break;

                const auto n = ++beat;
                auto res = queue.submit([&files, &logger, n] {
                    for (auto& file : files) {
                        if (auto w = file->write_line(fmt::format("heartbeat {}", n)); !w) {
                            logger->warn("{}", w.error().message);
                        }
                    }
                });
                if (!res) {
                    logger->warn("Heartbeat {} dropped: {}", n, res.error().message);
                }
            }
        });

        grace::adapters::FunctionCloseable heartbeat_stopper([&heartbeat]() -> grace::infra::VoidResult {
            heartbeat.request_stop();
            if (heartbeat.joinable()) heartbeat.join();
            return {};
        });

        std::vector<std::reference_wrapper<grace::core::Closeable>> resources;
        resources.emplace_back(heartbeat_stopper);
        resources.emplace_back(queue);
        for (auto& file : files) {
            resources.emplace_back(*file);
        }

        logger->info("Running with {} resource(s); send SIGINT, SIGTERM or SIGQUIT to stop",
                     resources.size());

        if (config.terminate) {
            grace::handle_and_terminate(*logger, grace::core::ResourceList{resources});
        }

        auto done = grace::handle(*logger, grace::core::ResourceList{resources});
        done.get();
        logger->info("Heartbeats processed: {}", queue.completed());
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
