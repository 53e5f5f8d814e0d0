#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>

#include "adapters/closeables.hpp"
#include "adapters/work_queue.hpp"
#include "core/shutdown/orchestrator.hpp"
#include "test_support.hpp"

using grace::adapters::FileResource;
using grace::adapters::FunctionCloseable;
using grace::adapters::WorkQueue;
using grace::infra::ErrorCode;
using grace::infra::SignalEvent;
using grace::infra::VoidResult;

namespace {

class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path()
                / ("grace_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter_++)))
    {
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    static inline int counter_ = 0;
    std::filesystem::path path_;
};

std::string read_all(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST(FunctionCloseable, ForwardsResult)
{
    int calls = 0;
    FunctionCloseable ok([&]() -> VoidResult { ++calls; return {}; });
    EXPECT_TRUE(ok.close());
    EXPECT_EQ(calls, 1);

    FunctionCloseable failing([]() -> VoidResult {
        return std::unexpected(grace::infra::make_error(ErrorCode::ResourceCloseFailure, "broker unreachable"));
    });
    auto res = failing.close();
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().message, "broker unreachable");

    FunctionCloseable empty(nullptr);
    EXPECT_FALSE(empty.close());
}

TEST(FileResource, WritesAndClosesOnce)
{
    TempDir dir;
    const auto path = dir.path() / "out.log";

    auto file = FileResource::open(path);
    ASSERT_TRUE(file) << file.error().message;
    EXPECT_TRUE((*file)->is_open());
    EXPECT_TRUE((*file)->write_line("first"));
    EXPECT_TRUE((*file)->write_line("second"));

    EXPECT_TRUE((*file)->close());
    EXPECT_FALSE((*file)->is_open());
    EXPECT_EQ(read_all(path), "first\nsecond\n");

    auto again = (*file)->close();
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::ResourceCloseFailure);

    EXPECT_FALSE((*file)->write_line("late"));
}

TEST(FileResource, OpenFailsForMissingDirectory)
{
    TempDir dir;
    auto file = FileResource::open(dir.path() / "missing" / "out.log");
    ASSERT_FALSE(file);
    EXPECT_EQ(file.error().code, ErrorCode::ResourceOpenFailure);
}

TEST(WorkQueue, CloseDrainsPendingTasks)
{
    WorkQueue queue(2);
    std::promise<void> gate;
    auto gate_future = gate.get_future().share();
    std::atomic<int> ran{0};

    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(queue.submit([gate_future, &ran] {
            gate_future.wait();
            ran.fetch_add(1);
        }));
    }

    auto closing = std::async(std::launch::async, [&] { return queue.close(); });
    gate.set_value();
    EXPECT_TRUE(closing.get());

    EXPECT_EQ(ran.load(), 10);
    EXPECT_EQ(queue.completed(), 10u);
    EXPECT_EQ(queue.pending(), 0u);
}

TEST(WorkQueue, RejectsWorkAfterClose)
{
    WorkQueue queue;
    EXPECT_TRUE(queue.close());

    auto res = queue.submit([] {});
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::QueueClosed);

    auto again = queue.close();
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::ResourceCloseFailure);
}

TEST(WorkQueue, FailingTaskDoesNotStopWorkers)
{
    WorkQueue queue;
    std::atomic<int> ran{0};
    ASSERT_TRUE(queue.submit([] { throw std::runtime_error("task failed"); }));
    ASSERT_TRUE(queue.submit([&] { ran.fetch_add(1); }));

    EXPECT_TRUE(queue.close());
    EXPECT_EQ(ran.load(), 1);
    EXPECT_EQ(queue.completed(), 2u);
}

// Очередь стоит раньше файла: все задачи успевают записать до закрытия файла
TEST(Adapters, QueueDrainsBeforeFileClosesInOrchestration)
{
    TempDir dir;
    const auto path = dir.path() / "drain.log";
    auto file = FileResource::open(path);
    ASSERT_TRUE(file);
    auto& out = **file;

    WorkQueue queue(1);
    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(queue.submit([&out, i] {
            std::this_thread::sleep_for(std::chrono::microseconds(100));
            if (auto res = out.write_line("line " + std::to_string(i)); !res) {
                ADD_FAILURE() << res.error().message;
            }
        }));
    }

    grace::testing::CapturingLogger log;
    grace::testing::ScriptedSignalSource source(SignalEvent::Terminate);
    grace::core::ShutdownOrchestrator orchestrator(log.logger(), source);
    auto done = orchestrator.handle(queue, out);
    EXPECT_TRUE(done.get());

    EXPECT_EQ(log.count_prefix("error|"), 0u);
    const auto content = read_all(path);
    EXPECT_NE(content.find("line 0\n"), std::string::npos);
    EXPECT_NE(content.find("line 49\n"), std::string::npos);
}
