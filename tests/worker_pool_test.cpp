#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <numeric>
#include <stdexcept>
#include <thread>
#include <vector>

#include "infra/worker_pool/work_queue.hpp"
#include "infra/worker_pool/worker_pool.hpp"
#include "test_utils.hpp"

using bucketcp::infra::ErrorCode;
using bucketcp::infra::NullProgress;
using bucketcp::infra::Result;
using bucketcp::infra::WorkQueue;
using bucketcp::infra::make_error;
using bucketcp::infra::run_batch;
using bucketcp::testing::RecordingProgress;

namespace {

struct Item {
    int id = 0;
    std::uint64_t size = 0;
};

auto make_items(int n) -> std::vector<Item> {
    std::vector<Item> items;
    for (int i = 0; i < n; ++i) {
        items.push_back(Item{.id = i, .size = static_cast<std::uint64_t>(i + 1)});
    }
    return items;
}

} // namespace

TEST(WorkQueueTest, DrainsBeforeReportingClosure)
{
    WorkQueue<int> queue;
    queue.push(1);
    queue.push(2);
    EXPECT_EQ(queue.size(), 2u);
    queue.close();

    EXPECT_TRUE(queue.closed());
    EXPECT_EQ(queue.pop(), 1);
    EXPECT_EQ(queue.pop(), 2);
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_FALSE(queue.pop().has_value());
    EXPECT_THROW(queue.push(3), std::logic_error);
}

TEST(WorkQueueTest, PopWakesOnStopRequest)
{
    WorkQueue<int> queue;
    std::stop_source stop;

    std::thread consumer([&] { EXPECT_FALSE(queue.pop(stop.get_token()).has_value()); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    stop.request_stop();
    consumer.join();
}

class WorkerPoolDrainTest : public ::testing::TestWithParam<std::size_t> {};

TEST_P(WorkerPoolDrainTest, EveryTaskRunsExactlyOnce)
{
    constexpr int kTasks = 200;
    std::vector<std::atomic<int>> calls(kTasks);
    std::atomic<int> completed{0};
    RecordingProgress progress;

    auto result = run_batch(make_items(kTasks), GetParam(),
        [&](const Item& item, std::stop_token) -> Result<std::uint64_t> {
            calls[item.id].fetch_add(1);
            std::this_thread::yield();
            completed.fetch_add(1);
            return item.size;
        },
        progress);

    // run_batch возвращается только после завершения всех вызовов
    EXPECT_EQ(completed.load(), kTasks);
    for (int i = 0; i < kTasks; ++i) {
        EXPECT_EQ(calls[i].load(), 1) << "task " << i;
    }

    const std::uint64_t expected_bytes = kTasks * (kTasks + 1) / 2;
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.total, static_cast<std::uint64_t>(kTasks));
    EXPECT_EQ(result.succeeded, static_cast<std::uint64_t>(kTasks));
    EXPECT_EQ(result.bytes, expected_bytes);
    EXPECT_EQ(progress.bytes_.load(), expected_bytes);
    EXPECT_EQ(progress.items_.load(), static_cast<std::uint64_t>(kTasks));
}

INSTANTIATE_TEST_SUITE_P(WorkerCounts, WorkerPoolDrainTest, ::testing::Values(1, 2, 7, 50, 500));

TEST(WorkerPoolTest, FailedTaskDoesNotStopSiblings)
{
    std::mutex mutex;
    std::vector<int> done;
    NullProgress progress;

    auto result = run_batch(make_items(10), 3,
        [&](const Item& item, std::stop_token) -> Result<std::uint64_t> {
            if (item.id == 3) {
                return std::unexpected(make_error(ErrorCode::ReadFailed, "task #4: I/O error"));
            }
            std::lock_guard lock(mutex);
            done.push_back(item.id);
            return item.size;
        },
        progress);

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.failed, 1u);
    EXPECT_EQ(result.succeeded, 9u);
    EXPECT_EQ(result.cancelled, 0u);
    std::sort(done.begin(), done.end());
    EXPECT_EQ(done, (std::vector<int>{0, 1, 2, 4, 5, 6, 7, 8, 9}));
}

TEST(WorkerPoolTest, ThrowingTaskCountsAsFailure)
{
    NullProgress progress;
    auto result = run_batch(make_items(4), 2,
        [](const Item& item, std::stop_token) -> Result<std::uint64_t> {
            if (item.id == 0) throw std::runtime_error("boom");
            return item.size;
        },
        progress);

    EXPECT_EQ(result.failed, 1u);
    EXPECT_EQ(result.succeeded, 3u);
}

TEST(WorkerPoolTest, EmptyBatchSucceeds)
{
    NullProgress progress;
    int calls = 0;
    auto result = run_batch(std::vector<Item>{}, 4,
        [&](const Item&, std::stop_token) -> Result<std::uint64_t> { ++calls; return 0; },
        progress);

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.total, 0u);
    EXPECT_EQ(calls, 0);
}

TEST(WorkerPoolTest, ZeroWorkersStillDrains)
{
    NullProgress progress;
    std::atomic<int> calls{0};
    auto result = run_batch(make_items(5), 0,
        [&](const Item& item, std::stop_token) -> Result<std::uint64_t> { ++calls; return item.size; },
        progress);

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(calls.load(), 5);
}

TEST(WorkerPoolTest, StopBeforeStartRunsNothing)
{
    NullProgress progress;
    std::stop_source stop;
    stop.request_stop();
    std::atomic<int> calls{0};

    auto result = run_batch(make_items(8), 4,
        [&](const Item& item, std::stop_token) -> Result<std::uint64_t> { ++calls; return item.size; },
        progress, stop.get_token());

    EXPECT_EQ(calls.load(), 0);
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.stop_requested);
    EXPECT_EQ(result.cancelled, 8u);
}

TEST(WorkerPoolTest, StopMidBatchSkipsQueuedTasks)
{
    NullProgress progress;
    std::stop_source stop;
    std::atomic<int> calls{0};

    auto result = run_batch(make_items(10), 1,
        [&](const Item& item, std::stop_token) -> Result<std::uint64_t> {
            ++calls;
            if (item.id == 2) stop.request_stop();
            return item.size;
        },
        progress, stop.get_token());

    EXPECT_EQ(calls.load(), 3);
    EXPECT_EQ(result.succeeded, 3u);
    EXPECT_EQ(result.cancelled, 7u);
    EXPECT_TRUE(result.stop_requested);
    EXPECT_FALSE(result.ok());
}

namespace {

// Перемещение "отравленного" элемента бросает, имитируя сбой внутри push
struct FragileItem {
    int id = 0;
    bool poison = false;

    FragileItem(int i, bool p) : id(i), poison(p) {}
    FragileItem(const FragileItem&) = default;
    FragileItem(FragileItem&& other) : id(other.id), poison(other.poison) {
        if (poison) throw std::runtime_error("cannot move item");
    }
};

} // namespace

TEST(WorkerPoolTest, ProducerFailureReleasesWorkers)
{
    std::vector<FragileItem> items;
    items.reserve(6);
    for (int i = 0; i < 6; ++i) {
        items.emplace_back(i, i == 3);
    }

    NullProgress progress;
    std::atomic<int> calls{0};
    EXPECT_THROW(
        (void)run_batch(std::move(items), 2,
            [&](const FragileItem&, std::stop_token) -> Result<std::uint64_t> { ++calls; return 1; },
            progress),
        std::runtime_error);
    // Уже поставленные в очередь задачи дорабатывают, потоки завершаются
    EXPECT_EQ(calls.load(), 3);
}
