#pragma once

#include <algorithm>
#include <atomic>
#include <concepts>
#include <cstdint>
#include <exception>
#include <functional>
#include <stop_token>
#include <thread>
#include <vector>

#include "work_queue.hpp"
#include "../error_handler/error.hpp"
#include "../monitoring/monitoring.hpp"

namespace bucketcp::infra {

/// Aggregate outcome of one batch. Any failed or skipped task makes it not ok().
struct BatchResult {
    std::uint64_t total = 0;
    std::uint64_t succeeded = 0;
    std::uint64_t failed = 0;
    std::uint64_t cancelled = 0;   // задачи, которые так и не были выполнены
    std::uint64_t bytes = 0;
    bool stop_requested = false;

    [[nodiscard]] auto ok() const -> bool {
        return failed == 0 && cancelled == 0 && !stop_requested;
    }
};

// Одна задача: Result<байты> transfer(const Task&, std::stop_token)
template<typename Fn, typename Task>
concept TransferFunction = std::invocable<Fn&, const Task&, std::stop_token> &&
    std::same_as<std::invoke_result_t<Fn&, const Task&, std::stop_token>, Result<std::uint64_t>>;

namespace detail {

struct PoolCounters {
    std::atomic<std::uint64_t> invoked{0};
    std::atomic<std::uint64_t> succeeded{0};
    std::atomic<std::uint64_t> failed{0};
    std::atomic<std::uint64_t> cancelled{0};
    std::atomic<std::uint64_t> bytes{0};
};

template<typename Task>
struct CloseOnExit {
    WorkQueue<Task>& queue;
    ~CloseOnExit() { queue.close(); }
};

template<typename Task, typename Fn>
auto invoke_guarded(Fn& transfer, const Task& task, std::stop_token st) -> Result<std::uint64_t> {
    // Исключение из примитива не должно убить воркер
    try {
        return transfer(task, st);
    } catch (const std::exception& e) {
        return std::unexpected(make_error(ErrorCode::Unknown,
            fmt::format("transfer threw: {}", e.what())));
    }
}

} // namespace detail

/// Runs every task through `transfer` on a fixed pool of `worker_count` threads.
///
/// One producer (the calling thread) enqueues all tasks and then closes the queue;
/// workers exit once the queue is closed and drained. The call returns only after
/// every worker has been joined. A failed task is logged and counted but never
/// stops the other workers. When `st` fires, tasks not yet dequeued are skipped
/// and counted as cancelled; in-flight transfers run to completion.
template<typename Task, typename Fn>
    requires TransferFunction<Fn, Task>
auto run_batch(std::vector<Task> tasks,
               std::size_t worker_count,
               Fn&& transfer,
               ProgressSink& progress,
               std::stop_token st = {}) -> BatchResult
{
    BatchResult result{.total = tasks.size()};
    if (tasks.empty()) {
        return result;
    }

    if (worker_count == 0) worker_count = 1;
    worker_count = std::min(worker_count, tasks.size());

    WorkQueue<Task> queue;
    detail::PoolCounters counters;

    auto worker = [&] {
        while (auto task = queue.pop(st)) {
            counters.invoked.fetch_add(1, std::memory_order_relaxed);

            auto res = detail::invoke_guarded(transfer, *task, st);
            if (res) {
                counters.succeeded.fetch_add(1, std::memory_order_relaxed);
                counters.bytes.fetch_add(*res, std::memory_order_relaxed);
                progress.add(*res);
            } else if (res.error().code == ErrorCode::Cancelled) {
                counters.cancelled.fetch_add(1, std::memory_order_relaxed);
                spdlog::debug("Task cancelled: {}", res.error().message);
            } else {
                counters.failed.fetch_add(1, std::memory_order_relaxed);
                (void)log_and_return(std::move(res.error()));
            }
        }
    };

    std::vector<std::jthread> workers;
    workers.reserve(worker_count);

    // Объявлен после workers: закрывает очередь раньше, чем jthread начнут join,
    // в том числе если push или запуск потока бросит исключение
    detail::CloseOnExit<Task> close_guard{queue};

    for (std::size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }

    std::uint64_t enqueued = 0;
    for (auto& task : tasks) {
        if (st.stop_requested()) break;
        queue.push(std::move(task));
        ++enqueued;
    }
    queue.close();

    for (auto& w : workers) {
        w.join();
    }

    result.succeeded = counters.succeeded.load();
    result.failed = counters.failed.load();
    result.bytes = counters.bytes.load();
    // Не запущенные: не поставленные в очередь + оставшиеся в очереди после отмены
    result.cancelled = counters.cancelled.load() + (result.total - enqueued) + queue.drain().size();
    result.stop_requested = st.stop_requested();

    spdlog::debug("Batch finished: {} ok, {} failed, {} cancelled of {} ({} invoked)",
                  result.succeeded, result.failed, result.cancelled, result.total,
                  counters.invoked.load());
    return result;
}

} // namespace bucketcp::infra
