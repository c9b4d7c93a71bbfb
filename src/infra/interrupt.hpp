#pragma once

#include <atomic>
#include <csignal>
#include <stop_token>
#include <thread>

namespace bucketcp::infra {

extern std::atomic<bool> g_interrupted;

void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

/// Starts a thread that forwards SIGINT/SIGTERM into `source.request_stop()`.
/// The watcher stops together with the returned jthread.
[[nodiscard]] auto forward_interrupts(std::stop_source source) -> std::jthread;

} // namespace bucketcp::infra
