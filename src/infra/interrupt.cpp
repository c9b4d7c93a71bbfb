#include "interrupt.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace bucketcp::infra {

std::atomic<bool> g_interrupted{false};

namespace {

// Внутри обработчика сигнала допустима только запись атомика
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

} // namespace

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

auto forward_interrupts(std::stop_source source) -> std::jthread {
    return std::jthread([source](std::stop_token st) mutable {
        while (!st.stop_requested()) {
            if (is_interrupted()) {
                spdlog::warn("Received interrupt signal. Finishing in-flight transfers...");
                source.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });
}

} // namespace bucketcp::infra
