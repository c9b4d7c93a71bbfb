#include "monitoring.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace bucketcp::infra {

auto format_bytes(double bytes) -> std::string {
    const char* unit = "B";
    if (bytes > 1024.0 * 1024 * 1024) { bytes /= 1024.0 * 1024 * 1024; unit = "GB"; }
    else if (bytes > 1024.0 * 1024) { bytes /= 1024.0 * 1024; unit = "MB"; }
    else if (bytes > 1024.0) { bytes /= 1024.0; unit = "KB"; }
    return fmt::format("{:.1f} {}", bytes, unit);
}

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , quiet_(quiet)
    , start_time_(std::chrono::steady_clock::now())
{}

ProgressMonitor::~ProgressMonitor() {
    stop_rendering_thread_();
}

void ProgressMonitor::begin(std::string_view label, std::uint64_t total_bytes, std::uint64_t total_items) {
    stop_rendering_thread_();

    label_ = std::string(label);
    total_bytes_ = total_bytes;
    total_items_ = total_items;
    processed_bytes_.store(0);
    processed_items_.store(0);
    start_time_ = std::chrono::steady_clock::now();

    if (enabled_) {
        start_rendering_thread_();
    }
}

void ProgressMonitor::add(std::uint64_t bytes) {
    processed_bytes_.fetch_add(bytes, std::memory_order_relaxed);
    processed_items_.fetch_add(1, std::memory_order_relaxed);
}

void ProgressMonitor::finish() {
    if (!render_thread_) return;
    stop_rendering_thread_();
    render_();
    std::fputs("\n", stderr); // финальный перенос
}

auto ProgressMonitor::get_stats() const -> Stats {
    return Stats{
        .total_items = total_items_,
        .processed_items = processed_items_.load(),
        .total_bytes = total_bytes_,
        .processed_bytes = processed_bytes_.load(),
        .start_time = start_time_
    };
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (!st.stop_requested()) {
            render_();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    if (render_thread_) {
        render_thread_->request_stop();
        render_thread_.reset(); // join
    }
}

void ProgressMonitor::render_() const {
    if (quiet_ || !enabled_) return;

    auto stats = get_stats();
    if (stats.total_items == 0) return;

    const double byte_progress = stats.total_bytes > 0
        ? static_cast<double>(stats.processed_bytes) / stats.total_bytes
        : static_cast<double>(stats.processed_items) / stats.total_items;
    const int bar_width = 20;
    const int filled = std::min(bar_width, static_cast<int>(byte_progress * bar_width));

    auto now = std::chrono::steady_clock::now();
    auto elapsed_sec = std::chrono::duration<double>(now - stats.start_time).count();
    double bytes_per_sec = elapsed_sec > 0 ? stats.processed_bytes / elapsed_sec : 0.0;

    // ETA
    double eta_sec = 0.0;
    if (bytes_per_sec > 0 && stats.processed_bytes > 0 && stats.total_bytes > stats.processed_bytes) {
        double remaining_bytes = static_cast<double>(stats.total_bytes - stats.processed_bytes);
        eta_sec = remaining_bytes / bytes_per_sec;
    }

    std::string eta_str = "--:--";
    if (std::isfinite(eta_sec) && eta_sec > 0) {
        int seconds = static_cast<int>(eta_sec);
        int hours = seconds / 3600;
        int minutes = (seconds % 3600) / 60;
        seconds = seconds % 60;
        if (hours > 0) {
            eta_str = fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
        } else {
            eta_str = fmt::format("{:02d}:{:02d}", minutes, seconds);
        }
    }

    std::string bar;
    for (int i = 0; i < bar_width; ++i) {
        bar += i < filled ? "█" : "░";
    }

    std::lock_guard lock(render_mutex_);
    // ANSI: очистить строку
    fmt::print(stderr,
        "\r\033[K{} [{}] {:3.0f}% {} / {} | {}/s | ETA: {} | {}/{}",
        label_,
        bar,
        byte_progress * 100.0,
        format_bytes(static_cast<double>(stats.processed_bytes)),
        format_bytes(static_cast<double>(stats.total_bytes)),
        format_bytes(bytes_per_sec),
        eta_str,
        stats.processed_items,
        stats.total_items
    );
    std::fflush(stderr);
}

} // namespace bucketcp::infra
