#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace bucketcp::infra {

/// Receives byte increments from concurrent workers.
/// `begin` and `finish` are called by the batch owner only.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void begin(std::string_view label, std::uint64_t total_bytes, std::uint64_t total_items) = 0;
    virtual void add(std::uint64_t bytes) = 0;
    virtual void finish() = 0;
};

class NullProgress final : public ProgressSink {
public:
    void begin(std::string_view, std::uint64_t, std::uint64_t) override {}
    void add(std::uint64_t) override {}
    void finish() override {}
};

class ProgressMonitor final : public ProgressSink {
public:
    struct Stats {
        std::uint64_t total_items = 0;
        std::uint64_t processed_items = 0;
        std::uint64_t total_bytes = 0;
        std::uint64_t processed_bytes = 0;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor() override;

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void begin(std::string_view label, std::uint64_t total_bytes, std::uint64_t total_items) override;
    void add(std::uint64_t bytes) override;
    void finish() override;

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

private:
    void render_() const;
    void start_rendering_thread_();
    void stop_rendering_thread_();

    // Атомики для thread-safe обновления
    std::atomic<std::uint64_t> processed_items_{0};
    std::atomic<std::uint64_t> processed_bytes_{0};
    std::uint64_t total_items_ = 0;
    std::uint64_t total_bytes_ = 0;
    std::string label_;

    const bool enabled_;
    const bool quiet_;
    std::chrono::steady_clock::time_point start_time_;
    mutable std::mutex render_mutex_;
    std::unique_ptr<std::jthread> render_thread_;
};

/// "12.3 MB" style formatting shared by the bar and the CLI summary.
[[nodiscard]] auto format_bytes(double bytes) -> std::string;

} // namespace bucketcp::infra
