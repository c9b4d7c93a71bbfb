#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <string_view>

#include "infra/monitoring/monitoring.hpp"

namespace bucketcp::testing {

// Временный каталог, удаляется в деструкторе
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("bucketcp-test-" + std::to_string(rd()) + "-" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    void write(std::string_view relative, std::string_view data) const {
        auto file = path_ / std::filesystem::path(std::string(relative));
        std::filesystem::create_directories(file.parent_path());
        std::ofstream ofs(file, std::ios::binary);
        ofs << data;
    }

    [[nodiscard]] auto read(std::string_view relative) const -> std::string {
        std::ifstream ifs(path_ / std::filesystem::path(std::string(relative)), std::ios::binary);
        return {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
    }

private:
    std::filesystem::path path_;
};

class RecordingProgress final : public infra::ProgressSink {
public:
    void begin(std::string_view, std::uint64_t total_bytes, std::uint64_t total_items) override {
        total_bytes_ = total_bytes;
        total_items_ = total_items;
        begun_.fetch_add(1);
    }
    void add(std::uint64_t bytes) override {
        bytes_.fetch_add(bytes);
        items_.fetch_add(1);
    }
    void finish() override { finished_.fetch_add(1); }

    std::uint64_t total_bytes_ = 0;
    std::uint64_t total_items_ = 0;
    std::atomic<std::uint64_t> bytes_{0};
    std::atomic<std::uint64_t> items_{0};
    std::atomic<int> begun_{0};
    std::atomic<int> finished_{0};
};

} // namespace bucketcp::testing
