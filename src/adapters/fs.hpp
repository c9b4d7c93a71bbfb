#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>

#include "../infra/error_handler/error.hpp"

namespace bucketcp::adapters::fs {

struct FileStat {
    std::uint64_t size = 0;
    bool is_directory = false;
};

[[nodiscard]] auto stat(const std::filesystem::path& path) -> infra::Result<FileStat>;

// Поток для тела PUT-запроса; закрывается вместе с последним shared_ptr
[[nodiscard]] auto open_for_read(const std::filesystem::path& path)
    -> infra::Result<std::shared_ptr<std::iostream>>;

/// Creates missing parent directories, then truncates/creates `path`.
[[nodiscard]] auto create_for_write(const std::filesystem::path& path)
    -> infra::Result<std::ofstream>;

[[nodiscard]] auto create_directories(const std::filesystem::path& dir) -> infra::VoidResult;

} // namespace bucketcp::adapters::fs
