#include "fs.hpp"

#include <fmt/core.h>
#include <system_error>
#include <utility>

namespace bucketcp::adapters::fs {

auto stat(const std::filesystem::path& path) -> infra::Result<FileStat> {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec) {
        return std::unexpected(infra::make_error(ec, fmt::format("Cannot stat {}", path.string())));
    }
    if (std::filesystem::is_directory(status)) {
        return FileStat{.size = 0, .is_directory = true};
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(infra::make_error(ec, fmt::format("Cannot get size of {}", path.string())));
    }
    return FileStat{.size = size, .is_directory = false};
}

auto open_for_read(const std::filesystem::path& path)
    -> infra::Result<std::shared_ptr<std::iostream>>
{
    auto stream = std::make_shared<std::fstream>(path, std::ios::in | std::ios::binary);
    if (!stream->is_open()) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
                fmt::format("Couldn't read file {}: no such file", path.string())));
        }
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadFailed,
            fmt::format("Couldn't read file {}", path.string())));
    }
    return stream;
}

auto create_directories(const std::filesystem::path& dir) -> infra::VoidResult {
    if (dir.empty()) return {};

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(infra::make_error(ec, fmt::format("Couldn't create directory {}", dir.string())));
    }
    return {};
}

auto create_for_write(const std::filesystem::path& path)
    -> infra::Result<std::ofstream>
{
    if (auto dirs = adapters::fs::create_directories(path.parent_path()); !dirs) {
        return std::unexpected(std::move(dirs.error()));
    }

    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        return std::unexpected(infra::make_error(infra::ErrorCode::WriteFailed,
            fmt::format("Couldn't open file {} for writing", path.string())));
    }
    return ofs;
}

} // namespace bucketcp::adapters::fs
