#include "size_aggregator.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "../../adapters/fs.hpp"

namespace bucketcp::core {

auto stat_local_files(const std::filesystem::path& root,
                      std::span<const std::string> paths)
    -> infra::Result<std::vector<LocalFile>>
{
    std::vector<LocalFile> files;
    files.reserve(paths.size());

    for (const auto& path : paths) {
        auto st = adapters::fs::stat(root / path);
        if (!st) {
            return std::unexpected(infra::make_error(infra::ErrorCode::StatFailed,
                fmt::format("Error getting size of {}: {}", path, st.error().message)));
        }
        if (st->is_directory) {
            spdlog::debug("Skipping directory {}", path);
            continue;
        }
        files.push_back(LocalFile{.path = path, .size = st->size});
    }
    return files;
}

auto total_local_size(const std::filesystem::path& root,
                      std::span<const std::string> paths)
    -> infra::Result<std::uint64_t>
{
    auto files = stat_local_files(root, paths);
    if (!files) {
        return std::unexpected(std::move(files.error()));
    }
    return total_size(std::span<const LocalFile>(*files));
}

} // namespace bucketcp::core
