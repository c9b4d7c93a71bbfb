#pragma once

#include <cstdint>
#include <filesystem>
#include <numeric>
#include <span>
#include <string>
#include <vector>

#include "../model.hpp"
#include "../../infra/error_handler/error.hpp"

namespace bucketcp::core {

/// Stats every matched path below `root`. Directories are dropped silently;
/// any stat failure aborts with a StatFailed error, since the batch cannot
/// start without a known total.
[[nodiscard]] auto stat_local_files(const std::filesystem::path& root,
                                    std::span<const std::string> paths)
    -> infra::Result<std::vector<LocalFile>>;

template<typename Item>
[[nodiscard]] auto total_size(std::span<const Item> items) -> std::uint64_t {
    return std::accumulate(items.begin(), items.end(), std::uint64_t{0},
                           [](std::uint64_t acc, const Item& item) { return acc + item.size; });
}

[[nodiscard]] auto total_local_size(const std::filesystem::path& root,
                                    std::span<const std::string> paths)
    -> infra::Result<std::uint64_t>;

// Для удалённых объектов размер уже пришёл в листинге
[[nodiscard]] inline auto total_remote_size(std::span<const RemoteObject> objects) -> std::uint64_t {
    return total_size(objects);
}

} // namespace bucketcp::core
