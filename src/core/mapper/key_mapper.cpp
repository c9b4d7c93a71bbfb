#include "key_mapper.hpp"

#include <fmt/core.h>

#include "../pattern/pattern_matcher.hpp"

namespace bucketcp::core {

auto validate_destination_prefix(std::string_view prefix) -> infra::VoidResult {
    if (prefix.empty() || prefix.back() == '/') {
        return {};
    }
    return std::unexpected(infra::make_error(infra::ErrorCode::InvalidDestination,
        fmt::format("Destination '{}' must be empty or end in '/'", prefix)));
}

auto derive_key(std::string_view matched_path,
                std::string_view pattern_static_prefix,
                std::string_view destination_prefix)
    -> infra::Result<std::string>
{
    const auto base = static_directory(pattern_static_prefix);
    if (!matched_path.starts_with(base) || matched_path.size() == base.size()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPattern,
            fmt::format("'{}' is not below '{}'", matched_path, base)));
    }

    // Ключ всегда с '/', независимо от ОС
    auto relative = std::filesystem::path(std::string(matched_path.substr(base.size()))).generic_string();
    return std::string(destination_prefix) + relative;
}

auto derive_local_path(std::string_view key,
                       const std::filesystem::path& destination_root)
    -> infra::Result<std::filesystem::path>
{
    if (key.empty() || key.front() == '/' || key.back() == '/') {
        return std::unexpected(infra::make_error(infra::ErrorCode::UnsafeKey,
            fmt::format("Key '{}' does not name a file", key)));
    }

    const std::filesystem::path relative{std::string(key)};
    for (const auto& part : relative) {
        if (part == "..") {
            return std::unexpected(infra::make_error(infra::ErrorCode::UnsafeKey,
                fmt::format("Key '{}' escapes the destination directory", key)));
        }
    }

    auto local = (destination_root / relative).lexically_normal();
    if (!local.has_filename()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::UnsafeKey,
            fmt::format("Key '{}' does not name a file", key)));
    }
    return local;
}

} // namespace bucketcp::core
