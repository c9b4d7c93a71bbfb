#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "../../infra/error_handler/error.hpp"

namespace bucketcp::core {

/// A destination key prefix must be empty or end with '/'.
[[nodiscard]] auto validate_destination_prefix(std::string_view prefix) -> infra::VoidResult;

/// Object key for an uploaded file: the matched path taken relative to the
/// directory part of the pattern's static prefix, appended to `destination_prefix`.
///
/// derive_key("foo/a.csv", "foo/", "bar/") == "bar/a.csv"
[[nodiscard]] auto derive_key(std::string_view matched_path,
                              std::string_view pattern_static_prefix,
                              std::string_view destination_prefix = {})
    -> infra::Result<std::string>;

/// Local file for a downloaded object: the whole key below `destination_root`.
/// Keys that are absolute or climb out with ".." are rejected. The result is
/// lexically normal, so "d//x" and "d/./x" map to the same path as "d/x".
[[nodiscard]] auto derive_local_path(std::string_view key,
                                     const std::filesystem::path& destination_root)
    -> infra::Result<std::filesystem::path>;

} // namespace bucketcp::core
