#pragma once

#include <filesystem>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "../../infra/error_handler/error.hpp"

namespace bucketcp::core {

/// Translates a glob into an anchored ECMAScript expression.
///
///   `**/` - zero or more whole path segments (`a/`, `a/b/`, ...)
///   `*`   - any run of characters inside one segment
///   `?`   - exactly one character other than '/'
///
/// Every other character is matched literally. The empty glob yields `^$`.
[[nodiscard]] auto wildcard_to_regex(std::string_view pattern) -> std::string;

/// The literal part of a glob before its first `*` or `?`.
[[nodiscard]] auto static_prefix(std::string_view pattern) -> std::string_view;

/// static_prefix() cut back to its last '/', inclusive. Empty when there is none.
[[nodiscard]] auto static_directory(std::string_view pattern) -> std::string_view;

class Pattern {
public:
    [[nodiscard]] static auto compile(std::string_view pattern) -> infra::Result<Pattern>;

    // Совпадение всей строки, не подстроки
    [[nodiscard]] auto matches(std::string_view candidate) const -> bool;

    [[nodiscard]] auto source() const -> const std::string& { return source_; }
    [[nodiscard]] auto expression() const -> const std::string& { return expression_; }
    [[nodiscard]] auto static_prefix() const -> std::string_view { return core::static_prefix(source_); }
    [[nodiscard]] auto static_directory() const -> std::string_view { return core::static_directory(source_); }
    [[nodiscard]] auto has_wildcards() const -> bool { return static_prefix().size() != source_.size(); }

private:
    Pattern(std::string source, std::string expression, std::regex re)
        : source_(std::move(source)), expression_(std::move(expression)), re_(std::move(re)) {}

    std::string source_;
    std::string expression_;
    std::regex re_;
};

/// Walks `root` recursively and returns the root-relative, '/'-separated paths
/// of the regular files matched by `pattern`. Directories are never returned.
/// Only the subtree under the pattern's static directory is visited.
/// Order follows the directory walk.
[[nodiscard]] auto glob_local(const std::filesystem::path& root, const Pattern& pattern)
    -> infra::Result<std::vector<std::string>>;

} // namespace bucketcp::core
