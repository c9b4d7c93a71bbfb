#include "pattern_matcher.hpp"

#include <spdlog/spdlog.h>
#include <system_error>

namespace bucketcp::core {

namespace {

constexpr std::string_view kRegexSpecial = R"(\^$.|+()[]{})";

void append_literal(std::string& out, char c) {
    if (kRegexSpecial.find(c) != std::string_view::npos) {
        out.push_back('\\');
    }
    out.push_back(c);
}

} // namespace

auto wildcard_to_regex(std::string_view pattern) -> std::string {
    std::string out;
    out.reserve(pattern.size() * 2 + 2);
    out.push_back('^');

    // Самый длинный токен первым: "**/" раньше "*"
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        if (pattern.substr(i, 3) == "**/") {
            out += "(?:[^/]*/)*";
            i += 2;
        } else if (c == '*') {
            out += "[^/]*";
        } else if (c == '?') {
            out += "[^/]";
        } else {
            append_literal(out, c);
        }
    }

    out.push_back('$');
    return out;
}

auto static_prefix(std::string_view pattern) -> std::string_view {
    return pattern.substr(0, pattern.find_first_of("*?"));
}

auto static_directory(std::string_view pattern) -> std::string_view {
    auto prefix = static_prefix(pattern);
    auto slash = prefix.rfind('/');
    if (slash == std::string_view::npos) {
        return {};
    }
    return prefix.substr(0, slash + 1);
}

auto Pattern::compile(std::string_view pattern) -> infra::Result<Pattern> {
    if (pattern.find('\0') != std::string_view::npos) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPattern,
            "Pattern contains a NUL character"));
    }

    auto expression = wildcard_to_regex(pattern);
    try {
        std::regex re(expression, std::regex::ECMAScript | std::regex::optimize);
        spdlog::debug("Compiled pattern '{}' to {}", pattern, expression);
        return Pattern(std::string(pattern), std::move(expression), std::move(re));
    } catch (const std::regex_error& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPattern,
            fmt::format("Cannot compile pattern '{}': {}", pattern, e.what())));
    }
}

auto Pattern::matches(std::string_view candidate) const -> bool {
    return std::regex_match(candidate.begin(), candidate.end(), re_);
}

auto glob_local(const std::filesystem::path& root, const Pattern& pattern)
    -> infra::Result<std::vector<std::string>>
{
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::WalkFailed,
            fmt::format("Root is not a directory: {}", root.string())));
    }

    std::vector<std::string> matches;

    // Обходим только поддерево статической части шаблона
    const auto start = root / fs::path(std::string(pattern.static_directory()));
    if (!fs::is_directory(start, ec)) {
        spdlog::debug("Nothing to walk under {}", start.string());
        return matches;
    }

    fs::recursive_directory_iterator it(start, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::WalkFailed,
            fmt::format("Cannot walk {}: {}", start.string(), ec.message())));
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::WalkFailed,
                fmt::format("Walk failed under {}: {}", start.string(), ec.message())));
        }

        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;

        auto relative = it->path().lexically_relative(root).generic_string();
        if (pattern.matches(relative)) {
            matches.push_back(std::move(relative));
        }
    }
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::WalkFailed,
            fmt::format("Walk failed under {}: {}", start.string(), ec.message())));
    }

    spdlog::debug("Pattern '{}' ({}) matched {} file(s) under {}",
                  pattern.source(), pattern.expression(), matches.size(), root.string());
    return matches;
}

} // namespace bucketcp::core
