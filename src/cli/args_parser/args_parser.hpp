#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>



namespace bucketcp::args_parser {

enum class Command {
    Upload,
    Download,
    List,
    Remove,
    Version,
};

struct CLIArgs
{
    Command command{Command::List};

    std::string pattern;                        // позиционный <pattern>
    std::string destination;                    // префикс ключа или каталог

    std::optional<std::string> bucket;          // -b, --bucket
    std::optional<std::string> endpoint;        // --endpoint
    std::optional<std::string> region;          // --region
    std::optional<std::string> profile;         // --profile
    std::optional<std::string> root;            // --root (только upload)
    std::optional<std::uint32_t> workers;       // -j, --workers=N
    std::optional<std::uint32_t> page_size;     // --page-size=N
    bool no_progress{false};                    // --no-progress
    bool quiet{false};                          // -q, --quiet
    bool verbose{false};                        // -v, --verbose
    bool long_listing{false};                   // ls -l
};



/// Parses command-line arguments and returns a CLIArgs struct.
/// Returns nullopt after printing help or a usage error; `exit_code` then holds
/// the code CLI11 chose.
std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code);

} // namespace bucketcp::args_parser
