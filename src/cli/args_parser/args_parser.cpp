#include "args_parser.hpp"

#include <CLI/CLI.hpp>
#include <fmt/core.h>

namespace bucketcp::args_parser {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code)
{
    CLIArgs args;
    bool version = false;

    CLI::App app{"bucketcp - bulk transfers between a local tree and an S3-compatible bucket"};
    app.require_subcommand(0, 1);

    app.add_option("-b,--bucket", args.bucket, "Bucket name");
    app.add_option("--endpoint", args.endpoint, "S3-compatible endpoint URL");
    app.add_option("--region", args.region, "Region");
    app.add_option("--profile", args.profile, "Credentials profile");
    app.add_option("-j,--workers", args.workers, "Concurrent transfers")
        ->check(CLI::PositiveNumber);
    app.add_option("--page-size", args.page_size, "Keys per listing page")
        ->check(CLI::Range(1u, 1000u));
    app.add_flag("--no-progress", args.no_progress, "Disable the progress bar");
    app.add_flag("-q,--quiet", args.quiet, "Only warnings and errors");
    app.add_flag("-v,--verbose", args.verbose, "Debug logging");
    app.add_flag("--version", version, "Print build information");

    auto* upload = app.add_subcommand("upload", "Upload local files matching a pattern");
    upload->add_option("pattern", args.pattern, "Local glob, e.g. 'data/**/*.csv'")->required();
    upload->add_option("prefix", args.destination, "Key prefix; empty or ending in '/'");
    upload->add_option("--root", args.root, "Directory the pattern is resolved against")
        ->check(CLI::ExistingDirectory);

    auto* download = app.add_subcommand("download", "Download objects whose keys match a pattern");
    download->add_option("pattern", args.pattern, "Key glob, e.g. 'logs/2024-*/*.gz'")->required();
    download->add_option("destination", args.destination, "Local directory")->required();

    auto* ls = app.add_subcommand("ls", "List objects, optionally filtered by a pattern");
    ls->add_option("pattern", args.pattern, "Key glob");
    ls->add_flag("-l,--long", args.long_listing, "Print sizes");

    auto* rm = app.add_subcommand("rm", "Delete objects whose keys match a pattern");
    rm->add_option("pattern", args.pattern, "Key glob")->required();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit_code = app.exit(e);
        return std::nullopt;
    }

    if (version) {
        args.command = Command::Version;
    } else if (*upload) {
        args.command = Command::Upload;
    } else if (*download) {
        args.command = Command::Download;
    } else if (*rm) {
        args.command = Command::Remove;
    } else if (*ls) {
        args.command = Command::List;
    } else {
        fmt::print("{}", app.help());
        exit_code = 1;
        return std::nullopt;
    }

    exit_code = 0;
    return args;
}

} // namespace bucketcp::args_parser
