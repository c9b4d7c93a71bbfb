#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <stop_token>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/transfer_engine/transfer_engine.hpp"
#include "adapters/s3/aws_object_store.hpp"
#include <build_info.hpp>

using ARGS = bucketcp::args_parser::CLIArgs;
using COMMAND = bucketcp::args_parser::Command;

constexpr auto load_from_cli = bucketcp::infra::config_from_cli;
constexpr auto load_config_file = bucketcp::infra::load_config_from_file;
constexpr auto git = bucketcp::build_info::get_git_info();

static auto
out_version()
-> void {
    fmt::print("bucketcp {}\n", bucketcp::build_info::version);
    fmt::print("Git branch: {}\n", git.branch);
    fmt::print("Git commit: {}\n", git.commit);
    fmt::print("Git commit short: {}\n", git.commit_short);
    fmt::print("Git dirty: {}\n", git.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", git.timestamp);
}

static auto
apply_log_level(const bucketcp::infra::Config& config)
-> void {
    if (config.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (config.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else if (config.log_level) {
        spdlog::set_level(spdlog::level::from_str(*config.log_level));
    }
}

static auto
report(std::string_view what, const bucketcp::infra::BatchResult& result,
       std::chrono::milliseconds elapsed)
-> int {
    using bucketcp::infra::format_bytes;

    spdlog::info("{}: {} of {} succeeded, {} failed, {} cancelled",
                 what, result.succeeded, result.total, result.failed, result.cancelled);
    spdlog::info("Bytes transferred: {} ({})", result.bytes, format_bytes(static_cast<double>(result.bytes)));
    spdlog::info("Time elapsed: {:.2f} seconds", elapsed.count() / 1000.0);
    if (result.bytes > 0 && elapsed.count() > 0) {
        spdlog::info("Average speed: {}/s", format_bytes(result.bytes / (elapsed.count() / 1000.0)));
    }

    if (result.stop_requested) return 130;
    return result.ok() ? 0 : 1;
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        bucketcp::infra::install_signal_handler();

        int exit_code = 0;
        auto args_opt = bucketcp::args_parser::parse_args(argc, argv, exit_code);
        if (!args_opt) {
            return exit_code; // --help или ошибка
        }
        const ARGS& args = *args_opt;

        if (args.command == COMMAND::Version) {
            out_version();
            return 0;
        }

        // 1. Загрузить из файла
        auto config_res = load_config_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error().message);
            return config_res.error().to_exit_code();
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args));
        apply_log_level(config);

        if (auto valid = config.validate(); !valid) {
            spdlog::error("Config error: {}", valid.error().message);
            return valid.error().to_exit_code();
        }

        if (!config.bucket) {
            spdlog::error("No bucket given: use --bucket or set 'bucket' in the config file");
            return 2;
        }
        const std::string& bucket = *config.bucket;

        bucketcp::adapters::s3::SdkSession session;
        bucketcp::adapters::s3::AwsObjectStore store({
            .endpoint = config.endpoint,
            .region = config.region,
            .profile = config.profile,
        });

        bucketcp::infra::ProgressMonitor monitor(config.progress, config.quiet);
        bucketcp::core::TransferEngine engine(store, config, monitor);

        std::stop_source stop;
        auto interrupt_watcher = bucketcp::infra::forward_interrupts(stop);

        bucketcp::core::TransferOptions options{
            .workers = args.workers,
            .local_root = args.root.value_or("."),
            .stop = stop.get_token(),
        };

        auto start_time = std::chrono::steady_clock::now();
        auto elapsed = [&] {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time);
        };

        switch (args.command) {
            case COMMAND::Upload: {
                auto result = engine.upload(args.pattern, args.destination, bucket, options);
                if (!result) {
                    spdlog::error("Upload failed: {}", result.error().message);
                    return result.error().to_exit_code();
                }
                if (result->total == 0) {
                    spdlog::warn("No files matched '{}'", args.pattern);
                }
                return report("Upload", *result, elapsed());
            }
            case COMMAND::Download: {
                auto result = engine.download(args.pattern, args.destination, bucket, options);
                if (!result) {
                    spdlog::error("Download failed: {}", result.error().message);
                    return result.error().to_exit_code();
                }
                if (result->total == 0) {
                    spdlog::warn("No objects matched '{}'", args.pattern);
                }
                return report("Download", *result, elapsed());
            }
            case COMMAND::Remove: {
                auto result = engine.remove(args.pattern, bucket, options);
                if (!result) {
                    spdlog::error("Delete failed: {}", result.error().message);
                    return result.error().to_exit_code();
                }
                return report("Delete", *result, elapsed());
            }
            case COMMAND::List: {
                auto objects = args.pattern.empty()
                    ? engine.list_all(bucket)
                    : engine.list(bucket, args.pattern);
                if (!objects) {
                    spdlog::error("Listing failed: {}", objects.error().message);
                    return objects.error().to_exit_code();
                }
                for (const auto& object : *objects) {
                    if (args.long_listing) {
                        fmt::print("{:>14} {}\n", object.size, object.key);
                    } else {
                        fmt::print("{}\n", object.key);
                    }
                }
                return 0;
            }
            case COMMAND::Version:
                break;
        }
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
