#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <system_error>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace bucketcp::infra {
    void Config::merge_with(const Config& other) {
        if (other.endpoint) endpoint = other.endpoint;
        if (other.region) region = other.region;
        if (other.profile) profile = other.profile;
        if (other.bucket) bucket = other.bucket;

        if (other.upload_workers) upload_workers = other.upload_workers;
        if (other.download_workers) download_workers = other.download_workers;
        if (other.delete_workers) delete_workers = other.delete_workers;
        if (other.page_size) page_size = other.page_size;

        if (!other.progress) progress = false; // CLI может отключить
        if (other.quiet) quiet = true;
        if (other.verbose) verbose = true;
        if (other.log_level) log_level = other.log_level;
    }

    auto Config::validate() const -> VoidResult {
        if (upload_worker_count() == 0 || download_worker_count() == 0 || delete_worker_count() == 0) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig, "Worker count must be at least 1"));
        }
        if (listing_page_size() == 0) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig, "Page size must be at least 1"));
        }
        // from_str отдаёт off для любой незнакомой строки
        if (log_level && *log_level != "off" && spdlog::level::from_str(*log_level) == spdlog::level::off) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                fmt::format("Unknown log_level '{}'", *log_level)));
        }
        return {};
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".bucketcp.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "bucketcp" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "bucketcp" / "config.yaml");
            }
        }

        return paths;
    }

    auto load_config(const std::filesystem::path& path) -> Result<Config> {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["endpoint"]) cfg.endpoint = config["endpoint"].as<std::string>();
            if (config["region"]) cfg.region = config["region"].as<std::string>();
            if (config["profile"]) cfg.profile = config["profile"].as<std::string>();
            if (config["bucket"]) cfg.bucket = config["bucket"].as<std::string>();

            if (config["upload_workers"]) cfg.upload_workers = config["upload_workers"].as<std::uint32_t>();
            if (config["download_workers"]) cfg.download_workers = config["download_workers"].as<std::uint32_t>();
            if (config["delete_workers"]) cfg.delete_workers = config["delete_workers"].as<std::uint32_t>();
            if (config["page_size"]) cfg.page_size = config["page_size"].as<std::uint32_t>();

            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["verbose"]) cfg.verbose = config["verbose"].as<bool>();
            if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();

            if (auto valid = cfg.validate(); !valid) {
                return std::unexpected(make_error(ErrorCode::InvalidConfig,
                    fmt::format("{}: {}", path.string(), valid.error().message)));
            }

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const YAML::Exception& e) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                fmt::format("Failed to parse {}: {}", path.string(), e.what())));
        }
    }

    auto load_config_from_file() -> Result<Config> {
        for (const auto& path : get_config_paths()) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            return load_config(path);
        }

        // Файл не найден: возвращаем пустой конфиг (не ошибка!)
        return Config{};
    }

    auto config_from_cli(const args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.endpoint = args.endpoint;
        cfg.region = args.region;
        cfg.profile = args.profile;
        cfg.bucket = args.bucket;
        cfg.page_size = args.page_size;
        // --workers задаётся на одну операцию, поэтому переопределяет все три
        cfg.upload_workers = args.workers;
        cfg.download_workers = args.workers;
        cfg.delete_workers = args.workers;
        cfg.progress = !args.no_progress;
        cfg.quiet = args.quiet;
        cfg.verbose = args.verbose;
        return cfg;
    }

} // namespace bucketcp::infra
