#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>

#include "../error_handler/error.hpp"

namespace bucketcp::args_parser {
    struct CLIArgs;
}

namespace bucketcp::infra {

inline constexpr std::uint32_t kDefaultUploadWorkers = 25;
inline constexpr std::uint32_t kDefaultDownloadWorkers = 50;
inline constexpr std::uint32_t kDefaultDeleteWorkers = 50;
inline constexpr std::uint32_t kDefaultPageSize = 1000;

struct Config {
    // Хранилище
    std::optional<std::string> endpoint;
    std::optional<std::string> region;
    std::optional<std::string> profile;
    std::optional<std::string> bucket;

    // Параллелизм
    std::optional<std::uint32_t> upload_workers;
    std::optional<std::uint32_t> download_workers;
    std::optional<std::uint32_t> delete_workers;
    std::optional<std::uint32_t> page_size;

    // Вывод
    bool progress = true;
    bool quiet = false;
    bool verbose = false;
    std::optional<std::string> log_level;

    [[nodiscard]] auto upload_worker_count() const -> std::uint32_t {
        return upload_workers.value_or(kDefaultUploadWorkers);
    }
    [[nodiscard]] auto download_worker_count() const -> std::uint32_t {
        return download_workers.value_or(kDefaultDownloadWorkers);
    }
    [[nodiscard]] auto delete_worker_count() const -> std::uint32_t {
        return delete_workers.value_or(kDefaultDeleteWorkers);
    }
    [[nodiscard]] auto listing_page_size() const -> std::uint32_t {
        return page_size.value_or(kDefaultPageSize);
    }

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);

    /// Rejects zero worker counts, a zero page size and an unknown log_level.
    [[nodiscard]] auto validate() const -> VoidResult;
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.bucketcp.yaml
///   2. $XDG_CONFIG_HOME/bucketcp/config.yaml или ~/.config/bucketcp/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> Result<Config>;

/// Разбирает конкретный файл (используется и тестами).
[[nodiscard]] auto load_config(const std::filesystem::path& path) -> Result<Config>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const args_parser::CLIArgs& args) -> Config;

} // namespace bucketcp::infra
