#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "../model.hpp"
#include "../../adapters/object_store.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/monitoring.hpp"
#include "../../infra/worker_pool/worker_pool.hpp"

namespace bucketcp::core {

using infra::BatchResult;

struct TransferOptions {
    // nullopt: значение по умолчанию для операции из Config
    std::optional<std::uint32_t> workers;
    // Корень, относительно которого разбирается локальный шаблон
    std::filesystem::path local_root = ".";
    std::stop_token stop;
};

/// Bulk transfers between a local tree and one bucket.
///
/// Configuration and enumeration problems come back as an error before any
/// transfer starts. Once the pool runs, per-item failures are only counted
/// in the returned BatchResult.
class TransferEngine {
public:
    TransferEngine(adapters::ObjectStore& store,
                   const infra::Config& config,
                   infra::ProgressSink& progress);

    [[nodiscard]] auto upload(std::string_view local_pattern,
                              std::string_view destination_prefix,
                              const std::string& bucket,
                              const TransferOptions& options = {})
        -> infra::Result<BatchResult>;

    [[nodiscard]] auto download(std::string_view remote_pattern,
                                const std::filesystem::path& destination_dir,
                                const std::string& bucket,
                                const TransferOptions& options = {})
        -> infra::Result<BatchResult>;

    [[nodiscard]] auto remove(std::string_view remote_pattern,
                              const std::string& bucket,
                              const TransferOptions& options = {})
        -> infra::Result<BatchResult>;

    [[nodiscard]] auto list_all(const std::string& bucket) const
        -> infra::Result<std::vector<RemoteObject>>;

    [[nodiscard]] auto list(const std::string& bucket, std::string_view remote_pattern) const
        -> infra::Result<std::vector<RemoteObject>>;

private:
    adapters::ObjectStore& store_;
    const infra::Config& config_;
    infra::ProgressSink& progress_;

    [[nodiscard]] auto plan_upload(std::string_view local_pattern,
                                   std::string_view destination_prefix,
                                   const std::filesystem::path& root) const
        -> infra::Result<std::vector<UploadTask>>;

    [[nodiscard]] auto upload_one(const std::string& bucket, const UploadTask& task, std::stop_token st)
        -> infra::Result<std::uint64_t>;
    [[nodiscard]] auto download_one(const std::string& bucket, const DownloadTask& task, std::stop_token st)
        -> infra::Result<std::uint64_t>;
    [[nodiscard]] auto delete_one(const std::string& bucket, const DeleteTask& task, std::stop_token st)
        -> infra::Result<std::uint64_t>;

    template<typename Task, typename Fn>
    [[nodiscard]] auto run_(std::string_view label, std::vector<Task> tasks,
                            std::uint32_t workers, Fn&& transfer, std::stop_token st)
        -> BatchResult;
};

} // namespace bucketcp::core
