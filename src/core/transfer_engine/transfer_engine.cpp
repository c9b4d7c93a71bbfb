#include "transfer_engine.hpp"

#include <fmt/core.h>
#include <map>
#include <spdlog/spdlog.h>
#include <span>
#include <utility>

#include "../lister/remote_lister.hpp"
#include "../mapper/key_mapper.hpp"
#include "../pattern/pattern_matcher.hpp"
#include "../size/size_aggregator.hpp"
#include "../../adapters/fs.hpp"

namespace bucketcp::core {

namespace {

auto check_bucket(const std::string& bucket) -> infra::VoidResult {
    if (bucket.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidConfig, "Bucket name is required"));
    }
    return {};
}

auto resolve_workers(std::optional<std::uint32_t> requested, std::uint32_t fallback)
    -> infra::Result<std::uint32_t>
{
    const auto workers = requested.value_or(fallback);
    if (workers == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidConfig,
                                                 "Worker count must be at least 1"));
    }
    return workers;
}

// Сохраняет код ошибки, добавляя контекст задачи
auto with_context(const infra::Error& err, std::string_view context) -> infra::Error {
    return infra::make_error(err.code, fmt::format("{}: {}", context, err.message));
}

auto cancelled(std::string_view what) -> infra::Error {
    return infra::make_error(infra::ErrorCode::Cancelled, fmt::format("{} skipped after stop request", what));
}

auto normalize_local_pattern(std::string_view pattern) -> std::string_view {
    while (pattern.starts_with("./")) {
        pattern.remove_prefix(2);
    }
    return pattern;
}

} // namespace

TransferEngine::TransferEngine(adapters::ObjectStore& store,
                               const infra::Config& config,
                               infra::ProgressSink& progress)
    : store_(store), config_(config), progress_(progress) {}

template<typename Task, typename Fn>
auto TransferEngine::run_(std::string_view label, std::vector<Task> tasks,
                          std::uint32_t workers, Fn&& transfer, std::stop_token st)
    -> BatchResult
{
    const auto total_bytes = total_size(std::span<const Task>(tasks));
    progress_.begin(label, total_bytes, tasks.size());

    auto result = infra::run_batch(std::move(tasks), workers, std::forward<Fn>(transfer), progress_, st);

    progress_.finish();
    return result;
}

// =============== Upload ===============

auto TransferEngine::plan_upload(std::string_view local_pattern,
                                 std::string_view destination_prefix,
                                 const std::filesystem::path& root) const
    -> infra::Result<std::vector<UploadTask>>
{
    local_pattern = normalize_local_pattern(local_pattern);
    if (local_pattern.starts_with('/')) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPattern,
            fmt::format("Local pattern '{}' must be relative to {}", local_pattern, root.string())));
    }

    auto pattern = Pattern::compile(local_pattern);
    if (!pattern) {
        return std::unexpected(std::move(pattern.error()));
    }

    auto matches = glob_local(root, *pattern);
    if (!matches) {
        return std::unexpected(std::move(matches.error()));
    }

    auto files = stat_local_files(root, *matches);
    if (!files) {
        return std::unexpected(std::move(files.error()));
    }

    std::vector<UploadTask> tasks;
    tasks.reserve(files->size());
    for (auto& file : *files) {
        auto key = derive_key(file.path, pattern->static_prefix(), destination_prefix);
        if (!key) {
            return std::unexpected(std::move(key.error()));
        }
        tasks.push_back(UploadTask{.source = root / file.path, .key = std::move(*key), .size = file.size});
    }
    return tasks;
}

auto TransferEngine::upload(std::string_view local_pattern,
                            std::string_view destination_prefix,
                            const std::string& bucket,
                            const TransferOptions& options)
    -> infra::Result<BatchResult>
{
    // Всё, что может провалить батч целиком, проверяется до старта воркеров
    if (auto ok = check_bucket(bucket); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    if (auto ok = validate_destination_prefix(destination_prefix); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    auto workers = resolve_workers(options.workers, config_.upload_worker_count());
    if (!workers) {
        return std::unexpected(std::move(workers.error()));
    }

    auto tasks = plan_upload(local_pattern, destination_prefix, options.local_root);
    if (!tasks) {
        return std::unexpected(std::move(tasks.error()));
    }

    spdlog::info("Uploading {} file(s) matching '{}' to s3://{}/{} with {} worker(s)",
                 tasks->size(), local_pattern, bucket, destination_prefix, *workers);

    return run_("uploading", std::move(*tasks), *workers,
                [this, &bucket](const UploadTask& task, std::stop_token st) {
                    return upload_one(bucket, task, st);
                },
                options.stop);
}

auto TransferEngine::upload_one(const std::string& bucket, const UploadTask& task, std::stop_token st)
    -> infra::Result<std::uint64_t>
{
    if (st.stop_requested()) {
        return std::unexpected(cancelled(task.source.string()));
    }

    // Каждый воркер открывает свой файл на одну задачу
    auto body = adapters::fs::open_for_read(task.source);
    if (!body) {
        return std::unexpected(with_context(body.error(),
            fmt::format("Couldn't upload {} to s3://{}/{}", task.source.string(), bucket, task.key)));
    }

    auto res = store_.put_object(bucket, task.key, std::move(*body), task.size);
    if (!res) {
        return std::unexpected(with_context(res.error(),
            fmt::format("Couldn't upload {} to s3://{}/{}", task.source.string(), bucket, task.key)));
    }

    spdlog::debug("Uploaded {} -> s3://{}/{}", task.source.string(), bucket, task.key);
    return task.size;
}

// =============== Download ===============

auto TransferEngine::download(std::string_view remote_pattern,
                              const std::filesystem::path& destination_dir,
                              const std::string& bucket,
                              const TransferOptions& options)
    -> infra::Result<BatchResult>
{
    if (auto ok = check_bucket(bucket); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    if (destination_dir.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidDestination,
                                                 "Destination directory is required"));
    }
    auto workers = resolve_workers(options.workers, config_.download_worker_count());
    if (!workers) {
        return std::unexpected(std::move(workers.error()));
    }

    auto pattern = Pattern::compile(remote_pattern);
    if (!pattern) {
        return std::unexpected(std::move(pattern.error()));
    }

    RemoteLister lister(store_, config_.listing_page_size());
    auto matches = lister.list_matching(bucket, *pattern);
    if (!matches) {
        return std::unexpected(std::move(matches.error()));
    }

    std::vector<DownloadTask> tasks;
    tasks.reserve(matches->size());
    std::uint64_t rejected = 0;
    // Нормализованный локальный путь -> ключ, который его занял
    std::map<std::filesystem::path, std::string> claimed;
    for (auto& object : *matches) {
        auto destination = derive_local_path(object.key, destination_dir);
        if (!destination) {
            // Небезопасный ключ: ошибка задачи, а не всего батча
            ++rejected;
            (void)infra::log_and_return(std::move(destination.error()));
            continue;
        }
        // Разные ключи ("d/x", "d//x", "d/./x") не должны писать в один файл
        auto [owner, inserted] = claimed.try_emplace(*destination, object.key);
        if (!inserted) {
            ++rejected;
            (void)infra::log_and_return(infra::make_error(infra::ErrorCode::DestinationConflict,
                fmt::format("Key '{}' maps to {}, already taken by key '{}'",
                            object.key, destination->string(), owner->second)));
            continue;
        }
        tasks.push_back(DownloadTask{.key = std::move(object.key),
                                     .destination = std::move(*destination),
                                     .size = object.size});
    }

    spdlog::info("Downloading {} object(s) matching '{}' from s3://{} to {} with {} worker(s)",
                 tasks.size(), remote_pattern, bucket, destination_dir.string(), *workers);

    auto result = run_("downloading", std::move(tasks), *workers,
                       [this, &bucket](const DownloadTask& task, std::stop_token st) {
                           return download_one(bucket, task, st);
                       },
                       options.stop);
    result.total += rejected;
    result.failed += rejected;
    return result;
}

auto TransferEngine::download_one(const std::string& bucket, const DownloadTask& task, std::stop_token st)
    -> infra::Result<std::uint64_t>
{
    if (st.stop_requested()) {
        return std::unexpected(cancelled(task.key));
    }

    auto out = adapters::fs::create_for_write(task.destination);
    if (!out) {
        return std::unexpected(with_context(out.error(),
            fmt::format("Couldn't download s3://{}/{} to {}", bucket, task.key, task.destination.string())));
    }

    auto written = store_.get_object(bucket, task.key, *out);
    if (!written) {
        return std::unexpected(with_context(written.error(),
            fmt::format("Couldn't download s3://{}/{} to {}", bucket, task.key, task.destination.string())));
    }

    out->close();
    if (out->fail()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::WriteFailed,
            fmt::format("Couldn't write {} for s3://{}/{}", task.destination.string(), bucket, task.key)));
    }

    spdlog::debug("Downloaded s3://{}/{} -> {}", bucket, task.key, task.destination.string());
    return *written;
}

// =============== Remove ===============

auto TransferEngine::remove(std::string_view remote_pattern,
                            const std::string& bucket,
                            const TransferOptions& options)
    -> infra::Result<BatchResult>
{
    if (auto ok = check_bucket(bucket); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    auto workers = resolve_workers(options.workers, config_.delete_worker_count());
    if (!workers) {
        return std::unexpected(std::move(workers.error()));
    }

    auto matches = list(bucket, remote_pattern);
    if (!matches) {
        return std::unexpected(std::move(matches.error()));
    }

    std::vector<DeleteTask> tasks;
    tasks.reserve(matches->size());
    for (auto& object : *matches) {
        tasks.push_back(DeleteTask{.key = std::move(object.key), .size = object.size});
    }

    spdlog::info("Deleting {} object(s) matching '{}' from s3://{}", tasks.size(), remote_pattern, bucket);

    return run_("deleting", std::move(tasks), *workers,
                [this, &bucket](const DeleteTask& task, std::stop_token st) {
                    return delete_one(bucket, task, st);
                },
                options.stop);
}

auto TransferEngine::delete_one(const std::string& bucket, const DeleteTask& task, std::stop_token st)
    -> infra::Result<std::uint64_t>
{
    if (st.stop_requested()) {
        return std::unexpected(cancelled(task.key));
    }

    auto res = store_.delete_object(bucket, task.key);
    if (!res) {
        return std::unexpected(with_context(res.error(),
            fmt::format("Couldn't delete s3://{}/{}", bucket, task.key)));
    }
    spdlog::debug("Deleted s3://{}/{}", bucket, task.key);
    return task.size;
}

// =============== Listing ===============

auto TransferEngine::list_all(const std::string& bucket) const
    -> infra::Result<std::vector<RemoteObject>>
{
    if (auto ok = check_bucket(bucket); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    return RemoteLister(store_, config_.listing_page_size()).list(bucket);
}

auto TransferEngine::list(const std::string& bucket, std::string_view remote_pattern) const
    -> infra::Result<std::vector<RemoteObject>>
{
    if (auto ok = check_bucket(bucket); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    auto pattern = Pattern::compile(remote_pattern);
    if (!pattern) {
        return std::unexpected(std::move(pattern.error()));
    }
    return RemoteLister(store_, config_.listing_page_size()).list_matching(bucket, *pattern);
}

} // namespace bucketcp::core
