#include "remote_lister.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace bucketcp::core {

RemoteLister::RemoteLister(adapters::ObjectStore& store, std::uint32_t page_size)
    : store_(store), page_size_(page_size == 0 ? 1 : page_size) {}

auto RemoteLister::list(const std::string& bucket,
                        const std::optional<std::string>& prefix) const
    -> infra::Result<std::vector<RemoteObject>>
{
    std::vector<RemoteObject> results;
    std::optional<std::string> token;
    std::size_t page = 0;

    do {
        ++page;
        auto res = store_.list_objects_page(bucket, prefix, token, page_size_);
        if (!res) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ListingFailed,
                fmt::format("Failed to get page {} in bucket {}: {}", page, bucket, res.error().message)));
        }

        auto& objects = res->objects;
        results.insert(results.end(),
                       std::make_move_iterator(objects.begin()),
                       std::make_move_iterator(objects.end()));
        auto& next = res->next_token;
        if (next && next->empty()) {
            next.reset();
        }
        if (next && token && *next == *token) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ListingFailed,
                fmt::format("Bucket {} returned the same continuation token twice", bucket)));
        }
        token = std::move(next);
    } while (token);

    spdlog::debug("Listed {} object(s) in {} page(s) of bucket {} (prefix '{}')",
                  results.size(), page, bucket, prefix.value_or(""));
    return results;
}

auto RemoteLister::list_matching(const std::string& bucket, const Pattern& pattern) const
    -> infra::Result<std::vector<RemoteObject>>
{
    std::optional<std::string> prefix;
    if (auto p = pattern.static_prefix(); !p.empty()) {
        prefix = std::string(p);
    }

    auto listed = list(bucket, prefix);
    if (!listed) {
        return listed;
    }

    std::erase_if(*listed, [&](const RemoteObject& obj) {
        return obj.key.ends_with('/') || !pattern.matches(obj.key);
    });
    return listed;
}

} // namespace bucketcp::core
