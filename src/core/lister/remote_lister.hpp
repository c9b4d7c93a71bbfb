#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../model.hpp"
#include "../pattern/pattern_matcher.hpp"
#include "../../adapters/object_store.hpp"
#include "../../infra/error_handler/error.hpp"

namespace bucketcp::core {

class RemoteLister {
public:
    RemoteLister(adapters::ObjectStore& store, std::uint32_t page_size);

    /// Follows continuation tokens until the store reports no more pages.
    /// A failed page fails the whole listing; partial results are discarded.
    [[nodiscard]] auto list(const std::string& bucket,
                            const std::optional<std::string>& prefix = std::nullopt) const
        -> infra::Result<std::vector<RemoteObject>>;

    /// Lists under the pattern's static prefix and keeps the keys it matches.
    /// Keys ending in '/' (folder placeholders) are never returned.
    [[nodiscard]] auto list_matching(const std::string& bucket, const Pattern& pattern) const
        -> infra::Result<std::vector<RemoteObject>>;

private:
    adapters::ObjectStore& store_;
    std::uint32_t page_size_;
};

} // namespace bucketcp::core
