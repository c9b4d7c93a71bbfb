#pragma once

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../infra/error_handler/error.hpp"

namespace bucketcp::adapters {

struct RemoteObject {
    std::string key;
    std::uint64_t size = 0;
};

struct ListPage {
    std::vector<RemoteObject> objects;
    std::optional<std::string> next_token;   // nullopt: страниц больше нет
};

/// Single-object primitives of an S3-compatible store.
/// Implementations must be safe to call from many workers at once.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    [[nodiscard]] virtual auto put_object(const std::string& bucket,
                                          const std::string& key,
                                          std::shared_ptr<std::iostream> body,
                                          std::uint64_t size) -> infra::VoidResult = 0;

    /// Streams the object into `sink`; returns the number of bytes written.
    [[nodiscard]] virtual auto get_object(const std::string& bucket,
                                          const std::string& key,
                                          std::ostream& sink) -> infra::Result<std::uint64_t> = 0;

    [[nodiscard]] virtual auto delete_object(const std::string& bucket,
                                             const std::string& key) -> infra::VoidResult = 0;

    [[nodiscard]] virtual auto list_objects_page(const std::string& bucket,
                                                 const std::optional<std::string>& prefix,
                                                 const std::optional<std::string>& continuation_token,
                                                 std::uint32_t max_keys) -> infra::Result<ListPage> = 0;
};

} // namespace bucketcp::adapters
