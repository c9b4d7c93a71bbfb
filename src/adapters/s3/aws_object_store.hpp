#pragma once

#include <memory>
#include <optional>
#include <string>

#include <aws/core/Aws.h>
#include <aws/s3/S3Client.h>

#include "../object_store.hpp"

namespace bucketcp::adapters::s3 {

/// Aws::InitAPI / Aws::ShutdownAPI for the lifetime of the object.
/// Must outlive every AwsObjectStore.
class SdkSession {
public:
    SdkSession();
    ~SdkSession();

    SdkSession(const SdkSession&) = delete;
    SdkSession& operator=(const SdkSession&) = delete;

private:
    Aws::SDKOptions options_;
};

struct Settings {
    std::optional<std::string> endpoint;   // S3-совместимое хранилище
    std::optional<std::string> region;
    std::optional<std::string> profile;
};

class AwsObjectStore final : public ObjectStore {
public:
    explicit AwsObjectStore(const Settings& settings);

    [[nodiscard]] auto put_object(const std::string& bucket,
                                  const std::string& key,
                                  std::shared_ptr<std::iostream> body,
                                  std::uint64_t size) -> infra::VoidResult override;

    [[nodiscard]] auto get_object(const std::string& bucket,
                                  const std::string& key,
                                  std::ostream& sink) -> infra::Result<std::uint64_t> override;

    [[nodiscard]] auto delete_object(const std::string& bucket,
                                     const std::string& key) -> infra::VoidResult override;

    [[nodiscard]] auto list_objects_page(const std::string& bucket,
                                         const std::optional<std::string>& prefix,
                                         const std::optional<std::string>& continuation_token,
                                         std::uint32_t max_keys) -> infra::Result<ListPage> override;

private:
    std::unique_ptr<Aws::S3::S3Client> client_;
};

} // namespace bucketcp::adapters::s3
