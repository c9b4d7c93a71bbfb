#include "aws_object_store.hpp"

#include <aws/core/auth/AWSCredentialsProvider.h>
#include <aws/core/auth/AWSCredentialsProviderChain.h>
#include <aws/s3/S3ClientConfiguration.h>
#include <aws/s3/S3EndpointProvider.h>
#include <aws/s3/model/DeleteObjectRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <ostream>

namespace bucketcp::adapters::s3 {

namespace {

constexpr const char* kAllocationTag = "bucketcp";

template<typename AwsError>
auto to_error(const AwsError& error, std::string_view what) -> infra::Error {
    auto code = infra::ErrorCode::NetworkError;
    switch (error.GetErrorType()) {
        case Aws::S3::S3Errors::ACCESS_DENIED:
        case Aws::S3::S3Errors::INVALID_ACCESS_KEY_ID:
        case Aws::S3::S3Errors::SIGNATURE_DOES_NOT_MATCH:
            code = infra::ErrorCode::PermissionDenied;
            break;
        case Aws::S3::S3Errors::NO_SUCH_KEY:
        case Aws::S3::S3Errors::NO_SUCH_BUCKET:
        case Aws::S3::S3Errors::RESOURCE_NOT_FOUND:
            code = infra::ErrorCode::FileNotFound;
            break;
        default:
            break;
    }
    return infra::make_error(code, fmt::format("{}: {} ({})", what,
        error.GetMessage().c_str(), error.GetExceptionName().c_str()));
}

} // namespace

SdkSession::SdkSession() {
    Aws::InitAPI(options_);
}

SdkSession::~SdkSession() {
    Aws::ShutdownAPI(options_);
}

AwsObjectStore::AwsObjectStore(const Settings& settings) {
    auto config = settings.profile
        ? Aws::S3::S3ClientConfiguration(settings.profile->c_str())
        : Aws::S3::S3ClientConfiguration();

    if (settings.endpoint) {
        config.endpointOverride = settings.endpoint->c_str();
        // Сторонние S3-хранилища обычно понимают только path-style адреса
        config.useVirtualAddressing = false;
    }
    if (settings.region) {
        config.region = settings.region->c_str();
    }

    std::shared_ptr<Aws::Auth::AWSCredentialsProvider> credentials;
    if (settings.profile) {
        credentials = Aws::MakeShared<Aws::Auth::ProfileConfigFileAWSCredentialsProvider>(
            kAllocationTag, settings.profile->c_str());
    } else {
        credentials = Aws::MakeShared<Aws::Auth::DefaultAWSCredentialsProviderChain>(kAllocationTag);
    }

    client_ = Aws::MakeUnique<Aws::S3::S3Client>(kAllocationTag, credentials,
        Aws::MakeShared<Aws::S3::S3EndpointProvider>(kAllocationTag), config);

    spdlog::debug("S3 client ready (endpoint: {}, region: {}, profile: {})",
                  settings.endpoint.value_or("default"),
                  settings.region.value_or("default"),
                  settings.profile.value_or("default"));
}

auto AwsObjectStore::put_object(const std::string& bucket,
                                const std::string& key,
                                std::shared_ptr<std::iostream> body,
                                std::uint64_t size) -> infra::VoidResult
{
    Aws::S3::Model::PutObjectRequest request;
    request.WithBucket(bucket.c_str()).WithKey(key.c_str());
    request.SetContentLength(static_cast<long long>(size));
    request.SetBody(std::move(body));

    auto outcome = client_->PutObject(request);
    if (!outcome.IsSuccess()) {
        return std::unexpected(to_error(outcome.GetError(), "PutObject"));
    }
    return {};
}

auto AwsObjectStore::get_object(const std::string& bucket,
                                const std::string& key,
                                std::ostream& sink) -> infra::Result<std::uint64_t>
{
    Aws::S3::Model::GetObjectRequest request;
    request.WithBucket(bucket.c_str()).WithKey(key.c_str());

    auto outcome = client_->GetObject(request);
    if (!outcome.IsSuccess()) {
        return std::unexpected(to_error(outcome.GetError(), "GetObject"));
    }

    auto result = outcome.GetResultWithOwnership();
    const auto length = result.GetContentLength();
    if (length > 0) {
        sink << result.GetBody().rdbuf();
    }
    if (!sink) {
        return std::unexpected(infra::make_error(infra::ErrorCode::WriteFailed,
            fmt::format("Failed writing {} bytes of {}", length, key)));
    }
    return static_cast<std::uint64_t>(length);
}

auto AwsObjectStore::delete_object(const std::string& bucket,
                                   const std::string& key) -> infra::VoidResult
{
    Aws::S3::Model::DeleteObjectRequest request;
    request.WithBucket(bucket.c_str()).WithKey(key.c_str());

    auto outcome = client_->DeleteObject(request);
    if (!outcome.IsSuccess()) {
        return std::unexpected(to_error(outcome.GetError(), "DeleteObject"));
    }
    return {};
}

auto AwsObjectStore::list_objects_page(const std::string& bucket,
                                       const std::optional<std::string>& prefix,
                                       const std::optional<std::string>& continuation_token,
                                       std::uint32_t max_keys) -> infra::Result<ListPage>
{
    Aws::S3::Model::ListObjectsV2Request request;
    request.WithBucket(bucket.c_str()).WithMaxKeys(static_cast<int>(max_keys));
    if (prefix) {
        request.SetPrefix(prefix->c_str());
    }
    if (continuation_token) {
        request.SetContinuationToken(continuation_token->c_str());
    }

    auto outcome = client_->ListObjectsV2(request);
    if (!outcome.IsSuccess()) {
        return std::unexpected(to_error(outcome.GetError(), "ListObjectsV2"));
    }

    const auto& result = outcome.GetResult();
    ListPage page;
    page.objects.reserve(result.GetContents().size());
    for (const auto& object : result.GetContents()) {
        page.objects.push_back(RemoteObject{
            .key = object.GetKey().c_str(),
            .size = static_cast<std::uint64_t>(object.GetSize()),
        });
    }
    if (result.GetIsTruncated()) {
        page.next_token = result.GetNextContinuationToken().c_str();
    }
    return page;
}

} // namespace bucketcp::adapters::s3
