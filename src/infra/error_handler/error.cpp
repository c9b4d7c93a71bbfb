#include "error.hpp"
#include <cstdlib>
#include <utility>
#include <fmt/core.h>

namespace bucketcp::infra {

auto Error::category() const -> ErrorCategory {
    switch (code) {
        case ErrorCode::InvalidPattern:
        case ErrorCode::InvalidDestination:
        case ErrorCode::InvalidConfig:
            return ErrorCategory::Configuration;
        case ErrorCode::WalkFailed:
        case ErrorCode::ListingFailed:
        case ErrorCode::StatFailed:
            return ErrorCategory::Enumeration;
        case ErrorCode::Cancelled:
            return ErrorCategory::Cancelled;
        default:
            return ErrorCategory::Task;
    }
}

bool Error::is_fatal() const {
    const auto cat = category();
    return cat == ErrorCategory::Configuration || cat == ErrorCategory::Enumeration;
}

int Error::to_exit_code() const {
    switch (category()) {
        case ErrorCategory::Configuration: return 2;
        case ErrorCategory::Enumeration:   return 3;
        case ErrorCategory::Cancelled:     return 130; // SIGINT
        default:                           return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::InvalidPattern:     return "invalid pattern";
        case ErrorCode::InvalidDestination: return "invalid destination";
        case ErrorCode::InvalidConfig:      return "invalid config";
        case ErrorCode::WalkFailed:         return "walk failed";
        case ErrorCode::ListingFailed:      return "listing failed";
        case ErrorCode::StatFailed:         return "stat failed";
        case ErrorCode::FileNotFound:       return "file not found";
        case ErrorCode::PermissionDenied:   return "permission denied";
        case ErrorCode::ReadFailed:         return "read failed";
        case ErrorCode::WriteFailed:        return "write failed";
        case ErrorCode::NetworkError:       return "network error";
        case ErrorCode::UnsafeKey:          return "unsafe key";
        case ErrorCode::DestinationConflict: return "destination conflict";
        case ErrorCode::Cancelled:          return "cancelled";
        case ErrorCode::Unknown:            break;
    }
    return "unknown";
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error make_error(std::error_code ec, std::string_view context,
                 const std::source_location& loc) {
    auto code = ErrorCode::Unknown;
    if (ec == std::errc::no_such_file_or_directory) {
        code = ErrorCode::FileNotFound;
    } else if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        code = ErrorCode::PermissionDenied;
    } else if (ec == std::errc::no_space_on_device || ec == std::errc::read_only_file_system) {
        code = ErrorCode::WriteFailed;
    }
    return Error{code, fmt::format("{}: {}", context, ec.message()), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        err.code, err.message
    );
    return std::move(err);
}

} // namespace bucketcp::infra
