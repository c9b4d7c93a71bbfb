#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace bucketcp::infra {

enum class ErrorCode {
    // Конфигурация (до старта передачи)
    InvalidPattern,
    InvalidDestination,
    InvalidConfig,

    // Перечисление (фатально для всего батча)
    WalkFailed,
    ListingFailed,
    StatFailed,

    // Ошибки отдельной задачи
    FileNotFound,
    PermissionDenied,
    ReadFailed,
    WriteFailed,
    NetworkError,
    UnsafeKey,
    DestinationConflict,

    Cancelled,
    Unknown,
};

enum class ErrorCategory {
    Configuration,
    Enumeration,
    Task,
    Cancelled,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto category() const -> ErrorCategory;
    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// Maps a std::error_code from <filesystem> onto the task-level codes.
[[nodiscard]] auto make_error(
    std::error_code ec,
    std::string_view context,
    const std::source_location& loc = std::source_location::current()
) -> Error;

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace bucketcp::infra

template<>
struct fmt::formatter<bucketcp::infra::ErrorCode> : fmt::formatter<std::string_view> {
    auto format(bucketcp::infra::ErrorCode code, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(bucketcp::infra::to_string(code), ctx);
    }
};
