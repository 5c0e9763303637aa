#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace relq {

/// Error taxonomy. Everything except BackendUnsupported is detected while a
/// clause is appended; BackendUnsupported is the only error a render reports.
enum class ErrorKind : std::uint8_t {
    UnknownColumn,
    TypeError,
    DuplicateAlias,
    InvalidAggregateReference,
    ConfigError,
    BackendUnsupported,
};

struct Error {
    ErrorKind kind = ErrorKind::ConfigError;
    /// Offending column, alias, operator or clause name, verbatim.
    std::string subject;
    std::string message;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

/// Builds an unexpected Error with a formatted message.
[[nodiscard]] auto make_error(ErrorKind kind, std::string subject, std::string message)
    -> std::unexpected<Error>;

}  // namespace relq
