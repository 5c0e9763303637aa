#include <relq/core/error.hpp>

#include <utility>

namespace relq {

auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::UnknownColumn:
            return "UnknownColumn";
        case ErrorKind::TypeError:
            return "TypeError";
        case ErrorKind::DuplicateAlias:
            return "DuplicateAlias";
        case ErrorKind::InvalidAggregateReference:
            return "InvalidAggregateReference";
        case ErrorKind::ConfigError:
            return "ConfigError";
        case ErrorKind::BackendUnsupported:
            return "BackendUnsupported";
    }
    return "Unknown";
}

auto make_error(ErrorKind kind, std::string subject, std::string message)
    -> std::unexpected<Error> {
    return std::unexpected(
        Error{.kind = kind, .subject = std::move(subject), .message = std::move(message)});
}

}  // namespace relq
