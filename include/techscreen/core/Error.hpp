#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace TS {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        MalformedInput,
        UnknownKind,
        UnsupportedVersion,
        ValidationFailed,
        InvalidTransition,
        MissingSignature,
        NoSuchJob,
        NoPendingIntent,
        InvalidIndex,
        DeliveryFailed,
        RetryLimitReached,
        InvalidConfiguration
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::UnknownKind:
        return "unknown_kind";
    case Error::Code::UnsupportedVersion:
        return "unsupported_version";
    case Error::Code::ValidationFailed:
        return "validation_failed";
    case Error::Code::InvalidTransition:
        return "invalid_transition";
    case Error::Code::MissingSignature:
        return "missing_signature";
    case Error::Code::NoSuchJob:
        return "no_such_job";
    case Error::Code::NoPendingIntent:
        return "no_pending_intent";
    case Error::Code::InvalidIndex:
        return "invalid_index";
    case Error::Code::DeliveryFailed:
        return "delivery_failed";
    case Error::Code::RetryLimitReached:
        return "retry_limit_reached";
    case Error::Code::InvalidConfiguration:
        return "invalid_configuration";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label);
        description.push_back(':');
        description.append(*error.message);
        return description;
    }
    return std::string{label};
}

} // namespace TS
