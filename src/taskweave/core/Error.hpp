#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace TW {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        ConditionFailed,
        Cancelled,
        ExecutionFailed,
        InvalidPermissions,
        Timeout,
        IoFailure
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}
    explicit Error(Code c)
        : code(c) {}

    auto operator==(Error const&) const -> bool = default;

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
    case Error::Code::ConditionFailed:
        return "condition_failed";
    case Error::Code::Cancelled:
        return "cancelled";
    case Error::Code::ExecutionFailed:
        return "execution_failed";
    case Error::Code::InvalidPermissions:
        return "invalid_permissions";
    case Error::Code::Timeout:
        return "timeout";
    case Error::Code::IoFailure:
        return "io_failure";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace TW
