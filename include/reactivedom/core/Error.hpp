#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace RD {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        NotFound,
        HierarchyRequest,
        InvalidNode,
        DuplicateKey,
        NoActiveScope,
        EvaluationFailed,
        MalformedInput,
        CapacityExceeded
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
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::HierarchyRequest:
        return "hierarchy_request";
    case Error::Code::InvalidNode:
        return "invalid_node";
    case Error::Code::DuplicateKey:
        return "duplicate_key";
    case Error::Code::NoActiveScope:
        return "no_active_scope";
    case Error::Code::EvaluationFailed:
        return "evaluation_failed";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::CapacityExceeded:
        return "capacity_exceeded";
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

} // namespace RD
