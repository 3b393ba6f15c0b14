#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace TP {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        UnknownNodeId,
        StackUnderflow,
        MalformedTriggerAttribute,
        UnsupportedReplaceArity,
        ComponentRenderFailure,
        PropsTypeMismatch,
        MalformedInput,
        NotAnElement,
        UnknownListener,
        DetachedNode,
        HierarchyViolation,
        ChannelClosed
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
    case Error::Code::UnknownNodeId:
        return "unknown_node_id";
    case Error::Code::StackUnderflow:
        return "stack_underflow";
    case Error::Code::MalformedTriggerAttribute:
        return "malformed_trigger_attribute";
    case Error::Code::UnsupportedReplaceArity:
        return "unsupported_replace_arity";
    case Error::Code::ComponentRenderFailure:
        return "component_render_failure";
    case Error::Code::PropsTypeMismatch:
        return "props_type_mismatch";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::NotAnElement:
        return "not_an_element";
    case Error::Code::UnknownListener:
        return "unknown_listener";
    case Error::Code::DetachedNode:
        return "detached_node";
    case Error::Code::HierarchyViolation:
        return "hierarchy_violation";
    case Error::Code::ChannelClosed:
        return "channel_closed";
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

} // namespace TP
