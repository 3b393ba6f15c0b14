#pragma once

#include <treepatch/core/Ids.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace TP::Edit {

struct PushRoot {
    NodeId id;
};

struct PopRoot {};

// Pops `many` nodes and appends them, in push order, to the node beneath them.
struct AppendChildren {
    std::uint32_t many = 0;
};

// Replaces the node beneath the top `many` nodes with those nodes.
struct ReplaceWith {
    std::uint32_t many = 1;
};

struct Remove {};

struct RemoveAllChildren {};

struct CreateTextNode {
    std::string text;
    NodeId      id;
};

struct CreateElement {
    std::string                tag;
    NodeId                     id;
    std::optional<std::string> ns;
};

struct CreatePlaceholder {
    NodeId id;
};

struct NewEventListener {
    std::string event_name;
    ComponentId scope;
    NodeId      mounted_node_id;
};

struct RemoveEventListener {
    std::string event_name;
};

struct SetText {
    std::string text;
};

struct SetAttribute {
    std::string                field;
    std::string                value;
    std::optional<std::string> ns;
};

struct RemoveAttribute {
    std::string name;
};

using DomEdit = std::variant<PushRoot,
                             PopRoot,
                             AppendChildren,
                             ReplaceWith,
                             Remove,
                             RemoveAllChildren,
                             CreateTextNode,
                             CreateElement,
                             CreatePlaceholder,
                             NewEventListener,
                             RemoveEventListener,
                             SetText,
                             SetAttribute,
                             RemoveAttribute>;

// Wire tag of an instruction ("PushRoot", "CreateElementNs", ...).
[[nodiscard]] auto editKind(DomEdit const& edit) -> std::string_view;

// One-line human readable rendering used by logs and error messages.
[[nodiscard]] auto describeEdit(DomEdit const& edit) -> std::string;

} // namespace TP::Edit
