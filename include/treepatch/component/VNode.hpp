#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace TP::Component {

struct VNode;

struct VText {
    std::string text;
};

// Invisible marker standing in for a component that rendered nothing.
struct VPlaceholder {};

struct VElement {
    std::string                                      tag;
    std::optional<std::string>                       ns;
    std::vector<std::pair<std::string, std::string>> attributes;
    std::vector<std::string>                         listeners;
    std::vector<VNode>                               children;
    std::optional<std::string>                       key;
};

// Output of a component render; handed to the diff engine, never to the DOM.
struct VNode {
    std::variant<VElement, VText, VPlaceholder> kind;

    [[nodiscard]] auto isElement() const -> bool { return std::holds_alternative<VElement>(this->kind); }
    [[nodiscard]] auto isText() const -> bool { return std::holds_alternative<VText>(this->kind); }
    [[nodiscard]] auto isPlaceholder() const -> bool { return std::holds_alternative<VPlaceholder>(this->kind); }

    [[nodiscard]] auto element() const -> VElement const* { return std::get_if<VElement>(&this->kind); }
    [[nodiscard]] auto text() const -> VText const* { return std::get_if<VText>(&this->kind); }
};

// Either a ready tree or the empty result used for suppressed and failed renders.
struct RenderReturn {
    std::optional<VNode> ready;

    [[nodiscard]] auto isReady() const -> bool { return this->ready.has_value(); }
};

} // namespace TP::Component
