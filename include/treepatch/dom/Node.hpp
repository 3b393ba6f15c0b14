#pragma once

#include <treepatch/dom/Event.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TP::Dom {

inline constexpr std::string_view kHtmlNamespace = "http://www.w3.org/1999/xhtml";
inline constexpr std::string_view kSvgNamespace  = "http://www.w3.org/2000/svg";

enum class NodeType : std::uint8_t {
    Element  = 1,
    Text     = 3,
    Comment  = 8,
    Document = 9,
};

class Document;
class Element;
class Node;

using NodePtr = std::shared_ptr<Node>;

/**
 * Retained native tree node.
 *
 * Children are owned by their parent; the parent link is weak. Nodes are
 * always heap allocated through std::make_shared so that shared_from_this()
 * is valid while a node takes part in dispatch or tree surgery.
 * Single-threaded: no member may be called concurrently.
 */
class Node : public std::enable_shared_from_this<Node> {
public:
    virtual ~Node() = default;

    Node(Node const&)            = delete;
    Node& operator=(Node const&) = delete;
    Node(Node&&)                 = delete;
    Node& operator=(Node&&)      = delete;

    [[nodiscard]] auto nodeType() const -> NodeType { return this->type; }
    [[nodiscard]] virtual auto nodeName() const -> std::string = 0;

    [[nodiscard]] auto isElement() const -> bool { return this->type == NodeType::Element; }
    [[nodiscard]] auto isText() const -> bool { return this->type == NodeType::Text; }
    [[nodiscard]] auto isComment() const -> bool { return this->type == NodeType::Comment; }

    [[nodiscard]] auto asElement() -> Element*;
    [[nodiscard]] auto asElement() const -> Element const*;

    [[nodiscard]] auto parent() const -> NodePtr { return this->parentNode.lock(); }
    [[nodiscard]] auto children() const -> std::vector<NodePtr> const& { return this->childNodes; }
    [[nodiscard]] auto childCount() const -> std::size_t { return this->childNodes.size(); }
    [[nodiscard]] auto firstChild() const -> NodePtr;
    [[nodiscard]] auto lastChild() const -> NodePtr;
    [[nodiscard]] auto nextSibling() const -> NodePtr;
    [[nodiscard]] auto previousSibling() const -> NodePtr;
    [[nodiscard]] auto indexInParent() const -> std::optional<std::size_t>;
    [[nodiscard]] auto contains(Node const* other) const -> bool;

    [[nodiscard]] auto ownerDocument() const -> std::shared_ptr<Document> { return this->owner.lock(); }

    // Moves child under this node (detaching it from any previous parent).
    // Returns nullptr when the insertion would create a cycle.
    auto appendChild(NodePtr child) -> NodePtr;
    // Inserts before reference; a null reference appends.
    auto insertBefore(NodePtr child, Node const* reference) -> NodePtr;
    auto removeChild(Node const& child) -> NodePtr;
    // Substitutes this node by nodes at its position. False when detached.
    auto replaceWith(std::vector<NodePtr> const& nodes) -> bool;
    auto remove() -> bool;
    auto removeAllChildren() -> std::vector<NodePtr>;

    [[nodiscard]] virtual auto textContent() const -> std::string;
    virtual auto setTextContent(std::string_view text) -> void;

    auto addEventListener(std::string type, EventCallback callback, bool capture = false) -> ListenerToken;
    auto removeEventListener(std::string_view type, ListenerToken token) -> bool;
    [[nodiscard]] auto listenerCount(std::string_view type) const -> std::size_t;
    auto dispatchEvent(Event& event) -> void;

protected:
    explicit Node(NodeType type)
        : type(type) {}

    friend class Document;

    std::weak_ptr<Document> owner;

private:
    struct Listener {
        ListenerToken token = 0;
        std::string   type;
        EventCallback callback;
        bool          capture = false;
    };

    enum class ListenerPass : std::uint8_t {
        Capture,
        Target,
        Bubble,
    };

    auto detachFromParent() -> void;
    auto invokeListeners(Event& event, ListenerPass pass) -> void;

    NodeType              type;
    std::weak_ptr<Node>   parentNode;
    std::vector<NodePtr>  childNodes;
    std::vector<Listener> listeners;
    ListenerToken         nextToken = 1;
};

struct Attribute {
    std::string                name;
    std::string                value;
    std::optional<std::string> namespaceURI;
};

class Element final : public Node {
public:
    Element(std::string tag, std::optional<std::string> namespaceURI);

    [[nodiscard]] auto nodeName() const -> std::string override { return this->tag; }
    [[nodiscard]] auto tagName() const -> std::string const& { return this->tag; }
    [[nodiscard]] auto namespaceURI() const -> std::optional<std::string> const& { return this->ns; }
    [[nodiscard]] auto isSvg() const -> bool;

    auto setAttribute(std::string_view name, std::string_view value) -> void;
    auto setAttributeNS(std::optional<std::string_view> namespaceURI, std::string_view name, std::string_view value) -> void;
    [[nodiscard]] auto getAttribute(std::string_view name) const -> std::optional<std::string>;
    [[nodiscard]] auto hasAttribute(std::string_view name) const -> bool;
    auto removeAttribute(std::string_view name) -> bool;
    [[nodiscard]] auto attributes() const -> std::vector<Attribute> const& { return this->attrs; }

    [[nodiscard]] auto className() const -> std::string;
    auto setClassName(std::string_view value) -> void;
    // SVGAnimatedString.baseVal; only meaningful on SVG elements.
    auto setSvgClassBaseVal(std::string_view value) -> bool;

    // Live form-control state. The value/checked/selected attributes seed the
    // live property until it is written through the setter.
    [[nodiscard]] auto isInput() const -> bool;
    [[nodiscard]] auto isTextArea() const -> bool;
    [[nodiscard]] auto isOption() const -> bool;
    [[nodiscard]] auto value() const -> std::string const& { return this->liveValue; }
    auto setValue(std::string_view value) -> void;
    [[nodiscard]] auto checked() const -> bool { return this->liveChecked; }
    auto setChecked(bool checked) -> void;
    [[nodiscard]] auto selected() const -> bool { return this->liveSelected; }
    auto setSelected(bool selected) -> void;

private:
    auto findAttribute(std::string_view name) -> Attribute*;
    auto findAttribute(std::string_view name) const -> Attribute const*;
    auto syncLiveState(std::string_view name, std::optional<std::string_view> value) -> void;

    std::string                tag;
    std::optional<std::string> ns;
    std::vector<Attribute>     attrs;

    std::string liveValue;
    bool        valueDirty    = false;
    bool        liveChecked   = false;
    bool        checkedDirty  = false;
    bool        liveSelected  = false;
    bool        selectedDirty = false;
};

class CharacterData : public Node {
public:
    [[nodiscard]] auto data() const -> std::string const& { return this->text; }
    auto setData(std::string_view data) -> void { this->text.assign(data); }

    [[nodiscard]] auto textContent() const -> std::string override { return this->text; }
    auto setTextContent(std::string_view text) -> void override { this->setData(text); }

protected:
    CharacterData(NodeType type, std::string data)
        : Node(type), text(std::move(data)) {}

private:
    std::string text;
};

class Text final : public CharacterData {
public:
    explicit Text(std::string data)
        : CharacterData(NodeType::Text, std::move(data)) {}

    [[nodiscard]] auto nodeName() const -> std::string override { return "#text"; }
};

class Comment final : public CharacterData {
public:
    explicit Comment(std::string data)
        : CharacterData(NodeType::Comment, std::move(data)) {}

    [[nodiscard]] auto nodeName() const -> std::string override { return "#comment"; }
};

class Document final : public Node {
public:
    Document()
        : Node(NodeType::Document) {}

    [[nodiscard]] static auto create() -> std::shared_ptr<Document>;

    [[nodiscard]] auto nodeName() const -> std::string override { return "#document"; }

    [[nodiscard]] auto createElement(std::string_view tag) -> std::shared_ptr<Element>;
    [[nodiscard]] auto createElementNS(std::string_view namespaceURI, std::string_view tag) -> std::shared_ptr<Element>;
    [[nodiscard]] auto createTextNode(std::string_view text) -> std::shared_ptr<Text>;
    [[nodiscard]] auto createComment(std::string_view text) -> std::shared_ptr<Comment>;

private:
    template <typename T>
    auto adopt(std::shared_ptr<T> node) -> std::shared_ptr<T>;
};

// Compact markup for diagnostics: attributes in insertion order, text escaped.
[[nodiscard]] auto serialize(Node const& node) -> std::string;

} // namespace TP::Dom
