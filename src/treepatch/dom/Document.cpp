#include <treepatch/dom/Node.hpp>

namespace TP::Dom {
namespace {

auto escapeText(std::string_view text, bool inAttribute) -> std::string {
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
        case '&':
            escaped += "&amp;";
            break;
        case '<':
            escaped += "&lt;";
            break;
        case '>':
            escaped += "&gt;";
            break;
        case '"':
            if (inAttribute) {
                escaped += "&quot;";
                break;
            }
            escaped.push_back(ch);
            break;
        default:
            escaped.push_back(ch);
            break;
        }
    }
    return escaped;
}

auto serializeInto(Node const& node, std::string& out) -> void {
    switch (node.nodeType()) {
    case NodeType::Text:
        out += escapeText(static_cast<Text const&>(node).data(), false);
        return;
    case NodeType::Comment:
        out += "<!--";
        out += static_cast<Comment const&>(node).data();
        out += "-->";
        return;
    case NodeType::Document:
        for (auto const& child : node.children()) {
            serializeInto(*child, out);
        }
        return;
    case NodeType::Element:
        break;
    }

    auto const& element = static_cast<Element const&>(node);
    out.push_back('<');
    out += element.tagName();
    for (auto const& attr : element.attributes()) {
        out.push_back(' ');
        out += attr.name;
        out += "=\"";
        out += escapeText(attr.value, true);
        out.push_back('"');
    }
    out.push_back('>');
    for (auto const& child : element.children()) {
        serializeInto(*child, out);
    }
    out += "</";
    out += element.tagName();
    out.push_back('>');
}

} // namespace

auto Document::create() -> std::shared_ptr<Document> {
    return std::make_shared<Document>();
}

template <typename T>
auto Document::adopt(std::shared_ptr<T> node) -> std::shared_ptr<T> {
    node->owner = std::static_pointer_cast<Document>(this->shared_from_this());
    return node;
}

auto Document::createElement(std::string_view tag) -> std::shared_ptr<Element> {
    return this->adopt(std::make_shared<Element>(std::string(tag), std::nullopt));
}

auto Document::createElementNS(std::string_view namespaceURI, std::string_view tag) -> std::shared_ptr<Element> {
    return this->adopt(std::make_shared<Element>(std::string(tag), std::string(namespaceURI)));
}

auto Document::createTextNode(std::string_view text) -> std::shared_ptr<Text> {
    return this->adopt(std::make_shared<Text>(std::string(text)));
}

auto Document::createComment(std::string_view text) -> std::shared_ptr<Comment> {
    return this->adopt(std::make_shared<Comment>(std::string(text)));
}

auto serialize(Node const& node) -> std::string {
    std::string out;
    serializeInto(node, out);
    return out;
}

} // namespace TP::Dom
