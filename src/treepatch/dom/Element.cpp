#include <treepatch/dom/Node.hpp>

#include <algorithm>
#include <cctype>

namespace TP::Dom {
namespace {

auto equalsIgnoreCase(std::string_view lhs, std::string_view rhs) -> bool {
    return lhs.size() == rhs.size()
           && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
                  return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
              });
}

} // namespace

Element::Element(std::string tag, std::optional<std::string> namespaceURI)
    : Node(NodeType::Element), tag(std::move(tag)), ns(std::move(namespaceURI)) {}

auto Element::isSvg() const -> bool {
    return this->ns && *this->ns == kSvgNamespace;
}

auto Element::isInput() const -> bool {
    return !this->isSvg() && equalsIgnoreCase(this->tag, "input");
}

auto Element::isTextArea() const -> bool {
    return !this->isSvg() && equalsIgnoreCase(this->tag, "textarea");
}

auto Element::isOption() const -> bool {
    return !this->isSvg() && equalsIgnoreCase(this->tag, "option");
}

auto Element::findAttribute(std::string_view name) -> Attribute* {
    auto it = std::find_if(this->attrs.begin(), this->attrs.end(), [name](Attribute const& attr) { return attr.name == name; });
    return it == this->attrs.end() ? nullptr : &*it;
}

auto Element::findAttribute(std::string_view name) const -> Attribute const* {
    auto it = std::find_if(this->attrs.begin(), this->attrs.end(), [name](Attribute const& attr) { return attr.name == name; });
    return it == this->attrs.end() ? nullptr : &*it;
}

auto Element::setAttribute(std::string_view name, std::string_view value) -> void {
    this->setAttributeNS(std::nullopt, name, value);
}

auto Element::setAttributeNS(std::optional<std::string_view> namespaceURI, std::string_view name, std::string_view value) -> void {
    std::optional<std::string> ownedNs;
    if (namespaceURI) {
        ownedNs = std::string(*namespaceURI);
    }
    if (auto* existing = this->findAttribute(name)) {
        existing->value.assign(value);
        existing->namespaceURI = std::move(ownedNs);
    } else {
        this->attrs.push_back(Attribute{.name = std::string(name), .value = std::string(value), .namespaceURI = std::move(ownedNs)});
    }
    this->syncLiveState(name, value);
}

auto Element::getAttribute(std::string_view name) const -> std::optional<std::string> {
    if (auto const* attr = this->findAttribute(name)) {
        return attr->value;
    }
    return std::nullopt;
}

auto Element::hasAttribute(std::string_view name) const -> bool {
    return this->findAttribute(name) != nullptr;
}

auto Element::removeAttribute(std::string_view name) -> bool {
    auto erased = std::erase_if(this->attrs, [name](Attribute const& attr) { return attr.name == name; });
    if (erased > 0) {
        this->syncLiveState(name, std::nullopt);
    }
    return erased > 0;
}

auto Element::className() const -> std::string {
    return this->getAttribute("class").value_or(std::string{});
}

auto Element::setClassName(std::string_view value) -> void {
    this->setAttribute("class", value);
}

auto Element::setSvgClassBaseVal(std::string_view value) -> bool {
    if (!this->isSvg()) {
        return false;
    }
    this->setAttribute("class", value);
    return true;
}

auto Element::syncLiveState(std::string_view name, std::optional<std::string_view> value) -> void {
    if (name == "value" && (this->isInput() || this->isTextArea()) && !this->valueDirty) {
        this->liveValue.assign(value.value_or(std::string_view{}));
    } else if (name == "checked" && this->isInput() && !this->checkedDirty) {
        this->liveChecked = value.has_value();
    } else if (name == "selected" && this->isOption() && !this->selectedDirty) {
        this->liveSelected = value.has_value();
    }
}

auto Element::setValue(std::string_view value) -> void {
    this->liveValue.assign(value);
    this->valueDirty = true;
}

auto Element::setChecked(bool checked) -> void {
    this->liveChecked  = checked;
    this->checkedDirty = true;
}

auto Element::setSelected(bool selected) -> void {
    this->liveSelected  = selected;
    this->selectedDirty = true;
}

} // namespace TP::Dom
