#include <treepatch/edit/EditInterpreter.hpp>
#include <treepatch/events/EventDelegation.hpp>

#include "log/TaggedLogger.hpp"

#include <utility>

namespace TP::Edit {

struct ApplyVisitor {
    EditInterpreter& interpreter;

    auto operator()(PushRoot const& edit) const -> Expected<void> { return interpreter.pushRoot(edit); }
    auto operator()(PopRoot const&) const -> Expected<void> { return interpreter.popRoot(); }
    auto operator()(AppendChildren const& edit) const -> Expected<void> { return interpreter.appendChildren(edit); }
    auto operator()(ReplaceWith const& edit) const -> Expected<void> { return interpreter.replaceWith(edit); }
    auto operator()(Remove const&) const -> Expected<void> { return interpreter.remove(); }
    auto operator()(RemoveAllChildren const&) const -> Expected<void> { return interpreter.removeAllChildren(); }
    auto operator()(CreateTextNode const& edit) const -> Expected<void> { return interpreter.createTextNode(edit); }
    auto operator()(CreateElement const& edit) const -> Expected<void> { return interpreter.createElement(edit); }
    auto operator()(CreatePlaceholder const& edit) const -> Expected<void> { return interpreter.createPlaceholder(edit); }
    auto operator()(NewEventListener const& edit) const -> Expected<void> { return interpreter.newEventListener(edit); }
    auto operator()(RemoveEventListener const& edit) const -> Expected<void> {
        return interpreter.removeEventListener(edit);
    }
    auto operator()(SetText const& edit) const -> Expected<void> { return interpreter.setText(edit); }
    auto operator()(SetAttribute const& edit) const -> Expected<void> { return interpreter.setAttribute(edit); }
    auto operator()(RemoveAttribute const& edit) const -> Expected<void> { return interpreter.removeAttribute(edit); }
};

EditInterpreter::EditInterpreter(std::shared_ptr<Dom::Document> document,
                                 Events::EventDelegation&       delegation,
                                 EditInterpreterOptions         options)
    : doc(std::move(document)),
      delegation(delegation),
      options(std::move(options)),
      nodes(this->options.registryCapacity),
      builder(this->options.stackCapacity) {}

auto EditInterpreter::apply(std::span<DomEdit const> edits) -> Expected<ApplyStats> {
    ApplyStats stats;
    for (std::size_t index = 0; index < edits.size(); ++index) {
        auto const& edit = edits[index];
        tp_log("EditInterpreter #" + std::to_string(index) + " " + describeEdit(edit), "EditInterpreter", "Edit");
        auto result = this->applyOne(edit);
        if (!result) {
            auto message = "edit #" + std::to_string(index) + " (" + describeEdit(edit) + ")";
            if (result.error().message) {
                message += ": " + *result.error().message;
            }
            tp_log("EditInterpreter aborted stream at " + message, "EditInterpreter", "ERROR");
            return std::unexpected(Error{result.error().code, std::move(message)});
        }
        ++stats.applied;
    }
    stats.residualDepth = this->builder.size();
    if (stats.residualDepth != 0) {
        tp_log("EditInterpreter stream left " + std::to_string(stats.residualDepth) + " node(s) on the builder stack",
               "EditInterpreter", "WARN");
    }
    return stats;
}

auto EditInterpreter::applyOne(DomEdit const& edit) -> Expected<void> {
    return std::visit(ApplyVisitor{*this}, edit);
}

auto EditInterpreter::pushRoot(PushRoot const& edit) -> Expected<void> {
    auto node = this->nodes.lookup(edit.id);
    if (!node) {
        return std::unexpected(node.error());
    }
    this->builder.push(std::move(*node));
    return {};
}

auto EditInterpreter::popRoot() -> Expected<void> {
    auto node = this->builder.pop();
    if (!node) {
        return std::unexpected(node.error());
    }
    return {};
}

auto EditInterpreter::appendChildren(AppendChildren const& edit) -> Expected<void> {
    if (this->builder.size() < static_cast<std::size_t>(edit.many) + 1) {
        return std::unexpected(Error{Error::Code::StackUnderflow,
                                     "AppendChildren needs " + std::to_string(edit.many + 1ull) + " node(s), stack holds "
                                         + std::to_string(this->builder.size())});
    }
    auto children = this->takeTop(edit.many);
    auto parent   = this->builder.top();
    if (!parent) {
        return std::unexpected(parent.error());
    }
    if (auto cycle = this->checkInsertable(children, **parent, "AppendChildren"); !cycle) {
        return cycle;
    }
    for (auto const& child : children) {
        // Adjacent text siblings would merge when the tree is serialized.
        if (child->isText()) {
            auto last = (*parent)->lastChild();
            if (last && last->isText()) {
                (*parent)->appendChild(this->doc->createComment(this->options.textSeparator));
            }
        }
        (*parent)->appendChild(child);
    }
    return {};
}

auto EditInterpreter::replaceWith(ReplaceWith const& edit) -> Expected<void> {
    if (edit.many == 0) {
        return std::unexpected(Error{Error::Code::UnsupportedReplaceArity, "ReplaceWith requires at least one node"});
    }
    if (this->builder.size() < static_cast<std::size_t>(edit.many) + 1) {
        return std::unexpected(Error{Error::Code::StackUnderflow,
                                     "ReplaceWith needs " + std::to_string(edit.many + 1ull) + " node(s), stack holds "
                                         + std::to_string(this->builder.size())});
    }
    auto replacements = this->takeTop(edit.many);
    auto old          = this->builder.pop();
    if (!old) {
        return std::unexpected(old.error());
    }
    auto owner = (*old)->parent();
    if (!owner) {
        return std::unexpected(Error{Error::Code::DetachedNode,
                                     "ReplaceWith target " + (*old)->nodeName() + " is not attached to a parent"});
    }
    if (auto cycle = this->checkInsertable(replacements, *owner, "ReplaceWith"); !cycle) {
        return cycle;
    }
    if (!(*old)->replaceWith(replacements)) {
        return std::unexpected(Error{Error::Code::DetachedNode, "ReplaceWith target left its parent"});
    }
    for (auto const& node : replacements) {
        this->separateText(*node);
    }
    for (auto& node : replacements) {
        this->builder.push(std::move(node));
    }
    return {};
}

auto EditInterpreter::remove() -> Expected<void> {
    auto node = this->builder.pop();
    if (!node) {
        return std::unexpected(node.error());
    }
    auto previous = (*node)->previousSibling();
    auto next     = (*node)->nextSibling();
    auto owner    = (*node)->parent();
    if (!(*node)->remove()) {
        tp_log("EditInterpreter Remove target was already detached", "EditInterpreter", "WARN");
    }
    // Closing the gap must not leave two text siblings touching.
    if (owner && previous && next && previous->isText() && next->isText()) {
        owner->insertBefore(this->doc->createComment(this->options.textSeparator), next.get());
    }
    this->forget(**node);
    return {};
}

auto EditInterpreter::removeAllChildren() -> Expected<void> {
    auto node = this->builder.top();
    if (!node) {
        return std::unexpected(node.error());
    }
    for (auto const& child : (*node)->removeAllChildren()) {
        this->forget(*child);
    }
    return {};
}

auto EditInterpreter::createTextNode(CreateTextNode const& edit) -> Expected<void> {
    auto node = this->doc->createTextNode(edit.text);
    this->nodes.registerNode(edit.id, node);
    this->builder.push(std::move(node));
    return {};
}

auto EditInterpreter::createElement(CreateElement const& edit) -> Expected<void> {
    Dom::NodePtr node = edit.ns ? this->doc->createElementNS(*edit.ns, edit.tag) : this->doc->createElement(edit.tag);
    this->nodes.registerNode(edit.id, node);
    this->builder.push(std::move(node));
    return {};
}

auto EditInterpreter::createPlaceholder(CreatePlaceholder const& edit) -> Expected<void> {
    auto node = this->doc->createElement(this->options.placeholderTag);
    node->setAttribute("hidden", "");
    this->nodes.registerNode(edit.id, node);
    this->builder.push(std::move(node));
    return {};
}

auto EditInterpreter::newEventListener(NewEventListener const& edit) -> Expected<void> {
    auto element = this->topElement("NewEventListener");
    if (!element) {
        return std::unexpected(element.error());
    }
    this->delegation.newEventListener(**element, edit.event_name, edit.scope, edit.mounted_node_id);
    return {};
}

auto EditInterpreter::removeEventListener(RemoveEventListener const& edit) -> Expected<void> {
    if (auto removed = this->delegation.removeListener(edit.event_name); !removed) {
        return removed;
    }
    // The reservation goes with the listener when the top node still carries it.
    if (auto top = this->builder.top(); top) {
        if (auto* element = (*top)->asElement()) {
            element->removeAttribute(this->delegation.reservationAttribute(edit.event_name));
        }
    }
    return {};
}

auto EditInterpreter::setText(SetText const& edit) -> Expected<void> {
    auto node = this->builder.top();
    if (!node) {
        return std::unexpected(node.error());
    }
    // Copy: setTextContent drops the current children.
    auto replaced = (*node)->children();
    (*node)->setTextContent(edit.text);
    for (auto const& child : replaced) {
        this->forget(*child);
    }
    return {};
}

auto EditInterpreter::setAttribute(SetAttribute const& edit) -> Expected<void> {
    auto element = this->topElement("SetAttribute");
    if (!element) {
        return std::unexpected(element.error());
    }
    auto* target = *element;
    if (edit.field == "class") {
        if (edit.ns && *edit.ns == Dom::kSvgNamespace) {
            if (!target->setSvgClassBaseVal(edit.value)) {
                tp_log("EditInterpreter skipped svg class on non-svg <" + target->tagName() + ">", "EditInterpreter",
                       "WARN");
            }
        } else {
            target->setClassName(edit.value);
        }
        return {};
    }
    if (edit.ns) {
        target->setAttributeNS(*edit.ns, edit.field, edit.value);
    } else {
        target->setAttribute(edit.field, edit.value);
    }
    return {};
}

auto EditInterpreter::removeAttribute(RemoveAttribute const& edit) -> Expected<void> {
    auto element = this->topElement("RemoveAttribute");
    if (!element) {
        return std::unexpected(element.error());
    }
    auto* target = *element;
    target->removeAttribute(edit.name);

    // Live state does not follow the attribute once it has been touched.
    if (edit.name == "value" && (target->isInput() || target->isTextArea())) {
        target->setValue("");
    } else if (edit.name == "checked" && target->isInput()) {
        target->setChecked(false);
    } else if (edit.name == "selected" && target->isOption()) {
        target->setSelected(false);
    }
    return {};
}

auto EditInterpreter::topElement(std::string_view instruction) -> Expected<Dom::Element*> {
    auto node = this->builder.top();
    if (!node) {
        return std::unexpected(node.error());
    }
    auto* element = (*node)->asElement();
    if (element == nullptr) {
        return std::unexpected(Error{Error::Code::NotAnElement,
                                     std::string(instruction) + " target is " + (*node)->nodeName() + ", not an element"});
    }
    return element;
}

// Removes the top count handles, bottom-most first.
auto EditInterpreter::takeTop(std::size_t count) -> std::vector<Dom::NodePtr> {
    std::vector<Dom::NodePtr> taken(count);
    for (std::size_t i = count; i > 0; --i) {
        auto node = this->builder.pop();
        if (node) {
            taken[i - 1] = std::move(*node);
        }
    }
    return taken;
}

auto EditInterpreter::separateText(Dom::Node& node) -> void {
    if (!node.isText()) {
        return;
    }
    auto parent = node.parent();
    if (!parent) {
        return;
    }
    if (auto previous = node.previousSibling(); previous && previous->isText()) {
        parent->insertBefore(this->doc->createComment(this->options.textSeparator), &node);
    }
    if (auto next = node.nextSibling(); next && next->isText()) {
        parent->insertBefore(this->doc->createComment(this->options.textSeparator), next.get());
    }
}

auto EditInterpreter::checkInsertable(std::vector<Dom::NodePtr> const& nodes, Dom::Node const& parent,
                                      std::string_view instruction) const -> Expected<void> {
    for (auto const& node : nodes) {
        if (node->contains(&parent)) {
            return std::unexpected(Error{Error::Code::HierarchyViolation,
                                         std::string(instruction) + " would insert " + node->nodeName()
                                             + " into its own subtree"});
        }
    }
    return {};
}

// Unregisters the node and every registered node beneath it.
auto EditInterpreter::forget(Dom::Node const& node) -> void {
    for (auto const& child : node.children()) {
        this->forget(*child);
    }
    if (auto id = this->nodes.idOf(&node)) {
        this->nodes.unregister(*id);
    }
}

} // namespace TP::Edit
