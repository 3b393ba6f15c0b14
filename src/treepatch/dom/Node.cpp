#include <treepatch/dom/Node.hpp>

#include <algorithm>
#include <utility>

namespace TP::Dom {

auto Node::asElement() -> Element* {
    return this->isElement() ? static_cast<Element*>(this) : nullptr;
}

auto Node::asElement() const -> Element const* {
    return this->isElement() ? static_cast<Element const*>(this) : nullptr;
}

auto Node::firstChild() const -> NodePtr {
    return this->childNodes.empty() ? nullptr : this->childNodes.front();
}

auto Node::lastChild() const -> NodePtr {
    return this->childNodes.empty() ? nullptr : this->childNodes.back();
}

auto Node::indexInParent() const -> std::optional<std::size_t> {
    auto owner = this->parent();
    if (!owner) {
        return std::nullopt;
    }
    auto const& siblings = owner->childNodes;
    auto it = std::find_if(siblings.begin(), siblings.end(), [this](NodePtr const& sibling) { return sibling.get() == this; });
    if (it == siblings.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(siblings.begin(), it));
}

auto Node::nextSibling() const -> NodePtr {
    auto index = this->indexInParent();
    if (!index) {
        return nullptr;
    }
    auto const& siblings = this->parent()->childNodes;
    return (*index + 1 < siblings.size()) ? siblings[*index + 1] : nullptr;
}

auto Node::previousSibling() const -> NodePtr {
    auto index = this->indexInParent();
    if (!index || *index == 0) {
        return nullptr;
    }
    return this->parent()->childNodes[*index - 1];
}

auto Node::contains(Node const* other) const -> bool {
    for (auto const* current = other; current != nullptr;) {
        if (current == this) {
            return true;
        }
        auto next = current->parent();
        current   = next.get();
    }
    return false;
}

auto Node::detachFromParent() -> void {
    auto owner = this->parentNode.lock();
    if (!owner) {
        return;
    }
    auto& siblings = owner->childNodes;
    std::erase_if(siblings, [this](NodePtr const& sibling) { return sibling.get() == this; });
    this->parentNode.reset();
}

auto Node::appendChild(NodePtr child) -> NodePtr {
    return this->insertBefore(std::move(child), nullptr);
}

auto Node::insertBefore(NodePtr child, Node const* reference) -> NodePtr {
    if (!child || child->contains(this)) {
        return nullptr;
    }
    if (reference == child.get()) {
        return child;
    }
    // Keep the node alive while it is moved between parents.
    auto keepAlive = child;
    child->detachFromParent();

    auto position = this->childNodes.end();
    if (reference != nullptr) {
        position = std::find_if(this->childNodes.begin(), this->childNodes.end(),
                                [reference](NodePtr const& sibling) { return sibling.get() == reference; });
    }
    child->parentNode = this->weak_from_this();
    this->childNodes.insert(position, child);
    return keepAlive;
}

auto Node::removeChild(Node const& child) -> NodePtr {
    auto it = std::find_if(this->childNodes.begin(), this->childNodes.end(),
                           [&child](NodePtr const& sibling) { return sibling.get() == &child; });
    if (it == this->childNodes.end()) {
        return nullptr;
    }
    auto removed = *it;
    this->childNodes.erase(it);
    removed->parentNode.reset();
    return removed;
}

auto Node::replaceWith(std::vector<NodePtr> const& nodes) -> bool {
    auto owner = this->parent();
    if (!owner) {
        return false;
    }
    auto self = this->shared_from_this();
    for (auto const& node : nodes) {
        if (node.get() == this) {
            continue;
        }
        owner->insertBefore(node, this);
    }
    if (std::find(nodes.begin(), nodes.end(), self) == nodes.end()) {
        owner->removeChild(*this);
    }
    return true;
}

auto Node::remove() -> bool {
    auto owner = this->parent();
    if (!owner) {
        return false;
    }
    return owner->removeChild(*this) != nullptr;
}

auto Node::removeAllChildren() -> std::vector<NodePtr> {
    auto removed = std::move(this->childNodes);
    this->childNodes.clear();
    for (auto const& child : removed) {
        child->parentNode.reset();
    }
    return removed;
}

auto Node::textContent() const -> std::string {
    std::string text;
    for (auto const& child : this->childNodes) {
        if (child->isComment()) {
            continue;
        }
        text += child->textContent();
    }
    return text;
}

auto Node::setTextContent(std::string_view text) -> void {
    this->removeAllChildren();
    if (text.empty()) {
        return;
    }
    auto node   = std::make_shared<Text>(std::string(text));
    node->owner = this->owner;
    this->appendChild(std::move(node));
}

auto Node::addEventListener(std::string type, EventCallback callback, bool capture) -> ListenerToken {
    auto token = this->nextToken++;
    this->listeners.push_back(Listener{.token = token, .type = std::move(type), .callback = std::move(callback), .capture = capture});
    return token;
}

auto Node::removeEventListener(std::string_view type, ListenerToken token) -> bool {
    auto erased = std::erase_if(this->listeners, [&](Listener const& listener) {
        return listener.token == token && listener.type == type;
    });
    return erased > 0;
}

auto Node::listenerCount(std::string_view type) const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(this->listeners.begin(), this->listeners.end(),
                                                  [type](Listener const& listener) { return listener.type == type; }));
}

auto Node::invokeListeners(Event& event, ListenerPass pass) -> void {
    // Snapshot first: callbacks may add or remove listeners on this node.
    std::vector<EventCallback> matching;
    for (auto const& listener : this->listeners) {
        if (listener.type != event.type) {
            continue;
        }
        if ((pass == ListenerPass::Capture && !listener.capture) || (pass == ListenerPass::Bubble && listener.capture)) {
            continue;
        }
        matching.push_back(listener.callback);
    }
    event.currentTarget = this;
    for (auto const& callback : matching) {
        callback(event);
    }
}

auto Node::dispatchEvent(Event& event) -> void {
    event.target             = this->shared_from_this();
    event.propagationStopped = false;

    std::vector<NodePtr> path;
    for (auto ancestor = this->parent(); ancestor; ancestor = ancestor->parent()) {
        path.push_back(ancestor);
    }

    event.phase = EventPhase::Capturing;
    for (auto it = path.rbegin(); it != path.rend() && !event.propagationStopped; ++it) {
        (*it)->invokeListeners(event, ListenerPass::Capture);
    }

    if (!event.propagationStopped) {
        event.phase = EventPhase::AtTarget;
        this->invokeListeners(event, ListenerPass::Target);
    }

    if (event.bubbles) {
        event.phase = EventPhase::Bubbling;
        for (auto const& ancestor : path) {
            if (event.propagationStopped) {
                break;
            }
            ancestor->invokeListeners(event, ListenerPass::Bubble);
        }
    }

    event.phase         = EventPhase::None;
    event.currentTarget = nullptr;
}

} // namespace TP::Dom
