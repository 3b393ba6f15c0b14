#include <treepatch/edit/NodeRegistry.hpp>

#include <string>

namespace TP::Edit {

NodeRegistry::NodeRegistry(std::size_t capacity) {
    this->slots.reserve(capacity);
    this->reverse.reserve(capacity);
}

auto NodeRegistry::registerNode(NodeId id, Dom::NodePtr handle) -> void {
    auto& slot = this->slots[id.slotIndex()];
    if (slot.handle) {
        auto const held     = NodeId::fromSlotKey(id.slotIndex(), slot.generation);
        auto       previous = this->reverse.find(slot.handle.get());
        if (previous != this->reverse.end() && previous->second == held.value) {
            this->reverse.erase(previous);
        }
    }
    slot.generation = id.generation();
    slot.handle     = std::move(handle);
    if (slot.handle) {
        this->reverse[slot.handle.get()] = id.value;
    }
}

auto NodeRegistry::lookup(NodeId id) const -> Expected<Dom::NodePtr> {
    auto it = this->slots.find(id.slotIndex());
    if (it == this->slots.end() || !it->second.handle || it->second.generation != id.generation()) {
        return std::unexpected(Error{Error::Code::UnknownNodeId, "node id " + std::to_string(id.value) + " is not registered"});
    }
    return it->second.handle;
}

auto NodeRegistry::contains(NodeId id) const -> bool {
    auto it = this->slots.find(id.slotIndex());
    return it != this->slots.end() && it->second.handle && it->second.generation == id.generation();
}

auto NodeRegistry::unregister(NodeId id) -> bool {
    auto it = this->slots.find(id.slotIndex());
    if (it == this->slots.end() || it->second.generation != id.generation()) {
        return false;
    }
    if (it->second.handle) {
        auto previous = this->reverse.find(it->second.handle.get());
        if (previous != this->reverse.end() && previous->second == id.value) {
            this->reverse.erase(previous);
        }
    }
    this->slots.erase(it);
    return true;
}

auto NodeRegistry::idOf(Dom::Node const* handle) const -> std::optional<NodeId> {
    auto it = this->reverse.find(handle);
    if (it == this->reverse.end()) {
        return std::nullopt;
    }
    return NodeId{it->second};
}

auto NodeRegistry::clear() -> void {
    this->slots.clear();
    this->reverse.clear();
}

} // namespace TP::Edit
