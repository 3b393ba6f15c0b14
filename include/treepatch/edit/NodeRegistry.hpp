#pragma once

#include <treepatch/core/Error.hpp>
#include <treepatch/core/Ids.hpp>
#include <treepatch/dom/Node.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace TP::Edit {

/**
 * Slot table mapping diff-engine node ids to native node handles.
 *
 * The slot index of an id selects the slot; the generation stored in the slot
 * must match the id's generation for a lookup to succeed. A write
 * at an occupied slot overwrites it, whatever generation it held.
 * Ids are never handed out by the registry, and removing an entry does not
 * make its id reusable from this side.
 */
class NodeRegistry {
public:
    NodeRegistry() = default;
    explicit NodeRegistry(std::size_t capacity);

    auto registerNode(NodeId id, Dom::NodePtr handle) -> void;
    [[nodiscard]] auto lookup(NodeId id) const -> Expected<Dom::NodePtr>;
    [[nodiscard]] auto contains(NodeId id) const -> bool;
    auto unregister(NodeId id) -> bool;

    // Reverse lookup used by instructions that only see a stack handle.
    [[nodiscard]] auto idOf(Dom::Node const* handle) const -> std::optional<NodeId>;

    [[nodiscard]] auto size() const -> std::size_t { return this->slots.size(); }
    auto clear() -> void;

private:
    struct Slot {
        std::uint32_t generation = 0;
        Dom::NodePtr  handle;
    };

    phmap::flat_hash_map<std::uint32_t, Slot>             slots;
    phmap::flat_hash_map<Dom::Node const*, std::uint64_t> reverse;
};

} // namespace TP::Edit
