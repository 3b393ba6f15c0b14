#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>

namespace TP {

/**
 * Opaque identity of a live logical node, assigned by the diff engine.
 *
 * The value doubles as a registry slot key: the low 32 bits select the slot,
 * the high 32 bits carry the slot generation. Ids carry no ordering.
 */
struct NodeId {
    std::uint64_t value = 0;

    constexpr NodeId() = default;
    constexpr explicit NodeId(std::uint64_t raw)
        : value(raw) {}

    [[nodiscard]] static constexpr auto fromSlotKey(std::uint32_t index, std::uint32_t generation) -> NodeId {
        return NodeId{(static_cast<std::uint64_t>(generation) << 32) | index};
    }

    [[nodiscard]] constexpr auto slotIndex() const -> std::uint32_t {
        return static_cast<std::uint32_t>(value & 0xffff'ffffu);
    }

    [[nodiscard]] constexpr auto generation() const -> std::uint32_t {
        return static_cast<std::uint32_t>(value >> 32);
    }

    friend constexpr bool operator==(NodeId, NodeId) = default;
};

// Identity of the component instance (scope) that owns a listener.
struct ComponentId {
    std::uint64_t value = 0;

    constexpr ComponentId() = default;
    constexpr explicit ComponentId(std::uint64_t raw)
        : value(raw) {}

    friend constexpr bool operator==(ComponentId, ComponentId) = default;
};

} // namespace TP

template <>
struct std::hash<TP::NodeId> {
    auto operator()(TP::NodeId id) const noexcept -> std::size_t {
        return std::hash<std::uint64_t>{}(id.value);
    }
};

template <>
struct std::hash<TP::ComponentId> {
    auto operator()(TP::ComponentId id) const noexcept -> std::size_t {
        return std::hash<std::uint64_t>{}(id.value);
    }
};
