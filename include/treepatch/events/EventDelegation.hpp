#pragma once

#include <treepatch/core/Error.hpp>
#include <treepatch/core/Ids.hpp>
#include <treepatch/dom/Node.hpp>
#include <treepatch/events/Trigger.hpp>
#include <treepatch/events/TriggerChannel.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace TP::Events {

inline constexpr std::string_view kDefaultAttributePrefix = "treepatch-event";

struct EventDelegationOptions {
    std::string   attributePrefix = std::string{kDefaultAttributePrefix};
    EventPriority priority        = EventPriority::High;
};

// Decoded value of a reservation attribute: "<component-id>.<node-id>".
struct Reservation {
    ComponentId scope;
    NodeId      node;
};

/**
 * One native listener per event name, installed on the delegation root.
 *
 * Elements that want an event carry a reservation attribute
 * "<prefix>-<event>" naming the owning component and node. The root
 * listener reads it back from the event's origin element and forwards a
 * normalized EventTrigger to the channel. Decode failures are logged and
 * the event dropped; they never escape the native dispatch.
 *
 * Owned by whoever owns the document lifecycle; detach() (or destruction)
 * removes every listener this instance installed.
 */
class EventDelegation {
public:
    EventDelegation(std::shared_ptr<Dom::Element> root,
                    std::shared_ptr<TriggerChannel> channel,
                    EventDelegationOptions options = {});
    ~EventDelegation();

    EventDelegation(EventDelegation const&)            = delete;
    EventDelegation& operator=(EventDelegation const&) = delete;
    EventDelegation(EventDelegation&&)                 = delete;
    EventDelegation& operator=(EventDelegation&&)      = delete;

    [[nodiscard]] auto reservationAttribute(std::string_view eventName) const -> std::string;
    [[nodiscard]] static auto encodeReservation(ComponentId scope, NodeId node) -> std::string;
    [[nodiscard]] static auto decodeReservation(std::string_view value) -> Expected<Reservation>;

    // Marks element as a target for eventName and counts one logical listener.
    auto newEventListener(Dom::Element& element, std::string_view eventName, ComponentId scope, NodeId node) -> void;
    auto addListener(std::string_view eventName) -> void;
    // Drops one logical listener; the native listener goes with the last one.
    auto removeListener(std::string_view eventName) -> Expected<void>;

    [[nodiscard]] auto listenerCount(std::string_view eventName) const -> std::size_t;
    [[nodiscard]] auto installedListeners() const -> std::size_t { return this->listeners.size(); }

    auto detach() -> void;

    [[nodiscard]] auto decodeTrigger(Dom::Event const& event) const -> Expected<EventTrigger>;
    auto handleNativeEvent(Dom::Event const& event) -> void;

    [[nodiscard]] auto deliveredEvents() const -> std::uint64_t { return this->delivered; }
    [[nodiscard]] auto droppedEvents() const -> std::uint64_t { return this->dropped; }
    [[nodiscard]] auto root() const -> std::shared_ptr<Dom::Element> const& { return this->rootElement; }

private:
    struct Registration {
        std::size_t        count   = 0;
        Dom::ListenerToken token   = 0;
        bool               capture = false;
    };

    std::shared_ptr<Dom::Element>                    rootElement;
    std::shared_ptr<TriggerChannel>                  channel;
    EventDelegationOptions                           options;
    phmap::flat_hash_map<std::string, Registration> listeners;
    std::uint64_t                                    delivered = 0;
    std::uint64_t                                    dropped   = 0;
};

} // namespace TP::Events
