#include <treepatch/events/EventDelegation.hpp>

#include "log/TaggedLogger.hpp"

#include <charconv>
#include <utility>

namespace TP::Events {
namespace {

auto parseId(std::string_view field, std::uint64_t& out) -> bool {
    if (field.empty()) {
        return false;
    }
    auto const* first  = field.data();
    auto const* last   = field.data() + field.size();
    auto [ptr, ec]     = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

auto malformed(std::string message) -> Error {
    return Error{Error::Code::MalformedTriggerAttribute, std::move(message)};
}

// Text and comment targets resolve to the element that contains them.
auto originElement(Dom::Event const& event) -> Dom::Element const* {
    if (!event.target) {
        return nullptr;
    }
    if (auto const* element = event.target->asElement()) {
        return element;
    }
    auto parent = event.target->parent();
    return parent ? parent->asElement() : nullptr;
}

} // namespace

EventDelegation::EventDelegation(std::shared_ptr<Dom::Element> root,
                                 std::shared_ptr<TriggerChannel> channel,
                                 EventDelegationOptions options)
    : rootElement(std::move(root)), channel(std::move(channel)), options(std::move(options)) {}

EventDelegation::~EventDelegation() {
    this->detach();
}

auto EventDelegation::reservationAttribute(std::string_view eventName) const -> std::string {
    std::string name;
    name.reserve(this->options.attributePrefix.size() + 1 + eventName.size());
    name.append(this->options.attributePrefix);
    name.push_back('-');
    name.append(eventName);
    return name;
}

auto EventDelegation::encodeReservation(ComponentId scope, NodeId node) -> std::string {
    return std::to_string(scope.value) + "." + std::to_string(node.value);
}

auto EventDelegation::decodeReservation(std::string_view value) -> Expected<Reservation> {
    auto firstDot = value.find('.');
    if (firstDot == std::string_view::npos) {
        return std::unexpected(malformed("reservation '" + std::string(value) + "' has no node id"));
    }
    auto scopeField = value.substr(0, firstDot);
    auto remainder  = value.substr(firstDot + 1);
    // Anything after a second delimiter is ignored.
    auto nodeField = remainder.substr(0, remainder.find('.'));

    std::uint64_t scope = 0;
    if (!parseId(scopeField, scope)) {
        return std::unexpected(malformed("failed to parse component id from '" + std::string(value) + "'"));
    }
    std::uint64_t node = 0;
    if (!parseId(nodeField, node)) {
        return std::unexpected(malformed("failed to parse node id from '" + std::string(value) + "'"));
    }
    return Reservation{.scope = ComponentId{scope}, .node = NodeId{node}};
}

auto EventDelegation::newEventListener(Dom::Element& element, std::string_view eventName, ComponentId scope, NodeId node) -> void {
    element.setAttribute(this->reservationAttribute(eventName), encodeReservation(scope, node));
    this->addListener(eventName);
}

auto EventDelegation::addListener(std::string_view eventName) -> void {
    auto key = std::string(eventName);
    if (auto it = this->listeners.find(key); it != this->listeners.end()) {
        ++it->second.count;
        return;
    }

    Registration registration;
    registration.count   = 1;
    registration.capture = !bubblesNatively(eventName);
    registration.token   = this->rootElement->addEventListener(
        key, [this](Dom::Event& event) { this->handleNativeEvent(event); }, registration.capture);
    tp_log("EventDelegation installed root listener for '" + key + "'", "EventDelegation", "INFO");
    this->listeners.emplace(std::move(key), registration);
}

auto EventDelegation::removeListener(std::string_view eventName) -> Expected<void> {
    auto it = this->listeners.find(std::string(eventName));
    if (it == this->listeners.end()) {
        return std::unexpected(Error{Error::Code::UnknownListener,
                                     "no listener registered for '" + std::string(eventName) + "'"});
    }
    if (--it->second.count > 0) {
        return {};
    }
    this->rootElement->removeEventListener(it->first, it->second.token);
    tp_log("EventDelegation removed root listener for '" + it->first + "'", "EventDelegation", "INFO");
    this->listeners.erase(it);
    return {};
}

auto EventDelegation::listenerCount(std::string_view eventName) const -> std::size_t {
    auto it = this->listeners.find(std::string(eventName));
    return it == this->listeners.end() ? 0 : it->second.count;
}

auto EventDelegation::detach() -> void {
    if (!this->rootElement) {
        return;
    }
    for (auto const& [name, registration] : this->listeners) {
        this->rootElement->removeEventListener(name, registration.token);
    }
    this->listeners.clear();
}

auto EventDelegation::decodeTrigger(Dom::Event const& event) const -> Expected<EventTrigger> {
    auto const* origin = originElement(event);
    if (origin == nullptr) {
        return std::unexpected(malformed("event '" + event.type + "' has no element origin"));
    }
    auto attribute = origin->getAttribute(this->reservationAttribute(event.type));
    if (!attribute) {
        return std::unexpected(malformed("origin <" + origin->tagName() + "> carries no reservation for '" + event.type + "'"));
    }
    auto reservation = decodeReservation(*attribute);
    if (!reservation) {
        return std::unexpected(reservation.error());
    }
    tp_log("EventDelegation decoded scope=" + std::to_string(reservation->scope.value)
               + " node=" + std::to_string(reservation->node.value),
           "EventDelegation", "Dispatch");

    EventTrigger trigger;
    trigger.name     = event.type;
    trigger.category = categoryOf(event.type);
    trigger.event    = toVirtualEvent(event, origin);
    trigger.scope    = reservation->scope;
    trigger.node     = reservation->node;
    trigger.priority = this->options.priority;
    return trigger;
}

auto EventDelegation::handleNativeEvent(Dom::Event const& event) -> void {
    auto trigger = this->decodeTrigger(event);
    if (!trigger) {
        ++this->dropped;
        tp_log("EventDelegation dropped '" + event.type + "': " + describeError(trigger.error()), "EventDelegation", "ERROR");
        return;
    }
    auto sent = this->channel->send(std::move(*trigger));
    if (!sent) {
        ++this->dropped;
        tp_log("EventDelegation dropped '" + event.type + "': " + describeError(sent.error()), "EventDelegation", "ERROR");
        return;
    }
    ++this->delivered;
}

} // namespace TP::Events
