#pragma once

#include <treepatch/core/Ids.hpp>
#include <treepatch/dom/Event.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace TP::Dom {
class Element;
}

namespace TP::Events {

enum class EventPriority : std::uint8_t {
    Immediate,
    High,
    Medium,
    Low,
};

// Payload family of a native event name; drives which fields are extracted.
enum class EventCategory : std::uint8_t {
    Clipboard,
    Composition,
    Keyboard,
    Focus,
    Form,
    Mouse,
    Pointer,
    Selection,
    Touch,
    Scroll,
    Wheel,
    Media,
    Animation,
    Transition,
    Toggle,
    Other,
};

struct ClipboardEvent {};

struct CompositionEvent {
    std::string data;
};

struct KeyboardEvent {
    Dom::KeyboardInit keyboard;
};

struct FocusEvent {};

struct FormEvent {
    std::string value;
};

struct MouseEvent {
    Dom::MouseInit mouse;
};

struct PointerEvent {
    Dom::PointerInit pointer;
};

struct SelectionEvent {};

struct TouchEvent {
    Dom::Modifiers modifiers;
};

struct ScrollEvent {};

struct WheelEvent {
    Dom::WheelInit wheel;
};

struct MediaEvent {};

struct AnimationEvent {
    std::string animation_name;
    float       elapsed_time = 0.0f;
    std::string pseudo_element;
};

struct TransitionEvent {
    std::string property_name;
    float       elapsed_time = 0.0f;
    std::string pseudo_element;
};

struct ToggleEvent {};

// Bare "occurred" payload for names outside every known family.
struct OtherEvent {};

using VirtualEvent = std::variant<OtherEvent,
                                  ClipboardEvent,
                                  CompositionEvent,
                                  KeyboardEvent,
                                  FocusEvent,
                                  FormEvent,
                                  MouseEvent,
                                  PointerEvent,
                                  SelectionEvent,
                                  TouchEvent,
                                  ScrollEvent,
                                  WheelEvent,
                                  MediaEvent,
                                  AnimationEvent,
                                  TransitionEvent,
                                  ToggleEvent>;

struct EventTrigger {
    std::string           name;
    EventCategory         category = EventCategory::Other;
    VirtualEvent          event;
    ComponentId           scope;
    std::optional<NodeId> node;
    EventPriority         priority = EventPriority::High;
};

[[nodiscard]] auto categoryOf(std::string_view eventName) -> EventCategory;
[[nodiscard]] auto categoryName(EventCategory category) -> std::string_view;
[[nodiscard]] auto priorityName(EventPriority priority) -> std::string_view;

// False for names the native tree delivers without a bubble phase; the
// delegation root observes those in the capture phase instead.
[[nodiscard]] auto bubblesNatively(std::string_view eventName) -> bool;

// Extracts the category payload from a native event. `origin` is the element
// the event was decoded against and feeds the form value when the target
// itself is not an element.
[[nodiscard]] auto toVirtualEvent(Dom::Event const& event, Dom::Element const* origin) -> VirtualEvent;

} // namespace TP::Events
