#include <treepatch/events/Trigger.hpp>
#include <treepatch/dom/Node.hpp>

#include <parallel_hashmap/phmap.h>

#include <initializer_list>
#include <utility>

namespace TP::Events {
namespace {

using CategoryTable = phmap::flat_hash_map<std::string_view, EventCategory>;

auto addNames(CategoryTable& table, EventCategory category, std::initializer_list<std::string_view> names) -> void {
    for (auto name : names) {
        table.emplace(name, category);
    }
}

auto categoryTable() -> CategoryTable const& {
    static CategoryTable const table = [] {
        CategoryTable built;
        addNames(built, EventCategory::Clipboard, {"copy", "cut", "paste"});
        addNames(built, EventCategory::Composition, {"compositionend", "compositionstart", "compositionupdate"});
        addNames(built, EventCategory::Keyboard, {"keydown", "keypress", "keyup"});
        addNames(built, EventCategory::Focus, {"focus", "blur", "focusin", "focusout"});
        addNames(built, EventCategory::Form, {"change", "input", "invalid", "reset", "submit"});
        addNames(built, EventCategory::Mouse,
                 {"click", "contextmenu", "dblclick", "doubleclick", "drag", "dragend", "dragenter", "dragexit",
                  "dragleave", "dragover", "dragstart", "drop", "mousedown", "mouseenter", "mouseleave",
                  "mousemove", "mouseout", "mouseover", "mouseup"});
        addNames(built, EventCategory::Pointer,
                 {"pointerdown", "pointermove", "pointerup", "pointercancel", "gotpointercapture",
                  "lostpointercapture", "pointerenter", "pointerleave", "pointerover", "pointerout"});
        addNames(built, EventCategory::Selection, {"select"});
        addNames(built, EventCategory::Touch, {"touchcancel", "touchend", "touchmove", "touchstart"});
        addNames(built, EventCategory::Scroll, {"scroll"});
        addNames(built, EventCategory::Wheel, {"wheel"});
        addNames(built, EventCategory::Media,
                 {"abort", "canplay", "canplaythrough", "durationchange", "emptied", "encrypted", "ended",
                  "error", "loadeddata", "loadedmetadata", "loadstart", "pause", "play", "playing", "progress",
                  "ratechange", "seeked", "seeking", "stalled", "suspend", "timeupdate", "volumechange",
                  "waiting"});
        addNames(built, EventCategory::Animation, {"animationstart", "animationend", "animationiteration"});
        addNames(built, EventCategory::Transition, {"transitionend"});
        addNames(built, EventCategory::Toggle, {"toggle"});
        return built;
    }();
    return table;
}

auto mouseStateOf(Dom::Event const& event) -> Dom::MouseInit {
    if (auto const* mouse = event.initAs<Dom::MouseInit>()) {
        return *mouse;
    }
    if (auto const* pointer = event.initAs<Dom::PointerInit>()) {
        return pointer->mouse;
    }
    if (auto const* wheel = event.initAs<Dom::WheelInit>()) {
        return wheel->mouse;
    }
    return {};
}

auto formValueOf(Dom::Event const& event, Dom::Element const* origin) -> std::string {
    Dom::Element const* element = nullptr;
    if (event.target) {
        element = event.target->asElement();
    }
    if (element == nullptr) {
        element = origin;
    }
    if (element == nullptr) {
        return event.target ? event.target->textContent() : std::string{};
    }
    if (element->isInput() || element->isTextArea()) {
        return element->value();
    }
    return element->textContent();
}

} // namespace

auto categoryOf(std::string_view eventName) -> EventCategory {
    auto const& table = categoryTable();
    auto        it    = table.find(eventName);
    return it == table.end() ? EventCategory::Other : it->second;
}

auto categoryName(EventCategory category) -> std::string_view {
    switch (category) {
    case EventCategory::Clipboard:
        return "clipboard";
    case EventCategory::Composition:
        return "composition";
    case EventCategory::Keyboard:
        return "keyboard";
    case EventCategory::Focus:
        return "focus";
    case EventCategory::Form:
        return "form";
    case EventCategory::Mouse:
        return "mouse";
    case EventCategory::Pointer:
        return "pointer";
    case EventCategory::Selection:
        return "selection";
    case EventCategory::Touch:
        return "touch";
    case EventCategory::Scroll:
        return "scroll";
    case EventCategory::Wheel:
        return "wheel";
    case EventCategory::Media:
        return "media";
    case EventCategory::Animation:
        return "animation";
    case EventCategory::Transition:
        return "transition";
    case EventCategory::Toggle:
        return "toggle";
    case EventCategory::Other:
        return "other";
    }
    return "other";
}

auto priorityName(EventPriority priority) -> std::string_view {
    switch (priority) {
    case EventPriority::Immediate:
        return "immediate";
    case EventPriority::High:
        return "high";
    case EventPriority::Medium:
        return "medium";
    case EventPriority::Low:
        return "low";
    }
    return "high";
}

auto bubblesNatively(std::string_view eventName) -> bool {
    if (eventName == "focus" || eventName == "blur" || eventName == "mouseenter" || eventName == "mouseleave"
        || eventName == "pointerenter" || eventName == "pointerleave" || eventName == "scroll"
        || eventName == "load" || eventName == "toggle") {
        return false;
    }
    return categoryOf(eventName) != EventCategory::Media;
}

auto toVirtualEvent(Dom::Event const& event, Dom::Element const* origin) -> VirtualEvent {
    switch (categoryOf(event.type)) {
    case EventCategory::Clipboard:
        return ClipboardEvent{};
    case EventCategory::Composition: {
        CompositionEvent composition;
        if (auto const* init = event.initAs<Dom::CompositionInit>()) {
            composition.data = init->data;
        }
        return composition;
    }
    case EventCategory::Keyboard: {
        KeyboardEvent keyboard;
        if (auto const* init = event.initAs<Dom::KeyboardInit>()) {
            keyboard.keyboard = *init;
        }
        return keyboard;
    }
    case EventCategory::Focus:
        return FocusEvent{};
    case EventCategory::Form:
        return FormEvent{.value = formValueOf(event, origin)};
    case EventCategory::Mouse:
        return MouseEvent{.mouse = mouseStateOf(event)};
    case EventCategory::Pointer: {
        PointerEvent pointer;
        if (auto const* init = event.initAs<Dom::PointerInit>()) {
            pointer.pointer = *init;
        } else {
            pointer.pointer.mouse = mouseStateOf(event);
        }
        return pointer;
    }
    case EventCategory::Selection:
        return SelectionEvent{};
    case EventCategory::Touch: {
        TouchEvent touch;
        if (auto const* init = event.initAs<Dom::TouchInit>()) {
            touch.modifiers = init->modifiers;
        }
        return touch;
    }
    case EventCategory::Scroll:
        return ScrollEvent{};
    case EventCategory::Wheel: {
        WheelEvent wheel;
        if (auto const* init = event.initAs<Dom::WheelInit>()) {
            wheel.wheel = *init;
        } else {
            wheel.wheel.mouse = mouseStateOf(event);
        }
        return wheel;
    }
    case EventCategory::Media:
        return MediaEvent{};
    case EventCategory::Animation: {
        AnimationEvent animation;
        if (auto const* init = event.initAs<Dom::AnimationInit>()) {
            animation.animation_name = init->animation_name;
            animation.elapsed_time   = init->elapsed_time;
            animation.pseudo_element = init->pseudo_element;
        }
        return animation;
    }
    case EventCategory::Transition: {
        TransitionEvent transition;
        if (auto const* init = event.initAs<Dom::TransitionInit>()) {
            transition.property_name  = init->property_name;
            transition.elapsed_time   = init->elapsed_time;
            transition.pseudo_element = init->pseudo_element;
        }
        return transition;
    }
    case EventCategory::Toggle:
        return ToggleEvent{};
    case EventCategory::Other:
        break;
    }
    return OtherEvent{};
}

} // namespace TP::Events
