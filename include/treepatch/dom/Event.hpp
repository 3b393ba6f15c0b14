#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>

namespace TP::Dom {

class Node;

struct Modifiers {
    bool alt   = false;
    bool ctrl  = false;
    bool meta  = false;
    bool shift = false;
};

struct MouseInit {
    std::int32_t  client_x = 0;
    std::int32_t  client_y = 0;
    std::int32_t  page_x   = 0;
    std::int32_t  page_y   = 0;
    std::int32_t  screen_x = 0;
    std::int32_t  screen_y = 0;
    std::int16_t  button   = 0;
    std::uint16_t buttons  = 0;
    Modifiers     modifiers;
};

struct PointerInit {
    MouseInit     mouse;
    std::int32_t  pointer_id          = 0;
    double        width               = 1.0;
    double        height              = 1.0;
    float         pressure            = 0.0f;
    float         tangential_pressure = 0.0f;
    std::int32_t  tilt_x              = 0;
    std::int32_t  tilt_y              = 0;
    std::int32_t  twist               = 0;
    std::string   pointer_type;
    bool          is_primary = false;
};

struct WheelInit {
    MouseInit     mouse;
    double        delta_x    = 0.0;
    double        delta_y    = 0.0;
    double        delta_z    = 0.0;
    std::uint32_t delta_mode = 0;
};

struct KeyboardInit {
    std::string   key;
    std::string   code;
    std::uint32_t location  = 0;
    bool          repeat    = false;
    std::uint32_t char_code = 0;
    std::uint32_t key_code  = 0;
    std::uint32_t which     = 0;
    Modifiers     modifiers;
};

struct CompositionInit {
    std::string data;
};

struct TouchInit {
    Modifiers modifiers;
};

struct AnimationInit {
    std::string animation_name;
    float       elapsed_time = 0.0f;
    std::string pseudo_element;
};

struct TransitionInit {
    std::string property_name;
    float       elapsed_time = 0.0f;
    std::string pseudo_element;
};

// Native payload carried by an event; which alternative is present depends on
// how the host constructed the event, not on its type name.
using EventInit = std::variant<std::monostate,
                               MouseInit,
                               PointerInit,
                               WheelInit,
                               KeyboardInit,
                               CompositionInit,
                               TouchInit,
                               AnimationInit,
                               TransitionInit>;

enum class EventPhase : std::uint8_t {
    None,
    Capturing,
    AtTarget,
    Bubbling,
};

struct Event {
    explicit Event(std::string type, EventInit init = {}, bool bubbles = true)
        : type(std::move(type)), init(std::move(init)), bubbles(bubbles) {}

    std::string           type;
    EventInit             init;
    bool                  bubbles = true;
    std::shared_ptr<Node> target;
    Node*                 currentTarget      = nullptr;
    EventPhase            phase              = EventPhase::None;
    bool                  propagationStopped = false;

    auto stopPropagation() -> void { propagationStopped = true; }

    template <typename T>
    [[nodiscard]] auto initAs() const -> T const* {
        return std::get_if<T>(&init);
    }
};

using EventCallback = std::function<void(Event&)>;
using ListenerToken = std::uint64_t;

} // namespace TP::Dom
