#include <treepatch/edit/EditSerialization.hpp>

#include "nlohmann/json.hpp"

#include <limits>
#include <utility>

namespace TP::Edit {
namespace {

using Json = nlohmann::json;

[[nodiscard]] auto make_error(std::size_t index, std::string_view field, std::string_view detail) -> Error {
    std::string message = "edit[" + std::to_string(index) + "]";
    if (!field.empty()) {
        message.append(".");
        message.append(field);
    }
    message.append(": ");
    message.append(detail);
    return Error{Error::Code::MalformedInput, std::move(message)};
}

[[nodiscard]] auto read_string(Json const& entry, std::size_t index, std::string_view field) -> Expected<std::string> {
    auto it = entry.find(std::string(field));
    if (it == entry.end()) {
        return std::unexpected(make_error(index, field, "missing"));
    }
    if (!it->is_string()) {
        return std::unexpected(make_error(index, field, "must be a string"));
    }
    return it->get<std::string>();
}

[[nodiscard]] auto read_optional_string(Json const& entry, std::size_t index, std::string_view field)
    -> Expected<std::optional<std::string>> {
    auto it = entry.find(std::string(field));
    if (it == entry.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return std::unexpected(make_error(index, field, "must be a string or null"));
    }
    return std::optional<std::string>{it->get<std::string>()};
}

[[nodiscard]] auto read_u64(Json const& entry, std::size_t index, std::string_view field) -> Expected<std::uint64_t> {
    auto it = entry.find(std::string(field));
    if (it == entry.end()) {
        return std::unexpected(make_error(index, field, "missing"));
    }
    if (!it->is_number_unsigned()) {
        return std::unexpected(make_error(index, field, "must be an unsigned integer"));
    }
    return it->get<std::uint64_t>();
}

[[nodiscard]] auto read_u32(Json const& entry, std::size_t index, std::string_view field) -> Expected<std::uint32_t> {
    auto value = read_u64(entry, index, field);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (*value > std::numeric_limits<std::uint32_t>::max()) {
        return std::unexpected(make_error(index, field, "out of range"));
    }
    return static_cast<std::uint32_t>(*value);
}

struct EncodeVisitor {
    Json& out;

    void operator()(PushRoot const& edit) const { out["id"] = edit.id.value; }
    void operator()(PopRoot const&) const {}
    void operator()(AppendChildren const& edit) const { out["many"] = edit.many; }
    void operator()(ReplaceWith const& edit) const { out["many"] = edit.many; }
    void operator()(Remove const&) const {}
    void operator()(RemoveAllChildren const&) const {}
    void operator()(CreateTextNode const& edit) const {
        out["text"] = edit.text;
        out["id"]   = edit.id.value;
    }
    void operator()(CreateElement const& edit) const {
        out["tag"] = edit.tag;
        out["id"]  = edit.id.value;
        if (edit.ns) {
            out["ns"] = *edit.ns;
        }
    }
    void operator()(CreatePlaceholder const& edit) const { out["id"] = edit.id.value; }
    void operator()(NewEventListener const& edit) const {
        out["event_name"]      = edit.event_name;
        out["scope"]           = edit.scope.value;
        out["mounted_node_id"] = edit.mounted_node_id.value;
    }
    void operator()(RemoveEventListener const& edit) const { out["event_name"] = edit.event_name; }
    void operator()(SetText const& edit) const { out["text"] = edit.text; }
    void operator()(SetAttribute const& edit) const {
        out["field"] = edit.field;
        out["value"] = edit.value;
        if (edit.ns) {
            out["ns"] = *edit.ns;
        }
    }
    void operator()(RemoveAttribute const& edit) const { out["name"] = edit.name; }
};

[[nodiscard]] auto decode_entry(Json const& entry, std::size_t index) -> Expected<DomEdit> {
    if (!entry.is_object()) {
        return std::unexpected(make_error(index, "", "entry must be an object"));
    }
    auto type = read_string(entry, index, "type");
    if (!type) {
        return std::unexpected(type.error());
    }

    if (*type == "PushRoot") {
        auto id = read_u64(entry, index, "id");
        if (!id) {
            return std::unexpected(id.error());
        }
        return PushRoot{NodeId{*id}};
    }
    if (*type == "PopRoot") {
        return PopRoot{};
    }
    if (*type == "AppendChildren" || *type == "ReplaceWith") {
        auto many = read_u32(entry, index, "many");
        if (!many) {
            return std::unexpected(many.error());
        }
        if (*type == "AppendChildren") {
            return AppendChildren{*many};
        }
        return ReplaceWith{*many};
    }
    if (*type == "Remove") {
        return Remove{};
    }
    if (*type == "RemoveAllChildren") {
        return RemoveAllChildren{};
    }
    if (*type == "CreateTextNode") {
        auto text = read_string(entry, index, "text");
        if (!text) {
            return std::unexpected(text.error());
        }
        auto id = read_u64(entry, index, "id");
        if (!id) {
            return std::unexpected(id.error());
        }
        return CreateTextNode{std::move(*text), NodeId{*id}};
    }
    if (*type == "CreateElement" || *type == "CreateElementNs") {
        auto tag = read_string(entry, index, "tag");
        if (!tag) {
            return std::unexpected(tag.error());
        }
        auto id = read_u64(entry, index, "id");
        if (!id) {
            return std::unexpected(id.error());
        }
        std::optional<std::string> ns;
        if (*type == "CreateElementNs") {
            auto value = read_string(entry, index, "ns");
            if (!value) {
                return std::unexpected(value.error());
            }
            ns = std::move(*value);
        }
        return CreateElement{std::move(*tag), NodeId{*id}, std::move(ns)};
    }
    if (*type == "CreatePlaceholder") {
        auto id = read_u64(entry, index, "id");
        if (!id) {
            return std::unexpected(id.error());
        }
        return CreatePlaceholder{NodeId{*id}};
    }
    if (*type == "NewEventListener") {
        auto name = read_string(entry, index, "event_name");
        if (!name) {
            return std::unexpected(name.error());
        }
        auto scope = read_u64(entry, index, "scope");
        if (!scope) {
            return std::unexpected(scope.error());
        }
        auto node = read_u64(entry, index, "mounted_node_id");
        if (!node) {
            return std::unexpected(node.error());
        }
        return NewEventListener{std::move(*name), ComponentId{*scope}, NodeId{*node}};
    }
    if (*type == "RemoveEventListener") {
        auto name = read_string(entry, index, "event_name");
        if (!name) {
            return std::unexpected(name.error());
        }
        return RemoveEventListener{std::move(*name)};
    }
    if (*type == "SetText") {
        auto text = read_string(entry, index, "text");
        if (!text) {
            return std::unexpected(text.error());
        }
        return SetText{std::move(*text)};
    }
    if (*type == "SetAttribute") {
        auto field = read_string(entry, index, "field");
        if (!field) {
            return std::unexpected(field.error());
        }
        auto value = read_string(entry, index, "value");
        if (!value) {
            return std::unexpected(value.error());
        }
        auto ns = read_optional_string(entry, index, "ns");
        if (!ns) {
            return std::unexpected(ns.error());
        }
        return SetAttribute{std::move(*field), std::move(*value), std::move(*ns)};
    }
    if (*type == "RemoveAttribute") {
        auto name = read_string(entry, index, "name");
        if (!name) {
            return std::unexpected(name.error());
        }
        return RemoveAttribute{std::move(*name)};
    }
    return std::unexpected(make_error(index, "type", "unknown edit type '" + *type + "'"));
}

[[nodiscard]] auto encode_modifiers(Dom::Modifiers const& modifiers) -> Json {
    return Json{{"alt", modifiers.alt}, {"ctrl", modifiers.ctrl}, {"meta", modifiers.meta}, {"shift", modifiers.shift}};
}

[[nodiscard]] auto encode_mouse(Dom::MouseInit const& mouse) -> Json {
    return Json{{"client_x", mouse.client_x},
                {"client_y", mouse.client_y},
                {"page_x", mouse.page_x},
                {"page_y", mouse.page_y},
                {"screen_x", mouse.screen_x},
                {"screen_y", mouse.screen_y},
                {"button", mouse.button},
                {"buttons", mouse.buttons},
                {"modifiers", encode_modifiers(mouse.modifiers)}};
}

struct PayloadVisitor {
    auto operator()(Events::OtherEvent const&) const -> Json { return Json::object(); }
    auto operator()(Events::ClipboardEvent const&) const -> Json { return Json::object(); }
    auto operator()(Events::CompositionEvent const& event) const -> Json { return Json{{"data", event.data}}; }
    auto operator()(Events::KeyboardEvent const& event) const -> Json {
        auto const& key = event.keyboard;
        return Json{{"key", key.key},
                    {"code", key.code},
                    {"location", key.location},
                    {"repeat", key.repeat},
                    {"char_code", key.char_code},
                    {"key_code", key.key_code},
                    {"which", key.which},
                    {"modifiers", encode_modifiers(key.modifiers)}};
    }
    auto operator()(Events::FocusEvent const&) const -> Json { return Json::object(); }
    auto operator()(Events::FormEvent const& event) const -> Json { return Json{{"value", event.value}}; }
    auto operator()(Events::MouseEvent const& event) const -> Json { return encode_mouse(event.mouse); }
    auto operator()(Events::PointerEvent const& event) const -> Json {
        auto const& pointer = event.pointer;
        auto        out     = encode_mouse(pointer.mouse);
        out["pointer_id"]          = pointer.pointer_id;
        out["width"]               = pointer.width;
        out["height"]              = pointer.height;
        out["pressure"]            = pointer.pressure;
        out["tangential_pressure"] = pointer.tangential_pressure;
        out["tilt_x"]              = pointer.tilt_x;
        out["tilt_y"]              = pointer.tilt_y;
        out["twist"]               = pointer.twist;
        out["pointer_type"]        = pointer.pointer_type;
        out["is_primary"]          = pointer.is_primary;
        return out;
    }
    auto operator()(Events::SelectionEvent const&) const -> Json { return Json::object(); }
    auto operator()(Events::TouchEvent const& event) const -> Json {
        return Json{{"modifiers", encode_modifiers(event.modifiers)}};
    }
    auto operator()(Events::ScrollEvent const&) const -> Json { return Json::object(); }
    auto operator()(Events::WheelEvent const& event) const -> Json {
        auto out          = encode_mouse(event.wheel.mouse);
        out["delta_x"]    = event.wheel.delta_x;
        out["delta_y"]    = event.wheel.delta_y;
        out["delta_z"]    = event.wheel.delta_z;
        out["delta_mode"] = event.wheel.delta_mode;
        return out;
    }
    auto operator()(Events::MediaEvent const&) const -> Json { return Json::object(); }
    auto operator()(Events::AnimationEvent const& event) const -> Json {
        return Json{{"animation_name", event.animation_name},
                    {"elapsed_time", event.elapsed_time},
                    {"pseudo_element", event.pseudo_element}};
    }
    auto operator()(Events::TransitionEvent const& event) const -> Json {
        return Json{{"property_name", event.property_name},
                    {"elapsed_time", event.elapsed_time},
                    {"pseudo_element", event.pseudo_element}};
    }
    auto operator()(Events::ToggleEvent const&) const -> Json { return Json::object(); }
};

} // namespace

auto encodeEdits(std::span<DomEdit const> edits) -> nlohmann::json {
    auto out = Json::array();
    for (auto const& edit : edits) {
        Json entry;
        entry["type"] = std::string(editKind(edit));
        std::visit(EncodeVisitor{entry}, edit);
        out.push_back(std::move(entry));
    }
    return out;
}

auto encodeEditsToString(std::span<DomEdit const> edits) -> std::string {
    return encodeEdits(edits).dump();
}

auto decodeEdits(nlohmann::json const& document) -> Expected<std::vector<DomEdit>> {
    if (!document.is_array()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "edit stream must be a JSON array"});
    }
    std::vector<DomEdit> edits;
    edits.reserve(document.size());
    for (std::size_t index = 0; index < document.size(); ++index) {
        auto edit = decode_entry(document[index], index);
        if (!edit) {
            return std::unexpected(edit.error());
        }
        edits.push_back(std::move(*edit));
    }
    return edits;
}

auto decodeEditsFromString(std::string_view text) -> Expected<std::vector<DomEdit>> {
    auto document = Json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "edit stream is not valid JSON"});
    }
    return decodeEdits(document);
}

auto encodeTrigger(Events::EventTrigger const& trigger) -> nlohmann::json {
    Json out;
    out["name"]     = trigger.name;
    out["category"] = std::string(Events::categoryName(trigger.category));
    out["priority"] = std::string(Events::priorityName(trigger.priority));
    out["scope"]    = trigger.scope.value;
    if (trigger.node) {
        out["node"] = trigger.node->value;
    } else {
        out["node"] = nullptr;
    }
    out["payload"] = std::visit(PayloadVisitor{}, trigger.event);
    return out;
}

} // namespace TP::Edit
