#include <treepatch/edit/EditSerialization.hpp>

#include <nlohmann/json.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace TP;
using namespace TP::Edit;

TEST_SUITE("edit.serialization") {

TEST_CASE("Encoded edits use the tagged wire layout") {
    std::vector<DomEdit> edits{
        PushRoot{NodeId{0}},
        CreateElement{"circle", NodeId{5}, std::string{"http://www.w3.org/2000/svg"}},
        SetAttribute{"r", "4", std::nullopt},
        NewEventListener{"click", ComponentId{42}, NodeId{5}},
        AppendChildren{1},
        PopRoot{},
    };

    auto json = encodeEdits(edits);
    REQUIRE(json.is_array());
    REQUIRE(json.size() == 6);
    CHECK(json[0] == nlohmann::json{{"type", "PushRoot"}, {"id", 0}});
    CHECK(json[1]["type"] == "CreateElementNs");
    CHECK(json[1]["ns"] == "http://www.w3.org/2000/svg");
    CHECK(json[2]["field"] == "r");
    CHECK_FALSE(json[2].contains("ns"));
    CHECK(json[3]["scope"] == 42);
    CHECK(json[3]["mounted_node_id"] == 5);
    CHECK(json[5] == nlohmann::json{{"type", "PopRoot"}});
}

TEST_CASE("Decoding a diff-engine stream") {
    auto decoded = decodeEditsFromString(R"([
        {"type": "PushRoot", "id": 0},
        {"type": "CreateElement", "tag": "ul", "id": 1},
        {"type": "CreateTextNode", "text": "item", "id": 4294967298},
        {"type": "CreatePlaceholder", "id": 3},
        {"type": "AppendChildren", "many": 2},
        {"type": "ReplaceWith", "many": 1},
        {"type": "SetAttribute", "field": "href", "value": "#top", "ns": null},
        {"type": "RemoveAttribute", "name": "href"},
        {"type": "SetText", "text": "done"},
        {"type": "RemoveEventListener", "event_name": "click"},
        {"type": "RemoveAllChildren"},
        {"type": "Remove"}
    ])");

    REQUIRE(decoded.has_value());
    auto const& edits = *decoded;
    REQUIRE(edits.size() == 12);
    CHECK(std::get<PushRoot>(edits[0]).id == NodeId{0});
    CHECK(std::get<CreateElement>(edits[1]).tag == "ul");
    CHECK_FALSE(std::get<CreateElement>(edits[1]).ns.has_value());
    CHECK(std::get<CreateTextNode>(edits[2]).id == NodeId::fromSlotKey(2, 1));
    CHECK(std::get<AppendChildren>(edits[4]).many == 2);
    CHECK(std::get<ReplaceWith>(edits[5]).many == 1);
    CHECK_FALSE(std::get<SetAttribute>(edits[6]).ns.has_value());
    CHECK(std::get<RemoveAttribute>(edits[7]).name == "href");
    CHECK(std::get<SetText>(edits[8]).text == "done");
    CHECK(std::holds_alternative<RemoveAllChildren>(edits[10]));
    CHECK(std::holds_alternative<Remove>(edits[11]));
}

TEST_CASE("Encode then decode preserves the stream") {
    std::vector<DomEdit> edits{
        CreateElement{"svg", NodeId{1}, std::string{"http://www.w3.org/2000/svg"}},
        SetAttribute{"class", "icon", std::string{"http://www.w3.org/2000/svg"}},
        NewEventListener{"mouseover", ComponentId{7}, NodeId{1}},
    };
    auto decoded = decodeEditsFromString(encodeEditsToString(edits));
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->size() == 3);
    CHECK(std::get<CreateElement>((*decoded)[0]).ns == std::optional<std::string>{"http://www.w3.org/2000/svg"});
    CHECK(std::get<SetAttribute>((*decoded)[1]).ns.has_value());
    auto const& listener = std::get<NewEventListener>((*decoded)[2]);
    CHECK(listener.event_name == "mouseover");
    CHECK(listener.scope == ComponentId{7});
    CHECK(listener.mounted_node_id == NodeId{1});
}

TEST_CASE("Malformed streams name the entry and field") {
    auto expectMalformed = [](std::string_view text, std::string_view fragment) {
        auto decoded = decodeEditsFromString(text);
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().code == Error::Code::MalformedInput);
        CHECK(decoded.error().message.value().find(fragment) != std::string::npos);
    };

    expectMalformed("not json", "not valid JSON");
    expectMalformed(R"({"type": "PopRoot"})", "array");
    expectMalformed(R"([{"type": "PopRoot"}, 7])", "edit[1]");
    expectMalformed(R"([{"id": 1}])", "edit[0].type");
    expectMalformed(R"([{"type": "Teleport"}])", "unknown edit type 'Teleport'");
    expectMalformed(R"([{"type": "PopRoot"}, {"type": "PushRoot"}])", "edit[1].id: missing");
    expectMalformed(R"([{"type": "PushRoot", "id": -1}])", "edit[0].id");
    expectMalformed(R"([{"type": "PushRoot", "id": "1"}])", "edit[0].id");
    expectMalformed(R"([{"type": "AppendChildren", "many": 4294967296}])", "edit[0].many: out of range");
    expectMalformed(R"([{"type": "CreateElementNs", "tag": "g", "id": 1}])", "edit[0].ns");
    expectMalformed(R"([{"type": "SetAttribute", "field": "a", "value": 1}])", "edit[0].value");
}

TEST_CASE("Triggers encode for scheduler logs") {
    Events::EventTrigger trigger;
    trigger.name     = "wheel";
    trigger.category = Events::EventCategory::Wheel;
    trigger.scope    = ComponentId{4};
    trigger.node     = NodeId{8};
    Events::WheelEvent wheel;
    wheel.wheel.delta_y = 120.0;
    trigger.event       = wheel;

    auto json = encodeTrigger(trigger);
    CHECK(json["name"] == "wheel");
    CHECK(json["category"] == "wheel");
    CHECK(json["priority"] == "high");
    CHECK(json["scope"] == 4);
    CHECK(json["node"] == 8);
    CHECK(json["payload"]["delta_y"] == 120.0);

    trigger.node.reset();
    CHECK(encodeTrigger(trigger)["node"].is_null());
}

} // TEST_SUITE
