#include <treepatch/events/EventDelegation.hpp>

#include <doctest/doctest.h>

#include <memory>

using namespace TP;
using namespace TP::Events;

namespace {

struct Mounted {
    std::shared_ptr<Dom::Document>  doc     = Dom::Document::create();
    std::shared_ptr<Dom::Element>   root    = doc->createElement("main");
    std::shared_ptr<TriggerChannel> channel = std::make_shared<TriggerChannel>();

    Mounted() { doc->appendChild(root); }

    auto child(std::string_view tag) -> std::shared_ptr<Dom::Element> {
        auto element = doc->createElement(tag);
        root->appendChild(element);
        return element;
    }
};

} // namespace

TEST_SUITE("events.delegation") {

TEST_CASE("Reservation values round trip") {
    auto encoded = EventDelegation::encodeReservation(ComponentId{42}, NodeId{7});
    CHECK(encoded == "42.7");

    auto decoded = EventDelegation::decodeReservation(encoded);
    REQUIRE(decoded.has_value());
    CHECK(decoded->scope == ComponentId{42});
    CHECK(decoded->node == NodeId{7});

    auto big = EventDelegation::decodeReservation("18446744073709551615.4294967297");
    REQUIRE(big.has_value());
    CHECK(big->scope.value == 18446744073709551615ull);
    CHECK(big->node == NodeId::fromSlotKey(1, 1));

    // Only the first two fields are read.
    auto extra = EventDelegation::decodeReservation("1.2.3");
    REQUIRE(extra.has_value());
    CHECK(extra->node == NodeId{2});
}

TEST_CASE("Malformed reservations are rejected") {
    for (auto const* value : {"", "42", "42.", ".7", "x.7", "42.y", "4 2.7", "-1.7", "42.7x"}) {
        CAPTURE(value);
        auto decoded = EventDelegation::decodeReservation(value);
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().code == Error::Code::MalformedTriggerAttribute);
    }
}

TEST_CASE("Click on a reserved element yields a decoded trigger") {
    Mounted         m;
    EventDelegation delegation(m.root, m.channel);
    auto            button = m.child("button");
    delegation.newEventListener(*button, "click", ComponentId{42}, NodeId{7});
    CHECK(button->getAttribute("treepatch-event-click") == std::optional<std::string>{"42.7"});

    Dom::MouseInit mouse;
    mouse.client_x = 10;
    mouse.client_y = 20;
    mouse.button   = 0;
    Dom::Event click{"click", mouse};
    button->dispatchEvent(click);

    auto trigger = m.channel->tryReceive();
    REQUIRE(trigger.has_value());
    CHECK(trigger->name == "click");
    CHECK(trigger->category == EventCategory::Mouse);
    CHECK(trigger->scope == ComponentId{42});
    CHECK(trigger->node == std::optional<NodeId>{NodeId{7}});
    CHECK(trigger->priority == EventPriority::High);
    auto const* payload = std::get_if<MouseEvent>(&trigger->event);
    REQUIRE(payload != nullptr);
    CHECK(payload->mouse.client_x == 10);
    CHECK(payload->mouse.client_y == 20);
    CHECK(delegation.deliveredEvents() == 1);
}

TEST_CASE("Unreserved origins are dropped") {
    Mounted         m;
    EventDelegation delegation(m.root, m.channel);
    auto            reserved = m.child("button");
    auto            plain    = m.child("div");
    delegation.newEventListener(*reserved, "click", ComponentId{1}, NodeId{2});

    Dom::Event click{"click"};
    plain->dispatchEvent(click);
    CHECK(m.channel->size() == 0);
    CHECK(delegation.deliveredEvents() == 0);
    CHECK(delegation.droppedEvents() == 1);

    SUBCASE("a garbled attribute is dropped the same way") {
        plain->setAttribute("treepatch-event-click", "not-a-reservation");
        Dom::Event again{"click"};
        plain->dispatchEvent(again);
        CHECK(m.channel->size() == 0);
        CHECK(delegation.droppedEvents() == 2);
    }
}

TEST_CASE("Text targets resolve to their parent element") {
    Mounted         m;
    EventDelegation delegation(m.root, m.channel);
    auto            label = m.child("label");
    auto            text  = m.doc->createTextNode("press");
    label->appendChild(text);
    delegation.newEventListener(*label, "click", ComponentId{3}, NodeId{4});

    Dom::Event click{"click"};
    text->dispatchEvent(click);
    auto trigger = m.channel->tryReceive();
    REQUIRE(trigger.has_value());
    CHECK(trigger->node == std::optional<NodeId>{NodeId{4}});
}

TEST_CASE("One native listener per event name") {
    Mounted         m;
    EventDelegation delegation(m.root, m.channel);
    auto            a = m.child("button");
    auto            b = m.child("button");

    delegation.newEventListener(*a, "click", ComponentId{1}, NodeId{1});
    delegation.newEventListener(*b, "click", ComponentId{1}, NodeId{2});
    CHECK(delegation.listenerCount("click") == 2);
    CHECK(delegation.installedListeners() == 1);
    CHECK(m.root->listenerCount("click") == 1);

    REQUIRE(delegation.removeListener("click").has_value());
    CHECK(delegation.listenerCount("click") == 1);
    CHECK(m.root->listenerCount("click") == 1);

    REQUIRE(delegation.removeListener("click").has_value());
    CHECK(delegation.listenerCount("click") == 0);
    CHECK(delegation.installedListeners() == 0);
    CHECK(m.root->listenerCount("click") == 0);

    Dom::Event click{"click"};
    a->dispatchEvent(click);
    CHECK(m.channel->size() == 0);

    auto missing = delegation.removeListener("click");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::UnknownListener);
}

TEST_CASE("Non-bubbling events are observed in the capture phase") {
    Mounted         m;
    EventDelegation delegation(m.root, m.channel);
    auto            input = m.child("input");
    delegation.newEventListener(*input, "focus", ComponentId{5}, NodeId{6});

    Dom::Event focus{"focus", {}, false};
    input->dispatchEvent(focus);
    auto trigger = m.channel->tryReceive();
    REQUIRE(trigger.has_value());
    CHECK(trigger->category == EventCategory::Focus);
    CHECK(std::holds_alternative<FocusEvent>(trigger->event));
}

TEST_CASE("Form events carry the live value") {
    Mounted         m;
    EventDelegation delegation(m.root, m.channel);
    auto            input = m.child("input");
    delegation.newEventListener(*input, "input", ComponentId{1}, NodeId{9});
    input->setValue("hello");

    Dom::Event typed{"input"};
    input->dispatchEvent(typed);
    auto trigger = m.channel->tryReceive();
    REQUIRE(trigger.has_value());
    auto const* form = std::get_if<FormEvent>(&trigger->event);
    REQUIRE(form != nullptr);
    CHECK(form->value == "hello");
}

TEST_CASE("Custom prefix and detach") {
    Mounted                m;
    EventDelegationOptions options;
    options.attributePrefix = "data-app";
    options.priority        = EventPriority::Low;
    auto delegation         = std::make_unique<EventDelegation>(m.root, m.channel, options);
    auto key                = m.child("div");

    delegation->newEventListener(*key, "keydown", ComponentId{2}, NodeId{3});
    CHECK(delegation->reservationAttribute("keydown") == "data-app-keydown");
    CHECK(key->hasAttribute("data-app-keydown"));

    Dom::KeyboardInit init;
    init.key = "Enter";
    Dom::Event press{"keydown", init};
    key->dispatchEvent(press);
    auto trigger = m.channel->tryReceive();
    REQUIRE(trigger.has_value());
    CHECK(trigger->priority == EventPriority::Low);
    auto const* keyboard = std::get_if<KeyboardEvent>(&trigger->event);
    REQUIRE(keyboard != nullptr);
    CHECK(keyboard->keyboard.key == "Enter");

    delegation.reset();
    CHECK(m.root->listenerCount("keydown") == 0);
}

TEST_CASE("Closed channels drop events") {
    Mounted         m;
    EventDelegation delegation(m.root, m.channel);
    auto            button = m.child("button");
    delegation.newEventListener(*button, "click", ComponentId{1}, NodeId{1});
    m.channel->close();

    Dom::Event click{"click"};
    button->dispatchEvent(click);
    CHECK(delegation.deliveredEvents() == 0);
    CHECK(delegation.droppedEvents() == 1);
}

} // TEST_SUITE
