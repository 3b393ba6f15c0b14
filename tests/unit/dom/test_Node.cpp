#include <treepatch/dom/Node.hpp>

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace TP::Dom;

TEST_SUITE("dom.node") {

TEST_CASE("Tree mutation keeps parent links consistent") {
    auto doc  = Document::create();
    auto root = doc->createElement("main");
    doc->appendChild(root);

    auto a = doc->createElement("a");
    auto b = doc->createElement("b");
    auto c = doc->createElement("c");

    SUBCASE("append and insertBefore") {
        root->appendChild(a);
        root->appendChild(c);
        root->insertBefore(b, c.get());
        REQUIRE(root->childCount() == 3);
        CHECK(root->children()[0] == a);
        CHECK(root->children()[1] == b);
        CHECK(root->children()[2] == c);
        CHECK(b->parent() == root);
        CHECK(b->previousSibling() == a);
        CHECK(b->nextSibling() == c);
        CHECK(b->ownerDocument() == doc);
    }

    SUBCASE("appending an attached node moves it") {
        root->appendChild(a);
        a->appendChild(b);
        root->appendChild(b);
        CHECK(a->childCount() == 0);
        CHECK(root->childCount() == 2);
        CHECK(b->parent() == root);
    }

    SUBCASE("a node cannot become its own descendant") {
        root->appendChild(a);
        a->appendChild(b);
        CHECK(b->appendChild(a) == nullptr);
        CHECK(a->parent() == root);
    }

    SUBCASE("replaceWith inserts in order and detaches the old node") {
        root->appendChild(a);
        root->appendChild(c);
        auto x = doc->createElement("x");
        auto y = doc->createElement("y");
        CHECK(a->replaceWith({x, y}));
        CHECK(serialize(*root) == "<main><x></x><y></y><c></c></main>");
        CHECK(a->parent() == nullptr);
    }

    SUBCASE("replaceWith on a detached node is a no-op") {
        CHECK_FALSE(a->replaceWith({b}));
        CHECK(b->parent() == nullptr);
    }

    SUBCASE("remove and removeAllChildren") {
        root->appendChild(a);
        root->appendChild(b);
        CHECK(a->remove());
        CHECK_FALSE(a->remove());
        root->appendChild(c);
        auto removed = root->removeAllChildren();
        CHECK(removed.size() == 2);
        CHECK(root->childCount() == 0);
        CHECK(b->parent() == nullptr);
        CHECK(c->parent() == nullptr);
    }
}

TEST_CASE("Text content and serialization") {
    auto doc = Document::create();
    auto p   = doc->createElement("p");
    p->appendChild(doc->createTextNode("a < b"));
    p->appendChild(doc->createComment("marker"));
    p->appendChild(doc->createTextNode(" & c"));

    CHECK(p->textContent() == "a < b & c");
    CHECK(serialize(*p) == "<p>a &lt; b<!--marker--> &amp; c</p>");

    p->setTextContent("plain");
    REQUIRE(p->childCount() == 1);
    CHECK(p->firstChild()->isText());
    CHECK(serialize(*p) == "<p>plain</p>");

    p->setTextContent("");
    CHECK(p->childCount() == 0);
}

TEST_CASE("Element attributes") {
    auto doc = Document::create();
    auto div = doc->createElement("div");

    div->setAttribute("id", "main");
    div->setAttribute("title", "say \"hi\"");
    CHECK(div->getAttribute("id") == std::optional<std::string>{"main"});
    CHECK(div->hasAttribute("title"));
    CHECK(serialize(*div) == "<div id=\"main\" title=\"say &quot;hi&quot;\"></div>");

    div->setAttribute("id", "other");
    CHECK(div->attributes().size() == 2);
    CHECK(div->getAttribute("id") == std::optional<std::string>{"other"});

    CHECK(div->removeAttribute("id"));
    CHECK_FALSE(div->removeAttribute("id"));
    CHECK_FALSE(div->getAttribute("id").has_value());

    div->setClassName("card");
    CHECK(div->className() == "card");
    CHECK_FALSE(div->setSvgClassBaseVal("ignored"));
    CHECK(div->className() == "card");

    auto circle = doc->createElementNS(kSvgNamespace, "circle");
    CHECK(circle->isSvg());
    CHECK(circle->setSvgClassBaseVal("dot"));
    CHECK(circle->className() == "dot");

    circle->setAttributeNS("http://www.w3.org/1999/xlink", "xlink:href", "#a");
    auto const& attrs = circle->attributes();
    REQUIRE(attrs.size() == 2);
    CHECK(attrs[1].namespaceURI == std::optional<std::string>{"http://www.w3.org/1999/xlink"});
}

TEST_CASE("Live form state follows attributes until set directly") {
    auto doc   = Document::create();
    auto input = doc->createElement("input");

    input->setAttribute("value", "seed");
    CHECK(input->value() == "seed");
    input->setAttribute("checked", "");
    CHECK(input->checked());

    input->setValue("typed");
    input->setAttribute("value", "ignored");
    CHECK(input->value() == "typed");

    // Removing the attribute alone leaves the live value in place.
    input->removeAttribute("value");
    CHECK(input->value() == "typed");

    auto option = doc->createElement("option");
    option->setAttribute("selected", "");
    CHECK(option->selected());
    option->removeAttribute("selected");
    CHECK_FALSE(option->selected());

    auto div = doc->createElement("div");
    div->setAttribute("value", "x");
    CHECK(div->value().empty());
}

TEST_CASE("Event dispatch runs capture, target and bubble phases") {
    auto doc    = Document::create();
    auto root   = doc->createElement("main");
    auto button = doc->createElement("button");
    auto label  = doc->createTextNode("go");
    root->appendChild(button);
    button->appendChild(label);

    std::vector<std::string> seen;
    root->addEventListener("click", [&](Event& e) {
        CHECK(e.phase == EventPhase::Capturing);
        seen.push_back("root-capture");
    }, true);
    root->addEventListener("click", [&](Event& e) {
        CHECK(e.phase == EventPhase::Bubbling);
        CHECK(e.target == label);
        seen.push_back("root-bubble");
    });
    auto token = button->addEventListener("click", [&](Event&) { seen.push_back("button"); });

    Event click{"click"};
    label->dispatchEvent(click);
    CHECK(seen == std::vector<std::string>{"root-capture", "button", "root-bubble"});

    SUBCASE("non-bubbling events skip the bubble phase") {
        seen.clear();
        Event focus{"click", {}, false};
        label->dispatchEvent(focus);
        CHECK(seen == std::vector<std::string>{"root-capture"});
    }

    SUBCASE("stopPropagation halts the path") {
        seen.clear();
        button->addEventListener("click", [](Event& e) { e.stopPropagation(); });
        Event again{"click"};
        label->dispatchEvent(again);
        CHECK(seen == std::vector<std::string>{"root-capture", "button"});
    }

    SUBCASE("removed listeners no longer fire") {
        seen.clear();
        CHECK(button->removeEventListener("click", token));
        CHECK(button->listenerCount("click") == 0);
        Event again{"click"};
        label->dispatchEvent(again);
        CHECK(seen == std::vector<std::string>{"root-capture", "root-bubble"});
    }
}

} // TEST_SUITE
