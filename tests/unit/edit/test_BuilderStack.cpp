#include <treepatch/edit/BuilderStack.hpp>

#include <doctest/doctest.h>

using namespace TP;
using namespace TP::Edit;

TEST_SUITE("edit.stack") {

TEST_CASE("Stack is last in, first out") {
    auto         doc = Dom::Document::create();
    BuilderStack stack(4);
    auto         a = doc->createElement("a");
    auto         b = doc->createElement("b");

    CHECK(stack.empty());
    stack.push(a);
    stack.push(b);
    CHECK(stack.size() == 2);
    CHECK(stack.top().value() == b);
    CHECK(stack.at(0).value() == a);
    CHECK(stack.at(1).value() == b);

    CHECK(stack.pop().value() == b);
    CHECK(stack.pop().value() == a);
    CHECK(stack.empty());
}

TEST_CASE("Empty stack reports StackUnderflow") {
    BuilderStack stack;

    auto popped = stack.pop();
    REQUIRE_FALSE(popped.has_value());
    CHECK(popped.error().code == Error::Code::StackUnderflow);

    auto top = stack.top();
    REQUIRE_FALSE(top.has_value());
    CHECK(top.error().code == Error::Code::StackUnderflow);

    auto beyond = stack.at(0);
    REQUIRE_FALSE(beyond.has_value());
    CHECK(beyond.error().code == Error::Code::StackUnderflow);
}

TEST_CASE("Clear drops every handle") {
    auto         doc = Dom::Document::create();
    BuilderStack stack;
    stack.push(doc->createElement("a"));
    stack.push(doc->createTextNode("t"));
    stack.clear();
    CHECK(stack.empty());
    CHECK(stack.nodes().empty());
}

} // TEST_SUITE
