#include <treepatch/core/Error.hpp>
#include <treepatch/core/Ids.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace TP;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError);
             i <= static_cast<int>(Error::Code::ChannelClosed);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            // describeError echoes the label when the message is empty.
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::UnknownNodeId, "node id 7 is not registered"};
        CHECK(describeError(withMsg) == "unknown_node_id:node id 7 is not registered");

        CHECK(errorCodeToString(Error::Code::StackUnderflow) == "stack_underflow");
        CHECK(errorCodeToString(Error::Code::MalformedTriggerAttribute) == "malformed_trigger_attribute");
        CHECK(errorCodeToString(Error::Code::DetachedNode) == "detached_node");
        CHECK(errorCodeToString(Error::Code::HierarchyViolation) == "hierarchy_violation");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }
}

TEST_SUITE("core.ids") {
    TEST_CASE("NodeId slot key round trip") {
        auto id = NodeId::fromSlotKey(17, 3);
        CHECK(id.slotIndex() == 17u);
        CHECK(id.generation() == 3u);
        CHECK(id == NodeId{(std::uint64_t{3} << 32) | 17u});

        NodeId plain{42};
        CHECK(plain.slotIndex() == 42u);
        CHECK(plain.generation() == 0u);
    }

    TEST_CASE("Ids hash by value") {
        std::hash<NodeId> hasher;
        CHECK(hasher(NodeId{5}) == hasher(NodeId{5}));
        CHECK(ComponentId{9} == ComponentId{9});
        CHECK_FALSE(ComponentId{9} == ComponentId{10});
    }
}
