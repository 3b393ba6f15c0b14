#pragma once

#include <treepatch/core/Error.hpp>
#include <treepatch/dom/Node.hpp>
#include <treepatch/edit/BuilderStack.hpp>
#include <treepatch/edit/DomEdit.hpp>
#include <treepatch/edit/NodeRegistry.hpp>

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace TP::Events {
class EventDelegation;
}

namespace TP::Edit {

struct EditInterpreterOptions {
    // Element created for CreatePlaceholder; it also receives `hidden`.
    std::string placeholderTag = "pre";
    // Data of the comment inserted between adjacent text siblings.
    std::string textSeparator    = "treepatch";
    std::size_t stackCapacity    = 10;
    std::size_t registryCapacity = 1000;
};

struct ApplyStats {
    std::size_t applied = 0;
    // Depth left on the builder stack after the stream; non-zero is logged.
    std::size_t residualDepth = 0;
};

/**
 * Replays diff-engine edit streams against a native document.
 *
 * Each instruction performs exactly one native mutation, in stream order.
 * The first failing instruction aborts the stream; the error names its index
 * and no rollback is attempted, so the caller must treat the tree as out of
 * sync. The registry and the builder stack are owned here and touched only
 * from the thread that owns the document.
 */
class EditInterpreter {
public:
    EditInterpreter(std::shared_ptr<Dom::Document> document,
                    Events::EventDelegation&       delegation,
                    EditInterpreterOptions         options = {});

    EditInterpreter(EditInterpreter const&)            = delete;
    EditInterpreter& operator=(EditInterpreter const&) = delete;

    auto apply(std::span<DomEdit const> edits) -> Expected<ApplyStats>;
    auto applyOne(DomEdit const& edit) -> Expected<void>;

    [[nodiscard]] auto registry() -> NodeRegistry& { return this->nodes; }
    [[nodiscard]] auto registry() const -> NodeRegistry const& { return this->nodes; }
    [[nodiscard]] auto stack() const -> BuilderStack const& { return this->builder; }
    [[nodiscard]] auto document() const -> std::shared_ptr<Dom::Document> const& { return this->doc; }

private:
    friend struct ApplyVisitor;

    auto pushRoot(PushRoot const& edit) -> Expected<void>;
    auto popRoot() -> Expected<void>;
    auto appendChildren(AppendChildren const& edit) -> Expected<void>;
    auto replaceWith(ReplaceWith const& edit) -> Expected<void>;
    auto remove() -> Expected<void>;
    auto removeAllChildren() -> Expected<void>;
    auto createTextNode(CreateTextNode const& edit) -> Expected<void>;
    auto createElement(CreateElement const& edit) -> Expected<void>;
    auto createPlaceholder(CreatePlaceholder const& edit) -> Expected<void>;
    auto newEventListener(NewEventListener const& edit) -> Expected<void>;
    auto removeEventListener(RemoveEventListener const& edit) -> Expected<void>;
    auto setText(SetText const& edit) -> Expected<void>;
    auto setAttribute(SetAttribute const& edit) -> Expected<void>;
    auto removeAttribute(RemoveAttribute const& edit) -> Expected<void>;

    auto topElement(std::string_view instruction) -> Expected<Dom::Element*>;
    auto takeTop(std::size_t count) -> std::vector<Dom::NodePtr>;
    auto separateText(Dom::Node& node) -> void;
    auto checkInsertable(std::vector<Dom::NodePtr> const& nodes, Dom::Node const& parent, std::string_view instruction) const
        -> Expected<void>;
    auto forget(Dom::Node const& node) -> void;

    std::shared_ptr<Dom::Document> doc;
    Events::EventDelegation&       delegation;
    EditInterpreterOptions         options;
    NodeRegistry                   nodes;
    BuilderStack                   builder;
};

} // namespace TP::Edit
