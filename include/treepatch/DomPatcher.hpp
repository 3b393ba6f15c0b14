#pragma once

#include <treepatch/core/Error.hpp>
#include <treepatch/core/Ids.hpp>
#include <treepatch/dom/Node.hpp>
#include <treepatch/edit/DomEdit.hpp>
#include <treepatch/edit/EditInterpreter.hpp>
#include <treepatch/events/EventDelegation.hpp>
#include <treepatch/events/Trigger.hpp>
#include <treepatch/events/TriggerChannel.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace TP {

struct DomPatcherOptions {
    // Id the diff engine uses for the mount root.
    NodeId      rootId;
    std::string eventAttributePrefix = std::string{Events::kDefaultAttributePrefix};
    std::string placeholderTag       = "pre";
    std::size_t stackCapacity        = 10;
    std::size_t registryCapacity     = 1000;
};

/**
 * One patcher per mounted root: applies edit streams to the document and
 * hands delegated events to the scheduler.
 *
 * Everything except the trigger channel belongs to the document thread.
 * waitForEvent() may be called from a consumer thread.
 */
class DomPatcher {
public:
    DomPatcher(std::shared_ptr<Dom::Document> document,
               std::shared_ptr<Dom::Element>  root,
               DomPatcherOptions              options = {});
    ~DomPatcher();

    DomPatcher(DomPatcher const&)            = delete;
    DomPatcher& operator=(DomPatcher const&) = delete;

    // Applies and drains `edits`; the vector is empty afterwards even on failure.
    auto processEdits(std::vector<Edit::DomEdit>& edits) -> Expected<Edit::ApplyStats>;
    auto processEdits(std::span<Edit::DomEdit const> edits) -> Expected<Edit::ApplyStats>;

    // Blocks until a trigger arrives; empty once shut down and drained.
    [[nodiscard]] auto waitForEvent() -> std::optional<Events::EventTrigger>;
    [[nodiscard]] auto pollEvent() -> std::optional<Events::EventTrigger>;

    auto shutdown() -> void;

    [[nodiscard]] auto root() const -> std::shared_ptr<Dom::Element> const& { return this->rootElement; }
    [[nodiscard]] auto document() const -> std::shared_ptr<Dom::Document> const& { return this->doc; }
    [[nodiscard]] auto interpreter() -> Edit::EditInterpreter& { return *this->edits; }
    [[nodiscard]] auto delegation() -> Events::EventDelegation& { return *this->events; }
    [[nodiscard]] auto channel() const -> std::shared_ptr<Events::TriggerChannel> const& { return this->triggers; }

private:
    std::shared_ptr<Dom::Document>           doc;
    std::shared_ptr<Dom::Element>            rootElement;
    std::shared_ptr<Events::TriggerChannel>  triggers;
    std::unique_ptr<Events::EventDelegation> events;
    std::unique_ptr<Edit::EditInterpreter>   edits;
    bool                                     isShutdown = false;
};

} // namespace TP
