#include <treepatch/DomPatcher.hpp>

#include "log/TaggedLogger.hpp"

#include <utility>

namespace TP {

DomPatcher::DomPatcher(std::shared_ptr<Dom::Document> document,
                       std::shared_ptr<Dom::Element>  root,
                       DomPatcherOptions              options)
    : doc(std::move(document)),
      rootElement(std::move(root)),
      triggers(std::make_shared<Events::TriggerChannel>()) {
    Events::EventDelegationOptions delegationOptions;
    delegationOptions.attributePrefix = std::move(options.eventAttributePrefix);
    this->events = std::make_unique<Events::EventDelegation>(this->rootElement, this->triggers, std::move(delegationOptions));

    Edit::EditInterpreterOptions editOptions;
    editOptions.placeholderTag   = std::move(options.placeholderTag);
    editOptions.stackCapacity    = options.stackCapacity;
    editOptions.registryCapacity = options.registryCapacity;
    this->edits = std::make_unique<Edit::EditInterpreter>(this->doc, *this->events, std::move(editOptions));

    this->edits->registry().registerNode(options.rootId, this->rootElement);
    tp_log("DomPatcher mounted <" + this->rootElement->tagName() + "> as node " + std::to_string(options.rootId.value),
           "DomPatcher", "INFO");
}

DomPatcher::~DomPatcher() {
    this->shutdown();
}

auto DomPatcher::processEdits(std::vector<Edit::DomEdit>& edits) -> Expected<Edit::ApplyStats> {
    auto pending = std::move(edits);
    edits.clear();
    return this->processEdits(std::span<Edit::DomEdit const>(pending));
}

auto DomPatcher::processEdits(std::span<Edit::DomEdit const> edits) -> Expected<Edit::ApplyStats> {
    return this->edits->apply(edits);
}

auto DomPatcher::waitForEvent() -> std::optional<Events::EventTrigger> {
    return this->triggers->receive();
}

auto DomPatcher::pollEvent() -> std::optional<Events::EventTrigger> {
    return this->triggers->tryReceive();
}

auto DomPatcher::shutdown() -> void {
    if (this->isShutdown) {
        return;
    }
    this->isShutdown = true;
    this->events->detach();
    this->triggers->close();
    tp_log("DomPatcher shut down", "DomPatcher", "INFO");
}

} // namespace TP
