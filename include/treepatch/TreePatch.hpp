#pragma once

#include <treepatch/DomPatcher.hpp>
#include <treepatch/component/RenderCell.hpp>
#include <treepatch/component/VNode.hpp>
#include <treepatch/core/Error.hpp>
#include <treepatch/core/Ids.hpp>
#include <treepatch/dom/Event.hpp>
#include <treepatch/dom/Node.hpp>
#include <treepatch/edit/BuilderStack.hpp>
#include <treepatch/edit/DomEdit.hpp>
#include <treepatch/edit/EditInterpreter.hpp>
#include <treepatch/edit/EditSerialization.hpp>
#include <treepatch/edit/NodeRegistry.hpp>
#include <treepatch/events/EventDelegation.hpp>
#include <treepatch/events/Trigger.hpp>
#include <treepatch/events/TriggerChannel.hpp>
