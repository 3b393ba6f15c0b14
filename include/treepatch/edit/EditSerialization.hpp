#pragma once

#include <treepatch/core/Error.hpp>
#include <treepatch/edit/DomEdit.hpp>
#include <treepatch/events/Trigger.hpp>

#include <nlohmann/json_fwd.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace TP::Edit {

/**
 * JSON wire format for edit streams: an array of objects tagged by "type",
 * e.g. {"type":"CreateElement","tag":"div","id":1}. Ids travel as unsigned
 * 64-bit numbers; optional namespaces are omitted when absent.
 */
[[nodiscard]] auto encodeEdits(std::span<DomEdit const> edits) -> nlohmann::json;
[[nodiscard]] auto encodeEditsToString(std::span<DomEdit const> edits) -> std::string;

// Fails with MalformedInput naming the entry index and field.
[[nodiscard]] auto decodeEdits(nlohmann::json const& document) -> Expected<std::vector<DomEdit>>;
[[nodiscard]] auto decodeEditsFromString(std::string_view text) -> Expected<std::vector<DomEdit>>;

// Scheduler-side rendering of a trigger, used for logs and replay captures.
[[nodiscard]] auto encodeTrigger(Events::EventTrigger const& trigger) -> nlohmann::json;

} // namespace TP::Edit
