#include <treepatch/component/RenderCell.hpp>

#include "log/TaggedLogger.hpp"

namespace TP::Component::Detail {

auto renderFailure(std::string_view component, std::string_view what) -> Error {
    auto message = "error while rendering component `" + std::string(component) + "`: " + std::string(what);
    tp_log(message, "RenderCell", "ERROR");
    return Error{Error::Code::ComponentRenderFailure, std::move(message)};
}

} // namespace TP::Component::Detail
