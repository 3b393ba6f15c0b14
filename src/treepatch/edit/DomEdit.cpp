#include <treepatch/edit/DomEdit.hpp>

#include <sstream>

namespace TP::Edit {
namespace {

struct KindVisitor {
    auto operator()(PushRoot const&) const -> std::string_view { return "PushRoot"; }
    auto operator()(PopRoot const&) const -> std::string_view { return "PopRoot"; }
    auto operator()(AppendChildren const&) const -> std::string_view { return "AppendChildren"; }
    auto operator()(ReplaceWith const&) const -> std::string_view { return "ReplaceWith"; }
    auto operator()(Remove const&) const -> std::string_view { return "Remove"; }
    auto operator()(RemoveAllChildren const&) const -> std::string_view { return "RemoveAllChildren"; }
    auto operator()(CreateTextNode const&) const -> std::string_view { return "CreateTextNode"; }
    auto operator()(CreateElement const& edit) const -> std::string_view {
        return edit.ns ? "CreateElementNs" : "CreateElement";
    }
    auto operator()(CreatePlaceholder const&) const -> std::string_view { return "CreatePlaceholder"; }
    auto operator()(NewEventListener const&) const -> std::string_view { return "NewEventListener"; }
    auto operator()(RemoveEventListener const&) const -> std::string_view { return "RemoveEventListener"; }
    auto operator()(SetText const&) const -> std::string_view { return "SetText"; }
    auto operator()(SetAttribute const&) const -> std::string_view { return "SetAttribute"; }
    auto operator()(RemoveAttribute const&) const -> std::string_view { return "RemoveAttribute"; }
};

struct DescribeVisitor {
    std::ostringstream& oss;

    void operator()(PushRoot const& edit) const { oss << " id=" << edit.id.value; }
    void operator()(PopRoot const&) const {}
    void operator()(AppendChildren const& edit) const { oss << " many=" << edit.many; }
    void operator()(ReplaceWith const& edit) const { oss << " many=" << edit.many; }
    void operator()(Remove const&) const {}
    void operator()(RemoveAllChildren const&) const {}
    void operator()(CreateTextNode const& edit) const {
        oss << " id=" << edit.id.value << " text=\"" << edit.text << '"';
    }
    void operator()(CreateElement const& edit) const {
        oss << " id=" << edit.id.value << " tag=" << edit.tag;
        if (edit.ns) {
            oss << " ns=" << *edit.ns;
        }
    }
    void operator()(CreatePlaceholder const& edit) const { oss << " id=" << edit.id.value; }
    void operator()(NewEventListener const& edit) const {
        oss << " event=" << edit.event_name << " scope=" << edit.scope.value << " node=" << edit.mounted_node_id.value;
    }
    void operator()(RemoveEventListener const& edit) const { oss << " event=" << edit.event_name; }
    void operator()(SetText const& edit) const { oss << " text=\"" << edit.text << '"'; }
    void operator()(SetAttribute const& edit) const {
        oss << ' ' << edit.field << "=\"" << edit.value << '"';
        if (edit.ns) {
            oss << " ns=" << *edit.ns;
        }
    }
    void operator()(RemoveAttribute const& edit) const { oss << " name=" << edit.name; }
};

} // namespace

auto editKind(DomEdit const& edit) -> std::string_view {
    return std::visit(KindVisitor{}, edit);
}

auto describeEdit(DomEdit const& edit) -> std::string {
    std::ostringstream oss;
    oss << editKind(edit);
    std::visit(DescribeVisitor{oss}, edit);
    return oss.str();
}

} // namespace TP::Edit
