#pragma once

#include <treepatch/core/Error.hpp>
#include <treepatch/dom/Node.hpp>

#include <cstddef>
#include <vector>

namespace TP::Edit {

// Scratch stack of native handles; the only way an instruction refers to
// "the node(s) just produced".
class BuilderStack {
public:
    BuilderStack() = default;
    explicit BuilderStack(std::size_t capacity) { this->list.reserve(capacity); }

    auto push(Dom::NodePtr node) -> void { this->list.push_back(std::move(node)); }
    auto pop() -> Expected<Dom::NodePtr>;
    [[nodiscard]] auto top() const -> Expected<Dom::NodePtr>;
    // Index counted from the bottom of the stack.
    [[nodiscard]] auto at(std::size_t index) const -> Expected<Dom::NodePtr>;

    [[nodiscard]] auto size() const -> std::size_t { return this->list.size(); }
    [[nodiscard]] auto empty() const -> bool { return this->list.empty(); }
    auto clear() -> void { this->list.clear(); }

    [[nodiscard]] auto nodes() const -> std::vector<Dom::NodePtr> const& { return this->list; }

private:
    std::vector<Dom::NodePtr> list;
};

} // namespace TP::Edit
