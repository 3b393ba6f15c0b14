#include <treepatch/edit/BuilderStack.hpp>

#include <string>

namespace TP::Edit {

auto BuilderStack::pop() -> Expected<Dom::NodePtr> {
    if (this->list.empty()) {
        return std::unexpected(Error{Error::Code::StackUnderflow, "pop from an empty builder stack"});
    }
    auto node = std::move(this->list.back());
    this->list.pop_back();
    return node;
}

auto BuilderStack::top() const -> Expected<Dom::NodePtr> {
    if (this->list.empty()) {
        return std::unexpected(Error{Error::Code::StackUnderflow, "top of an empty builder stack; push a root first"});
    }
    return this->list.back();
}

auto BuilderStack::at(std::size_t index) const -> Expected<Dom::NodePtr> {
    if (index >= this->list.size()) {
        return std::unexpected(Error{Error::Code::StackUnderflow,
                                     "stack index " + std::to_string(index) + " beyond depth " + std::to_string(this->list.size())});
    }
    return this->list[index];
}

} // namespace TP::Edit
