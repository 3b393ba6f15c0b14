#pragma once

#include <treepatch/component/VNode.hpp>
#include <treepatch/core/Error.hpp>

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace TP::Component {

class IRenderCell;
using BoxedRenderCell = std::unique_ptr<IRenderCell>;

/**
 * Borrowed, type-tagged view of a props value.
 *
 * Access goes through the stored std::type_info; asking for any other type
 * yields PropsTypeMismatch instead of a reinterpretation.
 */
struct PropsView {
    void const*           ptr  = nullptr;
    std::type_info const* type = nullptr;

    template <typename P>
    static auto of(P const& props) -> PropsView {
        return PropsView{&props, &typeid(P)};
    }

    template <typename P>
    [[nodiscard]] auto is() const -> bool {
        return this->type != nullptr && *this->type == typeid(P);
    }

    template <typename P>
    [[nodiscard]] auto as() const -> Expected<P const*> {
        if (!this->is<P>()) {
            return std::unexpected(Error{Error::Code::PropsTypeMismatch,
                                         std::string("props are not of type ") + typeid(P).name()});
        }
        return static_cast<P const*>(this->ptr);
    }
};

/**
 * Type-erased component invocation: a render function bound to its current
 * props, so heterogeneous components can live in one collection.
 */
class IRenderCell {
public:
    virtual ~IRenderCell() = default;

    // Never throws; a failing render function produces an empty RenderReturn.
    [[nodiscard]] virtual auto render() const -> RenderReturn = 0;
    // False whenever candidate holds a different props type.
    [[nodiscard]] virtual auto memoize(PropsView candidate) const -> bool = 0;
    [[nodiscard]] virtual auto props() const -> PropsView = 0;
    [[nodiscard]] virtual auto propsType() const -> std::type_info const& = 0;
    [[nodiscard]] virtual auto duplicate() const -> BoxedRenderCell = 0;
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    // Failure recorded by the most recent render(), if it failed.
    [[nodiscard]] virtual auto lastFailure() const -> std::optional<Error> const& = 0;
};

namespace Detail {
auto renderFailure(std::string_view component, std::string_view what) -> Error;
}

template <typename P>
using Component = std::function<std::optional<VNode>(P)>;

template <typename P>
using MemoFn = bool (*)(P const&, P const&);

template <typename P>
class RenderCell final : public IRenderCell {
public:
    RenderCell(Component<P> renderFn, MemoFn<P> memo, P props, std::string name)
        : renderFn(std::move(renderFn)), memo(memo), value(std::move(props)), displayName(std::move(name)) {}

    [[nodiscard]] auto render() const -> RenderReturn override {
        this->failure.reset();
        try {
            // The render function receives its own copy of the props.
            auto tree = this->renderFn(this->value);
            return RenderReturn{std::move(tree)};
        } catch (std::exception const& e) {
            this->failure = Detail::renderFailure(this->displayName, e.what());
        } catch (...) {
            this->failure = Detail::renderFailure(this->displayName, "unknown exception");
        }
        return RenderReturn{};
    }

    [[nodiscard]] auto memoize(PropsView candidate) const -> bool override {
        auto other = candidate.as<P>();
        if (!other || this->memo == nullptr) {
            return false;
        }
        return this->memo(this->value, **other);
    }

    [[nodiscard]] auto props() const -> PropsView override { return PropsView::of(this->value); }
    [[nodiscard]] auto propsType() const -> std::type_info const& override { return typeid(P); }

    [[nodiscard]] auto duplicate() const -> BoxedRenderCell override {
        return std::make_unique<RenderCell<P>>(this->renderFn, this->memo, this->value, this->displayName);
    }

    [[nodiscard]] auto name() const -> std::string_view override { return this->displayName; }
    [[nodiscard]] auto lastFailure() const -> std::optional<Error> const& override { return this->failure; }

    // Props replacement is the owner's call, made after consulting memoize().
    auto setProps(P props) -> void { this->value = std::move(props); }

private:
    Component<P>                 renderFn;
    MemoFn<P>                    memo;
    P                            value;
    std::string                  displayName;
    mutable std::optional<Error> failure;
};

// P is deduced from props alone so lambdas convert to the callable types.
template <typename P>
auto makeRenderCell(std::type_identity_t<Component<P>> renderFn,
                    std::type_identity_t<MemoFn<P>>    memo,
                    P                                  props,
                    std::string                        name) -> BoxedRenderCell {
    return std::make_unique<RenderCell<P>>(std::move(renderFn), memo, std::move(props), std::move(name));
}

} // namespace TP::Component
