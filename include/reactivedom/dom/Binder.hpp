#pragma once

#include <reactivedom/core/Error.hpp>
#include <reactivedom/dom/Node.hpp>
#include <reactivedom/dom/Region.hpp>
#include <reactivedom/reactive/Cell.hpp>
#include <reactivedom/reactive/Lifecycle.hpp>
#include <reactivedom/reactive/ValueText.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace RD::Dom {

namespace detail {

// Attribute semantics: false and empty optionals remove, true sets "", everything else its text form.
template <typename T>
auto applyAttribute(Element& element, std::string const& name, T const& value) -> void {
    if constexpr (std::is_same_v<T, bool>) {
        if (value)
            element.setAttribute(name, std::string{});
        else
            element.removeAttribute(name);
    } else if constexpr (RD::detail::IsOptional<T>::value) {
        if (value)
            applyAttribute(element, name, *value);
        else
            element.removeAttribute(name);
    } else {
        if (auto text = toDisplayString(value))
            element.setAttribute(name, std::move(*text));
        else
            element.removeAttribute(name);
    }
}

template <typename T>
auto styleValueText(T const& value) -> std::string {
    if constexpr (RD::detail::IsOptional<T>::value) {
        return value ? styleValueText(*value) : std::string{};
    } else {
        return toDisplayString(value).value_or(std::string{});
    }
}

auto classTokensOf(std::string const& value) -> std::vector<std::string>;
auto classTokensOf(std::vector<std::string> const& value) -> std::vector<std::string>;

// Adds tokens of next missing from previous and removes tokens of previous missing from next.
auto applyClassDiff(Element& element, std::vector<std::string> const& previous, std::vector<std::string> const& next) -> void;
// Removes properties of previous absent from next, then sets every property of next.
auto applyStyleDiff(Element& element, StyleMap const& previous, StyleMap const& next) -> void;

using ChildContent = std::vector<Node::Ptr>;

auto contentOf(Node::Ptr const& node) -> ChildContent;
auto contentOf(std::vector<Node::Ptr> const& nodes) -> ChildContent;
template <typename T>
    requires std::is_base_of_v<Node, T>
auto contentOf(std::shared_ptr<T> const& node) -> ChildContent {
    return contentOf(Node::Ptr(node));
}

// Writes value into region, reusing a lone text node when the value is text.
auto renderText(ChildRegion& region, std::string const& text) -> Expected<void>;
auto renderNodes(ChildRegion& region, ChildContent const& nodes) -> Expected<void>;

template <typename T>
auto renderChild(ChildRegion& region, T const& value) -> Expected<void> {
    if constexpr (requires { contentOf(value); })
        return renderNodes(region, contentOf(value));
    else
        return renderText(region, toDisplayString(value).value_or(std::string{}));
}

auto reportRenderFailure(Error const& error) -> void;

// Subscribes with a weak node reference so a binding never keeps its node alive.
template <typename N, typename T, typename Apply>
auto bindNode(std::shared_ptr<N> const& node, Cell<T> const& cell, Apply apply) -> Cleanup {
    std::weak_ptr<N> weakNode = node;
    apply(*node, cell.peek());
    auto subscription = cell.subscribe([weakNode, apply](T const& value) mutable {
        if (auto target = weakNode.lock())
            apply(*target, value);
    });
    registerWithCurrentScope(subscription);
    return subscription;
}

} // namespace detail

// Text content follows the cell through toDisplayString.
template <typename T>
auto bindText(Text::Ptr const& text, Cell<T> const& cell) -> Cleanup {
    return detail::bindNode(text, cell, [](Text& node, T const& value) {
        node.setData(toDisplayString(value).value_or(std::string{}));
    });
}

template <typename T, typename Formatter>
auto bindText(Text::Ptr const& text, Cell<T> const& cell, Formatter format) -> Cleanup {
    return detail::bindNode(text, cell, [format = std::move(format)](Text& node, T const& value) {
        node.setData(std::string{std::invoke(format, value)});
    });
}

template <typename T>
auto bindAttribute(Element::Ptr const& element, std::string name, Cell<T> const& cell) -> Cleanup {
    return detail::bindNode(element, cell, [name = std::move(name)](Element& node, T const& value) {
        detail::applyAttribute(node, name, value);
    });
}

/**
 * bindClass — reactive class tokens
 *
 * Only tokens contributed by the cell are managed: a token present on the
 * element that the previous value did not contain is never removed.
 */
template <typename T>
auto bindClass(Element::Ptr const& element, Cell<T> const& cell) -> Cleanup {
    auto previous = std::make_shared<std::vector<std::string>>();
    return detail::bindNode(element, cell, [previous](Element& node, T const& value) {
        auto next = detail::classTokensOf(value);
        detail::applyClassDiff(node, *previous, next);
        *previous = std::move(next);
    });
}

// Whole-map style binding.
inline auto bindStyle(Element::Ptr const& element, Cell<StyleMap> const& cell) -> Cleanup {
    auto previous = std::make_shared<StyleMap>();
    return detail::bindNode(element, cell, [previous](Element& node, StyleMap const& value) {
        detail::applyStyleDiff(node, *previous, value);
        *previous = value;
    });
}

// Css-text style binding; replaces the whole style attribute.
inline auto bindStyle(Element::Ptr const& element, Cell<std::string> const& cell) -> Cleanup {
    return detail::bindNode(element, cell, [](Element& node, std::string const& css) { node.setCssText(css); });
}

// One property; an empty value removes it.
template <typename T>
auto bindStyleProperty(Element::Ptr const& element, std::string property, Cell<T> const& cell) -> Cleanup {
    return detail::bindNode(element, cell, [property = std::move(property)](Element& node, T const& value) {
        node.setStyleProperty(property, detail::styleValueText(value));
    });
}

struct StyleEntry {
    std::string                                 property;
    std::variant<std::string, Cell<std::string>> value;
};

// Mixed static and reactive properties; each reactive entry gets its own subscription.
auto bindStyle(Element::Ptr const& element, std::vector<StyleEntry> const& entries) -> Cleanup;

/**
 * bindChild — reactive child region
 *
 * Appends a marker region to parent and renders the cell into it: a node
 * or a vector of nodes is placed as is, anything else becomes a text node.
 * Nodes that leave the region have their scopes disposed. The Cleanup
 * stops updates; the last rendered content stays in place.
 */
template <typename T>
auto bindChild(Node::Ptr const& parent, Cell<T> const& cell) -> Expected<Cleanup> {
    auto created = ChildRegion::create(*parent, "child");
    if (!created)
        return std::unexpected(created.error());
    auto region = std::make_shared<ChildRegion>(std::move(*created));
    if (auto rendered = detail::renderChild(*region, cell.peek()); !rendered)
        return std::unexpected(rendered.error());
    auto subscription = cell.subscribe([region](T const& value) {
        if (auto rendered = detail::renderChild(*region, value); !rendered)
            detail::reportRenderFailure(rendered.error());
    });
    registerWithCurrentScope(subscription);
    return subscription;
}

} // namespace RD::Dom
