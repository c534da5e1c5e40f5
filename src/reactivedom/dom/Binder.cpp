#include <reactivedom/dom/Binder.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace RD::Dom {

namespace detail {

auto classTokensOf(std::string const& value) -> std::vector<std::string> {
    return splitClassTokens(value);
}

auto classTokensOf(std::vector<std::string> const& value) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    for (auto const& entry : value) {
        for (auto& token : splitClassTokens(entry)) {
            if (std::find(tokens.begin(), tokens.end(), token) == tokens.end())
                tokens.push_back(std::move(token));
        }
    }
    return tokens;
}

auto applyClassDiff(Element& element, std::vector<std::string> const& previous, std::vector<std::string> const& next) -> void {
    for (auto const& token : previous) {
        if (std::find(next.begin(), next.end(), token) == next.end())
            element.removeClass(token);
    }
    for (auto const& token : next) {
        if (std::find(previous.begin(), previous.end(), token) == previous.end())
            element.addClass(token);
    }
}

auto applyStyleDiff(Element& element, StyleMap const& previous, StyleMap const& next) -> void {
    for (auto const& [property, value] : previous) {
        auto kept = std::any_of(next.begin(), next.end(), [&](auto const& entry) { return entry.first == property; });
        if (!kept)
            element.removeStyleProperty(property);
    }
    for (auto const& [property, value] : next)
        element.setStyleProperty(property, value);
}

auto contentOf(Node::Ptr const& node) -> ChildContent {
    if (!node)
        return {};
    return {node};
}

auto contentOf(std::vector<Node::Ptr> const& nodes) -> ChildContent {
    ChildContent content;
    for (auto const& node : nodes) {
        if (node)
            content.push_back(node);
    }
    return content;
}

auto renderText(ChildRegion& region, std::string const& text) -> Expected<void> {
    auto current = region.nodes();
    if (current.size() == 1 && current.front()->type() == NodeType::Text) {
        std::static_pointer_cast<Text>(current.front())->setData(text);
        return {};
    }
    return region.replace({Text::create(text)});
}

auto renderNodes(ChildRegion& region, ChildContent const& nodes) -> Expected<void> {
    return region.replace(nodes);
}

auto reportRenderFailure(Error const& error) -> void {
    rd_log_fault("child region update failed: " + describeError(error), "RenderFault");
}

} // namespace detail

auto bindStyle(Element::Ptr const& element, std::vector<StyleEntry> const& entries) -> Cleanup {
    std::vector<Cleanup> bindings;
    for (auto const& entry : entries) {
        if (auto const* text = std::get_if<std::string>(&entry.value)) {
            element->setStyleProperty(entry.property, *text);
            continue;
        }
        bindings.push_back(bindStyleProperty(element, entry.property, std::get<Cell<std::string>>(entry.value)));
    }
    return Cleanup::combine(std::move(bindings));
}

} // namespace RD::Dom
