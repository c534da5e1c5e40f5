#pragma once

#include <reactivedom/core/Error.hpp>
#include <reactivedom/dom/Node.hpp>
#include <reactivedom/reactive/Lifecycle.hpp>

#include <functional>
#include <memory>
#include <type_traits>

namespace RD::Dom {

/**
 * component — run build inside a fresh LifecycleScope
 *
 * Every binding, watch and onMount registered while build runs lands in the
 * scope, which is attached to the returned node (to each child when build
 * returns a Fragment). If build throws, the scope is disposed before the
 * exception leaves.
 */
template <typename Build>
auto component(Build&& build) -> std::invoke_result_t<Build&> {
    auto scope = std::make_shared<LifecycleScope>();
    std::invoke_result_t<Build&> node;
    {
        ScopeActivation activation(*scope);
        node = std::invoke(build);
    }
    if (!node)
        return node;
    if (node->type() == NodeType::Fragment) {
        for (auto const& child : node->children())
            child->attachScope(scope);
    } else {
        node->attachScope(scope);
    }
    return node;
}

// Append node to parent, then run the mount callbacks of every scope in the inserted subtree.
auto mount(Node& parent, Node::Ptr const& node) -> Expected<void>;

// Detach node and dispose every scope in its subtree.
auto unmount(Node::Ptr const& node) -> void;

} // namespace RD::Dom
