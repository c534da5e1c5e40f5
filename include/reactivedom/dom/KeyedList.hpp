#pragma once

#include <reactivedom/core/Error.hpp>
#include <reactivedom/dom/Node.hpp>
#include <reactivedom/dom/Region.hpp>
#include <reactivedom/reactive/Cell.hpp>
#include <reactivedom/reactive/Lifecycle.hpp>
#include <reactivedom/reactive/ValueText.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace RD::Dom {

template <typename Key>
using KeyedNodeMap = phmap::flat_hash_map<Key, Node::Ptr>;

struct ReconcileStats {
    std::size_t created = 0;
    std::size_t removed = 0;
    std::size_t moved   = 0;
    std::size_t reused  = 0;
};

namespace detail {

auto reportListFailure(Error const& error) -> void;

template <typename Key>
auto keyText(Key const& key) -> std::string {
    return toDisplayString(key).value_or(std::string{"<key>"});
}

} // namespace detail

/**
 * reconcile — keyed patch of a marker region
 *
 * Brings the nodes between the region markers in line with items while
 * keeping the node of every surviving key. nodes maps key to node and is
 * updated in place.
 *
 * Algorithm
 * ---------
 * 1. Compute the keys; a duplicate fails with DuplicateKey before any
 *    mutation.
 * 2. Detach the nodes whose key disappeared and dispose their scopes.
 * 3. Walk the keys from the back with an anchor starting at the end
 *    marker; reuse or create the node, insert it before the anchor unless
 *    it already sits there, then make it the anchor.
 *
 * create must return a single non-fragment node; anything else fails with
 * InvalidNode, leaving the nodes placed so far in the region.
 */
template <typename T, typename Key, typename KeyOf, typename Create>
auto reconcile(ChildRegion& region, KeyedNodeMap<Key>& nodes, std::vector<T> const& items, KeyOf&& keyOf, Create&& create)
    -> Expected<ReconcileStats> {
    auto* owner = region.parent();
    if (!owner || region.end()->parent() != owner)
        return std::unexpected(Error{Error::Code::NotFound, "region markers are detached"});

    std::vector<Key>          keys;
    phmap::flat_hash_set<Key> seen;
    keys.reserve(items.size());
    for (auto const& item : items) {
        Key key = std::invoke(keyOf, item);
        if (!seen.insert(key).second)
            return std::unexpected(Error{Error::Code::DuplicateKey, "duplicate list key " + detail::keyText(key)});
        keys.push_back(std::move(key));
    }

    ReconcileStats stats;

    std::vector<Key> stale;
    for (auto const& [key, node] : nodes) {
        if (!seen.contains(key))
            stale.push_back(key);
    }
    for (auto const& key : stale) {
        auto it   = nodes.find(key);
        auto node = std::move(it->second);
        nodes.erase(it);
        node->remove();
        node->disposeScopes();
        ++stats.removed;
    }

    Node::Ptr anchor = region.end();
    for (std::size_t i = keys.size(); i-- > 0;) {
        Node::Ptr node;
        if (auto it = nodes.find(keys[i]); it != nodes.end()) {
            node = it->second;
            ++stats.reused;
        } else {
            node = std::invoke(create, items[i]);
            if (!node || node->type() == NodeType::Fragment)
                return std::unexpected(Error{Error::Code::InvalidNode,
                                             "list item " + detail::keyText(keys[i]) + " must render a single node"});
            nodes.emplace(keys[i], node);
            ++stats.created;
        }
        bool const inPlace = node->parent() == owner && node->nextSibling() == anchor;
        if (!inPlace) {
            bool const wasPlaced = node->parent() == owner;
            if (auto inserted = owner->insertBefore(node, anchor.get()); !inserted)
                return std::unexpected(inserted.error());
            if (wasPlaced)
                ++stats.moved;
        }
        anchor = node;
    }
    return stats;
}

/**
 * ListBinding — handle returned by bindList
 *
 * dispose() stops following the cell and leaves the rendered items;
 * release() also removes the items and disposes their scopes.
 */
class ListBinding {
public:
    ListBinding(std::shared_ptr<ChildRegion> region, Cleanup subscription, std::shared_ptr<ReconcileStats> stats,
                std::function<void()> clearItems)
        : region_(std::move(region))
        , subscription_(std::move(subscription))
        , stats_(std::move(stats))
        , clearItems_(std::move(clearItems)) {}

    [[nodiscard]] auto region() const noexcept -> ChildRegion const& { return *region_; }
    [[nodiscard]] auto nodes() const -> std::vector<Node::Ptr> { return region_->nodes(); }
    [[nodiscard]] auto size() const -> std::size_t { return region_->size(); }
    // Stats of the most recent reconcile.
    [[nodiscard]] auto lastStats() const noexcept -> ReconcileStats const& { return *stats_; }

    auto dispose() const -> void { subscription_(); }
    auto release() const -> void {
        subscription_();
        clearItems_();
    }

private:
    std::shared_ptr<ChildRegion>    region_;
    Cleanup                         subscription_;
    std::shared_ptr<ReconcileStats> stats_;
    std::function<void()>           clearItems_;
};

/**
 * bindList — keyed list region following a cell
 *
 * Each item is rendered inside its own LifecycleScope, attached to the
 * item's node, so removing the item tears down every binding the render
 * created. Items created by later updates are mounted immediately. An
 * update carrying duplicate keys is logged and leaves the region as it was.
 */
template <typename T, typename KeyOf, typename Render>
auto bindList(Node::Ptr const& parent, Cell<std::vector<T>> const& items, KeyOf keyOf, Render render)
    -> Expected<ListBinding> {
    using Key = std::decay_t<std::invoke_result_t<KeyOf&, T const&>>;

    struct State {
        std::shared_ptr<ChildRegion>    region;
        KeyedNodeMap<Key>               nodes;
        KeyOf                           keyOf;
        Render                          render;
        std::shared_ptr<ReconcileStats> stats = std::make_shared<ReconcileStats>();

        auto update(std::vector<T> const& values, bool mountCreated) -> Expected<void> {
            std::vector<Node::Ptr> created;
            auto make = [&](T const& item) -> Node::Ptr {
                auto      scope = std::make_shared<LifecycleScope>();
                Node::Ptr node;
                {
                    ScopeActivation activation(*scope);
                    node = std::invoke(render, item);
                }
                if (node) {
                    node->attachScope(scope);
                    created.push_back(node);
                }
                return node;
            };
            auto result = reconcile(*region, nodes, values, keyOf, make);
            if (!result)
                return std::unexpected(result.error());
            *stats = *result;
            if (mountCreated) {
                for (auto const& node : created)
                    node->mountScopes();
            }
            return {};
        }
    };

    auto created = ChildRegion::create(*parent, "list");
    if (!created)
        return std::unexpected(created.error());

    auto state = std::make_shared<State>(
        State{std::make_shared<ChildRegion>(std::move(*created)), {}, std::move(keyOf), std::move(render)});
    if (auto initial = state->update(items.peek(), false); !initial) {
        state->region->release();
        return std::unexpected(initial.error());
    }

    auto subscription = items.subscribe([state](std::vector<T> const& values) {
        if (auto updated = state->update(values, true); !updated)
            detail::reportListFailure(updated.error());
    });
    registerWithCurrentScope(subscription);

    return ListBinding(state->region, subscription, state->stats, [state]() {
        state->nodes.clear();
        state->region->clear();
    });
}

} // namespace RD::Dom
