#pragma once

#include <reactivedom/core/Error.hpp>
#include <reactivedom/dom/Node.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace RD::Dom {

/**
 * ChildRegion — marker-bounded run of children inside a parent
 *
 * Two comment nodes delimit the content a reactive child binding or a keyed
 * list owns; siblings outside the markers are never touched. The markers
 * stay in place for the lifetime of the region. Nodes removed through the
 * region have their lifecycle scopes disposed.
 */
class ChildRegion {
public:
    ChildRegion() = default;

    // Appends the two markers to parent.
    static auto create(Node& parent, std::string_view label = "region") -> Expected<ChildRegion>;
    // Inserts the two markers before reference (nullptr appends).
    static auto createBefore(Node& parent, Node const* reference, std::string_view label = "region") -> Expected<ChildRegion>;

    [[nodiscard]] auto valid() const noexcept -> bool { return start_ && end_; }
    [[nodiscard]] auto start() const noexcept -> Comment::Ptr const& { return start_; }
    [[nodiscard]] auto end() const noexcept -> Comment::Ptr const& { return end_; }
    [[nodiscard]] auto parent() const noexcept -> Node* { return start_ ? start_->parent() : nullptr; }

    // Nodes currently between the markers, in order.
    [[nodiscard]] auto nodes() const -> std::vector<Node::Ptr>;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto empty() const -> bool;

    // Insert before anchor (a node of the region or the end marker; nullptr means the end marker).
    auto insert(Node::Ptr node, Node const* anchor = nullptr) -> Expected<void>;
    // Detach node from the region and dispose its scopes.
    auto discard(Node const& node) -> Expected<void>;
    // Replace the content; nodes kept across the replacement are moved, not disposed.
    auto replace(std::vector<Node::Ptr> const& next) -> Expected<void>;
    // Remove every node between the markers; returns how many were removed.
    auto clear() -> std::size_t;
    // Remove the content and both markers.
    auto release() -> void;

private:
    ChildRegion(Comment::Ptr start, Comment::Ptr end)
        : start_(std::move(start))
        , end_(std::move(end)) {}

    auto requireParent() const -> Expected<Node*>;

    Comment::Ptr start_;
    Comment::Ptr end_;
};

} // namespace RD::Dom
