#include <reactivedom/dom/Region.hpp>

#include <algorithm>
#include <string>

namespace RD::Dom {

auto ChildRegion::create(Node& parent, std::string_view label) -> Expected<ChildRegion> {
    return createBefore(parent, nullptr, label);
}

auto ChildRegion::createBefore(Node& parent, Node const* reference, std::string_view label) -> Expected<ChildRegion> {
    auto start = Comment::create(std::string{label});
    auto end   = Comment::create("/" + std::string{label});
    if (auto inserted = parent.insertBefore(start, reference); !inserted)
        return std::unexpected(inserted.error());
    if (auto inserted = parent.insertBefore(end, reference); !inserted) {
        start->remove();
        return std::unexpected(inserted.error());
    }
    return ChildRegion(std::move(start), std::move(end));
}

auto ChildRegion::requireParent() const -> Expected<Node*> {
    auto* owner = this->parent();
    if (!owner || end_->parent() != owner)
        return std::unexpected(Error{Error::Code::NotFound, "region markers are detached"});
    return owner;
}

auto ChildRegion::nodes() const -> std::vector<Node::Ptr> {
    std::vector<Node::Ptr> out;
    if (!this->valid() || !this->parent())
        return out;
    for (auto node = start_->nextSibling(); node && node != end_; node = node->nextSibling())
        out.push_back(node);
    return out;
}

auto ChildRegion::size() const -> std::size_t {
    return this->nodes().size();
}

auto ChildRegion::empty() const -> bool {
    return !this->valid() || start_->nextSibling() == end_;
}

auto ChildRegion::insert(Node::Ptr node, Node const* anchor) -> Expected<void> {
    auto owner = this->requireParent();
    if (!owner)
        return std::unexpected(owner.error());
    return (*owner)->insertBefore(std::move(node), anchor ? anchor : end_.get());
}

auto ChildRegion::discard(Node const& node) -> Expected<void> {
    auto owner = this->requireParent();
    if (!owner)
        return std::unexpected(owner.error());
    auto removed = (*owner)->removeChild(&node);
    if (!removed)
        return std::unexpected(removed.error());
    (*removed)->disposeScopes();
    return {};
}

auto ChildRegion::replace(std::vector<Node::Ptr> const& next) -> Expected<void> {
    auto owner = this->requireParent();
    if (!owner)
        return std::unexpected(owner.error());
    for (auto const& node : this->nodes()) {
        if (std::find(next.begin(), next.end(), node) != next.end())
            continue;
        if (auto discarded = this->discard(*node); !discarded)
            return discarded;
    }
    for (auto const& node : next) {
        if (!node)
            continue;
        if (auto inserted = (*owner)->insertBefore(node, end_.get()); !inserted)
            return inserted;
    }
    return {};
}

auto ChildRegion::clear() -> std::size_t {
    std::size_t removed = 0;
    for (auto const& node : this->nodes()) {
        node->remove();
        node->disposeScopes();
        ++removed;
    }
    return removed;
}

auto ChildRegion::release() -> void {
    this->clear();
    if (start_)
        start_->remove();
    if (end_)
        end_->remove();
}

} // namespace RD::Dom
