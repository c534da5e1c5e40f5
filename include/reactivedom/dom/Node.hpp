#pragma once

#include <reactivedom/core/Error.hpp>

#include <cstddef>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace RD {
class LifecycleScope;
}

namespace RD::Dom {

enum class NodeType {
    Element,
    Text,
    Comment,
    Fragment
};

[[nodiscard]] auto nodeTypeToString(NodeType type) -> char const*;

/**
 * Node — retained tree node mutated by the binders and the reconciler
 *
 * Purpose
 * -------
 * Stand-in for the browser DOM: a parent owns its children, a child knows
 * its parent and its own position, so sibling lookup and re-insertion are
 * constant time.
 *
 * Notes
 * -----
 * - Mutations follow DOM rules: inserting a node that already has a parent
 *   moves it; inserting a Fragment moves the fragment's children and leaves
 *   it empty; inserting an ancestor into its descendant is a
 *   HierarchyRequest error; a reference node that is not a child is
 *   NotFound. Only Element and Fragment accept children.
 * - Lifecycle scopes attached to a node are owned by it; Dom::unmount and
 *   the reconciler dispose them when the node leaves the tree.
 */
class Node : public std::enable_shared_from_this<Node> {
public:
    using Ptr = std::shared_ptr<Node>;

    virtual ~Node();

    Node(Node const&)            = delete;
    Node& operator=(Node const&) = delete;

    [[nodiscard]] auto type() const noexcept -> NodeType { return type_; }
    [[nodiscard]] auto parent() const noexcept -> Node* { return parent_; }

    [[nodiscard]] auto firstChild() const -> Ptr;
    [[nodiscard]] auto lastChild() const -> Ptr;
    [[nodiscard]] auto nextSibling() const -> Ptr;
    [[nodiscard]] auto previousSibling() const -> Ptr;
    [[nodiscard]] auto children() const -> std::vector<Ptr>;
    [[nodiscard]] auto childCount() const noexcept -> std::size_t { return children_.size(); }
    [[nodiscard]] auto hasChildren() const noexcept -> bool { return !children_.empty(); }

    auto appendChild(Ptr node) -> Expected<void>;
    // reference == nullptr appends.
    auto insertBefore(Ptr node, Node const* reference) -> Expected<void>;
    auto removeChild(Node const* child) -> Expected<Ptr>;
    auto replaceChild(Ptr node, Node const* child) -> Expected<Ptr>;
    // Detach from the parent, if any.
    auto remove() -> void;

    // Inclusive: a node contains itself.
    [[nodiscard]] auto contains(Node const* other) const noexcept -> bool;

    [[nodiscard]] virtual auto textContent() const -> std::string;
    [[nodiscard]] virtual auto outerHtml() const -> std::string = 0;

    auto attachScope(std::shared_ptr<LifecycleScope> scope) -> void;
    [[nodiscard]] auto scopes() const noexcept -> std::vector<std::shared_ptr<LifecycleScope>> const& { return scopes_; }
    // Dispose and drop the scopes of this node and every descendant.
    auto disposeScopes() -> void;
    // Run pending mount callbacks of this node and every descendant.
    auto mountScopes() -> void;

protected:
    explicit Node(NodeType type)
        : type_(type) {}

    [[nodiscard]] virtual auto acceptsChildren() const noexcept -> bool { return false; }
    [[nodiscard]] auto childrenHtml() const -> std::string;

private:
    auto insertOne(Ptr node, std::list<Ptr>::iterator position) -> void;
    auto positionOf(Node const* reference) -> Expected<std::list<Ptr>::iterator>;

    NodeType                                     type_;
    Node*                                        parent_ = nullptr;
    std::list<Ptr>                               children_;
    std::list<Ptr>::iterator                     self_;
    std::vector<std::shared_ptr<LifecycleScope>> scopes_;
};

class Text final : public Node {
public:
    using Ptr = std::shared_ptr<Text>;

    static auto create(std::string data = {}) -> Ptr;

    [[nodiscard]] auto data() const noexcept -> std::string const& { return data_; }
    auto setData(std::string data) -> void { data_ = std::move(data); }

    [[nodiscard]] auto textContent() const -> std::string override { return data_; }
    [[nodiscard]] auto outerHtml() const -> std::string override;

    explicit Text(std::string data)
        : Node(NodeType::Text)
        , data_(std::move(data)) {}

private:
    std::string data_;
};

class Comment final : public Node {
public:
    using Ptr = std::shared_ptr<Comment>;

    static auto create(std::string data = {}) -> Ptr;

    [[nodiscard]] auto data() const noexcept -> std::string const& { return data_; }
    auto setData(std::string data) -> void { data_ = std::move(data); }

    [[nodiscard]] auto textContent() const -> std::string override { return {}; }
    [[nodiscard]] auto outerHtml() const -> std::string override;

    explicit Comment(std::string data)
        : Node(NodeType::Comment)
        , data_(std::move(data)) {}

private:
    std::string data_;
};

class Fragment final : public Node {
public:
    using Ptr = std::shared_ptr<Fragment>;

    static auto create() -> Ptr;

    [[nodiscard]] auto outerHtml() const -> std::string override { return this->childrenHtml(); }

    Fragment()
        : Node(NodeType::Fragment) {}

protected:
    [[nodiscard]] auto acceptsChildren() const noexcept -> bool override { return true; }
};

using StyleMap = std::vector<std::pair<std::string, std::string>>;

/**
 * Element — tag with ordered attributes
 *
 * The "class" and "style" attributes are the single source of truth for
 * the class token list and the style property map; the helpers below parse
 * and rewrite them. An attribute left empty by a helper is removed.
 */
class Element final : public Node {
public:
    using Ptr = std::shared_ptr<Element>;

    static auto create(std::string tagName) -> Ptr;

    [[nodiscard]] auto tagName() const noexcept -> std::string const& { return tagName_; }

    [[nodiscard]] auto getAttribute(std::string_view name) const -> std::optional<std::string>;
    [[nodiscard]] auto hasAttribute(std::string_view name) const -> bool;
    auto setAttribute(std::string_view name, std::string value) -> void;
    auto removeAttribute(std::string_view name) -> bool;
    [[nodiscard]] auto attributes() const noexcept -> std::vector<std::pair<std::string, std::string>> const& { return attributes_; }

    [[nodiscard]] auto classTokens() const -> std::vector<std::string>;
    [[nodiscard]] auto hasClass(std::string_view token) const -> bool;
    auto addClass(std::string_view token) -> void;
    auto removeClass(std::string_view token) -> void;
    auto toggleClass(std::string_view token) -> bool;

    [[nodiscard]] auto style() const -> StyleMap;
    [[nodiscard]] auto styleProperty(std::string_view name) const -> std::optional<std::string>;
    auto setStyleProperty(std::string_view name, std::string value) -> void;
    auto removeStyleProperty(std::string_view name) -> void;
    [[nodiscard]] auto cssText() const -> std::string;
    auto setCssText(std::string_view css) -> void;

    [[nodiscard]] auto outerHtml() const -> std::string override;

    explicit Element(std::string tagName)
        : Node(NodeType::Element)
        , tagName_(std::move(tagName)) {}

protected:
    [[nodiscard]] auto acceptsChildren() const noexcept -> bool override { return true; }

private:
    auto setClassTokens(std::vector<std::string> const& tokens) -> void;
    auto setStyle(StyleMap const& style) -> void;

    std::string                                      tagName_;
    std::vector<std::pair<std::string, std::string>> attributes_;
};

// Whitespace separated tokens, duplicates removed, order kept.
[[nodiscard]] auto splitClassTokens(std::string_view value) -> std::vector<std::string>;
// "a: b; c: d" into ordered pairs; later duplicates win.
[[nodiscard]] auto parseCssText(std::string_view css) -> StyleMap;
[[nodiscard]] auto serializeStyle(StyleMap const& style) -> std::string;
[[nodiscard]] auto escapeHtml(std::string_view text, bool attribute = false) -> std::string;

} // namespace RD::Dom
