#include <reactivedom/dom/Node.hpp>
#include <reactivedom/reactive/Lifecycle.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace RD::Dom {
namespace {

constexpr auto kVoidElements = std::to_array<std::string_view>({
    "area", "base", "br", "col", "embed", "hr", "img", "input", "link", "meta", "source", "track", "wbr",
});

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

auto lowered(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char ch : text)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    return out;
}

} // namespace

auto nodeTypeToString(NodeType type) -> char const* {
    switch (type) {
    case NodeType::Element:
        return "element";
    case NodeType::Text:
        return "text";
    case NodeType::Comment:
        return "comment";
    case NodeType::Fragment:
        return "fragment";
    }
    return "element";
}

Node::~Node() {
    for (auto& child : children_)
        child->parent_ = nullptr;
}

auto Node::firstChild() const -> Ptr {
    return children_.empty() ? nullptr : children_.front();
}

auto Node::lastChild() const -> Ptr {
    return children_.empty() ? nullptr : children_.back();
}

auto Node::nextSibling() const -> Ptr {
    if (!parent_)
        return nullptr;
    auto next = std::next(self_);
    return next == parent_->children_.end() ? nullptr : *next;
}

auto Node::previousSibling() const -> Ptr {
    if (!parent_ || self_ == parent_->children_.begin())
        return nullptr;
    return *std::prev(self_);
}

auto Node::children() const -> std::vector<Ptr> {
    return std::vector<Ptr>(children_.begin(), children_.end());
}

auto Node::appendChild(Ptr node) -> Expected<void> {
    return this->insertBefore(std::move(node), nullptr);
}

auto Node::positionOf(Node const* reference) -> Expected<std::list<Ptr>::iterator> {
    if (reference == nullptr)
        return children_.end();
    if (reference->parent_ != this)
        return std::unexpected(Error{Error::Code::NotFound, "reference node is not a child of this node"});
    return reference->self_;
}

auto Node::insertBefore(Ptr node, Node const* reference) -> Expected<void> {
    if (!node)
        return std::unexpected(Error{Error::Code::InvalidNode, "cannot insert a null node"});
    if (!this->acceptsChildren())
        return std::unexpected(Error{Error::Code::HierarchyRequest,
                                     std::string{nodeTypeToString(type_)} + " nodes cannot have children"});
    if (node->contains(this))
        return std::unexpected(Error{Error::Code::HierarchyRequest, "cannot insert a node into its own subtree"});

    auto position = this->positionOf(reference);
    if (!position)
        return std::unexpected(position.error());

    if (node->type() == NodeType::Fragment) {
        for (auto& child : node->children())
            this->insertOne(std::move(child), *position);
        return {};
    }
    if (node.get() == reference)
        return {};
    this->insertOne(std::move(node), *position);
    return {};
}

auto Node::insertOne(Ptr node, std::list<Ptr>::iterator position) -> void {
    if (node->parent_) {
        children_.splice(position, node->parent_->children_, node->self_);
    } else {
        node->self_ = children_.insert(position, node);
    }
    node->parent_ = this;
}

auto Node::removeChild(Node const* child) -> Expected<Ptr> {
    if (child == nullptr || child->parent_ != this)
        return std::unexpected(Error{Error::Code::NotFound, "node is not a child of this node"});
    auto it      = child->self_;
    Ptr  removed = std::move(*it);
    children_.erase(it);
    removed->parent_ = nullptr;
    return removed;
}

auto Node::replaceChild(Ptr node, Node const* child) -> Expected<Ptr> {
    if (child == nullptr || child->parent_ != this)
        return std::unexpected(Error{Error::Code::NotFound, "node to replace is not a child of this node"});
    if (node.get() == child)
        return node;
    if (auto inserted = this->insertBefore(std::move(node), child); !inserted)
        return std::unexpected(inserted.error());
    return this->removeChild(child);
}

auto Node::remove() -> void {
    if (!parent_)
        return;
    auto keepAlive = this->shared_from_this();
    parent_->children_.erase(self_);
    parent_ = nullptr;
}

auto Node::contains(Node const* other) const noexcept -> bool {
    for (auto const* node = other; node != nullptr; node = node->parent_) {
        if (node == this)
            return true;
    }
    return false;
}

auto Node::textContent() const -> std::string {
    std::string text;
    for (auto const& child : children_)
        text += child->textContent();
    return text;
}

auto Node::childrenHtml() const -> std::string {
    std::string html;
    for (auto const& child : children_)
        html += child->outerHtml();
    return html;
}

auto Node::attachScope(std::shared_ptr<LifecycleScope> scope) -> void {
    if (scope)
        scopes_.push_back(std::move(scope));
}

auto Node::disposeScopes() -> void {
    for (auto const& child : this->children())
        child->disposeScopes();
    auto scopes = std::move(scopes_);
    scopes_.clear();
    for (auto const& scope : scopes)
        scope->dispose();
}

auto Node::mountScopes() -> void {
    for (auto const& child : this->children())
        child->mountScopes();
    for (auto const& scope : this->scopes())
        scope->mount();
}

auto Text::create(std::string data) -> Ptr {
    return std::make_shared<Text>(std::move(data));
}

auto Text::outerHtml() const -> std::string {
    return escapeHtml(data_);
}

auto Comment::create(std::string data) -> Ptr {
    return std::make_shared<Comment>(std::move(data));
}

auto Comment::outerHtml() const -> std::string {
    return "<!--" + data_ + "-->";
}

auto Fragment::create() -> Ptr {
    return std::make_shared<Fragment>();
}

auto Element::create(std::string tagName) -> Ptr {
    return std::make_shared<Element>(lowered(tagName));
}

auto Element::getAttribute(std::string_view name) const -> std::optional<std::string> {
    for (auto const& [key, value] : attributes_) {
        if (key == name)
            return value;
    }
    return std::nullopt;
}

auto Element::hasAttribute(std::string_view name) const -> bool {
    return std::any_of(attributes_.begin(), attributes_.end(), [name](auto const& attr) { return attr.first == name; });
}

auto Element::setAttribute(std::string_view name, std::string value) -> void {
    for (auto& [key, current] : attributes_) {
        if (key == name) {
            current = std::move(value);
            return;
        }
    }
    attributes_.emplace_back(std::string{name}, std::move(value));
}

auto Element::removeAttribute(std::string_view name) -> bool {
    auto it = std::find_if(attributes_.begin(), attributes_.end(), [name](auto const& attr) { return attr.first == name; });
    if (it == attributes_.end())
        return false;
    attributes_.erase(it);
    return true;
}

auto Element::classTokens() const -> std::vector<std::string> {
    auto value = this->getAttribute("class");
    return value ? splitClassTokens(*value) : std::vector<std::string>{};
}

auto Element::hasClass(std::string_view token) const -> bool {
    auto tokens = this->classTokens();
    return std::find(tokens.begin(), tokens.end(), token) != tokens.end();
}

auto Element::addClass(std::string_view token) -> void {
    auto tokens = this->classTokens();
    if (token.empty() || std::find(tokens.begin(), tokens.end(), token) != tokens.end())
        return;
    tokens.emplace_back(token);
    this->setClassTokens(tokens);
}

auto Element::removeClass(std::string_view token) -> void {
    auto tokens = this->classTokens();
    auto it     = std::find(tokens.begin(), tokens.end(), token);
    if (it == tokens.end())
        return;
    tokens.erase(it);
    this->setClassTokens(tokens);
}

auto Element::toggleClass(std::string_view token) -> bool {
    if (this->hasClass(token)) {
        this->removeClass(token);
        return false;
    }
    this->addClass(token);
    return true;
}

auto Element::setClassTokens(std::vector<std::string> const& tokens) -> void {
    if (tokens.empty()) {
        this->removeAttribute("class");
        return;
    }
    std::string value;
    for (auto const& token : tokens) {
        if (!value.empty())
            value.push_back(' ');
        value += token;
    }
    this->setAttribute("class", std::move(value));
}

auto Element::style() const -> StyleMap {
    auto value = this->getAttribute("style");
    return value ? parseCssText(*value) : StyleMap{};
}

auto Element::styleProperty(std::string_view name) const -> std::optional<std::string> {
    for (auto const& [property, value] : this->style()) {
        if (property == name)
            return value;
    }
    return std::nullopt;
}

auto Element::setStyleProperty(std::string_view name, std::string value) -> void {
    if (value.empty()) {
        this->removeStyleProperty(name);
        return;
    }
    auto style = this->style();
    auto it    = std::find_if(style.begin(), style.end(), [name](auto const& entry) { return entry.first == name; });
    if (it != style.end())
        it->second = std::move(value);
    else
        style.emplace_back(std::string{name}, std::move(value));
    this->setStyle(style);
}

auto Element::removeStyleProperty(std::string_view name) -> void {
    auto style = this->style();
    auto it    = std::find_if(style.begin(), style.end(), [name](auto const& entry) { return entry.first == name; });
    if (it == style.end())
        return;
    style.erase(it);
    this->setStyle(style);
}

auto Element::cssText() const -> std::string {
    return serializeStyle(this->style());
}

auto Element::setCssText(std::string_view css) -> void {
    this->setStyle(parseCssText(css));
}

auto Element::setStyle(StyleMap const& style) -> void {
    if (style.empty()) {
        this->removeAttribute("style");
        return;
    }
    this->setAttribute("style", serializeStyle(style));
}

auto Element::outerHtml() const -> std::string {
    std::string html = "<" + tagName_;
    for (auto const& [name, value] : attributes_) {
        html += " " + name;
        if (!value.empty())
            html += "=\"" + escapeHtml(value, true) + "\"";
    }
    html += ">";
    if (std::find(kVoidElements.begin(), kVoidElements.end(), tagName_) != kVoidElements.end())
        return html;
    html += this->childrenHtml();
    html += "</" + tagName_ + ">";
    return html;
}

auto splitClassTokens(std::string_view value) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    std::size_t              pos = 0;
    while (pos < value.size()) {
        while (pos < value.size() && std::isspace(static_cast<unsigned char>(value[pos])))
            ++pos;
        auto start = pos;
        while (pos < value.size() && !std::isspace(static_cast<unsigned char>(value[pos])))
            ++pos;
        if (pos > start) {
            std::string token{value.substr(start, pos - start)};
            if (std::find(tokens.begin(), tokens.end(), token) == tokens.end())
                tokens.push_back(std::move(token));
        }
    }
    return tokens;
}

auto parseCssText(std::string_view css) -> StyleMap {
    StyleMap style;
    while (!css.empty()) {
        auto semi        = css.find(';');
        auto declaration = css.substr(0, semi);
        auto colon       = declaration.find(':');
        if (colon != std::string_view::npos) {
            auto name  = trim(declaration.substr(0, colon));
            auto value = trim(declaration.substr(colon + 1));
            if (!name.empty() && !value.empty()) {
                auto it = std::find_if(style.begin(), style.end(), [name](auto const& entry) { return entry.first == name; });
                if (it != style.end())
                    it->second = std::string{value};
                else
                    style.emplace_back(std::string{name}, std::string{value});
            }
        }
        if (semi == std::string_view::npos)
            break;
        css.remove_prefix(semi + 1);
    }
    return style;
}

auto serializeStyle(StyleMap const& style) -> std::string {
    std::string css;
    for (auto const& [name, value] : style) {
        if (!css.empty())
            css += " ";
        css += name + ": " + value + ";";
    }
    return css;
}

auto escapeHtml(std::string_view text, bool attribute) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            if (attribute)
                out += "&quot;";
            else
                out.push_back(ch);
            break;
        default:
            out.push_back(ch);
            break;
        }
    }
    return out;
}

} // namespace RD::Dom
