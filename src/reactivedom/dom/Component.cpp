#include <reactivedom/dom/Component.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <vector>

namespace RD::Dom {

auto mount(Node& parent, Node::Ptr const& node) -> Expected<void> {
    if (!node)
        return std::unexpected(Error{Error::Code::InvalidNode, "cannot mount a null node"});
    std::vector<Node::Ptr> inserted;
    if (node->type() == NodeType::Fragment)
        inserted = node->children();
    else
        inserted.push_back(node);

    if (auto appended = parent.appendChild(node); !appended)
        return appended;
    for (auto const& child : inserted)
        child->mountScopes();
    rd_log("mounted " + std::to_string(inserted.size()) + " node(s)", "Dom");
    return {};
}

auto unmount(Node::Ptr const& node) -> void {
    if (!node)
        return;
    node->remove();
    node->disposeScopes();
    rd_log("unmounted " + std::string{nodeTypeToString(node->type())} + " node", "Dom");
}

} // namespace RD::Dom
