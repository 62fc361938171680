#include "dom.hh"

namespace sigrun {

std::vector<NodeRef> Dom::children(NodeRef n) const
{
    std::vector<NodeRef> ch;
    for (auto c = first_child(n); c != no_node; c = next_sibling(c)) {
        ch.push_back(c);
    }
    return ch;
}

bool Dom::contains(NodeRef ancestor, NodeRef node) const
{
    for (; node != no_node; node = parent(node)) {
        if (node == ancestor) {
            return true;
        }
    }
    return false;
}

NodeRef Dom::closest(NodeRef n, const std::string& tag) const
{
    for (; n != no_node; n = parent(n)) {
        if (type(n) == Node::Type::element && this->tag(n) == tag) {
            return n;
        }
    }
    return no_node;
}
}
