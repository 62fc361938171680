#pragma once

#include "dom.hh"
#include <string_view>

namespace sigrun {

// In-memory DOM implementation. Used for server-side rendering checks,
// debugging and tests. Mirrors browser behaviour relevant to patching:
// detaching or moving a subtree containing the focused element blurs it.
class Document : public Dom {
public:
    // Creates a document with an empty <body> element
    Document();

    // Root element of the document
    NodeRef body() const { return _body; }

    // Parse HTML and append the resulting nodes to parent.
    // Returns the top level nodes created.
    std::vector<NodeRef> append_html(NodeRef parent, std::string_view html);

    // Build nodes from a parsed tree and append them to parent
    NodeRef append_node(NodeRef parent, const Node&);

    // Serialize the node and its subtree to HTML
    std::string outer_html(NodeRef) const;

    // Serialize only the children of the node to HTML
    std::string inner_html(NodeRef) const;

    // Returns, if the node is connected to the document body
    bool attached(NodeRef n) const { return contains(_body, n); }

    // Returns, if the handle was released. Any other access to a released
    // handle throws.
    bool released(NodeRef n) const
    {
        return n != no_node && n <= nodes.size() && nodes[n - 1].released;
    }

    // Find an attached element by its id attribute. Returns no_node, if none.
    NodeRef get_element_by_id(const std::string& id) const;

    // Convert a node and its subtree back to a Node tree
    Node to_node(NodeRef) const;

    Node::Type type(NodeRef) const override;
    std::string tag(NodeRef) const override;
    std::string text(NodeRef) const override;
    void set_text(NodeRef, const std::string&) override;
    NodeRef parent(NodeRef) const override;
    NodeRef first_child(NodeRef) const override;
    NodeRef next_sibling(NodeRef) const override;
    Attrs attrs(NodeRef) const override;
    std::optional<std::string> attr(
        NodeRef, const std::string& key) const override;
    void set_attr(
        NodeRef, const std::string& key, const std::string& val) override;
    void remove_attr(NodeRef, const std::string& key) override;
    NodeRef create_element(const std::string& tag) override;
    NodeRef create_text(const std::string& text) override;
    NodeRef create_comment(const std::string& text) override;
    void insert_before(NodeRef parent, NodeRef child, NodeRef ref) override;
    void remove(NodeRef) override;
    void release(NodeRef) override;
    NodeRef focused() const override { return _focused; }
    void focus(NodeRef) override;
    std::optional<Selection> selection(NodeRef) const override;
    void set_selection(NodeRef, Selection) override;

private:
    struct Entry {
        Node::Type type = Node::Type::element;
        std::string tag, text;
        Attrs attrs;
        NodeRef parent = no_node;
        std::vector<NodeRef> children;
        Selection selection;
        bool released = false;
    };

    // All nodes ever created. Indexed by NodeRef - 1. Released entries are
    // kept empty, so that handles are never reused.
    std::vector<Entry> nodes;

    NodeRef _body = no_node, _focused = no_node;

    Entry& get(NodeRef);
    const Entry& get(NodeRef) const;
    NodeRef create(Entry);

    // Detach node from its parent, if any
    void detach(NodeRef);

    // Blur the focused element, if it is inside the subtree of n
    void blur_within(NodeRef n);

    // Mark n and its subtree released and free their contents
    void release_subtree(NodeRef n);
};
}
