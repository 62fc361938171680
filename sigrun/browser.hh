#pragma once

#include "dom.hh"
#include <emscripten/val.h>
#include <string>
#include <vector>

namespace sigrun {

// Dom implementation backed by the browser's DOM. Only one instance should
// exist per page, as handles are stored on the JS nodes themselves.
// Nodes seen by the reconciler are kept alive until released.
class BrowserDom : public Dom {
public:
    // Returns the element with the id attribute or no_node
    NodeRef get_element_by_id(const std::string& id);

    // Returns the handle of a JS DOM node, registering it, if needed
    NodeRef ref(emscripten::val node);

    // Returns the JS DOM node of a handle
    emscripten::val node(NodeRef) const;

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
    NodeRef focused() const override;
    void focus(NodeRef) override;
    std::optional<Selection> selection(NodeRef) const override;
    void set_selection(NodeRef, Selection) override;

private:
    // JS nodes indexed by handle - 1. Mutable, as lookups of not yet seen
    // nodes register them. Released slots hold undefined.
    mutable std::vector<emscripten::val> nodes;

    // Released handles to reuse
    mutable std::vector<NodeRef> free;

    NodeRef lookup(emscripten::val node) const;

    // Unregister the JS node and its subtree
    void forget(emscripten::val node);
};
}
