#pragma once

#include "node.hh"
#include <optional>
#include <stdint.h>
#include <string>
#include <vector>

namespace sigrun {

// Handle of a node in a live DOM. Assigned by the Dom implementation and
// stable until the node is released, including while it is detached.
typedef uint32_t NodeRef;

// Refers to no node
constexpr NodeRef no_node = 0;

// Text selection range of an input element
struct Selection {
    unsigned start = 0, end = 0;

    bool operator==(const Selection& rhs) const
    {
        return start == rhs.start && end == rhs.end;
    }
    bool operator!=(const Selection& rhs) const { return !(*this == rhs); }
};

// Minimal interface to a live DOM. Isolates all DOM access of the reconciler,
// so that the patching logic can run against a real browser DOM or the
// headless Document.
class Dom {
public:
    virtual ~Dom() = default;

    virtual Node::Type type(NodeRef) const = 0;

    // Lowercase tag name of an element. Empty for other node types.
    virtual std::string tag(NodeRef) const = 0;

    // Contents of a text or comment node
    virtual std::string text(NodeRef) const = 0;

    // Set the contents of a text or comment node
    virtual void set_text(NodeRef, const std::string&) = 0;

    // Parent of the node or no_node, if detached
    virtual NodeRef parent(NodeRef) const = 0;

    virtual NodeRef first_child(NodeRef) const = 0;
    virtual NodeRef next_sibling(NodeRef) const = 0;

    // Attributes of an element
    virtual Attrs attrs(NodeRef) const = 0;

    // Returns the attribute value or std::nullopt
    virtual std::optional<std::string> attr(
        NodeRef, const std::string& key) const = 0;

    virtual void set_attr(
        NodeRef, const std::string& key, const std::string& val) = 0;
    virtual void remove_attr(NodeRef, const std::string& key) = 0;

    // Create detached nodes
    virtual NodeRef create_element(const std::string& tag) = 0;
    virtual NodeRef create_text(const std::string& text) = 0;
    virtual NodeRef create_comment(const std::string& text) = 0;

    // Insert child into parent before ref. Appends, if ref is no_node.
    // Moves the child, if it is already attached somewhere.
    virtual void insert_before(NodeRef parent, NodeRef child, NodeRef ref) = 0;

    // Detach node from its parent. The handle stays valid.
    virtual void remove(NodeRef) = 0;

    // Detach node from its parent and free the handles of the node and its
    // subtree. Released handles must not be used again and may be reused
    // for new nodes.
    virtual void release(NodeRef) = 0;

    // Currently focused element or no_node
    virtual NodeRef focused() const = 0;

    virtual void focus(NodeRef) = 0;

    // Selection of a text input or textarea. std::nullopt for elements not
    // supporting selection.
    virtual std::optional<Selection> selection(NodeRef) const = 0;

    virtual void set_selection(NodeRef, Selection) = 0;

    // Returns the children of the node in order
    std::vector<NodeRef> children(NodeRef) const;

    // Returns, if node is ancestor or the node itself
    bool contains(NodeRef ancestor, NodeRef node) const;

    // Returns, if the element has the attribute
    bool has_attr(NodeRef n, const std::string& key) const
    {
        return attr(n, key).has_value();
    }

    // Returns the nearest ancestor element with the tag or no_node
    NodeRef closest(NodeRef, const std::string& tag) const;
};
}
