#pragma once

#include "util.hh"
#include <map>
#include <stdint.h>
#include <optional>
#include <string>
#include <vector>

namespace sigrun {

// Helper for serializing to HTML
class HTMLWriter {
public:
    virtual ~HTMLWriter() = default;

    // Renders HTML string
    std::string html() const;

    // Write as HTML to the Rope
    virtual void write_html(Rope&) const = 0;
};

// Element attributes. Ordered by name, so that serialization is stable.
class Attrs : public std::map<std::string, std::string>, public HTMLWriter {
    typedef std::map<std::string, std::string> Base;
    using Base::Base;

public:
    // Write attrs as HTML to the Rope. Values are escaped.
    void write_html(Rope&) const;

    // Returns the attribute value or std::nullopt
    std::optional<std::string> get(const std::string& key) const;
};

// Returns, if an element with this tag has no closing tag and no children
bool is_void_tag(const std::string& tag);

// Parsed HTML node. Target of DOM patching.
class Node : public HTMLWriter {
public:
    enum class Type : uint8_t { element, text, comment };

    Type type = Type::element;

    // Tag of the element in lowercase. Empty for other node types.
    std::string tag;

    // Attributes of the element
    Attrs attrs;

    // Children of the element
    std::vector<Node> children;

    // Unescaped contents of a text or comment node
    std::string text;

    // Creates an element with optional attributes and children
    Node(std::string tag, Attrs attrs = {}, std::vector<Node> children = {})
        : tag(std::move(tag))
        , attrs(std::move(attrs))
        , children(std::move(children))
    {
    }

    Node() = default;

    // Creates a text node
    static Node text_node(std::string text);

    // Creates a comment node
    static Node comment_node(std::string text);

    bool is_element() const { return type == Type::element; }

    // Returns the attribute value or std::nullopt
    std::optional<std::string> attr(const std::string& key) const
    {
        return attrs.get(key);
    }

    // Returns, if the attribute is set
    bool has_attr(const std::string& key) const { return attrs.count(key); }

    // Write node as HTML to the Rope
    void write_html(Rope&) const;

    // Write only the children of the node as HTML to the Rope
    void write_children(Rope&) const;

    bool operator==(const Node&) const;
    bool operator!=(const Node& rhs) const { return !(*this == rhs); }
};

// Subtree of a Node
typedef std::vector<Node> Children;
}
