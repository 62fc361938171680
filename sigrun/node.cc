#include "node.hh"
#include <unordered_set>

namespace sigrun {

std::string HTMLWriter::html() const
{
    Rope s;
    write_html(s);
    return s.str();
}

void Attrs::write_html(Rope& s) const
{
    for (auto & [ key, val ] : *this) {
        s << ' ' << key;
        if (val != "") {
            s << "=\"" << escape(val) << '"';
        }
    }
}

std::optional<std::string> Attrs::get(const std::string& key) const
{
    auto it = find(key);
    if (it == end()) {
        return std::nullopt;
    }
    return it->second;
}

bool is_void_tag(const std::string& tag)
{
    static const std::unordered_set<std::string> tags = {
        "area",
        "base",
        "br",
        "col",
        "embed",
        "hr",
        "img",
        "input",
        "link",
        "meta",
        "source",
        "track",
        "wbr",
    };
    return tags.count(tag);
}

// Returns, if the contents of the element are not HTML-escaped
static bool is_raw_text_tag(const std::string& tag)
{
    return tag == "script" || tag == "style";
}

Node Node::text_node(std::string text)
{
    Node n;
    n.type = Type::text;
    n.text = std::move(text);
    return n;
}

Node Node::comment_node(std::string text)
{
    Node n;
    n.type = Type::comment;
    n.text = std::move(text);
    return n;
}

void Node::write_html(Rope& s) const
{
    switch (type) {
    case Type::text:
        s << escape(text);
        return;
    case Type::comment:
        s << "<!--" << text << "-->";
        return;
    case Type::element:
        break;
    }

    s << '<' << tag;
    attrs.write_html(s);
    s << '>';

    // These should be left empty and unterminated
    if (is_void_tag(tag)) {
        return;
    }

    if (is_raw_text_tag(tag)) {
        for (auto& ch : children) {
            s << ch.text;
        }
    } else {
        write_children(s);
    }

    s << "</" << tag << '>';
}

void Node::write_children(Rope& s) const
{
    for (auto& ch : children) {
        ch.write_html(s);
    }
}

bool Node::operator==(const Node& rhs) const
{
    return type == rhs.type && tag == rhs.tag && text == rhs.text
        && attrs == rhs.attrs && children == rhs.children;
}
}
