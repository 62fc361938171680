#include "document.hh"
#include "errors.hh"
#include "parser.hh"
#include <algorithm>

namespace sigrun {

Document::Document() { _body = create_element("body"); }

Document::Entry& Document::get(NodeRef n)
{
    return const_cast<Entry&>(static_cast<const Document*>(this)->get(n));
}

const Document::Entry& Document::get(NodeRef n) const
{
    if (n == no_node || n > nodes.size()) {
        throw Error("document: invalid node: " + std::to_string(n));
    }
    auto& e = nodes[n - 1];
    if (e.released) {
        throw Error("document: released node: " + std::to_string(n));
    }
    return e;
}

NodeRef Document::create(Entry e)
{
    nodes.push_back(std::move(e));
    return static_cast<NodeRef>(nodes.size());
}

NodeRef Document::create_element(const std::string& tag)
{
    Entry e;
    e.tag = to_lower(tag);
    return create(std::move(e));
}

NodeRef Document::create_text(const std::string& text)
{
    Entry e;
    e.type = Node::Type::text;
    e.text = text;
    return create(std::move(e));
}

NodeRef Document::create_comment(const std::string& text)
{
    Entry e;
    e.type = Node::Type::comment;
    e.text = text;
    return create(std::move(e));
}

Node::Type Document::type(NodeRef n) const { return get(n).type; }

std::string Document::tag(NodeRef n) const { return get(n).tag; }

std::string Document::text(NodeRef n) const { return get(n).text; }

void Document::set_text(NodeRef n, const std::string& text)
{
    auto& e = get(n);
    if (e.type == Node::Type::element) {
        throw Error("document: set_text on element");
    }
    e.text = text;
}

NodeRef Document::parent(NodeRef n) const { return get(n).parent; }

NodeRef Document::first_child(NodeRef n) const
{
    auto& ch = get(n).children;
    return ch.empty() ? no_node : ch.front();
}

NodeRef Document::next_sibling(NodeRef n) const
{
    const auto p = get(n).parent;
    if (p == no_node) {
        return no_node;
    }
    auto& ch = get(p).children;
    auto it = std::find(ch.begin(), ch.end(), n);
    if (it == ch.end() || ++it == ch.end()) {
        return no_node;
    }
    return *it;
}

Attrs Document::attrs(NodeRef n) const { return get(n).attrs; }

std::optional<std::string> Document::attr(
    NodeRef n, const std::string& key) const
{
    return get(n).attrs.get(key);
}

void Document::set_attr(
    NodeRef n, const std::string& key, const std::string& val)
{
    auto& e = get(n);
    if (e.type != Node::Type::element) {
        throw Error("document: set_attr on non-element");
    }
    e.attrs[to_lower(key)] = val;
}

void Document::remove_attr(NodeRef n, const std::string& key)
{
    get(n).attrs.erase(to_lower(key));
}

void Document::detach(NodeRef n)
{
    auto& e = get(n);
    if (e.parent == no_node) {
        return;
    }
    auto& ch = get(e.parent).children;
    ch.erase(std::remove(ch.begin(), ch.end(), n), ch.end());
    e.parent = no_node;
}

void Document::blur_within(NodeRef n)
{
    if (_focused != no_node && contains(n, _focused)) {
        _focused = no_node;
    }
}

void Document::insert_before(NodeRef parent, NodeRef child, NodeRef ref)
{
    if (get(parent).type != Node::Type::element) {
        throw Error("document: insert into non-element");
    }
    if (contains(child, parent)) {
        throw Error("document: insertion would create a cycle");
    }
    if (ref != no_node && get(ref).parent != parent) {
        throw Error("document: reference node is not a child of parent");
    }
    if (child == ref) {
        return;
    }

    blur_within(child);
    detach(child);

    auto& ch = get(parent).children;
    auto it = ref == no_node ? ch.end() : std::find(ch.begin(), ch.end(), ref);
    ch.insert(it, child);
    get(child).parent = parent;
}

void Document::remove(NodeRef n)
{
    blur_within(n);
    detach(n);
}

void Document::release(NodeRef n)
{
    if (n == _body) {
        throw Error("document: can not release the body");
    }
    remove(n);
    release_subtree(n);
}

void Document::release_subtree(NodeRef n)
{
    auto& e = get(n);
    const auto children = std::move(e.children);
    e = Entry();
    e.released = true;
    for (auto ch : children) {
        release_subtree(ch);
    }
}

void Document::focus(NodeRef n)
{
    if (n == no_node) {
        _focused = no_node;
        return;
    }
    if (get(n).type != Node::Type::element || !attached(n)) {
        return;
    }
    _focused = n;
}

// Returns, if the element keeps a text selection
static bool supports_selection(const std::string& tag)
{
    return tag == "input" || tag == "textarea";
}

std::optional<Selection> Document::selection(NodeRef n) const
{
    auto& e = get(n);
    if (!supports_selection(e.tag)) {
        return std::nullopt;
    }
    return e.selection;
}

void Document::set_selection(NodeRef n, Selection sel)
{
    auto& e = get(n);
    if (supports_selection(e.tag)) {
        e.selection = sel;
    }
}

std::vector<NodeRef> Document::append_html(
    NodeRef parent, std::string_view html)
{
    std::vector<NodeRef> created;
    for (auto& n : parse_html(html)) {
        created.push_back(append_node(parent, n));
    }
    return created;
}

NodeRef Document::append_node(NodeRef parent, const Node& node)
{
    NodeRef n;
    switch (node.type) {
    case Node::Type::text:
        n = create_text(node.text);
        break;
    case Node::Type::comment:
        n = create_comment(node.text);
        break;
    default:
        n = create_element(node.tag);
        get(n).attrs = node.attrs;
        for (auto& ch : node.children) {
            append_node(n, ch);
        }
    }
    if (parent != no_node) {
        insert_before(parent, n, no_node);
    }
    return n;
}

Node Document::to_node(NodeRef n) const
{
    auto& e = get(n);
    switch (e.type) {
    case Node::Type::text:
        return Node::text_node(e.text);
    case Node::Type::comment:
        return Node::comment_node(e.text);
    default:
        Node node(e.tag, e.attrs);
        for (auto ch : e.children) {
            node.children.push_back(to_node(ch));
        }
        return node;
    }
}

std::string Document::outer_html(NodeRef n) const { return to_node(n).html(); }

std::string Document::inner_html(NodeRef n) const
{
    Rope s;
    to_node(n).write_children(s);
    return s.str();
}

NodeRef Document::get_element_by_id(const std::string& id) const
{
    for (size_t i = 0; i < nodes.size(); i++) {
        const auto ref = static_cast<NodeRef>(i + 1);
        auto& e = nodes[i];
        if (!e.released && e.type == Node::Type::element
            && e.attrs.get("id") == id && attached(ref)) {
            return ref;
        }
    }
    return no_node;
}
}
