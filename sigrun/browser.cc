#include "browser.hh"
#include "errors.hh"

using emscripten::val;

namespace sigrun {

// Property storing the handle on JS nodes
static const char* const ref_prop = "__sgRef";

static val document() { return val::global("document"); }

NodeRef BrowserDom::ref(val node) { return lookup(node); }

NodeRef BrowserDom::lookup(val node) const
{
    if (node.isNull() || node.isUndefined()) {
        return no_node;
    }
    auto id = node[ref_prop];
    if (!id.isUndefined()) {
        return id.as<NodeRef>();
    }

    NodeRef r;
    if (!free.empty()) {
        r = free.back();
        free.pop_back();
        nodes[r - 1] = node;
    } else {
        nodes.push_back(node);
        r = static_cast<NodeRef>(nodes.size());
    }
    node.set(ref_prop, r);
    return r;
}

val BrowserDom::node(NodeRef n) const
{
    if (n == no_node || n > nodes.size() || nodes[n - 1].isUndefined()) {
        throw Error("browser: invalid node: " + std::to_string(n));
    }
    return nodes[n - 1];
}

void BrowserDom::forget(val node)
{
    auto id = node[ref_prop];
    if (!id.isUndefined()) {
        const auto r = id.as<NodeRef>();
        node.delete_(ref_prop);
        nodes[r - 1] = val::undefined();
        free.push_back(r);
    }
    for (auto ch = node["firstChild"]; !ch.isNull(); ch = ch["nextSibling"]) {
        forget(ch);
    }
}

NodeRef BrowserDom::get_element_by_id(const std::string& id)
{
    return lookup(document().call<val>("getElementById", id));
}

Node::Type BrowserDom::type(NodeRef n) const
{
    switch (node(n)["nodeType"].as<int>()) {
    case 1:
        return Node::Type::element;
    case 3:
        return Node::Type::text;
    default:
        return Node::Type::comment;
    }
}

std::string BrowserDom::tag(NodeRef n) const
{
    auto t = node(n)["tagName"];
    if (t.isUndefined()) {
        return "";
    }
    return to_lower(t.as<std::string>());
}

std::string BrowserDom::text(NodeRef n) const
{
    auto v = node(n)["nodeValue"];
    return v.isNull() ? "" : v.as<std::string>();
}

void BrowserDom::set_text(NodeRef n, const std::string& text)
{
    node(n).set("nodeValue", text);
}

NodeRef BrowserDom::parent(NodeRef n) const
{
    return lookup(node(n)["parentNode"]);
}

NodeRef BrowserDom::first_child(NodeRef n) const
{
    return lookup(node(n)["firstChild"]);
}

NodeRef BrowserDom::next_sibling(NodeRef n) const
{
    return lookup(node(n)["nextSibling"]);
}

Attrs BrowserDom::attrs(NodeRef n) const
{
    Attrs re;
    auto list = node(n)["attributes"];
    if (list.isUndefined()) {
        return re;
    }
    const auto len = list["length"].as<unsigned>();
    for (unsigned i = 0; i < len; i++) {
        auto a = list.call<val>("item", i);
        re[a["name"].as<std::string>()] = a["value"].as<std::string>();
    }
    return re;
}

std::optional<std::string> BrowserDom::attr(
    NodeRef n, const std::string& key) const
{
    auto el = node(n);
    if (el["getAttribute"].isUndefined()) {
        return std::nullopt;
    }
    auto v = el.call<val>("getAttribute", key);
    if (v.isNull()) {
        return std::nullopt;
    }
    return v.as<std::string>();
}

void BrowserDom::set_attr(
    NodeRef n, const std::string& key, const std::string& value)
{
    node(n).call<void>("setAttribute", key, value);
}

void BrowserDom::remove_attr(NodeRef n, const std::string& key)
{
    node(n).call<void>("removeAttribute", key);
}

NodeRef BrowserDom::create_element(const std::string& tag)
{
    return lookup(document().call<val>("createElement", tag));
}

NodeRef BrowserDom::create_text(const std::string& text)
{
    return lookup(document().call<val>("createTextNode", text));
}

NodeRef BrowserDom::create_comment(const std::string& text)
{
    return lookup(document().call<val>("createComment", text));
}

void BrowserDom::insert_before(NodeRef parent, NodeRef child, NodeRef ref)
{
    node(parent).call<void>("insertBefore", node(child),
        ref == no_node ? val::null() : node(ref));
}

void BrowserDom::remove(NodeRef n)
{
    auto el = node(n);
    auto p = el["parentNode"];
    if (!p.isNull()) {
        p.call<void>("removeChild", el);
    }
}

void BrowserDom::release(NodeRef n)
{
    auto el = node(n);
    remove(n);
    forget(el);
}

NodeRef BrowserDom::focused() const
{
    auto el = document()["activeElement"];
    if (el.isNull() || el.isUndefined()
        || el.strictlyEquals(document()["body"])) {
        return no_node;
    }
    return lookup(el);
}

void BrowserDom::focus(NodeRef n)
{
    if (n == no_node) {
        auto el = document()["activeElement"];
        if (!el.isNull()) {
            el.call<void>("blur");
        }
        return;
    }
    node(n).call<void>("focus");
}

std::optional<Selection> BrowserDom::selection(NodeRef n) const
{
    auto el = node(n);
    auto start = el["selectionStart"];
    // null or undefined for elements and input types without selection
    if (start.isNull() || start.isUndefined()) {
        return std::nullopt;
    }
    return Selection {
        start.as<unsigned>(),
        el["selectionEnd"].as<unsigned>(),
    };
}

void BrowserDom::set_selection(NodeRef n, Selection sel)
{
    auto el = node(n);
    auto start = el["selectionStart"];
    if (start.isNull() || start.isUndefined()) {
        return;
    }
    el.call<void>("setSelectionRange", sel.start, sel.end);
}
}
