#include "patch.hh"
#include "console.hh"
#include "errors.hh"
#include "parser.hh"
#include <algorithm>
#include <cstdlib>

namespace sigrun {

UpdateMode parse_update_mode(const std::optional<std::string>& val)
{
    if (!val) {
        return UpdateMode::replace;
    }
    if (*val == "ignore") {
        return UpdateMode::ignore;
    }
    if (*val == "keyed") {
        return UpdateMode::keyed;
    }
    if (*val == "append") {
        return UpdateMode::append;
    }
    if (*val == "prepend") {
        return UpdateMode::prepend;
    }
    if (*val == "stream") {
        return UpdateMode::stream;
    }
    return UpdateMode::replace;
}

class Reconciler::Active {
public:
    Active(Reconciler& r, PatchReport& rep)
        : r(r)
    {
        if (r.report) {
            throw Error("reconciler: patch already in progress");
        }
        r.report = &rep;
    }

    ~Active()
    {
        r.report = nullptr;
        r.focused = no_node;
        r.keyed.clear();
        r.keyed_order.clear();
        r.insertions.clear();
        r.reused.clear();
    }

private:
    Reconciler& r;
};

Reconciler::Reconciler(Dom& dom, HookRegistry* hooks, Bindings b)
    : bindings(std::move(b))
    , _dom(dom)
    , hooks(hooks)
{
}

template <class F> void Reconciler::guard(const char* what, NodeRef el, F&& fn)
{
    try {
        fn();
    } catch (const std::exception& ex) {
        console::error(std::string(what) + " callback failed on node "
            + std::to_string(el) + ": " + ex.what());
        if (report) {
            report->callback_errors++;
        }
    }
}

PatchReport Reconciler::patch(NodeRef container, std::string_view html,
    const std::vector<Stream>& streams)
{
    return patch(container, parse_html(html), streams);
}

PatchReport Reconciler::patch(NodeRef container, const Children& target,
    const std::vector<Stream>& streams)
{
    PatchReport rep;
    Active active(*this, rep);

    for (auto& st : streams) {
        for (auto& in : st.inserts) {
            insertions.insert_or_assign(in.id, Insertion{ st.ref, in });
        }
    }

    // Capture focus before any mutation
    std::optional<Selection> sel;
    {
        const auto f = _dom.focused();
        if (f != no_node && f != container && _dom.contains(container, f)) {
            focused = f;
            if (is_textual_input(f)) {
                sel = _dom.selection(f);
            }
        }
    }

    // Removed items may be inserted again by the same patch
    for (auto& st : streams) {
        remove_stream_items(container, st);
    }

    index(container);

    Visit root { container, hooks ? hooks->find(container) : nullptr };
    morph_children(
        root, target, parse_update_mode(_dom.attr(container, bindings.update)));
    finish(root);

    apply_limits(container, streams);
    discard_unmatched(container);
    apply_feedback(container, container);

    // Restore focus after all mutations
    if (focused != no_node && _dom.contains(container, focused)) {
        if (_dom.focused() != focused) {
            _dom.focus(focused);
            rep.focus_restored = true;
        }
        if (sel && _dom.selection(focused) != sel) {
            _dom.set_selection(focused, *sel);
            rep.focus_restored = true;
        }
    }

    // Only after every hook and view of the removed subtrees was torn down
    for (auto n : rep.discarded) {
        _dom.release(n);
    }
    return rep;
}

void Reconciler::discard_unmatched(NodeRef container)
{
    std::vector<NodeRef> pending;
    for (auto n : keyed_order) {
        if (is_pending(n)) {
            pending.push_back(n);
        }
    }
    keyed.clear();

    // Descendants of an unmatched element are torn down with it
    const std::unordered_set<NodeRef> unmatched(pending.begin(), pending.end());
    for (auto n : pending) {
        bool nested = false;
        for (auto p = _dom.parent(n); p != no_node && !nested;
             p = _dom.parent(p)) {
            nested = unmatched.count(p);
        }
        if (nested) {
            continue;
        }

        // Those inside an already removed subtree only need their hooks and
        // views torn down
        if (_dom.contains(container, n)) {
            discard(n);
        } else {
            unmount(n, n);
        }
    }
}

void Reconciler::remove_stream_items(NodeRef container, const Stream& st)
{
    std::vector<NodeRef> doomed;
    for (auto& id : st.deletes) {
        const auto n = find_keyed(container, id);
        if (n != no_node) {
            doomed.push_back(n);
        }
    }
    if (st.reset) {
        collect_stream_items(container, st, doomed);
    }
    for (auto n : doomed) {
        // Listed twice or removed with an ancestor
        if (_dom.contains(container, n)) {
            discard(n);
        }
    }
}

void Reconciler::collect_stream_items(
    NodeRef n, const Stream& st, std::vector<NodeRef>& out) const
{
    for (auto ch = _dom.first_child(n); ch != no_node;
         ch = _dom.next_sibling(ch)) {
        if (_dom.type(ch) != Node::Type::element) {
            continue;
        }
        if (_dom.attr(ch, bindings.stream) == st.ref) {
            // Items inserted again by this patch are kept in place
            const auto key = key_of(ch);
            auto it = key ? insertions.find(*key) : insertions.end();
            if (it == insertions.end() || it->second.ref != st.ref) {
                out.push_back(ch);
            }
            continue;
        }
        if (!is_nested_view(ch)) {
            collect_stream_items(ch, st, out);
        }
    }
}

void Reconciler::apply_limits(
    NodeRef container, const std::vector<Stream>& streams)
{
    for (auto& st : streams) {
        for (auto& in : st.inserts) {
            if (!in.limit) {
                continue;
            }
            const auto item = find_keyed(container, in.id);
            if (item == no_node) {
                continue;
            }
            const auto parent = _dom.parent(item);
            if (parse_update_mode(_dom.attr(parent, bindings.update))
                != UpdateMode::stream) {
                continue;
            }

            std::vector<NodeRef> items;
            for (auto ch : _dom.children(parent)) {
                if (_dom.type(ch) == Node::Type::element) {
                    items.push_back(ch);
                }
            }
            const auto keep = static_cast<size_t>(std::labs(*in.limit));
            if (items.size() <= keep) {
                continue;
            }
            if (*in.limit >= 0) {
                items.erase(items.begin(), items.begin() + keep);
            } else {
                items.resize(items.size() - keep);
            }
            for (auto n : items) {
                discard(n);
            }
        }
    }
}

void Reconciler::insert_item(
    NodeRef parent, NodeRef item, const std::string& key)
{
    NodeRef ref = no_node;
    auto it = insertions.find(key);
    if (it != insertions.end()) {
        _dom.set_attr(item, bindings.stream, it->second.ref);
        const long at = it->second.op.at;
        long i = 0;
        for (auto ch = _dom.first_child(parent); at >= 0 && ch != no_node;
             ch = _dom.next_sibling(ch)) {
            if (ch == item || _dom.type(ch) != Node::Type::element) {
                continue;
            }
            if (i++ == at) {
                ref = ch;
                break;
            }
        }
    }
    _dom.insert_before(parent, item, ref);
}

PatchReport Reconciler::teardown(NodeRef container)
{
    PatchReport rep;
    Active active(*this, rep);
    for (auto ch : _dom.children(container)) {
        unmount(ch, no_node);
    }
    destroy_hook(container);
    return rep;
}

void Reconciler::index(NodeRef n)
{
    for (auto ch = _dom.first_child(n); ch != no_node;
         ch = _dom.next_sibling(ch)) {
        if (_dom.type(ch) != Node::Type::element) {
            continue;
        }
        if (auto key = key_of(ch)) {
            if (keyed.emplace(*key, ch).second) {
                keyed_order.push_back(ch);
            } else {
                console::warn("duplicate element key: " + *key);
            }
        }

        // Contents of these are never patched, so their descendants can not
        // be moved out of them
        if (is_nested_view(ch) || is_ignored(ch)
            || _dom.has_attr(ch, bindings.ref) || ch == focused) {
            continue;
        }
        index(ch);
    }
}

std::optional<std::string> Reconciler::key_of(NodeRef n) const
{
    if (_dom.type(n) != Node::Type::element) {
        return std::nullopt;
    }
    auto key = _dom.attr(n, bindings.key);
    if (!key || key->empty()) {
        return std::nullopt;
    }
    return key;
}

std::optional<std::string> Reconciler::key_of(const Node& n) const
{
    if (!n.is_element()) {
        return std::nullopt;
    }
    auto key = n.attr(bindings.key);
    if (!key || key->empty()) {
        return std::nullopt;
    }
    return key;
}

bool Reconciler::is_pending(NodeRef n) const
{
    const auto key = key_of(n);
    if (!key) {
        return false;
    }
    auto it = keyed.find(*key);
    return it != keyed.end() && it->second == n;
}

NodeRef Reconciler::take_keyed(
    const std::string& key, const Node& to, NodeRef parent)
{
    auto it = keyed.find(key);
    if (it == keyed.end()) {
        return no_node;
    }
    const auto n = it->second;
    if (!compatible(n, to) || _dom.contains(n, parent)) {
        return no_node;
    }
    keyed.erase(it);
    return n;
}

bool Reconciler::compatible(NodeRef from, const Node& to) const
{
    if (_dom.type(from) != to.type) {
        return false;
    }
    if (!to.is_element()) {
        return true;
    }
    if (_dom.tag(from) != to.tag) {
        return false;
    }
    const bool nested = is_nested_view(from);
    if (nested != to.has_attr(bindings.parent_id)) {
        return false;
    }
    if (!nested) {
        return true;
    }
    return key_of(from) == key_of(to)
        && _dom.attr(from, bindings.session) == to.attr(bindings.session);
}

bool Reconciler::is_nested_view(NodeRef n) const
{
    return _dom.type(n) == Node::Type::element
        && _dom.has_attr(n, bindings.parent_id);
}

bool Reconciler::is_ignored(NodeRef n) const
{
    return parse_update_mode(_dom.attr(n, bindings.update))
        == UpdateMode::ignore;
}

bool Reconciler::is_form_input(NodeRef n) const
{
    if (_dom.type(n) != Node::Type::element) {
        return false;
    }
    const auto tag = _dom.tag(n);
    if (tag != "input" && tag != "select" && tag != "textarea") {
        return false;
    }
    return _dom.attr(n, "type") != "button";
}

bool Reconciler::is_textual_input(NodeRef n) const
{
    if (_dom.type(n) != Node::Type::element) {
        return false;
    }
    const auto tag = _dom.tag(n);
    std::string type;
    if (tag == "textarea") {
        type = "textarea";
    } else if (tag == "input") {
        type = to_lower(_dom.attr(n, "type").value_or("text"));
    } else {
        return false;
    }
    auto& types = bindings.textual_inputs;
    return std::find(types.begin(), types.end(), type) != types.end();
}

void Reconciler::drop_unkeyed(const Node& n) const
{
    switch (n.type) {
    case Node::Type::comment:
        return;
    case Node::Type::text:
        if (is_blank(n.text)) {
            return;
        }
        break;
    case Node::Type::element:
        break;
    }
    console::error(
        "only elements with a key are allowed inside keyed containers, "
        "removing illegal node: "
        + n.html());
}

void Reconciler::touch(Visit& v)
{
    if (v.changed) {
        return;
    }
    v.changed = true;
    if (v.hook) {
        auto h = v.hook;
        guard("before_update", v.el, [h] { h->before_update(); });
    }
}

void Reconciler::finish(Visit& v)
{
    if (v.changed) {
        report->updated.push_back(v.el);
        if (v.hook && hooks && hooks->find(v.el) == v.hook) {
            auto h = v.hook;
            guard("updated", v.el, [h] { h->updated(); });
        }
        if (callbacks.updated) {
            guard("updated", v.el, [&] { callbacks.updated(v.el); });
        }
    }
    sync_hook(v.el);
}

void Reconciler::morph_node(NodeRef from, const Node& to, Visit& parent)
{
    if (to.is_element()) {
        morph(from, to);
        return;
    }
    if (_dom.text(from) != to.text) {
        touch(parent);
        _dom.set_text(from, to.text);
    }
}

void Reconciler::morph(NodeRef from, const Node& to)
{
    // Unacknowledged client changes and nested views are left as is
    if (_dom.has_attr(from, bindings.ref) || is_nested_view(from)) {
        return;
    }

    Visit v { from, hooks ? hooks->find(from) : nullptr };
    if (is_ignored(from)) {
        merge_attrs(v, to, Merge::ignored);
    } else if (from == focused && is_form_input(from)) {
        // Selects reset their highlighted option on any attribute change
        if (_dom.tag(from) != "select") {
            merge_attrs(v, to, Merge::focused);
        }
    } else {
        merge_attrs(v, to, Merge::full);
        morph_children(v, to.children,
            parse_update_mode(to.attr(bindings.update)));
    }
    finish(v);
}

void Reconciler::merge_attrs(Visit& v, const Node& to, Merge mode)
{
    const auto current = _dom.attrs(v.el);
    for (auto & [ key, val ] : to.attrs) {
        if (mode == Merge::focused && key == "value") {
            continue;
        }
        auto it = current.find(key);
        if (it == current.end() || it->second != val) {
            touch(v);
            _dom.set_attr(v.el, key, val);
        }
    }

    for (auto & [ key, _ ] : current) {
        if (to.attrs.count(key) || key == bindings.has_focused
            || key == bindings.has_submitted || key == bindings.ref
            || key == bindings.stream) {
            continue;
        }
        switch (mode) {
        case Merge::ignored:
            if (key.compare(0, 5, "data-")) {
                continue;
            }
            break;
        case Merge::focused:
            if (key == "value") {
                continue;
            }
            break;
        case Merge::full:
            break;
        }
        touch(v);
        _dom.remove_attr(v.el, key);
    }
}

void Reconciler::morph_children(
    Visit& v, const Children& target, UpdateMode mode)
{
    switch (mode) {
    case UpdateMode::ignore:
        return;
    case UpdateMode::append:
    case UpdateMode::prepend:
    case UpdateMode::stream:
        morph_appended(v, target, mode);
        return;
    default:
        break;
    }

    const auto parent = v.el;
    const auto old = _dom.children(parent);
    std::unordered_set<NodeRef> placed;
    size_t cursor = 0;
    NodeRef prev = no_node;

    for (auto& t : target) {
        const auto key = key_of(t);
        if (!key && mode == UpdateMode::keyed) {
            drop_unkeyed(t);
            continue;
        }

        NodeRef match = no_node;
        if (key) {
            match = take_keyed(*key, t, parent);
        } else {
            // Next unkeyed old child, that is still in place
            while (cursor < old.size()
                && (placed.count(old[cursor]) || key_of(old[cursor])
                    || _dom.parent(old[cursor]) != parent)) {
                cursor++;
            }
            if (cursor < old.size() && compatible(old[cursor], t)) {
                match = old[cursor++];
            }
        }

        if (match != no_node) {
            const auto expected = next_slot(parent, prev);
            if (match != expected) {
                touch(v);
                _dom.insert_before(parent, match, expected);
            }
            morph_node(match, t, v);
        } else {
            // Building can move keyed siblings into the new subtree, so the
            // slot is only known afterwards
            match = build(t, parent);
            touch(v);
            _dom.insert_before(parent, match, next_slot(parent, prev));
            inserted(match);
        }
        placed.insert(match);
        prev = match;
    }

    for (auto n : old) {
        if (placed.count(n) || _dom.parent(n) != parent || is_pending(n)) {
            // Pending keyed elements can still be moved elsewhere and are
            // discarded at the end of the patch otherwise
            continue;
        }
        touch(v);
        discard(n);
    }
}

NodeRef Reconciler::next_slot(NodeRef parent, NodeRef prev) const
{
    return prev == no_node ? _dom.first_child(parent) : _dom.next_sibling(prev);
}

void Reconciler::morph_appended(
    Visit& v, const Children& target, UpdateMode mode)
{
    const auto parent = v.el;

    // Existing children are kept, even if absent from the new markup
    std::unordered_map<std::string, NodeRef> kept;
    for (auto ch : _dom.children(parent)) {
        if (auto key = key_of(ch)) {
            if (is_pending(ch)) {
                keyed.erase(*key);
            }
            kept.emplace(*key, ch);
        }
    }

    const auto first = _dom.first_child(parent);
    for (auto& t : target) {
        const auto key = key_of(t);
        if (!key) {
            drop_unkeyed(t);
            continue;
        }

        auto it = kept.find(*key);
        if (it != kept.end() && compatible(it->second, t)) {
            const auto n = it->second;
            kept.erase(it);
            morph(n, t);
            continue;
        }

        auto n = take_keyed(*key, t, parent);
        const bool existing = n != no_node;
        if (!existing) {
            n = build(t, parent);
        }
        touch(v);
        if (mode == UpdateMode::stream) {
            insert_item(parent, n, *key);
        } else {
            _dom.insert_before(
                parent, n, mode == UpdateMode::prepend ? first : no_node);
        }
        if (existing) {
            morph(n, t);
        } else {
            inserted(n);
        }
    }
}

NodeRef Reconciler::build(const Node& t, NodeRef anchor)
{
    switch (t.type) {
    case Node::Type::text:
        return _dom.create_text(t.text);
    case Node::Type::comment:
        return _dom.create_comment(t.text);
    case Node::Type::element:
        break;
    }

    const auto n = _dom.create_element(t.tag);
    for (auto & [ key, val ] : t.attrs) {
        _dom.set_attr(n, key, val);
    }
    const auto mode = parse_update_mode(t.attr(bindings.update));
    const bool keyed_only = mode == UpdateMode::keyed
        || mode == UpdateMode::append || mode == UpdateMode::prepend
        || mode == UpdateMode::stream;
    for (auto& ch : t.children) {
        const auto key = key_of(ch);
        if (!key && keyed_only) {
            drop_unkeyed(ch);
            continue;
        }

        // Move existing keyed elements into the new subtree
        if (key) {
            const auto existing = take_keyed(*key, ch, anchor);
            if (existing != no_node) {
                if (mode == UpdateMode::stream) {
                    insert_item(n, existing, *key);
                } else {
                    _dom.insert_before(n, existing, no_node);
                }
                reused.insert(existing);
                morph(existing, ch);
                continue;
            }
        }
        const auto built = build(ch, anchor);
        if (mode == UpdateMode::stream) {
            insert_item(n, built, *key);
        } else {
            _dom.insert_before(n, built, no_node);
        }
    }
    return n;
}

void Reconciler::inserted(NodeRef n)
{
    report->inserted.push_back(n);
    if (callbacks.added) {
        guard("added", n, [&] { callbacks.added(n); });
    }
    mount(n);
}

void Reconciler::mount(NodeRef n)
{
    if (_dom.type(n) != Node::Type::element || reused.count(n)) {
        return;
    }
    if (is_nested_view(n)) {
        report->views_added.push_back(n);
        if (callbacks.view_added) {
            guard("view_added", n, [&] { callbacks.view_added(n); });
        }
        return;
    }
    sync_hook(n);
    for (auto ch : _dom.children(n)) {
        mount(ch);
    }
}

void Reconciler::discard(NodeRef n)
{
    unmount(n, n);
    if (callbacks.discarded) {
        guard("discarded", n, [&] { callbacks.discarded(n); });
    }
    _dom.remove(n);
    report->discarded.push_back(n);
}

void Reconciler::unmount(NodeRef n, NodeRef root)
{
    if (_dom.type(n) != Node::Type::element) {
        return;
    }
    if (n != root && is_pending(n)) {
        return;
    }
    if (is_nested_view(n)) {
        report->views_removed.push_back(n);
        if (callbacks.view_removed) {
            guard("view_removed", n, [&] { callbacks.view_removed(n); });
        }
        return;
    }
    destroy_hook(n);
    for (auto ch : _dom.children(n)) {
        unmount(ch, root);
    }
}

void Reconciler::sync_hook(NodeRef n)
{
    if (!hooks) {
        return;
    }
    const auto name = _dom.attr(n, bindings.hook);
    const auto h = hooks->find(n);
    if (h && !name) {
        destroy_hook(n);
    } else if (!h && name) {
        Hook* created = nullptr;
        guard("mounted", n, [&] { created = hooks->attach(_dom, n, *name); });
        if (created) {
            guard("mounted", n, [created] { created->mounted(); });
        }
    }
}

void Reconciler::destroy_hook(NodeRef n)
{
    if (!hooks) {
        return;
    }
    auto h = hooks->detach(n);
    if (h) {
        guard("destroyed", n, [&] { h->destroyed(); });
    }
}

NodeRef Reconciler::find_keyed(
    NodeRef container, const std::string& key) const
{
    for (auto ch = _dom.first_child(container); ch != no_node;
         ch = _dom.next_sibling(ch)) {
        if (_dom.type(ch) != Node::Type::element) {
            continue;
        }
        if (key_of(ch) == key) {
            return ch;
        }
        if (is_nested_view(ch)) {
            continue;
        }
        if (auto n = find_keyed(ch, key)) {
            return n;
        }
    }
    return no_node;
}

NodeRef Reconciler::find_input(
    NodeRef container, const std::string& name) const
{
    for (auto ch = _dom.first_child(container); ch != no_node;
         ch = _dom.next_sibling(ch)) {
        if (_dom.type(ch) != Node::Type::element) {
            continue;
        }
        if (_dom.attr(ch, "name") == name || _dom.attr(ch, "id") == name) {
            return ch;
        }
        if (is_nested_view(ch)) {
            continue;
        }
        if (auto n = find_input(ch, name)) {
            return n;
        }
    }
    return no_node;
}

// Add or remove a class of an element
static void toggle_class(Dom& dom, NodeRef el, const std::string& cls, bool on)
{
    auto classes = split_words(dom.attr(el, "class").value_or(""));
    auto it = std::find(classes.begin(), classes.end(), cls);
    const bool has = it != classes.end();
    if (has == on) {
        return;
    }
    if (on) {
        classes.push_back(cls);
    } else {
        classes.erase(it);
    }

    if (classes.empty()) {
        dom.remove_attr(el, "class");
        return;
    }
    std::string val;
    for (auto& c : classes) {
        if (!val.empty()) {
            val += ' ';
        }
        val += c;
    }
    dom.set_attr(el, "class", val);
}

void Reconciler::apply_feedback(NodeRef container, NodeRef n)
{
    for (auto ch = _dom.first_child(n); ch != no_node;
         ch = _dom.next_sibling(ch)) {
        if (_dom.type(ch) != Node::Type::element || is_nested_view(ch)) {
            continue;
        }
        if (auto name = _dom.attr(ch, bindings.feedback_for)) {
            const auto input = find_input(container, *name);
            bool show = false;
            if (input != no_node) {
                const auto form = _dom.closest(input, "form");
                show = _dom.has_attr(input, bindings.has_focused)
                    || (form != no_node
                        && _dom.has_attr(form, bindings.has_submitted));
            }
            toggle_class(_dom, ch, bindings.no_feedback, !show);
        }
        if (!is_ignored(ch)) {
            apply_feedback(container, ch);
        }
    }
}
}
