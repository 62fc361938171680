#pragma once

#include "dom.hh"
#include "hooks.hh"
#include "node.hh"
#include "rendered.hh"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace sigrun {

// Names of the DOM attributes read and written by the Reconciler
struct Bindings {
    // Identity of an element for matching across patches
    std::string key = "id";

    // Update mode of an element's children. See UpdateMode.
    std::string update = "sg-update";

    // Marks the root of a nested independent view
    std::string parent_id = "data-sg-parent-id";

    // Session of a nested independent view. A nested view is replaced,
    // when its session changes.
    std::string session = "data-sg-session";

    // Set on stream items to the ref of their stream
    std::string stream = "data-sg-stream";

    // Set by the client on elements with changes not yet acknowledged by the
    // server
    std::string ref = "data-sg-ref";

    // Name of the Hook to bind to the element
    std::string hook = "sg-hook";

    // Set by the client on inputs, that have been focused
    std::string has_focused = "sg-has-focused";

    // Set by the client on forms, that have been submitted
    std::string has_submitted = "sg-has-submitted";

    // Names the input an element shows feedback for
    std::string feedback_for = "sg-feedback-for";

    // Class hiding feedback of inputs not yet interacted with
    std::string no_feedback = "sg-no-feedback";

    // Input types, whose selection range is restored after a patch
    std::vector<std::string> textual_inputs = {
        "text",
        "textarea",
        "search",
        "url",
        "tel",
        "password",
        "email",
        "number",
    };
};

// How the children of an element are patched
enum class UpdateMode {
    // Match children by key or position, insert and remove as needed
    replace,
    // Never touch the children. Only the attributes of the element are merged.
    ignore,
    // Only keyed children allowed. Children are matched by key.
    keyed,
    // Keyed children are patched in place or appended. None are removed.
    append,
    // Keyed children are patched in place or prepended. None are removed.
    prepend,
    // Keyed children are patched in place or inserted as directed by the
    // stream operations of the patch. Only removed by stream operations.
    stream,
};

// Parse the update mode attribute value. Missing or unknown values are
// UpdateMode::replace.
UpdateMode parse_update_mode(const std::optional<std::string>&);

// Outcome of a single patch
struct PatchReport {
    // Roots of inserted subtrees
    std::vector<NodeRef> inserted;

    // Elements, whose attributes or direct children changed
    std::vector<NodeRef> updated;

    // Roots of removed subtrees
    std::vector<NodeRef> discarded;

    // Roots of nested views inserted and removed
    std::vector<NodeRef> views_added, views_removed;

    // Number of callbacks, that threw
    unsigned callback_errors = 0;

    // The focused element was refocused or had its selection restored
    bool focus_restored = false;
};

// Optional callbacks invoked synchronously during a patch. Exceptions thrown
// by them are logged and counted in the PatchReport.
struct PatchCallbacks {
    // Root of a subtree was inserted
    std::function<void(NodeRef)> added;

    // Element was patched in place
    std::function<void(NodeRef)> updated;

    // Root of a subtree is about to be removed
    std::function<void(NodeRef)> discarded;

    // Nested view root was inserted and its session should be mounted
    std::function<void(NodeRef)> view_added;

    // Nested view root is about to be removed and its session should be torn
    // down
    std::function<void(NodeRef)> view_removed;
};

// Patches a live DOM subtree to match new markup, preserving the identity of
// matched nodes, the focused element and its selection
class Reconciler {
public:
    Bindings bindings;
    PatchCallbacks callbacks;

    // hooks: optional hook registry for binding Hook instances to elements
    Reconciler(Dom& dom, HookRegistry* hooks = nullptr, Bindings = {});

    // Patch the children of container to match html. streams: operations
    // on the stream containers inside container.
    PatchReport patch(NodeRef container, std::string_view html,
        const std::vector<Stream>& streams = {});

    // Patch the children of container to match the target nodes
    PatchReport patch(NodeRef container, const Children& target,
        const std::vector<Stream>& streams = {});

    // Destroy all hooks and tear down all nested views in the subtree of
    // container without modifying the DOM
    PatchReport teardown(NodeRef container);

    Dom& dom() { return _dom; }

private:
    // Element being patched in place
    struct Visit {
        NodeRef el;
        Hook* hook;
        bool changed = false;
    };

    enum class Merge { full, focused, ignored };

    // Pending insertion of a stream item
    struct Insertion {
        std::string ref;
        StreamInsert op;
    };

    Dom& _dom;
    HookRegistry* hooks;

    // State of the patch in progress
    PatchReport* report = nullptr;
    NodeRef focused = no_node;

    // Keyed elements not yet matched
    std::unordered_map<std::string, NodeRef> keyed;

    // Keyed elements in document order at the start of the patch
    std::vector<NodeRef> keyed_order;

    // Stream insertions of the patch by item key
    std::unordered_map<std::string, Insertion> insertions;

    // Existing elements moved into newly built subtrees
    std::unordered_set<NodeRef> reused;

    // Resets the state of the patch in progress on destruction
    class Active;

    void index(NodeRef);
    std::optional<std::string> key_of(NodeRef) const;
    std::optional<std::string> key_of(const Node&) const;
    bool is_pending(NodeRef) const;
    NodeRef take_keyed(const std::string& key, const Node&, NodeRef parent);
    bool compatible(NodeRef, const Node&) const;
    bool is_nested_view(NodeRef) const;
    bool is_ignored(NodeRef) const;
    bool is_form_input(NodeRef) const;
    bool is_textual_input(NodeRef) const;

    // Skip an unkeyed child of a keyed container. Logs an error for nodes
    // other than whitespace and comments.
    void drop_unkeyed(const Node&) const;

    // Discard every keyed element never matched in the new markup
    void discard_unmatched(NodeRef container);

    void remove_stream_items(NodeRef container, const Stream&);
    void collect_stream_items(
        NodeRef n, const Stream&, std::vector<NodeRef>& out) const;
    void apply_limits(NodeRef container, const std::vector<Stream>&);

    // Insert a stream item into parent at the position of its insertion
    void insert_item(NodeRef parent, NodeRef item, const std::string& key);

    void morph(NodeRef from, const Node& to);
    void morph_node(NodeRef from, const Node& to, Visit& parent);
    void morph_children(Visit&, const Children&, UpdateMode);
    void morph_appended(Visit&, const Children&, UpdateMode);

    // Node to insert the next child after prev before
    NodeRef next_slot(NodeRef parent, NodeRef prev) const;
    void merge_attrs(Visit&, const Node& to, Merge);
    void touch(Visit&);
    void finish(Visit&);

    NodeRef build(const Node&, NodeRef anchor);
    void inserted(NodeRef);
    void mount(NodeRef);
    void discard(NodeRef);
    void unmount(NodeRef n, NodeRef root);
    void sync_hook(NodeRef);
    void destroy_hook(NodeRef);
    void apply_feedback(NodeRef container, NodeRef n);
    NodeRef find_input(NodeRef container, const std::string& name) const;
    NodeRef find_keyed(NodeRef container, const std::string& key) const;

    // Run a callback, logging and counting any thrown exception
    template <class F> void guard(const char* what, NodeRef, F&& fn);
};
}
