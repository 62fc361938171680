#pragma once

#include "dom.hh"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace sigrun {

// Client-side lifecycle callbacks bound to an element by the hook attribute.
// Override the methods needed.
class Hook {
public:
    virtual ~Hook() = default;

    // Element the hook is bound to
    NodeRef el = no_node;

    // DOM the element lives in
    Dom* dom = nullptr;

    // Element was inserted into the DOM
    virtual void mounted() {}

    // Element is about to be patched in place
    virtual void before_update() {}

    // Element was patched in place
    virtual void updated() {}

    // Element was removed from the DOM
    virtual void destroyed() {}
};

// Creates hooks by name and owns the hook instances of live elements
class HookRegistry {
public:
    typedef std::function<std::unique_ptr<Hook>()> Factory;

    // Register a hook constructor under a name. Overwrites any previous one.
    void define(const std::string& name, Factory);

    // Construct a hook of the named type for an element. Returns nullptr, if
    // no such hook is defined.
    Hook* attach(Dom&, NodeRef el, const std::string& name);

    // Returns the hook of an element or nullptr
    Hook* find(NodeRef el) const;

    // Release the hook of an element and return it. Returns nullptr, if none.
    std::unique_ptr<Hook> detach(NodeRef el);

    // Returns, if a hook with this name is defined
    bool defined(const std::string& name) const { return factories.count(name); }

    // Number of live hook instances
    size_t size() const { return live.size(); }

private:
    std::unordered_map<std::string, Factory> factories;
    std::unordered_map<NodeRef, std::unique_ptr<Hook>> live;
};
}
