#include "hooks.hh"
#include "console.hh"

namespace sigrun {

void HookRegistry::define(const std::string& name, Factory fn)
{
    factories[name] = std::move(fn);
}

Hook* HookRegistry::attach(Dom& dom, NodeRef el, const std::string& name)
{
    auto it = factories.find(name);
    if (it == factories.end()) {
        console::warn("unknown hook: " + name);
        return nullptr;
    }
    auto h = it->second();
    if (!h) {
        return nullptr;
    }
    h->el = el;
    h->dom = &dom;
    auto& slot = live[el];
    slot = std::move(h);
    return slot.get();
}

Hook* HookRegistry::find(NodeRef el) const
{
    auto it = live.find(el);
    return it == live.end() ? nullptr : it->second.get();
}

std::unique_ptr<Hook> HookRegistry::detach(NodeRef el)
{
    auto it = live.find(el);
    if (it == live.end()) {
        return nullptr;
    }
    auto h = std::move(it->second);
    live.erase(it);
    return h;
}
}
