#include "shadow.hh"
#include "errors.hh"
#include "serializer.hh"

namespace sigrun {

void Shadow::merge(const nlohmann::json& wire)
{
    if (is_full(wire)) {
        auto tree = decode_rendered(wire);
        reset(std::move(tree), decode_components(wire));
    } else {
        merge(decode_changes(wire, &_components));
    }
}

void Shadow::merge(const ChangeSet& changes)
{
    if (!rendered) {
        throw Error("shadow: changes received before a full render");
    }
    auto tree = sigrun::merge(*rendered, changes);
    auto components = _components;
    sigrun::merge(components, changes);
    rendered = std::move(tree);
    _components = std::move(components);
}

void Shadow::prune_streams()
{
    if (!rendered) {
        return;
    }
    rendered = sigrun::prune_streams(*rendered);
    for (auto & [ _, c ] : _components) {
        c = sigrun::prune_streams(c);
    }
}

const Rendered& Shadow::tree() const
{
    if (!rendered) {
        throw Error("shadow: no render received");
    }
    return *rendered;
}
}
