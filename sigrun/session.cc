#include "session.hh"
#include "errors.hh"
#include "serializer.hh"

namespace sigrun {

void Session::retain(Rendered tree, Components components)
{
    saved = prune_streams(tree);
    for (auto & [ _, c ] : components) {
        c = prune_streams(c);
    }
    saved_components = std::move(components);
}

Session::Mount Session::mount(Rendered tree, Components components)
{
    Mount m{ sigrun::html(tree, components), encode(tree, components) };
    retain(std::move(tree), std::move(components));
    render_count = 0;
    return m;
}

ChangeSet Session::render_changes(Rendered tree, Components components)
{
    if (!saved) {
        throw Error("session: render before mount");
    }

    ChangeSet changes;
    try {
        changes = diff(*saved, tree, saved_components, components);
    } catch (const Error&) {
        reset();
        throw;
    }
    retain(std::move(tree), std::move(components));
    render_count++;
    return changes;
}

std::optional<nlohmann::json> Session::render(
    Rendered tree, Components components)
{
    // Components known to the client, before retaining the new ones
    const auto prev = saved_components;
    auto changes = render_changes(std::move(tree), std::move(components));
    if (changes.empty()) {
        return std::nullopt;
    }
    return encode(changes, &prev);
}

const Rendered& Session::last() const
{
    if (!saved) {
        throw Error("session: not mounted");
    }
    return *saved;
}

void Session::reset()
{
    saved = std::nullopt;
    saved_components.clear();
    render_count = 0;
}
}
