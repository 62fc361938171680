#pragma once

#include "diff.hh"
#include "rendered.hh"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace sigrun {

// Server-side render state of a single connected client. Retains the last
// tree and components sent to the client and turns every following render
// into the changes to send. Items of streams are not retained.
// Not thread-safe. Each connection must own its Session.
class Session {
public:
    // Initial payload of a connection
    struct Mount {
        // Flattened tree for the first paint
        std::string html;

        // Full tree in wire format
        nlohmann::json rendered;
    };

    // Retain the tree as the first render and return it in full.
    // Any previously retained tree is discarded.
    Mount mount(Rendered tree, Components components = {});

    // Diff the tree and components against the retained ones and retain
    // them. Returns encoded changes or std::nullopt, if nothing changed.
    // Throws sigrun::Error, if not mounted, and StructuralMismatch, if the
    // tree is from a different template site. In both cases the retained
    // tree is dropped and the connection has to be mounted again.
    std::optional<nlohmann::json> render(
        Rendered tree, Components components = {});

    // Same as render(), but returns the ChangeSet instead of the wire value
    ChangeSet render_changes(Rendered tree, Components components = {});

    // Returns, if a tree is retained
    bool mounted() const { return saved.has_value(); }

    // Number of renders diffed since the last mount
    unsigned long renders() const { return render_count; }

    // Returns the retained tree. Throws sigrun::Error, if not mounted.
    const Rendered& last() const;

    // Retained components
    const Components& components() const { return saved_components; }

    // Drop the retained tree
    void reset();

private:
    std::optional<Rendered> saved;
    Components saved_components;
    unsigned long render_count = 0;

    void retain(Rendered tree, Components components);
};
}
