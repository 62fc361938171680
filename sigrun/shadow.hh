#pragma once

#include "diff.hh"
#include "rendered.hh"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sigrun {

// Client-side copy of the last tree and components received from the
// server. Changes from the wire are merged into it to reconstruct the markup
// to patch the DOM with.
class Shadow {
public:
    // Apply a wire value. A full tree replaces the copy, changes are merged
    // into it. On error the copy is left unchanged.
    // Throws DecodeError, ArityMismatch or StructuralMismatch on invalid
    // input and sigrun::Error on changes before the first full tree.
    void merge(const nlohmann::json& wire);

    // Merge decoded changes into the copy
    void merge(const ChangeSet& changes);

    // Replace the copy with a full tree
    void reset(Rendered tree, Components components = {})
    {
        rendered = std::move(tree);
        _components = std::move(components);
    }

    // Drop the copy
    void clear()
    {
        rendered = std::nullopt;
        _components.clear();
    }

    // Returns, if no full tree was received yet
    bool empty() const { return !rendered; }

    // Returns the current copy. Throws sigrun::Error, if empty.
    const Rendered& tree() const;

    const Components& components() const { return _components; }

    // Flatten the current copy to HTML. Throws sigrun::Error, if empty.
    std::string html() const { return sigrun::html(tree(), _components); }

    // Stream operations of the current copy in document order
    std::vector<Stream> streams() const
    {
        return collect_streams(tree(), &_components);
    }

    // Drop the items and operations of all streams, once applied to the DOM
    void prune_streams();

private:
    std::optional<Rendered> rendered;
    Components _components;
};
}
