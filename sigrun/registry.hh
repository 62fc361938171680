#pragma once

#include "rendered.hh"
#include <string>
#include <unordered_map>
#include <vector>

namespace sigrun {

// Maps template site identities to their static fragments. Trees built
// through the same registry share Statics per site, which keeps diffing on
// the pointer comparison fast path.
// Not thread-safe. Use one registry per thread or guard it externally.
class TemplateRegistry {
public:
    // Register the static fragments of a template site and return the shared
    // Statics. Registering equal fragments again returns the already stored
    // Statics. Registering different fragments replaces them, as happens when
    // a template is recompiled.
    Statics define(const std::string& id, std::vector<std::string> fragments);

    // Returns the Statics of a template site.
    // Throws sigrun::Error, if the site is not registered.
    const Statics& get(const std::string& id) const;

    // Returns, if the template site is registered
    bool contains(const std::string& id) const { return templates.count(id); }

    // Number of registered template sites
    size_t size() const { return templates.size(); }

    // Build a tree from a registered template site
    Rendered render(const std::string& id, std::vector<Dynamic> dynamics) const;

    // Build a comprehension from a registered template site
    Comprehension comprehension(
        const std::string& id, std::vector<Row> entries) const;

private:
    std::unordered_map<std::string, Statics> templates;
};
}
