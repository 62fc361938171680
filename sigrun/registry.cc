#include "registry.hh"
#include "errors.hh"

namespace sigrun {

Statics TemplateRegistry::define(
    const std::string& id, std::vector<std::string> fragments)
{
    if (fragments.empty()) {
        throw ArityMismatch("template " + id + ": no static fragments");
    }
    auto& st = templates[id];
    if (!st || *st != fragments) {
        st = make_statics(std::move(fragments));
    }
    return st;
}

const Statics& TemplateRegistry::get(const std::string& id) const
{
    auto it = templates.find(id);
    if (it == templates.end()) {
        throw Error("unknown template: " + id);
    }
    return it->second;
}

Rendered TemplateRegistry::render(
    const std::string& id, std::vector<Dynamic> dynamics) const
{
    return Rendered(get(id), std::move(dynamics));
}

Comprehension TemplateRegistry::comprehension(
    const std::string& id, std::vector<Row> entries) const
{
    return Comprehension(get(id), std::move(entries));
}
}
