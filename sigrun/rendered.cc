#include "rendered.hh"
#include "console.hh"
#include "errors.hh"
#include "parser.hh"
#include <algorithm>
#include <sstream>

namespace sigrun {

const char* const component_attr = "data-sg-component";

// Writes trees as HTML, resolving component references through an optional
// component table
class Flattener {
public:
    Flattener(Rope& s, const Components* components)
        : s(s)
        , components(components)
    {
    }

    void write(const Rendered& r) { write(*r.statics(), r.dynamics()); }

    void write(const Comprehension& c)
    {
        for (auto& row : c.entries()) {
            write(*c.statics(), row);
        }
    }

    void write(const std::vector<std::string>& statics, const Row& row)
    {
        s << statics[0];
        for (size_t i = 0; i < row.size(); i++) {
            write(row[i]);
            s << statics[i + 1];
        }
    }

    void write(const Dynamic& d)
    {
        switch (d.kind()) {
        case Dynamic::Kind::scalar:
            s << d.scalar();
            break;
        case Dynamic::Kind::nested:
            write(d.nested());
            break;
        case Dynamic::Kind::comprehension:
            write(d.comprehension());
            break;
        case Dynamic::Kind::component:
            write_component(d.component());
            break;
        }
    }

private:
    Rope& s;
    const Components* components;

    // Components being written, innermost last
    std::vector<unsigned> open;

    void write_component(unsigned cid)
    {
        const auto id = std::to_string(cid);
        if (!components) {
            throw Error("rendered: component " + id
                + " referenced without a component table");
        }
        auto it = components->find(cid);
        if (it == components->end()) {
            throw StructuralMismatch("rendered: no component with id " + id);
        }
        if (std::find(open.begin(), open.end(), cid) != open.end()) {
            throw StructuralMismatch(
                "rendered: component " + id + " renders itself");
        }

        Rope inner;
        Flattener f(inner, components);
        f.open = open;
        f.open.push_back(cid);
        f.write(it->second);

        for (auto& n : parse_html(inner.str())) {
            switch (n.type) {
            case Node::Type::element:
                n.attrs[component_attr] = id;
                n.write_html(s);
                break;
            case Node::Type::text:
                if (!is_blank(n.text)) {
                    console::error("component " + id
                        + " has text at its root, wrapping it in a span: "
                        + n.text);
                    Node(
                        "span", { { component_attr, id } }, { std::move(n) })
                        .write_html(s);
                    break;
                }
                n.write_html(s);
                break;
            case Node::Type::comment:
                n.write_html(s);
                break;
            }
        }
    }
};

Statics make_statics(std::vector<std::string> fragments)
{
    return std::make_shared<const std::vector<std::string>>(
        std::move(fragments));
}

bool same_statics(const Statics& a, const Statics& b)
{
    if (a == b) {
        // Hot path: same template site
        return true;
    }
    if (!a || !b) {
        return false;
    }
    return *a == *b;
}

void check_arity(const Statics& statics, size_t dynamics, const char* where)
{
    if (!statics || statics->size() != dynamics + 1) {
        std::ostringstream s;
        s << where << ": " << (statics ? statics->size() : 0)
          << " statics can not hold " << dynamics << " dynamics";
        throw ArityMismatch(s.str());
    }
}

void write_row(Rope& s, const std::vector<std::string>& statics, const Row& row)
{
    Flattener(s, nullptr).write(statics, row);
}

Dynamic::Dynamic(Rendered r)
    : val(std::make_shared<const Rendered>(std::move(r)))
{
}

Dynamic::Dynamic(Comprehension c)
    : val(std::make_shared<const Comprehension>(std::move(c)))
{
}

Dynamic::Dynamic(std::shared_ptr<const Rendered> r)
    : val(std::move(r))
{
    if (!nested_ptr()) {
        throw Error("dynamic: null tree");
    }
}

Dynamic::Dynamic(std::shared_ptr<const Comprehension> c)
    : val(std::move(c))
{
    if (!comprehension_ptr()) {
        throw Error("dynamic: null comprehension");
    }
}

void Dynamic::write_html(Rope& s) const { Flattener(s, nullptr).write(*this); }

bool Dynamic::operator==(const Dynamic& rhs) const
{
    if (kind() != rhs.kind()) {
        return false;
    }
    switch (kind()) {
    case Kind::scalar:
        return scalar() == rhs.scalar();
    case Kind::nested:
        return nested_ptr() == rhs.nested_ptr() || nested() == rhs.nested();
    case Kind::comprehension:
        return comprehension_ptr() == rhs.comprehension_ptr()
            || comprehension() == rhs.comprehension();
    case Kind::component:
        return component() == rhs.component();
    }
    return false;
}

Rendered::Rendered(Statics statics, std::vector<Dynamic> dynamics)
    : _statics(std::move(statics))
    , _dynamics(std::move(dynamics))
{
    check_arity(_statics, _dynamics.size(), "rendered");
}

std::string Rendered::html() const
{
    Rope s;
    write_html(s);
    return s.str();
}

void Rendered::write_html(Rope& s) const { Flattener(s, nullptr).write(*this); }

bool Rendered::operator==(const Rendered& rhs) const
{
    return same_statics(_statics, rhs._statics) && _dynamics == rhs._dynamics;
}

Comprehension::Comprehension(
    Statics statics, std::vector<Row> entries, std::optional<Stream> stream)
    : _statics(std::move(statics))
    , _entries(std::move(entries))
    , _stream(std::move(stream))
{
    // Statics must be valid even without any entries, as they are sent to
    // the client for rendering future entries
    if (!_statics || _statics->empty()) {
        throw ArityMismatch("comprehension: statics must not be empty");
    }
    for (auto& row : _entries) {
        check_arity(_statics, row.size(), "comprehension entry");
    }
    if (_stream && _stream->inserts.size() > _entries.size()) {
        throw ArityMismatch("comprehension: more stream inserts than entries");
    }
}

Comprehension Comprehension::pruned() const
{
    std::optional<Stream> st;
    if (_stream) {
        st = Stream{ _stream->ref };
    }
    return Comprehension(_statics, {}, std::move(st));
}

std::string Comprehension::html() const
{
    Rope s;
    write_html(s);
    return s.str();
}

void Comprehension::write_html(Rope& s) const
{
    Flattener(s, nullptr).write(*this);
}

bool Comprehension::operator==(const Comprehension& rhs) const
{
    return same_statics(_statics, rhs._statics) && _entries == rhs._entries
        && _stream == rhs._stream;
}

std::string html(const Rendered& r, const Components& components)
{
    Rope s;
    Flattener(s, &components).write(r);
    return s.str();
}

static void collect_streams(
    const Row&, std::vector<Stream>&, const Components*, std::vector<unsigned>&);

static void collect_streams(const Dynamic& d, std::vector<Stream>& out,
    const Components* components, std::vector<unsigned>& open)
{
    switch (d.kind()) {
    case Dynamic::Kind::scalar:
        break;
    case Dynamic::Kind::nested:
        collect_streams(d.nested().dynamics(), out, components, open);
        break;
    case Dynamic::Kind::comprehension: {
        auto& c = d.comprehension();
        if (c.is_stream()) {
            out.push_back(*c.stream());
        }
        for (auto& row : c.entries()) {
            collect_streams(row, out, components, open);
        }
        break;
    }
    case Dynamic::Kind::component: {
        if (!components
            || std::find(open.begin(), open.end(), d.component())
                != open.end()) {
            break;
        }
        auto it = components->find(d.component());
        if (it != components->end()) {
            open.push_back(d.component());
            collect_streams(it->second.dynamics(), out, components, open);
            open.pop_back();
        }
        break;
    }
    }
}

static void collect_streams(const Row& row, std::vector<Stream>& out,
    const Components* components, std::vector<unsigned>& open)
{
    for (auto& d : row) {
        collect_streams(d, out, components, open);
    }
}

std::vector<Stream> collect_streams(
    const Rendered& r, const Components* components)
{
    std::vector<Stream> out;
    std::vector<unsigned> open;
    collect_streams(r.dynamics(), out, components, open);
    return out;
}

static std::optional<Dynamic> prune(const Dynamic&);

// Returns the pruned row or std::nullopt, if it has no streams
static std::optional<Row> prune(const Row& row)
{
    std::optional<Row> out;
    for (size_t i = 0; i < row.size(); i++) {
        if (auto d = prune(row[i])) {
            if (!out) {
                out = row;
            }
            (*out)[i] = std::move(*d);
        }
    }
    return out;
}

static std::optional<Dynamic> prune(const Dynamic& d)
{
    switch (d.kind()) {
    case Dynamic::Kind::nested:
        if (auto row = prune(d.nested().dynamics())) {
            return Dynamic(Rendered(d.nested().statics(), std::move(*row)));
        }
        return std::nullopt;
    case Dynamic::Kind::comprehension: {
        auto& c = d.comprehension();
        if (c.is_stream()) {
            return Dynamic(c.pruned());
        }
        std::optional<std::vector<Row>> entries;
        for (size_t i = 0; i < c.size(); i++) {
            if (auto row = prune(c.entries()[i])) {
                if (!entries) {
                    entries = c.entries();
                }
                (*entries)[i] = std::move(*row);
            }
        }
        if (entries) {
            return Dynamic(Comprehension(c.statics(), std::move(*entries)));
        }
        return std::nullopt;
    }
    default:
        return std::nullopt;
    }
}

Rendered prune_streams(const Rendered& r)
{
    if (auto row = prune(r.dynamics())) {
        return Rendered(r.statics(), std::move(*row));
    }
    return r;
}
}
