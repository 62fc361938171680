#include "serializer.hh"
#include "errors.hh"
#include <algorithm>
#include <limits>
#include <set>
#include <string>
#include <vector>

using nlohmann::json;

namespace sigrun {

// Collects statics of values nested in a comprehension, so that each is
// written to the wire only once
class TemplateWriter {
public:
    // Returns the table index of the statics, adding them as needed
    size_t index(const Statics& st)
    {
        for (size_t i = 0; i < list.size(); i++) {
            if (same_statics(list[i], st)) {
                return i;
            }
        }
        list.push_back(st);
        return list.size() - 1;
    }

    bool empty() const { return list.empty(); }

    json to_json() const
    {
        json j = json::object();
        for (size_t i = 0; i < list.size(); i++) {
            j[std::to_string(i)] = *list[i];
        }
        return j;
    }

private:
    std::vector<Statics> list;
};

static json encode_dynamic(const Dynamic&, TemplateWriter*);
static json encode_change(const Change&, TemplateWriter*);

static json encode_statics(const Statics& st, TemplateWriter* tw)
{
    if (tw) {
        return tw->index(st);
    }
    return *st;
}

static json encode_rendered(const Rendered& r, TemplateWriter* tw)
{
    json j = json::object();
    j["s"] = encode_statics(r.statics(), tw);
    for (size_t i = 0; i < r.size(); i++) {
        j[std::to_string(i)] = encode_dynamic(r[i], tw);
    }
    return j;
}

static json encode_row(const Row& row, TemplateWriter* tw)
{
    json j = json::array();
    for (auto& d : row) {
        j.push_back(encode_dynamic(d, tw));
    }
    return j;
}

static json encode_stream(const Stream& st)
{
    json inserts = json::array();
    for (auto& in : st.inserts) {
        inserts.push_back(json::array(
            { in.id, in.at, in.limit ? json(*in.limit) : json(nullptr) }));
    }
    return json::array({ st.ref, std::move(inserts), st.deletes, st.reset });
}

static json encode_comprehension(const Comprehension& c, TemplateWriter* tw)
{
    // The outermost comprehension owns the template table
    TemplateWriter own;
    auto w = tw ? tw : &own;

    json rows = json::array();
    for (auto& row : c.entries()) {
        rows.push_back(encode_row(row, w));
    }

    json j = json::object();
    j["s"] = encode_statics(c.statics(), tw);
    j["d"] = std::move(rows);
    if (c.is_stream()) {
        j["stream"] = encode_stream(*c.stream());
    }
    if (!tw && !own.empty()) {
        j["p"] = own.to_json();
    }
    return j;
}

static json encode_dynamic(const Dynamic& d, TemplateWriter* tw)
{
    switch (d.kind()) {
    case Dynamic::Kind::nested:
        return encode_rendered(d.nested(), tw);
    case Dynamic::Kind::comprehension:
        return encode_comprehension(d.comprehension(), tw);
    case Dynamic::Kind::component:
        return d.component();
    default:
        return d.scalar();
    }
}

static json encode_changes(const ChangeSet& cs, TemplateWriter* tw)
{
    json j = json::object();
    for (auto & [ i, ch ] : cs) {
        j[std::to_string(i)] = encode_change(ch, tw);
    }
    return j;
}

static json encode_entries(const ComprehensionChange& cc, TemplateWriter* tw)
{
    TemplateWriter own;
    auto w = tw ? tw : &own;

    json d = json::object();
    for (auto & [ i, cs ] : cc.updated) {
        d[std::to_string(i)] = encode_changes(cs, w);
    }
    const auto first_appended = cc.size - cc.appended.size();
    for (size_t i = 0; i < cc.appended.size(); i++) {
        d[std::to_string(first_appended + i)] = encode_row(cc.appended[i], w);
    }

    json j = json::object();
    j["n"] = cc.size;
    if (!d.empty()) {
        j["d"] = std::move(d);
    }
    if (!tw && !own.empty()) {
        j["p"] = own.to_json();
    }
    return j;
}

static json encode_change(const Change& ch, TemplateWriter* tw)
{
    switch (ch.kind()) {
    case Change::Kind::scalar:
        return ch.scalar();
    case Change::Kind::rendered:
        return encode_rendered(ch.rendered(), tw);
    case Change::Kind::comprehension:
        return encode_comprehension(ch.comprehension(), tw);
    case Change::Kind::nested:
        return encode_changes(ch.nested(), tw);
    case Change::Kind::entries:
        return encode_entries(ch.entries(), tw);
    case Change::Kind::component:
        return ch.component();
    }
    return nullptr;
}

// Encodes full component trees. Statics already known to the client are
// replaced with the id of a component rendered from the same template site.
class ComponentWriter {
public:
    // prev: components the client already has
    ComponentWriter(const Components* prev)
        : prev(prev)
    {
    }

    json encode(unsigned cid, const Rendered& r)
    {
        if (!cid) {
            throw Error("component ids start at 1");
        }
        json j = encode_rendered(r, nullptr);
        if (const long ref = find(r.statics())) {
            j["s"] = ref;
        }
        sent.emplace_back(cid, r.statics());
        return j;
    }

private:
    const Components* prev;
    std::vector<std::pair<unsigned, Statics>> sent;

    // Positive ids refer to components sent in the same message, negative
    // ones to previous components. Returns 0, if there is none.
    long find(const Statics& st) const
    {
        for (auto & [ cid, statics ] : sent) {
            if (same_statics(statics, st)) {
                return cid;
            }
        }
        if (prev) {
            for (auto & [ cid, tree ] : *prev) {
                if (same_statics(tree.statics(), st)) {
                    return -static_cast<long>(cid);
                }
            }
        }
        return 0;
    }
};

json encode(const Rendered& r) { return encode_rendered(r, nullptr); }

json encode(const Rendered& r, const Components& components)
{
    json j = encode_rendered(r, nullptr);
    if (!components.empty()) {
        ComponentWriter w(nullptr);
        json c = json::object();
        for (auto & [ cid, tree ] : components) {
            c[std::to_string(cid)] = w.encode(cid, tree);
        }
        j["c"] = std::move(c);
    }
    return j;
}

json encode(const Comprehension& c) { return encode_comprehension(c, nullptr); }

json encode(const ChangeSet& cs, const Components* prev)
{
    json j = encode_changes(cs, nullptr);
    if (!cs.components().empty()) {
        ComponentWriter w(prev);
        json c = json::object();
        for (auto & [ cid, ch ] : cs.components()) {
            const auto key = std::to_string(cid);
            if (!ch) {
                c[key] = nullptr;
            } else if (ch->kind() == Change::Kind::rendered) {
                c[key] = w.encode(cid, ch->rendered());
            } else {
                c[key] = encode_change(*ch, nullptr);
            }
        }
        j["c"] = std::move(c);
    }
    return j;
}

json encode(const ComprehensionChange& cc)
{
    return encode_entries(cc, nullptr);
}

bool is_full(const json& j) { return j.is_object() && j.count("s"); }

// Decoding

typedef std::vector<Statics> Templates;

static Dynamic decode_dynamic(const json&, const Templates*);
static Change decode_change(const json&, const Templates*);

// Parse a slot or entry index from an object key
static size_t parse_index(const std::string& key)
{
    if (key.empty() || key.size() > 9
        || !std::all_of(key.begin(), key.end(),
               [](char ch) { return ch >= '0' && ch <= '9'; })) {
        throw DecodeError("invalid index key: " + key);
    }
    return std::stoul(key);
}

static void expect_object(const json& j, const char* what)
{
    if (!j.is_object()) {
        throw DecodeError(std::string(what) + ": expected object, got "
            + j.type_name());
    }
}

static std::vector<std::string> decode_strings(const json& j)
{
    if (!j.is_array()) {
        throw DecodeError(
            std::string("statics: expected array, got ") + j.type_name());
    }
    std::vector<std::string> out;
    out.reserve(j.size());
    for (auto& s : j) {
        if (!s.is_string()) {
            throw DecodeError("statics: non-string fragment");
        }
        out.push_back(s.get<std::string>());
    }
    return out;
}

static Templates decode_templates(const json& j)
{
    expect_object(j, "templates");
    Templates t(j.size());
    for (auto & [ key, val ] : j.items()) {
        const auto i = parse_index(key);
        if (i >= t.size()) {
            throw DecodeError("templates: sparse template table");
        }
        t[i] = make_statics(decode_strings(val));
    }
    return t;
}

// Decode a non-negative integer. Encoders may send any integer type.
static size_t decode_size(const json& j, const char* what)
{
    if (!j.is_number_integer() || j.get<long long>() < 0) {
        throw DecodeError(std::string(what) + ": expected non-negative integer, got "
            + j.dump());
    }
    return j.get<size_t>();
}

static Statics decode_statics(const json& j, const Templates* t)
{
    if (j.is_number_integer()) {
        const auto i = decode_size(j, "statics");
        if (!t || i >= t->size()) {
            throw DecodeError(
                "statics: dangling template reference " + std::to_string(i));
        }
        return (*t)[i];
    }
    return make_statics(decode_strings(j));
}

static std::string decode_scalar(const json& j)
{
    switch (j.type()) {
    case json::value_t::string:
        return j.get<std::string>();
    case json::value_t::null:
        return "";
    case json::value_t::boolean:
        return j.get<bool>() ? "true" : "false";
    case json::value_t::number_float:
        return j.dump();
    default:
        throw DecodeError(std::string("scalar: unexpected ") + j.type_name());
    }
}

static Row decode_row(const json& j, const Templates* t)
{
    if (!j.is_array()) {
        throw DecodeError(
            std::string("entry: expected array, got ") + j.type_name());
    }
    Row row;
    row.reserve(j.size());
    for (auto& d : j) {
        row.push_back(decode_dynamic(d, t));
    }
    return row;
}

// Decode a slot value referring to a component
static unsigned decode_cid(const json& j)
{
    const auto cid = decode_size(j, "component id");
    if (!cid || cid > std::numeric_limits<unsigned>::max()) {
        throw DecodeError("invalid component id " + j.dump());
    }
    return static_cast<unsigned>(cid);
}

// root: the value is the root of a message and may carry a component table
static Rendered decode_tree(const json& j, const Templates* t, bool root = false)
{
    expect_object(j, "rendered");
    auto statics = decode_statics(j.at("s"), t);
    if (statics->empty()) {
        throw ArityMismatch("rendered: statics must not be empty");
    }

    std::vector<Dynamic> dynamics(statics->size() - 1);
    size_t found = 0;
    for (auto & [ key, val ] : j.items()) {
        if (key == "s" || (root && key == "c")) {
            continue;
        }
        const auto i = parse_index(key);
        if (i >= dynamics.size()) {
            throw ArityMismatch("rendered: slot " + key + " out of range");
        }
        dynamics[i] = decode_dynamic(val, t);
        found++;
    }
    if (found != dynamics.size()) {
        throw ArityMismatch("rendered: missing dynamic slots");
    }
    return Rendered(std::move(statics), std::move(dynamics));
}

// [ref, [[id, at, limit], ...], [deleted ids...], reset]
static Stream decode_stream(const json& j)
{
    if (!j.is_array() || j.size() != 4 || !j[0].is_string()
        || !j[1].is_array() || !j[2].is_array() || !j[3].is_boolean()) {
        throw DecodeError("stream: expected [ref, inserts, deletes, reset]");
    }

    Stream st;
    st.ref = j[0].get<std::string>();
    for (auto& in : j[1]) {
        if (!in.is_array() || in.size() != 3 || !in[0].is_string()
            || !in[1].is_number_integer()
            || !(in[2].is_null() || in[2].is_number_integer())) {
            throw DecodeError("stream: invalid insert " + in.dump());
        }
        StreamInsert ins{ in[0].get<std::string>(), in[1].get<long>() };
        if (!in[2].is_null()) {
            ins.limit = in[2].get<long>();
        }
        st.inserts.push_back(std::move(ins));
    }
    for (auto& id : j[2]) {
        if (!id.is_string()) {
            throw DecodeError("stream: non-string deleted id");
        }
        st.deletes.push_back(id.get<std::string>());
    }
    st.reset = j[3].get<bool>();
    return st;
}

static Comprehension decode_comprehension(const json& j, const Templates* t)
{
    Templates own;
    if (j.count("p")) {
        own = decode_templates(j.at("p"));
        t = &own;
    }

    auto statics = decode_statics(j.at("s"), t);
    auto& rows = j.at("d");
    if (!rows.is_array()) {
        throw DecodeError("comprehension: entries must be an array");
    }
    std::vector<Row> entries;
    entries.reserve(rows.size());
    for (auto& row : rows) {
        entries.push_back(decode_row(row, t));
    }

    std::optional<Stream> stream;
    if (j.count("stream")) {
        stream = decode_stream(j.at("stream"));
    }
    return Comprehension(
        std::move(statics), std::move(entries), std::move(stream));
}

static Dynamic decode_dynamic(const json& j, const Templates* t)
{
    if (j.is_number_integer()) {
        return ComponentRef{ decode_cid(j) };
    }
    if (!j.is_object()) {
        return decode_scalar(j);
    }
    if (!j.count("s")) {
        throw DecodeError("dynamic: object without statics");
    }
    if (j.count("d")) {
        return decode_comprehension(j, t);
    }
    return decode_tree(j, t);
}

// skip: key to ignore, if any
static ChangeSet decode_change_set(
    const json& j, const Templates* t, const char* skip = nullptr)
{
    expect_object(j, "changes");
    ChangeSet cs;
    for (auto & [ key, val ] : j.items()) {
        if (skip && key == skip) {
            continue;
        }
        cs.set(parse_index(key), decode_change(val, t));
    }
    return cs;
}

static ComprehensionChange decode_entries(const json& j, const Templates* t)
{
    Templates own;
    if (j.count("p")) {
        own = decode_templates(j.at("p"));
        t = &own;
    }

    ComprehensionChange cc;
    cc.size = decode_size(j.at("n"), "comprehension change entry count");

    if (!j.count("d")) {
        return cc;
    }
    auto& d = j.at("d");
    expect_object(d, "comprehension change entries");

    // Sort by index, as object keys are ordered lexicographically
    std::vector<std::pair<size_t, const json*>> items;
    for (auto & [ key, val ] : d.items()) {
        items.emplace_back(parse_index(key), &val);
    }
    std::sort(items.begin(), items.end(),
        [](auto& a, auto& b) { return a.first < b.first; });

    for (auto & [ i, val ] : items) {
        if (i >= cc.size) {
            throw DecodeError("comprehension change: entry "
                + std::to_string(i) + " beyond entry count");
        }
        if (val->is_array()) {
            cc.appended.push_back(decode_row(*val, t));
        } else {
            if (!cc.appended.empty()) {
                throw DecodeError(
                    "comprehension change: entry update after appended entry");
            }
            cc.updated.emplace(i, decode_change_set(*val, t));
        }
    }
    // Appended entries must form a contiguous tail ending at the last entry
    if (!cc.appended.empty()) {
        const auto first = cc.size - cc.appended.size();
        for (size_t k = 0; k < cc.appended.size(); k++) {
            if (items[items.size() - cc.appended.size() + k].first
                != first + k) {
                throw DecodeError(
                    "comprehension change: appended entries are not a "
                    "contiguous tail");
            }
        }
    }
    return cc;
}

static Change decode_change(const json& j, const Templates* t)
{
    if (j.is_number_integer()) {
        return Change(ComponentRef{ decode_cid(j) });
    }
    if (!j.is_object()) {
        return Change(decode_scalar(j));
    }
    if (j.count("s")) {
        if (j.count("d")) {
            return Change(
                std::make_shared<const Comprehension>(decode_comprehension(j, t)));
        }
        return Change(std::make_shared<const Rendered>(decode_tree(j, t)));
    }
    if (j.count("n")) {
        return Change(decode_entries(j, t));
    }
    return Change(decode_change_set(j, t));
}

// Decodes the "c" table of a message. Resolves shared statics of new
// components against the same table and the previous components.
class ComponentReader {
public:
    ComponentReader(const json& table, const Components* prev)
        : table(table)
        , prev(prev)
    {
        expect_object(table, "components");
    }

    // Decode all entries into the changes
    void read(ChangeSet& cs)
    {
        for (auto & [ key, val ] : table.items()) {
            const auto cid = parse_cid(key);
            if (val.is_null()) {
                cs.remove_component(cid);
            } else if (is_full(val)) {
                cs.set_component(
                    cid, Change(std::make_shared<const Rendered>(full(cid))));
            } else {
                cs.set_component(cid, Change(decode_change_set(val, nullptr)));
            }
        }
    }

private:
    const json& table;
    const Components* prev;
    std::map<unsigned, Rendered> done;
    std::set<unsigned> open;

    static unsigned parse_cid(const std::string& key)
    {
        const auto cid = parse_index(key);
        if (!cid) {
            throw DecodeError("component ids start at 1");
        }
        return static_cast<unsigned>(cid);
    }

    // Returns the full tree of the component cid of this message
    const Rendered& full(unsigned cid)
    {
        auto it = done.find(cid);
        if (it != done.end()) {
            return it->second;
        }
        const auto key = std::to_string(cid);
        if (!table.count(key) || !is_full(table.at(key))) {
            throw DecodeError("components: no full tree of component " + key
                + " to share statics with");
        }
        if (!open.insert(cid).second) {
            throw DecodeError(
                "components: cyclic statics reference of component " + key);
        }

        auto& val = table.at(key);
        auto& s = val.at("s");
        std::optional<Rendered> tree;
        if (!s.is_number_integer()) {
            tree = decode_tree(val, nullptr);
        } else {
            // Same template site as another component. The slots of that
            // component are the base, that this one's slots are merged onto.
            const long ref = s.get<long>();
            const Rendered* base = nullptr;
            if (ref > 0) {
                base = &full(static_cast<unsigned>(ref));
            } else if (ref < 0 && prev) {
                auto p = prev->find(static_cast<unsigned>(-ref));
                if (p != prev->end()) {
                    base = &p->second;
                }
            }
            if (!base) {
                throw DecodeError("components: component " + key
                    + " shares statics with unknown component "
                    + std::to_string(ref));
            }
            tree = merge(*base, decode_change_set(val, nullptr, "s"));
        }

        open.erase(cid);
        return done.emplace(cid, std::move(*tree)).first->second;
    }
};

Rendered decode_rendered(const json& j)
{
    try {
        if (!is_full(j)) {
            throw DecodeError("rendered: missing statics");
        }
        return decode_tree(j, nullptr, true);
    } catch (const json::exception& ex) {
        throw DecodeError(ex.what());
    }
}

Components decode_components(const json& j)
{
    try {
        Components out;
        if (!j.is_object() || !j.count("c")) {
            return out;
        }
        ChangeSet cs;
        ComponentReader(j.at("c"), nullptr).read(cs);
        for (auto & [ cid, ch ] : cs.components()) {
            if (!ch || ch->kind() != Change::Kind::rendered) {
                throw DecodeError("components: component "
                    + std::to_string(cid) + " must be a full tree");
            }
            out.emplace(cid, ch->rendered());
        }
        return out;
    } catch (const json::exception& ex) {
        throw DecodeError(ex.what());
    }
}

ChangeSet decode_changes(const json& j, const Components* prev)
{
    try {
        auto cs = decode_change_set(j, nullptr, "c");
        if (j.count("c")) {
            ComponentReader(j.at("c"), prev).read(cs);
        }
        return cs;
    } catch (const json::exception& ex) {
        throw DecodeError(ex.what());
    }
}
}
