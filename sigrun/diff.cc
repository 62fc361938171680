#include "diff.hh"
#include "errors.hh"
#include <algorithm>
#include <optional>
#include <sstream>

namespace sigrun {

Change::Change(std::shared_ptr<const Rendered> r)
    : val(std::move(r))
{
    if (!std::get<std::shared_ptr<const Rendered>>(val)) {
        throw Error("change: null tree");
    }
}

Change::Change(std::shared_ptr<const Comprehension> c)
    : val(std::move(c))
{
    if (!std::get<std::shared_ptr<const Comprehension>>(val)) {
        throw Error("change: null comprehension");
    }
}

Change::Change(ChangeSet cs)
    : val(std::make_shared<const ChangeSet>(std::move(cs)))
{
}

Change::Change(ComprehensionChange cc)
    : val(std::make_shared<const ComprehensionChange>(std::move(cc)))
{
}

Change Change::replace(const Dynamic& d)
{
    switch (d.kind()) {
    case Dynamic::Kind::nested:
        return Change(d.nested_ptr());
    case Dynamic::Kind::comprehension:
        return Change(d.comprehension_ptr());
    case Dynamic::Kind::component:
        return Change(ComponentRef{ d.component() });
    default:
        return Change(d.scalar());
    }
}

Dynamic Change::to_dynamic() const
{
    switch (kind()) {
    case Kind::rendered:
        return Dynamic(std::get<std::shared_ptr<const Rendered>>(val));
    case Kind::comprehension:
        return Dynamic(std::get<std::shared_ptr<const Comprehension>>(val));
    case Kind::component:
        return Dynamic(ComponentRef{ component() });
    default:
        return Dynamic(scalar());
    }
}

bool Change::operator==(const Change& rhs) const
{
    if (kind() != rhs.kind()) {
        return false;
    }
    switch (kind()) {
    case Kind::scalar:
        return scalar() == rhs.scalar();
    case Kind::rendered:
        return rendered() == rhs.rendered();
    case Kind::comprehension:
        return comprehension() == rhs.comprehension();
    case Kind::nested:
        return nested() == rhs.nested();
    case Kind::entries:
        return entries() == rhs.entries();
    case Kind::component:
        return component() == rhs.component();
    }
    return false;
}

static std::optional<Change> diff_dynamic(const Dynamic& prev, const Dynamic& next);

// Diff two rows of dynamics of equal length
static ChangeSet diff_row(const Row& prev, const Row& next)
{
    ChangeSet cs;
    for (size_t i = 0; i < next.size(); i++) {
        if (auto ch = diff_dynamic(prev[i], next[i])) {
            cs.set(i, std::move(*ch));
        }
    }
    return cs;
}

static std::optional<Change> diff_dynamic(const Dynamic& prev, const Dynamic& next)
{
    // The slot switched between a scalar, tree or comprehension. Happens,
    // when a conditional changes branches.
    if (prev.kind() != next.kind()) {
        return Change::replace(next);
    }

    switch (next.kind()) {
    case Dynamic::Kind::scalar:
        if (prev.scalar() == next.scalar()) {
            return std::nullopt;
        }
        return Change(next.scalar());

    case Dynamic::Kind::nested: {
        if (prev.nested_ptr() == next.nested_ptr()) {
            return std::nullopt;
        }
        auto& p = prev.nested();
        auto& n = next.nested();
        if (!same_statics(p.statics(), n.statics())) {
            return Change::replace(next);
        }
        auto cs = diff_row(p.dynamics(), n.dynamics());
        if (cs.empty()) {
            return std::nullopt;
        }
        return Change(std::move(cs));
    }

    case Dynamic::Kind::comprehension: {
        if (prev.comprehension_ptr() == next.comprehension_ptr()) {
            return std::nullopt;
        }
        auto& p = prev.comprehension();
        auto& n = next.comprehension();
        if (!same_statics(p.statics(), n.statics())) {
            return Change::replace(next);
        }
        if (p.is_stream() || n.is_stream()) {
            // Items of a stream are not retained, so there is nothing to diff
            // against. A stream without operations renders nothing new.
            if (n.is_stream() && p.is_stream() && n.empty()
                && n.stream()->empty()
                && n.stream()->ref == p.stream()->ref) {
                return std::nullopt;
            }
            return Change::replace(next);
        }
        auto cc = diff(p, n);
        if (cc.size == p.size() && cc.updated.empty()) {
            return std::nullopt;
        }
        return Change(std::move(cc));
    }

    case Dynamic::Kind::component:
        if (prev.component() == next.component()) {
            return std::nullopt;
        }
        return Change::replace(next);
    }
    return Change::replace(next);
}

ChangeSet diff(const Rendered& prev, const Rendered& next)
{
    if (!same_statics(prev.statics(), next.statics())) {
        std::ostringstream s;
        s << "can not diff trees of different template sites: "
          << prev.statics()->size() << " and " << next.statics()->size()
          << " statics";
        throw StructuralMismatch(s.str());
    }
    return diff_row(prev.dynamics(), next.dynamics());
}

ChangeSet diff(const Rendered& prev, const Rendered& next,
    const Components& prev_components, const Components& next_components)
{
    auto cs = diff(prev, next);
    for (auto & [ cid, tree ] : next_components) {
        auto it = prev_components.find(cid);
        if (it == prev_components.end()
            || !same_statics(it->second.statics(), tree.statics())) {
            cs.set_component(cid, Change(std::make_shared<const Rendered>(tree)));
            continue;
        }
        auto ch = diff(it->second, tree);
        if (!ch.empty()) {
            cs.set_component(cid, Change(std::move(ch)));
        }
    }
    for (auto & [ cid, _ ] : prev_components) {
        if (!next_components.count(cid)) {
            cs.remove_component(cid);
        }
    }
    return cs;
}

ComprehensionChange diff(const Comprehension& prev, const Comprehension& next)
{
    if (!same_statics(prev.statics(), next.statics())) {
        throw StructuralMismatch(
            "can not diff comprehensions of different template sites");
    }

    ComprehensionChange cc;
    cc.size = next.size();

    auto& p = prev.entries();
    auto& n = next.entries();
    const auto common = std::min(p.size(), n.size());
    for (size_t i = 0; i < common; i++) {
        auto cs = diff_row(p[i], n[i]);
        if (!cs.empty()) {
            cc.updated.emplace(i, std::move(cs));
        }
    }
    // New entries have no previous counterpart to diff against
    for (size_t i = common; i < n.size(); i++) {
        cc.appended.push_back(n[i]);
    }
    return cc;
}

// Apply a ChangeSet to a row of dynamics in place
static void merge_row(Row& row, const ChangeSet& changes, const char* where)
{
    for (auto & [ i, ch ] : changes) {
        if (i >= row.size()) {
            std::ostringstream s;
            s << where << ": change to slot " << i << " of " << row.size();
            throw StructuralMismatch(s.str());
        }
        row[i] = merge(row[i], ch);
    }
}

Dynamic merge(const Dynamic& prev, const Change& change)
{
    switch (change.kind()) {
    case Change::Kind::nested:
        if (!prev.is_nested()) {
            throw StructuralMismatch("nested change applied to a non-tree slot");
        }
        return Dynamic(merge(prev.nested(), change.nested()));
    case Change::Kind::entries:
        if (!prev.is_comprehension()) {
            throw StructuralMismatch(
                "entry change applied to a non-comprehension slot");
        }
        return Dynamic(merge(prev.comprehension(), change.entries()));
    default:
        return change.to_dynamic();
    }
}

Rendered merge(const Rendered& prev, const ChangeSet& changes)
{
    if (changes.empty()) {
        return prev;
    }
    auto dynamics = prev.dynamics();
    merge_row(dynamics, changes, "rendered");
    return Rendered(prev.statics(), std::move(dynamics));
}

Comprehension merge(const Comprehension& prev, const ComprehensionChange& ch)
{
    if (ch.appended.size() > ch.size) {
        throw StructuralMismatch("comprehension: more appended entries than "
                                 "total entries");
    }
    const auto kept = ch.size - ch.appended.size();
    if (kept > prev.size()
        || (!ch.appended.empty() && kept != prev.size())) {
        std::ostringstream s;
        s << "comprehension: can not grow " << prev.size() << " entries to "
          << ch.size << " with " << ch.appended.size() << " new entries";
        throw StructuralMismatch(s.str());
    }

    std::vector<Row> entries(
        prev.entries().begin(), prev.entries().begin() + kept);
    entries.reserve(ch.size);
    for (auto & [ i, cs ] : ch.updated) {
        if (i >= kept) {
            std::ostringstream s;
            s << "comprehension: change to entry " << i << " of " << kept;
            throw StructuralMismatch(s.str());
        }
        merge_row(entries[i], cs, "comprehension entry");
    }
    for (auto& row : ch.appended) {
        entries.push_back(row);
    }
    return Comprehension(prev.statics(), std::move(entries));
}

void merge(Components& components, const ChangeSet& changes)
{
    if (changes.components().empty()) {
        return;
    }

    auto next = components;
    for (auto & [ cid, ch ] : changes.components()) {
        if (!ch) {
            next.erase(cid);
            continue;
        }
        switch (ch->kind()) {
        case Change::Kind::rendered:
            next.insert_or_assign(cid, ch->rendered());
            break;
        case Change::Kind::nested: {
            auto it = next.find(cid);
            if (it == next.end()) {
                throw StructuralMismatch(
                    "change to unknown component " + std::to_string(cid));
            }
            it->second = merge(it->second, ch->nested());
            break;
        }
        default:
            throw StructuralMismatch("component " + std::to_string(cid)
                + " must be changed by a tree or nested changes");
        }
    }
    components = std::move(next);
}
}
