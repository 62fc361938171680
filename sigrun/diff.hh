#pragma once

#include "rendered.hh"
#include <map>
#include <memory>
#include <optional>
#include <stdint.h>
#include <string>
#include <variant>
#include <vector>

namespace sigrun {

class ChangeSet;
struct ComprehensionChange;

// Change of a single dynamic slot
class Change {
public:
    enum class Kind : uint8_t {
        scalar, // New scalar value
        rendered, // Full replacement by a tree
        comprehension, // Full replacement by a comprehension
        nested, // Changes inside the previous nested tree
        entries, // Changes to the entries of the previous comprehension
        component, // Reference to a component
    };

    Change(std::string s)
        : val(std::move(s))
    {
    }
    Change(const char* s)
        : val(std::string(s))
    {
    }
    Change(ComponentRef c)
        : val(c)
    {
    }

    // Throw sigrun::Error on nullptr
    Change(std::shared_ptr<const Rendered>);
    Change(std::shared_ptr<const Comprehension>);

    Change(ChangeSet);
    Change(ComprehensionChange);

    // Full replacement of a slot by the passed value
    static Change replace(const Dynamic&);

    Kind kind() const { return static_cast<Kind>(val.index()); }

    // Returns, if the change carries a complete value rather than a diff
    bool is_full() const
    {
        return kind() != Kind::nested && kind() != Kind::entries;
    }

    // Accessors for the contained value. Throw std::bad_variant_access on
    // kind mismatch.
    const std::string& scalar() const { return std::get<std::string>(val); }
    const Rendered& rendered() const
    {
        return *std::get<std::shared_ptr<const Rendered>>(val);
    }
    const Comprehension& comprehension() const
    {
        return *std::get<std::shared_ptr<const Comprehension>>(val);
    }
    const ChangeSet& nested() const
    {
        return *std::get<std::shared_ptr<const ChangeSet>>(val);
    }
    const ComprehensionChange& entries() const
    {
        return *std::get<std::shared_ptr<const ComprehensionChange>>(val);
    }
    unsigned component() const { return std::get<ComponentRef>(val).cid; }

    // Convert a full change into the Dynamic it replaces the slot with.
    // Throws std::bad_variant_access, if the change is not full.
    Dynamic to_dynamic() const;

    bool operator==(const Change&) const;
    bool operator!=(const Change& rhs) const { return !(*this == rhs); }

private:
    std::variant<std::string, std::shared_ptr<const Rendered>,
        std::shared_ptr<const Comprehension>, std::shared_ptr<const ChangeSet>,
        std::shared_ptr<const ComprehensionChange>, ComponentRef>
        val;
};

// Changes to the components of a view by component id. A full tree adds or
// replaces a component, a nested ChangeSet patches it and std::nullopt
// removes it.
typedef std::map<unsigned, std::optional<Change>> ComponentChanges;

// Sparse mapping of slot indices to changes. Slots without changes are
// absent. An empty ChangeSet means nothing changed.
class ChangeSet {
public:
    typedef std::map<size_t, Change> Slots;

    ChangeSet() = default;
    ChangeSet(Slots slots)
        : slots(std::move(slots))
    {
    }

    bool empty() const { return slots.empty() && _components.empty(); }

    // Number of changed slots
    size_t size() const { return slots.size(); }
    bool count(size_t i) const { return slots.count(i); }

    // Returns change of slot i or nullptr
    const Change* find(size_t i) const
    {
        auto it = slots.find(i);
        return it == slots.end() ? nullptr : &it->second;
    }

    // Returns change of slot i. Throws std::out_of_range, if absent.
    const Change& at(size_t i) const { return slots.at(i); }

    // Set or overwrite change of slot i
    void set(size_t i, Change ch) { slots.insert_or_assign(i, std::move(ch)); }

    Slots::const_iterator begin() const { return slots.begin(); }
    Slots::const_iterator end() const { return slots.end(); }

    // Changes to components. Only set on the root ChangeSet of a view.
    const ComponentChanges& components() const { return _components; }

    // Set a full tree or nested changes of component cid
    void set_component(unsigned cid, Change ch)
    {
        _components.insert_or_assign(cid, std::move(ch));
    }

    void remove_component(unsigned cid)
    {
        _components.insert_or_assign(cid, std::nullopt);
    }

    bool operator==(const ChangeSet& rhs) const
    {
        return slots == rhs.slots && _components == rhs._components;
    }
    bool operator!=(const ChangeSet& rhs) const { return !(*this == rhs); }

private:
    Slots slots;
    ComponentChanges _components;
};

// Positional changes to the entries of a comprehension
struct ComprehensionChange {
    // Number of entries after applying the change. Smaller than the previous
    // count, when trailing entries were removed.
    size_t size = 0;

    // Changes to entries present in both renders by entry index
    std::map<size_t, ChangeSet> updated;

    // Full rows of entries beyond the previous entry count. Always the last
    // appended.size() entries of the new render.
    std::vector<Row> appended;

    bool operator==(const ComprehensionChange& rhs) const
    {
        return size == rhs.size && updated == rhs.updated
            && appended == rhs.appended;
    }
    bool operator!=(const ComprehensionChange& rhs) const
    {
        return !(*this == rhs);
    }
};

// Compute the minimal changes that turn prev into next.
// Throws StructuralMismatch, if prev and next are not renders of the same
// template site. Nested trees and comprehensions that changed statics or
// slots that changed value kind are replaced in full. Streams with any
// operations are sent in full.
ChangeSet diff(const Rendered& prev, const Rendered& next);

// Same as diff(prev, next), but also computes changes to the components of
// the view. Components absent from prev_components or rendered from a
// different template site are sent in full. Components absent from
// next_components are removed.
ChangeSet diff(const Rendered& prev, const Rendered& next,
    const Components& prev_components, const Components& next_components);

// Compute changes to the entries of a comprehension with the same statics.
// Throws StructuralMismatch, if statics differ.
ComprehensionChange diff(const Comprehension& prev, const Comprehension& next);

// Apply changes on top of prev, returning the new tree. Unchanged slots are
// shared with prev.
// Throws StructuralMismatch, if the changes address slots or value kinds prev
// does not have.
Rendered merge(const Rendered& prev, const ChangeSet& changes);

// Apply entry changes on top of prev, returning the new comprehension
Comprehension merge(const Comprehension& prev, const ComprehensionChange& ch);

// Apply a change to a single slot value
Dynamic merge(const Dynamic& prev, const Change& change);

// Apply the component changes of a root ChangeSet to the component table in
// place. On error the table is left unchanged.
// Throws StructuralMismatch on changes to unknown components.
void merge(Components& components, const ChangeSet& changes);
}
