#pragma once

#include "util.hh"
#include <map>
#include <memory>
#include <optional>
#include <stdint.h>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace sigrun {

class Rendered;
class Comprehension;

// Static text fragments of a template site. Shared by every render of the
// same site, so that comparing statics of two renders is usually a pointer
// comparison.
typedef std::shared_ptr<const std::vector<std::string>> Statics;

// Create Statics from a list of fragments
Statics make_statics(std::vector<std::string> fragments);

// Returns, if both Statics contain the same fragments
bool same_statics(const Statics& a, const Statics& b);

// Reference from a slot to a stateful component of the view. Component ids
// start at 1.
struct ComponentRef {
    unsigned cid = 0;

    bool operator==(const ComponentRef& rhs) const { return cid == rhs.cid; }
    bool operator!=(const ComponentRef& rhs) const { return cid != rhs.cid; }
};

// Attribute stamped on the root elements of a flattened component
extern const char* const component_attr;

// Value of a single dynamic slot. Either a scalar string, a nested tree, a
// comprehension or a reference to a component. Scalars are written verbatim,
// so any escaping must be done by the producer of the tree.
class Dynamic {
public:
    // Kind of the contained value
    enum class Kind : uint8_t { scalar, nested, comprehension, component };

    // Empty scalar
    Dynamic() = default;

    Dynamic(std::string s)
        : val(std::move(s))
    {
    }

    Dynamic(const char* s)
        : val(std::string(s))
    {
    }

    // Scalar from a number or boolean
    template <class T,
        std::enable_if_t<std::is_arithmetic<T>::value, int> = 0>
    Dynamic(T n)
    {
        if constexpr (std::is_same<T, bool>::value) {
            val = std::string(n ? "true" : "false");
        } else {
            val = std::to_string(n);
        }
    }

    Dynamic(Rendered);
    Dynamic(Comprehension);
    Dynamic(ComponentRef c)
        : val(c)
    {
    }

    // Throw sigrun::Error on nullptr
    Dynamic(std::shared_ptr<const Rendered>);
    Dynamic(std::shared_ptr<const Comprehension>);

    Kind kind() const { return static_cast<Kind>(val.index()); }
    bool is_scalar() const { return kind() == Kind::scalar; }
    bool is_nested() const { return kind() == Kind::nested; }
    bool is_comprehension() const { return kind() == Kind::comprehension; }
    bool is_component() const { return kind() == Kind::component; }

    // Accessors for the contained value. Throw std::bad_variant_access on
    // kind mismatch.
    const std::string& scalar() const { return std::get<std::string>(val); }
    const Rendered& nested() const { return *nested_ptr(); }
    const Comprehension& comprehension() const
    {
        return *comprehension_ptr();
    }
    const std::shared_ptr<const Rendered>& nested_ptr() const
    {
        return std::get<std::shared_ptr<const Rendered>>(val);
    }
    const std::shared_ptr<const Comprehension>& comprehension_ptr() const
    {
        return std::get<std::shared_ptr<const Comprehension>>(val);
    }
    unsigned component() const { return std::get<ComponentRef>(val).cid; }

    // Write value as HTML to the Rope. Throws sigrun::Error on component
    // references.
    void write_html(Rope&) const;

    bool operator==(const Dynamic&) const;
    bool operator!=(const Dynamic& rhs) const { return !(*this == rhs); }

private:
    std::variant<std::string, std::shared_ptr<const Rendered>,
        std::shared_ptr<const Comprehension>, ComponentRef>
        val;
};

// Dynamic values of a single comprehension iteration
typedef std::vector<Dynamic> Row;

// One render of a template site: static fragments interleaved with dynamic
// slot values. Immutable once constructed.
class Rendered {
public:
    // Throws ArityMismatch, unless there is exactly one more static than
    // dynamics.
    Rendered(Statics statics, std::vector<Dynamic> dynamics);
    Rendered(std::vector<std::string> statics, std::vector<Dynamic> dynamics)
        : Rendered(make_statics(std::move(statics)), std::move(dynamics))
    {
    }

    const Statics& statics() const { return _statics; }
    const std::vector<Dynamic>& dynamics() const { return _dynamics; }

    // Number of dynamic slots
    size_t size() const { return _dynamics.size(); }

    // Value of the slot at index i
    const Dynamic& operator[](size_t i) const { return _dynamics.at(i); }

    // Flatten to HTML
    std::string html() const;

    // Same as html(), but writes to a Rope to reduce allocations
    void write_html(Rope&) const;

    bool operator==(const Rendered&) const;
    bool operator!=(const Rendered& rhs) const { return !(*this == rhs); }

private:
    Statics _statics;
    std::vector<Dynamic> _dynamics;
};

// Insertion of an item into a stream container
struct StreamInsert {
    // Key of the item's root element
    std::string id;

    // Child index to insert a new item at. -1 appends.
    long at = -1;

    // Number of items to keep in the container after the insertion.
    // Negative limits keep the last items instead of the first.
    std::optional<long> limit;

    bool operator==(const StreamInsert& rhs) const
    {
        return id == rhs.id && at == rhs.at && limit == rhs.limit;
    }
    bool operator!=(const StreamInsert& rhs) const { return !(*this == rhs); }
};

// Operations on a stream container. Items of a stream live only in the DOM.
// The comprehension carrying the stream renders just the items inserted by
// this render.
struct Stream {
    // Identifies the stream among the streams of a view
    std::string ref;

    // Insertions in the order of the comprehension's entries
    std::vector<StreamInsert> inserts;

    // Keys of items to remove
    std::vector<std::string> deletes;

    // Remove all items not inserted by this render
    bool reset = false;

    // Returns, if there are no operations to perform
    bool empty() const { return inserts.empty() && deletes.empty() && !reset; }

    bool operator==(const Stream& rhs) const
    {
        return ref == rhs.ref && inserts == rhs.inserts
            && deletes == rhs.deletes && reset == rhs.reset;
    }
    bool operator!=(const Stream& rhs) const { return !(*this == rhs); }
};

// Repeated block with a single static template and one Row per iteration.
// Entries are an ordered sequence and may grow, shrink or reorder between
// renders.
class Comprehension {
public:
    // Throws ArityMismatch, if any row does not line up with statics
    Comprehension(Statics statics, std::vector<Row> entries = {},
        std::optional<Stream> stream = std::nullopt);
    Comprehension(std::vector<std::string> statics, std::vector<Row> entries,
        std::optional<Stream> stream = std::nullopt)
        : Comprehension(make_statics(std::move(statics)), std::move(entries),
              std::move(stream))
    {
    }

    const Statics& statics() const { return _statics; }
    const std::vector<Row>& entries() const { return _entries; }

    // Stream operations, if the comprehension renders a stream
    const std::optional<Stream>& stream() const { return _stream; }
    bool is_stream() const { return _stream.has_value(); }

    // Copy of a stream comprehension without entries or operations. Retained
    // in place of a stream, once its operations were sent or applied.
    Comprehension pruned() const;

    // Number of iterations
    size_t size() const { return _entries.size(); }
    bool empty() const { return _entries.empty(); }

    // Flatten to HTML
    std::string html() const;

    // Same as html(), but writes to a Rope to reduce allocations
    void write_html(Rope&) const;

    bool operator==(const Comprehension&) const;
    bool operator!=(const Comprehension& rhs) const { return !(*this == rhs); }

private:
    Statics _statics;
    std::vector<Row> _entries;
    std::optional<Stream> _stream;
};

// Stateful components of a view by component id
typedef std::map<unsigned, Rendered> Components;

// Flatten a tree, whose slots refer to components. The root elements of each
// component get component_attr set to the component id. Text at the root of
// a component is wrapped in a <span>.
// Throws StructuralMismatch on references to missing components and on
// components rendering themselves.
std::string html(const Rendered&, const Components&);

// Collect the stream operations of the tree and its components in document
// order
std::vector<Stream> collect_streams(const Rendered&, const Components* = nullptr);

// Replace every stream comprehension in the tree with its pruned copy.
// Subtrees without streams are shared with the passed tree.
Rendered prune_streams(const Rendered&);

// Throws ArityMismatch, if a row of dynamics does not line up with statics.
// where describes the checked value for the error message.
void check_arity(const Statics& statics, size_t dynamics, const char* where);

// Write statics interleaved with a row of dynamics to the Rope
void write_row(Rope&, const std::vector<std::string>& statics, const Row&);
}
