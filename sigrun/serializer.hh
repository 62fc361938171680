#pragma once

#include "diff.hh"
#include "rendered.hh"
#include <nlohmann/json.hpp>

// Wire format
//
// Full tree:              {"s": [statics...], "0": v0, "1": v1, ...}
// Change set:             {"0": v0, "2": v2}
// Full comprehension:     {"s": [statics...], "d": [[row0...], ...],
//                          "p": {"0": [statics...], ...}}
// Comprehension change:   {"n": entry_count, "d": {"0": {...}, "3": [...]},
//                          "p": {...}}
// Stream comprehension:   {"s": [...], "d": [...],
//                          "stream": [ref, [[id, at, limit], ...],
//                                     [deleted ids...], reset]}
// Components:             {"s": [...], "0": 1, "c": {"1": {"s": [...], ...},
//                          "2": {"s": -1, "0": ...}, "3": {"0": ...},
//                          "4": null}}
//
// Scalars are strings. A statics value inside a comprehension may be an
// integer index into the "p" template table of the outermost comprehension,
// so that statics of nested trees are sent once instead of once per entry.
// In a comprehension change an entry present in the previous render is
// addressed by a sparse change object and an appended entry by its full row.
//
// An integer slot value refers to a component in the "c" table of the root
// value. A component entry is a full tree, sparse changes or null for removal.
// Integer statics of a full component tree share the statics of another
// component: positive ids refer to a full tree in the same table, negative
// ids to a component the client already has. Slots absent from such a tree
// are taken from the component it shares statics with.

namespace sigrun {

// Encode a full tree
nlohmann::json encode(const Rendered&);

// Encode a full tree with the components of the view.
// Throws sigrun::Error on component id 0.
nlohmann::json encode(const Rendered&, const Components&);

// Encode a full comprehension
nlohmann::json encode(const Comprehension&);

// Encode sparse changes. An empty ChangeSet encodes to an empty object.
// prev: components the client has, whose statics new components may share
nlohmann::json encode(const ChangeSet&, const Components* prev = nullptr);

// Encode changes to the entries of a comprehension
nlohmann::json encode(const ComprehensionChange&);

// Returns, if a wire value carries a full tree rather than changes
bool is_full(const nlohmann::json&);

// Decode a full tree. Throws DecodeError on invalid input.
Rendered decode_rendered(const nlohmann::json&);

// Decode the component table of a full tree. Throws DecodeError on invalid
// input.
Components decode_components(const nlohmann::json&);

// Decode sparse changes. prev: components the client has. Throws DecodeError
// on invalid input.
ChangeSet decode_changes(
    const nlohmann::json&, const Components* prev = nullptr);
}
