#ifndef MODELDIFF_MODEL_DOCUMENT_H
#define MODELDIFF_MODEL_DOCUMENT_H

#include <vector>

#include <modeldiff/core.h>

// This file provides a typed view of a model document. Documents arrive as
// dynamic values; the view picks out the parts the structural comparison
// relies on and normalizes anything missing or malformed to a safe default.
//
// A document looks like this:
//
//  name: "Sales model"
//  description: "..."
//  pages:
//    - id: p1
//      name: Sales
//      elements:
//        - id: e1
//          name: Orders
//          kind: table
//          columns:
//            - id: c1
//              name: amount
//              formula: "sum(x)"
//
// Any other fields are carried along untouched in the records.

namespace modeldiff {

struct model_column
{
    // the column's id, if it has a non-empty one
    optional<dynamic> id;
    optional<string> name;
    optional<string> formula;
    // the full column record, including any vendor-specific fields
    dynamic record;
};

struct model_element
{
    optional<dynamic> id;
    optional<string> name;
    optional<string> kind;
    std::vector<model_column> columns;
    dynamic record;
};

struct model_page
{
    optional<dynamic> id;
    optional<string> name;
    std::vector<model_element> elements;
    dynamic record;
};

struct model_document
{
    optional<string> name;
    optional<string> description;
    std::vector<model_page> pages;
    // all top-level fields of the document (including the ones above)
    dynamic_map fields;
};

// Build the typed view of a document.
// This never throws. Missing collections are treated as empty, and entries
// within collections that aren't maps are skipped.
model_document
read_model_document(dynamic const& document);

// Get the label of a text field from a record. Strings are returned as-is,
// other non-nil values are rendered as compact JSON. A missing or nil field
// yields none.
optional<string>
read_label(dynamic_map const& record, string const& field);

// Get the identity key of a record: its 'id' field, unless that's missing,
// nil, or an empty string.
optional<dynamic>
read_identity(dynamic_map const& record);

// Derive the identity key that's used to match a column across snapshots.
// This is the column's id if it has one, otherwise its name, otherwise an
// empty string.
dynamic
get_column_key(model_column const& column);

} // namespace modeldiff

#endif
