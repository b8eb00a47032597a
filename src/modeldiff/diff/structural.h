#ifndef MODELDIFF_DIFF_STRUCTURAL_H
#define MODELDIFF_DIFF_STRUCTURAL_H

#include <modeldiff/config.h>
#include <modeldiff/diff/change.h>
#include <modeldiff/model/document.h>

namespace modeldiff {

// Compare two versions of a document structurally.
//
// Pages and elements are matched across the two versions by their ids, and
// columns by their ids (or names, for columns without ids). The result lists
// additions, removals and renames at each level, plus the columns whose
// contents changed. Changes are listed in a deterministic order: within a
// collection, added entities come first, then removed ones, and then the
// entities present in both versions, in order of their identity keys.
//
// If :old_document is none, the document is new, and the result is a
// NEW_DOCUMENT entry followed by one entry for each element in the document.
//
// Comparing two equal documents always produces an empty list, but the
// converse doesn't hold: changes to fields that aren't part of the structure
// described in model/document.h aren't detected here. (See fallback.h.)
//
std::vector<change_entry>
compare_documents(
    optional<dynamic> const& old_document,
    dynamic const& new_document,
    diff_config const& config = diff_config());

// Same as above, but operating on the typed views.
std::vector<change_entry>
compare_documents(
    optional<model_document> const& old_document,
    model_document const& new_document,
    diff_config const& config);

// Compare the columns of two versions of the element labelled
// :element_label. Changes are listed as column renames, followed by the lists
// of added, removed and modified columns.
std::vector<change_entry>
compare_columns(
    string const& element_label,
    std::vector<model_column> const& old_columns,
    std::vector<model_column> const& new_columns,
    diff_config const& config);

} // namespace modeldiff

#endif
