#ifndef MODELDIFF_DIFF_FALLBACK_H
#define MODELDIFF_DIFF_FALLBACK_H

#include <modeldiff/config.h>
#include <modeldiff/diff/change.h>

namespace modeldiff {

// Compare two versions of a document field by field.
//
// This is a coarse, shallow comparison of the top-level fields of the two
// documents. It's meant for documents that differ in ways the structural
// comparison doesn't capture (e.g., schema metadata). Fields are visited in
// sorted order. Fields holding arrays or maps are summarized by their
// serialized sizes, and long strings by their lengths. Other values are
// reported literally.
//
// If :old_document is none, the result is a single NEW_DOCUMENT entry.
//
std::vector<change_entry>
compute_fallback_diff(
    optional<dynamic> const& old_document,
    dynamic const& new_document,
    diff_config const& config = diff_config());

} // namespace modeldiff

#endif
