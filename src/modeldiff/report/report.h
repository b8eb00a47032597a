#ifndef MODELDIFF_REPORT_REPORT_H
#define MODELDIFF_REPORT_REPORT_H

#include <ostream>

#include <modeldiff/config.h>
#include <modeldiff/diff/change.h>
#include <modeldiff/io/document_source.h>

namespace modeldiff {

enum class comparison_status
{
    // the document changed (and the changes are listed)
    CHANGED,
    // no changes were detected
    UNCHANGED,
    // the new version of the document couldn't be read, so there was
    // nothing to compare
    UNREADABLE
};

std::ostream&
operator<<(std::ostream& s, comparison_status status);

// the outcome of comparing two versions of a single document
struct document_comparison
{
    comparison_status status = comparison_status::UNCHANGED;

    std::vector<change_entry> changes;

    // Did the changes come from the field-level fallback diff?
    bool used_fallback = false;

    // for UNREADABLE comparisons, a description of what went wrong
    optional<string> error;
};

// Compare two versions of a document.
// This runs the structural comparison, and if that doesn't find anything
// even though the documents differ, it falls back to a field-level diff.
document_comparison
compare_document_versions(
    optional<dynamic> const& old_document,
    dynamic const& new_document,
    diff_config const& config = diff_config());

// Compare the document :old_name at :old_source against the document
// :new_name at :new_source.
// If the new version is missing or unreadable, the result is UNREADABLE.
// If the old version is missing or unreadable, the document is treated as
// new.
document_comparison
compare_sourced_documents(
    document_source_interface& old_source,
    string const& old_name,
    document_source_interface& new_source,
    string const& new_name,
    diff_config const& config = diff_config());

// a document_comparison labelled with the name of the document
struct named_comparison
{
    string name;
    document_comparison comparison;
};

enum class report_format
{
    TEXT,
    MARKDOWN
};

// Render a report covering several documents.
string
render_report(
    std::vector<named_comparison> const& comparisons, report_format format);

} // namespace modeldiff

#endif
