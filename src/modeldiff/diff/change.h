#ifndef MODELDIFF_DIFF_CHANGE_H
#define MODELDIFF_DIFF_CHANGE_H

#include <ostream>
#include <vector>

#include <modeldiff/core.h>

namespace modeldiff {

enum class change_type
{
    ADDED,
    REMOVED,
    RENAMED,
    MODIFIED,
    // the document has no prior version
    NEW_DOCUMENT
};

// what a change_entry is about
enum class change_subject
{
    DOCUMENT,
    DOCUMENT_NAME,
    DOCUMENT_DESCRIPTION,
    PAGE,
    ELEMENT,
    // a single column (only used for renames)
    COLUMN,
    // a list of columns within an element
    COLUMNS,
    // a top-level document field (as reported by the fallback diff)
    FIELD
};

std::ostream&
operator<<(std::ostream& s, change_type t);

std::ostream&
operator<<(std::ostream& s, change_subject t);

// change_entry is one reported unit of difference between two versions of a
// document.
struct change_entry
{
    change_type type = change_type::MODIFIED;

    change_subject subject = change_subject::DOCUMENT;

    // the name of the page, element or column that changed, the element whose
    // columns changed (for COLUMNS), or the field name (for FIELD)
    string label;

    // the kind of element ("table", "view", etc.), only used for ELEMENT
    string kind;

    // for renames and scalar modifications, the old and new values
    optional<string> before, after;

    // for COLUMNS, the labels of the affected columns
    // This is truncated to the configured limit. :omitted_items says how many
    // labels were left out.
    std::vector<string> items;
    size_t omitted_items = 0;

    // any additional summary (e.g., a column count, a size comparison or a
    // preview of added text)
    optional<string> detail;
};

bool
operator==(change_entry const& a, change_entry const& b);
bool
operator!=(change_entry const& a, change_entry const& b);

std::ostream&
operator<<(std::ostream& s, change_entry const& entry);

// Render a change as a single line of plain text, e.g.,
// "renamed page: Sales → Sales2".
string
to_string(change_entry const& entry);

// Render a change as a line of Markdown (suitable for a pull request
// comment).
string
to_markdown(change_entry const& entry);

// Render a whole list of changes as plain text lines.
std::vector<string>
to_strings(std::vector<change_entry> const& entries);

// Construct a change_entry with the given type, subject and label.
change_entry
make_change_entry(change_type type, change_subject subject, string label);

// Construct a rename entry.
change_entry
make_rename_entry(
    change_subject subject, string kind, string before, string after);

} // namespace modeldiff

#endif
