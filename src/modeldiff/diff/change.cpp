#include <modeldiff/diff/change.h>

#include <sstream>

#include <boost/algorithm/string/join.hpp>

namespace modeldiff {

std::ostream&
operator<<(std::ostream& s, change_type t)
{
    switch (t)
    {
        case change_type::ADDED:
            s << "added";
            break;
        case change_type::REMOVED:
            s << "removed";
            break;
        case change_type::RENAMED:
            s << "renamed";
            break;
        case change_type::MODIFIED:
            s << "modified";
            break;
        case change_type::NEW_DOCUMENT:
            s << "new";
            break;
        default:
            MODELDIFF_THROW(
                invalid_enum_value()
                << enum_id_info("change_type") << enum_value_info(int(t)));
    }
    return s;
}

std::ostream&
operator<<(std::ostream& s, change_subject t)
{
    switch (t)
    {
        case change_subject::DOCUMENT:
            s << "document";
            break;
        case change_subject::DOCUMENT_NAME:
            s << "name";
            break;
        case change_subject::DOCUMENT_DESCRIPTION:
            s << "description";
            break;
        case change_subject::PAGE:
            s << "page";
            break;
        case change_subject::ELEMENT:
            s << "element";
            break;
        case change_subject::COLUMN:
            s << "column";
            break;
        case change_subject::COLUMNS:
            s << "columns";
            break;
        case change_subject::FIELD:
            s << "field";
            break;
        default:
            MODELDIFF_THROW(
                invalid_enum_value()
                << enum_id_info("change_subject") << enum_value_info(int(t)));
    }
    return s;
}

bool
operator==(change_entry const& a, change_entry const& b)
{
    return a.type == b.type && a.subject == b.subject && a.label == b.label
           && a.kind == b.kind && a.before == b.before && a.after == b.after
           && a.items == b.items && a.omitted_items == b.omitted_items
           && a.detail == b.detail;
}
bool
operator!=(change_entry const& a, change_entry const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, change_entry const& entry)
{
    s << to_string(entry);
    return s;
}

change_entry
make_change_entry(change_type type, change_subject subject, string label)
{
    change_entry entry;
    entry.type = type;
    entry.subject = subject;
    entry.label = std::move(label);
    return entry;
}

change_entry
make_rename_entry(
    change_subject subject, string kind, string before, string after)
{
    change_entry entry;
    entry.type = change_type::RENAMED;
    entry.subject = subject;
    entry.kind = std::move(kind);
    entry.label = after;
    entry.before = std::move(before);
    entry.after = std::move(after);
    return entry;
}

// Get the word for the thing that changed.
static string
get_noun(change_entry const& entry)
{
    if (entry.subject == change_subject::ELEMENT && !entry.kind.empty())
        return entry.kind;
    return lexical_cast<string>(entry.subject);
}

static string
capitalize(string s)
{
    if (!s.empty() && s[0] >= 'a' && s[0] <= 'z')
        s[0] = char(s[0] - 'a' + 'A');
    return s;
}

static string
join_items(
    std::vector<string> const& items,
    string const& quote,
    string const& separator)
{
    std::vector<string> quoted;
    quoted.reserve(items.size());
    for (auto const& item : items)
        quoted.push_back(quote + item + quote);
    return boost::algorithm::join(quoted, separator);
}

string
to_string(change_entry const& entry)
{
    std::ostringstream s;
    if (entry.type == change_type::NEW_DOCUMENT)
    {
        s << "new document";
        if (!entry.label.empty())
            s << ": " << entry.label;
    }
    else if (entry.subject == change_subject::COLUMNS)
    {
        s << entry.type << " columns in " << entry.label << ": "
          << join_items(entry.items, "", ", ");
        if (entry.omitted_items != 0)
            s << " (+" << entry.omitted_items << " more)";
    }
    else if (entry.before && entry.after)
    {
        s << entry.type << " " << get_noun(entry) << ": ";
        if (entry.subject == change_subject::FIELD)
            s << entry.label << ": ";
        s << *entry.before << " → " << *entry.after;
    }
    else
    {
        s << entry.type << " " << get_noun(entry);
        if (!entry.label.empty())
            s << ": " << entry.label;
    }
    if (entry.detail)
        s << " (" << *entry.detail << ")";
    return s.str();
}

static char const*
get_marker(change_type type)
{
    switch (type)
    {
        case change_type::ADDED:
            return "➕";
        case change_type::REMOVED:
            return "➖";
        case change_type::RENAMED:
            return "✏️";
        case change_type::MODIFIED:
        default:
            return "📝";
        case change_type::NEW_DOCUMENT:
            return "🆕";
    }
}

static string
get_markdown_verb(change_entry const& entry)
{
    if (entry.type == change_type::ADDED
        && (entry.subject == change_subject::PAGE
            || entry.subject == change_subject::ELEMENT))
    {
        return "New";
    }
    return capitalize(lexical_cast<string>(entry.type));
}

string
to_markdown(change_entry const& entry)
{
    std::ostringstream s;
    // Column-level changes are nested under their element.
    if (entry.subject == change_subject::COLUMN
        || entry.subject == change_subject::COLUMNS)
    {
        s << "  ";
    }
    s << get_marker(entry.type) << " ";
    if (entry.type == change_type::NEW_DOCUMENT)
    {
        s << "**New data model**";
        if (!entry.label.empty())
            s << ": `" << entry.label << "`";
    }
    else if (entry.subject == change_subject::COLUMNS)
    {
        s << "`" << entry.label << "`: " << get_markdown_verb(entry)
          << " columns: " << join_items(entry.items, "`", ", ");
        if (entry.omitted_items != 0)
            s << " _and " << entry.omitted_items << " more_";
    }
    else if (entry.before && entry.after)
    {
        s << get_markdown_verb(entry) << " " << get_noun(entry);
        if (entry.subject == change_subject::FIELD)
            s << " `" << entry.label << "`";
        s << ": `" << *entry.before << "` → `" << *entry.after << "`";
    }
    else
    {
        s << get_markdown_verb(entry) << " " << get_noun(entry);
        if (!entry.label.empty())
            s << ": `" << entry.label << "`";
    }
    if (entry.detail)
        s << " (" << *entry.detail << ")";
    return s.str();
}

std::vector<string>
to_strings(std::vector<change_entry> const& entries)
{
    std::vector<string> strings;
    strings.reserve(entries.size());
    for (auto const& entry : entries)
        strings.push_back(to_string(entry));
    return strings;
}

} // namespace modeldiff
