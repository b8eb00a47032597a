#include <modeldiff/diff/fallback.h>

#include <modeldiff/encodings/json.h>
#include <modeldiff/utilities/logging.h>
#include <modeldiff/utilities/text.h>

namespace modeldiff {

static size_t
serialized_size(dynamic const& value)
{
    return value_to_compact_json(value).length();
}

static string
describe_size_change(size_t old_size, size_t new_size, char const* unit)
{
    return lexical_cast<string>(old_size) + " → "
           + lexical_cast<string>(new_size) + " " + unit;
}

// Get the text used to show a scalar value in a change entry. Strings are
// shown unquoted unless :quote_strings is set, which is needed whenever the
// other side of the change has a different type.
static string
display_value(dynamic const& value, bool quote_strings)
{
    if (value.type() == value_type::STRING && !quote_strings)
        return cast<string>(value);
    return value_to_compact_json(value);
}

static bool
is_long_string(dynamic const& value, diff_config const& config)
{
    return value.type() == value_type::STRING
           && utf8_length(cast<string>(value)) > config.long_string_threshold;
}

static change_entry
describe_modified_field(
    string const& field,
    dynamic const& old_value,
    dynamic const& new_value,
    diff_config const& config)
{
    auto entry
        = make_change_entry(change_type::MODIFIED, change_subject::FIELD, field);
    if (is_composite(old_value))
    {
        entry.detail = describe_size_change(
            serialized_size(old_value), serialized_size(new_value), "bytes");
    }
    else if (is_long_string(old_value, config))
    {
        auto new_length = new_value.type() == value_type::STRING
                              ? utf8_length(cast<string>(new_value))
                              : serialized_size(new_value);
        entry.detail = describe_size_change(
            utf8_length(cast<string>(old_value)), new_length, "characters");
    }
    else
    {
        bool quote_strings = old_value.type() != new_value.type();
        entry.before = display_value(old_value, quote_strings);
        entry.after = display_value(new_value, quote_strings);
    }
    return entry;
}

std::vector<change_entry>
compute_fallback_diff(
    optional<dynamic> const& old_document,
    dynamic const& new_document,
    diff_config const& config)
{
    std::vector<change_entry> changes;

    if (!old_document)
    {
        auto entry = make_change_entry(
            change_type::NEW_DOCUMENT, change_subject::DOCUMENT, string());
        entry.detail = "approximately "
                       + lexical_cast<string>(serialized_size(new_document))
                       + " bytes";
        changes.push_back(std::move(entry));
        return changes;
    }

    if (old_document->type() != value_type::MAP
        || new_document.type() != value_type::MAP)
    {
        if (*old_document != new_document)
        {
            auto entry = make_change_entry(
                change_type::MODIFIED, change_subject::DOCUMENT, string());
            entry.detail = describe_size_change(
                serialized_size(*old_document),
                serialized_size(new_document),
                "bytes");
            changes.push_back(std::move(entry));
        }
        return changes;
    }

    auto const& old_fields = cast<dynamic_map>(*old_document);
    auto const& new_fields = cast<dynamic_map>(new_document);

    // Both maps are sorted by key, so walking them together visits the union
    // of their fields in sorted order.
    auto a_i = old_fields.begin(), a_end = old_fields.end();
    auto b_i = new_fields.begin(), b_end = new_fields.end();
    while (a_i != a_end || b_i != b_end)
    {
        if (a_i != a_end && (b_i == b_end || a_i->first < b_i->first))
        {
            changes.push_back(make_change_entry(
                change_type::REMOVED,
                change_subject::FIELD,
                display_value(a_i->first, false)));
            ++a_i;
        }
        else if (b_i != b_end && (a_i == a_end || b_i->first < a_i->first))
        {
            changes.push_back(make_change_entry(
                change_type::ADDED,
                change_subject::FIELD,
                display_value(b_i->first, false)));
            ++b_i;
        }
        else
        {
            if (a_i->second != b_i->second)
            {
                changes.push_back(describe_modified_field(
                    display_value(a_i->first, false),
                    a_i->second,
                    b_i->second,
                    config));
            }
            ++a_i;
            ++b_i;
        }
    }

    get_logger()->debug("fallback diff found {} change(s)", changes.size());
    return changes;
}

} // namespace modeldiff
