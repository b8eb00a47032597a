#include <modeldiff/report/report.h>

#include <sstream>

#include <modeldiff/diff/fallback.h>
#include <modeldiff/diff/structural.h>
#include <modeldiff/fs/file_io.h>
#include <modeldiff/utilities/errors.h>
#include <modeldiff/utilities/logging.h>
#include <modeldiff/utilities/text.h>

namespace modeldiff {

std::ostream&
operator<<(std::ostream& s, comparison_status status)
{
    switch (status)
    {
        case comparison_status::CHANGED:
            s << "changed";
            break;
        case comparison_status::UNCHANGED:
            s << "unchanged";
            break;
        case comparison_status::UNREADABLE:
            s << "unreadable";
            break;
        default:
            MODELDIFF_THROW(
                invalid_enum_value() << enum_id_info("comparison_status")
                                     << enum_value_info(int(status)));
    }
    return s;
}

document_comparison
compare_document_versions(
    optional<dynamic> const& old_document,
    dynamic const& new_document,
    diff_config const& config)
{
    bool has_old_version = old_document ? true : false;
    MODELDIFF_LOG_CALL(
        << MODELDIFF_LOG_ARG(has_old_version)
        << MODELDIFF_LOG_ARG(new_document))

    document_comparison comparison;
    comparison.changes = compare_documents(old_document, new_document, config);
    if (comparison.changes.empty() && old_document != some(new_document))
    {
        comparison.changes
            = compute_fallback_diff(old_document, new_document, config);
        comparison.used_fallback = true;
    }
    comparison.status = comparison.changes.empty()
                            ? comparison_status::UNCHANGED
                            : comparison_status::CHANGED;
    get_logger()->debug(
        "comparison is {} with {} change(s){}",
        lexical_cast<string>(comparison.status),
        comparison.changes.size(),
        comparison.used_fallback ? " (fallback)" : "");
    return comparison;
}

// Get a short description of why a document couldn't be read.
static string
describe_parsing_error(parsing_error const& e)
{
    auto const* message = get_error_info<parsing_error_info>(e);
    return message ? *message : string("invalid JSON");
}

static string
describe_open_file_error(open_file_error const& e)
{
    auto const* message = get_error_info<internal_error_message_info>(e);
    return message ? *message : string("unable to open file");
}

document_comparison
compare_sourced_documents(
    document_source_interface& old_source,
    string const& old_name,
    document_source_interface& new_source,
    string const& new_name,
    diff_config const& config)
{
    optional<dynamic> new_document;
    optional<string> error;
    try
    {
        new_document = new_source.read_document(new_name);
        if (!new_document)
            error = "document not found";
    }
    catch (parsing_error& e)
    {
        error = describe_parsing_error(e);
    }
    catch (open_file_error& e)
    {
        error = describe_open_file_error(e);
    }
    if (error)
    {
        get_logger()->warn("unable to read {}: {}", new_name, *error);
        document_comparison comparison;
        comparison.status = comparison_status::UNREADABLE;
        comparison.error = error;
        return comparison;
    }

    optional<dynamic> old_document;
    try
    {
        old_document = old_source.read_document(old_name);
    }
    catch (parsing_error& e)
    {
        get_logger()->warn(
            "treating {} as new because its previous version is unreadable: "
            "{}",
            new_name,
            describe_parsing_error(e));
    }
    catch (open_file_error& e)
    {
        get_logger()->warn(
            "treating {} as new because its previous version is unreadable: "
            "{}",
            new_name,
            describe_open_file_error(e));
    }

    return compare_document_versions(old_document, *new_document, config);
}

static void
render_text_section(std::ostream& s, named_comparison const& document)
{
    s << "== " << document.name << " ==\n";
    auto const& comparison = document.comparison;
    switch (comparison.status)
    {
        case comparison_status::CHANGED:
            for (auto const& change : comparison.changes)
                s << to_string(change) << "\n";
            break;
        case comparison_status::UNCHANGED:
            s << "No structural changes detected\n";
            break;
        case comparison_status::UNREADABLE:
            s << "Could not parse JSON";
            if (comparison.error)
                s << " (" << *comparison.error << ")";
            s << "\n";
            break;
    }
    s << "\n";
}

static void
render_markdown_section(std::ostream& s, named_comparison const& document)
{
    s << "### `" << document.name << "`\n\n";
    auto const& comparison = document.comparison;
    switch (comparison.status)
    {
        case comparison_status::CHANGED:
            for (auto const& change : comparison.changes)
                s << to_markdown(change) << "\n";
            break;
        case comparison_status::UNCHANGED:
            s << "_No structural changes detected_\n";
            break;
        case comparison_status::UNREADABLE:
            s << "⚠️ Could not parse JSON\n";
            break;
    }
    s << "\n";
}

static size_t
count_changed(std::vector<named_comparison> const& comparisons)
{
    size_t count = 0;
    for (auto const& document : comparisons)
    {
        if (document.comparison.status == comparison_status::CHANGED)
            ++count;
    }
    return count;
}

string
render_report(
    std::vector<named_comparison> const& comparisons, report_format format)
{
    std::ostringstream s;
    if (comparisons.empty())
    {
        s << "No data model changes detected.\n";
        return s.str();
    }
    switch (format)
    {
        case report_format::TEXT:
            s << count_changed(comparisons) << " of " << comparisons.size()
              << " data model(s) changed:\n\n";
            for (auto const& document : comparisons)
                render_text_section(s, document);
            break;
        case report_format::MARKDOWN:
            s << "**" << count_changed(comparisons) << " of "
              << comparisons.size() << " data model(s) changed:**\n\n";
            for (auto const& document : comparisons)
                render_markdown_section(s, document);
            break;
    }
    return s.str();
}

} // namespace modeldiff
