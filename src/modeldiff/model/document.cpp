#include <modeldiff/model/document.h>

#include <modeldiff/encodings/json.h>
#include <modeldiff/utilities/logging.h>

namespace modeldiff {

optional<string>
read_label(dynamic_map const& record, string const& field)
{
    dynamic const* value;
    if (!get_field(&value, record, field) || value->type() == value_type::NIL)
        return none;
    if (value->type() == value_type::STRING)
        return cast<string>(*value);
    return value_to_compact_json(*value);
}

optional<dynamic>
read_identity(dynamic_map const& record)
{
    dynamic const* value;
    if (!get_field(&value, record, "id") || value->type() == value_type::NIL)
        return none;
    if (value->type() == value_type::STRING && cast<string>(*value).empty())
        return none;
    return *value;
}

dynamic
get_column_key(model_column const& column)
{
    if (column.id)
        return *column.id;
    if (column.name)
        return *column.name;
    return string();
}

// Get the entries of the collection stored in :field of :record.
// Anything other than an array is treated as an empty collection, and entries
// that aren't maps are skipped. :fn is called on each remaining entry.
template<class Fn>
static void
for_each_record(
    dynamic_map const& record,
    string const& field,
    char const* entity_kind,
    Fn&& fn)
{
    dynamic const* collection;
    if (!get_field(&collection, record, field)
        || collection->type() == value_type::NIL)
    {
        return;
    }
    if (collection->type() != value_type::ARRAY)
    {
        get_logger()->warn(
            "ignoring '{}' collection of type {}",
            field,
            lexical_cast<string>(collection->type()));
        return;
    }
    for (auto const& entry : cast<dynamic_array>(*collection))
    {
        if (entry.type() != value_type::MAP)
        {
            get_logger()->warn(
                "skipping {} entry of type {}",
                entity_kind,
                lexical_cast<string>(entry.type()));
            continue;
        }
        fn(entry);
    }
}

static model_column
read_model_column(dynamic const& record)
{
    auto const& map = cast<dynamic_map>(record);
    model_column column;
    column.id = read_identity(map);
    column.name = read_label(map, "name");
    column.formula = read_label(map, "formula");
    column.record = record;
    return column;
}

static model_element
read_model_element(dynamic const& record)
{
    auto const& map = cast<dynamic_map>(record);
    model_element element;
    element.id = read_identity(map);
    element.name = read_label(map, "name");
    element.kind = read_label(map, "kind");
    for_each_record(map, "columns", "column", [&](dynamic const& column) {
        element.columns.push_back(read_model_column(column));
    });
    element.record = record;
    return element;
}

static model_page
read_model_page(dynamic const& record)
{
    auto const& map = cast<dynamic_map>(record);
    model_page page;
    page.id = read_identity(map);
    page.name = read_label(map, "name");
    for_each_record(map, "elements", "element", [&](dynamic const& element) {
        page.elements.push_back(read_model_element(element));
    });
    page.record = record;
    return page;
}

model_document
read_model_document(dynamic const& document)
{
    model_document model;
    if (document.type() != value_type::MAP)
    {
        get_logger()->warn(
            "document is a {}, not a map; treating it as empty",
            lexical_cast<string>(document.type()));
        return model;
    }
    model.fields = cast<dynamic_map>(document);
    model.name = read_label(model.fields, "name");
    model.description = read_label(model.fields, "description");
    for_each_record(model.fields, "pages", "page", [&](dynamic const& page) {
        model.pages.push_back(read_model_page(page));
    });
    return model;
}

} // namespace modeldiff
