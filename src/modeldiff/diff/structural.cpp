#include <modeldiff/diff/structural.h>

#include <algorithm>
#include <functional>
#include <iterator>

#include <modeldiff/encodings/json.h>
#include <modeldiff/utilities/logging.h>
#include <modeldiff/utilities/text.h>

namespace modeldiff {

// IDENTITY MATCHING

// Render an identity key as text.
static string
identity_label(dynamic const& key)
{
    if (key.type() == value_type::STRING)
        return cast<string>(key);
    return value_to_compact_json(key);
}

namespace {

// the entities of a single collection, split by whether or not they can be
// matched by their identity keys
template<class Entity>
struct identity_index
{
    std::map<dynamic, Entity const*> keyed;
    // entities without ids or with ids that aren't unique within the
    // collection, in their original order
    std::vector<Entity const*> unkeyed;
};

template<class Entity>
struct identity_matching
{
    std::vector<Entity const*> added;
    std::vector<Entity const*> removed;
    std::vector<std::pair<Entity const*, Entity const*>> matched;
};

} // namespace

template<class Entity>
static identity_index<Entity>
index_by_identity(std::vector<Entity> const& entities, char const* entity_kind)
{
    identity_index<Entity> index;
    std::map<dynamic, std::vector<Entity const*>> groups;
    for (auto const& entity : entities)
    {
        if (entity.id)
            groups[*entity.id].push_back(&entity);
        else
            index.unkeyed.push_back(&entity);
    }
    for (auto const& group : groups)
    {
        if (group.second.size() == 1)
        {
            index.keyed[group.first] = group.second.front();
        }
        else
        {
            get_logger()->warn(
                "{} {} {}s share the id {}; they won't be matched by id",
                group.second.size(),
                entity_kind,
                entity_kind,
                identity_label(group.first));
            index.unkeyed.insert(
                index.unkeyed.end(),
                group.second.begin(),
                group.second.end());
        }
    }
    // The entities all live in the same vector, so address order is the
    // original order.
    std::sort(
        index.unkeyed.begin(),
        index.unkeyed.end(),
        std::less<Entity const*>());
    return index;
}

// Match the entities of two versions of a collection.
// Entities with unique ids are matched by id. Any others can't be tracked
// across versions, so they only pair up with identical entities on the other
// side; the rest are treated as removed and re-added.
template<class Entity>
static identity_matching<Entity>
match_by_identity(
    std::vector<Entity> const& old_entities,
    std::vector<Entity> const& new_entities,
    char const* entity_kind)
{
    auto old_index = index_by_identity(old_entities, entity_kind);
    auto new_index = index_by_identity(new_entities, entity_kind);

    identity_matching<Entity> matching;

    auto a_i = old_index.keyed.begin(), a_end = old_index.keyed.end();
    auto b_i = new_index.keyed.begin(), b_end = new_index.keyed.end();
    while (a_i != a_end || b_i != b_end)
    {
        if (a_i != a_end && (b_i == b_end || a_i->first < b_i->first))
        {
            matching.removed.push_back(a_i->second);
            ++a_i;
        }
        else if (b_i != b_end && (a_i == a_end || b_i->first < a_i->first))
        {
            matching.added.push_back(b_i->second);
            ++b_i;
        }
        else
        {
            matching.matched.emplace_back(a_i->second, b_i->second);
            ++a_i;
            ++b_i;
        }
    }

    std::vector<bool> paired(new_index.unkeyed.size(), false);
    std::vector<Entity const*> unpaired_old;
    for (auto const* old_entity : old_index.unkeyed)
    {
        bool found = false;
        for (size_t i = 0; i != new_index.unkeyed.size(); ++i)
        {
            if (!paired[i] && new_index.unkeyed[i]->record == old_entity->record)
            {
                paired[i] = true;
                found = true;
                break;
            }
        }
        if (!found)
            unpaired_old.push_back(old_entity);
    }
    for (size_t i = 0; i != new_index.unkeyed.size(); ++i)
    {
        if (!paired[i])
            matching.added.push_back(new_index.unkeyed[i]);
    }
    matching.removed.insert(
        matching.removed.end(), unpaired_old.begin(), unpaired_old.end());

    return matching;
}

// LABELS

static string
label_or_placeholder(optional<string> const& name, diff_config const& config)
{
    return name && !name->empty() ? *name : config.unnamed_placeholder;
}

static string
element_kind(model_element const& element, diff_config const& config)
{
    return element.kind && !element.kind->empty()
               ? *element.kind
               : config.default_element_kind;
}

// Get the label used for a column in column lists.
static string
column_label(model_column const& column)
{
    if (column.name)
        return *column.name;
    if (column.id)
        return identity_label(*column.id);
    return string();
}

static bool
is_empty(optional<string> const& text)
{
    return !text || text->empty();
}

// COLUMNS

static change_entry
make_column_list_entry(
    change_type type,
    string const& element_label,
    std::vector<string> const& labels,
    diff_config const& config)
{
    auto entry
        = make_change_entry(type, change_subject::COLUMNS, element_label);
    size_t shown = std::min(labels.size(), config.column_label_limit);
    entry.items.assign(labels.begin(), labels.begin() + shown);
    entry.omitted_items = labels.size() - shown;
    return entry;
}

// Get a copy of a column record without its name.
static dynamic
without_name(dynamic const& record)
{
    if (record.type() != value_type::MAP)
        return record;
    auto fields = cast<dynamic_map>(record);
    fields.erase(dynamic("name"));
    return dynamic(std::move(fields));
}

// Index columns by their derived keys. If several columns share a key, the
// last one wins.
static std::map<dynamic, model_column const*>
index_columns(
    std::vector<model_column> const& columns, string const& element_label)
{
    std::map<dynamic, model_column const*> index;
    for (auto const& column : columns)
    {
        auto key = get_column_key(column);
        auto& slot = index[key];
        if (slot)
        {
            get_logger()->warn(
                "columns of {} share the key '{}'; only the last one is "
                "compared",
                element_label,
                identity_label(key));
        }
        slot = &column;
    }
    return index;
}

std::vector<change_entry>
compare_columns(
    string const& element_label,
    std::vector<model_column> const& old_columns,
    std::vector<model_column> const& new_columns,
    diff_config const& config)
{
    auto old_index = index_columns(old_columns, element_label);
    auto new_index = index_columns(new_columns, element_label);

    std::vector<change_entry> changes;
    std::vector<string> added, removed, modified;

    auto a_i = old_index.begin(), a_end = old_index.end();
    auto b_i = new_index.begin(), b_end = new_index.end();
    while (a_i != a_end || b_i != b_end)
    {
        if (a_i != a_end && (b_i == b_end || a_i->first < b_i->first))
        {
            removed.push_back(column_label(*a_i->second));
            ++a_i;
        }
        else if (b_i != b_end && (a_i == a_end || b_i->first < a_i->first))
        {
            added.push_back(column_label(*b_i->second));
            ++b_i;
        }
        else
        {
            auto const& old_column = *a_i->second;
            auto const& new_column = *b_i->second;
            // A rename requires a stable id. When the key came from the name,
            // the names are necessarily equal.
            bool renamed = old_column.id && new_column.id
                           && *old_column.id == *new_column.id
                           && old_column.name != new_column.name;
            if (renamed)
            {
                changes.push_back(make_rename_entry(
                    change_subject::COLUMN,
                    string(),
                    label_or_placeholder(old_column.name, config),
                    label_or_placeholder(new_column.name, config)));
            }
            if (renamed ? without_name(old_column.record)
                              != without_name(new_column.record)
                        : old_column.record != new_column.record)
            {
                modified.push_back(column_label(new_column));
            }
            ++a_i;
            ++b_i;
        }
    }

    if (!added.empty())
    {
        changes.push_back(make_column_list_entry(
            change_type::ADDED, element_label, added, config));
    }
    if (!removed.empty())
    {
        changes.push_back(make_column_list_entry(
            change_type::REMOVED, element_label, removed, config));
    }
    if (!modified.empty())
    {
        changes.push_back(make_column_list_entry(
            change_type::MODIFIED, element_label, modified, config));
    }
    return changes;
}

// ELEMENTS

static change_entry
make_element_entry(
    change_type type, model_element const& element, diff_config const& config)
{
    auto entry = make_change_entry(
        type,
        change_subject::ELEMENT,
        label_or_placeholder(element.name, config));
    entry.kind = element_kind(element, config);
    return entry;
}

static void
compare_elements(
    std::vector<change_entry>& changes,
    model_page const& old_page,
    model_page const& new_page,
    diff_config const& config)
{
    auto matching
        = match_by_identity(old_page.elements, new_page.elements, "element");

    for (auto const* element : matching.added)
    {
        changes.push_back(
            make_element_entry(change_type::ADDED, *element, config));
    }
    for (auto const* element : matching.removed)
    {
        changes.push_back(
            make_element_entry(change_type::REMOVED, *element, config));
    }
    for (auto const& pair : matching.matched)
    {
        auto const& old_element = *pair.first;
        auto const& new_element = *pair.second;
        if (old_element.name != new_element.name)
        {
            changes.push_back(make_rename_entry(
                change_subject::ELEMENT,
                element_kind(new_element, config),
                label_or_placeholder(old_element.name, config),
                label_or_placeholder(new_element.name, config)));
        }
        auto column_changes = compare_columns(
            label_or_placeholder(new_element.name, config),
            old_element.columns,
            new_element.columns,
            config);
        std::move(
            column_changes.begin(),
            column_changes.end(),
            std::back_inserter(changes));
    }
}

// PAGES

static void
compare_pages(
    std::vector<change_entry>& changes,
    model_document const& old_document,
    model_document const& new_document,
    diff_config const& config)
{
    auto matching
        = match_by_identity(old_document.pages, new_document.pages, "page");

    for (auto const* page : matching.added)
    {
        changes.push_back(make_change_entry(
            change_type::ADDED,
            change_subject::PAGE,
            label_or_placeholder(page->name, config)));
    }
    for (auto const* page : matching.removed)
    {
        changes.push_back(make_change_entry(
            change_type::REMOVED,
            change_subject::PAGE,
            label_or_placeholder(page->name, config)));
    }
    for (auto const& pair : matching.matched)
    {
        if (pair.first->name != pair.second->name)
        {
            changes.push_back(make_rename_entry(
                change_subject::PAGE,
                string(),
                label_or_placeholder(pair.first->name, config),
                label_or_placeholder(pair.second->name, config)));
        }
        compare_elements(changes, *pair.first, *pair.second, config);
    }
}

// DOCUMENTS

static void
list_new_document(
    std::vector<change_entry>& changes,
    model_document const& document,
    diff_config const& config)
{
    changes.push_back(make_change_entry(
        change_type::NEW_DOCUMENT,
        change_subject::DOCUMENT,
        document.name ? *document.name : string()));
    for (auto const& page : document.pages)
    {
        for (auto const& element : page.elements)
        {
            auto entry
                = make_element_entry(change_type::ADDED, element, config);
            auto column_count = element.columns.size();
            entry.detail = lexical_cast<string>(column_count)
                           + (column_count == 1 ? " column" : " columns");
            changes.push_back(std::move(entry));
        }
    }
}

static void
compare_document_name(
    std::vector<change_entry>& changes,
    optional<string> const& old_name,
    optional<string> const& new_name)
{
    if (!is_empty(old_name) && !is_empty(new_name))
    {
        if (*old_name != *new_name)
        {
            auto entry = make_change_entry(
                change_type::MODIFIED, change_subject::DOCUMENT_NAME, *new_name);
            entry.before = *old_name;
            entry.after = *new_name;
            changes.push_back(std::move(entry));
        }
    }
    else if (is_empty(old_name) && !is_empty(new_name))
    {
        changes.push_back(make_change_entry(
            change_type::ADDED, change_subject::DOCUMENT_NAME, *new_name));
    }
    else if (!is_empty(old_name) && is_empty(new_name))
    {
        changes.push_back(make_change_entry(
            change_type::REMOVED, change_subject::DOCUMENT_NAME, *old_name));
    }
}

static void
compare_document_description(
    std::vector<change_entry>& changes,
    optional<string> const& old_description,
    optional<string> const& new_description,
    diff_config const& config)
{
    if (!is_empty(old_description) && !is_empty(new_description))
    {
        if (*old_description != *new_description)
        {
            changes.push_back(make_change_entry(
                change_type::MODIFIED,
                change_subject::DOCUMENT_DESCRIPTION,
                string()));
        }
    }
    else if (is_empty(old_description) && !is_empty(new_description))
    {
        auto preview = utf8_prefix(
            *new_description, config.description_preview_length);
        if (preview.length() < new_description->length())
            preview += "...";
        changes.push_back(make_change_entry(
            change_type::ADDED, change_subject::DOCUMENT_DESCRIPTION, preview));
    }
    else if (!is_empty(old_description) && is_empty(new_description))
    {
        changes.push_back(make_change_entry(
            change_type::REMOVED,
            change_subject::DOCUMENT_DESCRIPTION,
            string()));
    }
}

std::vector<change_entry>
compare_documents(
    optional<model_document> const& old_document,
    model_document const& new_document,
    diff_config const& config)
{
    std::vector<change_entry> changes;
    if (!old_document)
    {
        list_new_document(changes, new_document, config);
        return changes;
    }
    compare_document_name(changes, old_document->name, new_document.name);
    compare_document_description(
        changes, old_document->description, new_document.description, config);
    compare_pages(changes, *old_document, new_document, config);
    get_logger()->debug(
        "structural comparison found {} change(s)", changes.size());
    return changes;
}

std::vector<change_entry>
compare_documents(
    optional<dynamic> const& old_document,
    dynamic const& new_document,
    diff_config const& config)
{
    optional<model_document> old_model;
    if (old_document)
        old_model = read_model_document(*old_document);
    return compare_documents(
        old_model, read_model_document(new_document), config);
}

} // namespace modeldiff
