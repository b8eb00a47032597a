#include <modeldiff/diff/change.h>

#include <modeldiff/utilities/testing.h>
#include <modeldiff/utilities/text.h>

using namespace modeldiff;

TEST_CASE("change enum streaming", "[diff][change]")
{
    REQUIRE(lexical_cast<string>(change_type::ADDED) == "added");
    REQUIRE(lexical_cast<string>(change_type::REMOVED) == "removed");
    REQUIRE(lexical_cast<string>(change_type::RENAMED) == "renamed");
    REQUIRE(lexical_cast<string>(change_type::MODIFIED) == "modified");
    REQUIRE(lexical_cast<string>(change_type::NEW_DOCUMENT) == "new");
    REQUIRE_THROWS_AS(
        lexical_cast<string>(change_type(-1)), invalid_enum_value);

    REQUIRE(lexical_cast<string>(change_subject::PAGE) == "page");
    REQUIRE(lexical_cast<string>(change_subject::COLUMNS) == "columns");
    REQUIRE(
        lexical_cast<string>(change_subject::DOCUMENT_DESCRIPTION)
        == "description");
    REQUIRE_THROWS_AS(
        lexical_cast<string>(change_subject(-1)), invalid_enum_value);
}

TEST_CASE("change entry construction", "[diff][change]")
{
    auto rename = make_rename_entry(
        change_subject::ELEMENT, "table", "Orders", "Sales");
    REQUIRE(rename.type == change_type::RENAMED);
    REQUIRE(rename.label == "Sales");
    REQUIRE(rename.kind == "table");
    REQUIRE(rename.before == some(string("Orders")));
    REQUIRE(rename.after == some(string("Sales")));

    auto added = make_change_entry(
        change_type::ADDED, change_subject::PAGE, "Sales");
    REQUIRE(added.items.empty());
    REQUIRE(added.omitted_items == 0);
    REQUIRE(added.detail == none);

    REQUIRE(added == added);
    REQUIRE(added != rename);
    auto other = added;
    other.detail = string("x");
    REQUIRE(added != other);

    // A default-constructed entry is well-defined and can be rendered.
    change_entry blank;
    REQUIRE(blank.type == change_type::MODIFIED);
    REQUIRE(blank.subject == change_subject::DOCUMENT);
    REQUIRE(to_string(blank) == "modified document");
    REQUIRE(blank == change_entry());
}

TEST_CASE("plain text rendering", "[diff][change]")
{
    REQUIRE(
        to_string(make_rename_entry(
            change_subject::PAGE, "", "Sales", "Sales2"))
        == "renamed page: Sales → Sales2");
    REQUIRE(
        to_string(make_rename_entry(
            change_subject::ELEMENT, "view", "A", "B"))
        == "renamed view: A → B");
    REQUIRE(
        to_string(
            make_change_entry(change_type::REMOVED, change_subject::PAGE, ""))
        == "removed page");

    auto element = make_change_entry(
        change_type::ADDED, change_subject::ELEMENT, "Orders");
    REQUIRE(to_string(element) == "added element: Orders");
    element.kind = "table";
    element.detail = "3 columns";
    REQUIRE(to_string(element) == "added table: Orders (3 columns)");

    auto columns = make_change_entry(
        change_type::REMOVED, change_subject::COLUMNS, "Orders");
    columns.items = {"a", "b"};
    REQUIRE(to_string(columns) == "removed columns in Orders: a, b");
    columns.omitted_items = 4;
    REQUIRE(to_string(columns) == "removed columns in Orders: a, b (+4 more)");

    auto field = make_change_entry(
        change_type::MODIFIED, change_subject::FIELD, "schemaVersion");
    field.before = string("1");
    field.after = string("2");
    REQUIRE(to_string(field) == "modified field: schemaVersion: 1 → 2");

    auto document = make_change_entry(
        change_type::NEW_DOCUMENT, change_subject::DOCUMENT, "Revenue");
    REQUIRE(to_string(document) == "new document: Revenue");
    REQUIRE(lexical_cast<string>(document) == "new document: Revenue");
}

TEST_CASE("Markdown rendering", "[diff][change]")
{
    REQUIRE(
        to_markdown(make_change_entry(
            change_type::NEW_DOCUMENT, change_subject::DOCUMENT, ""))
        == "🆕 **New data model**");
    REQUIRE(
        to_markdown(make_change_entry(
            change_type::NEW_DOCUMENT, change_subject::DOCUMENT, "Revenue"))
        == "🆕 **New data model**: `Revenue`");

    REQUIRE(
        to_markdown(
            make_change_entry(change_type::ADDED, change_subject::PAGE, "X"))
        == "➕ New page: `X`");
    REQUIRE(
        to_markdown(make_change_entry(
            change_type::REMOVED, change_subject::PAGE, "X"))
        == "➖ Removed page: `X`");

    auto element = make_change_entry(
        change_type::ADDED, change_subject::ELEMENT, "Orders");
    element.kind = "table";
    REQUIRE(to_markdown(element) == "➕ New table: `Orders`");

    REQUIRE(
        to_markdown(make_rename_entry(
            change_subject::PAGE, "", "Sales", "Sales2"))
        == "✏️ Renamed page: `Sales` → `Sales2`");
    REQUIRE(
        to_markdown(make_rename_entry(
            change_subject::COLUMN, "", "amount", "total"))
        == "  ✏️ Renamed column: `amount` → `total`");

    auto columns = make_change_entry(
        change_type::MODIFIED, change_subject::COLUMNS, "Orders");
    columns.items = {"a", "b"};
    REQUIRE(
        to_markdown(columns) == "  📝 `Orders`: Modified columns: `a`, `b`");
    columns.omitted_items = 2;
    REQUIRE(
        to_markdown(columns)
        == "  📝 `Orders`: Modified columns: `a`, `b` _and 2 more_");

    auto field = make_change_entry(
        change_type::MODIFIED, change_subject::FIELD, "schemaVersion");
    field.before = string("1");
    field.after = string("2");
    REQUIRE(
        to_markdown(field) == "📝 Modified field `schemaVersion`: `1` → `2`");
}
