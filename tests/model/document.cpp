#include <modeldiff/model/document.h>

#include <modeldiff/encodings/json.h>
#include <modeldiff/utilities/testing.h>

using namespace modeldiff;

TEST_CASE("model document reading", "[model][document]")
{
    auto document = read_model_document(parse_json_value(R"json(
        {
            "name": "Revenue",
            "description": "Quarterly revenue",
            "schemaVersion": 2,
            "pages": [
                {
                    "id": "p1",
                    "name": "Sales",
                    "elements": [
                        {
                            "id": "e1",
                            "name": "Orders",
                            "kind": "table",
                            "columns": [
                                {
                                    "id": "c1",
                                    "name": "amount",
                                    "formula": "sum(x)",
                                    "format": { "currency": "USD" }
                                },
                                { "name": "region" }
                            ]
                        }
                    ]
                }
            ]
        }
    )json"));

    REQUIRE(document.name == some(string("Revenue")));
    REQUIRE(document.description == some(string("Quarterly revenue")));
    REQUIRE(document.fields.size() == 4);
    REQUIRE(
        document.fields.at(dynamic("schemaVersion")) == dynamic(integer(2)));

    REQUIRE(document.pages.size() == 1);
    auto const& page = document.pages[0];
    REQUIRE(page.id == some(dynamic("p1")));
    REQUIRE(page.name == some(string("Sales")));

    REQUIRE(page.elements.size() == 1);
    auto const& element = page.elements[0];
    REQUIRE(element.id == some(dynamic("e1")));
    REQUIRE(element.name == some(string("Orders")));
    REQUIRE(element.kind == some(string("table")));

    REQUIRE(element.columns.size() == 2);
    auto const& amount = element.columns[0];
    REQUIRE(amount.id == some(dynamic("c1")));
    REQUIRE(amount.name == some(string("amount")));
    REQUIRE(amount.formula == some(string("sum(x)")));
    // The record keeps everything, including fields with no typed view.
    REQUIRE(
        cast<dynamic_map>(amount.record).at(dynamic("format"))
        == dynamic({{"currency", "USD"}}));

    auto const& region = element.columns[1];
    REQUIRE(region.id == none);
    REQUIRE(region.name == some(string("region")));
    REQUIRE(region.formula == none);
}

TEST_CASE("model document defaults", "[model][document]")
{
    // Missing collections are empty.
    auto empty = read_model_document(parse_json_value(R"({ "name": "X" })"));
    REQUIRE(empty.name == some(string("X")));
    REQUIRE(empty.description == none);
    REQUIRE(empty.pages.empty());

    // So are collections that aren't arrays, and entries that aren't maps are
    // skipped.
    auto odd = read_model_document(parse_json_value(R"(
        {
            "pages": [
                12,
                { "id": "p1", "elements": { "id": "e1" } },
                { "id": "p2", "elements": [ "e1", { "columns": null } ] }
            ]
        }
    )"));
    REQUIRE(odd.pages.size() == 2);
    REQUIRE(odd.pages[0].elements.empty());
    REQUIRE(odd.pages[1].elements.size() == 1);
    REQUIRE(odd.pages[1].elements[0].columns.empty());
    REQUIRE(odd.pages[1].elements[0].id == none);

    // A document that isn't a map has no structure at all.
    auto scalar = read_model_document(dynamic("just a string"));
    REQUIRE(scalar.name == none);
    REQUIRE(scalar.pages.empty());
    REQUIRE(scalar.fields.empty());
}

TEST_CASE("model labels and identities", "[model][document]")
{
    auto record = cast<dynamic_map>(parse_json_value(R"(
        {
            "id": "",
            "name": 42,
            "kind": null,
            "formula": [ "a", 1 ]
        }
    )"));

    // Non-string labels are rendered as JSON.
    REQUIRE(read_label(record, "name") == some(string("42")));
    REQUIRE(read_label(record, "formula") == some(string(R"(["a",1])")));
    REQUIRE(read_label(record, "kind") == none);
    REQUIRE(read_label(record, "missing") == none);

    // Empty ids don't count.
    REQUIRE(read_identity(record) == none);
    REQUIRE(
        read_identity(cast<dynamic_map>(parse_json_value(R"({ "id": 7 })")))
        == some(dynamic(integer(7))));
    REQUIRE(read_identity(dynamic_map()) == none);
}

TEST_CASE("column keys", "[model][document]")
{
    model_column column;
    REQUIRE(get_column_key(column) == dynamic(""));

    column.name = string("Total");
    REQUIRE(get_column_key(column) == dynamic("Total"));

    column.id = dynamic("c9");
    REQUIRE(get_column_key(column) == dynamic("c9"));
}
