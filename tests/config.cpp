#include <modeldiff/config.h>

#include <modeldiff/fs/file_io.h>
#include <modeldiff/utilities/testing.h>
#include <modeldiff/utilities/text.h>

using namespace modeldiff;

TEST_CASE("default diff_config", "[config]")
{
    diff_config config;
    REQUIRE(config.column_label_limit == 5);
    REQUIRE(config.description_preview_length == 100);
    REQUIRE(config.long_string_threshold == 50);
    REQUIRE(config.unnamed_placeholder == "Unnamed");
    REQUIRE(config.default_element_kind == "element");

    // An empty configuration is the default one.
    REQUIRE(read_diff_config(nil) == config);
    REQUIRE(read_diff_config(dynamic_map()) == config);
}

TEST_CASE("diff_config reading", "[config]")
{
    auto config = read_diff_config(
        {{"column_label_limit", integer(2)},
         {"unnamed_placeholder", "(no name)"},
         {"some_future_field", true}});
    REQUIRE(config.column_label_limit == 2);
    REQUIRE(config.unnamed_placeholder == "(no name)");
    // Everything else keeps its default.
    REQUIRE(config.description_preview_length == 100);
    REQUIRE(config.default_element_kind == "element");

    diff_config custom;
    custom.column_label_limit = 9;
    custom.description_preview_length = 12;
    custom.long_string_threshold = 20;
    custom.unnamed_placeholder = "?";
    custom.default_element_kind = "widget";
    REQUIRE(read_diff_config(to_dynamic(custom)) == custom);
    REQUIRE(custom != diff_config());
}

TEST_CASE("invalid diff_config", "[config]")
{
    try
    {
        read_diff_config({{"column_label_limit", "five"}});
        FAIL("no exception thrown");
    }
    catch (invalid_config& e)
    {
        REQUIRE(
            get_required_error_info<config_field_info>(e)
            == "column_label_limit");
        REQUIRE(
            get_required_error_info<expected_value_type_info>(e)
            == value_type::INTEGER);
    }

    try
    {
        read_diff_config({{"long_string_threshold", integer(-1)}});
        FAIL("no exception thrown");
    }
    catch (invalid_config& e)
    {
        REQUIRE(
            get_required_error_info<config_field_info>(e)
            == "long_string_threshold");
    }

    try
    {
        read_diff_config({{"default_element_kind", integer(1)}});
        FAIL("no exception thrown");
    }
    catch (invalid_config& e)
    {
        REQUIRE(
            get_required_error_info<config_field_info>(e)
            == "default_element_kind");
        REQUIRE(
            get_required_error_info<expected_value_type_info>(e)
            == value_type::STRING);
    }

    try
    {
        read_diff_config(dynamic_array{integer(1)});
        FAIL("no exception thrown");
    }
    catch (invalid_config& e)
    {
        REQUIRE(get_required_error_info<config_field_info>(e) == "");
        REQUIRE(
            get_required_error_info<expected_value_type_info>(e)
            == value_type::MAP);
    }
}

TEST_CASE("diff_config loading", "[config]")
{
    auto dir = get_test_scratch_dir("config");

    auto yaml_path = dir / "config.yml";
    dump_string_to_file(
        yaml_path,
        "column_label_limit: 3\n"
        "default_element_kind: object\n");
    auto config = load_diff_config(yaml_path);
    REQUIRE(config.column_label_limit == 3);
    REQUIRE(config.default_element_kind == "object");

    // JSON works too.
    auto json_path = dir / "config.json";
    dump_string_to_file(json_path, R"({ "long_string_threshold": 10 })");
    REQUIRE(load_diff_config(json_path).long_string_threshold == 10);

    // An empty file is the default configuration.
    auto empty_path = dir / "empty.yml";
    dump_string_to_file(empty_path, "");
    REQUIRE(load_diff_config(empty_path) == diff_config());

    REQUIRE_THROWS_AS(load_diff_config(dir / "missing.yml"), open_file_error);

    auto malformed_path = dir / "malformed.yml";
    dump_string_to_file(malformed_path, "column_label_limit: [3\n");
    REQUIRE_THROWS_AS(load_diff_config(malformed_path), parsing_error);
}
