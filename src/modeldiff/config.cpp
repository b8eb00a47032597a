#include <modeldiff/config.h>

#include <modeldiff/encodings/yaml.h>
#include <modeldiff/fs/file_io.h>
#include <modeldiff/utilities/logging.h>

namespace modeldiff {

char const* const default_config_file = "model-diff/config.yml";

bool
operator==(diff_config const& a, diff_config const& b)
{
    return a.column_label_limit == b.column_label_limit
           && a.description_preview_length == b.description_preview_length
           && a.long_string_threshold == b.long_string_threshold
           && a.unnamed_placeholder == b.unnamed_placeholder
           && a.default_element_kind == b.default_element_kind;
}
bool
operator!=(diff_config const& a, diff_config const& b)
{
    return !(a == b);
}

static size_t
read_count(dynamic const& v)
{
    integer i = cast<integer>(v);
    if (i < 0)
    {
        MODELDIFF_THROW(
            type_mismatch() << expected_value_type_info(value_type::INTEGER)
                            << actual_value_type_info(v.type()));
    }
    return size_t(i);
}

diff_config
read_diff_config(dynamic const& v)
{
    diff_config config;
    // An empty configuration file parses as nil.
    if (v.type() == value_type::NIL)
        return config;
    try
    {
        for (auto const& field : cast<dynamic_map>(v))
        {
            if (field.first.type() != value_type::STRING)
            {
                get_logger()->warn(
                    "ignoring non-string configuration key:\n{}",
                    value_to_diagnostic_yaml(field.first));
                continue;
            }
            auto const& name = cast<string>(field.first);
            try
            {
                if (name == "column_label_limit")
                    config.column_label_limit = read_count(field.second);
                else if (name == "description_preview_length")
                {
                    config.description_preview_length
                        = read_count(field.second);
                }
                else if (name == "long_string_threshold")
                    config.long_string_threshold = read_count(field.second);
                else if (name == "unnamed_placeholder")
                    config.unnamed_placeholder = cast<string>(field.second);
                else if (name == "default_element_kind")
                    config.default_element_kind = cast<string>(field.second);
                else
                {
                    get_logger()->warn(
                        "ignoring unknown configuration field '{}'", name);
                }
            }
            catch (type_mismatch& e)
            {
                MODELDIFF_THROW(
                    invalid_config()
                    << config_field_info(name)
                    << expected_value_type_info(
                           get_required_error_info<expected_value_type_info>(
                               e)));
            }
        }
    }
    catch (type_mismatch&)
    {
        MODELDIFF_THROW(
            invalid_config() << config_field_info("")
                             << expected_value_type_info(value_type::MAP));
    }
    return config;
}

dynamic
to_dynamic(diff_config const& config)
{
    return dynamic{
        {"column_label_limit", integer(config.column_label_limit)},
        {"description_preview_length",
         integer(config.description_preview_length)},
        {"long_string_threshold", integer(config.long_string_threshold)},
        {"unnamed_placeholder", config.unnamed_placeholder},
        {"default_element_kind", config.default_element_kind}};
}

diff_config
load_diff_config(file_path const& path)
{
    auto config = read_diff_config(parse_yaml_value(read_file_contents(path)));
    get_logger()->debug(
        "loaded configuration from {}:\n{}",
        path.string(),
        value_to_diagnostic_yaml(to_dynamic(config)));
    return config;
}

} // namespace modeldiff
