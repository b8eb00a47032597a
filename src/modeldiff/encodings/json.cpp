#include <modeldiff/encodings/json.h>

#include <limits>
#include <mutex>

#include <nlohmann/json.hpp>
#include <simdjson.h>

#include <modeldiff/utilities/text.h>

namespace modeldiff {

// JSON I/O

// Read a JSON value into a dynamic.
static dynamic
read_json_value(simdjson::dom::element const& json)
{
    switch (json.type())
    {
        case simdjson::dom::element_type::NULL_VALUE:
        default: // to avoid warnings
            return nil;
        case simdjson::dom::element_type::BOOL:
            return bool(json);
        case simdjson::dom::element_type::INT64:
            return integer(int64_t(json));
        case simdjson::dom::element_type::UINT64: {
            // Only values beyond the range of int64_t come through here, so
            // they're stored as floats rather than overflowing.
            uint64_t value = uint64_t(json);
            if (value <= uint64_t(std::numeric_limits<integer>::max()))
                return integer(value);
            return double(value);
        }
        case simdjson::dom::element_type::DOUBLE:
            return double(json);
        case simdjson::dom::element_type::STRING:
            return string(json.get_string().value());
        case simdjson::dom::element_type::ARRAY: {
            simdjson::dom::array source = json;
            dynamic_array array;
            array.reserve(source.size());
            for (auto const& i : source)
            {
                array.push_back(read_json_value(i));
            }
            return array;
        }
        case simdjson::dom::element_type::OBJECT: {
            simdjson::dom::object object = json;
            dynamic_map map;
            for (auto const& i : object)
            {
                // If a key is repeated, the last occurrence wins.
                map[string(i.key)] = read_json_value(i.value);
            }
            return map;
        }
    }
}

dynamic
parse_json_value(char const* json, size_t length)
{
    static simdjson::dom::parser the_parser;
    static std::mutex the_mutex;

    std::lock_guard<std::mutex> guard(the_mutex);

    simdjson::dom::element doc;
    try
    {
        doc = the_parser.parse(json, length);
    }
    catch (std::exception& e)
    {
        MODELDIFF_THROW(
            parsing_error() << expected_format_info("JSON")
                            << parsed_text_info(string(json, json + length))
                            << parsing_error_info(e.what()));
    }
    return read_json_value(doc);
}

static bool
has_only_string_keys(dynamic_map const& map)
{
    for (auto const& i : map)
    {
        if (i.first.type() != value_type::STRING)
            return false;
    }
    return true;
}

static nlohmann::json
to_nlohmann_json(dynamic const& v)
{
    switch (v.type())
    {
        case value_type::NIL:
        default: // to avoid warnings
            return nullptr;
        case value_type::BOOLEAN:
            return cast<bool>(v);
        case value_type::INTEGER:
            return cast<integer>(v);
        case value_type::FLOAT:
            return cast<double>(v);
        case value_type::STRING:
            return cast<string>(v);
        case value_type::ARRAY: {
            nlohmann::json json(nlohmann::json::value_t::array);
            for (auto const& i : cast<dynamic_array>(v))
            {
                json.push_back(to_nlohmann_json(i));
            }
            return json;
        }
        case value_type::MAP: {
            dynamic_map const& x = cast<dynamic_map>(v);
            // If the map has only key strings, encode it directly as a JSON
            // object.
            if (has_only_string_keys(x))
            {
                nlohmann::json json(nlohmann::json::value_t::object);
                for (auto const& i : x)
                {
                    json[cast<string>(i.first)] = to_nlohmann_json(i.second);
                }
                return json;
            }
            // Otherwise, encode it as a array of key/value pairs.
            else
            {
                nlohmann::json json(nlohmann::json::value_t::array);
                for (auto const& i : x)
                {
                    nlohmann::json pair;
                    pair["key"] = to_nlohmann_json(i.first);
                    pair["value"] = to_nlohmann_json(i.second);
                    json.push_back(pair);
                }
                return json;
            }
        }
    }
}

// Strings that aren't valid UTF-8 are written with replacement characters
// rather than failing, since these functions are used to describe documents.

string
value_to_json(dynamic const& v)
{
    return to_nlohmann_json(v).dump(
        4, ' ', false, nlohmann::json::error_handler_t::replace);
}

string
value_to_compact_json(dynamic const& v)
{
    return to_nlohmann_json(v).dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace modeldiff
