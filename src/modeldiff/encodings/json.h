#ifndef MODELDIFF_ENCODINGS_JSON_H
#define MODELDIFF_ENCODINGS_JSON_H

#include <modeldiff/core.h>

// JSON - conversion to and from JSON strings

namespace modeldiff {

// Parse some JSON text into a dynamic value.
// If the text isn't valid JSON, this throws a parsing_error.
dynamic
parse_json_value(char const* json, size_t length);

// Same as above, but accepts a string.
inline dynamic
parse_json_value(string const& json)
{
    return parse_json_value(json.c_str(), json.length());
}

// Write a value to a string in (indented) JSON format.
string
value_to_json(dynamic const& v);

// Write a value to a string in compact JSON format (no whitespace).
string
value_to_compact_json(dynamic const& v);

} // namespace modeldiff

#endif
