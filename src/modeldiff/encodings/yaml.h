#ifndef MODELDIFF_ENCODINGS_YAML_H
#define MODELDIFF_ENCODINGS_YAML_H

#include <modeldiff/core/dynamic.h>

// YAML - conversion to and from YAML strings

namespace modeldiff {

// Parse some YAML text into a dynamic value.
// If the text isn't valid YAML, this throws a parsing_error.
dynamic
parse_yaml_value(char const* yaml, size_t length);

// Same as above, but accepts a string.
inline dynamic
parse_yaml_value(string const& yaml)
{
    return parse_yaml_value(yaml.c_str(), yaml.length());
}

// Write a value to a string in YAML format.
string
value_to_yaml(dynamic const& v);

// Write a value to a diagnostic string in YAML format.
// This won't necessarily capture the entire contents of the value. In
// particular, it will omit the contents of large arrays and maps.
string
value_to_diagnostic_yaml(dynamic const& v);

} // namespace modeldiff

#endif
