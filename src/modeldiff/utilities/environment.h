#ifndef MODELDIFF_UTILITIES_ENVIRONMENT_H
#define MODELDIFF_UTILITIES_ENVIRONMENT_H

#include <modeldiff/core.h>

namespace modeldiff {

// Get the value of an environment variable.
string
get_environment_variable(string const& name);
// If the variable isn't set, the following exception is thrown.
MODELDIFF_DEFINE_EXCEPTION(missing_environment_variable)
MODELDIFF_DEFINE_ERROR_INFO(string, variable_name)

// Get the value of an optional environment variable.
// If the variable isn't set (or is empty), this simply returns none.
optional<string>
get_optional_environment_variable(string const& name);

// Set the value of an environment variable.
// Setting a variable to the empty string removes it.
void
set_environment_variable(string const& name, string const& value);

} // namespace modeldiff

#endif
