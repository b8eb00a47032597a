#include <modeldiff/utilities/environment.h>

#include <cstdlib>

namespace modeldiff {

string
get_environment_variable(string const& name)
{
    auto value = get_optional_environment_variable(name);
    if (!value)
    {
        MODELDIFF_THROW(
            missing_environment_variable() << variable_name_info(name));
    }
    return *value;
}

optional<string>
get_optional_environment_variable(string const& name)
{
    char const* value = std::getenv(name.c_str());
    return value && *value != '\0' ? some(string(value)) : none;
}

void
set_environment_variable(string const& name, string const& value)
{
    if (value.empty())
        unsetenv(name.c_str());
    else
        setenv(name.c_str(), value.c_str(), 1);
}

} // namespace modeldiff
