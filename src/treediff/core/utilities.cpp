#include <treediff/core/utilities.hpp>

#include <cstdlib>

namespace treediff {

optional<string>
get_optional_environment_variable(string const& name)
{
    char const* value = std::getenv(name.c_str());
    return value && *value != '\0' ? some(string(value)) : none;
}

void
set_environment_variable(string const& name, string const& value)
{
#ifdef WIN32
    auto assignment = name + "=" + value;
    _putenv(assignment.c_str());
#else
    if (value.empty())
        unsetenv(name.c_str());
    else
        setenv(name.c_str(), value.c_str(), 1);
#endif
}

} // namespace treediff
