#ifndef TREEDIFF_CORE_UTILITIES_HPP
#define TREEDIFF_CORE_UTILITIES_HPP

#include <treediff/core/exception.hpp>

#include <boost/lexical_cast.hpp>

namespace treediff {

using boost::lexical_cast;

// invalid_enum_value is thrown when an enum's raw (integer) value is invalid.
TREEDIFF_DEFINE_EXCEPTION(invalid_enum_value)
TREEDIFF_DEFINE_ERROR_INFO(string, enum_id)
TREEDIFF_DEFINE_ERROR_INFO(int, enum_value)

// invalid_enum_string is thrown when attempting to convert a string value to
// an enum and the string doesn't match any of the enum's cases.
TREEDIFF_DEFINE_EXCEPTION(invalid_enum_string)
// Note that this also uses the enum_id info declared above.
TREEDIFF_DEFINE_ERROR_INFO(string, enum_string)

// If a simple parsing operation fails, this exception can be thrown.
TREEDIFF_DEFINE_EXCEPTION(parsing_error)
TREEDIFF_DEFINE_ERROR_INFO(string, expected_format)
TREEDIFF_DEFINE_ERROR_INFO(string, parsed_text)
TREEDIFF_DEFINE_ERROR_INFO(string, parsing_error)

// Get the value of an optional environment variable.
// If the variable isn't set, this simply returns none.
optional<string>
get_optional_environment_variable(string const& name);

// Set the value of an environment variable.
void
set_environment_variable(string const& name, string const& value);

// If an error occurs internally within library that provides its own
// error messages, this is used to convey that message.
TREEDIFF_DEFINE_ERROR_INFO(string, internal_error_message)

} // namespace treediff

#endif
