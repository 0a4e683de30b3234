#ifndef TREEDIFF_ENCODINGS_YAML_HPP
#define TREEDIFF_ENCODINGS_YAML_HPP

#include <treediff/core/dynamic.hpp>

// YAML - conversion to and from YAML strings
//
// Sets and lists have no native YAML representation, so they're written as
// sequences carrying the local tags !set and !list respectively.

namespace treediff {

// Parse some YAML text into a dynamic value.
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
// particular, it will summarize large containers.
string
value_to_diagnostic_yaml(dynamic const& v);

} // namespace treediff

#endif
