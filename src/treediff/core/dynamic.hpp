#ifndef TREEDIFF_CORE_DYNAMIC_HPP
#define TREEDIFF_CORE_DYNAMIC_HPP

#include <initializer_list>
#include <ostream>

#include <treediff/core/exception.hpp>
#include <treediff/core/type_definitions.hpp>

namespace treediff {

// DYNAMIC VALUES - Dynamic values are values whose structure is determined at
// run-time rather than compile time.

std::ostream&
operator<<(std::ostream& s, value_type t);

// Check that two value types match.
void
check_type(value_type expected, value_type actual);

// If the above check fails, it throws this exception.
TREEDIFF_DEFINE_EXCEPTION(type_mismatch)
TREEDIFF_DEFINE_ERROR_INFO(value_type, expected_value_type)
TREEDIFF_DEFINE_ERROR_INFO(value_type, actual_value_type)

// Get the value_type value for a C++ type.
template<class T>
struct value_type_of
{
};
template<>
struct value_type_of<nil_t>
{
    static value_type const value = value_type::NIL;
};
template<>
struct value_type_of<bool>
{
    static value_type const value = value_type::BOOLEAN;
};
template<>
struct value_type_of<integer>
{
    static value_type const value = value_type::INTEGER;
};
template<>
struct value_type_of<double>
{
    static value_type const value = value_type::FLOAT;
};
template<>
struct value_type_of<string>
{
    static value_type const value = value_type::STRING;
};
template<>
struct value_type_of<ptime>
{
    static value_type const value = value_type::DATETIME;
};
template<>
struct value_type_of<dynamic_array>
{
    static value_type const value = value_type::ARRAY;
};
template<>
struct value_type_of<dynamic_list>
{
    static value_type const value = value_type::LIST;
};
template<>
struct value_type_of<dynamic_set>
{
    static value_type const value = value_type::SET;
};
template<>
struct value_type_of<dynamic_map>
{
    static value_type const value = value_type::MAP;
};

// VALUE KINDS

// value_kind is the structural classification that the differ works with.
// Scalars of all types collapse into SCALAR, and a missing value (represented
// by a null pointer) is ABSENT.
enum class value_kind
{
    ABSENT,
    SCALAR,
    ARRAY,
    LIST,
    SET,
    MAP
};

std::ostream&
operator<<(std::ostream& s, value_kind k);

// Get the structural kind of a value that may be absent.
value_kind
classify(dynamic const* v);

// Does the given value type represent a container?
bool
is_container(value_type t);

// MAPS

// This queries a map for a field with a key matching the given string.
// If the field is not present in the map, an exception is thrown.
dynamic const&
get_field(dynamic_map const& r, string const& field);

TREEDIFF_DEFINE_EXCEPTION(missing_field)
TREEDIFF_DEFINE_ERROR_INFO(string, field_name)

// This is the same as above, but its return value indicates whether or not
// the field is in the map.
bool
get_field(dynamic const** v, dynamic_map const& r, string const& field);

// When an error occurs in the processing of a dynamic value, this provides the
// path to the location within the value where the error occurred.
TREEDIFF_DEFINE_ERROR_INFO(std::list<dynamic>, dynamic_value_path)

// Given an exception :e, this will add :path_element to the beginning of the
// dynamic_value_path info associated with :e. If there is currently no path
// info associated with :e, a path containing only :p is associated with it.
void
add_dynamic_path_element(boost::exception& e, dynamic const& path_element);

// NESTING

// Get the container nesting depth of a value. Scalars have a depth of 0 and a
// container has a depth one greater than its deepest element.
size_t
nesting_depth(dynamic const& v);

// Check that a value isn't nested more deeply than :limit.
void
check_nesting_depth(dynamic const& v, size_t limit);

// If the above check fails, it throws this exception.
TREEDIFF_DEFINE_EXCEPTION(nesting_too_deep)
TREEDIFF_DEFINE_ERROR_INFO(size_t, nesting_depth_limit)

// VALUES

// Cast a dynamic value to one of the base types.
template<class T>
T const&
cast(dynamic const& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T const&>(v.contents());
}
// Same, but with a non-const reference.
template<class T>
T&
cast(dynamic& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T&>(v.contents());
}
// Same, but with move semantics.
template<class T>
T&&
cast(dynamic&& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T&&>(std::move(v).contents());
}

std::ostream&
operator<<(std::ostream& os, dynamic const& v);

std::ostream&
operator<<(std::ostream& os, std::list<dynamic> const& v);

void
swap(dynamic& a, dynamic& b);

// Comparison is type-sensitive. Two values of different types are never
// equal, even if they would compare equal numerically (e.g., 1 and 1.0), and
// ordering across types follows the order of value_type.
bool
operator==(dynamic const& a, dynamic const& b);
bool
operator!=(dynamic const& a, dynamic const& b);
bool
operator<(dynamic const& a, dynamic const& b);
bool
operator<=(dynamic const& a, dynamic const& b);
bool
operator>(dynamic const& a, dynamic const& b);
bool
operator>=(dynamic const& a, dynamic const& b);

static inline bool
operator==(nil_t a, nil_t b)
{
    return true;
}
static inline bool
operator<(nil_t a, nil_t b)
{
    return false;
}

inline void
to_dynamic(dynamic* v, dynamic const& x)
{
    *v = x;
}
inline void
from_dynamic(dynamic* x, dynamic const& v)
{
    *x = v;
}

// All regular treediff types provide to_dynamic(&v, x) and
// from_dynamic(&x, v). The following are alternate, often more convenient
// forms.
template<class T>
dynamic
to_dynamic(T const& x)
{
    dynamic v;
    to_dynamic(&v, x);
    return v;
}
template<class T>
T
from_dynamic(dynamic const& v)
{
    T x;
    from_dynamic(&x, v);
    return x;
}

// Apply the functor fn to two values of the same type.
// If a and b are not the same type, this throws a type_mismatch exception.
template<class Fn>
auto
apply_to_dynamic_pair(Fn&& fn, dynamic const& a, dynamic const& b)
{
    check_type(a.type(), b.type());
    switch (a.type())
    {
        case value_type::NIL:
        default: // All cases are covered, so this is just to avoid warnings.
            return fn(nil, nil);
        case value_type::BOOLEAN:
            return fn(cast<bool>(a), cast<bool>(b));
        case value_type::INTEGER:
            return fn(cast<integer>(a), cast<integer>(b));
        case value_type::FLOAT:
            return fn(cast<double>(a), cast<double>(b));
        case value_type::STRING:
            return fn(cast<string>(a), cast<string>(b));
        case value_type::DATETIME:
            return fn(cast<ptime>(a), cast<ptime>(b));
        case value_type::ARRAY:
            return fn(cast<dynamic_array>(a), cast<dynamic_array>(b));
        case value_type::LIST:
            return fn(cast<dynamic_list>(a), cast<dynamic_list>(b));
        case value_type::SET:
            return fn(cast<dynamic_set>(a), cast<dynamic_set>(b));
        case value_type::MAP:
            return fn(cast<dynamic_map>(a), cast<dynamic_map>(b));
    }
}

// This is a generic function for reading a field from a dynamic_map.
// If the field is missing, :field_value is left untouched.
template<class Field>
void
read_field_from_record(
    omissible<Field>* field_value,
    dynamic_map const& record,
    string const& field_name)
{
    dynamic const* dynamic_field_value;
    if (!get_field(&dynamic_field_value, record, field_name))
        return;
    try
    {
        Field x;
        from_dynamic(&x, *dynamic_field_value);
        *field_value = x;
    }
    catch (boost::exception& e)
    {
        treediff::add_dynamic_path_element(e, field_name);
        throw;
    }
}

// Same, but for fields that must be present.
template<class Field>
void
read_field_from_record(
    Field* field_value, dynamic_map const& record, string const& field_name)
{
    auto const& dynamic_field_value = get_field(record, field_name);
    try
    {
        from_dynamic(field_value, dynamic_field_value);
    }
    catch (boost::exception& e)
    {
        treediff::add_dynamic_path_element(e, field_name);
        throw;
    }
}

// This is a generic function for writing a field to a dynamic_map.
template<class Field>
void
write_field_to_record(
    dynamic_map& record, std::string field_name, Field const& field_value)
{
    to_dynamic(&record[dynamic(std::move(field_name))], field_value);
}

template<class Field>
void
write_field_to_record(
    dynamic_map& record,
    std::string field_name,
    omissible<Field> const& field_value)
{
    if (field_value)
        write_field_to_record(record, std::move(field_name), *field_value);
}

} // namespace treediff

#endif
