#include <treediff/core/dynamic.hpp>

#include <algorithm>

#include <treediff/core/utilities.hpp>
#include <treediff/encodings/yaml.hpp>

namespace treediff {

std::ostream&
operator<<(std::ostream& s, value_type t)
{
    switch (t)
    {
        case value_type::NIL:
            s << "nil";
            break;
        case value_type::BOOLEAN:
            s << "boolean";
            break;
        case value_type::INTEGER:
            s << "integer";
            break;
        case value_type::FLOAT:
            s << "float";
            break;
        case value_type::STRING:
            s << "string";
            break;
        case value_type::DATETIME:
            s << "datetime";
            break;
        case value_type::ARRAY:
            s << "array";
            break;
        case value_type::LIST:
            s << "list";
            break;
        case value_type::SET:
            s << "set";
            break;
        case value_type::MAP:
            s << "map";
            break;
        default:
            TREEDIFF_THROW(
                invalid_enum_value()
                << enum_id_info("value_type") << enum_value_info(int(t)));
    }
    return s;
}

void
check_type(value_type expected, value_type actual)
{
    if (expected != actual)
    {
        TREEDIFF_THROW(
            type_mismatch() << expected_value_type_info(expected)
                            << actual_value_type_info(actual));
    }
}

std::ostream&
operator<<(std::ostream& s, value_kind k)
{
    switch (k)
    {
        case value_kind::ABSENT:
            s << "absent";
            break;
        case value_kind::SCALAR:
            s << "scalar";
            break;
        case value_kind::ARRAY:
            s << "array";
            break;
        case value_kind::LIST:
            s << "list";
            break;
        case value_kind::SET:
            s << "set";
            break;
        case value_kind::MAP:
            s << "map";
            break;
        default:
            TREEDIFF_THROW(
                invalid_enum_value()
                << enum_id_info("value_kind") << enum_value_info(int(k)));
    }
    return s;
}

value_kind
classify(dynamic const* v)
{
    if (!v)
        return value_kind::ABSENT;
    switch (v->type())
    {
        case value_type::NIL:
        case value_type::BOOLEAN:
        case value_type::INTEGER:
        case value_type::FLOAT:
        case value_type::STRING:
        case value_type::DATETIME:
            return value_kind::SCALAR;
        case value_type::ARRAY:
            return value_kind::ARRAY;
        case value_type::LIST:
            return value_kind::LIST;
        case value_type::SET:
            return value_kind::SET;
        case value_type::MAP:
            return value_kind::MAP;
    }
    TREEDIFF_THROW(
        invalid_enum_value()
        << enum_id_info("value_type") << enum_value_info(int(v->type())));
}

bool
is_container(value_type t)
{
    switch (t)
    {
        case value_type::ARRAY:
        case value_type::LIST:
        case value_type::SET:
        case value_type::MAP:
            return true;
        default:
            return false;
    }
}

dynamic::dynamic(std::initializer_list<dynamic> list)
{
    // If this is a list of arrays, all of which are length two and have
    // strings as their first elements, treat it as a map.
    if (std::all_of(list.begin(), list.end(), [](dynamic const& v) {
            return v.type() == value_type::ARRAY
                   && cast<dynamic_array>(v).size() == 2
                   && cast<dynamic_array>(v)[0].type() == value_type::STRING;
        }))
    {
        dynamic_map map;
        for (auto const& v : list)
        {
            auto const& array = cast<dynamic_array>(v);
            map[array[0]] = array[1];
        }
        *this = std::move(map);
    }
    else
    {
        *this = dynamic_array(list);
    }
}

void
dynamic::set(nil_t _)
{
    type_ = value_type::NIL;
    value_.reset();
}
void
dynamic::set(bool v)
{
    type_ = value_type::BOOLEAN;
    value_ = v;
}
void
dynamic::set(integer v)
{
    type_ = value_type::INTEGER;
    value_ = v;
}
void
dynamic::set(double v)
{
    type_ = value_type::FLOAT;
    value_ = v;
}
void
dynamic::set(string const& v)
{
    type_ = value_type::STRING;
    value_ = v;
}
void
dynamic::set(string&& v)
{
    type_ = value_type::STRING;
    value_ = std::move(v);
}
void
dynamic::set(ptime const& v)
{
    type_ = value_type::DATETIME;
    value_ = v;
}
void
dynamic::set(dynamic_array const& v)
{
    type_ = value_type::ARRAY;
    value_ = v;
}
void
dynamic::set(dynamic_array&& v)
{
    type_ = value_type::ARRAY;
    value_ = std::move(v);
}
void
dynamic::set(dynamic_list const& v)
{
    type_ = value_type::LIST;
    value_ = v;
}
void
dynamic::set(dynamic_list&& v)
{
    type_ = value_type::LIST;
    value_ = std::move(v);
}
void
dynamic::set(dynamic_set const& v)
{
    type_ = value_type::SET;
    value_ = v;
}
void
dynamic::set(dynamic_set&& v)
{
    type_ = value_type::SET;
    value_ = std::move(v);
}
void
dynamic::set(dynamic_map const& v)
{
    type_ = value_type::MAP;
    value_ = v;
}
void
dynamic::set(dynamic_map&& v)
{
    type_ = value_type::MAP;
    value_ = std::move(v);
}

void
swap(dynamic& a, dynamic& b)
{
    using std::swap;
    swap(a.type_, b.type_);
    swap(a.value_, b.value_);
}

std::ostream&
operator<<(std::ostream& os, dynamic const& v)
{
    os << value_to_diagnostic_yaml(v);
    return os;
}

std::ostream&
operator<<(std::ostream& os, std::list<dynamic> const& v)
{
    os << dynamic(dynamic_array{std::begin(v), std::end(v)});
    return os;
}

// COMPARISON OPERATORS

bool
operator==(dynamic const& a, dynamic const& b)
{
    if (a.type() != b.type())
        return false;
    return apply_to_dynamic_pair(
        [](auto const& x, auto const& y) { return x == y; }, a, b);
}
bool
operator!=(dynamic const& a, dynamic const& b)
{
    return !(a == b);
}

bool
operator<(dynamic const& a, dynamic const& b)
{
    if (a.type() != b.type())
        return a.type() < b.type();
    return apply_to_dynamic_pair(
        [](auto const& x, auto const& y) { return x < y; }, a, b);
}
bool
operator<=(dynamic const& a, dynamic const& b)
{
    return !(b < a);
}
bool
operator>(dynamic const& a, dynamic const& b)
{
    return b < a;
}
bool
operator>=(dynamic const& a, dynamic const& b)
{
    return !(a < b);
}

dynamic const&
get_field(dynamic_map const& r, string const& field)
{
    dynamic const* v;
    if (!get_field(&v, r, field))
    {
        TREEDIFF_THROW(missing_field() << field_name_info(field));
    }
    return *v;
}

bool
get_field(dynamic const** v, dynamic_map const& r, string const& field)
{
    auto i = r.find(dynamic(field));
    if (i == r.end())
        return false;
    *v = &i->second;
    return true;
}

void
add_dynamic_path_element(boost::exception& e, dynamic const& path_element)
{
    std::list<dynamic>* info = get_error_info<dynamic_value_path_info>(e);
    if (info)
    {
        info->push_front(path_element);
    }
    else
    {
        e << dynamic_value_path_info(std::list<dynamic>({path_element}));
    }
}

// NESTING

size_t
nesting_depth(dynamic const& v)
{
    size_t deepest = 0;
    switch (v.type())
    {
        case value_type::ARRAY:
            for (auto const& item : cast<dynamic_array>(v))
                deepest = (std::max)(deepest, nesting_depth(item));
            break;
        case value_type::LIST:
            for (auto const& item : cast<dynamic_list>(v))
                deepest = (std::max)(deepest, nesting_depth(item));
            break;
        case value_type::SET:
            for (auto const& item : cast<dynamic_set>(v))
                deepest = (std::max)(deepest, nesting_depth(item));
            break;
        case value_type::MAP:
            for (auto const& item : cast<dynamic_map>(v))
            {
                deepest = (std::max)(
                    deepest,
                    (std::max)(
                        nesting_depth(item.first),
                        nesting_depth(item.second)));
            }
            break;
        default:
            return 0;
    }
    return deepest + 1;
}

// This walks the value itself rather than calling nesting_depth() so that it
// can stop descending as soon as the limit is crossed.
static void
check_nesting_depth(dynamic const& v, size_t limit, size_t depth)
{
    if (!is_container(v.type()))
        return;
    if (depth >= limit)
    {
        TREEDIFF_THROW(
            nesting_too_deep() << nesting_depth_limit_info(limit));
    }
    auto recurse
        = [&](dynamic const& x) { check_nesting_depth(x, limit, depth + 1); };
    switch (v.type())
    {
        case value_type::ARRAY:
            std::for_each(
                cast<dynamic_array>(v).begin(),
                cast<dynamic_array>(v).end(),
                recurse);
            break;
        case value_type::LIST:
            std::for_each(
                cast<dynamic_list>(v).begin(),
                cast<dynamic_list>(v).end(),
                recurse);
            break;
        case value_type::SET:
            std::for_each(
                cast<dynamic_set>(v).begin(),
                cast<dynamic_set>(v).end(),
                recurse);
            break;
        case value_type::MAP:
            for (auto const& item : cast<dynamic_map>(v))
            {
                recurse(item.first);
                recurse(item.second);
            }
            break;
        default:
            break;
    }
}

void
check_nesting_depth(dynamic const& v, size_t limit)
{
    check_nesting_depth(v, limit, 0);
}

} // namespace treediff
