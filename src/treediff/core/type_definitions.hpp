#ifndef TREEDIFF_CORE_TYPE_DEFINITIONS_HPP
#define TREEDIFF_CORE_TYPE_DEFINITIONS_HPP

#include <any>
#include <cassert>
#include <cstdint>
#include <list>
#include <map>
#include <set>
#include <string>
#include <vector>

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <boost/optional.hpp>

namespace treediff {

using std::string;

using boost::none;
using boost::optional;

// some(x) creates a boost::optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_cv_t<std::remove_reference_t<T>>>(
        std::forward<T>(x));
}

typedef int64_t integer;

using boost::posix_time::ptime;

// nil_t is a unit type. It has only one possible value, :nil.
struct nil_t
{
};
static nil_t nil;

struct dynamic;

enum class value_type
{
    NIL, // nil_t - no value
    BOOLEAN, // bool
    INTEGER, // integer
    FLOAT, // double
    STRING, // string
    DATETIME, // boost::posix_time::ptime
    ARRAY, // dynamic_array - indexed sequence of dynamic values
    LIST, // dynamic_list - sequence of dynamic values without random access
    SET, // dynamic_set - unordered collection of distinct dynamic values
    MAP, // dynamic_map - collection of keyed dynamic values
};

// Arrays are represented as std::vectors and can be manipulated as such.
typedef std::vector<dynamic> dynamic_array;

// Lists are represented as std::lists. They are compared and diffed like
// arrays but keep their own identity as a type.
typedef std::list<dynamic> dynamic_list;

// Sets are represented as std::sets. Their iteration order is the ordering of
// dynamic values, but that order carries no meaning.
typedef std::set<dynamic> dynamic_set;

// Maps are represented as std::maps and can be manipulated as such.
typedef std::map<dynamic, dynamic> dynamic_map;

struct dynamic
{
    // CONSTRUCTORS

    // Default construction creates a nil value.
    dynamic()
    {
        set(nil);
    }

    // Construct a dynamic from one of the base types.
    dynamic(nil_t v)
    {
        set(v);
    }
    dynamic(bool v)
    {
        set(v);
    }
    dynamic(integer v)
    {
        set(v);
    }
    dynamic(int v)
    {
        set(integer(v));
    }
    dynamic(double v)
    {
        set(v);
    }
    dynamic(string const& v)
    {
        set(v);
    }
    dynamic(string&& v)
    {
        set(std::move(v));
    }
    dynamic(char const* v)
    {
        set(string(v));
    }
    dynamic(ptime const& v)
    {
        set(v);
    }
    dynamic(dynamic_array const& v)
    {
        set(v);
    }
    dynamic(dynamic_array&& v)
    {
        set(std::move(v));
    }
    dynamic(dynamic_list const& v)
    {
        set(v);
    }
    dynamic(dynamic_list&& v)
    {
        set(std::move(v));
    }
    dynamic(dynamic_set const& v)
    {
        set(v);
    }
    dynamic(dynamic_set&& v)
    {
        set(std::move(v));
    }
    dynamic(dynamic_map const& v)
    {
        set(v);
    }
    dynamic(dynamic_map&& v)
    {
        set(std::move(v));
    }

    // Construct from an initializer list.
    dynamic(std::initializer_list<dynamic> list);

    // GETTERS

    // Get the type of value stored here.
    value_type
    type() const
    {
        return type_;
    }

    // Get the contents.
    // This should be used with caution.
    // cast<T>(dynamic) provides a safer interface to this.
    std::any const&
    contents() const&
    {
        return value_;
    }

    // Get a non-const reference to the contents.
    // This should be used with caution.
    // cast<T>(dynamic) provides a safer interface to this.
    std::any&
    contents() &
    {
        return value_;
    }

    // Get an r-value reference to the contents.
    // This should be used with caution.
    // cast<T>(dynamic) provides a safer interface to this.
    std::any&&
    contents() &&
    {
        return std::move(value_);
    }

 private:
    void
    set(nil_t _);
    void
    set(bool v);
    void
    set(integer v);
    void
    set(double v);
    void
    set(string const& v);
    void
    set(string&& v);
    void
    set(ptime const& v);
    void
    set(dynamic_array const& v);
    void
    set(dynamic_array&& v);
    void
    set(dynamic_list const& v);
    void
    set(dynamic_list&& v);
    void
    set(dynamic_set const& v);
    void
    set(dynamic_set&& v);
    void
    set(dynamic_map const& v);
    void
    set(dynamic_map&& v);

    friend void
    swap(dynamic& a, dynamic& b);

    value_type type_;
    std::any value_;
};

// omissible<T> is the same as optional<T>, but it's meant specifically for
// fields of configuration structures that may be left out entirely.
template<class T>
struct omissible
{
    typedef T value_type;
    omissible() : valid_(false)
    {
    }
    omissible(T const& value) : value_(value), valid_(true)
    {
    }
    omissible(boost::none_t) : valid_(false)
    {
    }
    omissible&
    operator=(T const& value)
    {
        value_ = value;
        valid_ = true;
        return *this;
    }
    omissible& operator=(boost::none_t)
    {
        valid_ = false;
        return *this;
    }
    explicit operator bool() const
    {
        return valid_;
    }
    operator optional<T>() const
    {
        return valid_ ? optional<T>(value_) : optional<T>();
    }
    T const&
    operator*() const
    {
        assert(valid_);
        return value_;
    }
    T&
    operator*()
    {
        assert(valid_);
        return value_;
    }
    T const*
    operator->() const
    {
        assert(valid_);
        return &value_;
    }

 private:
    T value_;
    bool valid_;
};

// Get the value of an omissible, or :fallback if it's not set.
template<class T>
T
value_or(omissible<T> const& x, T const& fallback)
{
    return x ? *x : fallback;
}

} // namespace treediff

#endif
