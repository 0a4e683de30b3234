#ifndef TREEDIFF_CORE_TYPE_INTERFACES_HPP
#define TREEDIFF_CORE_TYPE_INTERFACES_HPP

#include <vector>

#include <treediff/core/dynamic.hpp>

// This file provides the to_dynamic/from_dynamic interface for the basic
// C++ types that get converted to and from dynamic values.

namespace treediff {

// NIL

// Note that we don't have to do anything here because callers of to_dynamic
// are required to provide a default-constructed dynamic, which is already nil.
static inline void
to_dynamic(dynamic* v, nil_t n)
{
}

static inline void
from_dynamic(nil_t* n, dynamic const& v)
{
    check_type(value_type::NIL, v.type());
}

// BOOL

void
to_dynamic(dynamic* v, bool x);

void
from_dynamic(bool* x, dynamic const& v);

// INTEGERS AND FLOATS

void
to_dynamic(dynamic* v, integer x);

// Floats are also accepted here if they convert without loss.
void
from_dynamic(integer* x, dynamic const& v);

void
to_dynamic(dynamic* v, size_t x);

void
from_dynamic(size_t* x, dynamic const& v);

void
to_dynamic(dynamic* v, double x);

// Integers are also accepted here.
void
from_dynamic(double* x, dynamic const& v);

// STRING

void
to_dynamic(dynamic* v, string const& x);

void
from_dynamic(string* x, dynamic const& v);

// PTIME

// Get the preferred representation for encoding a ptime as a string.
// (This preserves milliseconds.)
string
to_value_string(ptime const& t);

// Parse a string in the format produced by to_value_string.
ptime
parse_ptime(string const& s);

void
to_dynamic(dynamic* v, ptime const& x);

void
from_dynamic(ptime* x, dynamic const& v);

// STD::VECTOR

template<class T>
void
to_dynamic(dynamic* v, std::vector<T> const& x)
{
    dynamic_array array;
    size_t n_elements = x.size();
    array.resize(n_elements);
    for (size_t i = 0; i != n_elements; ++i)
    {
        to_dynamic(&array[i], x[i]);
    }
    *v = std::move(array);
}

template<class T>
void
from_dynamic(std::vector<T>* x, dynamic const& v)
{
    dynamic_array const& array = cast<dynamic_array>(v);
    size_t n_elements = array.size();
    x->resize(n_elements);
    for (size_t i = 0; i != n_elements; ++i)
    {
        try
        {
            from_dynamic(&(*x)[i], array[i]);
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, integer(i));
            throw;
        }
    }
}

} // namespace treediff

#endif
