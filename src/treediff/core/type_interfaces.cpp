#include <treediff/core/type_interfaces.hpp>

#include <iostream>
#include <sstream>

#include <fmt/format.h>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/numeric/conversion/cast.hpp>

#include <treediff/core/utilities.hpp>

namespace treediff {

// BOOL

void
to_dynamic(dynamic* v, bool x)
{
    *v = x;
}

void
from_dynamic(bool* x, dynamic const& v)
{
    *x = cast<bool>(v);
}

// INTEGERS

void
to_dynamic(dynamic* v, integer x)
{
    *v = x;
}

void
from_dynamic(integer* x, dynamic const& v)
{
    if (v.type() == value_type::FLOAT)
    {
        double d = cast<double>(v);
        integer i = boost::numeric_cast<integer>(d);
        // Check that the conversion doesn't change the value.
        if (boost::numeric_cast<double>(i) == d)
        {
            *x = i;
            return;
        }
    }
    *x = cast<integer>(v);
}

void
to_dynamic(dynamic* v, size_t x)
{
    *v = boost::numeric_cast<integer>(x);
}

void
from_dynamic(size_t* x, dynamic const& v)
{
    integer i;
    from_dynamic(&i, v);
    *x = boost::numeric_cast<size_t>(i);
}

// FLOATS

void
to_dynamic(dynamic* v, double x)
{
    *v = x;
}

void
from_dynamic(double* x, dynamic const& v)
{
    if (v.type() == value_type::INTEGER)
        *x = boost::numeric_cast<double>(cast<integer>(v));
    else
        *x = cast<double>(v);
}

// STRING

void
to_dynamic(dynamic* v, string const& x)
{
    *v = x;
}

void
from_dynamic(string* x, dynamic const& v)
{
    // Datetimes are encoded as strings in text formats, so it's possible
    // that a string was misinterpreted as a datetime.
    if (v.type() == value_type::DATETIME)
        *x = to_value_string(cast<ptime>(v));
    else
        *x = cast<string>(v);
}

// PTIME

string
to_value_string(ptime const& t)
{
    namespace bt = boost::posix_time;
    std::ostringstream os;
    os.imbue(
        std::locale(std::cout.getloc(), new bt::time_facet("%Y-%m-%dT%H:%M")));
    os << t;
    // The seconds are added manually so that milliseconds always appear.
    os << fmt::format(
        ":{:02d}.{:03d}Z",
        t.time_of_day().seconds(),
        t.time_of_day().total_milliseconds() % 1000);
    return os.str();
}

ptime
parse_ptime(string const& s)
{
    namespace bt = boost::posix_time;
    std::istringstream is(s);
    is.imbue(std::locale(
        std::cout.getloc(), new bt::time_input_facet("%Y-%m-%dT%H:%M:%s")));
    ptime t;
    is >> t;
    char z = '\0';
    is.get(z);
    if (t != ptime() && z == 'Z'
        && is.peek() == std::istringstream::traits_type::eof())
    {
        return t;
    }
    TREEDIFF_THROW(
        parsing_error() << expected_format_info("datetime")
                        << parsed_text_info(s));
}

void
to_dynamic(dynamic* v, ptime const& x)
{
    *v = x;
}

void
from_dynamic(ptime* x, dynamic const& v)
{
    *x = cast<ptime>(v);
}

} // namespace treediff
