#ifndef TREEDIFF_CORE_TESTING_HPP
#define TREEDIFF_CORE_TESTING_HPP

#include <catch.hpp>

#include <treediff/core/dynamic.hpp>

namespace treediff {

// Test that a type behaves as a regular value type for the given value:
// copies and assignments compare equal, swap exchanges values, and
// conversion to dynamic and back is lossless.
template<class T>
void
test_regular_value(T const& x)
{
    {
        INFO("Copy construction should produce an equal value.")
        T y = x;
        REQUIRE(y == x);
    }

    {
        INFO("Assignment should produce an equal value.")
        T y;
        y = x;
        REQUIRE(y == x);
    }

    {
        INFO("std::swap should swap values.")

        T default_initialized = T();

        T y = x;
        T z = default_initialized;

        using std::swap;
        swap(y, z);
        REQUIRE(z == x);
        REQUIRE(y == default_initialized);
    }

    {
        INFO(
            "Conversion to treediff::dynamic and then back should produce an "
            "equal value.")
        treediff::dynamic v;
        to_dynamic(&v, x);
        T y;
        from_dynamic(&y, v);
        REQUIRE(y == x);
    }
}

} // namespace treediff

#endif
