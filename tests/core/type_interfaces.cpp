#include <treediff/core/type_interfaces.hpp>

#include <treediff/core/testing.hpp>
#include <treediff/core/utilities.hpp>

using namespace treediff;

TEST_CASE("bool type interface", "[core][types]")
{
    test_regular_value(true);
    REQUIRE_THROWS_AS(from_dynamic<bool>(dynamic(integer(1))), type_mismatch);
}

TEST_CASE("integer type interfaces", "[core][types]")
{
    test_regular_value(integer(-12));
    test_regular_value(size_t(12));

    // Floats are accepted when they hold integral values.
    REQUIRE(from_dynamic<integer>(dynamic(4.)) == 4);
    REQUIRE_THROWS_AS(from_dynamic<integer>(dynamic(4.5)), type_mismatch);

    // Negative values don't fit in a size_t.
    REQUIRE_THROWS(from_dynamic<size_t>(dynamic(integer(-1))));
}

TEST_CASE("floating point type interface", "[core][types]")
{
    test_regular_value(1.5);
    REQUIRE(from_dynamic<double>(dynamic(integer(2))) == 2.);
    REQUIRE_THROWS_AS(from_dynamic<double>(dynamic("2")), type_mismatch);
}

TEST_CASE("string type interface", "[core][types]")
{
    test_regular_value(string("hello"));
}

TEST_CASE("ptime type interface", "[core][types]")
{
    auto t = ptime(
        boost::gregorian::date(2017, boost::gregorian::Apr, 26),
        boost::posix_time::time_duration(1, 2, 3)
            + boost::posix_time::milliseconds(4));
    test_regular_value(t);

    REQUIRE(to_value_string(t) == "2017-04-26T01:02:03.004Z");
    REQUIRE(parse_ptime("2017-04-26T01:02:03.004Z") == t);

    // Try parsing a malformed time.
    try
    {
        parse_ptime("2017-04-26 01:02");
        FAIL("no exception thrown");
    }
    catch (parsing_error& e)
    {
        REQUIRE(get_required_error_info<expected_format_info>(e) == "datetime");
        REQUIRE(
            get_required_error_info<parsed_text_info>(e) == "2017-04-26 01:02");
    }
}

TEST_CASE("vector type interface", "[core][types]")
{
    test_regular_value(std::vector<integer>({1, 2, 3}));

    try
    {
        from_dynamic<std::vector<double>>(
            dynamic_array({dynamic(1.), dynamic(nil)}));
        FAIL("no exception thrown");
    }
    catch (type_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<dynamic_value_path_info>(e)
            == std::list<dynamic>({dynamic(integer(1))}));
    }
}
