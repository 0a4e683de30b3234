#include <treediff/core/dynamic.hpp>

#include <treediff/core/testing.hpp>
#include <treediff/core/type_interfaces.hpp>
#include <treediff/core/utilities.hpp>

using namespace treediff;

TEST_CASE("value_type streaming", "[core][dynamic]")
{
    REQUIRE(lexical_cast<string>(value_type::NIL) == "nil");
    REQUIRE(lexical_cast<string>(value_type::BOOLEAN) == "boolean");
    REQUIRE(lexical_cast<string>(value_type::INTEGER) == "integer");
    REQUIRE(lexical_cast<string>(value_type::FLOAT) == "float");
    REQUIRE(lexical_cast<string>(value_type::STRING) == "string");
    REQUIRE(lexical_cast<string>(value_type::DATETIME) == "datetime");
    REQUIRE(lexical_cast<string>(value_type::ARRAY) == "array");
    REQUIRE(lexical_cast<string>(value_type::LIST) == "list");
    REQUIRE(lexical_cast<string>(value_type::SET) == "set");
    REQUIRE(lexical_cast<string>(value_type::MAP) == "map");
    REQUIRE_THROWS_AS(
        lexical_cast<string>(value_type(-1)), invalid_enum_value);
}

TEST_CASE("dynamic type checking", "[core][dynamic]")
{
    try
    {
        check_type(value_type::NIL, value_type::BOOLEAN);
        FAIL("no exception thrown");
    }
    catch (type_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<expected_value_type_info>(e)
            == value_type::NIL);
        REQUIRE(
            get_required_error_info<actual_value_type_info>(e)
            == value_type::BOOLEAN);
    }

    REQUIRE_NOTHROW(check_type(value_type::NIL, value_type::NIL));
}

TEST_CASE("dynamic initializer lists", "[core][dynamic]")
{
    // Test a simple initializer list.
    REQUIRE(
        (dynamic{0., 1., 2.})
        == dynamic(dynamic_array{dynamic(0.), dynamic(1.), dynamic(2.)}));

    // Test that lists that look like maps are interpretted as maps.
    REQUIRE(
        (dynamic{{"foo", 0.}, {"bar", 1.}})
        == dynamic(dynamic_map{
            {dynamic("foo"), dynamic(0.)}, {dynamic("bar"), dynamic(1.)}}));

    // Test that the conversion to map only happens with string keys.
    REQUIRE(
        (dynamic{{"foo", 0.}, {0., 1.}})
        == dynamic(dynamic_array{
            dynamic_array{dynamic("foo"), dynamic(0.)},
            dynamic_array{dynamic(0.), dynamic(1.)}}));
}

TEST_CASE("dynamic type interface", "[core][dynamic]")
{
    test_regular_value(dynamic(false));
    test_regular_value(dynamic(integer(1)));
    test_regular_value(dynamic(1.5));
    test_regular_value(dynamic(string("foo")));
    test_regular_value(dynamic(ptime(
        boost::gregorian::date(2017, boost::gregorian::Apr, 26),
        boost::posix_time::time_duration(1, 2, 3))));
    test_regular_value(dynamic(dynamic_array({dynamic(0.), dynamic(1.)})));
    test_regular_value(dynamic(dynamic_list({dynamic(0.), dynamic(1.)})));
    test_regular_value(dynamic(dynamic_set({dynamic(0.), dynamic(1.)})));
    test_regular_value(dynamic(dynamic_map({{dynamic(0.), dynamic(1.)}})));
}

TEST_CASE("dynamic value kinds", "[core][dynamic]")
{
    REQUIRE(classify(nullptr) == value_kind::ABSENT);

    dynamic nil_value;
    REQUIRE(classify(&nil_value) == value_kind::SCALAR);
    dynamic boolean_value(true);
    REQUIRE(classify(&boolean_value) == value_kind::SCALAR);
    dynamic string_value("abc");
    REQUIRE(classify(&string_value) == value_kind::SCALAR);
    dynamic float_value(0.5);
    REQUIRE(classify(&float_value) == value_kind::SCALAR);

    dynamic array_value = dynamic_array();
    REQUIRE(classify(&array_value) == value_kind::ARRAY);
    dynamic list_value = dynamic_list();
    REQUIRE(classify(&list_value) == value_kind::LIST);
    dynamic set_value = dynamic_set();
    REQUIRE(classify(&set_value) == value_kind::SET);
    dynamic map_value = dynamic_map();
    REQUIRE(classify(&map_value) == value_kind::MAP);

    REQUIRE(lexical_cast<string>(value_kind::ABSENT) == "absent");
    REQUIRE(lexical_cast<string>(value_kind::SET) == "set");

    REQUIRE(is_container(value_type::LIST));
    REQUIRE(!is_container(value_type::DATETIME));
}

TEST_CASE("type-sensitive equality", "[core][dynamic]")
{
    REQUIRE(dynamic(integer(1)) != dynamic(1.));
    REQUIRE(dynamic(integer(1)) == dynamic(integer(1)));
    REQUIRE(
        dynamic(dynamic_array({dynamic(integer(1))}))
        != dynamic(dynamic_list({dynamic(integer(1))})));

    // Ordering across types follows the order of value_type.
    REQUIRE(dynamic(true) < dynamic(integer(0)));
    REQUIRE(dynamic(integer(2)) < dynamic(1.));
    REQUIRE(dynamic(string("z")) < dynamic(dynamic_array()));
}

TEST_CASE("get_field", "[core][dynamic]")
{
    auto map = dynamic_map({{"a", 12.}, {"b", false}});

    // Try getting both fields.
    REQUIRE(get_field(map, "a") == 12.);
    REQUIRE(get_field(map, "b") == false);

    // Try a missing field.
    try
    {
        get_field(map, "c");
        FAIL("no exception thrown");
    }
    catch (missing_field& e)
    {
        REQUIRE(get_required_error_info<field_name_info>(e) == "c");
    }

    dynamic const* field;
    REQUIRE(get_field(&field, map, "a"));
    REQUIRE(*field == dynamic(12.));
    REQUIRE(!get_field(&field, map, "c"));
}

TEST_CASE("dynamic operators", "[core][dynamic]")
{
    dynamic a;
    dynamic b(integer(0));
    dynamic c(integer(1));

    REQUIRE(a == a);
    REQUIRE(b == b);
    REQUIRE(c == c);

    REQUIRE(a != b);
    REQUIRE(b != c);
    REQUIRE(a != c);

    REQUIRE(a < b);
    REQUIRE(b < c);
    REQUIRE(a < c);

    REQUIRE(b > a);
    REQUIRE(c > b);
    REQUIRE(c > a);

    REQUIRE(a <= a);
    REQUIRE(a <= b);
    REQUIRE(b <= c);

    REQUIRE(c >= c);
    REQUIRE(c >= b);
    REQUIRE(b >= a);
}

TEST_CASE("nesting depth", "[core][dynamic]")
{
    REQUIRE(nesting_depth(dynamic(integer(1))) == 0);
    REQUIRE(nesting_depth(dynamic(dynamic_array())) == 1);

    auto nested = dynamic(dynamic_map(
        {{dynamic("a"),
          dynamic(dynamic_array(
              {dynamic(integer(1)),
               dynamic(dynamic_set({dynamic(integer(2))}))}))},
         {dynamic("b"), dynamic(integer(3))}}));
    REQUIRE(nesting_depth(nested) == 3);

    REQUIRE_NOTHROW(check_nesting_depth(nested, 3));
    try
    {
        check_nesting_depth(nested, 2);
        FAIL("no exception thrown");
    }
    catch (nesting_too_deep& e)
    {
        REQUIRE(get_required_error_info<nesting_depth_limit_info>(e) == 2);
    }

    REQUIRE_NOTHROW(check_nesting_depth(dynamic("deep"), 0));
    REQUIRE_THROWS_AS(
        check_nesting_depth(dynamic(dynamic_list()), 0), nesting_too_deep);
}

TEST_CASE("dynamic field paths", "[core][dynamic]")
{
    try
    {
        from_dynamic<std::vector<integer>>(dynamic(
            dynamic_array({dynamic(integer(1)), dynamic(string("two"))})));
        FAIL("no exception thrown");
    }
    catch (type_mismatch& e)
    {
        auto const& path = get_required_error_info<dynamic_value_path_info>(e);
        REQUIRE(path == std::list<dynamic>({dynamic(integer(1))}));
    }
}
