#include <treediff/diff/quick.hpp>

#include <random>

#include <treediff/core/testing.hpp>

using namespace treediff;

// Check that diffing :a and :b produces :expected and that the result
// actually transforms :a into :b.
static void
test_diff(dynamic const& a, dynamic const& b, edit_script const& expected)
{
    CAPTURE(a);
    CAPTURE(b);
    auto script = compute_edit_script(a, b);
    REQUIRE(script == expected);
    REQUIRE(patch_value(a, script) == b);
}

// Check only that the script produced by diffing :a and :b transforms :a
// into :b.
static void
test_round_trip(dynamic const& a, dynamic const& b)
{
    CAPTURE(a);
    CAPTURE(b);
    auto script = compute_edit_script(a, b);
    CAPTURE(script);
    REQUIRE(patch_value(a, script) == b);
}

static dynamic
make_array(std::vector<integer> const& items)
{
    return dynamic_array(items.begin(), items.end());
}

static dynamic
make_set(std::vector<integer> const& items)
{
    return dynamic_set(items.begin(), items.end());
}

static dynamic
make_list(std::vector<integer> const& items)
{
    return dynamic_list(items.begin(), items.end());
}

TEST_CASE("identical values", "[diff][quick]")
{
    test_diff(dynamic(integer(1)), dynamic(integer(1)), edit_script());
    test_diff(dynamic(nil), dynamic(nil), edit_script());

    std::vector<dynamic> values
        = {dynamic("abc"),
           make_array({1, 2, 3}),
           make_list({3, 2, 1}),
           make_set({4, 5}),
           dynamic({{"a", integer(1)}, {"b", make_array({2})}})};
    for (auto const& v : values)
    {
        // Compare against a copy so that the identity shortcut doesn't apply.
        dynamic copy = v;
        test_diff(v, copy, edit_script());
        REQUIRE(compute_edit_script(v, v).empty());
    }
}

TEST_CASE("scalar diffs", "[diff][quick]")
{
    edit_script expected;
    expected.replace_data(edit_path(), dynamic(integer(2)));
    test_diff(dynamic(integer(1)), dynamic(integer(2)), expected);

    // Values of different types are never equal, even when they're
    // numerically the same.
    edit_script float_expected;
    float_expected.replace_data(edit_path(), dynamic(1.));
    test_diff(dynamic(integer(1)), dynamic(1.), float_expected);
}

TEST_CASE("map diffs", "[diff][quick]")
{
    {
        edit_script expected;
        expected.replace_data({dynamic("x")}, dynamic(integer(2)));
        test_diff(
            dynamic({{"x", integer(1)}}),
            dynamic({{"x", integer(2)}}),
            expected);
    }
    {
        edit_script expected;
        expected.add_data({dynamic("b")}, dynamic(integer(5)));
        test_diff(
            dynamic({{"a", make_array({1, 2})}}),
            dynamic({{"a", make_array({1, 2})}, {"b", integer(5)}}),
            expected);
    }
    {
        edit_script expected;
        expected.delete_data({dynamic("x")});
        test_diff(dynamic({{"x", nil}}), dynamic(dynamic_map()), expected);
    }
    {
        edit_script expected;
        expected.replace_data(
            {dynamic("outer"), dynamic("inner")}, dynamic("new"));
        test_diff(
            dynamic({{"outer", dynamic({{"inner", "old"}})}}),
            dynamic({{"outer", dynamic({{"inner", "new"}})}}),
            expected);
    }
}

TEST_CASE("array diffs", "[diff][quick]")
{
    {
        edit_script expected;
        expected.add_data({dynamic(integer(1))}, dynamic(integer(3)));
        expected.add_data({dynamic(integer(3))}, dynamic(integer(4)));
        expected.delete_data({dynamic(integer(4))});
        test_diff(make_array({1, 2, 3}), make_array({1, 3, 2, 4}), expected);
    }
    {
        edit_script expected;
        expected.replace_data({dynamic(integer(1))}, dynamic(integer(5)));
        test_diff(make_array({1, 2, 3}), make_array({1, 5, 3}), expected);
    }
    {
        // Deletions don't shift the positions of later edits.
        edit_script expected;
        expected.delete_data({dynamic(integer(0))});
        expected.delete_data({dynamic(integer(0))});
        test_diff(make_array({1, 2, 3}), make_array({3}), expected);
    }
    {
        edit_script expected;
        expected.add_data({dynamic(integer(0))}, dynamic(integer(7)));
        expected.add_data({dynamic(integer(1))}, dynamic(integer(8)));
        test_diff(dynamic_array(), make_array({7, 8}), expected);
    }
}

TEST_CASE("nested array diffs", "[diff][quick]")
{
    // A replaced item of the same container type is diffed recursively.
    edit_script expected;
    expected.replace_data(
        {dynamic(integer(0)), dynamic("name")}, dynamic("bob"));
    test_diff(
        dynamic_array({dynamic({{"name", "alice"}})}),
        dynamic_array({dynamic({{"name", "bob"}})}),
        expected);
}

TEST_CASE("list diffs", "[diff][quick]")
{
    edit_script expected;
    expected.delete_data({dynamic(integer(0))});
    test_diff(make_list({1, 2}), make_list({2}), expected);
}

TEST_CASE("set diffs", "[diff][quick]")
{
    edit_script expected;
    expected.delete_data({dynamic(integer(1))});
    expected.add_data({dynamic(integer(4))}, dynamic(integer(4)));
    test_diff(make_set({1, 2, 3}), make_set({2, 3, 4}), expected);

    // Containers can be set elements too.
    test_round_trip(
        dynamic_set({make_array({1}), make_array({2})}),
        dynamic_set({make_array({2}), make_array({3})}));
}

TEST_CASE("container type mismatches", "[diff][quick]")
{
    {
        edit_script expected;
        expected.replace_data(edit_path(), dynamic("x"));
        test_diff(make_array({1, 2}), dynamic("x"), expected);
    }
    {
        edit_script expected;
        expected.replace_data(edit_path(), make_list({1, 2}));
        test_diff(make_array({1, 2}), make_list({1, 2}), expected);
    }
    {
        edit_script expected;
        expected.replace_data({dynamic("a")}, make_set({1}));
        test_diff(
            dynamic({{"a", make_array({1})}}),
            dynamic({{"a", make_set({1})}}),
            expected);
    }
}

TEST_CASE("absent values", "[diff][quick]")
{
    dynamic value = make_array({1});

    edit_script script;
    diff_values(script, {dynamic("k")}, nullptr, &value);
    diff_values(script, {dynamic("k")}, &value, nullptr);
    diff_values(script, {dynamic("k")}, nullptr, nullptr);

    edit_script expected;
    expected.add_data({dynamic("k")}, value);
    expected.delete_data({dynamic("k")});
    REQUIRE(script == expected);
}

TEST_CASE("diff round trips", "[diff][quick]")
{
    test_round_trip(
        make_array({1, 9, 2, 9, 3, 9}), make_array({9, 1, 9, 2, 4}));
    test_round_trip(make_array({5, 4, 3, 2, 1}), make_array({1, 2, 3, 4, 5}));
    test_round_trip(make_list({1, 2, 3}), make_list({4, 5, 6, 7}));
    test_round_trip(
        dynamic_array({make_array({1, 2}), make_array({3})}),
        dynamic_array({make_array({1, 3}), make_array({3}), make_array({4})}));
    test_round_trip(
        dynamic(
            {{"items", make_array({1, 2, 3})},
             {"tags", make_set({1, 2})},
             {"meta", dynamic({{"version", integer(1)}})}}),
        dynamic(
            {{"items", make_array({0, 1, 3})},
             {"tags", make_set({2, 5})},
             {"meta", dynamic({{"version", 2.}, {"draft", true}})}}));
    test_round_trip(dynamic(nil), make_array({1}));
    test_round_trip(make_array({1}), dynamic(nil));
}

// Generate a random value that's nested at most :depth levels deep. Values
// are drawn from small pools so that random pairs have plenty in common.
static dynamic
make_random_value(std::mt19937& generator, int depth)
{
    std::uniform_int_distribution<int> kind(0, depth > 0 ? 6 : 2);
    std::uniform_int_distribution<integer> item(0, 3);
    std::uniform_int_distribution<size_t> length(0, 5);
    switch (kind(generator))
    {
        case 0:
        case 1:
            return dynamic(item(generator));
        case 2:
            return dynamic(string(1, char('a' + item(generator))));
        case 3: {
            dynamic_array items;
            for (size_t i = length(generator); i != 0; --i)
                items.push_back(make_random_value(generator, depth - 1));
            return dynamic(items);
        }
        case 4: {
            dynamic_list items;
            for (size_t i = length(generator); i != 0; --i)
                items.push_back(make_random_value(generator, depth - 1));
            return dynamic(items);
        }
        case 5: {
            dynamic_set items;
            for (size_t i = length(generator); i != 0; --i)
                items.insert(dynamic(item(generator)));
            return dynamic(items);
        }
        default: {
            dynamic_map fields;
            for (size_t i = length(generator); i != 0; --i)
            {
                fields[dynamic(string(1, char('a' + item(generator))))]
                    = make_random_value(generator, depth - 1);
            }
            return dynamic(fields);
        }
    }
}

TEST_CASE("random diff round trips", "[diff][quick]")
{
    std::mt19937 generator(7);
    for (int i = 0; i != 1000; ++i)
    {
        auto a = make_random_value(generator, 3);
        auto b = make_random_value(generator, 3);
        test_round_trip(a, b);
        test_round_trip(b, a);

        // A copy is identical, so there's nothing to do.
        dynamic copy = a;
        REQUIRE(compute_edit_script(a, copy).edit_count() == 0);
    }
}
