#include <treediff/diff/quick.hpp>

#include <algorithm>
#include <iterator>

#include <treediff/core/logging.hpp>
#include <treediff/diff/alignment.hpp>

namespace treediff {

static void
diff_maps(
    edit_script& script,
    edit_path const& path,
    dynamic_map const& a,
    dynamic_map const& b)
{
    for (auto const& field : a)
    {
        auto match = b.find(field.first);
        diff_values(
            script,
            extend_path(path, field.first),
            &field.second,
            match != b.end() ? &match->second : nullptr);
    }
    for (auto const& field : b)
    {
        if (a.find(field.first) == a.end())
        {
            diff_values(
                script, extend_path(path, field.first), nullptr, &field.second);
        }
    }
}

// Sets have no positions, so elements are simply removed or added, and each
// element is its own path element.
static void
diff_sets(
    edit_script& script,
    edit_path const& path,
    dynamic_set const& a,
    dynamic_set const& b)
{
    std::vector<dynamic> removed;
    std::set_difference(
        a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(removed));
    for (auto const& element : removed)
        diff_values(script, extend_path(path, element), &element, nullptr);

    std::vector<dynamic> added;
    std::set_difference(
        b.begin(), b.end(), a.begin(), a.end(), std::back_inserter(added));
    for (auto const& element : added)
        diff_values(script, extend_path(path, element), nullptr, &element);
}

// Emit the edits for an alignment of a and b.
//
// Three positions are tracked: ia and ib are the next unconsumed items in a
// and b, while ia_out is where the next item sits in the partially patched
// value (i.e., after all edits emitted so far have been applied). Since a
// deleted item's slot is taken over by whatever follows it, deletions don't
// advance ia_out.
//
static void
diff_arrays(
    edit_script& script,
    edit_path const& path,
    dynamic_array const& a,
    dynamic_array const& b)
{
    size_t ia = 0, ia_out = 0, ib = 0;
    for (auto const& op : compute_alignment(a, b))
    {
        switch (op.type)
        {
            case alignment_op_type::MATCH:
                ia += op.length;
                ia_out += op.length;
                ib += op.length;
                break;
            case alignment_op_type::DELETE:
                diff_values(
                    script,
                    extend_path(path, integer(ia_out)),
                    &a[ia],
                    nullptr);
                ++ia;
                break;
            case alignment_op_type::INSERT:
                diff_values(
                    script,
                    extend_path(path, integer(ia_out)),
                    nullptr,
                    &b[ib]);
                ++ia_out;
                ++ib;
                break;
            case alignment_op_type::REPLACE:
                diff_values(
                    script, extend_path(path, integer(ia_out)), &a[ia], &b[ib]);
                ++ia;
                ++ia_out;
                ++ib;
                break;
        }
    }
}

static void
diff_lists(
    edit_script& script,
    edit_path const& path,
    dynamic_list const& a,
    dynamic_list const& b)
{
    diff_arrays(
        script,
        path,
        dynamic_array(a.begin(), a.end()),
        dynamic_array(b.begin(), b.end()));
}

void
diff_values(
    edit_script& script,
    edit_path const& path,
    dynamic const* a,
    dynamic const* b)
{
    // This also covers the case where both are absent.
    if (a == b)
        return;

    switch (classify(a))
    {
        case value_kind::ABSENT:
            script.add_data(path, *b);
            break;
        case value_kind::SCALAR:
            if (!b)
                script.delete_data(path);
            else if (*a != *b)
                script.replace_data(path, *b);
            break;
        default:
            if (!b)
            {
                script.delete_data(path);
            }
            else if (a->type() != b->type())
            {
                script.replace_data(path, *b);
            }
            else
            {
                switch (a->type())
                {
                    case value_type::MAP:
                        diff_maps(
                            script,
                            path,
                            cast<dynamic_map>(*a),
                            cast<dynamic_map>(*b));
                        break;
                    case value_type::SET:
                        diff_sets(
                            script,
                            path,
                            cast<dynamic_set>(*a),
                            cast<dynamic_set>(*b));
                        break;
                    case value_type::LIST:
                        diff_lists(
                            script,
                            path,
                            cast<dynamic_list>(*a),
                            cast<dynamic_list>(*b));
                        break;
                    case value_type::ARRAY:
                    default:
                        diff_arrays(
                            script,
                            path,
                            cast<dynamic_array>(*a),
                            cast<dynamic_array>(*b));
                        break;
                }
            }
            break;
    }
}

edit_script
compute_edit_script(dynamic const& a, dynamic const& b)
{
    edit_script script;
    diff_values(script, edit_path(), &a, &b);

    auto logger = get_logger();
    if (logger->should_log(spdlog::level::debug))
    {
        logger->debug(
            "computed edit script: {} edits ({} added, {} deleted, {} "
            "replaced)",
            script.edit_count(),
            script.add_count(),
            script.delete_count(),
            script.replace_count());
    }
    return script;
}

} // namespace treediff
