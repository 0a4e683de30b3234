#ifndef TREEDIFF_DIFF_QUICK_HPP
#define TREEDIFF_DIFF_QUICK_HPP

#include <treediff/diff/edit_script.hpp>

namespace treediff {

// Compute an edit script that transforms :a into :b.
//
// Maps are compared key by key and sets element by element. Arrays and lists
// are aligned (see alignment.hpp), so items that are only shifted around by
// insertions and deletions don't produce edits. Values of different types are
// replaced wholesale.
//
// Applying the result to :a with patch_value yields :b. If a and b are equal,
// the result is empty.
//
// This recurses once per level of nesting in the inputs, so callers that
// accept arbitrary input should impose a limit first (see
// check_nesting_depth).
//
edit_script
compute_edit_script(dynamic const& a, dynamic const& b);

// Append the edits that transform :a into :b to :script, with :path as the
// location of a (and b) within the values being compared.
//
// Either value may be absent (a null pointer). An absent :a results in an ADD
// of b. An absent :b results in a DELETE.
//
void
diff_values(
    edit_script& script,
    edit_path const& path,
    dynamic const* a,
    dynamic const* b);

} // namespace treediff

#endif
