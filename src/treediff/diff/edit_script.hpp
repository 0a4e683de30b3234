#ifndef TREEDIFF_DIFF_EDIT_SCRIPT_HPP
#define TREEDIFF_DIFF_EDIT_SCRIPT_HPP

#include <ostream>
#include <vector>

#include <treediff/core/dynamic.hpp>

namespace treediff {

enum class edit_op
{
    // add a map entry, array/list item or set element
    ADD,
    // delete a map entry, array/list item or set element
    DELETE,
    // replace whatever is at the path with a new value
    REPLACE
};

std::ostream&
operator<<(std::ostream& s, edit_op op);

// edit_path represents the path from the root of a value to the point where
// an edit should be applied.
// Map entries are addressed by their keys, array and list items by their
// (integer) indices, and set elements by the elements themselves.
typedef std::vector<dynamic> edit_path;

std::ostream&
operator<<(std::ostream& s, edit_path const& path);

// Extend a path with one more element, leaving the original untouched.
edit_path
extend_path(edit_path const& path, dynamic const& addition);

struct edit
{
    edit_path path;

    edit_op op;

    // the new value - This is present for ADD and REPLACE edits.
    optional<dynamic> value;
};

bool
operator==(edit const& a, edit const& b);
bool
operator!=(edit const& a, edit const& b);

std::ostream&
operator<<(std::ostream& s, edit const& e);

edit
make_edit(edit_path path, edit_op op, optional<dynamic> value = none);

// An edit_script is an ordered log of edits. Applying the edits in order
// transforms one value into another.
class edit_script
{
 public:
    // value now exists at :path where it did not before
    void
    add_data(edit_path path, dynamic value);

    // the value at :path no longer exists
    void
    delete_data(edit_path path);

    // the value at :path is superseded by :value
    void
    replace_data(edit_path path, dynamic value);

    // Append an already constructed edit.
    void
    append(edit e);

    std::vector<edit> const&
    edits() const
    {
        return edits_;
    }

    bool
    empty() const
    {
        return edits_.empty();
    }

    size_t
    edit_count() const
    {
        return edits_.size();
    }

    size_t
    add_count() const
    {
        return add_count_;
    }

    size_t
    delete_count() const
    {
        return delete_count_;
    }

    size_t
    replace_count() const
    {
        return replace_count_;
    }

 private:
    std::vector<edit> edits_;
    size_t add_count_ = 0;
    size_t delete_count_ = 0;
    size_t replace_count_ = 0;
};

bool
operator==(edit_script const& a, edit_script const& b);
bool
operator!=(edit_script const& a, edit_script const& b);

std::ostream&
operator<<(std::ostream& s, edit_script const& script);

// Concatenate two scripts. Applying the result is equivalent to applying :a
// and then :b.
edit_script
combine(edit_script const& a, edit_script const& b);

// ENCODING

// Scripts are encoded as arrays of [path, op, value] triples, where op is
// "+", "-" or "r". Deletions are encoded as [path, "-"].
void
to_dynamic(dynamic* v, edit_script const& script);

void
from_dynamic(edit_script* script, dynamic const& v);

TREEDIFF_DEFINE_EXCEPTION(invalid_edit)
TREEDIFF_DEFINE_ERROR_INFO(size_t, edit_index)

// PATCHING

// Apply a script to a value.
dynamic
patch_value(dynamic const& v, edit_script const& script);

// If an edit's path doesn't lead anywhere in the value being patched,
// patch_value throws this.
TREEDIFF_DEFINE_EXCEPTION(invalid_edit_path)
TREEDIFF_DEFINE_ERROR_INFO(edit_path, edit_path)

} // namespace treediff

#endif
