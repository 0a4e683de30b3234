#include <treediff/diff/edit_script.hpp>

#include <iterator>

#include <treediff/core/type_interfaces.hpp>
#include <treediff/core/utilities.hpp>

namespace treediff {

std::ostream&
operator<<(std::ostream& s, edit_op op)
{
    switch (op)
    {
        case edit_op::ADD:
            s << "add";
            break;
        case edit_op::DELETE:
            s << "delete";
            break;
        case edit_op::REPLACE:
            s << "replace";
            break;
        default:
            TREEDIFF_THROW(
                invalid_enum_value()
                << enum_id_info("edit_op") << enum_value_info(int(op)));
    }
    return s;
}

std::ostream&
operator<<(std::ostream& s, edit_path const& path)
{
    s << dynamic(dynamic_array(path));
    return s;
}

edit_path
extend_path(edit_path const& path, dynamic const& addition)
{
    edit_path extended = path;
    extended.push_back(addition);
    return extended;
}

bool
operator==(edit const& a, edit const& b)
{
    return a.path == b.path && a.op == b.op && a.value == b.value;
}
bool
operator!=(edit const& a, edit const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, edit const& e)
{
    s << e.op << " at " << e.path;
    if (e.value)
        s << ": " << *e.value;
    return s;
}

edit
make_edit(edit_path path, edit_op op, optional<dynamic> value)
{
    edit e;
    e.path = std::move(path);
    e.op = op;
    e.value = std::move(value);
    return e;
}

void
edit_script::add_data(edit_path path, dynamic value)
{
    append(make_edit(std::move(path), edit_op::ADD, some(std::move(value))));
}

void
edit_script::delete_data(edit_path path)
{
    append(make_edit(std::move(path), edit_op::DELETE));
}

void
edit_script::replace_data(edit_path path, dynamic value)
{
    append(
        make_edit(std::move(path), edit_op::REPLACE, some(std::move(value))));
}

void
edit_script::append(edit e)
{
    switch (e.op)
    {
        case edit_op::ADD:
            ++add_count_;
            break;
        case edit_op::DELETE:
            ++delete_count_;
            break;
        case edit_op::REPLACE:
            ++replace_count_;
            break;
    }
    edits_.push_back(std::move(e));
}

bool
operator==(edit_script const& a, edit_script const& b)
{
    return a.edits() == b.edits();
}
bool
operator!=(edit_script const& a, edit_script const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, edit_script const& script)
{
    s << to_dynamic(script);
    return s;
}

edit_script
combine(edit_script const& a, edit_script const& b)
{
    edit_script combined = a;
    for (auto const& e : b.edits())
        combined.append(e);
    return combined;
}

// ENCODING

static char const*
encode_edit_op(edit_op op)
{
    switch (op)
    {
        case edit_op::ADD:
            return "+";
        case edit_op::DELETE:
            return "-";
        case edit_op::REPLACE:
        default:
            return "r";
    }
}

static edit_op
decode_edit_op(dynamic const& code)
{
    if (code == dynamic("+"))
        return edit_op::ADD;
    if (code == dynamic("-"))
        return edit_op::DELETE;
    if (code == dynamic("r"))
        return edit_op::REPLACE;
    TREEDIFF_THROW(invalid_edit());
}

void
to_dynamic(dynamic* v, edit_script const& script)
{
    dynamic_array encoded;
    encoded.reserve(script.edit_count());
    for (auto const& e : script.edits())
    {
        dynamic_array item;
        item.push_back(dynamic_array(e.path));
        item.push_back(encode_edit_op(e.op));
        if (e.value)
            item.push_back(*e.value);
        encoded.push_back(std::move(item));
    }
    *v = std::move(encoded);
}

static edit
decode_edit(dynamic const& v)
{
    if (v.type() != value_type::ARRAY)
        TREEDIFF_THROW(invalid_edit());
    auto const& item = cast<dynamic_array>(v);
    if (item.size() < 2 || item.size() > 3
        || item[0].type() != value_type::ARRAY)
    {
        TREEDIFF_THROW(invalid_edit());
    }
    auto const& path = cast<dynamic_array>(item[0]);
    auto op = decode_edit_op(item[1]);
    // Only deletions omit the value.
    bool has_value = item.size() == 3;
    if (has_value != (op != edit_op::DELETE))
        TREEDIFF_THROW(invalid_edit());
    return make_edit(
        edit_path(path.begin(), path.end()),
        op,
        has_value ? some(item[2]) : optional<dynamic>());
}

void
from_dynamic(edit_script* script, dynamic const& v)
{
    if (v.type() != value_type::ARRAY)
        TREEDIFF_THROW(invalid_edit());
    edit_script decoded;
    auto const& items = cast<dynamic_array>(v);
    for (size_t i = 0; i != items.size(); ++i)
    {
        try
        {
            decoded.append(decode_edit(items[i]));
        }
        catch (boost::exception& e)
        {
            e << edit_index_info(i);
            throw;
        }
    }
    *script = std::move(decoded);
}

// PATCHING

[[noreturn]] static void
throw_invalid_path(edit const& e)
{
    TREEDIFF_THROW(invalid_edit_path() << edit_path_info(e.path));
}

static dynamic const&
new_value(edit const& e)
{
    if (!e.value)
        TREEDIFF_THROW(invalid_edit() << edit_path_info(e.path));
    return *e.value;
}

// Interpret a path element as a position within a sequence of length :size.
// If :allow_end is set, the position just past the last item is accepted.
static size_t
sequence_index(
    edit const& e, dynamic const& path_element, size_t size, bool allow_end)
{
    if (path_element.type() != value_type::INTEGER)
        throw_invalid_path(e);
    integer index = cast<integer>(path_element);
    if (index < 0 || size_t(index) > size
        || (!allow_end && size_t(index) == size))
    {
        throw_invalid_path(e);
    }
    return size_t(index);
}

static void
apply_edit(dynamic& target, edit const& e, size_t path_index);

template<class Sequence>
static void
apply_sequence_edit(
    Sequence& sequence, edit const& e, size_t path_index, bool is_last)
{
    auto const& path_element = e.path[path_index];
    if (is_last)
    {
        switch (e.op)
        {
            case edit_op::ADD: {
                size_t index = sequence_index(
                    e, path_element, sequence.size(), true);
                sequence.insert(
                    std::next(sequence.begin(), index), new_value(e));
                break;
            }
            case edit_op::DELETE: {
                size_t index = sequence_index(
                    e, path_element, sequence.size(), false);
                sequence.erase(std::next(sequence.begin(), index));
                break;
            }
            case edit_op::REPLACE: {
                size_t index = sequence_index(
                    e, path_element, sequence.size(), false);
                *std::next(sequence.begin(), index) = new_value(e);
                break;
            }
        }
    }
    else
    {
        size_t index
            = sequence_index(e, path_element, sequence.size(), false);
        apply_edit(*std::next(sequence.begin(), index), e, path_index + 1);
    }
}

static void
apply_map_edit(
    dynamic_map& map, edit const& e, size_t path_index, bool is_last)
{
    auto const& path_element = e.path[path_index];
    if (is_last)
    {
        switch (e.op)
        {
            case edit_op::ADD:
            case edit_op::REPLACE:
                map[path_element] = new_value(e);
                break;
            case edit_op::DELETE:
                if (map.erase(path_element) == 0)
                    throw_invalid_path(e);
                break;
        }
    }
    else
    {
        auto field = map.find(path_element);
        if (field == map.end())
            throw_invalid_path(e);
        apply_edit(field->second, e, path_index + 1);
    }
}

static void
apply_set_edit(
    dynamic_set& set, edit const& e, size_t path_index, bool is_last)
{
    auto const& path_element = e.path[path_index];
    if (is_last)
    {
        switch (e.op)
        {
            case edit_op::ADD:
                set.insert(new_value(e));
                break;
            case edit_op::DELETE:
                if (set.erase(path_element) == 0)
                    throw_invalid_path(e);
                break;
            case edit_op::REPLACE: {
                auto const& replacement = new_value(e);
                if (set.erase(path_element) == 0)
                    throw_invalid_path(e);
                set.insert(replacement);
                break;
            }
        }
    }
    else
    {
        // Set elements can't be modified in place, so the element is taken
        // out, patched and put back.
        auto element = set.find(path_element);
        if (element == set.end())
            throw_invalid_path(e);
        dynamic patched = *element;
        set.erase(element);
        apply_edit(patched, e, path_index + 1);
        set.insert(std::move(patched));
    }
}

static void
apply_edit(dynamic& target, edit const& e, size_t path_index)
{
    size_t path_size = e.path.size();

    // If the path is exhausted, then we must be acting on the whole value.
    if (path_index == path_size)
    {
        if (e.op == edit_op::DELETE)
            target = nil;
        else
            target = new_value(e);
        return;
    }

    bool is_last = path_index + 1 == path_size;
    switch (target.type())
    {
        case value_type::ARRAY:
            apply_sequence_edit(
                cast<dynamic_array>(target), e, path_index, is_last);
            break;
        case value_type::LIST:
            apply_sequence_edit(
                cast<dynamic_list>(target), e, path_index, is_last);
            break;
        case value_type::MAP:
            apply_map_edit(cast<dynamic_map>(target), e, path_index, is_last);
            break;
        case value_type::SET:
            apply_set_edit(cast<dynamic_set>(target), e, path_index, is_last);
            break;
        default:
            throw_invalid_path(e);
    }
}

dynamic
patch_value(dynamic const& v, edit_script const& script)
{
    dynamic patched = v;
    for (auto const& e : script.edits())
    {
        apply_edit(patched, e, 0);
    }
    return patched;
}

} // namespace treediff
