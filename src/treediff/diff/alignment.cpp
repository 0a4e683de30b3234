#include <treediff/diff/alignment.hpp>

#include <algorithm>
#include <cstddef>

#include <treediff/core/utilities.hpp>

namespace treediff {

std::ostream&
operator<<(std::ostream& s, alignment_op_type t)
{
    switch (t)
    {
        case alignment_op_type::MATCH:
            s << "match";
            break;
        case alignment_op_type::DELETE:
            s << "delete";
            break;
        case alignment_op_type::INSERT:
            s << "insert";
            break;
        case alignment_op_type::REPLACE:
            s << "replace";
            break;
        default:
            TREEDIFF_THROW(
                invalid_enum_value() << enum_id_info("alignment_op_type")
                                     << enum_value_info(int(t)));
    }
    return s;
}

bool
operator==(alignment_op const& a, alignment_op const& b)
{
    return a.type == b.type && a.length == b.length;
}
bool
operator!=(alignment_op const& a, alignment_op const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, alignment_op const& op)
{
    s << op.type;
    if (op.type == alignment_op_type::MATCH)
        s << "(" << op.length << ")";
    return s;
}

namespace {

typedef std::ptrdiff_t offset;

// The path leading to each furthest point is recorded as a chain of nodes,
// each referring back to its predecessor. Diagonals that branch off from one
// another share the nodes for their common prefix.
struct trace_node
{
    // the DELETE or INSERT step onto the diagonal
    alignment_op_type step;
    // the number of matching items that follow the step
    size_t match_length;
    // index of the previous node in the chain, or -1
    offset parent;
};

struct furthest_point
{
    // the furthest position reached in a along this diagonal, or -1 if the
    // diagonal hasn't been visited
    offset x;
    // the last node in the chain of operations that reaches x, or -1
    offset trace;
};

// Internally, the algorithm needs its first sequence to be the longer one, so
// the roles of the two are swapped (along with those of deletions and
// insertions) when b is longer.
class sequence_aligner
{
 public:
    sequence_aligner(dynamic_array const& a, dynamic_array const& b)
        : swapped_(a.size() < b.size()),
          a_(swapped_ ? b : a),
          b_(swapped_ ? a : b),
          n_(offset(a_.size())),
          m_(offset(b_.size())),
          // Diagonals range from -(m + 1) to n + 1 (including the unvisited
          // neighbors of the outermost ones).
          points_(size_t(n_ + m_ + 3), furthest_point{-1, -1})
    {
    }

    alignment
    run()
    {
        offset delta = n_ - m_;
        for (offset p = 0;; ++p)
        {
            for (offset k = -p; k < delta; ++k)
                advance(k);
            for (offset k = delta + p; k > delta; --k)
                advance(k);
            advance(delta);
            if (point(delta).x == n_)
                break;
            if (trace_.size() > 2 * compacted_size_)
                compact();
        }

        alignment ops;
        for (offset i = point(delta).trace; i != -1;
             i = trace_[size_t(i)].parent)
        {
            auto const& node = trace_[size_t(i)];
            if (node.match_length != 0)
                ops.push_back(make_match(node.match_length));
            // The first step along any path is the step onto the starting
            // diagonal from nowhere, so it doesn't consume anything.
            if (node.parent != -1)
                ops.push_back(make_step(node.step));
        }
        std::reverse(ops.begin(), ops.end());
        return ops;
    }

 private:
    furthest_point&
    point(offset k)
    {
        return points_[size_t(k + m_ + 1)];
    }

    alignment_op
    make_step(alignment_op_type step) const
    {
        if (swapped_)
        {
            return step == alignment_op_type::DELETE ? make_insert()
                                                     : make_delete();
        }
        return step == alignment_op_type::DELETE ? make_delete()
                                                 : make_insert();
    }

    // Follow diagonal k from x for as long as the items match.
    offset
    snake(offset k, offset x) const
    {
        offset y = x - k;
        while (x < n_ && y < m_ && a_[size_t(x)] == b_[size_t(y)])
        {
            ++x;
            ++y;
        }
        return x;
    }

    // Compute the furthest point on diagonal k, stepping from whichever of
    // its neighbors gets further.
    void
    advance(offset k)
    {
        furthest_point const below = point(k - 1);
        furthest_point const above = point(k + 1);
        offset x;
        trace_node node;
        if (below.x + 1 > above.x)
        {
            x = below.x + 1;
            node = trace_node{alignment_op_type::DELETE, 0, below.trace};
        }
        else
        {
            x = above.x;
            node = trace_node{alignment_op_type::INSERT, 0, above.trace};
        }
        offset end = snake(k, x);
        node.match_length = size_t(end - x);
        trace_.push_back(node);
        point(k) = furthest_point{end, offset(trace_.size()) - 1};
    }

    // Drop the nodes that are no longer reachable from any furthest point.
    // Parents always precede their children, so a single forward pass can
    // renumber the survivors.
    void
    compact()
    {
        std::vector<bool> live(trace_.size(), false);
        for (auto const& fp : points_)
        {
            for (offset i = fp.trace; i != -1 && !live[size_t(i)];
                 i = trace_[size_t(i)].parent)
            {
                live[size_t(i)] = true;
            }
        }

        std::vector<offset> new_index(trace_.size(), -1);
        size_t kept = 0;
        for (size_t i = 0; i != trace_.size(); ++i)
        {
            if (!live[i])
                continue;
            trace_node node = trace_[i];
            if (node.parent != -1)
                node.parent = new_index[size_t(node.parent)];
            new_index[i] = offset(kept);
            trace_[kept++] = node;
        }
        trace_.resize(kept);
        trace_.shrink_to_fit();

        for (auto& fp : points_)
        {
            if (fp.trace != -1)
                fp.trace = new_index[size_t(fp.trace)];
        }
        compacted_size_ = std::max(kept, points_.size());
    }

    bool swapped_;
    dynamic_array const& a_;
    dynamic_array const& b_;
    offset n_, m_;
    std::vector<furthest_point> points_;
    std::vector<trace_node> trace_;
    size_t compacted_size_ = 0;
};

} // namespace

alignment
align_sequences(dynamic_array const& a, dynamic_array const& b)
{
    return sequence_aligner(a, b).run();
}

alignment
merge_replacements(alignment const& ops)
{
    alignment merged;
    merged.reserve(ops.size());
    size_t n = ops.size();
    size_t i = 0;
    while (i != n)
    {
        bool follows_delete
            = i != 0 && ops[i - 1].type == alignment_op_type::DELETE;
        if (ops[i].type == alignment_op_type::DELETE && i + 1 != n
            && ops[i + 1].type == alignment_op_type::INSERT && !follows_delete)
        {
            merged.push_back(make_replace());
            i += 2;
        }
        else
        {
            merged.push_back(ops[i]);
            ++i;
        }
    }
    return merged;
}

alignment
compute_alignment(dynamic_array const& a, dynamic_array const& b)
{
    return merge_replacements(align_sequences(a, b));
}

} // namespace treediff
