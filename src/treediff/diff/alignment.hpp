#ifndef TREEDIFF_DIFF_ALIGNMENT_HPP
#define TREEDIFF_DIFF_ALIGNMENT_HPP

#include <ostream>
#include <vector>

#include <treediff/core/dynamic.hpp>

namespace treediff {

// SEQUENCE ALIGNMENT - An alignment describes how to turn one sequence (a)
// into another (b) as a series of operations that consume items from the two
// sequences.

enum class alignment_op_type
{
    // a run of items that are the same in both sequences
    MATCH,
    // an item of a that doesn't appear in b
    DELETE,
    // an item of b that doesn't appear in a
    INSERT,
    // an item of a that's replaced by an item of b
    REPLACE
};

std::ostream&
operator<<(std::ostream& s, alignment_op_type t);

struct alignment_op
{
    alignment_op_type type;

    // the number of items covered - This is only ever more than 1 for MATCH.
    size_t length;
};

bool
operator==(alignment_op const& a, alignment_op const& b);
bool
operator!=(alignment_op const& a, alignment_op const& b);

std::ostream&
operator<<(std::ostream& s, alignment_op const& op);

inline alignment_op
make_match(size_t length)
{
    return alignment_op{alignment_op_type::MATCH, length};
}
inline alignment_op
make_delete()
{
    return alignment_op{alignment_op_type::DELETE, 1};
}
inline alignment_op
make_insert()
{
    return alignment_op{alignment_op_type::INSERT, 1};
}
inline alignment_op
make_replace()
{
    return alignment_op{alignment_op_type::REPLACE, 1};
}

typedef std::vector<alignment_op> alignment;

// Align two sequences using only MATCH, DELETE and INSERT operations.
//
// This is the O(NP) algorithm from Wu, Manber, Myers and Miller, "An O(NP)
// Sequence Comparison Algorithm" (Information Processing Letters, 1990).
// The result has the minimum possible number of insertions and deletions.
// Its running time is proportional to (n + m) * p, where p is the number of
// deletions, so it's near linear for similar sequences.
//
// Items are compared with dynamic's operator==, which is type-sensitive.
//
alignment
align_sequences(dynamic_array const& a, dynamic_array const& b);

// Turn isolated DELETE-INSERT pairs into REPLACE operations.
//
// A DELETE that immediately follows another DELETE is left alone, since it's
// ambiguous which of the deleted items the insertion should replace.
//
alignment
merge_replacements(alignment const& ops);

// Align two sequences and then merge replacements.
alignment
compute_alignment(dynamic_array const& a, dynamic_array const& b);

} // namespace treediff

#endif
