#pragma once

#include "liftfix/core/MatchEnvironment.h"
#include "liftfix/core/Node.h"

#include <vector>

namespace liftfix {

// Structural matcher over the generic node envelope.
//
//   $X     matches any single node outside a list or any list element;
//          later occurrences must be structurally equal to the first
//   $...X  matches a contiguous, possibly empty, run of list elements
//
// A pattern whose root is a Statements list matches a contiguous window of
// any statement list in the target.
class Matcher {
public:
    explicit Matcher(NodePtr pattern);

    // Every match, in pre-order of the target tree. Nested matches are
    // reported too; overlapping fixes are resolved when they are applied.
    std::vector<Match> findAll(const NodePtr &target) const;

    // Matches the pattern against exactly this node.
    bool matchAt(const NodePtr &target, MatchEnvironment &env) const;

private:
    bool matchNode(const Node &pattern, const NodePtr &target,
                   MatchEnvironment &env) const;

    // Matches pattern items [pi, end) against target items starting at ti.
    // With `anchored`, the target run must be consumed entirely; otherwise
    // *consumedEnd receives the index one past the last matched item.
    bool matchSequence(const std::vector<NodePtr> &pattern, size_t pi,
                       const std::vector<NodePtr> &target, size_t ti,
                       MatchEnvironment &env, bool anchored,
                       size_t *consumedEnd) const;

    void collect(const NodePtr &target, std::vector<Match> &out) const;

    NodePtr pattern_;
    bool windowPattern_ = false;
};

} // namespace liftfix
