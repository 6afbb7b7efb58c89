// BALLOT - Delegation Resolver
// Copyright (c) 2024 BALLOT Developers
// MIT License
//
// Follows delegate pointers through the ledger to find the identity that
// ends up holding delegated weight.

#ifndef BALLOT_VOTING_DELEGATION_H
#define BALLOT_VOTING_DELEGATION_H

#include "ballot/core/types.h"
#include "ballot/voting/ledger.h"

#include <vector>

namespace ballot {
namespace voting {

/**
 * Walks the delegation graph (edges id -> record.delegate).
 *
 * The graph is kept acyclic: Resolve refuses any new edge whose walk comes
 * back to the delegating identity. The walk has no fixed depth limit; it is
 * bounded by the number of distinct identities visited, and revisiting one
 * (possible only with corrupted storage) is reported as a cycle too.
 */
class DelegationResolver {
public:
    explicit DelegationResolver(const VoterLedger& ledger) : ledger_(ledger) {}

    /**
     * Find the terminal delegate for a new edge start -> target.
     *
     * Starting at target, follow delegate pointers while the current
     * identity has itself delegated. Fails with DelegationCycle as soon as
     * the walk reaches start.
     *
     * Preconditions (checked by the caller): start has rights, has not
     * voted, and target != start.
     *
     * @param start The delegating identity
     * @param target The identity start wants to delegate to
     * @param[out] terminal The first identity on the walk that has not delegated
     * @return OK, DelegationCycle, or StorageError
     */
    BallotError Resolve(const Identity& start, const Identity& target,
                        Identity* terminal) const;

    /**
     * The chain start, delegate(start), ... ending at the first identity that
     * has not delegated. A chain of one element means start has not
     * delegated. Read-only.
     */
    BallotError Chain(const Identity& start, std::vector<Identity>* chain) const;

private:
    const VoterLedger& ledger_;
};

} // namespace voting
} // namespace ballot

#endif // BALLOT_VOTING_DELEGATION_H
