// BALLOT - Tally Engine
// Copyright (c) 2024 BALLOT Developers
// MIT License
//
// Applies votes and delegations: moves weight either onto a proposal's
// count or onto the identity that ends up holding it.

#ifndef BALLOT_VOTING_TALLY_H
#define BALLOT_VOTING_TALLY_H

#include "ballot/core/types.h"
#include "ballot/db/database.h"
#include "ballot/voting/access.h"
#include "ballot/voting/delegation.h"
#include "ballot/voting/ledger.h"
#include "ballot/voting/registry.h"

#include <string>

namespace ballot {
namespace voting {

/**
 * Vote and delegation state transitions.
 *
 * Every transition validates all of its preconditions before touching
 * anything, then commits the changed voter records and proposal count as a
 * single db::WriteBatch. The in-memory registry is updated only after the
 * batch has been written, so a failed write leaves no trace.
 *
 * Weight conservation: the weight of identities that have not voted, plus
 * the sum of all proposal counts, always equals the total weight granted.
 */
class TallyEngine {
public:
    TallyEngine(VoterLedger& ledger, ProposalRegistry& registry,
                const AccessControl& access, db::Database& db)
        : ledger_(ledger), registry_(registry), access_(access), db_(db), resolver_(ledger) {}

    /**
     * Cast actor's full weight for the proposal at index.
     * @return NoVotingRights, AlreadyVoted, InvalidProposal (checked in that
     *         order), StorageError, or OK
     */
    BallotError Vote(const Identity& actor, size_t index);

    /**
     * Delegate actor's weight to target.
     *
     * The actor is marked as voted with delegate = target (the immediate
     * target, not the terminal). If the terminal delegate has already voted,
     * its chosen proposal gains the actor's weight; otherwise the terminal's
     * own weight grows by it.
     *
     * @return NoVotingRights, AlreadyVoted, SelfDelegation, DelegationCycle,
     *         StorageError, or OK
     */
    BallotError Delegate(const Identity& actor, const Identity& target);

    /// Index of the leading proposal (ties go to the lowest index)
    size_t WinningProposal() const { return registry_.Winner(); }

    /// Name of the leading proposal
    std::string WinnerName() const;

    const DelegationResolver& Resolver() const { return resolver_; }

private:
    /// Write the batch, logging and mapping a failure to StorageError
    BallotError Commit(db::WriteBatch& batch, const char* what);

    VoterLedger& ledger_;
    ProposalRegistry& registry_;
    const AccessControl& access_;
    db::Database& db_;
    DelegationResolver resolver_;
};

} // namespace voting
} // namespace ballot

#endif // BALLOT_VOTING_TALLY_H
