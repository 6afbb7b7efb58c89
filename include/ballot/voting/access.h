// BALLOT - Access Control
// Copyright (c) 2024 BALLOT Developers
// MIT License

#ifndef BALLOT_VOTING_ACCESS_H
#define BALLOT_VOTING_ACCESS_H

#include "ballot/core/types.h"
#include "ballot/voting/ledger.h"

namespace ballot {
namespace voting {

/**
 * Gates operations by caller identity.
 *
 * The administrator is fixed when the ballot is created and never changes.
 * Voting operations require a nonzero weight in the ledger.
 */
class AccessControl {
public:
    AccessControl(const Identity& administrator, const VoterLedger& ledger)
        : administrator_(administrator), ledger_(ledger) {}

    const Identity& Administrator() const { return administrator_; }

    bool IsAdministrator(const Identity& actor) const { return actor == administrator_; }

    /// NotAuthorized unless actor is the administrator
    BallotError RequireAdministrator(const Identity& actor) const;

    /// NoVotingRights unless actor's weight is nonzero
    BallotError RequireVotingRights(const Identity& actor) const;

private:
    const Identity administrator_;
    const VoterLedger& ledger_;
};

} // namespace voting
} // namespace ballot

#endif // BALLOT_VOTING_ACCESS_H
