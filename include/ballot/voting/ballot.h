// BALLOT - Ballot Facade
// Copyright (c) 2024 BALLOT Developers
// MIT License
//
// The operation surface of a single-round delegated vote: creation and
// reopening from storage, rights granting, voting, delegation and queries.

#ifndef BALLOT_VOTING_BALLOT_H
#define BALLOT_VOTING_BALLOT_H

#include "ballot/core/types.h"
#include "ballot/core/serialize.h"
#include "ballot/db/database.h"
#include "ballot/voting/access.h"
#include "ballot/voting/delegation.h"
#include "ballot/voting/ledger.h"
#include "ballot/voting/registry.h"
#include "ballot/voting/tally.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace ballot {
namespace voting {

/// Version of the stored layout
constexpr uint32_t BALLOT_FORMAT_VERSION = 1;

// ============================================================================
// Ballot Meta Record
// ============================================================================

/// Stored once per ballot under the meta key
struct BallotMeta {
    uint32_t version{BALLOT_FORMAT_VERSION};
    Identity administrator;
    uint32_t proposalCount{0};
    NamePolicy namePolicy{NamePolicy::Reject};

    /// Weight ever granted (one per rights grant, administrator included)
    Weight totalGranted{0};
};

template<typename Stream>
void Serialize(Stream& s, const BallotMeta& m) {
    ::ballot::Serialize(s, m.version);
    ::ballot::Serialize(s, m.administrator);
    ::ballot::Serialize(s, m.proposalCount);
    ::ballot::Serialize(s, static_cast<uint8_t>(m.namePolicy));
    ::ballot::Serialize(s, m.totalGranted);
}

template<typename Stream>
void Unserialize(Stream& s, BallotMeta& m) {
    uint8_t policy = 0;
    ::ballot::Unserialize(s, m.version);
    ::ballot::Unserialize(s, m.administrator);
    ::ballot::Unserialize(s, m.proposalCount);
    ::ballot::Unserialize(s, policy);
    ::ballot::Unserialize(s, m.totalGranted);
    if (policy > static_cast<uint8_t>(NamePolicy::Truncate)) {
        throw std::ios_base::failure("unknown name policy");
    }
    m.namePolicy = static_cast<NamePolicy>(policy);
}

// ============================================================================
// Options and Reports
// ============================================================================

struct BallotOptions {
    NamePolicy namePolicy{NamePolicy::Reject};
};

/// One identity in a voter listing
struct VoterEntry {
    Identity id;
    VotingRecord record;
};

/// Result of recomputing the weight balance from storage
struct WeightAudit {
    Weight granted{0};    ///< Persisted total of granted weight
    Weight resting{0};    ///< Weight held by identities that have not voted
    Weight tallied{0};    ///< Sum of stored proposal counts
    size_t records{0};    ///< Voting records visited

    bool Balanced() const { return resting + tallied == granted; }
};

// ============================================================================
// Ballot
// ============================================================================

/**
 * A single-round delegated ballot.
 *
 * All operations run under one mutex, so concurrent callers are applied
 * one at a time and each sees the effects of the previous one. Every
 * mutating operation either commits fully (one atomic batch) or fails with
 * no effect.
 *
 * Usage:
 * @code
 *   auto [err, b] = Ballot::Create(std::make_unique<db::MemoryDatabase>(),
 *                                  admin, {"alpha", "beta"});
 *   b->GiveRightToVote(admin, alice);
 *   b->Vote(alice, 1);
 *   b->WinnerName();   // "beta"
 * @endcode
 */
class Ballot {
public:
    /**
     * Start a new ballot on an empty store.
     * The administrator is recorded permanently and receives weight 1.
     * @return InvalidInput for a bad proposal list or a store that already
     *         holds a ballot, StorageError if the initial write fails
     */
    static std::pair<BallotError, std::unique_ptr<Ballot>> Create(
        std::unique_ptr<db::Database> db,
        const Identity& administrator,
        const std::vector<std::string>& proposalNames,
        const BallotOptions& options = BallotOptions());

    /**
     * Reopen a ballot previously created on this store.
     * @return NotInitialized for a store without a ballot, StorageError for
     *         unreadable or corrupt state
     */
    static std::pair<BallotError, std::unique_ptr<Ballot>> Open(
        std::unique_ptr<db::Database> db);

    ~Ballot();

    Ballot(const Ballot&) = delete;
    Ballot& operator=(const Ballot&) = delete;

    // ========================================================================
    // Mutations
    // ========================================================================

    /// Administrator only. AlreadyHasRights if voter's weight is nonzero.
    BallotError GiveRightToVote(const Identity& caller, const Identity& voter);

    /// Hand caller's weight to another identity (see TallyEngine::Delegate)
    BallotError Delegate(const Identity& caller, const Identity& to);

    /// Cast caller's weight for a proposal
    BallotError Vote(const Identity& caller, size_t proposal);

    // ========================================================================
    // Queries
    // ========================================================================

    /// Index of the leading proposal, ties resolve to the lowest index
    size_t WinningProposal() const;

    /// Label of the leading proposal
    std::string WinnerName() const;

    BallotError GetProposalName(size_t index, std::string* name) const;
    BallotError GetProposalVotes(size_t index, Weight* votes) const;

    size_t GetProposalCount() const;
    std::vector<Proposal> GetProposals() const;

    /// Whether caller has voted or delegated
    BallotError HasVoted(const Identity& caller, bool* voted) const;

    /// Administrator only
    BallotError GetWeight(const Identity& caller, const Identity& voter, Weight* weight) const;

    /// Administrator only
    BallotError GetVoterInfo(const Identity& caller, const Identity& voter,
                             VotingRecord* record) const;

    /// Administrator only. Every identity with a stored record, in key order.
    BallotError ListVoters(const Identity& caller, std::vector<VoterEntry>* voters) const;

    /// Administrator only. voter followed by its delegates down to the terminal one.
    BallotError GetDelegationChain(const Identity& caller, const Identity& voter,
                                   std::vector<Identity>* chain) const;

    Weight GetTotalGrantedWeight() const;

    /// Recompute resting and tallied weight from storage
    BallotError AuditWeight(WeightAudit* audit) const;

    const Identity& GetAdministrator() const { return meta_.administrator; }
    NamePolicy GetNamePolicy() const { return meta_.namePolicy; }
    const char* GetBackendName() const { return db_->Name(); }

private:
    Ballot(std::unique_ptr<db::Database> db, const BallotMeta& meta);

    /// Log a rejected operation and pass the error through
    BallotError Rejected(const char* operation, const Identity& caller, BallotError err) const;

    std::unique_ptr<db::Database> db_;
    BallotMeta meta_;
    VoterLedger ledger_;
    ProposalRegistry registry_;
    AccessControl access_;
    TallyEngine tally_;
    mutable std::mutex mutex_;
};

/// Storage key of the meta record
std::string MetaKey();

} // namespace voting
} // namespace ballot

#endif // BALLOT_VOTING_BALLOT_H
