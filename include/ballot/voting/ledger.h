// BALLOT - Voter Ledger
// Copyright (c) 2024 BALLOT Developers
// MIT License
//
// Per-identity voting records kept in the key-value store.

#ifndef BALLOT_VOTING_LEDGER_H
#define BALLOT_VOTING_LEDGER_H

#include "ballot/core/types.h"
#include "ballot/core/serialize.h"
#include "ballot/db/database.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace ballot {
namespace voting {

// ============================================================================
// Voter State
// ============================================================================

/// Lifecycle of an identity: NoRights -> HasRights -> {Voted | Delegated}
enum class VoterState {
    NoRights,
    HasRights,
    Voted,
    Delegated,
};

const char* VoterStateToString(VoterState state);

// ============================================================================
// Voting Record
// ============================================================================

/**
 * What the ballot knows about one identity.
 *
 * weight == 0 means no right to vote. hasVoted flips to true once, in the
 * same transition that sets either vote (direct vote) or delegate.
 */
struct VotingRecord {
    Weight weight{0};
    bool hasVoted{false};
    std::optional<Identity> delegate;
    std::optional<uint32_t> vote;

    bool HasRights() const { return weight > 0; }

    VoterState State() const;

    bool operator==(const VotingRecord& other) const {
        return weight == other.weight && hasVoted == other.hasVoted &&
               delegate == other.delegate && vote == other.vote;
    }
    bool operator!=(const VotingRecord& other) const { return !(*this == other); }
};

template<typename Stream>
void Serialize(Stream& s, const VotingRecord& r) {
    ::ballot::Serialize(s, r.weight);
    ::ballot::Serialize(s, r.hasVoted);
    ::ballot::Serialize(s, r.delegate);
    ::ballot::Serialize(s, r.vote);
}

template<typename Stream>
void Unserialize(Stream& s, VotingRecord& r) {
    ::ballot::Unserialize(s, r.weight);
    ::ballot::Unserialize(s, r.hasVoted);
    ::ballot::Unserialize(s, r.delegate);
    ::ballot::Unserialize(s, r.vote);
}

/// Storage key of an identity's record
std::string VoterKey(const Identity& id);

// ============================================================================
// Voter Ledger
// ============================================================================

/**
 * Identity -> VotingRecord mapping backed by a db::Database.
 *
 * Records are read and written by value; identities never seen read as the
 * default (NoRights) record. The ledger does not lock: the Ballot facade
 * serializes every operation that touches it.
 */
class VoterLedger {
public:
    explicit VoterLedger(db::Database& db) : db_(db) {}

    /// Read a record. NotFound is mapped to the default record; a stored
    /// value that does not decode is reported as Corruption.
    db::Status Read(const Identity& id, VotingRecord* record) const;

    /// Add a record write to a batch
    void Stage(const Identity& id, const VotingRecord& record, db::WriteBatch& batch) const;

    /**
     * Stage weight 1 for voter into batch.
     * AlreadyHasRights when the voter's weight is already nonzero (nothing is
     * staged), StorageError if the record cannot be read.
     * The caller has checked that the actor is the administrator.
     */
    BallotError StageGrantRights(const Identity& voter, db::WriteBatch& batch) const;

    /// Visit every stored record in key order; stops early when fn returns false
    db::Status ForEach(const std::function<bool(const Identity&, const VotingRecord&)>& fn) const;

private:
    db::Database& db_;
};

} // namespace voting
} // namespace ballot

#endif // BALLOT_VOTING_LEDGER_H
