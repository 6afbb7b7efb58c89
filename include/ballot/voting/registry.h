// BALLOT - Proposal Registry
// Copyright (c) 2024 BALLOT Developers
// MIT License
//
// The fixed, ordered list of proposals of a ballot together with their
// running vote counts. A proposal's index is its identity.

#ifndef BALLOT_VOTING_REGISTRY_H
#define BALLOT_VOTING_REGISTRY_H

#include "ballot/core/types.h"
#include "ballot/core/serialize.h"
#include "ballot/db/database.h"

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ballot {
namespace voting {

// ============================================================================
// Constants
// ============================================================================

/// Width of a proposal label in bytes
constexpr size_t PROPOSAL_NAME_SIZE = 32;

/// Upper bound on proposals per ballot (indices are stored as u32)
constexpr size_t MAX_PROPOSALS = 1024;

// ============================================================================
// Proposal Name
// ============================================================================

/// Fixed-width proposal label, zero padded on the right
using ProposalName = std::array<Byte, PROPOSAL_NAME_SIZE>;

/// How names longer than PROPOSAL_NAME_SIZE are handled
enum class NamePolicy : uint8_t {
    Reject = 0,     ///< InvalidInput
    Truncate = 1,   ///< Keep the first PROPOSAL_NAME_SIZE bytes
};

const char* NamePolicyToString(NamePolicy policy);

/**
 * Encode a name as a fixed-width label.
 * @return nullopt if the name is too long under NamePolicy::Reject
 */
std::optional<ProposalName> EncodeProposalName(const std::string& name, NamePolicy policy);

/// Label bytes up to the first zero byte
std::string DecodeProposalName(const ProposalName& label);

// ============================================================================
// Proposal
// ============================================================================

struct Proposal {
    ProposalName name{};
    Weight voteCount{0};

    std::string Name() const { return DecodeProposalName(name); }

    bool operator==(const Proposal& other) const {
        return name == other.name && voteCount == other.voteCount;
    }
};

template<typename Stream>
void Serialize(Stream& s, const Proposal& p) {
    ::ballot::Serialize(s, p.name);
    ::ballot::Serialize(s, p.voteCount);
}

template<typename Stream>
void Unserialize(Stream& s, Proposal& p) {
    ::ballot::Unserialize(s, p.name);
    ::ballot::Unserialize(s, p.voteCount);
}

/// Storage key of the proposal at index
std::string ProposalKey(uint32_t index);

// ============================================================================
// Proposal Registry
// ============================================================================

/**
 * Ordered proposals with vote counts.
 *
 * The list is fixed by Initialize (or Load); afterwards only vote counts
 * change, and only through RecordVote. Persistence is staged into a
 * db::WriteBatch so that a count update commits together with the voter
 * record that caused it.
 */
class ProposalRegistry {
public:
    ProposalRegistry() = default;

    /// Build the list from names in input order. InvalidInput for an empty
    /// list, too many names, or an oversized name under NamePolicy::Reject.
    BallotError Initialize(const std::vector<std::string>& names,
                           NamePolicy policy = NamePolicy::Reject);

    /// Reload count proposals from storage
    BallotError Load(db::Database& db, uint32_t count);

    bool IsInitialized() const;

    size_t Size() const;

    bool IsValidIndex(size_t index) const { return index < Size(); }

    /// The proposal at index, nullopt when out of range
    std::optional<Proposal> Get(size_t index) const;

    /// Snapshot of every proposal in index order
    std::vector<Proposal> GetAll() const;

    /// voteCount += weight. The caller has validated index.
    void RecordVote(size_t index, Weight weight);

    /// Stage the proposal as it will be after RecordVote(index, weight)
    void StageVote(size_t index, Weight weight, db::WriteBatch& batch) const;

    /// Stage every proposal as currently held
    void StageAll(db::WriteBatch& batch) const;

    /**
     * Index of the proposal with the most votes.
     * Strictly-greater scan starting from a maximum of 0, so ties go to the
     * lowest index and an all-zero tally yields 0.
     */
    size_t Winner() const;

    /// Sum of all vote counts
    Weight TotalVotes() const;

private:
    std::vector<Proposal> proposals_;
    mutable std::mutex mutex_;
};

} // namespace voting
} // namespace ballot

#endif // BALLOT_VOTING_REGISTRY_H
