// BALLOT - Proposal Registry Implementation
// Copyright (c) 2024 BALLOT Developers
// MIT License

#include "ballot/voting/registry.h"
#include "ballot/util/logging.h"

#include <algorithm>
#include <cstring>

namespace ballot {
namespace voting {

// ============================================================================
// Proposal Names
// ============================================================================

const char* NamePolicyToString(NamePolicy policy) {
    switch (policy) {
        case NamePolicy::Reject: return "reject";
        case NamePolicy::Truncate: return "truncate";
        default: return "unknown";
    }
}

std::optional<ProposalName> EncodeProposalName(const std::string& name, NamePolicy policy) {
    if (name.size() > PROPOSAL_NAME_SIZE && policy == NamePolicy::Reject) {
        return std::nullopt;
    }

    ProposalName label{};
    std::memcpy(label.data(), name.data(), std::min(name.size(), PROPOSAL_NAME_SIZE));
    return label;
}

std::string DecodeProposalName(const ProposalName& label) {
    auto end = std::find(label.begin(), label.end(), Byte{0});
    return std::string(label.begin(), end);
}

std::string ProposalKey(uint32_t index) {
    return db::MakeKey(db::prefix::PROPOSAL, index);
}

// ============================================================================
// ProposalRegistry
// ============================================================================

BallotError ProposalRegistry::Initialize(const std::vector<std::string>& names,
                                         NamePolicy policy) {
    if (names.empty()) {
        LOG_DEBUG(util::LogCategory::BALLOT) << "Rejecting empty proposal list";
        return BallotError::InvalidInput;
    }
    if (names.size() > MAX_PROPOSALS) {
        LOG_DEBUG(util::LogCategory::BALLOT) << "Rejecting " << names.size()
                                             << " proposals (max " << MAX_PROPOSALS << ")";
        return BallotError::InvalidInput;
    }

    std::vector<Proposal> proposals;
    proposals.reserve(names.size());
    for (const auto& name : names) {
        auto label = EncodeProposalName(name, policy);
        if (!label) {
            LOG_DEBUG(util::LogCategory::BALLOT) << "Proposal name longer than "
                                                 << PROPOSAL_NAME_SIZE << " bytes: " << name;
            return BallotError::InvalidInput;
        }
        if (name.size() > PROPOSAL_NAME_SIZE) {
            LogWarnF(util::LogCategory::BALLOT, "Truncated proposal name '%s' to %zu bytes",
                     name.c_str(), PROPOSAL_NAME_SIZE);
        }
        Proposal p;
        p.name = *label;
        proposals.push_back(p);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    proposals_ = std::move(proposals);
    return BallotError::OK;
}

BallotError ProposalRegistry::Load(db::Database& db, uint32_t count) {
    if (count == 0 || count > MAX_PROPOSALS) {
        LOG_ERROR(util::LogCategory::DB) << "Stored proposal count out of range: " << count;
        return BallotError::StorageError;
    }

    std::vector<Proposal> proposals(count);
    for (uint32_t i = 0; i < count; ++i) {
        std::string value;
        db::Status s = db.Get(ProposalKey(i), &value);
        if (!s.ok()) {
            LOG_ERROR(util::LogCategory::DB) << "Reading proposal " << i << ": " << s.ToString();
            return BallotError::StorageError;
        }
        if (!db::DeserializeFromString(value, proposals[i])) {
            LOG_ERROR(util::LogCategory::DB) << "Corrupt proposal record " << i;
            return BallotError::StorageError;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    proposals_ = std::move(proposals);
    return BallotError::OK;
}

bool ProposalRegistry::IsInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !proposals_.empty();
}

size_t ProposalRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proposals_.size();
}

std::optional<Proposal> ProposalRegistry::Get(size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= proposals_.size()) {
        return std::nullopt;
    }
    return proposals_[index];
}

std::vector<Proposal> ProposalRegistry::GetAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proposals_;
}

void ProposalRegistry::RecordVote(size_t index, Weight weight) {
    std::lock_guard<std::mutex> lock(mutex_);
    proposals_[index].voteCount += weight;
}

void ProposalRegistry::StageVote(size_t index, Weight weight, db::WriteBatch& batch) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Proposal updated = proposals_[index];
    updated.voteCount += weight;
    batch.Put(ProposalKey(static_cast<uint32_t>(index)), db::SerializeToString(updated));
}

void ProposalRegistry::StageAll(db::WriteBatch& batch) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < proposals_.size(); ++i) {
        batch.Put(ProposalKey(static_cast<uint32_t>(i)), db::SerializeToString(proposals_[i]));
    }
}

size_t ProposalRegistry::Winner() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t winner = 0;
    Weight winningCount = 0;
    for (size_t i = 0; i < proposals_.size(); ++i) {
        if (proposals_[i].voteCount > winningCount) {
            winningCount = proposals_[i].voteCount;
            winner = i;
        }
    }
    return winner;
}

Weight ProposalRegistry::TotalVotes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Weight total = 0;
    for (const auto& p : proposals_) {
        total += p.voteCount;
    }
    return total;
}

} // namespace voting
} // namespace ballot
