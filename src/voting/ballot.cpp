// BALLOT - Ballot Facade Implementation
// Copyright (c) 2024 BALLOT Developers
// MIT License

#include "ballot/voting/ballot.h"
#include "ballot/util/logging.h"

namespace ballot {
namespace voting {

std::string MetaKey() {
    return db::MakeKey(db::prefix::META);
}

// ============================================================================
// Construction
// ============================================================================

Ballot::Ballot(std::unique_ptr<db::Database> db, const BallotMeta& meta)
    : db_(std::move(db))
    , meta_(meta)
    , ledger_(*db_)
    , access_(meta_.administrator, ledger_)
    , tally_(ledger_, registry_, access_, *db_) {}

Ballot::~Ballot() = default;

std::pair<BallotError, std::unique_ptr<Ballot>> Ballot::Create(
    std::unique_ptr<db::Database> db,
    const Identity& administrator,
    const std::vector<std::string>& proposalNames,
    const BallotOptions& options)
{
    if (!db) {
        return {BallotError::InvalidInput, nullptr};
    }
    if (db->Exists(MetaKey())) {
        LOG_WARN(util::LogCategory::BALLOT) << "Store already holds a ballot";
        return {BallotError::InvalidInput, nullptr};
    }

    BallotMeta meta;
    meta.administrator = administrator;
    meta.namePolicy = options.namePolicy;
    meta.totalGranted = 1;

    std::unique_ptr<Ballot> ballot(new Ballot(std::move(db), meta));

    BallotError err = ballot->registry_.Initialize(proposalNames, options.namePolicy);
    if (err != BallotError::OK) {
        return {err, nullptr};
    }
    ballot->meta_.proposalCount = static_cast<uint32_t>(ballot->registry_.Size());

    db::WriteBatch batch;
    batch.Put(MetaKey(), db::SerializeToString(ballot->meta_));
    ballot->registry_.StageAll(batch);
    err = ballot->ledger_.StageGrantRights(administrator, batch);
    if (err != BallotError::OK) {
        return {err, nullptr};
    }

    db::Status s = ballot->db_->Write(&batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::BALLOT) << "Writing new ballot: " << s.ToString();
        return {BallotError::StorageError, nullptr};
    }

    LOG_INFO(util::LogCategory::BALLOT) << "Created ballot with "
                                        << ballot->meta_.proposalCount
                                        << " proposal(s), administrator "
                                        << administrator.ToString();
    return {BallotError::OK, std::move(ballot)};
}

std::pair<BallotError, std::unique_ptr<Ballot>> Ballot::Open(std::unique_ptr<db::Database> db) {
    if (!db) {
        return {BallotError::InvalidInput, nullptr};
    }

    std::string value;
    db::Status s = db->Get(MetaKey(), &value);
    if (s.IsNotFound()) {
        LOG_DEBUG(util::LogCategory::BALLOT) << "No ballot in store";
        return {BallotError::NotInitialized, nullptr};
    }
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::BALLOT) << "Reading ballot meta: " << s.ToString();
        return {BallotError::StorageError, nullptr};
    }

    BallotMeta meta;
    if (!db::DeserializeFromString(value, meta)) {
        LOG_ERROR(util::LogCategory::BALLOT) << "Corrupt ballot meta record";
        return {BallotError::StorageError, nullptr};
    }
    if (meta.version != BALLOT_FORMAT_VERSION) {
        LOG_ERROR(util::LogCategory::BALLOT) << "Unsupported ballot format version "
                                             << meta.version;
        return {BallotError::StorageError, nullptr};
    }

    std::unique_ptr<Ballot> ballot(new Ballot(std::move(db), meta));
    BallotError err = ballot->registry_.Load(*ballot->db_, meta.proposalCount);
    if (err != BallotError::OK) {
        return {err, nullptr};
    }

    LOG_DEBUG(util::LogCategory::BALLOT) << "Opened ballot with " << meta.proposalCount
                                         << " proposal(s), " << meta.totalGranted
                                         << " weight granted";
    return {BallotError::OK, std::move(ballot)};
}

BallotError Ballot::Rejected(const char* operation, const Identity& caller,
                             BallotError err) const {
    if (err == BallotError::StorageError) {
        LOG_ERROR(util::LogCategory::BALLOT) << operation << " by " << caller.ToString()
                                             << " failed: " << BallotErrorToString(err);
    } else {
        LOG_DEBUG(util::LogCategory::BALLOT) << operation << " by " << caller.ToString()
                                             << " rejected: " << BallotErrorToString(err);
    }
    return err;
}

// ============================================================================
// Mutations
// ============================================================================

BallotError Ballot::GiveRightToVote(const Identity& caller, const Identity& voter) {
    std::lock_guard<std::mutex> lock(mutex_);

    BallotError err = access_.RequireAdministrator(caller);
    if (err != BallotError::OK) {
        return Rejected("GiveRightToVote", caller, err);
    }

    db::WriteBatch batch;
    err = ledger_.StageGrantRights(voter, batch);
    if (err != BallotError::OK) {
        return Rejected("GiveRightToVote", caller, err);
    }

    BallotMeta updated = meta_;
    updated.totalGranted += 1;
    batch.Put(MetaKey(), db::SerializeToString(updated));

    db::Status s = db_->Write(&batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Granting rights to " << voter.ToString()
                                             << ": " << s.ToString();
        return Rejected("GiveRightToVote", caller, BallotError::StorageError);
    }
    meta_ = updated;

    LOG_INFO(util::LogCategory::BALLOT) << "Granted voting rights to " << voter.ToString();
    return BallotError::OK;
}

BallotError Ballot::Delegate(const Identity& caller, const Identity& to) {
    std::lock_guard<std::mutex> lock(mutex_);
    BallotError err = tally_.Delegate(caller, to);
    if (err != BallotError::OK) {
        return Rejected("Delegate", caller, err);
    }
    return BallotError::OK;
}

BallotError Ballot::Vote(const Identity& caller, size_t proposal) {
    std::lock_guard<std::mutex> lock(mutex_);
    BallotError err = tally_.Vote(caller, proposal);
    if (err != BallotError::OK) {
        return Rejected("Vote", caller, err);
    }
    return BallotError::OK;
}

// ============================================================================
// Queries
// ============================================================================

size_t Ballot::WinningProposal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tally_.WinningProposal();
}

std::string Ballot::WinnerName() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tally_.WinnerName();
}

BallotError Ballot::GetProposalName(size_t index, std::string* name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto proposal = registry_.Get(index);
    if (!proposal) {
        return BallotError::InvalidProposal;
    }
    *name = proposal->Name();
    return BallotError::OK;
}

BallotError Ballot::GetProposalVotes(size_t index, Weight* votes) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto proposal = registry_.Get(index);
    if (!proposal) {
        return BallotError::InvalidProposal;
    }
    *votes = proposal->voteCount;
    return BallotError::OK;
}

size_t Ballot::GetProposalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.Size();
}

std::vector<Proposal> Ballot::GetProposals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.GetAll();
}

BallotError Ballot::HasVoted(const Identity& caller, bool* voted) const {
    std::lock_guard<std::mutex> lock(mutex_);
    VotingRecord record;
    db::Status s = ledger_.Read(caller, &record);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Reading " << caller.ToString() << ": "
                                             << s.ToString();
        return BallotError::StorageError;
    }
    *voted = record.hasVoted;
    return BallotError::OK;
}

BallotError Ballot::GetWeight(const Identity& caller, const Identity& voter,
                              Weight* weight) const {
    VotingRecord record;
    BallotError err = GetVoterInfo(caller, voter, &record);
    if (err == BallotError::OK) {
        *weight = record.weight;
    }
    return err;
}

BallotError Ballot::GetVoterInfo(const Identity& caller, const Identity& voter,
                                 VotingRecord* record) const {
    std::lock_guard<std::mutex> lock(mutex_);
    BallotError err = access_.RequireAdministrator(caller);
    if (err != BallotError::OK) {
        return Rejected("GetVoterInfo", caller, err);
    }

    db::Status s = ledger_.Read(voter, record);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Reading " << voter.ToString() << ": "
                                             << s.ToString();
        return BallotError::StorageError;
    }
    return BallotError::OK;
}

BallotError Ballot::ListVoters(const Identity& caller, std::vector<VoterEntry>* voters) const {
    std::lock_guard<std::mutex> lock(mutex_);
    BallotError err = access_.RequireAdministrator(caller);
    if (err != BallotError::OK) {
        return Rejected("ListVoters", caller, err);
    }

    std::vector<VoterEntry> result;
    db::Status s = ledger_.ForEach([&result](const Identity& id, const VotingRecord& record) {
        result.push_back({id, record});
        return true;
    });
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Listing voters: " << s.ToString();
        return BallotError::StorageError;
    }

    *voters = std::move(result);
    return BallotError::OK;
}

BallotError Ballot::GetDelegationChain(const Identity& caller, const Identity& voter,
                                       std::vector<Identity>* chain) const {
    std::lock_guard<std::mutex> lock(mutex_);
    BallotError err = access_.RequireAdministrator(caller);
    if (err != BallotError::OK) {
        return Rejected("GetDelegationChain", caller, err);
    }
    return tally_.Resolver().Chain(voter, chain);
}

Weight Ballot::GetTotalGrantedWeight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return meta_.totalGranted;
}

BallotError Ballot::AuditWeight(WeightAudit* audit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    WeightAudit result;
    result.granted = meta_.totalGranted;

    db::Status s = ledger_.ForEach([&result](const Identity&, const VotingRecord& record) {
        ++result.records;
        if (!record.hasVoted) {
            result.resting += record.weight;
        }
        return true;
    });
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Audit: " << s.ToString();
        return BallotError::StorageError;
    }

    for (uint32_t i = 0; i < meta_.proposalCount; ++i) {
        std::string value;
        Proposal proposal;
        s = db_->Get(ProposalKey(i), &value);
        if (!s.ok() || !db::DeserializeFromString(value, proposal)) {
            LOG_ERROR(util::LogCategory::DB) << "Audit: proposal " << i << " unreadable";
            return BallotError::StorageError;
        }
        result.tallied += proposal.voteCount;
    }

    if (!result.Balanced()) {
        LOG_ERROR(util::LogCategory::BALLOT) << "Weight audit mismatch: granted "
                                             << result.granted << ", resting "
                                             << result.resting << ", tallied "
                                             << result.tallied;
    }

    *audit = result;
    return BallotError::OK;
}

} // namespace voting
} // namespace ballot
