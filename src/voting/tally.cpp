// BALLOT - Tally Engine Implementation
// Copyright (c) 2024 BALLOT Developers
// MIT License

#include "ballot/voting/tally.h"
#include "ballot/util/logging.h"

namespace ballot {
namespace voting {

BallotError TallyEngine::Commit(db::WriteBatch& batch, const char* what) {
    db::Status s = db_.Write(&batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::TALLY) << what << " not committed: " << s.ToString();
        return BallotError::StorageError;
    }
    return BallotError::OK;
}

// ============================================================================
// Direct Vote
// ============================================================================

BallotError TallyEngine::Vote(const Identity& actor, size_t index) {
    BallotError err = access_.RequireVotingRights(actor);
    if (err != BallotError::OK) {
        return err;
    }

    VotingRecord record;
    db::Status s = ledger_.Read(actor, &record);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::TALLY) << "Reading " << actor.ToString() << ": "
                                            << s.ToString();
        return BallotError::StorageError;
    }

    if (record.hasVoted) {
        return BallotError::AlreadyVoted;
    }
    if (!registry_.IsValidIndex(index)) {
        return BallotError::InvalidProposal;
    }

    record.hasVoted = true;
    record.vote = static_cast<uint32_t>(index);

    db::WriteBatch batch;
    ledger_.Stage(actor, record, batch);
    registry_.StageVote(index, record.weight, batch);

    err = Commit(batch, "vote");
    if (err != BallotError::OK) {
        return err;
    }
    registry_.RecordVote(index, record.weight);

    LOG_INFO(util::LogCategory::TALLY) << actor.ToString() << " voted for proposal "
                                       << index << " with weight " << record.weight;
    return BallotError::OK;
}

// ============================================================================
// Delegation
// ============================================================================

BallotError TallyEngine::Delegate(const Identity& actor, const Identity& target) {
    BallotError err = access_.RequireVotingRights(actor);
    if (err != BallotError::OK) {
        return err;
    }

    VotingRecord sender;
    db::Status s = ledger_.Read(actor, &sender);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::TALLY) << "Reading " << actor.ToString() << ": "
                                            << s.ToString();
        return BallotError::StorageError;
    }

    if (sender.hasVoted) {
        return BallotError::AlreadyVoted;
    }
    if (target == actor) {
        return BallotError::SelfDelegation;
    }

    Identity terminal;
    err = resolver_.Resolve(actor, target, &terminal);
    if (err != BallotError::OK) {
        return err;
    }

    VotingRecord holder;
    s = ledger_.Read(terminal, &holder);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::TALLY) << "Reading " << terminal.ToString() << ": "
                                            << s.ToString();
        return BallotError::StorageError;
    }

    sender.hasVoted = true;
    sender.delegate = target;

    db::WriteBatch batch;
    ledger_.Stage(actor, sender, batch);

    std::optional<size_t> countedFor;
    if (holder.hasVoted) {
        // A terminal delegate that has voted voted directly
        if (!holder.vote || !registry_.IsValidIndex(*holder.vote)) {
            LOG_ERROR(util::LogCategory::TALLY) << "Record of " << terminal.ToString()
                                                << " is voted but has no valid choice";
            return BallotError::StorageError;
        }
        countedFor = *holder.vote;
        registry_.StageVote(*countedFor, sender.weight, batch);
    } else {
        holder.weight += sender.weight;
        ledger_.Stage(terminal, holder, batch);
    }

    err = Commit(batch, "delegation");
    if (err != BallotError::OK) {
        return err;
    }

    if (countedFor) {
        registry_.RecordVote(*countedFor, sender.weight);
        LOG_INFO(util::LogCategory::TALLY) << actor.ToString() << " delegated to "
                                           << target.ToString() << ", weight "
                                           << sender.weight << " counted for proposal "
                                           << *countedFor << " via " << terminal.ToString();
    } else {
        LOG_INFO(util::LogCategory::TALLY) << actor.ToString() << " delegated to "
                                           << target.ToString() << ", "
                                           << terminal.ToString() << " now holds weight "
                                           << holder.weight;
    }
    return BallotError::OK;
}

std::string TallyEngine::WinnerName() const {
    auto proposal = registry_.Get(registry_.Winner());
    return proposal ? proposal->Name() : std::string();
}

} // namespace voting
} // namespace ballot
