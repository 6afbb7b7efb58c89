// BALLOT - Voter Ledger Implementation
// Copyright (c) 2024 BALLOT Developers
// MIT License

#include "ballot/voting/ledger.h"
#include "ballot/util/logging.h"

namespace ballot {
namespace voting {

const char* VoterStateToString(VoterState state) {
    switch (state) {
        case VoterState::NoRights: return "NoRights";
        case VoterState::HasRights: return "HasRights";
        case VoterState::Voted: return "Voted";
        case VoterState::Delegated: return "Delegated";
        default: return "Unknown";
    }
}

VoterState VotingRecord::State() const {
    if (hasVoted) {
        return delegate ? VoterState::Delegated : VoterState::Voted;
    }
    return weight > 0 ? VoterState::HasRights : VoterState::NoRights;
}

std::string VoterKey(const Identity& id) {
    return db::MakeKey(db::prefix::VOTER, id);
}

// ============================================================================
// VoterLedger
// ============================================================================

db::Status VoterLedger::Read(const Identity& id, VotingRecord* record) const {
    std::string value;
    db::Status s = db_.Get(VoterKey(id), &value);
    if (s.IsNotFound()) {
        *record = VotingRecord();
        return db::Status::Ok();
    }
    if (!s.ok()) {
        return s;
    }

    VotingRecord decoded;
    if (!db::DeserializeFromString(value, decoded)) {
        return db::Status::Corruption("voting record of " + id.ToString());
    }
    *record = decoded;
    return db::Status::Ok();
}

void VoterLedger::Stage(const Identity& id, const VotingRecord& record,
                        db::WriteBatch& batch) const {
    batch.Put(VoterKey(id), db::SerializeToString(record));
}

BallotError VoterLedger::StageGrantRights(const Identity& voter, db::WriteBatch& batch) const {
    VotingRecord record;
    db::Status s = Read(voter, &record);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Reading " << voter.ToString() << ": "
                                             << s.ToString();
        return BallotError::StorageError;
    }

    if (record.weight != 0) {
        return BallotError::AlreadyHasRights;
    }

    record.weight = 1;
    Stage(voter, record, batch);
    return BallotError::OK;
}

db::Status VoterLedger::ForEach(
    const std::function<bool(const Identity&, const VotingRecord&)>& fn) const {
    const std::string start = db::MakeKey(db::prefix::VOTER);
    auto it = db_.NewIterator();

    for (it->Seek(start); it->Valid(); it->Next()) {
        db::Slice key = it->key();
        if (!key.starts_with(start)) {
            break;
        }
        if (key.size() != 1 + Identity::SIZE) {
            return db::Status::Corruption("malformed voter key");
        }

        Identity id(reinterpret_cast<const Byte*>(key.data() + 1), Identity::SIZE);
        VotingRecord record;
        if (!db::DeserializeFromString(it->value().ToString(), record)) {
            return db::Status::Corruption("voting record of " + id.ToString());
        }
        if (!fn(id, record)) {
            break;
        }
    }
    return it->status();
}

} // namespace voting
} // namespace ballot
