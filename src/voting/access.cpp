// BALLOT - Access Control Implementation
// Copyright (c) 2024 BALLOT Developers
// MIT License

#include "ballot/voting/access.h"
#include "ballot/util/logging.h"

namespace ballot {
namespace voting {

BallotError AccessControl::RequireAdministrator(const Identity& actor) const {
    if (!IsAdministrator(actor)) {
        LOG_DEBUG(util::LogCategory::ACCESS) << actor.ToString()
                                             << " is not the administrator";
        return BallotError::NotAuthorized;
    }
    return BallotError::OK;
}

BallotError AccessControl::RequireVotingRights(const Identity& actor) const {
    VotingRecord record;
    db::Status s = ledger_.Read(actor, &record);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::ACCESS) << "Reading " << actor.ToString() << ": "
                                             << s.ToString();
        return BallotError::StorageError;
    }
    if (!record.HasRights()) {
        LOG_DEBUG(util::LogCategory::ACCESS) << actor.ToString() << " has no voting rights";
        return BallotError::NoVotingRights;
    }
    return BallotError::OK;
}

} // namespace voting
} // namespace ballot
