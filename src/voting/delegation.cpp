// BALLOT - Delegation Resolver Implementation
// Copyright (c) 2024 BALLOT Developers
// MIT License

#include "ballot/voting/delegation.h"
#include "ballot/util/logging.h"

#include <set>

namespace ballot {
namespace voting {

BallotError DelegationResolver::Resolve(const Identity& start, const Identity& target,
                                        Identity* terminal) const {
    Identity current = target;
    std::set<Identity> visited;
    visited.insert(current);

    while (true) {
        VotingRecord record;
        db::Status s = ledger_.Read(current, &record);
        if (!s.ok()) {
            LOG_ERROR(util::LogCategory::DELEGATION) << "Reading " << current.ToString()
                                                     << ": " << s.ToString();
            return BallotError::StorageError;
        }

        if (!record.delegate) {
            break;
        }

        current = *record.delegate;
        if (current == start) {
            LOG_DEBUG(util::LogCategory::DELEGATION)
                << "Delegation " << start.ToString() << " -> " << target.ToString()
                << " would close a cycle";
            return BallotError::DelegationCycle;
        }
        if (!visited.insert(current).second) {
            LOG_ERROR(util::LogCategory::DELEGATION)
                << "Stored delegation graph loops through " << current.ToString();
            return BallotError::DelegationCycle;
        }
    }

    LOG_TRACE(util::LogCategory::DELEGATION) << start.ToString() << " -> "
                                             << target.ToString() << " resolves to "
                                             << current.ToString() << " after "
                                             << visited.size() << " hop(s)";
    *terminal = current;
    return BallotError::OK;
}

BallotError DelegationResolver::Chain(const Identity& start,
                                      std::vector<Identity>* chain) const {
    chain->clear();
    std::set<Identity> visited;
    Identity current = start;

    while (true) {
        if (!visited.insert(current).second) {
            LOG_ERROR(util::LogCategory::DELEGATION)
                << "Stored delegation graph loops through " << current.ToString();
            return BallotError::DelegationCycle;
        }
        chain->push_back(current);

        VotingRecord record;
        db::Status s = ledger_.Read(current, &record);
        if (!s.ok()) {
            LOG_ERROR(util::LogCategory::DELEGATION) << "Reading " << current.ToString()
                                                     << ": " << s.ToString();
            return BallotError::StorageError;
        }
        if (!record.delegate) {
            return BallotError::OK;
        }
        current = *record.delegate;
    }
}

} // namespace voting
} // namespace ballot
