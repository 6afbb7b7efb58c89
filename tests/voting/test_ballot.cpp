// BALLOT - Ballot Facade Tests
// Copyright (c) 2024 BALLOT Developers
// MIT License

#include <gtest/gtest.h>

#include "ballot/db/leveldb.h"
#include "ballot/voting/ballot.h"

#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace ballot {
namespace voting {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class BallotTest : public ::testing::Test {
protected:
    void SetUp() override {
        Start({"alpha", "beta", "gamma"});
    }

    void Start(const std::vector<std::string>& names,
               const BallotOptions& options = BallotOptions()) {
        auto store = std::make_unique<db::MemoryDatabase>();
        store_ = store.get();
        auto [err, created] = Ballot::Create(std::move(store), chair_, names, options);
        ASSERT_EQ(err, BallotError::OK);
        ASSERT_NE(created, nullptr);
        ballot_ = std::move(created);
    }

    /// Copy of everything the ballot has stored so far
    std::unique_ptr<db::MemoryDatabase> CopyStore() const {
        auto copy = std::make_unique<db::MemoryDatabase>();
        auto it = store_->NewIterator();
        for (it->SeekToFirst(); it->Valid(); it->Next()) {
            EXPECT_TRUE(copy->Put(it->key(), it->value()).ok());
        }
        return copy;
    }

    static Identity Id(const std::string& label) { return Identity::FromLabel(label); }

    void Grant(const std::string& label) {
        ASSERT_EQ(ballot_->GiveRightToVote(chair_, Id(label)), BallotError::OK);
    }

    Weight Votes(size_t index) const {
        Weight votes = 0;
        EXPECT_EQ(ballot_->GetProposalVotes(index, &votes), BallotError::OK);
        return votes;
    }

    void ExpectBalanced() const {
        WeightAudit audit;
        ASSERT_EQ(ballot_->AuditWeight(&audit), BallotError::OK);
        EXPECT_TRUE(audit.Balanced()) << "granted " << audit.granted << " resting "
                                      << audit.resting << " tallied " << audit.tallied;
    }

    Identity chair_ = Identity::FromLabel("chair");
    db::MemoryDatabase* store_{nullptr};
    std::unique_ptr<Ballot> ballot_;
};

// ============================================================================
// Creation
// ============================================================================

TEST_F(BallotTest, CreateSetsUpProposalsAndAdministrator) {
    EXPECT_EQ(ballot_->GetProposalCount(), 3u);
    EXPECT_EQ(ballot_->GetAdministrator(), chair_);
    EXPECT_EQ(ballot_->GetNamePolicy(), NamePolicy::Reject);
    EXPECT_STREQ(ballot_->GetBackendName(), "memory");

    std::string name;
    ASSERT_EQ(ballot_->GetProposalName(1, &name), BallotError::OK);
    EXPECT_EQ(name, "beta");
    EXPECT_EQ(Votes(0), 0u);

    Weight weight = 0;
    ASSERT_EQ(ballot_->GetWeight(chair_, chair_, &weight), BallotError::OK);
    EXPECT_EQ(weight, 1u);
    EXPECT_EQ(ballot_->GetTotalGrantedWeight(), 1u);
    ExpectBalanced();
}

TEST(BallotCreateTest, RejectsBadInput) {
    Identity chair = Identity::FromLabel("chair");

    auto [nullErr, nullBallot] = Ballot::Create(nullptr, chair, {"a"});
    EXPECT_EQ(nullErr, BallotError::InvalidInput);
    EXPECT_EQ(nullBallot, nullptr);

    auto [emptyErr, emptyBallot] =
        Ballot::Create(std::make_unique<db::MemoryDatabase>(), chair, {});
    EXPECT_EQ(emptyErr, BallotError::InvalidInput);
    EXPECT_EQ(emptyBallot, nullptr);

    auto [longErr, longBallot] = Ballot::Create(std::make_unique<db::MemoryDatabase>(), chair,
                                                {std::string(33, 'x')});
    EXPECT_EQ(longErr, BallotError::InvalidInput);
    EXPECT_EQ(longBallot, nullptr);
}

TEST(BallotCreateTest, TruncatePolicyKeepsPrefix) {
    BallotOptions options;
    options.namePolicy = NamePolicy::Truncate;

    auto [err, ballot] = Ballot::Create(std::make_unique<db::MemoryDatabase>(),
                                        Identity::FromLabel("chair"),
                                        {std::string(40, 'y')}, options);
    ASSERT_EQ(err, BallotError::OK);
    EXPECT_EQ(ballot->WinnerName(), std::string(PROPOSAL_NAME_SIZE, 'y'));
    EXPECT_EQ(ballot->GetNamePolicy(), NamePolicy::Truncate);
}

TEST(BallotCreateTest, FailedInitialWriteReportsStorageError) {
    auto store = std::make_unique<db::MemoryDatabase>();
    store->SetWriteFailure(db::Status::IOError("injected"));

    auto [err, ballot] = Ballot::Create(std::move(store), Identity::FromLabel("chair"), {"a"});
    EXPECT_EQ(err, BallotError::StorageError);
    EXPECT_EQ(ballot, nullptr);
}

TEST_F(BallotTest, CreateOnUsedStoreIsRejected) {
    auto [err, second] = Ballot::Create(CopyStore(), chair_, {"other"});
    EXPECT_EQ(err, BallotError::InvalidInput);
    EXPECT_EQ(second, nullptr);
}

// ============================================================================
// Rights
// ============================================================================

TEST_F(BallotTest, OnlyAdministratorGrantsRights) {
    EXPECT_EQ(ballot_->GiveRightToVote(Id("alice"), Id("bob")), BallotError::NotAuthorized);

    Grant("alice");
    EXPECT_EQ(ballot_->GiveRightToVote(Id("alice"), Id("bob")), BallotError::NotAuthorized);
    EXPECT_EQ(ballot_->GetTotalGrantedWeight(), 2u);
}

TEST_F(BallotTest, RightsAreGrantedOnce) {
    Grant("alice");
    EXPECT_EQ(ballot_->GiveRightToVote(chair_, Id("alice")), BallotError::AlreadyHasRights);
    EXPECT_EQ(ballot_->GiveRightToVote(chair_, chair_), BallotError::AlreadyHasRights);
    EXPECT_EQ(ballot_->GetTotalGrantedWeight(), 2u);

    Weight weight = 0;
    ASSERT_EQ(ballot_->GetWeight(chair_, Id("alice"), &weight), BallotError::OK);
    EXPECT_EQ(weight, 1u);
    ExpectBalanced();
}

TEST_F(BallotTest, FailedGrantLeavesNoTrace) {
    store_->SetWriteFailure(db::Status::IOError("injected"));
    EXPECT_EQ(ballot_->GiveRightToVote(chair_, Id("alice")), BallotError::StorageError);
    store_->SetWriteFailure(std::nullopt);

    EXPECT_EQ(ballot_->GetTotalGrantedWeight(), 1u);
    Weight weight = 99;
    ASSERT_EQ(ballot_->GetWeight(chair_, Id("alice"), &weight), BallotError::OK);
    EXPECT_EQ(weight, 0u);
    ExpectBalanced();
}

// ============================================================================
// Voting Scenarios
// ============================================================================

TEST_F(BallotTest, SimpleMajority) {
    Grant("alice");
    Grant("bob");
    Grant("carol");

    ASSERT_EQ(ballot_->Vote(Id("alice"), 2), BallotError::OK);
    ASSERT_EQ(ballot_->Vote(Id("bob"), 2), BallotError::OK);
    ASSERT_EQ(ballot_->Vote(Id("carol"), 1), BallotError::OK);

    EXPECT_EQ(ballot_->WinningProposal(), 2u);
    EXPECT_EQ(ballot_->WinnerName(), "gamma");
    ExpectBalanced();
}

TEST_F(BallotTest, NoVotesMeansFirstProposalWins) {
    EXPECT_EQ(ballot_->WinningProposal(), 0u);
    EXPECT_EQ(ballot_->WinnerName(), "alpha");
}

TEST_F(BallotTest, TieResolvesToLowestIndex) {
    for (const char* voter : {"a1", "a2", "a3", "b1", "b2", "b3", "b4", "b5",
                              "c1", "c2", "c3", "c4", "c5"}) {
        Grant(voter);
    }
    for (const char* voter : {"a1", "a2", "a3"}) {
        ASSERT_EQ(ballot_->Vote(Id(voter), 0), BallotError::OK);
    }
    for (const char* voter : {"b1", "b2", "b3", "b4", "b5"}) {
        ASSERT_EQ(ballot_->Vote(Id(voter), 1), BallotError::OK);
    }
    for (const char* voter : {"c1", "c2", "c3", "c4", "c5"}) {
        ASSERT_EQ(ballot_->Vote(Id(voter), 2), BallotError::OK);
    }

    EXPECT_EQ(ballot_->WinningProposal(), 1u);
    EXPECT_EQ(ballot_->WinnerName(), "beta");
}

TEST_F(BallotTest, DelegationBeforeAndAfterDelegateVotes) {
    Grant("alice");
    Grant("bob");
    Grant("carol");
    Grant("dave");

    // Delegate first, delegate votes later
    ASSERT_EQ(ballot_->Delegate(Id("alice"), Id("bob")), BallotError::OK);
    ASSERT_EQ(ballot_->Vote(Id("bob"), 1), BallotError::OK);
    EXPECT_EQ(Votes(1), 2u);

    // Delegate votes first, delegation arrives later
    ASSERT_EQ(ballot_->Vote(Id("carol"), 2), BallotError::OK);
    ASSERT_EQ(ballot_->Delegate(Id("dave"), Id("carol")), BallotError::OK);
    EXPECT_EQ(Votes(2), 2u);

    EXPECT_EQ(Votes(0), 0u);
    ExpectBalanced();
}

TEST_F(BallotTest, CycleIsRejectedAndStateKept) {
    Grant("a");
    Grant("b");
    Grant("c");
    ASSERT_EQ(ballot_->Delegate(Id("a"), Id("b")), BallotError::OK);
    ASSERT_EQ(ballot_->Delegate(Id("b"), Id("c")), BallotError::OK);

    EXPECT_EQ(ballot_->Delegate(Id("c"), Id("a")), BallotError::DelegationCycle);

    bool voted = true;
    ASSERT_EQ(ballot_->HasVoted(Id("c"), &voted), BallotError::OK);
    EXPECT_FALSE(voted);
    Weight weight = 0;
    ASSERT_EQ(ballot_->GetWeight(chair_, Id("c"), &weight), BallotError::OK);
    EXPECT_EQ(weight, 3u);

    // c can still vote with the gathered weight
    ASSERT_EQ(ballot_->Vote(Id("c"), 0), BallotError::OK);
    EXPECT_EQ(Votes(0), 3u);
    ExpectBalanced();
}

TEST_F(BallotTest, NoDoubleCounting) {
    Grant("alice");
    Grant("bob");

    ASSERT_EQ(ballot_->Vote(Id("alice"), 0), BallotError::OK);
    EXPECT_EQ(ballot_->Vote(Id("alice"), 0), BallotError::AlreadyVoted);
    EXPECT_EQ(ballot_->Delegate(Id("alice"), Id("bob")), BallotError::AlreadyVoted);

    ASSERT_EQ(ballot_->Delegate(Id("bob"), Id("alice")), BallotError::OK);
    EXPECT_EQ(ballot_->Vote(Id("bob"), 1), BallotError::AlreadyVoted);

    EXPECT_EQ(Votes(0), 2u);
    EXPECT_EQ(Votes(1), 0u);
    ExpectBalanced();
}

TEST_F(BallotTest, AdministratorVotesLikeAnyone) {
    ASSERT_EQ(ballot_->Vote(chair_, 2), BallotError::OK);
    EXPECT_EQ(Votes(2), 1u);
    EXPECT_EQ(ballot_->Vote(chair_, 1), BallotError::AlreadyVoted);
}

TEST_F(BallotTest, InvalidProposalQueries) {
    std::string name;
    Weight votes = 0;
    EXPECT_EQ(ballot_->GetProposalName(3, &name), BallotError::InvalidProposal);
    EXPECT_EQ(ballot_->GetProposalVotes(3, &votes), BallotError::InvalidProposal);

    Grant("alice");
    EXPECT_EQ(ballot_->Vote(Id("alice"), 3), BallotError::InvalidProposal);
    bool voted = true;
    ASSERT_EQ(ballot_->HasVoted(Id("alice"), &voted), BallotError::OK);
    EXPECT_FALSE(voted);
}

// ============================================================================
// Administrative Queries
// ============================================================================

TEST_F(BallotTest, AdministrativeQueriesRequireAdministrator) {
    Grant("alice");

    Weight weight = 0;
    VotingRecord record;
    std::vector<VoterEntry> voters;
    std::vector<Identity> chain;

    EXPECT_EQ(ballot_->GetWeight(Id("alice"), Id("alice"), &weight), BallotError::NotAuthorized);
    EXPECT_EQ(ballot_->GetVoterInfo(Id("alice"), Id("alice"), &record),
              BallotError::NotAuthorized);
    EXPECT_EQ(ballot_->ListVoters(Id("alice"), &voters), BallotError::NotAuthorized);
    EXPECT_EQ(ballot_->GetDelegationChain(Id("alice"), Id("alice"), &chain),
              BallotError::NotAuthorized);
}

TEST_F(BallotTest, ListVotersAndChain) {
    Grant("alice");
    Grant("bob");
    ASSERT_EQ(ballot_->Delegate(Id("alice"), Id("bob")), BallotError::OK);

    std::vector<VoterEntry> voters;
    ASSERT_EQ(ballot_->ListVoters(chair_, &voters), BallotError::OK);
    ASSERT_EQ(voters.size(), 3u);
    EXPECT_EQ(voters[0].id, Id("alice"));
    EXPECT_EQ(voters[0].record.State(), VoterState::Delegated);
    EXPECT_EQ(voters[1].id, Id("bob"));
    EXPECT_EQ(voters[1].record.weight, 2u);
    EXPECT_EQ(voters[2].id, chair_);

    std::vector<Identity> chain;
    ASSERT_EQ(ballot_->GetDelegationChain(chair_, Id("alice"), &chain), BallotError::OK);
    ASSERT_EQ(chain.size(), 2u);
    EXPECT_EQ(chain[1], Id("bob"));
}

TEST_F(BallotTest, ProposalsSnapshot) {
    Grant("alice");
    ASSERT_EQ(ballot_->Vote(Id("alice"), 1), BallotError::OK);

    auto proposals = ballot_->GetProposals();
    ASSERT_EQ(proposals.size(), 3u);
    EXPECT_EQ(proposals[1].Name(), "beta");
    EXPECT_EQ(proposals[1].voteCount, 1u);
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(BallotTest, ReopenRestoresState) {
    Grant("alice");
    Grant("bob");
    ASSERT_EQ(ballot_->Delegate(Id("alice"), Id("bob")), BallotError::OK);
    ASSERT_EQ(ballot_->Vote(chair_, 2), BallotError::OK);

    auto [err, reopened] = Ballot::Open(CopyStore());
    ASSERT_EQ(err, BallotError::OK);
    ASSERT_NE(reopened, nullptr);

    EXPECT_EQ(reopened->GetAdministrator(), chair_);
    EXPECT_EQ(reopened->GetProposalCount(), 3u);
    EXPECT_EQ(reopened->GetTotalGrantedWeight(), 3u);
    EXPECT_EQ(reopened->WinnerName(), "gamma");

    // Progress continues where it left off
    EXPECT_EQ(reopened->Vote(Id("alice"), 0), BallotError::AlreadyVoted);
    ASSERT_EQ(reopened->Vote(Id("bob"), 0), BallotError::OK);
    EXPECT_EQ(reopened->WinnerName(), "alpha");

    WeightAudit audit;
    ASSERT_EQ(reopened->AuditWeight(&audit), BallotError::OK);
    EXPECT_TRUE(audit.Balanced());
    EXPECT_EQ(audit.tallied, 3u);
}

TEST(BallotOpenTest, EmptyStoreIsNotInitialized) {
    auto [err, ballot] = Ballot::Open(std::make_unique<db::MemoryDatabase>());
    EXPECT_EQ(err, BallotError::NotInitialized);
    EXPECT_EQ(ballot, nullptr);
}

TEST(BallotOpenTest, CorruptMetaIsStorageError) {
    auto store = std::make_unique<db::MemoryDatabase>();
    ASSERT_TRUE(store->Put(MetaKey(), "broken").ok());

    auto [err, ballot] = Ballot::Open(std::move(store));
    EXPECT_EQ(err, BallotError::StorageError);
}

TEST(BallotOpenTest, UnknownFormatVersionIsStorageError) {
    BallotMeta meta;
    meta.version = BALLOT_FORMAT_VERSION + 1;
    meta.proposalCount = 1;

    auto store = std::make_unique<db::MemoryDatabase>();
    ASSERT_TRUE(store->Put(MetaKey(), db::SerializeToString(meta)).ok());

    auto [err, ballot] = Ballot::Open(std::move(store));
    EXPECT_EQ(err, BallotError::StorageError);
}

TEST_F(BallotTest, MissingProposalRecordIsStorageError) {
    auto copy = CopyStore();
    ASSERT_TRUE(copy->Delete(ProposalKey(2)).ok());

    auto [err, reopened] = Ballot::Open(std::move(copy));
    EXPECT_EQ(err, BallotError::StorageError);
}

TEST(BallotPersistenceTest, ReopenFromLevelDB) {
    if (!db::HaveLevelDB()) {
        GTEST_SKIP() << "built without LevelDB";
    }

    std::random_device rd;
    auto dir = std::filesystem::temp_directory_path() /
               ("ballot_persist_test_" + std::to_string(rd() % 1000000));
    Identity chair = Identity::FromLabel("chair");

    {
        auto [status, store] = db::OpenDatabase(dir);
        ASSERT_TRUE(status.ok()) << status.ToString();
        auto [err, ballot] = Ballot::Create(std::move(store), chair, {"x", "y"});
        ASSERT_EQ(err, BallotError::OK);
        ASSERT_EQ(ballot->Vote(chair, 1), BallotError::OK);
    }

    {
        auto [status, store] = db::OpenDatabase(dir);
        ASSERT_TRUE(status.ok()) << status.ToString();
        auto [err, ballot] = Ballot::Open(std::move(store));
        ASSERT_EQ(err, BallotError::OK);
        EXPECT_EQ(ballot->WinnerName(), "y");
    }

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(BallotTest, ConcurrentVotesAreAllCounted) {
    const int voters = 40;
    for (int i = 0; i < voters; ++i) {
        Grant("v" + std::to_string(i));
    }

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = t; i < voters; i += 4) {
                EXPECT_EQ(ballot_->Vote(Id("v" + std::to_string(i)), i % 3), BallotError::OK);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(Votes(0) + Votes(1) + Votes(2), static_cast<Weight>(voters));
    ExpectBalanced();
}

} // namespace test
} // namespace voting
} // namespace ballot
