// BALLOT - Core Types Tests
// Copyright (c) 2024 BALLOT Developers
// MIT License

#include <gtest/gtest.h>
#include "ballot/core/types.h"

#include <set>
#include <stdexcept>
#include <string>

namespace ballot {
namespace test {

// ============================================================================
// Hash160 Tests
// ============================================================================

TEST(Hash160Test, DefaultIsNull) {
    Hash160 h;
    EXPECT_TRUE(h.IsNull());
    EXPECT_EQ(Hash160::SIZE, 20u);
    EXPECT_EQ(h.size(), 20u);
}

TEST(Hash160Test, ConstructFromShortBytesPadsWithZeros) {
    const Byte bytes[] = {0xAB, 0xCD};
    Hash160 h(bytes, sizeof(bytes));

    EXPECT_FALSE(h.IsNull());
    EXPECT_EQ(h[0], 0xAB);
    EXPECT_EQ(h[1], 0xCD);
    for (size_t i = 2; i < Hash160::SIZE; ++i) {
        EXPECT_EQ(h[i], 0);
    }
}

TEST(Hash160Test, HexRoundTripKeepsByteOrder) {
    std::string hex = "000102030405060708090a0b0c0d0e0f10111213";
    auto h = Hash160::FromHex(hex);
    EXPECT_EQ(h[0], 0x00);
    EXPECT_EQ(h[19], 0x13);
    EXPECT_EQ(h.ToHex(), hex);
}

TEST(Hash160Test, FromHexAcceptsUppercase) {
    auto h = Hash160::FromHex("FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF");
    for (auto b : h) {
        EXPECT_EQ(b, 0xFF);
    }
}

TEST(Hash160Test, FromHexRejectsBadInput) {
    EXPECT_THROW(Hash160::FromHex("abcd"), std::invalid_argument);
    EXPECT_THROW(Hash160::FromHex(std::string(40, 'g')), std::invalid_argument);
}

TEST(Hash160Test, OrderingAndEquality) {
    const Byte one[] = {1};
    const Byte two[] = {2};
    Hash160 a(one, 1);
    Hash160 b(two, 1);

    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_NE(a, b);
    EXPECT_EQ(a, Hash160(one, 1));

    a.SetNull();
    EXPECT_TRUE(a.IsNull());
}

// ============================================================================
// Identity Tests
// ============================================================================

TEST(IdentityTest, LabelRoundTrip) {
    Identity alice = Identity::FromLabel("alice");
    EXPECT_EQ(alice.ToString(), "alice");
    EXPECT_EQ(alice, Identity::FromLabel("alice"));
    EXPECT_NE(alice, Identity::FromLabel("bob"));
}

TEST(IdentityTest, LabelOfFullWidth) {
    std::string label(Identity::SIZE, 'x');
    Identity id = Identity::FromLabel(label);
    EXPECT_EQ(id.ToString(), label);
}

TEST(IdentityTest, LabelTooLongThrows) {
    EXPECT_THROW(Identity::FromLabel(std::string(Identity::SIZE + 1, 'x')),
                 std::invalid_argument);
    EXPECT_THROW(Identity::FromLabel(""), std::invalid_argument);
}

TEST(IdentityTest, BinaryIdentityPrintsAsHex) {
    std::string hex = "00ff00ff00ff00ff00ff00ff00ff00ff00ff00ff";
    Identity id = Identity::FromHex(hex);
    EXPECT_EQ(id.ToString(), hex);
}

TEST(IdentityTest, NullIdentityPrintsAsHex) {
    Identity id;
    EXPECT_EQ(id.ToString(), std::string(40, '0'));
}

TEST(IdentityTest, UsableAsOrderedKey) {
    std::set<Identity> ids;
    ids.insert(Identity::FromLabel("carol"));
    ids.insert(Identity::FromLabel("alice"));
    ids.insert(Identity::FromLabel("alice"));
    ids.insert(Identity::FromLabel("bob"));

    ASSERT_EQ(ids.size(), 3u);
    EXPECT_EQ(ids.begin()->ToString(), "alice");
}

// ============================================================================
// BallotError Tests
// ============================================================================

TEST(BallotErrorTest, NamesAreDistinct) {
    std::set<std::string> names;
    for (BallotError err : {BallotError::OK, BallotError::NotAuthorized,
                            BallotError::AlreadyHasRights, BallotError::NoVotingRights,
                            BallotError::AlreadyVoted, BallotError::SelfDelegation,
                            BallotError::DelegationCycle, BallotError::InvalidProposal,
                            BallotError::InvalidInput, BallotError::StorageError,
                            BallotError::NotInitialized}) {
        names.insert(BallotErrorToString(err));
    }
    EXPECT_EQ(names.size(), 11u);
    EXPECT_STREQ(BallotErrorToString(BallotError::DelegationCycle), "DelegationCycle");
}

} // namespace test
} // namespace ballot
