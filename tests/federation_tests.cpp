#include "gtest/gtest.h"
#include "cogdedup/codec.hpp"
#include "cogdedup/errors.hpp"
#include "cogdedup/federation.hpp"
#include "test_utils.hpp"

#include <string>

using namespace cogdedup;

TEST(FederationTest, AgentStoresAreIsolatedBeforePromotion) {
    Federation federation(3);
    auto alice = federation.agentStore("alice");
    auto bob = federation.agentStore("bob");
    EXPECT_EQ(federation.agentStore("alice"), alice);
    EXPECT_EQ(federation.findAgentStore("carol"), nullptr);
    EXPECT_EQ(federation.agentIds().size(), 2u);

    std::string cid = alice->put(string_to_byte_vector("private note")).cid;
    EXPECT_TRUE(alice->contains(cid));
    EXPECT_FALSE(bob->contains(cid));
    EXPECT_FALSE(federation.sharedStore()->contains(cid));
}

TEST(FederationTest, PromotionMakesChunkVisibleToAllAgents) {
    Federation federation(3);
    auto alice = federation.agentStore("alice");
    auto bob = federation.agentStore("bob");
    auto data = string_to_byte_vector("shared system prompt");

    std::string cid = alice->put(data).cid;
    alice->addReference(cid);
    EXPECT_FALSE(bob->contains(cid));
    alice->addReference(cid); // reaches the threshold

    EXPECT_TRUE(federation.sharedStore()->contains(cid));
    EXPECT_TRUE(bob->contains(cid));
    EXPECT_FALSE(bob->containsLocal(cid));
    EXPECT_EQ(bob->get(cid).payload, data);
    EXPECT_EQ(bob->get(cid).tier, Tier::Shared);
    EXPECT_TRUE(alice->containsLocal(cid));
    EXPECT_EQ(alice->stats().promoted, 1u);
}

TEST(FederationTest, LocalAndSharedCopiesAreIndependent) {
    Federation federation(2);
    auto alice = federation.agentStore("alice");
    auto bob = federation.agentStore("bob");
    auto data = string_to_byte_vector("tool schema block");

    std::string cid = alice->put(data).cid;
    alice->addReference(cid);
    ASSERT_TRUE(federation.sharedStore()->contains(cid));

    // Dropping the local copy leaves the shared one in place.
    EXPECT_TRUE(alice->evict(cid));
    EXPECT_FALSE(alice->containsLocal(cid));
    EXPECT_TRUE(federation.sharedStore()->contains(cid));
    EXPECT_EQ(bob->get(cid).payload, data);
    EXPECT_EQ(alice->get(cid).tier, Tier::Shared);

    // And the other way round.
    auto other = string_to_byte_vector("retrieved document");
    std::string other_cid = alice->put(other).cid;
    alice->addReference(other_cid);
    ASSERT_TRUE(federation.sharedStore()->contains(other_cid));
    EXPECT_TRUE(federation.sharedStore()->evict(other_cid));
    EXPECT_FALSE(bob->contains(other_cid));
    EXPECT_TRUE(alice->containsLocal(other_cid));
    EXPECT_EQ(alice->get(other_cid).payload, other);
    EXPECT_EQ(alice->refCount(other_cid), 2u);
}

TEST(FederationTest, ManualPromotionHonoursThreshold) {
    Federation federation(2);
    auto alice = federation.agentStore("alice");
    std::string cid = alice->put(string_to_byte_vector("chunk")).cid;
    EXPECT_FALSE(alice->promote(cid));
    EXPECT_THROW(alice->promote("unknown"), NotFoundError);

    ChunkStore standalone;
    std::string local = standalone.put(string_to_byte_vector("chunk")).cid;
    EXPECT_FALSE(standalone.promote(local));
}

TEST(FederationTest, SecondAgentEncodesAgainstSharedTier) {
    Federation federation(2);
    auto alice = federation.agentStore("alice");
    auto bob = federation.agentStore("bob");
    Codec codec;
    SecurityPolicy policy;
    auto prompt = text_bytes(3000, 17);

    codec.encode(prompt, *alice, policy);
    codec.encode(prompt, *alice, policy); // promoted

    EncodeResult result = codec.encode(prompt, *bob, policy);
    EXPECT_EQ(result.stats.ref, 1u);
    EXPECT_EQ(codec.decode(result.envelope, *bob, policy), prompt);
}
