#include "gtest/gtest.h"
#include "cogdedup/chunk_io.hpp"
#include "cogdedup/errors.hpp"
#include "cogdedup/integrity.hpp"
#include "test_utils.hpp"

using namespace cogdedup;

TEST(IntegrityVerifierTest, DefaultPolicy) {
    SecurityPolicy policy;
    EXPECT_EQ(policy.max_ref_count_for_similarity, 1000u);
    EXPECT_TRUE(policy.verify_deltas);
    EXPECT_DOUBLE_EQ(policy.max_delta_expansion, 100.0);
}

TEST(IntegrityVerifierTest, RefCountCapIsExclusive) {
    SecurityPolicy policy;
    policy.max_ref_count_for_similarity = 3;
    IntegrityVerifier verifier(policy);
    EXPECT_TRUE(verifier.checkRefCount(2));
    EXPECT_FALSE(verifier.checkRefCount(3));
    EXPECT_NO_THROW(verifier.enforceRefCount("cid", 2));
    EXPECT_THROW(verifier.enforceRefCount("cid", 3), ReferenceCapExceededError);
}

TEST(IntegrityVerifierTest, ExpansionCheck) {
    SecurityPolicy policy;
    policy.max_delta_expansion = 10.0;
    IntegrityVerifier verifier(policy);
    EXPECT_NO_THROW(verifier.checkExpansion(500, 100));
    EXPECT_THROW(verifier.checkExpansion(1500, 100), ExpansionLimitExceededError);
    // An empty diff counts as one byte.
    EXPECT_NO_THROW(verifier.checkExpansion(10, 0));
    EXPECT_THROW(verifier.checkExpansion(11, 0), ExpansionLimitExceededError);
}

TEST(IntegrityVerifierTest, ExpansionErrorCarriesRatio) {
    SecurityPolicy policy;
    policy.max_delta_expansion = 10.0;
    IntegrityVerifier verifier(policy);
    try {
        verifier.checkExpansion(2000, 100);
        FAIL() << "expected ExpansionLimitExceededError";
    } catch (const ExpansionLimitExceededError &e) {
        EXPECT_DOUBLE_EQ(e.ratio(), 20.0);
        EXPECT_DOUBLE_EQ(e.limit(), 10.0);
    }
}

TEST(IntegrityVerifierTest, ChunkSizeLimit) {
    SecurityPolicy policy;
    policy.max_chunk_bytes = 1000;
    IntegrityVerifier verifier(policy);
    EXPECT_NO_THROW(verifier.checkChunkSize(1000, 10));
    EXPECT_THROW(verifier.checkChunkSize(1001, 10), ExpansionLimitExceededError);
}

TEST(IntegrityVerifierTest, ChecksumAndDigestVerification) {
    IntegrityVerifier verifier{SecurityPolicy{}};
    auto data = string_to_byte_vector("reconstructed chunk");
    uint64_t const sum = ChunkIO::short_checksum(data);
    EXPECT_NO_THROW(verifier.verifyChecksum(data, sum, "chunk"));
    EXPECT_THROW(verifier.verifyChecksum(data, sum ^ 1, "chunk"), CorruptChunkError);

    DigestResult dr = ChunkIO::hash(data);
    EXPECT_NO_THROW(verifier.verifyDigest(data, dr.digest, HashAlgorithm::BLAKE3));
    DigestArray wrong = dr.digest;
    wrong[0] ^= 0xff;
    EXPECT_THROW(verifier.verifyDigest(data, wrong, HashAlgorithm::BLAKE3),
                 CorruptChunkError);

    EXPECT_EQ(verifier.verified(), 2u);
    EXPECT_EQ(verifier.failed(), 2u);
}

TEST(IntegrityVerifierTest, VerificationCanBeDisabled) {
    SecurityPolicy policy;
    policy.verify_deltas = false;
    IntegrityVerifier verifier(policy);
    auto data = string_to_byte_vector("unchecked");
    EXPECT_NO_THROW(verifier.verifyChecksum(data, 0, "chunk"));
    EXPECT_EQ(verifier.verified(), 0u);
}
