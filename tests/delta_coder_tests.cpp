#include "gtest/gtest.h"
#include "cogdedup/byte_codec.hpp"
#include "cogdedup/delta_coder.hpp"
#include "cogdedup/errors.hpp"
#include "test_utils.hpp"

#include <vector>

using namespace cogdedup;

namespace {

// Round-trip tests check correctness, not the bomb ceiling.
SecurityPolicy permissivePolicy() {
    SecurityPolicy policy;
    policy.max_delta_expansion = 1e12;
    policy.max_chunk_bytes = 64 * 1024 * 1024;
    return policy;
}

void expectRoundTrip(const std::vector<std::byte> &base,
                     const std::vector<std::byte> &target) {
    auto diff = DeltaCoder::encode(base, target);
    EXPECT_EQ(DeltaCoder::declaredSize(diff), target.size());
    EXPECT_EQ(DeltaCoder::decode(base, diff, permissivePolicy()), target);
}

} // namespace

TEST(DeltaCoderTest, RoundTripIdentical) {
    auto base = text_bytes(4096, 1);
    auto diff = DeltaCoder::encode(base, base);
    EXPECT_LT(diff.size(), 16u);
    EXPECT_EQ(DeltaCoder::decode(base, diff, permissivePolicy()), base);
}

TEST(DeltaCoderTest, RoundTripTargetShorterThanBase) {
    auto base = text_bytes(8192, 2);
    std::vector<std::byte> target(base.begin() + 1000, base.begin() + 3000);
    expectRoundTrip(base, target);
}

TEST(DeltaCoderTest, RoundTripTargetLongerThanBase) {
    auto base = text_bytes(2048, 3);
    auto target = base;
    auto extra = random_bytes(3000, 3);
    target.insert(target.begin() + 500, extra.begin(), extra.end());
    target.insert(target.end(), base.begin(), base.begin() + 700);
    expectRoundTrip(base, target);
}

TEST(DeltaCoderTest, RoundTripDisjoint) {
    expectRoundTrip(random_bytes(4096, 4), random_bytes(5000, 5));
}

TEST(DeltaCoderTest, RoundTripEmptyInputs) {
    std::vector<std::byte> empty;
    auto some = text_bytes(100, 6);
    expectRoundTrip(empty, empty);
    expectRoundTrip(some, empty);
    expectRoundTrip(empty, some);
    expectRoundTrip(string_to_byte_vector("tiny"), string_to_byte_vector("tinier"));
}

TEST(DeltaCoderTest, SmallEditGivesSmallDiff) {
    auto base = text_bytes(16384, 7);
    auto target = base;
    for (size_t i = 8000; i < 8040; ++i) {
        target[i] = std::byte{'#'};
    }
    auto diff = DeltaCoder::encode(base, target);
    EXPECT_LT(diff.size(), 100u);
    EXPECT_EQ(DeltaCoder::decode(base, diff, permissivePolicy()), target);
}

TEST(DeltaCoderTest, ExpansionBombRejectedBeforeAllocation) {
    // Declares 1 GiB of output from a handful of bytes.
    ByteWriter w;
    w.putUvarint(1ULL << 30);
    w.putU8(DeltaCoder::kOpCopy);
    w.putUvarint(0);
    w.putUvarint(4);
    auto diff = w.take();
    EXPECT_GT(DeltaCoder::expansionRatio(diff), 1e6);

    auto base = string_to_byte_vector("base");
    SecurityPolicy policy;
    policy.max_delta_expansion = 10.0;
    EXPECT_THROW(DeltaCoder::decode(base, diff, policy), ExpansionLimitExceededError);
}

TEST(DeltaCoderTest, DeclaredSizeAboveChunkLimitRejected) {
    ByteWriter w;
    w.putUvarint(2 * 1024 * 1024);
    std::vector<std::byte> literal(64 * 1024, std::byte{'x'});
    w.putU8(DeltaCoder::kOpInsert);
    w.putUvarint(literal.size());
    w.putBytes(literal);
    auto diff = w.take();

    SecurityPolicy policy; // 1 MiB chunk limit, ratio ~32 is fine
    EXPECT_THROW(DeltaCoder::decode({}, diff, policy), ExpansionLimitExceededError);
}

TEST(DeltaCoderTest, CopyOutsideBaseIsCorrupt) {
    ByteWriter w;
    w.putUvarint(8);
    w.putU8(DeltaCoder::kOpCopy);
    w.putUvarint(2);
    w.putUvarint(8);
    auto base = string_to_byte_vector("0123456789");
    EXPECT_THROW(DeltaCoder::decode(base, w.take(), permissivePolicy()),
                 CorruptChunkError);
}

TEST(DeltaCoderTest, OutputOverrunIsCorrupt) {
    ByteWriter w;
    w.putUvarint(2);
    w.putU8(DeltaCoder::kOpInsert);
    w.putUvarint(3);
    w.putBytes(string_to_byte_vector("abc"));
    EXPECT_THROW(DeltaCoder::decode({}, w.take(), permissivePolicy()),
                 CorruptChunkError);
}

TEST(DeltaCoderTest, ShortOutputIsCorrupt) {
    ByteWriter w;
    w.putUvarint(5);
    w.putU8(DeltaCoder::kOpInsert);
    w.putUvarint(3);
    w.putBytes(string_to_byte_vector("abc"));
    EXPECT_THROW(DeltaCoder::decode({}, w.take(), permissivePolicy()),
                 CorruptChunkError);
}

TEST(DeltaCoderTest, UnknownOpIsCorrupt) {
    ByteWriter w;
    w.putUvarint(1);
    w.putU8(0x7f);
    EXPECT_THROW(DeltaCoder::decode({}, w.take(), permissivePolicy()),
                 CorruptChunkError);
}

TEST(DeltaCoderTest, TruncatedDiffIsMalformed) {
    ByteWriter w;
    w.putUvarint(10);
    w.putU8(DeltaCoder::kOpInsert);
    w.putUvarint(10);
    w.putBytes(string_to_byte_vector("abc"));
    EXPECT_THROW(DeltaCoder::decode({}, w.take(), permissivePolicy()),
                 MalformedEnvelopeError);
    EXPECT_THROW(DeltaCoder::declaredSize({}), MalformedEnvelopeError);
}
