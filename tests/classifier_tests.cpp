#include "gtest/gtest.h"
#include "cogdedup/classifier.hpp"
#include "cogdedup/delta_coder.hpp"
#include "test_utils.hpp"

#include <optional>
#include <string>
#include <variant>

using namespace cogdedup;

class ClassifierTest : public ::testing::Test {
protected:
    ChunkStore store;
    ChunkIO io{HashAlgorithm::BLAKE3, 10};
    SecurityPolicy policy;

    ChunkRecord classify(Classifier &classifier, const std::vector<std::byte> &chunk,
                         const std::optional<std::string> &previous = std::nullopt) {
        return classifier.classify(chunk, store.hasher().identify(chunk), previous);
    }
};

TEST_F(ClassifierTest, NewChunkIsFullAndStored) {
    Classifier classifier(store, policy, io);
    auto chunk = text_bytes(4096, 1);
    ChunkRecord record = classify(classifier, chunk);
    ASSERT_TRUE(std::holds_alternative<FullRecord>(record));
    const auto &full = std::get<FullRecord>(record);
    EXPECT_EQ(full.raw_size, chunk.size());
    EXPECT_LT(full.compressed.size(), chunk.size());
    EXPECT_TRUE(store.contains(store.hasher().identify(chunk).cid));
    EXPECT_EQ(classifier.counters().full, 1u);
}

TEST_F(ClassifierTest, RepeatedChunkIsRef) {
    Classifier classifier(store, policy, io);
    auto chunk = string_to_byte_vector("AAAAAAAA");
    classify(classifier, chunk);
    ChunkRecord record = classify(classifier, chunk);
    ASSERT_TRUE(std::holds_alternative<RefRecord>(record));
    ChunkIdentity id = store.hasher().identify(chunk);
    EXPECT_EQ(std::get<RefRecord>(record).digest, id.digest);
    EXPECT_EQ(store.refCount(id.cid), 2u);
    EXPECT_EQ(classifier.counters().ref, 1u);
}

TEST_F(ClassifierTest, SimilarChunkIsDeltaAgainstStoredBase) {
    Classifier classifier(store, policy, io);
    auto base = text_bytes(4096, 2);
    auto target = with_edit(base, 2000, 150, 99);
    ASSERT_LE(hammingDistance(simhash64(base), simhash64(target)), SIMILARITY_THRESHOLD);

    std::string base_cid = store.put(base).cid;
    ChunkRecord record = classify(classifier, target);
    ASSERT_TRUE(std::holds_alternative<DeltaRecord>(record));
    const auto &delta = std::get<DeltaRecord>(record);
    EXPECT_EQ(delta.base, store.hasher().identify(base).digest);
    EXPECT_EQ(delta.checksum, ChunkIO::short_checksum(target));

    SecurityPolicy lenient;
    lenient.max_delta_expansion = 1e9;
    EXPECT_EQ(DeltaCoder::decode(base, delta.diff, lenient), target);
    // The base gained a reference and the target itself is now stored.
    EXPECT_EQ(store.refCount(base_cid), 2u);
    EXPECT_TRUE(store.contains(store.hasher().identify(target).cid));
    EXPECT_EQ(classifier.counters().delta, 1u);
}

TEST_F(ClassifierTest, ReferenceCapBlocksOverusedBase) {
    policy.max_ref_count_for_similarity = 3;
    Classifier classifier(store, policy, io);
    auto base = text_bytes(4096, 3);
    std::string base_cid = store.put(base).cid;
    store.addReference(base_cid);
    store.addReference(base_cid); // ref count 3 reaches the cap

    auto target = with_edit(base, 1000, 150, 5);
    ASSERT_LE(hammingDistance(simhash64(base), simhash64(target)), SIMILARITY_THRESHOLD);
    ChunkRecord record = classify(classifier, target);
    EXPECT_TRUE(std::holds_alternative<FullRecord>(record));
    EXPECT_EQ(classifier.counters().ref_cap_rejections, 1u);
    EXPECT_EQ(store.refCount(base_cid), 3u);
}

TEST_F(ClassifierTest, EquallyCloseBasesPreferFewerReferences) {
    Classifier classifier(store, policy, io);
    auto target = text_bytes(4096, 30);
    auto first = with_edit(target, 500, 150, 31);
    auto second = with_edit(target, 3000, 150, 32);
    ChunkIdentity first_id = store.hasher().identify(first);
    ChunkIdentity second_id = store.hasher().identify(second);
    ChunkIdentity target_id = store.hasher().identify(target);
    // Pin the fingerprints so both bases are exactly two bits away.
    target_id.fingerprint = 0;
    first_id.fingerprint = 0x3;
    second_id.fingerprint = 0x5;
    store.put(first, first_id);
    store.put(second, second_id);

    const ChunkIdentity &busy = first_id.cid < second_id.cid ? first_id : second_id;
    const ChunkIdentity &quiet = first_id.cid < second_id.cid ? second_id : first_id;
    for (int i = 0; i < 3; ++i) {
        store.addReference(busy.cid);
    }

    ChunkRecord record = classifier.classify(target, target_id, std::nullopt);
    ASSERT_TRUE(std::holds_alternative<DeltaRecord>(record));
    EXPECT_EQ(std::get<DeltaRecord>(record).base, quiet.digest);
    EXPECT_EQ(store.refCount(quiet.cid), 2u);
    EXPECT_EQ(store.refCount(busy.cid), 4u);
}

TEST_F(ClassifierTest, ExpansionCeilingRejectsDelta) {
    policy.max_delta_expansion = 2.0;
    Classifier classifier(store, policy, io);
    auto base = text_bytes(4096, 4);
    store.put(base);
    auto target = with_edit(base, 3000, 150, 6);
    ASSERT_LE(hammingDistance(simhash64(base), simhash64(target)), SIMILARITY_THRESHOLD);
    ChunkRecord record = classify(classifier, target);
    EXPECT_TRUE(std::holds_alternative<FullRecord>(record));
    EXPECT_GE(classifier.counters().expansion_rejections, 1u);
}

TEST_F(ClassifierTest, PredictedSuccessorGivesPredDelta) {
    Predictor predictor;
    Classifier classifier(store, policy, io, &predictor);
    auto previous = text_bytes(4096, 7);
    auto successor = text_bytes(4096, 8);
    std::string previous_cid = store.put(previous).cid;
    std::string successor_cid = store.put(successor).cid;
    predictor.observe(previous_cid, successor_cid);

    auto target = with_edit(successor, 500, 150, 9);
    ChunkRecord record = classify(classifier, target, previous_cid);
    ASSERT_TRUE(std::holds_alternative<PredDeltaRecord>(record));
    const auto &pred = std::get<PredDeltaRecord>(record);
    EXPECT_EQ(pred.prediction_index, 0u);
    EXPECT_EQ(pred.base, store.hasher().identify(successor).digest);
    EXPECT_EQ(classifier.counters().pred_delta, 1u);
}

TEST_F(ClassifierTest, UnrelatedChunkStaysFull) {
    Classifier classifier(store, policy, io);
    store.put(random_bytes(4096, 10));
    ChunkRecord record = classify(classifier, random_bytes(4096, 11));
    EXPECT_TRUE(std::holds_alternative<FullRecord>(record));
}
