#include "gtest/gtest.h"
#include "cogdedup/chunk_io.hpp"
#include "cogdedup/digest.hpp"
#include "test_utils.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace cogdedup;

TEST(ChunkIOTest, Sha256KnownVector) {
    auto data = string_to_byte_vector("abc");
    DigestResult r = ChunkIO::hash(data, HashAlgorithm::SHA256);
    EXPECT_EQ(digest_to_hex(r.digest),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ChunkIOTest, Blake3EmptyInputKnownVector) {
    std::vector<std::byte> empty;
    DigestResult r = ChunkIO::hash(empty, HashAlgorithm::BLAKE3);
    EXPECT_EQ(digest_to_hex(r.digest),
              "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(ChunkIOTest, IncrementalHashMatchesOneShot) {
    auto data = random_bytes(100000, 5);
    ChunkIO io(HashAlgorithm::BLAKE3);
    io.ingest(data.data(), 1000);
    io.ingest(data.data() + 1000, data.size() - 1000);
    DigestResult incremental = io.finalize_hashed();
    EXPECT_EQ(incremental.cid, ChunkIO::hash(data).cid);
    EXPECT_THROW(io.finalize_hashed(), std::logic_error);
    EXPECT_THROW(io.ingest(data.data(), 1), std::logic_error);
}

TEST(ChunkIOTest, CompressRoundTrip) {
    ChunkIO io(HashAlgorithm::BLAKE3, 3);
    auto data = text_bytes(20000, 1);
    auto compressed = io.compress_data(data);
    EXPECT_LT(compressed.size(), data.size());
    EXPECT_EQ(ChunkIO::frame_content_size(compressed), data.size());
    EXPECT_EQ(io.decompress_data(compressed, data.size()), data);
}

TEST(ChunkIOTest, EmptyCompressesToEmpty) {
    ChunkIO io;
    std::vector<std::byte> empty;
    EXPECT_TRUE(io.compress_data(empty).empty());
    EXPECT_TRUE(io.decompress_data(empty, 0).empty());
    EXPECT_THROW(io.decompress_data(empty, 10), std::runtime_error);
}

TEST(ChunkIOTest, DecompressRejectsWrongSize) {
    ChunkIO io;
    auto data = text_bytes(5000, 2);
    auto compressed = io.compress_data(data);
    EXPECT_THROW(io.decompress_data(compressed, data.size() - 1), std::runtime_error);
}

TEST(ChunkIOTest, DictionaryRoundTrip) {
    ChunkIO io;
    auto dict = text_bytes(4096, 9);
    auto data = text_bytes(8000, 9);
    auto compressed = io.compress_with_dictionary(data, dict);
    EXPECT_EQ(io.decompress_with_dictionary(compressed, dict, data.size()), data);
}

TEST(ChunkIOTest, FrameContentSizeRejectsGarbage) {
    auto garbage = string_to_byte_vector("not a zstd frame");
    EXPECT_THROW(ChunkIO::frame_content_size(garbage), std::runtime_error);
}

TEST(ChunkIOTest, ShortChecksumIsStableAndSensitive) {
    auto a = string_to_byte_vector("hello world");
    auto b = string_to_byte_vector("hello worle");
    EXPECT_EQ(ChunkIO::short_checksum(a), ChunkIO::short_checksum(a));
    EXPECT_NE(ChunkIO::short_checksum(a), ChunkIO::short_checksum(b));
}

TEST(DigestTest, CidRoundTripKeepsAlgorithm) {
    auto data = string_to_byte_vector("chunk");
    for (auto algo : {HashAlgorithm::SHA256, HashAlgorithm::BLAKE3}) {
        DigestResult r = ChunkIO::hash(data, algo);
        HashAlgorithm parsed = algo == HashAlgorithm::SHA256 ? HashAlgorithm::BLAKE3
                                                              : HashAlgorithm::SHA256;
        EXPECT_EQ(cid_to_digest(r.cid, &parsed), r.digest);
        EXPECT_EQ(parsed, algo);
    }
    EXPECT_NE(ChunkIO::hash(data, HashAlgorithm::SHA256).cid,
              ChunkIO::hash(data, HashAlgorithm::BLAKE3).cid);
}

TEST(DigestTest, InvalidCidsAreRejected) {
    EXPECT_THROW(cid_to_digest(""), std::runtime_error);
    EXPECT_THROW(cid_to_digest("not*base32"), std::runtime_error);
    EXPECT_THROW(cid_to_digest("MFRGG==="), std::runtime_error);
}

TEST(DigestTest, ParseHashAlgorithm) {
    EXPECT_EQ(parse_hash_algorithm("BLAKE3"), HashAlgorithm::BLAKE3);
    EXPECT_EQ(parse_hash_algorithm("sha-256"), HashAlgorithm::SHA256);
    EXPECT_THROW(parse_hash_algorithm("md5"), std::invalid_argument);
    EXPECT_STREQ(hash_algorithm_name(HashAlgorithm::SHA256), "sha256");
}
