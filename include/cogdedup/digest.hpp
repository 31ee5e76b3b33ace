#ifndef COGDEDUP_DIGEST_HPP
#define COGDEDUP_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cogdedup {

/// Exact-match hash used as the chunk dedup key.
enum class HashAlgorithm : uint8_t { SHA256 = 0, BLAKE3 = 1 };

/// Both supported algorithms produce 32-byte digests.
inline constexpr size_t DIGEST_SIZE = 32;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

// CIDv1 prefixes: version 0x01, raw codec 0x55, multihash code, length 0x20.
extern const std::vector<uint8_t> CID_PREFIX_SHA256;
extern const std::vector<uint8_t> CID_PREFIX_BLAKE3;

/**
 * @brief Render a digest as a base32 CIDv1 string.
 * @param digest Raw 32-byte digest.
 * @param algo Algorithm that produced @p digest.
 */
std::string digest_to_cid(const DigestArray &digest,
                          HashAlgorithm algo = HashAlgorithm::BLAKE3);

/**
 * @brief Parse a CIDv1 string produced by digest_to_cid().
 * @param algo_out Receives the algorithm encoded in the prefix when non-null.
 * @throws std::runtime_error if the CID is empty, not base32 or has an
 *         unknown prefix.
 */
DigestArray cid_to_digest(const std::string &cid,
                          HashAlgorithm *algo_out = nullptr);

/// Lowercase hex rendering, used in logs and the CLI.
std::string digest_to_hex(const DigestArray &digest);

/// Parse an algorithm name ("blake3", "sha256"); throws std::invalid_argument.
HashAlgorithm parse_hash_algorithm(const std::string &name);

const char *hash_algorithm_name(HashAlgorithm algo);

} // namespace cogdedup

#endif // COGDEDUP_DIGEST_HPP
