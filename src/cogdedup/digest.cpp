#include "cogdedup/digest.hpp"
#include "cppcodec/base32_rfc4648.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cogdedup {

// multicodec: raw (0x55); multihash: sha2-256 (0x12) / blake3 (0x1e)
const std::vector<uint8_t> CID_PREFIX_SHA256 = {0x01, 0x55, 0x12, 0x20};
const std::vector<uint8_t> CID_PREFIX_BLAKE3 = {0x01, 0x55, 0x1e, 0x20};

std::string digest_to_cid(const DigestArray &digest, HashAlgorithm algo) {
  const auto &prefix =
      algo == HashAlgorithm::SHA256 ? CID_PREFIX_SHA256 : CID_PREFIX_BLAKE3;
  std::vector<uint8_t> bytes;
  bytes.reserve(prefix.size() + digest.size());
  bytes.insert(bytes.end(), prefix.begin(), prefix.end());
  bytes.insert(bytes.end(), digest.begin(), digest.end());
  return cppcodec::base32_rfc4648::encode(bytes);
}

DigestArray cid_to_digest(const std::string &cid, HashAlgorithm *algo_out) {
  if (cid.empty()) {
    throw std::runtime_error("CID string cannot be empty.");
  }

  std::vector<uint8_t> decoded;
  try {
    decoded = cppcodec::base32_rfc4648::decode(cid.data(), cid.length());
  } catch (const std::exception &e) {
    throw std::runtime_error("Failed to decode Base32 CID: " +
                             std::string(e.what()));
  }

  if (decoded.size() != CID_PREFIX_BLAKE3.size() + DIGEST_SIZE) {
    throw std::runtime_error("Invalid CID: unexpected decoded length " +
                             std::to_string(decoded.size()));
  }

  HashAlgorithm algo;
  if (std::equal(CID_PREFIX_BLAKE3.begin(), CID_PREFIX_BLAKE3.end(),
                 decoded.begin())) {
    algo = HashAlgorithm::BLAKE3;
  } else if (std::equal(CID_PREFIX_SHA256.begin(), CID_PREFIX_SHA256.end(),
                        decoded.begin())) {
    algo = HashAlgorithm::SHA256;
  } else {
    throw std::runtime_error("Invalid CID: Prefix mismatch.");
  }

  DigestArray digest;
  std::copy(decoded.begin() + CID_PREFIX_BLAKE3.size(), decoded.end(),
            digest.begin());
  if (algo_out) {
    *algo_out = algo;
  }
  return digest;
}

std::string digest_to_hex(const DigestArray &digest) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (uint8_t b : digest) {
    oss << std::setw(2) << static_cast<int>(b);
  }
  return oss.str();
}

HashAlgorithm parse_hash_algorithm(const std::string &name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "blake3") {
    return HashAlgorithm::BLAKE3;
  }
  if (lower == "sha256" || lower == "sha-256") {
    return HashAlgorithm::SHA256;
  }
  throw std::invalid_argument("Unknown hash algorithm: " + name);
}

const char *hash_algorithm_name(HashAlgorithm algo) {
  return algo == HashAlgorithm::SHA256 ? "sha256" : "blake3";
}

} // namespace cogdedup
