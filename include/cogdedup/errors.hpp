#ifndef COGDEDUP_ERRORS_HPP
#define COGDEDUP_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace cogdedup {

/**
 * @brief Base class for every error raised by the codec and its store.
 */
class CodecError : public std::runtime_error {
public:
  explicit CodecError(const std::string &what) : std::runtime_error(what) {}
};

/// The first four bytes are not a known format-family tag.
class UnrecognizedFormatError : public CodecError {
public:
  explicit UnrecognizedFormatError(const std::string &magic)
      : CodecError("Unrecognized format magic: '" + magic + "'"),
        magic_(magic) {}

  const std::string &magic() const { return magic_; }

private:
  std::string magic_;
};

/// Known family member with no decoder compiled into this build.
class UnsupportedFormatError : public CodecError {
public:
  explicit UnsupportedFormatError(const std::string &magic)
      : CodecError("No decoder available for format '" + magic + "'") {}
};

/// Envelope body is truncated or carries an invalid field.
class MalformedEnvelopeError : public CodecError {
public:
  explicit MalformedEnvelopeError(const std::string &what)
      : CodecError("Malformed envelope: " + what) {}
};

/// Reconstructed bytes do not match the checksum recorded at encode time.
class CorruptChunkError : public CodecError {
public:
  explicit CorruptChunkError(const std::string &what)
      : CodecError("Corrupt chunk: " + what) {}
};

/**
 * @brief Declared output of a record exceeds the policy ceiling.
 *
 * Always raised before the output buffer is allocated.
 */
class ExpansionLimitExceededError : public CodecError {
public:
  ExpansionLimitExceededError(double ratio, double limit)
      : CodecError("Expansion ratio " + std::to_string(ratio) +
                   " exceeds limit " + std::to_string(limit)),
        ratio_(ratio), limit_(limit) {}

  ExpansionLimitExceededError(const std::string &what, double ratio,
                              double limit)
      : CodecError(what), ratio_(ratio), limit_(limit) {}

  double ratio() const { return ratio_; }
  double limit() const { return limit_; }

private:
  double ratio_;
  double limit_;
};

/// A similarity candidate is already used too often as a delta base.
class ReferenceCapExceededError : public CodecError {
public:
  ReferenceCapExceededError(const std::string &cid, unsigned long long refs)
      : CodecError("Chunk " + cid + " has " + std::to_string(refs) +
                   " references, over the similarity cap"),
        cid_(cid) {}

  const std::string &cid() const { return cid_; }

private:
  std::string cid_;
};

/// A referenced digest is not present in the store.
class NotFoundError : public CodecError {
public:
  explicit NotFoundError(const std::string &cid)
      : CodecError("Chunk not found: " + cid), cid_(cid) {}

  const std::string &cid() const { return cid_; }

private:
  std::string cid_;
};

/// The decoded stream does not hash to the caller-supplied value.
class IntegrityMismatchError : public CodecError {
public:
  IntegrityMismatchError(const std::string &expected, const std::string &actual)
      : CodecError("Integrity hash mismatch: expected " + expected + ", got " +
                   actual) {}
};

} // namespace cogdedup

#endif // COGDEDUP_ERRORS_HPP
