/**
 * @page euid_value EUID value type
 * @file euid.hpp
 * @brief EUID: 128-bit sortable identifier carried as two 64-bit words.
 *
 * This header defines the `EUID` class, the immutable value produced by the
 * generator, the bit-layout codec and the text decoder. It owns no policy: it
 * stores two words and exposes read-only views of the fields packed inside
 * them, plus conversions to the wire forms used for storage and transport.
 *
 * @section euid_value_layout Binary layout (big endian)
 *
 * ```text
 *        0               1               2               3
 * 0 1 2 3 4 5 6 7 0 1 2 3 4 5 6 7 0 1 2 3 4 5 6 7 0 1 2 3 4 5 6 7
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                        Timestamp High                         |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * | Timestamp Low     | N-bit Random + Ext Data     |Ext Len| Ver |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |              Random (sequence counter on next())              |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                            Random                             |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * ```
 *
 * | Field            | Bits | Word | Description                                   |
 * |------------------|------|------|-----------------------------------------------|
 * | Timestamp        | 42   | hi   | ms since the generator's epoch                |
 * | Random padding   | var  | hi   | fills the 15-bit region above the extension   |
 * | Extension data   | 0–15 | hi   | caller tag, right aligned                     |
 * | Extension length | 4    | hi   | significant bits of the extension (0 = none)  |
 * | Version          | 3    | hi   | format version field (0 = version 1)          |
 * | Random           | 64   | lo   | upper 32 bits double as the sequence counter  |
 *
 * @section euid_value_order Ordering
 *
 * Identifiers compare as the unsigned pair `(hi, lo)`, which is the same as
 * comparing their 16-byte big-endian forms or their text encodings. Since the
 * timestamp occupies the top bits, identifiers sort by creation time first.
 *
 * ### Example
 * @code
 * euid::Generator gen;
 * auto id = gen.create(42);
 * if (id) {
 *   euid::EncodedStr text = id->encode();   // 27 chars, checksummed
 *   uint64_t ms = id->timestamp();
 *   auto ext = id->extension();              // 42
 * }
 * @endcode
 *
 * @see layout.hpp for the packing rules, base32.hpp for the text form.
 */

#ifndef EUID_EUID_HPP
#define EUID_EUID_HPP

#include "etl/string.h"
#include <stdint.h>
#include <stddef.h>
#include <functional>
#include <optional>

namespace euid {

/// Number of symbols in the text form.
static constexpr size_t ENCODED_LEN = 27;

/// Number of bytes in the binary (big-endian) form.
static constexpr size_t BINARY_LEN = 16;

/// Longest decimal rendering of a 128-bit value (2^128 - 1 has 39 digits).
static constexpr size_t DECIMAL_MAX = 39;

/// Fixed-capacity holder for the 27-symbol text form.
using EncodedStr = etl::string<ENCODED_LEN>;

/// Fixed-capacity holder for the decimal form.
using DecimalStr = etl::string<DECIMAL_MAX>;

/**
 * @class EUID
 * @brief Immutable 128-bit identifier: `hi` (fields) and `lo` (random tail).
 *
 * An EUID is only ever built whole: by the generator, by the layout codec,
 * by the text decoder or from one of the raw forms below. There are no
 * setters; deriving a successor always yields a new value.
 *
 * Any pair of words is a valid EUID. Only *text* can be invalid, and that is
 * reported by `base32::decode`.
 */
class EUID {
public:
  /// All-zero identifier (timestamp 0, no extension, version 1).
  EUID();

  /**
   * @brief Builds an identifier from its two words.
   * @param hi Most significant word (timestamp, extension, version).
   * @param lo Least significant word (random tail).
   */
  EUID(uint64_t hi, uint64_t lo);

  /// Most significant word.
  uint64_t hi() const { return hi_; }

  /// Least significant word.
  uint64_t lo() const { return lo_; }

  /**
   * @brief Reads an identifier from a 16-byte big-endian buffer.
   * @param data Input buffer.
   * @param len  Length of the buffer; must be at least 16.
   * @return The identifier, or `std::nullopt` if the buffer is too short.
   */
  static std::optional<EUID> from_bytes(const uint8_t* data, size_t len);

  /**
   * @brief Writes the identifier as 16 big-endian bytes.
   * @param out_buf Output buffer of at least 16 bytes.
   */
  void to_bytes(uint8_t* out_buf) const;

  /**
   * @brief Parses an unsigned 128-bit decimal number (e.g. "123897324").
   * @param str Null-terminated string of digits only.
   * @return The identifier, or `std::nullopt` if the string is empty, holds a
   *         non-digit, or exceeds 2^128 - 1.
   */
  static std::optional<EUID> from_decimal(const char* str);

  /// Renders the identifier as an unsigned 128-bit decimal number.
  DecimalStr to_decimal() const;

  /// Milliseconds since the epoch the identifier was generated against.
  uint64_t timestamp() const;

  /**
   * @brief Timestamp projected back onto the Unix timeline.
   * @param epoch_ms The epoch offset the generator used (Unix ms).
   * @return `(timestamp() + epoch_ms)` masked to 42 bits.
   */
  uint64_t timestamp_with_epoch(uint64_t epoch_ms) const;

  /// Caller tag, or `std::nullopt` when the extension length is zero.
  std::optional<uint16_t> extension() const;

  /// Number of significant extension bits (0..15).
  uint8_t extension_len() const;

  /// Format version (the 3-bit field plus one; currently always 1).
  uint8_t version() const;

  /// Upper half of `lo`, the counter that `Generator::next()` increments.
  uint32_t sequence() const { return static_cast<uint32_t>(lo_ >> 32); }

  /// 7-bit check value over all 128 bits, in [0, 126].
  uint8_t checksum() const;

  /**
   * @brief Encodes the identifier as its 27-symbol text form.
   * @param with_checksum When false, the "no checksum" sentinel is embedded.
   */
  EncodedStr encode(bool with_checksum = true) const;

  /**
   * @brief Human-readable dump of the fields. For debugging.
   * @param out Output character buffer.
   * @param max_len Capacity of `out`, including the null terminator.
   *
   * Format example: "TS:1700000000000 EXT:42 VER:1 SEQ:9F31A0C2 TEXT:C90FS3..."
   */
  void to_string(char* out, size_t max_len) const;

  friend bool operator==(const EUID& a, const EUID& b) { return a.hi_ == b.hi_ && a.lo_ == b.lo_; }
  friend bool operator!=(const EUID& a, const EUID& b) { return !(a == b); }
  friend bool operator<(const EUID& a, const EUID& b) {
    return a.hi_ != b.hi_ ? a.hi_ < b.hi_ : a.lo_ < b.lo_;
  }
  friend bool operator>(const EUID& a, const EUID& b)  { return b < a; }
  friend bool operator<=(const EUID& a, const EUID& b) { return !(b < a); }
  friend bool operator>=(const EUID& a, const EUID& b) { return !(a < b); }

private:
  uint64_t hi_;
  uint64_t lo_;
};

} // namespace euid

namespace std {

template <>
struct hash<euid::EUID> {
  size_t operator()(const euid::EUID& id) const noexcept {
    size_t h = std::hash<uint64_t>{}(id.hi());
    h ^= std::hash<uint64_t>{}(id.lo()) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
    return h;
  }
};

} // namespace std

#endif // EUID_EUID_HPP
