/**
 * @file base32.hpp
 * @brief EUID text codec: 27 symbols over a 32-letter, human-friendly alphabet.
 *
 * ---
 *
 * ## Alphabet
 *
 * `0123456789ABCDEFGHJKMNPQRSTVWXYZ`, ten digits and 22 uppercase letters.
 * I, L, O and U are left out so a reader cannot confuse them with 1 and 0.
 * The symbols are in ascending ASCII order, so plain string comparison of two
 * encodings gives the same answer as comparing the identifiers.
 *
 * ---
 *
 * ## Bit slicing (the only one)
 *
 * 27 symbols × 5 bits = 135 bits = 128 identifier bits + 7 check bits.
 *
 * | Symbols | Carries                                                      |
 * |---------|--------------------------------------------------------------|
 * | 1–12    | `hi` bits 63..4                                              |
 * | 13      | `hi` bits 3..0, then `lo` bit 63                             |
 * | 14–25   | `lo` bits 62..3                                              |
 * | 26      | `lo` bits 2..0 (upper 3 bits), check bits 6..5 (low 2 bits)  |
 * | 27      | check bits 4..0                                              |
 *
 * When the encoder is asked not to embed a check value it writes the sentinel
 * `checksum::NONE` (0x7F) instead, and the decoder skips verification.
 *
 * ---
 *
 * ## Decoding order
 *
 * 1. Length: anything but 27 characters → `InvalidLength` (no byte is read).
 * 2. Characters, left to right: the first byte outside the alphabet →
 *    `InvalidCharacter`. The alphabet is uppercase only; lowercase letters,
 *    I/L/O/U, punctuation and bytes ≥ 0x80 are all rejected.
 * 3. Check value: sentinel → accepted; otherwise recomputed and compared →
 *    `ChecksumMismatch` on disagreement.
 *
 * There is no partial success: either `ok()` and `id` is the identifier, or
 * the status says why not and `id` stays zero.
 *
 * ---
 *
 * ## Usage Example
 *
 * ```cpp
 * euid::EncodedStr text = euid::base32::encode(id);
 * euid::base32::DecodeResult r = euid::base32::decode(text.c_str());
 * if (r.ok()) use(r.id);
 * ```
 */

#ifndef EUID_BASE32_HPP
#define EUID_BASE32_HPP

#include <stdint.h>
#include <stddef.h>
#include "euid.hpp"
#include "status.hpp"

namespace euid::base32 {

/// The 32 symbols, indexed by 5-bit group value.
extern const char ALPHABET[33];

/// Marker in the decode table for bytes outside the alphabet.
static constexpr uint8_t INVALID = 0xFF;

/**
 * @struct DecodeResult
 * @brief Outcome of `decode()`; only the fields relevant to `status` are set.
 */
struct DecodeResult {
  EuidStatus status{EuidStatus::Ok};
  EUID       id{};                  ///< Decoded identifier when `ok()`.

  size_t   actual_len{0};           ///< InvalidLength: length received.
  size_t   expected_len{ENCODED_LEN}; ///< InvalidLength: always 27.

  char     bad_char{0};             ///< InvalidCharacter: the offending byte.
  size_t   bad_pos{0};              ///< InvalidCharacter: its 0-based index.

  uint8_t  embedded_checksum{0};    ///< ChecksumMismatch: value found in the text.
  uint8_t  computed_checksum{0};    ///< ChecksumMismatch: value recomputed from `id` bits.

  bool ok() const { return status == EuidStatus::Ok; }
};

/**
 * @brief Encodes an identifier into its 27-symbol text form.
 * @param id            Identifier to encode.
 * @param with_checksum Embed the real check value (true) or the sentinel (false).
 */
EncodedStr encode(const EUID& id, bool with_checksum = true);

/**
 * @brief Decodes a text form of known length.
 * @param text Input characters (need not be null terminated).
 * @param len  Number of characters in `text`.
 */
DecodeResult decode(const char* text, size_t len);

/// Decodes a null-terminated text form. A nullptr is treated as "".
DecodeResult decode(const char* text);

/// Maps a byte to its 5-bit value, or `INVALID`.
uint8_t symbol_value(char c);

} // namespace euid::base32

#endif // EUID_BASE32_HPP
