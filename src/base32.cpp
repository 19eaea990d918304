// -----------------------------------------------------------------------------
// @file base32.cpp
// @brief 27-symbol text codec for EUID with an embedded 7-bit check value.
//
// Refer to base32.hpp for the bit slicing table. The two lookup tables below
// are read-only process-wide constants.
// -----------------------------------------------------------------------------
#include "euid/base32.hpp"
#include "euid/checksum.hpp"

namespace euid::base32 {

const char ALPHABET[33] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

namespace {

constexpr uint8_t X = INVALID;

// ASCII -> 5-bit value. Uppercase only; I, L, O, U and everything
// outside '0'..'Z' map to INVALID.
constexpr uint8_t DECODE_TABLE[128] = {
    X,  X,  X,  X,  X,  X,  X,  X,   // 0
    X,  X,  X,  X,  X,  X,  X,  X,   // 8
    X,  X,  X,  X,  X,  X,  X,  X,   // 16
    X,  X,  X,  X,  X,  X,  X,  X,   // 24
    X,  X,  X,  X,  X,  X,  X,  X,   // 32
    X,  X,  X,  X,  X,  X,  X,  X,   // 40
    0,  1,  2,  3,  4,  5,  6,  7,   // 48  '0'..'7'
    8,  9,  X,  X,  X,  X,  X,  X,   // 56  '8' '9'
    X,  10, 11, 12, 13, 14, 15, 16,  // 64  'A'..'G'
    17, X,  18, 19, X,  20, 21, X,   // 72  'H' (I) 'J' 'K' (L) 'M' 'N' (O)
    22, 23, 24, 25, 26, X,  27, 28,  // 80  'P'..'T' (U) 'V' 'W'
    29, 30, 31, X,  X,  X,  X,  X,   // 88  'X' 'Y' 'Z'
    X,  X,  X,  X,  X,  X,  X,  X,   // 96
    X,  X,  X,  X,  X,  X,  X,  X,   // 104
    X,  X,  X,  X,  X,  X,  X,  X,   // 112
    X,  X,  X,  X,  X,  X,  X,  X,   // 120
};

constexpr uint64_t GROUP = 0x1F;

// Number of symbols drawn from each word before the shared/tail symbols.
constexpr size_t WORD_GROUPS = 12;

} // namespace

uint8_t symbol_value(char c) {
  const unsigned char b = static_cast<unsigned char>(c);
  if (b >= sizeof(DECODE_TABLE)) return INVALID;
  return DECODE_TABLE[b];
}

EncodedStr encode(const EUID& id, bool with_checksum) {
  const uint64_t hi  = id.hi();
  const uint64_t lo  = id.lo();
  const uint8_t  chk = with_checksum ? checksum::compute(hi, lo) : checksum::NONE;

  uint8_t g[ENCODED_LEN];

  // Symbols 1-12: hi bits 63..4.
  for (size_t i = 0; i < WORD_GROUPS; ++i) {
    g[i] = static_cast<uint8_t>((hi >> (59 - 5 * i)) & GROUP);
  }
  // Symbol 13 straddles the words: 4 bits of hi, then the top bit of lo.
  g[12] = static_cast<uint8_t>(((hi & 0xF) << 1) | (lo >> 63));
  // Symbols 14-25: lo bits 62..3.
  for (size_t i = 0; i < WORD_GROUPS; ++i) {
    g[13 + i] = static_cast<uint8_t>((lo >> (58 - 5 * i)) & GROUP);
  }
  // Symbols 26-27: last 3 identifier bits, then the 7 check bits.
  g[25] = static_cast<uint8_t>(((lo & 0x7) << 2) | ((chk >> 5) & 0x3));
  g[26] = static_cast<uint8_t>(chk & GROUP);

  EncodedStr out;
  for (size_t i = 0; i < ENCODED_LEN; ++i) {
    out += ALPHABET[g[i]];
  }
  return out;
}

DecodeResult decode(const char* text, size_t len) {
  DecodeResult r;

  // Length is checked before any character is looked at.
  if (text == nullptr || len != ENCODED_LEN) {
    r.status       = EuidStatus::InvalidLength;
    r.actual_len   = text == nullptr ? 0 : len;
    r.expected_len = ENCODED_LEN;
    return r;
  }

  uint8_t g[ENCODED_LEN];
  for (size_t i = 0; i < ENCODED_LEN; ++i) {
    g[i] = symbol_value(text[i]);
    if (g[i] == INVALID) {
      r.status   = EuidStatus::InvalidCharacter;
      r.bad_char = text[i];
      r.bad_pos  = i;
      return r;
    }
  }

  uint64_t hi = 0;
  for (size_t i = 0; i < WORD_GROUPS; ++i) {
    hi |= static_cast<uint64_t>(g[i]) << (59 - 5 * i);
  }
  hi |= static_cast<uint64_t>(g[12] >> 1);

  uint64_t lo = static_cast<uint64_t>(g[12] & 0x1) << 63;
  for (size_t i = 0; i < WORD_GROUPS; ++i) {
    lo |= static_cast<uint64_t>(g[13 + i]) << (58 - 5 * i);
  }
  lo |= static_cast<uint64_t>(g[25] >> 2);

  const uint8_t embedded = static_cast<uint8_t>(((g[25] & 0x3) << 5) | g[26]);
  if (embedded != checksum::NONE) {
    const uint8_t computed = checksum::compute(hi, lo);
    if (computed != embedded) {
      r.status            = EuidStatus::ChecksumMismatch;
      r.embedded_checksum = embedded;
      r.computed_checksum = computed;
      return r;
    }
  }

  r.id = EUID(hi, lo);
  return r;
}

DecodeResult decode(const char* text) {
  if (text == nullptr) return decode("", 0);
  size_t len = 0;
  while (text[len] != '\0') ++len;
  return decode(text, len);
}

} // namespace euid::base32
