// -----------------------------------------------------------------------------
// @file euid.cpp
// @brief Implementation of the EUID value type.
//
// Field accessors delegate to the layout codec, text conversion to the base32
// codec. The raw conversions (16-byte big-endian buffer, 128-bit decimal) are
// done here on four 32-bit limbs so no 128-bit integer type is needed.
//
// @note Heap-free. The debug rendering writes into a caller buffer.
// -----------------------------------------------------------------------------
#include "euid/euid.hpp"
#include "euid/base32.hpp"
#include "euid/checksum.hpp"
#include "euid/layout.hpp"

namespace euid {

namespace {

// Big-endian limbs: limb[0] holds the top 32 bits of hi.
void to_limbs(uint64_t hi, uint64_t lo, uint32_t limb[4]) {
  limb[0] = static_cast<uint32_t>(hi >> 32);
  limb[1] = static_cast<uint32_t>(hi);
  limb[2] = static_cast<uint32_t>(lo >> 32);
  limb[3] = static_cast<uint32_t>(lo);
}

bool limbs_zero(const uint32_t limb[4]) {
  return (limb[0] | limb[1] | limb[2] | limb[3]) == 0;
}

// Bounded appenders for to_string(). `idx` never passes max_len - 1.
void put_str(char* out, size_t max_len, size_t& idx, const char* s) {
  while (*s && idx + 1 < max_len) out[idx++] = *s++;
}

void put_dec(char* out, size_t max_len, size_t& idx, uint64_t v) {
  char tmp[20];
  size_t n = 0;
  do {
    tmp[n++] = static_cast<char>('0' + (v % 10));
    v /= 10;
  } while (v != 0);
  while (n > 0 && idx + 1 < max_len) out[idx++] = tmp[--n];
}

void put_hex32(char* out, size_t max_len, size_t& idx, uint32_t v) {
  static const char HEX[] = "0123456789ABCDEF";
  for (int shift = 28; shift >= 0 && idx + 1 < max_len; shift -= 4) {
    out[idx++] = HEX[(v >> shift) & 0xF];
  }
}

} // namespace

// =============================================================================
// Constructors
// =============================================================================

EUID::EUID() : hi_(0), lo_(0) {}

EUID::EUID(uint64_t hi, uint64_t lo) : hi_(hi), lo_(lo) {}

// =============================================================================
// Binary form
// =============================================================================

std::optional<EUID> EUID::from_bytes(const uint8_t* data, size_t len) {
  if (data == nullptr || len < BINARY_LEN) return std::nullopt;

  uint64_t hi = 0;
  uint64_t lo = 0;
  for (size_t i = 0; i < 8; ++i) {
    hi = (hi << 8) | data[i];
    lo = (lo << 8) | data[8 + i];
  }
  return EUID(hi, lo);
}

void EUID::to_bytes(uint8_t* out_buf) const {
  for (size_t i = 0; i < 8; ++i) {
    out_buf[i]     = static_cast<uint8_t>(hi_ >> (56 - 8 * i));
    out_buf[8 + i] = static_cast<uint8_t>(lo_ >> (56 - 8 * i));
  }
}

// =============================================================================
// Decimal form
// =============================================================================

std::optional<EUID> EUID::from_decimal(const char* str) {
  if (str == nullptr || *str == '\0') return std::nullopt;

  uint32_t limb[4] = {0, 0, 0, 0};
  for (const char* p = str; *p; ++p) {
    if (*p < '0' || *p > '9') return std::nullopt;

    // limb = limb * 10 + digit, least significant limb first.
    uint64_t carry = static_cast<uint64_t>(*p - '0');
    for (int i = 3; i >= 0; --i) {
      const uint64_t cur = static_cast<uint64_t>(limb[i]) * 10 + carry;
      limb[i] = static_cast<uint32_t>(cur);
      carry   = cur >> 32;
    }
    // Anything carried out of the top limb is above 2^128 - 1.
    if (carry != 0) return std::nullopt;
  }

  const uint64_t hi = (static_cast<uint64_t>(limb[0]) << 32) | limb[1];
  const uint64_t lo = (static_cast<uint64_t>(limb[2]) << 32) | limb[3];
  return EUID(hi, lo);
}

DecimalStr EUID::to_decimal() const {
  uint32_t limb[4];
  to_limbs(hi_, lo_, limb);

  // Repeated division by 10 yields digits least significant first.
  char digits[DECIMAL_MAX];
  size_t n = 0;
  while (!limbs_zero(limb) && n < DECIMAL_MAX) {
    uint64_t rem = 0;
    for (size_t i = 0; i < 4; ++i) {
      const uint64_t cur = (rem << 32) | limb[i];
      limb[i] = static_cast<uint32_t>(cur / 10);
      rem     = cur % 10;
    }
    digits[n++] = static_cast<char>('0' + rem);
  }

  DecimalStr out;
  if (n == 0) {
    out += '0';
    return out;
  }
  while (n > 0) out += digits[--n];
  return out;
}

// =============================================================================
// Fields
// =============================================================================

uint64_t EUID::timestamp() const {
  return layout::unpack(*this).timestamp;
}

uint64_t EUID::timestamp_with_epoch(uint64_t epoch_ms) const {
  return (timestamp() + epoch_ms) & layout::TIMESTAMP_MASK;
}

std::optional<uint16_t> EUID::extension() const {
  const layout::Fields f = layout::unpack(*this);
  if (!f.has_extension()) return std::nullopt;
  return f.extension;
}

uint8_t EUID::extension_len() const {
  return layout::unpack(*this).extension_len;
}

uint8_t EUID::version() const {
  return static_cast<uint8_t>(layout::unpack(*this).version + 1);
}

uint8_t EUID::checksum() const {
  return euid::checksum::compute(hi_, lo_);
}

EncodedStr EUID::encode(bool with_checksum) const {
  return base32::encode(*this, with_checksum);
}

// =============================================================================
// Debug rendering
// =============================================================================

// Example: "TS:1700000000000 EXT:42 VER:1 SEQ:9F31A0C2 TEXT:C90FS3..."
// Needs about 100 bytes for the full line; shorter buffers are clipped.
void EUID::to_string(char* out, size_t max_len) const {
  if (out == nullptr || max_len == 0) return;

  const layout::Fields f = layout::unpack(*this);
  size_t idx = 0;

  put_str(out, max_len, idx, "TS:");
  put_dec(out, max_len, idx, f.timestamp);

  put_str(out, max_len, idx, " EXT:");
  if (f.has_extension()) put_dec(out, max_len, idx, f.extension);
  else                   put_str(out, max_len, idx, "-");

  put_str(out, max_len, idx, " VER:");
  put_dec(out, max_len, idx, static_cast<uint64_t>(f.version) + 1);

  put_str(out, max_len, idx, " SEQ:");
  put_hex32(out, max_len, idx, sequence());

  put_str(out, max_len, idx, " TEXT:");
  put_str(out, max_len, idx, encode().c_str());

  out[idx] = '\0';
}

} // namespace euid
