// -----------------------------------------------------------------------------
// @file layout.cpp
// @brief Packing and unpacking of the EUID field layout.
//
// Refer to layout.hpp for the field map. Everything here is pure bit
// arithmetic on the two words; randomness and time arrive as arguments.
// -----------------------------------------------------------------------------
#include "euid/layout.hpp"

namespace euid::layout {

// Minimal number of bits needed to hold `value`.
// Scans down from bit 14 (the top extension bit); 0 needs no bits at all.
uint8_t extension_bit_len(uint16_t value) {
  const uint16_t v = static_cast<uint16_t>(value & EXT_DATA_MASK);
  for (int i = EXT_DATA_BITS - 1; i >= 0; --i) {
    if ((v >> i) != 0) return static_cast<uint8_t>(i + 1);
  }
  return 0;
}

std::optional<EUID> pack(uint64_t timestamp,
                         std::optional<uint16_t> extension,
                         uint64_t random_hi,
                         uint64_t random_lo) {
  // Refuse rather than wrap: a truncated timestamp would break ordering.
  if (timestamp > TIMESTAMP_MASK) return std::nullopt;

  uint64_t ext_data = 0;
  uint8_t  ext_len  = 0;
  if (extension) {
    if (*extension > EXT_DATA_MASK) return std::nullopt;
    ext_data = *extension;
    ext_len  = extension_bit_len(*extension);
  }

  // The extension takes the low ext_len bits of the 15-bit region;
  // random padding fills whatever is left above it.
  const uint64_t pad_mask = (uint64_t{1} << (EXT_DATA_BITS - ext_len)) - 1;
  const uint64_t padding  = random_hi & pad_mask;
  const uint64_t region   = (padding << ext_len) | ext_data;

  const uint64_t hi = (timestamp << TIMESTAMP_SHIFT)
                    | (region << EXT_REGION_SHIFT)
                    | (static_cast<uint64_t>(ext_len) << EXT_LEN_SHIFT)
                    | (static_cast<uint64_t>(VERSION_FIELD) << VERSION_SHIFT);

  return EUID(hi, random_lo);
}

Fields unpack(const EUID& id) {
  const uint64_t hi = id.hi();

  Fields f;
  f.timestamp     = (hi >> TIMESTAMP_SHIFT) & TIMESTAMP_MASK;
  f.extension_len = static_cast<uint8_t>((hi >> EXT_LEN_SHIFT) & EXT_LEN_MASK);
  f.version       = static_cast<uint8_t>((hi >> VERSION_SHIFT) & VERSION_MASK);

  const uint64_t region   = (hi >> EXT_REGION_SHIFT) & EXT_DATA_MASK;
  const uint64_t ext_mask = (uint64_t{1} << f.extension_len) - 1;
  f.extension = static_cast<uint16_t>(region & ext_mask);
  f.padding   = static_cast<uint16_t>(region >> f.extension_len);
  f.random    = id.lo();
  return f;
}

} // namespace euid::layout
