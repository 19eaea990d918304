/**
 * @file layout.hpp
 * @brief EUID bit-layout codec. Packs semantic fields into two 64-bit words and back.
 *
 * ---
 *
 * ## Field map of `hi` (most to least significant)
 *
 * | Bits     | Width      | Field            | Constant                 |
 * |----------|------------|------------------|--------------------------|
 * | 63..22   | 42         | Timestamp        | `TIMESTAMP_SHIFT`        |
 * | 21..7    | 15         | Padding + ext    | `EXT_REGION_SHIFT`       |
 * | 6..3     | 4          | Extension length | `EXT_LEN_SHIFT`          |
 * | 2..0     | 3          | Version          | `VERSION_MASK`           |
 *
 * The 15-bit region is shared: the extension sits right-aligned and takes
 * exactly `extension_bit_len(ext)` bits, and random padding fills the rest.
 * With no extension the whole region is random. `lo` is 64 random bits.
 *
 * ---
 *
 * ## Rules
 *
 * - `pack()` refuses (returns `std::nullopt`) a timestamp above
 *   `TIMESTAMP_MASK` or an extension above `EXT_DATA_MASK`. Nothing wraps.
 * - `unpack()` is total: any 128-bit input yields a field tuple.
 * - An extension of 0 has length 0 and therefore reads back as "absent".
 *
 * ---
 *
 * ## Usage Example
 *
 * ```cpp
 * auto id = euid::layout::pack(now_ms, uint16_t{7}, rnd_hi, rnd_lo);
 * if (id) {
 *   euid::layout::Fields f = euid::layout::unpack(*id);
 *   // f.timestamp == now_ms, f.extension == 7, f.extension_len == 3
 * }
 * ```
 */

#ifndef EUID_LAYOUT_HPP
#define EUID_LAYOUT_HPP

#include <stdint.h>
#include <optional>
#include "euid.hpp"

namespace euid::layout {

/// @name Field widths, masks and shifts
///@{
static constexpr uint32_t TIMESTAMP_BITS   = 42;
static constexpr uint64_t TIMESTAMP_MASK   = (uint64_t{1} << TIMESTAMP_BITS) - 1;  ///< 0x3FFFFFFFFFF
static constexpr uint32_t EXT_DATA_BITS    = 15;
static constexpr uint64_t EXT_DATA_MASK    = (uint64_t{1} << EXT_DATA_BITS) - 1;   ///< 0x7FFF
static constexpr uint64_t EXT_LEN_MASK     = 0xF;
static constexpr uint64_t VERSION_MASK     = 0x7;

static constexpr uint32_t VERSION_SHIFT    = 0;
static constexpr uint32_t EXT_LEN_SHIFT    = 3;
static constexpr uint32_t EXT_REGION_SHIFT = 7;
static constexpr uint32_t TIMESTAMP_SHIFT  = 22;
///@}

/// Version field written by `pack()`. Reported by `EUID::version()` as 1.
static constexpr uint8_t VERSION_FIELD = 0;

/**
 * @struct Fields
 * @brief Every field of an identifier, as read by `unpack()`.
 */
struct Fields {
  uint64_t timestamp{0};     ///< 42-bit timestamp.
  uint16_t extension{0};     ///< Extension value; 0 when absent.
  uint8_t  extension_len{0}; ///< Significant extension bits; 0 means no extension.
  uint8_t  version{0};       ///< Raw 3-bit version field.
  uint16_t padding{0};       ///< Random bits above the extension, right aligned.
  uint64_t random{0};        ///< The whole `lo` word.

  /// True when an extension was attached.
  bool has_extension() const { return extension_len != 0; }
};

/**
 * @brief Minimal bit width of an extension value.
 *
 * 0 for 0, otherwise `floor(log2(value)) + 1`. Only the low 15 bits of
 * `value` are considered, so the result never exceeds 15.
 */
uint8_t extension_bit_len(uint16_t value);

/**
 * @brief Packs a timestamp, an optional extension and random bits into an EUID.
 *
 * @param timestamp  Milliseconds since the generator's epoch; must fit 42 bits.
 * @param extension  Caller tag (0..32767) or `std::nullopt`.
 * @param random_hi  Random source for the padding bits (low bits used).
 * @param random_lo  Random tail, stored verbatim as `lo`.
 * @return The packed identifier, or `std::nullopt` on overflow of either field.
 */
std::optional<EUID> pack(uint64_t timestamp,
                         std::optional<uint16_t> extension,
                         uint64_t random_hi,
                         uint64_t random_lo);

/// Reads every field of `id`. Never fails.
Fields unpack(const EUID& id);

} // namespace euid::layout

#endif // EUID_LAYOUT_HPP
