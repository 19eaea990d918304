/**
 * @file checksum.hpp
 * @brief 7-bit modular check value over a 128-bit identifier.
 *
 * @details
 * Because `2^7 ≡ 1 (mod 127)`, a number is congruent mod 127 to the sum of
 * its 7-bit windows. The engine folds the 128-bit value window by window,
 * then keeps folding `(v & 0x7F) + (v >> 7)` until the result is at most 127.
 * A final 127 is congruent to 0 and is reported as 0, so the check value is
 * exactly `value mod 127` and never collides with the sentinel below.
 *
 * Any single-bit change of the identifier moves the value by `±2^k`, which is
 * never a multiple of 127, so it always changes the check value.
 *
 * @note The check value depends on the 128-bit identifier only, never on its
 *       text encoding.
 */

#ifndef EUID_CHECKSUM_HPP
#define EUID_CHECKSUM_HPP

#include <stdint.h>

namespace euid::checksum {

/// Reserved value meaning "no check value embedded"; decoders skip verification.
static constexpr uint8_t NONE = 0x7F;

/// Width of the check value in bits.
static constexpr uint32_t BITS = 7;

/**
 * @brief Computes the check value of the 128-bit number `hi:lo`.
 * @return A value in [0, 126].
 */
uint8_t compute(uint64_t hi, uint64_t lo);

} // namespace euid::checksum

#endif // EUID_CHECKSUM_HPP
