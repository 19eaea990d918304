/**
 * @file status.hpp
 * @brief EUID status codes, one small enum shared by every fallible operation.
 *
 * The core never throws. Operations that can fail either return an empty
 * `std::optional` (generation, packing, conversions) or a result struct that
 * carries one of these codes plus its diagnostic payload (text decoding).
 *
 * | Code               | Raised by                                   | Payload                     |
 * |--------------------|---------------------------------------------|-----------------------------|
 * | `Ok`               | -                                           | -                           |
 * | `Overflow`         | timestamp/extension too wide, sequence full | none ("no result produced") |
 * | `InvalidLength`    | `base32::decode`                            | actual + expected length    |
 * | `InvalidCharacter` | `base32::decode`                            | offending char + position   |
 * | `ChecksumMismatch` | `base32::decode`                            | embedded + computed value   |
 *
 * Every error is terminal for the single call that raised it; nothing is
 * retried internally.
 */

#ifndef EUID_STATUS_HPP
#define EUID_STATUS_HPP

#include <stdint.h>

namespace euid {

/// Result codes for EUID generation, packing and decoding.
enum class EuidStatus : uint8_t {
  Ok = 0,
  Overflow,          // field or sequence counter would not fit
  InvalidLength,     // text is not exactly 27 characters
  InvalidCharacter,  // byte outside the 32-symbol alphabet
  ChecksumMismatch,  // embedded check value disagrees with recomputation
};

/**
 * @brief Stable snake_case name for a status, for `reason=` style diagnostics.
 * @param status Any status value.
 * @return Null-terminated static string, never nullptr.
 */
const char* status_name(EuidStatus status);

} // namespace euid

#endif // EUID_STATUS_HPP
