/**
 * @file generator.hpp
 * @brief EUID generator: fresh identifiers and monotonic successors.
 *
 * ---
 *
 * ## Operations
 *
 * | Call                 | Result                                                       |
 * |----------------------|--------------------------------------------------------------|
 * | `create()`           | timestamp + 128 random bits, no extension                    |
 * | `create(ext)`        | same, with a 15-bit caller tag                               |
 * | `next(prev)`         | same ms: `prev` with its sequence + 1 and 32 fresh random bits |
 * |                      | later ms: `create(prev.extension())`                         |
 *
 * Every call returns `std::nullopt` instead of a wrapped value when a field
 * would overflow: timestamp past 42 bits, extension past 0x7FFF, or a
 * sequence already at 0xFFFFFFFF.
 *
 * ---
 *
 * ## Epoch
 *
 * `GeneratorConfig::epoch_ms` is subtracted from the clock before packing,
 * which moves the 139-year window of the 42-bit timestamp. The offset is
 * masked to 42 bits. An epoch at or after the current time is ignored and
 * the raw clock reading is used instead.
 *
 * ---
 *
 * ## Usage Example
 *
 * ```cpp
 * euid::Generator gen;                 // system clock + random_device
 * auto a = gen.create();
 * auto b = a ? gen.next(*a) : std::nullopt;   // b > a
 * ```
 */

#ifndef EUID_GENERATOR_HPP
#define EUID_GENERATOR_HPP

#include <stdint.h>
#include <optional>
#include "euid.hpp"
#include "source/source_base.hpp"

namespace euid {

/// Generator settings.
struct GeneratorConfig {
  uint64_t epoch_ms{0};   ///< Custom epoch in Unix ms; 0 = Unix epoch.
};

class Generator {
public:
  /// Uses the process-wide SystemClock and SystemRandom.
  explicit Generator(GeneratorConfig cfg = {});

  /// Uses caller-owned sources; both must outlive the generator.
  Generator(source::IClock& clock, source::IRandom& random, GeneratorConfig cfg = {});

  /// Fresh identifier without extension.
  std::optional<EUID> create();

  /// Fresh identifier carrying `extension` (0..32767).
  std::optional<EUID> create(uint16_t extension);

  /**
   * @brief Successor of `prev`, strictly greater when both fall in the same ms.
   * @return `std::nullopt` when the sequence is exhausted or generation overflows.
   */
  std::optional<EUID> next(const EUID& prev);

  /// Epoch-adjusted clock reading used by create()/next().
  uint64_t current_timestamp() const;

  /// Effective epoch (already masked to 42 bits).
  uint64_t epoch() const { return epoch_; }

private:
  std::optional<EUID> create_with(std::optional<uint16_t> extension);

  source::IClock&  clock_;
  source::IRandom& random_;
  uint64_t         epoch_;
};

} // namespace euid

#endif // EUID_GENERATOR_HPP
