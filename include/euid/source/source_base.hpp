#pragma once
/**
 * @file source_base.hpp
 * @brief Narrow contracts for the two collaborators a generator needs.
 *
 * The generator never talks to the OS directly. It asks an IClock for the
 * current time and an IRandom for secure random bits, both through a
 * reference it does not own. Tests hand in deterministic fakes.
 */

#include <cstdint>

namespace euid::source {

/**
 * @brief Wall clock.
 *
 * Contract:
 *  - now_ms() returns milliseconds since the Unix epoch.
 *  - It is read once per create()/next() call; no ordering is assumed
 *    between successive readings.
 */
class IClock {
public:
  virtual ~IClock() = default;
  virtual uint64_t now_ms() const = 0;
};

/**
 * @brief Cryptographically secure random bits.
 *
 * Contract:
 *  - next_u32()/next_u64() return uniformly distributed values.
 *  - 128 bits are drawn as two next_u64() calls.
 *  - Never fails from the caller's point of view.
 */
class IRandom {
public:
  virtual ~IRandom() = default;
  virtual uint32_t next_u32() = 0;
  virtual uint64_t next_u64() = 0;
};

} // namespace euid::source
