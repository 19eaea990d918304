// -----------------------------------------------------------------------------
// @file checksum.cpp
// @brief Mod-127 folding over a pair of 64-bit words.
// -----------------------------------------------------------------------------
#include "euid/checksum.hpp"

namespace euid::checksum {

namespace {

constexpr uint64_t WINDOW = 0x7F;

} // namespace

uint8_t compute(uint64_t hi, uint64_t lo) {
  // Sum every 7-bit window of hi:lo, shifting the pair right by 7 each step.
  // 19 windows of at most 127 each cannot overflow the accumulator.
  uint64_t acc = 0;
  while (hi != 0 || lo != 0) {
    acc += lo & WINDOW;
    lo = (lo >> BITS) | ((hi & WINDOW) << (64 - BITS));
    hi >>= BITS;
  }

  while (acc > WINDOW) {
    acc = (acc & WINDOW) + (acc >> BITS);
  }
  return acc == WINDOW ? 0 : static_cast<uint8_t>(acc);
}

} // namespace euid::checksum
