// -----------------------------------------------------------------------------
// @file generator.cpp
// @brief create()/next() on top of the layout codec and the two sources.
// -----------------------------------------------------------------------------
#include "euid/generator.hpp"
#include "euid/layout.hpp"
#include "euid/source/source_system.hpp"

namespace euid {

namespace {

constexpr uint32_t SEQUENCE_MAX = 0xFFFFFFFFu;

source::IClock& system_clock() {
  static source::SystemClock clock;
  return clock;
}

source::IRandom& system_random() {
  static source::SystemRandom random;
  return random;
}

} // namespace

Generator::Generator(GeneratorConfig cfg)
    : Generator(system_clock(), system_random(), cfg) {}

Generator::Generator(source::IClock& clock, source::IRandom& random, GeneratorConfig cfg)
    : clock_(clock), random_(random), epoch_(cfg.epoch_ms & layout::TIMESTAMP_MASK) {}

uint64_t Generator::current_timestamp() const {
  const uint64_t now = clock_.now_ms();
  return epoch_ < now ? now - epoch_ : now;
}

std::optional<EUID> Generator::create() {
  return create_with(std::nullopt);
}

std::optional<EUID> Generator::create(uint16_t extension) {
  return create_with(extension);
}

std::optional<EUID> Generator::create_with(std::optional<uint16_t> extension) {
  const uint64_t ts = current_timestamp();
  const uint64_t r0 = random_.next_u64();
  const uint64_t r1 = random_.next_u64();
  return layout::pack(ts, extension, r0, r1);
}

std::optional<EUID> Generator::next(const EUID& prev) {
  const uint64_t ts = current_timestamp();

  if (ts != prev.timestamp()) {
    // Clock moved (either way): start over, keeping the caller's tag.
    return create_with(prev.extension());
  }

  const uint32_t seq = prev.sequence();
  if (seq == SEQUENCE_MAX) return std::nullopt;

  const uint64_t lo = (static_cast<uint64_t>(seq + 1) << 32) | random_.next_u32();
  return EUID(prev.hi(), lo);
}

} // namespace euid
