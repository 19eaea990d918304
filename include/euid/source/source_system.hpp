#pragma once
/**
 * @file source_system.hpp
 * @brief Default clock and random sources backed by the standard library
 *        (header-only).
 *
 * SystemClock reads std::chrono::system_clock. SystemRandom keeps one
 * std::random_device per thread, so generators on different threads share
 * no state. If the device throws, the draw degrades to 0.
 */

#include "euid/source/source_base.hpp"
#include <chrono>
#include <exception>
#include <random>

namespace euid::source {

class SystemClock : public IClock {
public:
  uint64_t now_ms() const override {
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch());
    return static_cast<uint64_t>(ms.count());
  }
};

class SystemRandom : public IRandom {
public:
  uint32_t next_u32() override {
    try {
      return static_cast<uint32_t>(device()());
    } catch (const std::exception&) {
      return 0;
    }
  }

  uint64_t next_u64() override {
    try {
      std::random_device& rd = device();
      const uint64_t hi = static_cast<uint32_t>(rd());
      const uint64_t lo = static_cast<uint32_t>(rd());
      return (hi << 32) | lo;
    } catch (const std::exception&) {
      return 0;
    }
  }

private:
  static std::random_device& device() {
    static thread_local std::random_device rd;
    return rd;
  }
};

} // namespace euid::source
