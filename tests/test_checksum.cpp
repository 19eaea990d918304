#include <doctest/doctest.h>
#include "euid/checksum.hpp"

using namespace euid;

namespace {

// 2^64 = 2^(7*9+1) ≡ 2 (mod 127)
uint8_t reference_mod127(uint64_t hi, uint64_t lo) {
    return static_cast<uint8_t>(((hi % 127) * 2 + lo % 127) % 127);
}

uint64_t lcg(uint64_t& s) {
    s = s * 6364136223846793005ull + 1442695040888963407ull;
    return s;
}

} // namespace

TEST_CASE("checksum of small values is the value mod 127") {
    CHECK(checksum::compute(0, 0)   == 0);
    CHECK(checksum::compute(0, 1)   == 1);
    CHECK(checksum::compute(0, 126) == 126);
    CHECK(checksum::compute(0, 127) == 0);   // final 127 reported as 0
    CHECK(checksum::compute(0, 128) == 1);
    CHECK(checksum::compute(1, 0)   == 2);   // 2^64
}

TEST_CASE("checksum of all ones") {
    // 2^128 - 1 = 4 - 1 (mod 127)
    CHECK(checksum::compute(~0ull, ~0ull) == 3);
}

TEST_CASE("checksum matches plain modular arithmetic and never hits the sentinel") {
    uint64_t s = 0xC0FFEE;
    for (int i = 0; i < 2000; ++i) {
        const uint64_t hi = lcg(s);
        const uint64_t lo = lcg(s);
        const uint8_t c = checksum::compute(hi, lo);
        CHECK(c == reference_mod127(hi, lo));
        CHECK(c < checksum::NONE);
    }
}

TEST_CASE("any single-bit flip changes the checksum") {
    const uint64_t hi = 0x0123456789ABCDEFull;
    const uint64_t lo = 0xFEDCBA9876543210ull;
    const uint8_t base = checksum::compute(hi, lo);

    for (int bit = 0; bit < 64; ++bit) {
        CHECK(checksum::compute(hi ^ (1ull << bit), lo) != base);
        CHECK(checksum::compute(hi, lo ^ (1ull << bit)) != base);
    }
}
