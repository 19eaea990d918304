#include <doctest/doctest.h>
#include "euid/layout.hpp"

using namespace euid;

TEST_CASE("extension_bit_len is the minimal bit width") {
    CHECK(layout::extension_bit_len(0) == 0);
    CHECK(layout::extension_bit_len(1) == 1);
    CHECK(layout::extension_bit_len(2) == 2);
    CHECK(layout::extension_bit_len(3) == 2);
    CHECK(layout::extension_bit_len(42) == 6);
    CHECK(layout::extension_bit_len(0x4000) == 15);
    CHECK(layout::extension_bit_len(0x7FFF) == 15);
}

TEST_CASE("pack places every field at its documented bit position") {
    auto ts_only = layout::pack(1, std::nullopt, 0, 0);
    REQUIRE(ts_only);
    CHECK(ts_only->hi() == (1ull << 22));
    CHECK(ts_only->lo() == 0);

    // ext 7 -> region bits 7..9, length 3 at bits 3..6
    auto ext = layout::pack(0, uint16_t{7}, 0, 0xABCDull);
    REQUIRE(ext);
    CHECK(ext->hi() == ((7ull << 7) | (3ull << 3)));
    CHECK(ext->lo() == 0xABCDull);
}

TEST_CASE("pack fills the free part of the region with random padding") {
    auto id = layout::pack(1700000000000ull, uint16_t{42}, ~0ull, 0x1234);
    REQUIRE(id);

    layout::Fields f = layout::unpack(*id);
    CHECK(f.timestamp == 1700000000000ull);
    CHECK(f.has_extension());
    CHECK(f.extension == 42);
    CHECK(f.extension_len == 6);
    CHECK(f.version == layout::VERSION_FIELD);
    CHECK(f.padding == (1u << (15 - 6)) - 1);
    CHECK(f.random == 0x1234);

    // Without extension the whole region is padding.
    auto bare = layout::pack(5, std::nullopt, ~0ull, 0);
    REQUIRE(bare);
    f = layout::unpack(*bare);
    CHECK_FALSE(f.has_extension());
    CHECK(f.extension == 0);
    CHECK(f.padding == 0x7FFF);
}

TEST_CASE("pack refuses oversized fields instead of wrapping") {
    CHECK(layout::pack(layout::TIMESTAMP_MASK, std::nullopt, 0, 0).has_value());
    CHECK_FALSE(layout::pack(layout::TIMESTAMP_MASK + 1, std::nullopt, 0, 0).has_value());

    CHECK(layout::pack(0, uint16_t{0x7FFF}, 0, 0).has_value());
    CHECK_FALSE(layout::pack(0, uint16_t{0x8000}, 0, 0).has_value());
}

TEST_CASE("explicit extension 0 is the same as no extension") {
    auto zero = layout::pack(5, uint16_t{0}, 0x55, 9);
    auto none = layout::pack(5, std::nullopt, 0x55, 9);
    REQUIRE(zero);
    REQUIRE(none);
    CHECK(*zero == *none);
    CHECK_FALSE(layout::unpack(*zero).has_extension());
}

TEST_CASE("unpack is total") {
    layout::Fields f = layout::unpack(EUID(~0ull, ~0ull));
    CHECK(f.timestamp == layout::TIMESTAMP_MASK);
    CHECK(f.extension_len == 15);
    CHECK(f.extension == 0x7FFF);
    CHECK(f.padding == 0);
    CHECK(f.version == 7);
    CHECK(f.random == ~0ull);

    f = layout::unpack(EUID());
    CHECK(f.timestamp == 0);
    CHECK_FALSE(f.has_extension());
    CHECK(f.version == 0);
}

TEST_CASE("pack/unpack round-trip over the extension range") {
    for (uint32_t ext = 0; ext <= 0x7FFF; ext += 97) {
        auto id = layout::pack(123456789ull, static_cast<uint16_t>(ext), 0xDEADBEEFull, 42);
        REQUIRE(id);
        layout::Fields f = layout::unpack(*id);
        CHECK(f.timestamp == 123456789ull);
        CHECK(f.extension == ext);
        CHECK(f.extension_len == layout::extension_bit_len(static_cast<uint16_t>(ext)));
        CHECK(f.random == 42);
    }
}
