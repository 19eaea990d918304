#include <doctest/doctest.h>
#include <string>
#include "euid/base32.hpp"
#include "euid/generator.hpp"
#include "euid/layout.hpp"
#include "fake_sources.hpp"

using namespace euid;

namespace {
constexpr uint64_t NOW = 1700000000000ull;
}

TEST_CASE("create() packs the clock reading and two random draws") {
    FakeClock clock(NOW);
    ScriptedRandom rnd({0x7FFFull, 0x0000000500000009ull});
    Generator gen(clock, rnd);

    auto id = gen.create();
    REQUIRE(id);
    CHECK(id->timestamp() == NOW);
    CHECK_FALSE(id->extension().has_value());
    CHECK(id->version() == 1);
    CHECK(id->lo() == 0x0000000500000009ull);
    CHECK(id->sequence() == 5);
    CHECK(layout::unpack(*id).padding == 0x7FFF);
    CHECK(rnd.u64_calls == 2);
}

TEST_CASE("extension boundary") {
    FakeClock clock(NOW);
    ScriptedRandom rnd({0x1234ull, 0x5678ull});
    Generator gen(clock, rnd);

    auto max = gen.create(32767);
    REQUIRE(max);
    REQUIRE(max->extension().has_value());
    CHECK(*max->extension() == 32767);
    CHECK(max->extension_len() == 15);

    auto back = base32::decode(max->encode().c_str());
    REQUIRE(back.ok());
    CHECK(back.id == *max);
    CHECK(*back.id.extension() == 32767);

    CHECK_FALSE(gen.create(32768).has_value());

    auto zero = gen.create(0);
    REQUIRE(zero);
    CHECK_FALSE(zero->extension().has_value());
}

TEST_CASE("epoch offset is subtracted from the clock") {
    FakeClock clock(NOW);
    ScriptedRandom rnd;
    GeneratorConfig cfg;
    cfg.epoch_ms = NOW - 1000;
    Generator gen(clock, rnd, cfg);

    CHECK(gen.epoch() == NOW - 1000);
    CHECK(gen.current_timestamp() == 1000);

    auto id = gen.create();
    REQUIRE(id);
    CHECK(id->timestamp() == 1000);
    CHECK(id->timestamp_with_epoch(gen.epoch()) == NOW);
}

TEST_CASE("epoch at or after the clock falls back to the raw clock") {
    FakeClock clock(NOW);
    ScriptedRandom rnd;

    GeneratorConfig later;
    later.epoch_ms = NOW + 1;
    Generator g1(clock, rnd, later);
    CHECK(g1.current_timestamp() == NOW);

    GeneratorConfig same;
    same.epoch_ms = NOW;
    Generator g2(clock, rnd, same);
    CHECK(g2.current_timestamp() == NOW);
}

TEST_CASE("epoch is masked to 42 bits") {
    FakeClock clock(NOW);
    ScriptedRandom rnd;
    GeneratorConfig cfg;
    cfg.epoch_ms = (1ull << 42) + 5;
    Generator gen(clock, rnd, cfg);

    CHECK(gen.epoch() == 5);
    CHECK(gen.current_timestamp() == NOW - 5);
}

TEST_CASE("timestamp beyond 42 bits makes generation fail") {
    ScriptedRandom rnd;

    FakeClock edge(layout::TIMESTAMP_MASK);
    Generator ok(edge, rnd);
    CHECK(ok.create().has_value());

    FakeClock past(layout::TIMESTAMP_MASK + 1);
    Generator exhausted(past, rnd);
    CHECK_FALSE(exhausted.create().has_value());
    CHECK_FALSE(exhausted.create(1).has_value());
}

TEST_CASE("next() within the same millisecond bumps the sequence") {
    FakeClock clock(NOW);
    ScriptedRandom rnd({0x0ull, 0x00000001AAAAAAAAull, 0xBBBBBBBBull});
    Generator gen(clock, rnd);

    auto a = gen.create(9);
    REQUIRE(a);
    CHECK(a->sequence() == 1);

    auto b = gen.next(*a);
    REQUIRE(b);
    CHECK(*b > *a);
    CHECK(b->hi() == a->hi());
    CHECK(b->sequence() == 2);
    CHECK(static_cast<uint32_t>(b->lo()) == 0xBBBBBBBBu);
    CHECK(*b->extension() == 9);
    CHECK(rnd.u32_calls == 1);
}

TEST_CASE("next() produces a strictly increasing run") {
    FakeClock clock(NOW);
    ScriptedRandom rnd({0x3ull, 0x00000010FFFFFFFFull, 0x0ull, 0xFFFFFFFFull, 0x12345678ull});
    Generator gen(clock, rnd);

    auto prev = gen.create();
    REQUIRE(prev);
    for (int i = 0; i < 1000; ++i) {
        auto succ = gen.next(*prev);
        REQUIRE(succ);
        CHECK(*succ > *prev);
        CHECK(std::string(succ->encode().c_str()) > std::string(prev->encode().c_str()));
        prev = succ;
    }
}

TEST_CASE("next() stops when the sequence is exhausted") {
    FakeClock clock(NOW);
    ScriptedRandom rnd({0x1ull});
    Generator gen(clock, rnd);

    auto start = layout::pack(NOW, std::nullopt, 0, 0xFFFFFFFE00000000ull);
    REQUIRE(start);

    auto last = gen.next(*start);
    REQUIRE(last);
    CHECK(last->sequence() == 0xFFFFFFFFu);

    CHECK_FALSE(gen.next(*last).has_value());
}

TEST_CASE("next() after the clock moved starts over with the same extension") {
    FakeClock clock(NOW);
    ScriptedRandom rnd({0x0ull, 0xFFFFFFFFFFFFFFFFull});
    Generator gen(clock, rnd);

    auto a = gen.create(42);
    REQUIRE(a);
    CHECK(a->sequence() == 0xFFFFFFFFu);

    // Exhausted in this ms, but the next ms is a fresh start.
    clock.advance(1);
    auto b = gen.next(*a);
    REQUIRE(b);
    CHECK(b->timestamp() == NOW + 1);
    REQUIRE(b->extension().has_value());
    CHECK(*b->extension() == 42);
    CHECK(*b > *a);

    auto plain = gen.create();
    REQUIRE(plain);
    clock.advance(1);
    auto c = gen.next(*plain);
    REQUIRE(c);
    CHECK_FALSE(c->extension().has_value());
}

TEST_CASE("next() after the clock went backwards uses the new reading") {
    FakeClock clock(NOW);
    ScriptedRandom rnd({0x0ull, 0x1ull});
    Generator gen(clock, rnd);

    auto a = gen.create();
    REQUIRE(a);
    clock.now = NOW - 10;
    auto b = gen.next(*a);
    REQUIRE(b);
    CHECK(b->timestamp() == NOW - 10);
}

TEST_CASE("default generator uses the system sources") {
    Generator gen;
    CHECK(gen.epoch() == 0);

    auto a = gen.create();
    REQUIRE(a);
    CHECK(a->timestamp() > NOW);   // later than Nov 2023
    CHECK(a->version() == 1);

    auto b = gen.next(*a);
    REQUIRE(b);
    CHECK(*b > *a);
}
