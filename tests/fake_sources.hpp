#pragma once
#include <cstdint>
#include <utility>
#include <vector>
#include "euid/source/source_base.hpp"

// ---- Test fakes ----

// Clock that only moves when told to.
class FakeClock final : public euid::source::IClock {
public:
    explicit FakeClock(uint64_t now) : now(now) {}

    uint64_t now_ms() const override { return now; }
    void advance(uint64_t ms) { now += ms; }

    uint64_t now;
};

// Replays the scripted values in order and wraps around. An empty script
// yields 0. Counts calls so tests can check how much randomness was drawn.
class ScriptedRandom final : public euid::source::IRandom {
public:
    ScriptedRandom() = default;
    explicit ScriptedRandom(std::vector<uint64_t> values) : values(std::move(values)) {}

    uint32_t next_u32() override {
        u32_calls++;
        return static_cast<uint32_t>(pull());
    }
    uint64_t next_u64() override {
        u64_calls++;
        return pull();
    }

    std::vector<uint64_t> values;
    size_t pos{0};
    int u32_calls{0};
    int u64_calls{0};

private:
    uint64_t pull() {
        if (values.empty()) return 0;
        uint64_t v = values[pos % values.size()];
        pos++;
        return v;
    }
};
