#pragma once
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <string>
#include "flagsync/core/interfaces/iid_source.hpp"
#include "flagsync/core/util/time.hpp"

using namespace flagsync;

/// Clock the test moves by hand.
class ManualClock : public IClock {
public:
    explicit ManualClock(uint64_t start = 1'700'000'000'000ULL) : now_(start) {}

    uint64_t nowMs() const override { return now_.load(); }

    void advance(uint64_t ms) { now_ += ms; }
    void set(uint64_t ms) { now_ = ms; }

private:
    std::atomic<uint64_t> now_;
};

/// Deterministic ids: "0000000N-0000-4000-8000-00000000000N".
class SequentialIds : public IIdSource {
public:
    std::string uuid() override {
        char buf[40];
        unsigned n = ++next_;
        std::snprintf(buf, sizeof(buf), "%08x-0000-4000-8000-%012x", n, n);
        return buf;
    }

private:
    std::atomic<unsigned> next_{ 0 };
};
