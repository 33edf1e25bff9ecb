#include <catch2/catch_all.hpp>
#include "flagsync/core/resilience/circuit_breaker.hpp"
#include "manual_clock.hpp"

using namespace flagsync;

static CircuitOptions breakerOpts(uint32_t threshold = 3) {
    CircuitOptions o;
    o.failureThreshold = threshold;
    o.resetTimeoutMs = 30000;
    o.halfOpenTimeoutMs = 30000;
    return o;
}

static Result<int> fail() { return Error::network("down"); }
static Result<int> succeed() { return 1; }

TEST_CASE("breaker opens after threshold failures and short-circuits", "[breaker]") {
    auto clock = std::make_shared<ManualClock>();
    CircuitBreaker cb("test", breakerOpts(3), clock);

    for (int i = 0; i < 3; ++i) REQUIRE_FALSE(cb.execute<int>(&fail).ok());
    REQUIRE(cb.state() == CircuitState::Open);

    int invoked = 0;
    auto r = cb.execute<int>([&]() -> Result<int> { ++invoked; return 1; });
    REQUIRE(invoked == 0);
    REQUIRE(r.error().kind == ErrorKind::CircuitOpen);
}

TEST_CASE("an open breaker returns the fallback without calling the operation", "[breaker]") {
    auto clock = std::make_shared<ManualClock>();
    CircuitBreaker cb("fb", breakerOpts(1), clock);
    REQUIRE_FALSE(cb.execute<int>(&fail).ok());

    auto r = cb.execute<int>(&succeed, 99);
    REQUIRE(r.ok());
    REQUIRE(r.value() == 99);
}

TEST_CASE("half-open allows a single trial which closes on success", "[breaker]") {
    auto clock = std::make_shared<ManualClock>();
    CircuitBreaker cb("trial", breakerOpts(1), clock);
    REQUIRE_FALSE(cb.execute<int>(&fail).ok());
    REQUIRE(cb.state() == CircuitState::Open);

    clock->advance(30000);
    REQUIRE(cb.state() == CircuitState::HalfOpen);

    REQUIRE(cb.tryAcquire());
    REQUIRE_FALSE(cb.tryAcquire());   // trial already in flight
    cb.onSuccess();

    auto snap = cb.snapshot();
    REQUIRE(snap.state == CircuitState::Closed);
    REQUIRE(snap.failureCount == 0);
}

TEST_CASE("a failed trial reopens the breaker for another full timeout", "[breaker]") {
    auto clock = std::make_shared<ManualClock>();
    CircuitBreaker cb("reopen", breakerOpts(1), clock);
    REQUIRE_FALSE(cb.execute<int>(&fail).ok());

    clock->advance(30000);
    REQUIRE_FALSE(cb.execute<int>(&fail).ok());
    REQUIRE(cb.state() == CircuitState::Open);

    clock->advance(29999);
    REQUIRE(cb.state() == CircuitState::Open);
    clock->advance(1);
    REQUIRE(cb.state() == CircuitState::HalfOpen);
    REQUIRE(cb.execute<int>(&succeed).ok());
    REQUIRE(cb.state() == CircuitState::Closed);
}

TEST_CASE("failures spread beyond the reset window do not open the breaker", "[breaker]") {
    auto clock = std::make_shared<ManualClock>();
    CircuitBreaker cb("window", breakerOpts(3), clock);

    REQUIRE_FALSE(cb.execute<int>(&fail).ok());
    REQUIRE_FALSE(cb.execute<int>(&fail).ok());
    clock->advance(30001);
    REQUIRE_FALSE(cb.execute<int>(&fail).ok());

    auto snap = cb.snapshot();
    REQUIRE(snap.state == CircuitState::Closed);
    REQUIRE(snap.failureCount == 1);
}

TEST_CASE("a success resets the failure count", "[breaker]") {
    auto clock = std::make_shared<ManualClock>();
    CircuitBreaker cb("count", breakerOpts(3), clock);
    REQUIRE_FALSE(cb.execute<int>(&fail).ok());
    REQUIRE_FALSE(cb.execute<int>(&fail).ok());
    REQUIRE(cb.execute<int>(&succeed).ok());
    REQUIRE_FALSE(cb.execute<int>(&fail).ok());
    REQUIRE(cb.state() == CircuitState::Closed);
    REQUIRE(cb.snapshot().failureCount == 1);
}

TEST_CASE("exceptions count as failures", "[breaker]") {
    auto clock = std::make_shared<ManualClock>();
    CircuitBreaker cb("throws", breakerOpts(1), clock);
    auto r = cb.execute<int>([]() -> Result<int> { throw std::runtime_error("boom"); });
    REQUIRE(r.error().kind == ErrorKind::Internal);
    REQUIRE(cb.state() == CircuitState::Open);
}

TEST_CASE("registry returns one breaker per name and keeps names isolated", "[breaker][registry]") {
    auto clock = std::make_shared<ManualClock>();
    CircuitBreakerRegistry reg(clock);

    auto a1 = reg.getOrCreate("a", breakerOpts(1));
    auto a2 = reg.getOrCreate("a", breakerOpts(5));
    auto b  = reg.getOrCreate("b", breakerOpts(1));
    REQUIRE(a1 == a2);
    REQUIRE(a1->options().failureThreshold == 1);
    REQUIRE(reg.size() == 2);

    REQUIRE_FALSE(a1->execute<int>(&fail).ok());
    REQUIRE(a1->state() == CircuitState::Open);
    REQUIRE(b->state() == CircuitState::Closed);
    REQUIRE(reg.find("missing") == nullptr);

    reg.reset();
    REQUIRE(reg.size() == 0);
    REQUIRE(reg.getOrCreate("a")->state() == CircuitState::Closed);
}
