#include <catch2/catch_all.hpp>
#include "flagsync/core/session/session_lifecycle.hpp"
#include "flagsync/core/storage/memory_store.hpp"
#include "manual_clock.hpp"

using namespace flagsync;

namespace {

    constexpr uint64_t kMinute = 60 * 1000;

    struct Rotation {
        std::optional<std::string> oldId;
        std::string                newId;
        RotationReason             reason;
    };

    struct Fixture {
        std::shared_ptr<MemoryStore>   store = std::make_shared<MemoryStore>();
        std::shared_ptr<ManualClock>   clock = std::make_shared<ManualClock>();
        std::shared_ptr<SequentialIds> ids   = std::make_shared<SequentialIds>();
        std::vector<Rotation>          rotations;
        std::vector<std::string>       restored;
        std::vector<std::string>       errors;
        std::vector<Subscription>      subs;

        std::unique_ptr<SessionLifecycle> make(SessionOptions opts = {}) {
            auto s = std::make_unique<SessionLifecycle>(opts, store, clock, ids);
            SessionListener l;
            l.onRotated = [this](const std::optional<std::string>& o, const std::string& n, RotationReason r) {
                rotations.push_back({ o, n, r });
            };
            l.onRestored = [this](const std::string& id) { restored.push_back(id); };
            l.onError = [this](const std::string& msg) { errors.push_back(msg); };
            subs.push_back(s->addListener(std::move(l)));
            return s;
        }
    };

    /// Store whose writes always fail.
    class FailingStore : public MemoryStore {
    public:
        bool setString(const std::string&, const std::string&) override { return false; }
    };

}

TEST_CASE("session ids carry the prefix, the start time and 8 hex characters", "[session]") {
    Fixture f;
    auto s = f.make();
    s->start();
    auto id = s->sessionId();

    const std::string expected = "cf_session_" + std::to_string(f.clock->nowMs()) + "_00000001";
    REQUIRE(id == expected);
    REQUIRE(f.rotations.size() == 1);
    REQUIRE_FALSE(f.rotations[0].oldId);
    REQUIRE(f.rotations[0].reason == RotationReason::AppStart);
}

TEST_CASE("a restart long after the last app start rotates from the persisted id", "[session]") {
    Fixture f;
    std::string first;
    {
        auto s = f.make();
        s->start();
        first = s->sessionId();
    }
    f.rotations.clear();
    f.clock->advance(6 * kMinute);

    auto s = f.make();
    s->start();
    REQUIRE(f.rotations.size() == 1);
    REQUIRE(f.rotations[0].oldId == first);
    REQUIRE(f.rotations[0].newId != first);
    REQUIRE(f.rotations[0].reason == RotationReason::AppStart);
    REQUIRE(s->current()->appStartTime == f.clock->nowMs());
}

TEST_CASE("a quick restart restores the persisted session", "[session]") {
    Fixture f;
    std::string first;
    {
        auto s = f.make();
        s->start();
        first = s->sessionId();
    }
    f.rotations.clear();
    f.clock->advance(1 * kMinute);

    auto s = f.make();
    s->start();
    REQUIRE(f.rotations.empty());
    REQUIRE(f.restored == std::vector<std::string>{ first });
    REQUIRE(s->sessionId() == first);
}

TEST_CASE("a quick restart of a session past its maximum age rotates", "[session]") {
    Fixture f;
    SessionOptions opts;
    opts.maxSessionDurationMs = 2 * kMinute;
    {
        auto s = f.make(opts);
        s->start();
    }
    // keep the app-start marker recent so the restore path is taken
    f.clock->advance(3 * kMinute);
    f.store->setInt(SessionLifecycle::kAppStartKey, static_cast<int64_t>(f.clock->nowMs() - kMinute));
    f.rotations.clear();

    auto s = f.make(opts);
    s->start();
    REQUIRE(f.rotations.size() == 1);
    REQUIRE(f.restored.empty());
}

TEST_CASE("activity past the maximum duration rotates", "[session]") {
    Fixture f;
    auto s = f.make();
    s->start();
    f.rotations.clear();

    f.clock->advance(59 * kMinute);
    s->updateActivity();
    REQUIRE(f.rotations.empty());

    f.clock->advance(1 * kMinute);
    s->updateActivity();
    REQUIRE(f.rotations.size() == 1);
    REQUIRE(f.rotations[0].reason == RotationReason::MaxDurationExceeded);
}

TEST_CASE("time-based rotation can be disabled", "[session]") {
    Fixture f;
    SessionOptions opts;
    opts.enableTimeBasedRotation = false;
    auto s = f.make(opts);
    s->start();
    auto id = s->sessionId();

    f.clock->advance(3 * 60 * kMinute);
    s->updateActivity();
    REQUIRE(s->sessionId() == id);
    REQUIRE(s->current()->lastActiveAt == f.clock->nowMs());
}

TEST_CASE("returning from a long background rotates, a short one does not", "[session]") {
    Fixture f;
    auto s = f.make();
    s->start();
    auto id = s->sessionId();
    f.rotations.clear();

    s->onAppBackground();
    f.clock->advance(10 * kMinute);
    s->onAppForeground();
    REQUIRE(s->sessionId() == id);
    REQUIRE(f.rotations.empty());

    s->onAppBackground();
    f.clock->advance(16 * kMinute);
    s->onAppForeground();
    REQUIRE(f.rotations.size() == 1);
    REQUIRE(f.rotations[0].reason == RotationReason::BackgroundTimeout);
    REQUIRE(f.rotations[0].oldId == id);
    REQUIRE_FALSE(f.store->getInt(SessionLifecycle::kBackgroundKey).has_value());
}

TEST_CASE("authentication changes rotate only when enabled", "[session]") {
    Fixture f;
    SessionOptions opts;
    opts.rotateOnAuthChange = false;
    auto quiet = f.make(opts);
    quiet->start();
    f.rotations.clear();
    quiet->onAuthenticationChange(std::string("user-1"));
    REQUIRE(f.rotations.empty());

    auto s = f.make();
    s->start();
    f.rotations.clear();
    s->onAuthenticationChange(std::string("user-1"));
    REQUIRE(f.rotations.size() == 1);
    REQUIRE(f.rotations[0].reason == RotationReason::AuthChange);
}

TEST_CASE("network changes never rotate", "[session]") {
    Fixture f;
    auto s = f.make();
    s->start();
    auto id = s->sessionId();
    s->onNetworkChange();
    REQUIRE(s->sessionId() == id);
}

TEST_CASE("forceRotation returns and persists the new id", "[session]") {
    Fixture f;
    auto s = f.make();
    s->start();
    auto old = s->sessionId();

    auto id = s->forceRotation();
    REQUIRE(id != old);
    REQUIRE(s->sessionId() == id);
    REQUIRE(f.rotations.back().reason == RotationReason::ManualRotation);

    auto stored = nlohmann::json::parse(*f.store->getString(SessionLifecycle::kSessionKey));
    REQUIRE(stored["session_id"] == id);
    REQUIRE(stored["rotation_reason"] == "manual_rotation");
}

TEST_CASE("sessionId bootstraps a session without start()", "[session]") {
    Fixture f;
    auto s = f.make();
    auto id = s->sessionId();
    REQUIRE_FALSE(id.empty());
    REQUIRE(s->sessionId() == id);
    REQUIRE(f.rotations.size() == 1);
}

TEST_CASE("persistence failures are reported to listeners", "[session]") {
    auto store = std::make_shared<FailingStore>();
    auto s = SessionLifecycle({}, store, std::make_shared<ManualClock>(), std::make_shared<SequentialIds>());
    std::vector<std::string> errors;
    auto sub = s.addListener({ nullptr, nullptr, [&](const std::string& m) { errors.push_back(m); } });

    s.start();
    REQUIRE_FALSE(errors.empty());
    REQUIRE_FALSE(s.sessionId().empty());
}

TEST_CASE("a dropped subscription stops notifications", "[session]") {
    Fixture f;
    auto s = std::make_unique<SessionLifecycle>(SessionOptions{}, f.store, f.clock, f.ids);
    int calls = 0;
    {
        SessionListener l;
        l.onRotated = [&](const std::optional<std::string>&, const std::string&, RotationReason) { ++calls; };
        auto sub = s->addListener(std::move(l));
        s->forceRotation();
    }
    s->forceRotation();
    REQUIRE(calls == 1);
}

TEST_CASE("stats describe the active session", "[session]") {
    Fixture f;
    auto s = f.make();
    s->start();
    f.clock->advance(5000);
    auto st = s->stats();
    REQUIRE(st["hasActiveSession"] == true);
    REQUIRE(st["sessionId"] == s->sessionId());
    REQUIRE(st["sessionAge"] == 5000);
    REQUIRE(st["lastActiveAge"] == 5000);
    REQUIRE(st["listenersCount"] == 3);
}
