#include <catch2/catch_all.hpp>
#include "flagsync/core/config/settings_synchronizer.hpp"
#include "flagsync/core/storage/memory_store.hpp"
#include "mock_transport.hpp"
#include "manual_clock.hpp"
#include <condition_variable>
#include <future>
#include <thread>

using namespace flagsync;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

    struct Fixture {
        std::shared_ptr<MockTransport>          transport = std::make_shared<MockTransport>();
        std::shared_ptr<MemoryStore>            store     = std::make_shared<MemoryStore>();
        std::shared_ptr<ManualClock>            clock     = std::make_shared<ManualClock>();
        std::shared_ptr<CircuitBreakerRegistry> breakers  = std::make_shared<CircuitBreakerRegistry>(clock);
        std::shared_ptr<ConnectionMonitor>      connection = std::make_shared<ConnectionMonitor>(clock);

        Fixture() {
            transport->setValidators("\"v1\"");
            transport->configDoc = {
                { "hero_text", configEntry("Hi", "hero") },
                { "dark_mode", configEntry(false, "dark") }
            };
        }

        static SettingsOptions options() {
            SettingsOptions o;
            o.settingsUrl = "https://settings.test/dim/cf-sdk-settings.json";
            o.configUrl = "https://api.test/v1/users/configs?cfenc=key";
            o.checkTimeout = 5s;
            o.retry.maxAttempts = 2;
            o.retry.initialDelay = 1ms;
            o.retry.maxDelay = 1ms;
            o.retry.jitterFactor = 0.0;
            return o;
        }

        std::shared_ptr<SettingsSynchronizer> make(SettingsOptions opts = options(),
                                                   Executor ex = inlineExecutor()) {
            auto cache = std::make_shared<TTLCache<json>>(store, store, clock, inlineExecutor());
            return std::make_shared<SettingsSynchronizer>(std::move(opts), transport, store, cache,
                                                          breakers, connection, nullptr, std::move(ex));
        }
    };

}

TEST_CASE("the first cycle fetches settings and config and publishes the snapshot", "[settings]") {
    Fixture f;
    auto sync = f.make();

    REQUIRE(sync->checkSettings() == CheckResult::Updated);
    REQUIRE(f.transport->settingsFetches == 1);
    REQUIRE(f.transport->configFetches == 1);
    REQUIRE(sync->get<std::string>("hero_text", "fallback") == "Hi");
    REQUIRE(sync->get<bool>("dark_mode", true) == false);
    REQUIRE(sync->lastMetadata().etag == std::optional<std::string>("\"v1\""));
    REQUIRE(f.connection->status() == ConnectionStatus::Connected);

    auto stored = json::parse(*f.store->getString(SettingsSynchronizer::kMetadataKey));
    REQUIRE(stored["etag"] == "\"v1\"");
}

TEST_CASE("unchanged validators skip the settings and config fetches", "[settings]") {
    Fixture f;
    auto sync = f.make();
    REQUIRE(sync->checkSettings() == CheckResult::Updated);

    REQUIRE(sync->checkSettings() == CheckResult::Unchanged);
    REQUIRE(f.transport->probes == 2);
    REQUIRE(f.transport->settingsFetches == 1);
    REQUIRE(f.transport->configFetches == 1);
}

TEST_CASE("changed validators refetch and a 304 keeps the snapshot", "[settings]") {
    Fixture f;
    auto sync = f.make();
    REQUIRE(sync->checkSettings() == CheckResult::Updated);

    f.transport->setValidators("\"v2\"");
    f.transport->configNotModified = true;
    REQUIRE(sync->checkSettings() == CheckResult::Unchanged);
    REQUIRE(f.transport->configFetches == 2);
    REQUIRE(f.transport->lastEtag() == std::optional<std::string>("\"v2\""));
    REQUIRE(sync->get<std::string>("hero_text", "fallback") == "Hi");

    f.transport->setValidators("\"v3\"");
    f.transport->configNotModified = false;
    f.transport->configDoc["hero_text"] = configEntry("Hello", "hero");
    REQUIRE(sync->checkSettings() == CheckResult::Updated);
    REQUIRE(sync->get<std::string>("hero_text", "fallback") == "Hello");
}

TEST_CASE("a probe without validators aborts the cycle", "[settings]") {
    Fixture f;
    f.transport->setValidators(std::nullopt);
    auto sync = f.make();
    REQUIRE(sync->checkSettings() == CheckResult::NoMetadata);
    REQUIRE(f.transport->settingsFetches == 0);
    REQUIRE(sync->allFlags().empty());
}

TEST_CASE("disabled accounts hide every flag and skip the config fetch", "[settings]") {
    Fixture f;
    auto sync = f.make();
    REQUIRE(sync->checkSettings() == CheckResult::Updated);

    f.transport->setValidators("\"v2\"");
    f.transport->settingsDoc["cf_account_enabled"] = false;
    REQUIRE(sync->checkSettings() == CheckResult::Disabled);
    REQUIRE(f.transport->configFetches == 1);
    REQUIRE(sync->isDisabled());
    REQUIRE(sync->state() == SyncState::Disabled);
    REQUIRE(sync->allFlags().empty());
    REQUIRE(sync->get<std::string>("hero_text", "fallback") == "fallback");

    f.transport->setValidators("\"v3\"");
    f.transport->settingsDoc["cf_account_enabled"] = true;
    REQUIRE(sync->checkSettings() == CheckResult::Updated);
    REQUIRE_FALSE(sync->isDisabled());
    REQUIRE(sync->get<std::string>("hero_text", "fallback") == "Hi");
}

TEST_CASE("cf_skip_sdk disables the SDK as well", "[settings]") {
    Fixture f;
    f.transport->settingsDoc["cf_skip_sdk"] = true;
    auto sync = f.make();
    REQUIRE(sync->checkSettings() == CheckResult::Disabled);
    REQUIRE(f.transport->configFetches == 0);
}

TEST_CASE("offline mode skips the cycle entirely", "[settings]") {
    Fixture f;
    f.connection->setOfflineMode(true);
    auto sync = f.make();
    REQUIRE(sync->checkSettings() == CheckResult::Offline);
    REQUIRE(f.transport->probes == 0);
}

TEST_CASE("network failures are retried, then reported as Failed", "[settings]") {
    Fixture f;
    f.transport->failProbe = true;
    auto sync = f.make();

    REQUIRE(sync->checkSettings() == CheckResult::Failed);
    REQUIRE(f.transport->probes == 2);
    REQUIRE(f.connection->status() == ConnectionStatus::Connecting);
    REQUIRE(sync->metrics()["failures"] == 1);
}

TEST_CASE("an open breaker short-circuits later cycles", "[settings]") {
    Fixture f;
    f.transport->failProbe = true;
    auto opts = Fixture::options();
    opts.circuit.failureThreshold = 1;
    auto sync = f.make(opts);

    REQUIRE(sync->checkSettings() == CheckResult::Failed);
    int probes = f.transport->probes;
    REQUIRE(sync->checkSettings() == CheckResult::CircuitOpen);
    REQUIRE(f.transport->probes == probes);

    f.transport->failProbe = false;
    f.clock->advance(opts.circuit.halfOpenTimeoutMs);
    REQUIRE(sync->checkSettings() == CheckResult::Updated);
}

TEST_CASE("only one cycle runs at a time", "[settings]") {
    Fixture f;
    std::mutex mx;
    std::condition_variable cv;
    bool entered = false;
    bool release = false;
    f.transport->onProbe = [&] {
        std::unique_lock lk(mx);
        entered = true;
        cv.notify_all();
        cv.wait(lk, [&] { return release; });
    };

    auto pool = std::make_shared<ThreadPool>(2);
    auto sync = f.make(Fixture::options(), poolExecutor(pool));

    auto first = std::async(std::launch::async, [&] { return sync->checkSettings(); });
    {
        std::unique_lock lk(mx);
        cv.wait(lk, [&] { return entered; });
    }
    REQUIRE(sync->state() == SyncState::Checking);
    REQUIRE(sync->checkSettings() == CheckResult::AlreadyRunning);

    {
        std::scoped_lock lk(mx);
        release = true;
    }
    cv.notify_all();
    REQUIRE(first.get() == CheckResult::Updated);
    REQUIRE(f.transport->probes == 1);
    pool->join();
}

TEST_CASE("a cycle exceeding the timeout is abandoned without publishing", "[settings]") {
    Fixture f;
    std::promise<void> gate;
    auto opened = gate.get_future().share();
    f.transport->onProbe = [opened] { opened.wait(); };

    auto opts = Fixture::options();
    opts.checkTimeout = 20ms;
    auto pool = std::make_shared<ThreadPool>(2);
    auto sync = f.make(opts, poolExecutor(pool));

    REQUIRE(sync->checkSettings() == CheckResult::TimedOut);
    gate.set_value();
    pool->join();

    REQUIRE(sync->allFlags().empty());
    REQUIRE(sync->metrics()["timeouts"] == 1);
    REQUIRE(sync->state() == SyncState::Idle);
}

TEST_CASE("a background check needs only one worker", "[settings][concurrency]") {
    Fixture f;
    auto pool = std::make_shared<ThreadPool>(2);
    auto scheduler = std::make_shared<Scheduler>(pool);
    auto cache = std::make_shared<TTLCache<json>>(f.store, f.store, f.clock, inlineExecutor());
    auto sync = std::make_shared<SettingsSynchronizer>(Fixture::options(), f.transport, f.store, cache,
                                                       f.breakers, f.connection, scheduler, poolExecutor(pool));

    // an event flush stuck in its retry backoff holds the other worker
    std::promise<void> gate;
    auto busy = gate.get_future().share();
    pool->add(std::function<void()>([busy] { busy.wait(); }));

    sync->checkSettingsAsync();
    for (int i = 0; i < 400 && sync->allFlags().empty(); ++i) std::this_thread::sleep_for(5ms);
    REQUIRE(sync->get<std::string>("hero_text", "fallback") == "Hi");
    REQUIRE(sync->metrics()["timeouts"] == 0);

    gate.set_value();
    scheduler->shutdown();
    pool->join();
}

TEST_CASE("a background check past its deadline publishes nothing", "[settings][concurrency]") {
    Fixture f;
    std::promise<void> gate;
    auto opened = gate.get_future().share();
    f.transport->onProbe = [opened] { opened.wait(); };

    auto pool = std::make_shared<ThreadPool>(2);
    auto scheduler = std::make_shared<Scheduler>(pool);
    auto cache = std::make_shared<TTLCache<json>>(f.store, f.store, f.clock, inlineExecutor());
    auto opts = Fixture::options();
    opts.checkTimeout = 20ms;
    auto sync = std::make_shared<SettingsSynchronizer>(opts, f.transport, f.store, cache,
                                                       f.breakers, f.connection, scheduler, poolExecutor(pool));

    auto check = std::async(std::launch::async, [&] { return sync->checkInBackground(); });
    std::this_thread::sleep_for(100ms);
    gate.set_value();

    REQUIRE(check.get() == CheckResult::TimedOut);
    REQUIRE(sync->allFlags().empty());
    REQUIRE(sync->metrics()["timeouts"] == 1);
    REQUIRE(sync->state() == SyncState::Idle);

    scheduler->shutdown();
    pool->join();
}

TEST_CASE("cached config serves reads offline, then a check replaces it", "[settings]") {
    Fixture f;
    REQUIRE(f.make()->checkSettings() == CheckResult::Updated);

    // next process start, still offline
    f.connection->setNetworkAvailable(false);
    auto sync = f.make();
    REQUIRE(sync->hydrateFromCache());
    REQUIRE(sync->get<std::string>("hero_text", "fallback") == "Hi");
    REQUIRE(sync->checkSettings() == CheckResult::Offline);
    REQUIRE(f.transport->probes == 1);

    std::vector<std::pair<std::string, std::string>> seen;
    auto sub = sync->addListener("hero_text", [&](const std::string& k, const ConfigValue& v) {
        seen.emplace_back(k, v.as<std::string>().value_or(""));
    });

    f.connection->setNetworkAvailable(true);
    f.transport->setValidators("\"v2\"");
    f.transport->configDoc["hero_text"] = configEntry("Hello", "hero");
    REQUIRE(sync->checkSettings() == CheckResult::Updated);
    REQUIRE(sync->get<std::string>("hero_text", "fallback") == "Hello");
    REQUIRE(seen == std::vector<std::pair<std::string, std::string>>{ { "hero_text", "Hello" } });
}

TEST_CASE("hydration survives an expired cache entry", "[settings]") {
    Fixture f;
    auto opts = Fixture::options();
    opts.configCacheTtlSeconds = 1;
    REQUIRE(f.make(opts)->checkSettings() == CheckResult::Updated);

    f.clock->advance(10'000);
    auto sync = f.make(opts);
    REQUIRE(sync->hydrateFromCache());
    REQUIRE(sync->allFlags().size() == 2);
}

TEST_CASE("hydration with nothing cached reports false", "[settings]") {
    Fixture f;
    auto sync = f.make();
    REQUIRE_FALSE(sync->hydrateFromCache());
    REQUIRE(sync->get<double>("missing", 4.0) == 4.0);
}

TEST_CASE("forceRefresh refetches even when validators did not change", "[settings]") {
    Fixture f;
    auto sync = f.make();
    REQUIRE(sync->checkSettings() == CheckResult::Updated);

    f.transport->configDoc["dark_mode"] = configEntry(true, "dark");
    REQUIRE(sync->forceRefresh() == CheckResult::Updated);
    REQUIRE(f.transport->configFetches == 2);
    REQUIRE(sync->get<bool>("dark_mode", false));
}

TEST_CASE("reads with the wrong type return the fallback", "[settings]") {
    Fixture f;
    auto sync = f.make();
    sync->checkSettings();

    REQUIRE(sync->get<bool>("hero_text", true) == true);
    REQUIRE(sync->get<double>("dark_mode", 1.5) == 1.5);
    REQUIRE(sync->get<json>("hero_text", json()) == json("Hi"));
    REQUIRE(sync->getValue("missing", ConfigValue("fb")) == ConfigValue("fb"));
}

TEST_CASE("reads emit usage summaries for fully identified entries", "[settings][summary]") {
    Fixture f;
    f.transport->configDoc["anonymous"] = { { "variation", 3 } };
    auto sync = f.make();
    sync->checkSettings();

    std::vector<std::string> seen;
    sync->setSummarySink([&](const ConfigEntry& e) { seen.push_back(e.metadata.configId.value_or("")); });

    sync->get<std::string>("hero_text", "");
    sync->get<double>("anonymous", 0.0);
    sync->get<bool>("missing", false);
    REQUIRE(seen == std::vector<std::string>{ "cfg_hero" });
}

TEST_CASE("listeners fire for changed keys only", "[settings][listeners]") {
    Fixture f;
    auto sync = f.make();
    sync->checkSettings();

    std::vector<bool> dark;
    std::vector<std::string> hero;
    std::vector<json> all;
    auto s1 = sync->addTypedListener<bool>("dark_mode", [&](const bool& v) { dark.push_back(v); });
    auto s2 = sync->addTypedListener<std::string>("hero_text", [&](const std::string& v) { hero.push_back(v); });
    auto s3 = sync->addAllFlagsListener([&](const json& flags) { all.push_back(flags); });

    f.transport->setValidators("\"v2\"");
    f.transport->configDoc["dark_mode"] = configEntry(true, "dark");
    REQUIRE(sync->checkSettings() == CheckResult::Updated);

    REQUIRE(dark == std::vector<bool>{ true });
    REQUIRE(hero.empty());
    REQUIRE(all.size() == 1);
    REQUIRE(all[0]["dark_mode"] == true);
}

TEST_CASE("removed keys are reported with a null value", "[settings][listeners]") {
    Fixture f;
    auto sync = f.make();
    sync->checkSettings();

    std::vector<ConfigValue> seen;
    auto sub = sync->addListener("hero_text", [&](const std::string&, const ConfigValue& v) { seen.push_back(v); });

    f.transport->setValidators("\"v2\"");
    f.transport->configDoc.erase("hero_text");
    REQUIRE(sync->checkSettings() == CheckResult::Updated);
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].isJson());
    REQUIRE(seen[0].toJson().is_null());
}

TEST_CASE("polling can be retimed and is skipped when disabled", "[settings][polling]") {
    Fixture f;
    auto pool = std::make_shared<ThreadPool>(2);
    auto scheduler = std::make_shared<Scheduler>(pool);
    auto cache = std::make_shared<TTLCache<json>>(f.store, f.store, f.clock, inlineExecutor());

    auto opts = Fixture::options();
    opts.pollInterval = 10ms;
    auto sync = std::make_shared<SettingsSynchronizer>(opts, f.transport, f.store, cache, f.breakers,
                                                       f.connection, scheduler, inlineExecutor());
    sync->startPolling();
    for (int i = 0; i < 200 && f.transport->probes < 2; ++i) std::this_thread::sleep_for(5ms);
    REQUIRE(f.transport->probes >= 2);

    sync->setPollingInterval(1h);
    REQUIRE(sync->pollingInterval() == 1h);
    sync->stopPolling();

    opts.disableBackgroundPolling = true;
    auto quiet = std::make_shared<SettingsSynchronizer>(opts, f.transport, f.store, cache, f.breakers,
                                                        f.connection, scheduler, inlineExecutor());
    quiet->startPolling();

    scheduler->shutdown();
    pool->join();
}
