#include <catch2/catch_all.hpp>
#include "flagsync/core/network/connection_monitor.hpp"
#include "flagsync/core/util/logger.hpp"
#include "manual_clock.hpp"
#include <algorithm>
#include <mutex>
#include <thread>

using namespace flagsync;

TEST_CASE("status follows request outcomes while the network is up", "[connection]") {
    ConnectionMonitor m(std::make_shared<ManualClock>());
    REQUIRE(m.status() == ConnectionStatus::Connecting);
    REQUIRE(m.isOnline());

    m.recordSuccess();
    REQUIRE(m.status() == ConnectionStatus::Connected);

    m.recordFailure("timeout");
    REQUIRE(m.status() == ConnectionStatus::Connecting);
    REQUIRE(m.info().failureCount == 1);
    REQUIRE(m.info().lastError == "timeout");

    m.recordSuccess();
    REQUIRE(m.status() == ConnectionStatus::Connected);
    REQUIRE(m.info().failureCount == 0);
}

TEST_CASE("offline mode wins over the network signal", "[connection]") {
    ConnectionMonitor m(std::make_shared<ManualClock>());
    m.setNetworkAvailable(false);
    REQUIRE(m.status() == ConnectionStatus::Disconnected);
    REQUIRE_FALSE(m.isOnline());

    m.setOfflineMode(true);
    REQUIRE(m.status() == ConnectionStatus::Offline);

    m.setNetworkAvailable(true);
    REQUIRE(m.status() == ConnectionStatus::Offline);
    REQUIRE_FALSE(m.isOnline());

    m.setOfflineMode(false);
    REQUIRE(m.isOnline());
}

TEST_CASE("network recovery clears the failure count", "[connection]") {
    ConnectionMonitor m(std::make_shared<ManualClock>());
    m.recordFailure("a");
    m.recordFailure("b");
    m.setNetworkAvailable(false);
    m.setNetworkAvailable(true);
    REQUIRE(m.info().failureCount == 0);
}

TEST_CASE("listeners fire only on status changes", "[connection]") {
    ConnectionMonitor m(std::make_shared<ManualClock>());
    std::vector<ConnectionStatus> seen;
    auto sub = m.addListener([&](ConnectionStatus s, const ConnectionInfo&) { seen.push_back(s); });

    m.recordSuccess();
    m.recordSuccess();
    m.setOfflineMode(true);
    m.setOfflineMode(true);
    REQUIRE(seen == std::vector<ConnectionStatus>{ ConnectionStatus::Connected, ConnectionStatus::Offline });

    sub.reset();
    m.setOfflineMode(false);
    REQUIRE(seen.size() == 2);
}

TEST_CASE("concurrent transitions each report their own status", "[connection][concurrency]") {
    ConnectionMonitor m(std::make_shared<ManualClock>());
    std::mutex mx;
    std::vector<ConnectionStatus> seen;
    int mismatched = 0;
    auto sub = m.addListener([&](ConnectionStatus s, const ConnectionInfo& info) {
        std::scoped_lock lk(mx);
        seen.push_back(s);
        if (s != info.status) ++mismatched;
    });
    const auto level = Logger::inst().level();
    Logger::inst().setLevel(LogLevel::Error);

    constexpr int kRounds = 2000;
    std::thread network([&] {
        for (int i = 0; i < kRounds; ++i) {
            m.setNetworkAvailable(false);
            m.setNetworkAvailable(true);
        }
    });
    std::thread offline([&] {
        for (int i = 0; i < kRounds; ++i) {
            m.setOfflineMode(true);
            m.setOfflineMode(false);
        }
    });
    network.join();
    offline.join();
    Logger::inst().setLevel(level);

    // every switch into offline mode is a transition, and only those reach Offline
    auto offlineCount = std::count(seen.begin(), seen.end(), ConnectionStatus::Offline);
    REQUIRE(offlineCount == kRounds);
    REQUIRE(mismatched == 0);
    REQUIRE(m.status() == ConnectionStatus::Connecting);
}
