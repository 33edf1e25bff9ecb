/**
 * @file client.hpp
 * @brief Client class: owns and wires every flagsync component.
 *
 * The Client is the entry point applications use. It reads flags from the
 * settings synchronizer, tracks events and usage summaries through two
 * delivery queues, keeps the session current and reacts to host signals
 * (network, background, battery).
 */
#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "flagsync/core/cache/ttl_cache.hpp"
#include "flagsync/core/client_options.hpp"
#include "flagsync/core/config/settings_synchronizer.hpp"
#include "flagsync/core/delivery/delivery_queue.hpp"
#include "flagsync/core/delivery/event.hpp"
#include "flagsync/core/delivery/summary.hpp"
#include "flagsync/core/interfaces/iid_source.hpp"
#include "flagsync/core/interfaces/istore.hpp"
#include "flagsync/core/interfaces/itransport.hpp"
#include "flagsync/core/network/connection_monitor.hpp"
#include "flagsync/core/resilience/circuit_breaker.hpp"
#include "flagsync/core/session/session_lifecycle.hpp"
#include "flagsync/core/util/scheduler.hpp"
#include "flagsync/core/util/thread_pool.hpp"

namespace flagsync {

    using EventQueue   = DeliveryQueue<Event, EventTraits>;
    using SummaryQueue = DeliveryQueue<Summary, SummaryTraits>;

    /**
     * @struct ClientDeps
     * @brief Host-provided collaborators. Only transport is required.
     */
    struct ClientDeps {
        std::shared_ptr<ITransport>     transport;
        std::shared_ptr<IKeyValueStore> store;     ///< Defaults to a MemoryStore
        std::shared_ptr<IBlobStore>     blobs;     ///< Defaults to the store when it is a MemoryStore
        std::shared_ptr<IClock>         clock;     ///< Defaults to SystemClock
        std::shared_ptr<IIdSource>      ids;       ///< Defaults to RandomIdSource
        Executor                        executor;  ///< Background work; defaults to the client's pool
    };

    /**
     * @class Client
     * @brief Feature flag and analytics client.
     *
     * Example:
     * @code
     * flagsync::Client client(opts, { myTransport });
     * client.start();
     * if (client.getBoolean("new_checkout", false)) { ... }
     * client.trackEvent("checkout_opened", {{"step", 1}});
     * @endcode
     */
    class Client {
    public:
        static constexpr const char* kSdkVersion        = "1.0.0";
        static constexpr const char* kEventsStoreKey    = "cf_pending_events";
        static constexpr const char* kSummariesStoreKey = "cf_pending_summaries";
        static constexpr const char* kEventsBreaker     = "event_delivery";
        static constexpr const char* kSummariesBreaker  = "summary_delivery";

        /**
         * @brief Build and wire the client. Nothing touches the network yet.
         * @throws std::invalid_argument when the options fail validation or
         *         no transport is given
         */
        Client(ClientOptions opts, ClientDeps deps);

        /**
         * @brief Destructor. Calls shutdown().
         */
        ~Client();

        Client(const Client&) = delete;
        Client& operator=(const Client&) = delete;

        /**
         * @brief Hydrate flags from cache, start the session, reload pending
         *        items, start timers and schedule the first settings check.
         */
        void start();

        /**
         * @brief Stop timers, flush once when online, persist what is left
         *        and join the workers. Idempotent.
         */
        void shutdown();

        /*──────────── flags ────────────*/

        bool getBoolean(const std::string& key, bool fallback);
        double getNumber(const std::string& key, double fallback);
        std::string getString(const std::string& key, const std::string& fallback);
        nlohmann::json getJson(const std::string& key, const nlohmann::json& fallback);
        ConfigValue getValue(const std::string& key, const ConfigValue& fallback);

        /// Every flag as key -> variation; empty while the SDK is disabled.
        nlohmann::json allFlags() const;

        Subscription addFlagListener(const std::string& key, SettingsSynchronizer::KeyListener l);

        template<typename T>
        Subscription addTypedFlagListener(const std::string& key, std::function<void(const T&)> l) {
            return settings_->addTypedListener<T>(key, std::move(l));
        }

        Subscription addAllFlagsListener(SettingsSynchronizer::AllFlagsListener l);

        /*──────────── analytics ────────────*/

        /**
         * @brief Queue an event stamped with a new id, the time and the session.
         * @return Validation error for a blank name or non-object properties
         */
        Result<void> trackEvent(const std::string& name,
                                nlohmann::json properties = nlohmann::json::object());

        /// Queue a usage summary; user, session and time are filled in when absent.
        Result<void> pushSummary(Summary summary);

        Result<void> flushEvents();
        Result<void> flushSummaries();

        /*──────────── session & user ────────────*/

        std::string sessionId();
        std::string rotateSession();
        void onUserAuthenticationChanged(const std::optional<std::string>& userId);

        void setUser(UserContext user);
        UserContext user() const;

        /*──────────── host signals ────────────*/

        void onAppBackground();
        void onAppForeground();
        void setNetworkAvailable(bool available);
        void setBatteryState(bool low, bool charging);
        void setOfflineMode(bool offline);

        /*──────────── settings ────────────*/

        CheckResult checkSettings();
        CheckResult forceRefresh();
        void setPollingInterval(std::chrono::milliseconds interval);

        /// Queue sizes, totals, breaker state, connection and session stats.
        nlohmann::json metrics() const;

        SettingsSynchronizer& settings() { return *settings_; }
        ConnectionMonitor& connection() { return *connection_; }
        SessionLifecycle& session() { return *session_; }
        CircuitBreakerRegistry& breakers() { return *breakers_; }
        const ClientOptions& options() const { return opts_; }

        size_t pendingEvents() const { return events_->size(); }
        size_t pendingSummaries() const { return summaries_->size(); }

    private:
        template<typename T, typename Traits>
        Result<void> transmit(const std::string& url, const char* breaker, const std::vector<T>& items);

        void onConnectionChanged(ConnectionStatus status);
        void applyPollingInterval();

        ClientOptions                 opts_;
        std::shared_ptr<ITransport>   transport_;
        std::shared_ptr<IKeyValueStore> store_;
        std::shared_ptr<IBlobStore>   blobs_;
        std::shared_ptr<IClock>       clock_;
        std::shared_ptr<IIdSource>    ids_;

        std::shared_ptr<ThreadPool>   pool_;
        std::shared_ptr<Scheduler>    scheduler_;
        Executor                      executor_;
        RetryPolicy                   retry_;

        std::shared_ptr<ConnectionMonitor>         connection_;
        std::shared_ptr<CircuitBreakerRegistry>    breakers_;
        std::shared_ptr<TTLCache<nlohmann::json>>  cache_;
        std::shared_ptr<SettingsSynchronizer>      settings_;
        std::unique_ptr<SessionLifecycle>          session_;
        std::shared_ptr<SummaryQueue>              summaries_;
        std::shared_ptr<EventQueue>                events_;

        mutable std::mutex userMx_;
        UserContext        user_;

        std::atomic<bool> started_{ false };
        std::atomic<bool> stopped_{ false };
        std::atomic<bool> wasOnline_{ true };
        std::atomic<bool> background_{ false };
        std::atomic<bool> batteryLow_{ false };

        Subscription connectionSub_;
        TaskHandle   sweepTimer_;
    };

}
