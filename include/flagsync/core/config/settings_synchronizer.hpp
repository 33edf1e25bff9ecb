/**
 * @file settings_synchronizer.hpp
 * @brief Keeps the live flag snapshot in sync with the remote settings.
 *
 * A check cycle probes the settings document's validators, fetches the
 * settings (account enablement) and the config document only when they
 * changed, and atomically swaps in the new snapshot. Cycles are single-flight,
 * run under a timeout, and go through the "sdk_settings_fetch" circuit breaker
 * around a retry policy. Network failures end the cycle quietly; readers keep
 * seeing the previous snapshot.
 *
 * Must be owned by a std::shared_ptr (cycles and timers hold weak or shared
 * references to it).
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <nlohmann/json.hpp>
#include "flagsync/core/cache/ttl_cache.hpp"
#include "flagsync/core/config/config_value.hpp"
#include "flagsync/core/interfaces/istore.hpp"
#include "flagsync/core/interfaces/itransport.hpp"
#include "flagsync/core/network/connection_monitor.hpp"
#include "flagsync/core/resilience/circuit_breaker.hpp"
#include "flagsync/core/resilience/retry_policy.hpp"
#include "flagsync/core/util/listeners.hpp"
#include "flagsync/core/util/scheduler.hpp"
#include "flagsync/core/util/thread_pool.hpp"

namespace flagsync {

    enum class SyncState : uint8_t { Idle, Checking, Disabled };

    const char* toString(SyncState s);

    /**
     * @enum CheckResult
     * @brief How a checkSettings() call ended. Informational only.
     */
    enum class CheckResult : uint8_t {
        AlreadyRunning, ///< Another cycle was in flight, nothing done
        Offline,        ///< Offline mode, cycle skipped
        NoMetadata,     ///< Probe returned no validators, cycle aborted
        Unchanged,      ///< Validators unchanged (or config answered 304)
        Updated,        ///< A new snapshot was swapped in
        Disabled,       ///< Settings disable the SDK, config not fetched
        CircuitOpen,    ///< Breaker rejected the cycle
        Failed,         ///< Network or validation failure after retries
        TimedOut        ///< Cycle exceeded the check timeout
    };

    const char* toString(CheckResult r);

    struct SettingsOptions {
        std::string               settingsUrl;                 ///< <settingsBase>/<dimensionId>/cf-sdk-settings.json
        std::string               configUrl;                   ///< Config document endpoint
        std::chrono::milliseconds checkTimeout{ 10000 };
        uint64_t                  configCacheTtlSeconds{ 86400 };
        std::chrono::milliseconds pollInterval{ 300000 };
        bool                      disableBackgroundPolling{ false };
        RetryOptions              retry;
        CircuitOptions            circuit;
    };

    class SettingsSynchronizer : public std::enable_shared_from_this<SettingsSynchronizer> {
    public:
        static constexpr const char* kBreakerName    = "sdk_settings_fetch";
        static constexpr const char* kConfigCacheKey = "cf_config_snapshot";
        static constexpr const char* kMetadataKey    = "cf_sdk_settings_metadata";

        using KeyListener = std::function<void(const std::string&, const ConfigValue&)>;
        using AllFlagsListener = std::function<void(const nlohmann::json&)>;
        using SummarySink = std::function<void(const ConfigEntry&)>;

        SettingsSynchronizer(SettingsOptions opts,
                             std::shared_ptr<ITransport> transport,
                             std::shared_ptr<IKeyValueStore> store,
                             std::shared_ptr<TTLCache<nlohmann::json>> cache,
                             std::shared_ptr<CircuitBreakerRegistry> breakers,
                             std::shared_ptr<ConnectionMonitor> connection,
                             std::shared_ptr<Scheduler> scheduler,
                             Executor executor);

        ~SettingsSynchronizer();

        /**
         * @brief Load the cached config document into the live snapshot.
         *
         * Runs before any network call. Invalid entries are discarded; an
         * unreadable document is removed from the cache.
         * @return true when a non-empty snapshot was restored
         */
        bool hydrateFromCache();

        /**
         * @brief Run one check cycle and wait for it (at most checkTimeout).
         *
         * The cycle runs on the executor while the caller blocks, so this is
         * for API callers, not for pool tasks. Never throws and never reports
         * network failures as errors.
         */
        CheckResult checkSettings();

        /// Run a check cycle on the scheduler without waiting for it.
        void checkSettingsAsync();

        /**
         * @brief Run one check cycle on the calling thread.
         *
         * Used by the polling timer and checkSettingsAsync() so that a check
         * occupies a single worker. checkTimeout is enforced through the
         * scheduler: once it passes the cycle stops at its next checkpoint
         * and nothing it fetched is applied.
         */
        CheckResult checkInBackground();

        /// Forget stored validators so the next cycle refetches, then check now.
        CheckResult forceRefresh();

        /// Start the periodic check timer (no-op when background polling is disabled).
        void startPolling();
        void stopPolling();

        /// Replace the periodic timer. The old timer stops before the new one starts.
        void setPollingInterval(std::chrono::milliseconds interval);
        std::chrono::milliseconds pollingInterval() const;

        /**
         * @brief Read a flag.
         * @param typeCheck Optional predicate the value must satisfy
         * @return The flag's value, or fallback when missing, disabled or rejected
         */
        ConfigValue getValue(const std::string& key,
                             const ConfigValue& fallback,
                             const std::function<bool(const ConfigValue&)>& typeCheck = {});

        /// Typed read; the value must carry T's tag.
        template<typename T>
        T get(const std::string& key, T fallback);

        /// Flag map (key -> variation), empty while disabled.
        nlohmann::json allFlags() const;

        SnapshotPtr snapshot() const;
        SyncState state() const;
        bool isDisabled() const { return disabled_.load(); }
        HttpMetadata lastMetadata() const;

        Subscription addListener(const std::string& key, KeyListener l);

        /// Listener invoked only with values carrying T's tag.
        template<typename T>
        Subscription addTypedListener(const std::string& key, std::function<void(const T&)> l);

        Subscription addAllFlagsListener(AllFlagsListener l) { return allFlagsListeners_.add(std::move(l)); }

        /// Destination of usage summaries emitted by reads.
        void setSummarySink(SummarySink sink);

        nlohmann::json metrics() const;

    private:
        /// Output of the network phase of a cycle.
        struct CycleData {
            HttpMetadata                  metadata;
            bool                          changed{ false };
            std::optional<bool>           enabled;         ///< Set when settings were fetched
            std::optional<ParsedConfig>   config;          ///< Set when a new config was fetched
            nlohmann::json                configDoc;
        };

        /// Snapshot lookup shared by the read paths; emits the usage summary on a hit.
        std::optional<ConfigValue> read(const std::string& key,
                                        const std::function<bool(const ConfigValue&)>& typeCheck);

        Result<CycleData> fetchPhase(std::stop_token stop);
        CheckResult applyPhase(CycleData data, std::stop_token stop);
        CheckResult runCycle(std::stop_token stop);

        Result<bool> fetchEnablement();
        Result<std::optional<nlohmann::json>> fetchConfig(const HttpMetadata& meta);

        void loadStoredMetadata();
        void persistMetadata(const HttpMetadata& meta);
        void notifyChanged(const std::vector<std::string>& keys, const SnapshotPtr& snap);
        void emitSummary(const ConfigEntry& e);

        SettingsOptions                            opts_;
        std::shared_ptr<ITransport>                transport_;
        std::shared_ptr<IKeyValueStore>            store_;
        std::shared_ptr<TTLCache<nlohmann::json>>  cache_;
        std::shared_ptr<CircuitBreakerRegistry>    breakers_;
        std::shared_ptr<ConnectionMonitor>         connection_;
        std::shared_ptr<Scheduler>                 scheduler_;
        Executor                                   executor_;
        RetryPolicy                                retry_;

        mutable std::mutex   snapMx_;
        SnapshotPtr          snapshot_;
        HttpMetadata         lastMetadata_;
        bool                 settingsFetched_{ false };

        std::atomic<bool>    inFlight_{ false };
        std::atomic<bool>    disabled_{ false };

        mutable std::mutex        timerMx_;
        TaskHandle                timer_;
        TaskHandle                oneShot_;
        std::chrono::milliseconds interval_;

        mutable std::mutex                  listenerMx_;
        std::map<std::string, std::shared_ptr<ListenerList<std::string, ConfigValue>>> keyListeners_;
        ListenerList<nlohmann::json>        allFlagsListeners_;

        mutable std::mutex  sinkMx_;
        SummarySink         summarySink_;

        std::atomic<uint64_t> cycles_{ 0 };
        std::atomic<uint64_t> updates_{ 0 };
        std::atomic<uint64_t> failures_{ 0 };
        std::atomic<uint64_t> timeouts_{ 0 };
    };

    template<typename T>
    T SettingsSynchronizer::get(const std::string& key, T fallback)
    {
        auto v = read(key, [](const ConfigValue& cv) { return cv.template as<T>().has_value(); });
        if (!v) return fallback;
        auto typed = v->template as<T>();
        return typed ? *typed : fallback;
    }

    template<typename T>
    Subscription SettingsSynchronizer::addTypedListener(const std::string& key, std::function<void(const T&)> l)
    {
        return addListener(key, [l = std::move(l)](const std::string&, const ConfigValue& v) {
            if (auto typed = v.template as<T>()) l(*typed);
        });
    }

}
