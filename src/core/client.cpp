#include "flagsync/core/client.hpp"
#include <algorithm>
#include <stdexcept>
#include "flagsync/core/storage/memory_store.hpp"
#include "flagsync/core/util/logger.hpp"

namespace flagsync {

    namespace {

        RetryOptions retryOptions(const ClientOptions& o)
        {
            RetryOptions r;
            r.maxAttempts  = o.maxRetryAttempts;
            r.initialDelay = std::chrono::milliseconds(o.retryInitialDelayMs);
            r.maxDelay     = std::chrono::milliseconds(o.retryMaxDelayMs);
            r.multiplier   = o.retryBackoffMultiplier;
            r.jitterFactor = o.retryJitterFactor;
            return r;
        }

        CircuitOptions circuitOptions(const ClientOptions& o)
        {
            CircuitOptions c;
            c.failureThreshold  = o.circuitFailureThreshold;
            c.resetTimeoutMs    = o.circuitResetTimeoutMs;
            c.halfOpenTimeoutMs = o.circuitHalfOpenTimeoutMs;
            return c;
        }

        void logFlush(const char* what, const Result<void>& r)
        {
            if (!r.ok()) LOG_WARN(std::string("[Client] ") + what + " flush failed: " + r.error().describe());
        }

    }

    Client::Client(ClientOptions opts, ClientDeps deps)
        : opts_(std::move(opts)),
          transport_(std::move(deps.transport)),
          store_(std::move(deps.store)),
          blobs_(std::move(deps.blobs)),
          clock_(deps.clock ? std::move(deps.clock) : std::make_shared<SystemClock>()),
          ids_(deps.ids ? std::move(deps.ids) : std::make_shared<RandomIdSource>()),
          retry_(retryOptions(opts_))
    {
        opts_.validate();
        if (!transport_) throw std::invalid_argument("Client: a transport is required");
        Logger::inst().setLevel(opts_.effectiveLogLevel());

        if (!store_) {
            auto mem = std::make_shared<MemoryStore>();
            store_ = mem;
            if (!blobs_) blobs_ = mem;
        } else if (!blobs_) {
            blobs_ = std::dynamic_pointer_cast<IBlobStore>(store_);
        }

        pool_      = std::make_shared<ThreadPool>(std::max<uint32_t>(opts_.workerThreads, 2));
        scheduler_ = std::make_shared<Scheduler>(pool_);
        executor_  = deps.executor ? std::move(deps.executor) : poolExecutor(pool_);

        connection_ = std::make_shared<ConnectionMonitor>(clock_);
        if (opts_.offlineMode) connection_->setOfflineMode(true);
        wasOnline_ = connection_->isOnline();

        breakers_ = std::make_shared<CircuitBreakerRegistry>(clock_);

        CacheOptions cacheOpts;
        cacheOpts.blobThresholdBytes = opts_.cacheBlobThresholdBytes;
        cache_ = std::make_shared<TTLCache<nlohmann::json>>(store_, blobs_, clock_, executor_, cacheOpts);

        SettingsOptions so;
        so.settingsUrl              = opts_.settingsUrl();
        so.configUrl                = opts_.configUrl();
        so.checkTimeout             = std::chrono::milliseconds(opts_.settingsCheckTimeoutMs);
        so.configCacheTtlSeconds    = opts_.configCacheTtlSeconds;
        so.pollInterval             = std::chrono::milliseconds(opts_.settingsCheckIntervalMs);
        so.disableBackgroundPolling = opts_.disableBackgroundPolling;
        so.retry                    = retryOptions(opts_);
        so.circuit                  = circuitOptions(opts_);
        settings_ = std::make_shared<SettingsSynchronizer>(so, transport_, store_, cache_, breakers_,
                                                           connection_, scheduler_, executor_);

        session_ = std::make_unique<SessionLifecycle>(opts_.session, store_, clock_, ids_);
        user_ = opts_.user;

        DeliveryOptions so2;
        so2.name           = "summaries";
        so2.capacity       = opts_.summariesQueueSize;
        so2.flushThreshold = opts_.summariesQueueSize;
        so2.batchSize      = opts_.batchSize;
        so2.flushInterval  = std::chrono::milliseconds(opts_.summariesFlushIntervalMs);
        so2.maxStoredItems = opts_.summariesQueueSize;
        so2.storageKey     = kSummariesStoreKey;
        summaries_ = std::make_shared<SummaryQueue>(so2,
            [this](const std::vector<Summary>& items) {
                return transmit<Summary, SummaryTraits>(opts_.summariesUrl(), kSummariesBreaker, items);
            },
            connection_, store_, executor_);

        DeliveryOptions eo;
        eo.name           = "events";
        eo.capacity       = opts_.eventsQueueSize;
        eo.flushThreshold = opts_.eventsQueueSize;
        eo.batchSize      = opts_.batchSize;
        eo.flushInterval  = std::chrono::milliseconds(opts_.eventsFlushIntervalMs);
        eo.maxStoredItems = opts_.maxStoredEvents;
        eo.storageKey     = kEventsStoreKey;
        events_ = std::make_shared<EventQueue>(eo,
            [this](const std::vector<Event>& items) {
                return transmit<Event, EventTraits>(opts_.eventsUrl(), kEventsBreaker, items);
            },
            connection_, store_, executor_);

        // summaries describe the flag reads behind the events, so they go first
        std::weak_ptr<SummaryQueue> weakSummaries = summaries_;
        events_->setPreFlushHook([weakSummaries] {
            if (auto s = weakSummaries.lock()) logFlush("summaries", s->flush());
        });

        settings_->setSummarySink([this](const ConfigEntry& e) {
            auto r = pushSummary(Summary::fromEntry(e));
            if (!r.ok()) LOG_DEBUG("[Client] summary for " + e.key + " not queued: " + r.error().message);
        });

        connectionSub_ = connection_->addListener([this](ConnectionStatus status, const ConnectionInfo&) {
            onConnectionChanged(status);
        });

        LOG_INFO("[Client] created (sdk " + std::string(kSdkVersion) + ")");
    }

    Client::~Client()
    {
        shutdown();
    }

    /*──────────── lifecycle ────────────*/

    void Client::start()
    {
        if (started_.exchange(true) || stopped_) return;

        if (settings_->hydrateFromCache()) LOG_INFO("[Client] flags restored from cache");
        session_->start();

        size_t restored = summaries_->restorePersisted() + events_->restorePersisted();
        if (restored) LOG_INFO("[Client] reloaded " + std::to_string(restored) + " pending items");

        summaries_->startTimer(*scheduler_);
        events_->startTimer(*scheduler_);

        std::weak_ptr<TTLCache<nlohmann::json>> weakCache = cache_;
        sweepTimer_ = scheduler_->scheduleEvery(std::chrono::milliseconds(opts_.cacheSweepIntervalMs), [weakCache] {
            if (auto c = weakCache.lock()) {
                size_t n = c->sweepExpired();
                if (n) LOG_DEBUG("[Client] swept " + std::to_string(n) + " expired cache records");
            }
        });

        settings_->startPolling();
        if (connection_->isOnline()) {
            settings_->checkSettingsAsync();
        } else {
            LOG_INFO("[Client] offline, initial settings check skipped");
        }
    }

    void Client::shutdown()
    {
        if (stopped_.exchange(true)) return;
        LOG_INFO("[Client] shutting down");

        connectionSub_.reset();
        sweepTimer_.cancel();
        settings_->stopPolling();
        events_->stopTimer();
        summaries_->stopTimer();

        if (connection_->isOnline()) {
            logFlush("summaries", summaries_->flush());
            logFlush("events", events_->flush());
        }
        summaries_->persistPending();
        events_->persistPending();

        scheduler_->shutdown();
        pool_->join();
    }

    /*──────────── flags ────────────*/

    bool Client::getBoolean(const std::string& key, bool fallback)
    {
        return settings_->get<bool>(key, fallback);
    }

    double Client::getNumber(const std::string& key, double fallback)
    {
        return settings_->get<double>(key, fallback);
    }

    std::string Client::getString(const std::string& key, const std::string& fallback)
    {
        return settings_->get<std::string>(key, fallback);
    }

    nlohmann::json Client::getJson(const std::string& key, const nlohmann::json& fallback)
    {
        return settings_->get<nlohmann::json>(key, fallback);
    }

    ConfigValue Client::getValue(const std::string& key, const ConfigValue& fallback)
    {
        return settings_->getValue(key, fallback);
    }

    nlohmann::json Client::allFlags() const
    {
        return settings_->allFlags();
    }

    Subscription Client::addFlagListener(const std::string& key, SettingsSynchronizer::KeyListener l)
    {
        return settings_->addListener(key, std::move(l));
    }

    Subscription Client::addAllFlagsListener(SettingsSynchronizer::AllFlagsListener l)
    {
        return settings_->addAllFlagsListener(std::move(l));
    }

    /*──────────── analytics ────────────*/

    Result<void> Client::trackEvent(const std::string& name, nlohmann::json properties)
    {
        session_->updateActivity();

        Event e;
        e.eventId     = ids_->uuid();
        e.name        = name;
        e.properties  = std::move(properties);
        e.timestampMs = clock_->nowMs();
        e.sessionId   = session_->sessionId();
        return events_->enqueue(std::move(e));
    }

    Result<void> Client::pushSummary(Summary summary)
    {
        if (!summary.userCustomerId) {
            std::scoped_lock lk(userMx_);
            summary.userCustomerId = user_.customerId;
        }
        if (!summary.sessionId) summary.sessionId = session_->sessionId();
        if (summary.requestedTimeMs == 0) summary.requestedTimeMs = clock_->nowMs();
        return summaries_->enqueue(std::move(summary));
    }

    Result<void> Client::flushEvents()
    {
        return events_->flush();
    }

    Result<void> Client::flushSummaries()
    {
        return summaries_->flush();
    }

    template<typename T, typename Traits>
    Result<void> Client::transmit(const std::string& url, const char* breakerName, const std::vector<T>& items)
    {
        nlohmann::json payload = nlohmann::json::array();
        for (const auto& item : items) payload.push_back(Traits::toJson(item));

        nlohmann::json body;
        body[Traits::kPayloadKey] = std::move(payload);
        body["user"] = user().toJson();
        body["cf_client_sdk_version"] = kSdkVersion;
        const std::string text = body.dump();

        auto breaker = breakers_->getOrCreate(breakerName, circuitOptions(opts_));
        std::function<Result<bool>()> attempt = [this, &url, &text]() -> Result<bool> {
            auto r = transport_->post(url, text);
            if (!r.ok()) return r.error();
            const int status = r.value().status;
            if (status < 200 || status >= 300) {
                return Error::network("HTTP " + std::to_string(status) + " from " + url, status);
            }
            return true;
        };
        auto sent = breaker->execute<bool>([this, &attempt]() {
            return retry_.execute<bool>(attempt, &RetryPolicy::retryNetworkOnly);
        });
        if (!sent.ok()) return sent.error();
        return Result<void>::success();
    }

    /*──────────── session & user ────────────*/

    std::string Client::sessionId()
    {
        return session_->sessionId();
    }

    std::string Client::rotateSession()
    {
        return session_->forceRotation();
    }

    void Client::onUserAuthenticationChanged(const std::optional<std::string>& userId)
    {
        {
            std::scoped_lock lk(userMx_);
            user_.customerId = userId;
            user_.anonymous = !userId.has_value();
        }
        session_->onAuthenticationChange(userId);
    }

    void Client::setUser(UserContext user)
    {
        std::scoped_lock lk(userMx_);
        user_ = std::move(user);
    }

    UserContext Client::user() const
    {
        std::scoped_lock lk(userMx_);
        return user_;
    }

    /*──────────── host signals ────────────*/

    void Client::onAppBackground()
    {
        background_ = true;
        session_->onAppBackground();
        summaries_->persistPending();
        events_->persistPending();
        applyPollingInterval();
    }

    void Client::onAppForeground()
    {
        background_ = false;
        session_->onAppForeground();
        applyPollingInterval();
        if (connection_->isOnline()) settings_->checkSettingsAsync();
    }

    void Client::setNetworkAvailable(bool available)
    {
        connection_->setNetworkAvailable(available);
        session_->onNetworkChange();
    }

    void Client::setBatteryState(bool low, bool charging)
    {
        batteryLow_ = low && !charging;
        applyPollingInterval();
    }

    void Client::setOfflineMode(bool offline)
    {
        connection_->setOfflineMode(offline);
    }

    void Client::applyPollingInterval()
    {
        const bool reduced = background_ || (opts_.useReducedPollingWhenBatteryLow && batteryLow_);
        const uint64_t ms = reduced ? opts_.reducedSettingsCheckIntervalMs : opts_.settingsCheckIntervalMs;
        settings_->setPollingInterval(std::chrono::milliseconds(ms));
    }

    void Client::onConnectionChanged(ConnectionStatus status)
    {
        const bool online = status == ConnectionStatus::Connected || status == ConnectionStatus::Connecting;
        const bool recovered = online && !wasOnline_.exchange(online);
        if (!online) wasOnline_ = false;
        if (!recovered || stopped_) return;

        LOG_INFO("[Client] connectivity restored, flushing queues");
        std::weak_ptr<SummaryQueue> weakSummaries = summaries_;
        std::weak_ptr<EventQueue> weakEvents = events_;
        std::weak_ptr<SettingsSynchronizer> weakSettings = settings_;
        executor_([weakSummaries, weakEvents, weakSettings] {
            if (auto s = weakSummaries.lock()) logFlush("summaries", s->flush());
            if (auto e = weakEvents.lock()) logFlush("events", e->flush());
            if (auto st = weakSettings.lock()) st->checkSettingsAsync();
        });
    }

    /*──────────── settings ────────────*/

    CheckResult Client::checkSettings()
    {
        return settings_->checkSettings();
    }

    CheckResult Client::forceRefresh()
    {
        return settings_->forceRefresh();
    }

    void Client::setPollingInterval(std::chrono::milliseconds interval)
    {
        settings_->setPollingInterval(interval);
    }

    nlohmann::json Client::metrics() const
    {
        auto ev = events_->stats();
        auto su = summaries_->stats();
        auto conn = connection_->info();

        nlohmann::json breakers = nlohmann::json::object();
        for (const char* name : { SettingsSynchronizer::kBreakerName, kEventsBreaker, kSummariesBreaker }) {
            if (auto b = breakers_->find(name)) {
                auto snap = b->snapshot();
                breakers[name] = { { "state", toString(snap.state) }, { "failures", snap.failureCount } };
            }
        }

        return {
            { "events", events_->metrics() },
            { "summaries", summaries_->metrics() },
            { "totals", {
                { "eventsTracked", ev.enqueued },
                { "eventsSent", ev.sent },
                { "eventsDropped", ev.dropped },
                { "summariesSent", su.sent },
                { "summariesDropped", su.dropped } } },
            { "settings", settings_->metrics() },
            { "breakers", breakers },
            { "connection", {
                { "status", toString(conn.status) },
                { "failureCount", conn.failureCount },
                { "lastError", conn.lastError } } },
            { "session", session_->stats() }
        };
    }

}
