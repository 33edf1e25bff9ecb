#include "flagsync/core/config/settings_synchronizer.hpp"
#include "flagsync/core/util/logger.hpp"
#include <future>

namespace flagsync {

    namespace {

        nlohmann::json metadataToJson(const HttpMetadata& m)
        {
            nlohmann::json j = nlohmann::json::object();
            if (m.etag)         j["etag"] = *m.etag;
            if (m.lastModified) j["last_modified"] = *m.lastModified;
            return j;
        }

        HttpMetadata metadataFromJson(const nlohmann::json& j)
        {
            HttpMetadata m;
            if (j.contains("etag") && j["etag"].is_string())
                m.etag = j["etag"].get<std::string>();
            if (j.contains("last_modified") && j["last_modified"].is_string())
                m.lastModified = j["last_modified"].get<std::string>();
            return m;
        }

        std::map<std::string, std::string> metadataAttrs(const HttpMetadata& m)
        {
            std::map<std::string, std::string> attrs;
            if (m.etag)         attrs["etag"] = *m.etag;
            if (m.lastModified) attrs["last_modified"] = *m.lastModified;
            return attrs;
        }

        /// A validator counts as changed only when present and different.
        bool validatorsChanged(const HttpMetadata& now, const HttpMetadata& before)
        {
            bool etagChanged = now.etag && now.etag != before.etag;
            bool lmChanged   = now.lastModified && now.lastModified != before.lastModified;
            return etagChanged || lmChanged;
        }

        std::string show(const std::optional<std::string>& s) { return s ? *s : "none"; }

    }

    const char* toString(SyncState s)
    {
        switch (s) {
            case SyncState::Idle:     return "idle";
            case SyncState::Checking: return "checking";
            case SyncState::Disabled: return "disabled";
        }
        return "unknown";
    }

    const char* toString(CheckResult r)
    {
        switch (r) {
            case CheckResult::AlreadyRunning: return "already_running";
            case CheckResult::Offline:        return "offline";
            case CheckResult::NoMetadata:     return "no_metadata";
            case CheckResult::Unchanged:      return "unchanged";
            case CheckResult::Updated:        return "updated";
            case CheckResult::Disabled:       return "disabled";
            case CheckResult::CircuitOpen:    return "circuit_open";
            case CheckResult::Failed:         return "failed";
            case CheckResult::TimedOut:       return "timed_out";
        }
        return "unknown";
    }

    SettingsSynchronizer::SettingsSynchronizer(SettingsOptions opts,
                                               std::shared_ptr<ITransport> transport,
                                               std::shared_ptr<IKeyValueStore> store,
                                               std::shared_ptr<TTLCache<nlohmann::json>> cache,
                                               std::shared_ptr<CircuitBreakerRegistry> breakers,
                                               std::shared_ptr<ConnectionMonitor> connection,
                                               std::shared_ptr<Scheduler> scheduler,
                                               Executor executor)
        : opts_(std::move(opts)),
          transport_(std::move(transport)),
          store_(std::move(store)),
          cache_(std::move(cache)),
          breakers_(std::move(breakers)),
          connection_(std::move(connection)),
          scheduler_(std::move(scheduler)),
          executor_(std::move(executor)),
          retry_(opts_.retry),
          snapshot_(std::make_shared<const ConfigSnapshot>()),
          interval_(opts_.pollInterval)
    {
        if (!transport_ || !store_ || !cache_ || !breakers_ || !connection_ || !executor_) {
            throw std::invalid_argument("SettingsSynchronizer: missing collaborator");
        }
    }

    SettingsSynchronizer::~SettingsSynchronizer()
    {
        std::scoped_lock lk(timerMx_);
        timer_.cancel();
        oneShot_.cancel();
    }

    /*──────────── startup ────────────*/

    bool SettingsSynchronizer::hydrateFromCache()
    {
        auto entry = cache_->getEntry(kConfigCacheKey, /*allowExpired=*/true);
        if (!entry) {
            LOG_DEBUG("[Settings] no cached config");
            return false;
        }

        auto parsed = parseConfigDocument(entry->value);
        if (!parsed.ok()) {
            LOG_WARN("[Settings] cached config unusable (" + parsed.error().message + "), clearing it");
            cache_->remove(kConfigCacheKey);
            return false;
        }
        if (parsed.value().discarded) {
            LOG_WARN("[Settings] discarded " + std::to_string(parsed.value().discarded) + " invalid cached entries");
        }
        if (parsed.value().entries.empty()) return false;

        auto snap = std::make_shared<ConfigSnapshot>();
        snap->entries = std::move(parsed.value().entries);
        auto& attrs = entry->metadata;
        if (auto it = attrs.find("etag"); it != attrs.end()) snap->metadata.etag = it->second;
        if (auto it = attrs.find("last_modified"); it != attrs.end()) snap->metadata.lastModified = it->second;

        {
            std::scoped_lock lk(snapMx_);
            snapshot_ = snap;
        }
        // validators are only meaningful next to the document they describe
        loadStoredMetadata();
        LOG_INFO("[Settings] restored " + std::to_string(snap->entries.size()) + " flags from cache");
        return true;
    }

    void SettingsSynchronizer::loadStoredMetadata()
    {
        auto raw = store_->getString(kMetadataKey);
        if (!raw) return;
        auto j = nlohmann::json::parse(*raw, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded() || !j.is_object()) {
            LOG_WARN("[Settings] stored validators unreadable, ignoring");
            store_->remove(kMetadataKey);
            return;
        }
        std::scoped_lock lk(snapMx_);
        lastMetadata_ = metadataFromJson(j);
    }

    void SettingsSynchronizer::persistMetadata(const HttpMetadata& meta)
    {
        if (!store_->setString(kMetadataKey, metadataToJson(meta).dump())) {
            LOG_WARN("[Settings] failed to persist validators");
        }
    }

    /*──────────── check cycle ────────────*/

    CheckResult SettingsSynchronizer::checkSettings()
    {
        if (!connection_->isOnline()) {
            LOG_INFO("[Settings] offline, skipping settings check");
            return CheckResult::Offline;
        }

        bool expected = false;
        if (!inFlight_.compare_exchange_strong(expected, true)) {
            LOG_DEBUG("[Settings] check already in progress");
            return CheckResult::AlreadyRunning;
        }

        // releases the single-flight flag even if the executor drops the task
        struct Flight {
            std::shared_ptr<SettingsSynchronizer> self;
            void release() {
                if (self) {
                    self->inFlight_.store(false);
                    self.reset();
                }
            }
            ~Flight() { release(); }
        };
        auto flight = std::make_shared<Flight>();
        flight->self = shared_from_this();

        auto stop = std::make_shared<std::stop_source>();
        auto done = std::make_shared<std::promise<CheckResult>>();
        auto fut  = done->get_future();

        executor_([flight, stop, done] {
            CheckResult r = CheckResult::Failed;
            try {
                r = flight->self->runCycle(stop->get_token());
            } catch (const std::exception& ex) {
                LOG_ERROR(std::string("[Settings] check cycle threw: ") + ex.what());
            }
            flight->release();
            done->set_value(r);
        });

        if (fut.wait_for(opts_.checkTimeout) == std::future_status::timeout) {
            {
                std::scoped_lock lk(snapMx_);
                stop->request_stop();
            }
            ++timeouts_;
            LOG_WARN("[Settings] check timed out after " + std::to_string(opts_.checkTimeout.count()) + "ms");
            return CheckResult::TimedOut;
        }
        try {
            return fut.get();
        } catch (const std::future_error& ex) {
            LOG_WARN(std::string("[Settings] check was not run: ") + ex.what());
            return CheckResult::Failed;
        }
    }

    void SettingsSynchronizer::checkSettingsAsync()
    {
        if (!scheduler_) {
            checkSettings();
            return;
        }
        std::weak_ptr<SettingsSynchronizer> weak = weak_from_this();
        std::scoped_lock lk(timerMx_);
        oneShot_ = scheduler_->scheduleOnce(std::chrono::milliseconds(0), [weak] {
            if (auto self = weak.lock()) self->checkInBackground();
        });
    }

    CheckResult SettingsSynchronizer::checkInBackground()
    {
        if (!connection_->isOnline()) {
            LOG_DEBUG("[Settings] offline, skipping background check");
            return CheckResult::Offline;
        }

        bool expected = false;
        if (!inFlight_.compare_exchange_strong(expected, true)) {
            LOG_DEBUG("[Settings] check already in progress");
            return CheckResult::AlreadyRunning;
        }
        struct Release {
            std::atomic<bool>& flag;
            ~Release() { flag.store(false); }
        } release{ inFlight_ };

        // the cycle runs on this worker; the scheduler only enforces the deadline
        auto stop = std::make_shared<std::stop_source>();
        auto self = shared_from_this();
        TaskHandle deadline;
        if (scheduler_) {
            std::weak_ptr<SettingsSynchronizer> weak = self;
            deadline = scheduler_->scheduleOnce(opts_.checkTimeout, [weak, stop] {
                if (auto s = weak.lock()) {
                    std::scoped_lock lk(s->snapMx_);
                    stop->request_stop();
                }
            });
        }

        CheckResult r = CheckResult::Failed;
        try {
            r = runCycle(stop->get_token());
        } catch (const std::exception& ex) {
            LOG_ERROR(std::string("[Settings] check cycle threw: ") + ex.what());
        }
        deadline.cancel();

        if (r == CheckResult::TimedOut) {
            ++timeouts_;
            LOG_WARN("[Settings] check timed out after " + std::to_string(opts_.checkTimeout.count()) + "ms");
        }
        return r;
    }

    CheckResult SettingsSynchronizer::forceRefresh()
    {
        {
            std::scoped_lock lk(snapMx_);
            lastMetadata_ = HttpMetadata{};
        }
        store_->remove(kMetadataKey);
        LOG_INFO("[Settings] forced refresh");
        return checkSettings();
    }

    CheckResult SettingsSynchronizer::runCycle(std::stop_token stop)
    {
        ++cycles_;
        auto breaker = breakers_->getOrCreate(kBreakerName, opts_.circuit);

        std::function<Result<CycleData>()> guarded = [this, stop]() -> Result<CycleData> {
            return retry_.execute<CycleData>([this, stop] { return fetchPhase(stop); }, {}, stop);
        };
        auto r = breaker->execute<CycleData>(guarded);

        if (!r.ok()) {
            const Error& e = r.error();
            if (e.kind == ErrorKind::CircuitOpen) {
                LOG_DEBUG("[Settings] breaker open, skipping cycle");
                return CheckResult::CircuitOpen;
            }
            if (e.kind == ErrorKind::Cancelled || stop.stop_requested()) {
                return CheckResult::TimedOut;
            }
            ++failures_;
            LOG_WARN("[Settings] check failed: " + e.describe());
            if (isNetworkError(e.root())) connection_->recordFailure(e.root().message);
            return CheckResult::Failed;
        }

        connection_->recordSuccess();
        if (r.value().metadata.empty()) {
            LOG_INFO("[Settings] settings probe returned no validators, aborting cycle");
            return CheckResult::NoMetadata;
        }
        return applyPhase(std::move(r.value()), stop);
    }

    Result<SettingsSynchronizer::CycleData> SettingsSynchronizer::fetchPhase(std::stop_token stop)
    {
        auto probe = transport_->fetchMetadata(opts_.settingsUrl);
        if (!probe.ok()) return probe.error();

        CycleData data;
        data.metadata = probe.value();
        if (data.metadata.empty()) return data;

        HttpMetadata previous;
        bool firstCycle;
        {
            std::scoped_lock lk(snapMx_);
            previous = lastMetadata_;
            firstCycle = !settingsFetched_;
        }
        data.changed = validatorsChanged(data.metadata, previous);
        LOG_DEBUG("[Settings] validators etag=" + show(data.metadata.etag)
                  + " last-modified=" + show(data.metadata.lastModified)
                  + (data.changed ? " (changed)" : " (unchanged)"));

        if (!firstCycle && !data.changed) return data;
        if (stop.stop_requested()) return Error::cancelled("settings check stopped");

        auto enabled = fetchEnablement();
        if (!enabled.ok()) return enabled.error();
        data.enabled = enabled.value();

        if (!data.enabled.value() || !data.changed) return data;
        if (stop.stop_requested()) return Error::cancelled("settings check stopped");

        auto doc = fetchConfig(data.metadata);
        if (!doc.ok()) return doc.error();
        if (!doc.value()) {
            LOG_DEBUG("[Settings] config not modified");
            return data;
        }

        auto parsed = parseConfigDocument(*doc.value());
        if (!parsed.ok()) return parsed.error();
        if (parsed.value().discarded) {
            LOG_WARN("[Settings] discarded " + std::to_string(parsed.value().discarded) + " invalid config entries");
        }
        data.configDoc = std::move(*doc.value());
        data.config = std::move(parsed.value());
        return data;
    }

    Result<bool> SettingsSynchronizer::fetchEnablement()
    {
        auto res = transport_->fetchFull(opts_.settingsUrl, std::nullopt, std::nullopt);
        if (!res.ok()) return res.error();

        auto j = nlohmann::json::parse(res.value().body, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded() || !j.is_object()) {
            return Error::validation("settings document is not a JSON object");
        }
        bool accountEnabled = j.value("cf_account_enabled", true);
        bool skipSdk        = j.value("cf_skip_sdk", false);
        LOG_DEBUG("[Settings] cf_account_enabled=" + std::string(accountEnabled ? "true" : "false")
                  + " cf_skip_sdk=" + std::string(skipSdk ? "true" : "false"));
        return accountEnabled && !skipSdk;
    }

    Result<std::optional<nlohmann::json>> SettingsSynchronizer::fetchConfig(const HttpMetadata& meta)
    {
        auto res = transport_->fetchFull(opts_.configUrl, meta.etag, meta.lastModified);
        if (!res.ok()) return res.error();
        if (res.value().notModified()) return std::optional<nlohmann::json>{};

        auto j = nlohmann::json::parse(res.value().body, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded()) return Error::validation("config document is not valid JSON");
        return std::optional<nlohmann::json>{ std::move(j) };
    }

    CheckResult SettingsSynchronizer::applyPhase(CycleData data, std::stop_token stop)
    {
        if (stop.stop_requested()) return CheckResult::TimedOut;

        if (data.config) {
            if (!cache_->put(kConfigCacheKey, data.configDoc, opts_.configCacheTtlSeconds, true,
                             metadataAttrs(data.metadata))) {
                LOG_WARN("[Settings] failed to persist config to cache");
            }
        }

        std::vector<std::string> changedKeys;
        SnapshotPtr published;
        {
            std::scoped_lock lk(snapMx_);
            if (stop.stop_requested()) return CheckResult::TimedOut;

            if (data.enabled) {
                settingsFetched_ = true;
                bool wasDisabled = disabled_.exchange(!*data.enabled);
                if (wasDisabled != !*data.enabled) {
                    if (*data.enabled) LOG_INFO("[Settings] SDK functionality enabled");
                    else               LOG_WARN("[Settings] SDK functionality disabled by remote settings");
                }
            }
            if (data.config) {
                auto snap = std::make_shared<ConfigSnapshot>();
                snap->entries  = std::move(data.config->entries);
                snap->metadata = data.metadata;
                changedKeys = diffKeys(snapshot_->entries, snap->entries);
                snapshot_ = snap;
                published = snap;
            }
            if (data.changed) lastMetadata_ = data.metadata;
        }
        persistMetadata(data.metadata);

        if (published) {
            ++updates_;
            LOG_INFO("[Settings] config updated, " + std::to_string(changedKeys.size()) + " keys changed");
            if (!disabled_.load() && !changedKeys.empty()) notifyChanged(changedKeys, published);
            return CheckResult::Updated;
        }
        if (disabled_.load()) return CheckResult::Disabled;
        return CheckResult::Unchanged;
    }

    /*──────────── polling ────────────*/

    void SettingsSynchronizer::startPolling()
    {
        if (opts_.disableBackgroundPolling) {
            LOG_INFO("[Settings] background polling disabled");
            return;
        }
        if (!scheduler_) return;

        std::weak_ptr<SettingsSynchronizer> weak = weak_from_this();
        std::scoped_lock lk(timerMx_);
        timer_.cancel();
        timer_ = scheduler_->scheduleEvery(interval_, [weak] {
            if (auto self = weak.lock()) self->checkInBackground();
        });
        LOG_DEBUG("[Settings] polling every " + std::to_string(interval_.count()) + "ms");
    }

    void SettingsSynchronizer::stopPolling()
    {
        std::scoped_lock lk(timerMx_);
        timer_.cancel();
    }

    void SettingsSynchronizer::setPollingInterval(std::chrono::milliseconds interval)
    {
        bool running;
        {
            std::scoped_lock lk(timerMx_);
            if (interval == interval_) return;
            interval_ = interval;
            running = timer_.active();
        }
        if (running) startPolling();
    }

    std::chrono::milliseconds SettingsSynchronizer::pollingInterval() const
    {
        std::scoped_lock lk(timerMx_);
        return interval_;
    }

    /*──────────── reads ────────────*/

    SnapshotPtr SettingsSynchronizer::snapshot() const
    {
        std::scoped_lock lk(snapMx_);
        return snapshot_;
    }

    HttpMetadata SettingsSynchronizer::lastMetadata() const
    {
        std::scoped_lock lk(snapMx_);
        return lastMetadata_;
    }

    SyncState SettingsSynchronizer::state() const
    {
        if (inFlight_.load()) return SyncState::Checking;
        if (disabled_.load()) return SyncState::Disabled;
        return SyncState::Idle;
    }

    std::optional<ConfigValue> SettingsSynchronizer::read(const std::string& key,
                                                          const std::function<bool(const ConfigValue&)>& typeCheck)
    {
        if (disabled_.load()) return std::nullopt;
        auto snap = snapshot();
        const ConfigEntry* e = snap->find(key);
        if (!e) return std::nullopt;

        emitSummary(*e);
        if (typeCheck && !typeCheck(e->value)) {
            LOG_DEBUG("[Settings] '" + key + "' holds a " + toString(e->value.type()) + ", returning fallback");
            return std::nullopt;
        }
        return e->value;
    }

    ConfigValue SettingsSynchronizer::getValue(const std::string& key,
                                               const ConfigValue& fallback,
                                               const std::function<bool(const ConfigValue&)>& typeCheck)
    {
        auto v = read(key, typeCheck);
        return v ? *v : fallback;
    }

    nlohmann::json SettingsSynchronizer::allFlags() const
    {
        if (disabled_.load()) return nlohmann::json::object();
        return snapshot()->toFlagMap();
    }

    void SettingsSynchronizer::setSummarySink(SummarySink sink)
    {
        std::scoped_lock lk(sinkMx_);
        summarySink_ = std::move(sink);
    }

    void SettingsSynchronizer::emitSummary(const ConfigEntry& e)
    {
        if (!e.metadata.hasSummaryFields()) return;
        SummarySink sink;
        {
            std::scoped_lock lk(sinkMx_);
            sink = summarySink_;
        }
        if (!sink) return;
        try {
            sink(e);
        } catch (const std::exception& ex) {
            LOG_WARN("[Settings] summary sink threw for '" + e.key + "': " + ex.what());
        }
    }

    /*──────────── listeners ────────────*/

    Subscription SettingsSynchronizer::addListener(const std::string& key, KeyListener l)
    {
        std::shared_ptr<ListenerList<std::string, ConfigValue>> list;
        {
            std::scoped_lock lk(listenerMx_);
            auto& slot = keyListeners_[key];
            if (!slot) slot = std::make_shared<ListenerList<std::string, ConfigValue>>();
            list = slot;
        }
        return list->add(std::move(l));
    }

    void SettingsSynchronizer::notifyChanged(const std::vector<std::string>& keys, const SnapshotPtr& snap)
    {
        std::vector<std::pair<std::string, std::shared_ptr<ListenerList<std::string, ConfigValue>>>> targets;
        {
            std::scoped_lock lk(listenerMx_);
            for (const auto& k : keys) {
                auto it = keyListeners_.find(k);
                if (it != keyListeners_.end() && it->second->size() > 0) targets.emplace_back(k, it->second);
            }
        }
        for (auto& [k, list] : targets) {
            // removed keys are reported with a null Json value
            const ConfigEntry* e = snap->find(k);
            list->notify(k, e ? e->value : ConfigValue());
        }
        allFlagsListeners_.notify(snap->toFlagMap());
    }

    nlohmann::json SettingsSynchronizer::metrics() const
    {
        auto snap = snapshot();
        auto meta = lastMetadata();
        return {
            { "state", toString(state()) },
            { "flags", snap->entries.size() },
            { "cycles", cycles_.load() },
            { "updates", updates_.load() },
            { "failures", failures_.load() },
            { "timeouts", timeouts_.load() },
            { "etag", meta.etag ? nlohmann::json(*meta.etag) : nlohmann::json() },
            { "lastModified", meta.lastModified ? nlohmann::json(*meta.lastModified) : nlohmann::json() },
            { "pollingIntervalMs", pollingInterval().count() }
        };
    }

}
