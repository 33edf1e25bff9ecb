/**
 * @file ttl_cache.hpp
 * @brief Two-tier key/value cache with expiry and stale-while-revalidate.
 *
 * The fast tier is an in-process map. Entries put with persist=true are also
 * written to a CacheStorage (the durable tier) and survive a restart: a get
 * that misses the fast tier falls through to storage and hydrates the fast
 * tier. Values are serialized with nlohmann::json, so V needs to_json /
 * from_json.
 *
 * Background refresh needs shared ownership: construct the cache with
 * std::make_shared.
 */
#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <nlohmann/json.hpp>
#include "flagsync/core/cache/cache_storage.hpp"
#include "flagsync/core/util/logger.hpp"
#include "flagsync/core/util/thread_pool.hpp"
#include "flagsync/core/util/time.hpp"

namespace flagsync {

    /**
     * @struct CacheEntry
     * @brief Cached value with its lifetime.
     */
    template<typename V>
    struct CacheEntry {
        V                                  value;
        uint64_t                           createdAt{ 0 };
        uint64_t                           expiresAt{ 0 };
        std::map<std::string, std::string> metadata;

        bool expired(uint64_t now) const { return now >= expiresAt; }
        uint64_t ttlMs() const { return expiresAt > createdAt ? expiresAt - createdAt : 0; }
    };

    struct CacheOptions {
        std::string keyPrefix{ "cf_cache_" };
        size_t      blobThresholdBytes{ 100 * 1024 };
        double      refreshFraction{ 0.1 };     ///< Remaining-TTL share that triggers a background refresh
    };

    template<typename V>
    class TTLCache : public std::enable_shared_from_this<TTLCache<V>> {
    public:
        /// Produces a fresh value; nullopt when the fetch failed.
        using Provider = std::function<std::optional<V>()>;

        /**
         * @param kv Durable record store (required)
         * @param blobs Store for oversized payloads, may be null
         * @param clock Time source for expiry
         * @param executor Where background refreshes run
         */
        TTLCache(std::shared_ptr<IKeyValueStore> kv,
                 std::shared_ptr<IBlobStore> blobs,
                 std::shared_ptr<IClock> clock,
                 Executor executor,
                 CacheOptions opts = {})
            : storage_(std::move(kv), std::move(blobs), opts.keyPrefix, opts.blobThresholdBytes),
              clock_(std::move(clock)), executor_(std::move(executor)), opts_(std::move(opts)) {}

        /**
         * @brief Insert or replace a value.
         * @param ttlSeconds Lifetime from now
         * @param persist Also write to the durable tier; otherwise any durable
         *                record for the key is removed
         * @param metadata Free-form string attributes kept with the entry
         * @return false when persist was requested and the durable write failed
         */
        bool put(const std::string& key, const V& value, uint64_t ttlSeconds, bool persist = true,
                 std::map<std::string, std::string> metadata = {});

        /**
         * @brief Look up a value.
         * @param allowExpired Return expired entries instead of treating them as misses
         */
        std::optional<V> get(const std::string& key, bool allowExpired = false);

        /// Like get() but returns the entry with its timestamps and metadata.
        std::optional<CacheEntry<V>> getEntry(const std::string& key, bool allowExpired = false);

        /**
         * @brief Return the cached value, fetching inline on a miss.
         *
         * A hit whose remaining lifetime is under refreshFraction of its TTL
         * is returned as is while a background refresh replaces it.
         */
        std::optional<V> getOrFetch(const std::string& key, Provider provider, uint64_t ttlSeconds,
                                    bool persist = true);

        /// Fetch now and store the result. Returns false when the provider failed.
        bool refresh(const std::string& key, const Provider& provider, uint64_t ttlSeconds, bool persist = true);

        void remove(const std::string& key);
        void clear();

        /// Drop expired entries from both tiers. Returns the number of durable records removed.
        size_t sweepExpired();

        size_t fastSize() const {
            std::scoped_lock lk(mx_);
            return fast_.size();
        }

        bool refreshing(const std::string& key) const {
            std::scoped_lock lk(mx_);
            return refreshing_.count(key) > 0;
        }

    private:
        std::optional<CacheEntry<V>> lookup(const std::string& key, bool allowExpired);
        void scheduleRefresh(const std::string& key, Provider provider, uint64_t ttlSeconds, bool persist);

        CacheStorage            storage_;
        std::shared_ptr<IClock> clock_;
        Executor                executor_;
        CacheOptions            opts_;

        mutable std::mutex                      mx_;
        std::map<std::string, CacheEntry<V>>    fast_;
        std::set<std::string>                   refreshing_;
    };

    template<typename V>
    bool TTLCache<V>::put(const std::string& key, const V& value, uint64_t ttlSeconds, bool persist,
                          std::map<std::string, std::string> metadata)
    {
        const auto now = clock_->nowMs();
        CacheEntry<V> e{ value, now, now + ttlSeconds * 1000, std::move(metadata) };

        bool stored = true;
        if (persist) {
            try {
                StoredEntry se{ nlohmann::json(value).dump(), e.createdAt, e.expiresAt, e.metadata };
                stored = storage_.write(key, se);
            } catch (const std::exception& ex) {
                LOG_ERROR("[TTLCache] serialize failed for " + key + ": " + ex.what());
                stored = false;
            }
        } else if (storage_.erase(key)) {
            // an older durable record would resurface once this entry expires
            LOG_DEBUG("[TTLCache] dropped durable record replaced by memory-only " + key);
        }

        std::scoped_lock lk(mx_);
        fast_[key] = std::move(e);
        return stored;
    }

    template<typename V>
    std::optional<CacheEntry<V>> TTLCache<V>::lookup(const std::string& key, bool allowExpired)
    {
        const auto now = clock_->nowMs();
        {
            std::scoped_lock lk(mx_);
            auto it = fast_.find(key);
            if (it != fast_.end() && (allowExpired || !it->second.expired(now))) {
                return it->second;
            }
        }

        auto rec = storage_.read(key);
        if (!rec.ok()) {
            LOG_WARN("[TTLCache] " + rec.error().message + ", clearing entry");
            remove(key);
            return std::nullopt;
        }
        if (!rec.value()) return std::nullopt;

        const StoredEntry& se = *rec.value();
        CacheEntry<V> e;
        try {
            e.value = nlohmann::json::parse(se.payload).template get<V>();
        } catch (const std::exception& ex) {
            LOG_WARN("[TTLCache] undecodable value for " + key + " (" + ex.what() + "), clearing entry");
            remove(key);
            return std::nullopt;
        }
        e.createdAt = se.createdAt;
        e.expiresAt = se.expiresAt;
        e.metadata  = se.metadata;

        {
            std::scoped_lock lk(mx_);
            fast_[key] = e;
        }
        if (!allowExpired && e.expired(now)) return std::nullopt;
        return e;
    }

    template<typename V>
    std::optional<CacheEntry<V>> TTLCache<V>::getEntry(const std::string& key, bool allowExpired)
    {
        return lookup(key, allowExpired);
    }

    template<typename V>
    std::optional<V> TTLCache<V>::get(const std::string& key, bool allowExpired)
    {
        auto e = lookup(key, allowExpired);
        if (!e) return std::nullopt;
        return std::move(e->value);
    }

    template<typename V>
    bool TTLCache<V>::refresh(const std::string& key, const Provider& provider, uint64_t ttlSeconds, bool persist)
    {
        std::optional<V> fresh;
        try {
            fresh = provider();
        } catch (const std::exception& ex) {
            LOG_WARN("[TTLCache] provider threw for " + key + ": " + ex.what());
            return false;
        }
        if (!fresh) return false;
        put(key, *fresh, ttlSeconds, persist);
        return true;
    }

    template<typename V>
    void TTLCache<V>::scheduleRefresh(const std::string& key, Provider provider, uint64_t ttlSeconds, bool persist)
    {
        {
            std::scoped_lock lk(mx_);
            if (!refreshing_.insert(key).second) return;
        }
        std::weak_ptr<TTLCache<V>> weak = this->weak_from_this();
        if (weak.expired() || !executor_) {
            LOG_DEBUG("[TTLCache] background refresh unavailable for " + key);
            std::scoped_lock lk(mx_);
            refreshing_.erase(key);
            return;
        }
        LOG_DEBUG("[TTLCache] refreshing " + key + " in background");
        executor_([weak, key, provider = std::move(provider), ttlSeconds, persist] {
            auto self = weak.lock();
            if (!self) return;
            if (!self->refresh(key, provider, ttlSeconds, persist)) {
                LOG_DEBUG("[TTLCache] background refresh failed for " + key + ", keeping cached value");
            }
            std::scoped_lock lk(self->mx_);
            self->refreshing_.erase(key);
        });
    }

    template<typename V>
    std::optional<V> TTLCache<V>::getOrFetch(const std::string& key, Provider provider, uint64_t ttlSeconds,
                                             bool persist)
    {
        if (auto e = lookup(key, false)) {
            const auto now = clock_->nowMs();
            const auto remaining = e->expiresAt > now ? e->expiresAt - now : 0;
            if (static_cast<double>(remaining) < opts_.refreshFraction * static_cast<double>(e->ttlMs())) {
                scheduleRefresh(key, std::move(provider), ttlSeconds, persist);
            }
            return std::move(e->value);
        }

        std::optional<V> fresh;
        try {
            fresh = provider();
        } catch (const std::exception& ex) {
            LOG_WARN("[TTLCache] provider threw for " + key + ": " + ex.what());
            return std::nullopt;
        }
        if (fresh) put(key, *fresh, ttlSeconds, persist);
        return fresh;
    }

    template<typename V>
    void TTLCache<V>::remove(const std::string& key)
    {
        {
            std::scoped_lock lk(mx_);
            fast_.erase(key);
        }
        storage_.erase(key);
    }

    template<typename V>
    void TTLCache<V>::clear()
    {
        {
            std::scoped_lock lk(mx_);
            fast_.clear();
        }
        auto n = storage_.eraseAll();
        LOG_DEBUG("[TTLCache] cleared " + std::to_string(n) + " durable records");
    }

    template<typename V>
    size_t TTLCache<V>::sweepExpired()
    {
        const auto now = clock_->nowMs();
        {
            std::scoped_lock lk(mx_);
            for (auto it = fast_.begin(); it != fast_.end();) {
                if (it->second.expired(now)) it = fast_.erase(it);
                else ++it;
            }
        }
        return storage_.sweep(now);
    }

}
