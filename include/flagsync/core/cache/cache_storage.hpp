/**
 * @file cache_storage.hpp
 * @brief Durable tier of the TTL cache.
 *
 * Stores serialized cache entries in the key/value store under a common
 * prefix. Payloads above the blob threshold are written to the blob store and
 * referenced from a small record, keeping the key/value store free of
 * outsized values.
 */
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "flagsync/core/interfaces/istore.hpp"
#include "flagsync/core/util/error_types.hpp"

namespace flagsync {

    /**
     * @struct StoredEntry
     * @brief Serialized cache entry as held by the durable tier.
     */
    struct StoredEntry {
        std::string                        payload;
        uint64_t                           createdAt{ 0 };
        uint64_t                           expiresAt{ 0 };
        std::map<std::string, std::string> metadata;
    };

    class CacheStorage {
    public:
        /**
         * @param kv Record store
         * @param blobs Blob store; when null every payload is stored inline
         * @param prefix Key prefix for every record written
         * @param blobThresholdBytes Payloads larger than this go to the blob store
         */
        CacheStorage(std::shared_ptr<IKeyValueStore> kv,
                     std::shared_ptr<IBlobStore> blobs,
                     std::string prefix = "cf_cache_",
                     size_t blobThresholdBytes = 100 * 1024);

        /// Replace every non-alphanumeric character with '_'.
        static std::string normalizeKey(const std::string& key);

        /// Full store key for a cache key.
        std::string recordKey(const std::string& key) const;

        /**
         * @brief Write an entry.
         * @return false when the store rejected the write
         */
        bool write(const std::string& key, const StoredEntry& entry);

        /**
         * @brief Read an entry.
         * @return nullopt when absent, an Internal error when the record or
         *         its blob is unreadable (the caller clears it)
         */
        Result<std::optional<StoredEntry>> read(const std::string& key) const;

        /// Remove the record and its blob. Returns true when a record existed.
        bool erase(const std::string& key);

        /// Remove every record under the prefix.
        size_t eraseAll();

        /**
         * @brief Remove records with expiresAt < now, and unreadable ones.
         * @return Number of records removed
         */
        size_t sweep(uint64_t now);

        size_t blobThreshold() const { return blobThreshold_; }

    private:
        std::string blobName(const std::string& recordKey) const { return recordKey + ".blob"; }
        void eraseRecordKey(const std::string& recordKey);

        std::shared_ptr<IKeyValueStore> kv_;
        std::shared_ptr<IBlobStore>     blobs_;
        std::string                     prefix_;
        size_t                          blobThreshold_;
    };

}
