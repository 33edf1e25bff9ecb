#include "flagsync/core/cache/cache_storage.hpp"
#include "flagsync/core/util/logger.hpp"
#include "internal/core/codec/record_codec.hpp"
#include <cctype>

namespace flagsync {

    CacheStorage::CacheStorage(std::shared_ptr<IKeyValueStore> kv,
                               std::shared_ptr<IBlobStore> blobs,
                               std::string prefix,
                               size_t blobThresholdBytes)
        : kv_(std::move(kv)), blobs_(std::move(blobs)),
          prefix_(std::move(prefix)), blobThreshold_(blobThresholdBytes)
    {
        if (!kv_) throw std::invalid_argument("CacheStorage requires a key/value store");
    }

    std::string CacheStorage::normalizeKey(const std::string& key)
    {
        std::string out = key;
        for (auto& c : out) {
            if (!std::isalnum(static_cast<unsigned char>(c))) c = '_';
        }
        return out;
    }

    std::string CacheStorage::recordKey(const std::string& key) const
    {
        return prefix_ + normalizeKey(key);
    }

    bool CacheStorage::write(const std::string& key, const StoredEntry& entry)
    {
        const auto rk = recordKey(key);

        internal::CacheRecord rec;
        rec.createdAt = entry.createdAt;
        rec.expiresAt = entry.expiresAt;
        rec.metadata  = entry.metadata;

        bool spilled = false;
        if (blobs_ && entry.payload.size() > blobThreshold_) {
            if (!blobs_->writeBlob(blobName(rk), entry.payload)) {
                LOG_WARN("[CacheStorage] blob write failed for " + rk);
                return false;
            }
            rec.blobRef = blobName(rk);
            spilled = true;
        } else {
            rec.payload = entry.payload;
        }

        std::string bytes;
        try {
            bytes = internal::encodeCacheRecord(rec);
        } catch (const std::exception& ex) {
            LOG_ERROR("[CacheStorage] encode failed for " + rk + ": " + ex.what());
            if (spilled) blobs_->removeBlob(blobName(rk));
            return false;
        }

        if (!kv_->setString(rk, bytes)) {
            LOG_WARN("[CacheStorage] record write failed for " + rk);
            if (spilled) blobs_->removeBlob(blobName(rk));
            return false;
        }
        // a previously spilled value that now fits inline leaves a stale blob
        if (!spilled && blobs_) blobs_->removeBlob(blobName(rk));
        return true;
    }

    Result<std::optional<StoredEntry>> CacheStorage::read(const std::string& key) const
    {
        const auto rk = recordKey(key);
        auto bytes = kv_->getString(rk);
        if (!bytes) return std::optional<StoredEntry>{};

        auto rec = internal::decodeCacheRecord(*bytes);
        if (!rec) return Error::internal("corrupted cache record " + rk);

        StoredEntry out;
        out.createdAt = rec->createdAt;
        out.expiresAt = rec->expiresAt;
        out.metadata  = std::move(rec->metadata);
        if (rec->blobRef) {
            if (!blobs_) return Error::internal("cache record " + rk + " references a blob but no blob store is set");
            auto blob = blobs_->readBlob(*rec->blobRef);
            if (!blob) return Error::internal("missing blob for cache record " + rk);
            out.payload = std::move(*blob);
        } else {
            out.payload = std::move(rec->payload);
        }
        return std::optional<StoredEntry>{ std::move(out) };
    }

    void CacheStorage::eraseRecordKey(const std::string& rk)
    {
        kv_->remove(rk);
        if (blobs_) blobs_->removeBlob(blobName(rk));
    }

    bool CacheStorage::erase(const std::string& key)
    {
        const auto rk = recordKey(key);
        bool existed = kv_->getString(rk).has_value();
        eraseRecordKey(rk);
        return existed;
    }

    size_t CacheStorage::eraseAll()
    {
        auto keys = kv_->keysWithPrefix(prefix_);
        for (const auto& rk : keys) eraseRecordKey(rk);
        return keys.size();
    }

    size_t CacheStorage::sweep(uint64_t now)
    {
        size_t removed = 0;
        for (const auto& rk : kv_->keysWithPrefix(prefix_)) {
            auto bytes = kv_->getString(rk);
            if (!bytes) continue;
            auto rec = internal::decodeCacheRecord(*bytes);
            if (!rec) {
                LOG_WARN("[CacheStorage] sweeping unreadable record " + rk);
                eraseRecordKey(rk);
                ++removed;
                continue;
            }
            if (rec->expiresAt <= now) {
                eraseRecordKey(rk);
                ++removed;
            }
        }
        if (removed) LOG_DEBUG("[CacheStorage] sweep removed " + std::to_string(removed) + " records");
        return removed;
    }

}
