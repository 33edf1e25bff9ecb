/**
 * @file record_codec.hpp
 * @brief MessagePack encoding of durable records.
 *
 * Two record shapes are written to the key/value store: cache records
 * (timestamps, metadata and either an inline payload or a blob reference)
 * and persisted queue batches (a list of serialized items).
 */
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace flagsync::internal {

    /**
     * @struct CacheRecord
     * @brief Durable form of a cache entry.
     */
    struct CacheRecord {
        uint64_t                           createdAt{ 0 };
        uint64_t                           expiresAt{ 0 };
        std::map<std::string, std::string> metadata;
        std::string                        payload;   ///< Inline serialized value, empty when blobRef is set
        std::optional<std::string>         blobRef;   ///< Blob name holding the payload
    };

    /// Encode a cache record. Never fails for well-formed input.
    std::string encodeCacheRecord(const CacheRecord& rec);

    /// Decode a cache record; nullopt on malformed bytes.
    std::optional<CacheRecord> decodeCacheRecord(const std::string& bytes);

    /// Encode a batch of serialized queue items in order.
    std::string encodeBatch(const std::vector<std::string>& items);

    /// Decode a batch; nullopt on malformed bytes.
    std::optional<std::vector<std::string>> decodeBatch(const std::string& bytes);

}
