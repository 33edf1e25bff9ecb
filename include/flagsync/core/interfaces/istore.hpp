/**
 * @file istore.hpp
 * @brief Durable storage collaborators for flagsync.
 *
 * A key/value store for small records (session, settings validators, cache
 * metadata, pending queue batches) and a blob store for oversized cache
 * payloads. Values are byte strings; binary content is allowed.
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flagsync {

    /**
     * @class IKeyValueStore
     * @brief Small-record durable store.
     *
     * Setters return false on failure. remove() returns whether the key
     * existed; removing an absent key is not an error.
     */
    class IKeyValueStore {
    public:
        virtual ~IKeyValueStore() = default;
        virtual std::optional<std::string> getString(const std::string& key) const = 0;
        virtual bool setString(const std::string& key, const std::string& value) = 0;
        virtual std::optional<int64_t> getInt(const std::string& key) const = 0;
        virtual bool setInt(const std::string& key, int64_t value) = 0;
        virtual bool remove(const std::string& key) = 0;
        virtual std::vector<std::string> keysWithPrefix(const std::string& prefix) const = 0;
    };

    /**
     * @class IBlobStore
     * @brief Store for payloads too large for the key/value store.
     *
     * writeBlob returns false on failure; removeBlob returns whether the
     * blob existed.
     */
    class IBlobStore {
    public:
        virtual ~IBlobStore() = default;
        virtual bool writeBlob(const std::string& name, const std::string& bytes) = 0;
        virtual std::optional<std::string> readBlob(const std::string& name) const = 0;
        virtual bool removeBlob(const std::string& name) = 0;
    };

}
