/**
 * @file memory_store.hpp
 * @brief In-process implementation of the durable store collaborators.
 *
 * Used by hosts that have no persistence layer and by the tests, which share
 * one MemoryStore between two client instances to simulate a restart.
 */
#pragma once
#include <map>
#include <shared_mutex>
#include "flagsync/core/interfaces/istore.hpp"

namespace flagsync {

    class MemoryStore : public IKeyValueStore, public IBlobStore {
    public:
        std::optional<std::string> getString(const std::string& key) const override;
        bool setString(const std::string& key, const std::string& value) override;
        std::optional<int64_t> getInt(const std::string& key) const override;
        bool setInt(const std::string& key, int64_t value) override;
        bool remove(const std::string& key) override;
        std::vector<std::string> keysWithPrefix(const std::string& prefix) const override;

        bool writeBlob(const std::string& name, const std::string& bytes) override;
        std::optional<std::string> readBlob(const std::string& name) const override;
        bool removeBlob(const std::string& name) override;

        size_t size() const;
        size_t blobCount() const;

    private:
        mutable std::shared_mutex            mx_;
        std::map<std::string, std::string>   strings_;
        std::map<std::string, int64_t>       ints_;
        std::map<std::string, std::string>   blobs_;
    };

}
