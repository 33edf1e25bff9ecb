/**
 * @file batch_store.hpp
 * @brief Durable copy of a delivery queue's pending items.
 */
#pragma once
#include <memory>
#include <string>
#include <vector>
#include "flagsync/core/interfaces/istore.hpp"

namespace flagsync {

    /**
     * @class BatchStore
     * @brief Saves and reloads serialized queue items under one store key.
     */
    class BatchStore {
    public:
        BatchStore(std::shared_ptr<IKeyValueStore> store, std::string key)
            : store_(std::move(store)), key_(std::move(key)) {}

        /// Replace the stored batch. An empty batch removes the key.
        bool save(const std::vector<std::string>& items);

        /// Stored items in order; empty when nothing (or nothing readable) is stored.
        std::vector<std::string> load() const;

        void clear();

        const std::string& key() const { return key_; }

    private:
        std::shared_ptr<IKeyValueStore> store_;
        std::string                     key_;
    };

}
