#include "flagsync/core/storage/memory_store.hpp"
#include <mutex>

namespace flagsync {

    std::optional<std::string> MemoryStore::getString(const std::string& key) const {
        std::shared_lock lk(mx_);
        auto it = strings_.find(key);
        if (it == strings_.end()) return std::nullopt;
        return it->second;
    }

    bool MemoryStore::setString(const std::string& key, const std::string& value) {
        std::unique_lock lk(mx_);
        strings_[key] = value;
        return true;
    }

    std::optional<int64_t> MemoryStore::getInt(const std::string& key) const {
        std::shared_lock lk(mx_);
        auto it = ints_.find(key);
        if (it == ints_.end()) return std::nullopt;
        return it->second;
    }

    bool MemoryStore::setInt(const std::string& key, int64_t value) {
        std::unique_lock lk(mx_);
        ints_[key] = value;
        return true;
    }

    bool MemoryStore::remove(const std::string& key) {
        std::unique_lock lk(mx_);
        auto n = strings_.erase(key) + ints_.erase(key);
        return n > 0;
    }

    std::vector<std::string> MemoryStore::keysWithPrefix(const std::string& prefix) const {
        std::shared_lock lk(mx_);
        std::vector<std::string> out;
        for (auto it = strings_.lower_bound(prefix);
             it != strings_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
            out.push_back(it->first);
        }
        for (auto it = ints_.lower_bound(prefix);
             it != ints_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
            out.push_back(it->first);
        }
        return out;
    }

    bool MemoryStore::writeBlob(const std::string& name, const std::string& bytes) {
        std::unique_lock lk(mx_);
        blobs_[name] = bytes;
        return true;
    }

    std::optional<std::string> MemoryStore::readBlob(const std::string& name) const {
        std::shared_lock lk(mx_);
        auto it = blobs_.find(name);
        if (it == blobs_.end()) return std::nullopt;
        return it->second;
    }

    bool MemoryStore::removeBlob(const std::string& name) {
        std::unique_lock lk(mx_);
        return blobs_.erase(name) > 0;
    }

    size_t MemoryStore::size() const {
        std::shared_lock lk(mx_);
        return strings_.size() + ints_.size();
    }

    size_t MemoryStore::blobCount() const {
        std::shared_lock lk(mx_);
        return blobs_.size();
    }

}
