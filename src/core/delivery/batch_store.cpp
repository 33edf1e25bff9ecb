#include "flagsync/core/delivery/batch_store.hpp"
#include "flagsync/core/util/logger.hpp"
#include "internal/core/codec/record_codec.hpp"

namespace flagsync {

    bool BatchStore::save(const std::vector<std::string>& items)
    {
        if (!store_) return false;
        if (items.empty()) {
            store_->remove(key_);
            return true;
        }
        std::string bytes;
        try {
            bytes = internal::encodeBatch(items);
        } catch (const std::exception& ex) {
            LOG_ERROR("[BatchStore] encode failed for " + key_ + ": " + ex.what());
            return false;
        }
        if (!store_->setString(key_, bytes)) {
            LOG_WARN("[BatchStore] write failed for " + key_);
            return false;
        }
        return true;
    }

    std::vector<std::string> BatchStore::load() const
    {
        if (!store_) return {};
        auto bytes = store_->getString(key_);
        if (!bytes) return {};
        auto items = internal::decodeBatch(*bytes);
        if (!items) {
            LOG_WARN("[BatchStore] unreadable batch under " + key_ + ", discarding");
            store_->remove(key_);
            return {};
        }
        return std::move(*items);
    }

    void BatchStore::clear()
    {
        if (store_) store_->remove(key_);
    }

}
