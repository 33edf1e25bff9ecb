#include "internal/core/codec/record_codec.hpp"
#include "flagsync/core/util/logger.hpp"
#include <limits>
#include <stdexcept>
#include <msgpack.hpp>

namespace flagsync::internal {

    namespace {

        constexpr uint8_t kRecordVersion = 1;

        template<typename S>
        [[nodiscard]] bool safe_u32(S src, uint32_t& dst) noexcept {
            if (src > std::numeric_limits<uint32_t>::max()) return false;
            dst = static_cast<uint32_t>(src);
            return true;
        }

        void packBytes(msgpack::packer<msgpack::sbuffer>& pk, const std::string& s) {
            uint32_t len32;
            if (!safe_u32(s.size(), len32)) {
                throw std::overflow_error("record_codec: payload size exceeds 4 GiB");
            }
            pk.pack_bin(len32);
            pk.pack_bin_body(s.data(), len32);
        }

        bool readBytes(const msgpack::object& o, std::string& out) {
            if (o.type == msgpack::type::BIN) {
                out.assign(o.via.bin.ptr, o.via.bin.size);
                return true;
            }
            if (o.type == msgpack::type::STR) {
                out.assign(o.via.str.ptr, o.via.str.size);
                return true;
            }
            return false;
        }

    }

    std::string encodeCacheRecord(const CacheRecord& rec)
    {
        msgpack::sbuffer buf;
        msgpack::packer<msgpack::sbuffer> pk(&buf);

        pk.pack_map(rec.blobRef ? 6 : 5);
        pk.pack(std::string("v"));       pk.pack(kRecordVersion);
        pk.pack(std::string("created")); pk.pack(rec.createdAt);
        pk.pack(std::string("expires")); pk.pack(rec.expiresAt);
        pk.pack(std::string("meta"));    pk.pack(rec.metadata);
        pk.pack(std::string("payload")); packBytes(pk, rec.payload);
        if (rec.blobRef) {
            pk.pack(std::string("blob"));
            pk.pack(*rec.blobRef);
        }
        return { buf.data(), buf.size() };
    }

    std::optional<CacheRecord> decodeCacheRecord(const std::string& bytes)
    {
        try {
            msgpack::object_handle oh = msgpack::unpack(bytes.data(), bytes.size());
            msgpack::object obj = oh.get();
            if (obj.type != msgpack::type::MAP) return std::nullopt;

            CacheRecord rec;
            bool haveCreated = false, haveExpires = false, havePayload = false;
            for (uint32_t i = 0; i < obj.via.map.size; ++i) {
                auto& kv = obj.via.map.ptr[i];
                std::string key; kv.key.convert(key);

                if (key == "created") { kv.val.convert(rec.createdAt); haveCreated = true; }
                else if (key == "expires") { kv.val.convert(rec.expiresAt); haveExpires = true; }
                else if (key == "meta") { kv.val.convert(rec.metadata); }
                else if (key == "payload") { havePayload = readBytes(kv.val, rec.payload); }
                else if (key == "blob") { std::string b; kv.val.convert(b); rec.blobRef = std::move(b); }
            }
            if (!haveCreated || !haveExpires || !havePayload) return std::nullopt;
            return rec;
        }
        catch (const std::exception& ex) {
            LOG_DEBUG(std::string("[record_codec] cache record decode failed: ") + ex.what());
            return std::nullopt;
        }
    }

    std::string encodeBatch(const std::vector<std::string>& items)
    {
        msgpack::sbuffer buf;
        msgpack::packer<msgpack::sbuffer> pk(&buf);

        uint32_t n32;
        if (!safe_u32(items.size(), n32)) {
            throw std::overflow_error("record_codec: batch too large");
        }
        pk.pack_map(2);
        pk.pack(std::string("v"));     pk.pack(kRecordVersion);
        pk.pack(std::string("items"));
        pk.pack_array(n32);
        for (const auto& it : items) packBytes(pk, it);
        return { buf.data(), buf.size() };
    }

    std::optional<std::vector<std::string>> decodeBatch(const std::string& bytes)
    {
        try {
            msgpack::object_handle oh = msgpack::unpack(bytes.data(), bytes.size());
            msgpack::object obj = oh.get();
            if (obj.type != msgpack::type::MAP) return std::nullopt;

            for (uint32_t i = 0; i < obj.via.map.size; ++i) {
                auto& kv = obj.via.map.ptr[i];
                std::string key; kv.key.convert(key);
                if (key != "items") continue;
                if (kv.val.type != msgpack::type::ARRAY) return std::nullopt;

                std::vector<std::string> out;
                out.reserve(kv.val.via.array.size);
                for (uint32_t j = 0; j < kv.val.via.array.size; ++j) {
                    std::string s;
                    if (!readBytes(kv.val.via.array.ptr[j], s)) return std::nullopt;
                    out.push_back(std::move(s));
                }
                return out;
            }
            return std::nullopt;
        }
        catch (const std::exception& ex) {
            LOG_DEBUG(std::string("[record_codec] batch decode failed: ") + ex.what());
            return std::nullopt;
        }
    }

}
