#include <catch2/catch_all.hpp>
#include <msgpack.hpp>
#include "internal/core/codec/record_codec.hpp"

using namespace flagsync::internal;

TEST_CASE("cache records keep their payload, metadata and blob reference", "[codec]") {
    CacheRecord rec;
    rec.createdAt = 1000;
    rec.expiresAt = 61000;
    rec.metadata = { { "etag", "\"abc\"" }, { "last_modified", "Tue" } };
    rec.blobRef = "cf_cache_cfg.blob";

    auto back = decodeCacheRecord(encodeCacheRecord(rec));
    REQUIRE(back);
    REQUIRE(back->createdAt == 1000);
    REQUIRE(back->expiresAt == 61000);
    REQUIRE(back->metadata == rec.metadata);
    REQUIRE(back->payload.empty());
    REQUIRE(back->blobRef == rec.blobRef);
}

TEST_CASE("payloads with embedded zero bytes survive", "[codec]") {
    CacheRecord rec;
    rec.payload = std::string("a\0b", 3);
    auto back = decodeCacheRecord(encodeCacheRecord(rec));
    REQUIRE(back);
    REQUIRE(back->payload.size() == 3);
    REQUIRE_FALSE(back->blobRef);
}

TEST_CASE("malformed bytes decode to nullopt", "[codec]") {
    REQUIRE_FALSE(decodeCacheRecord("").has_value());
    REQUIRE_FALSE(decodeCacheRecord("\xc1").has_value());
    REQUIRE_FALSE(decodeBatch("not msgpack at all").has_value());

    // valid msgpack of the wrong shape
    msgpack::sbuffer buf;
    msgpack::pack(buf, 42);
    REQUIRE_FALSE(decodeCacheRecord(std::string(buf.data(), buf.size())).has_value());
    REQUIRE_FALSE(decodeBatch(std::string(buf.data(), buf.size())).has_value());
}

TEST_CASE("batches keep item order", "[codec]") {
    std::vector<std::string> items{ "{\"n\":1}", "{\"n\":2}", "{\"n\":3}" };
    auto back = decodeBatch(encodeBatch(items));
    REQUIRE(back);
    REQUIRE(*back == items);
    REQUIRE(decodeBatch(encodeBatch({}))->empty());
}
