/**
 * @file event.hpp
 * @brief Tracked analytics event and its queue traits.
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "flagsync/core/util/error_types.hpp"

namespace flagsync {

    struct Event {
        std::string    eventId;                                  ///< insert_id
        std::string    name;                                     ///< event_customer_id
        nlohmann::json properties{ nlohmann::json::object() };
        uint64_t       timestampMs{ 0 };
        std::string    sessionId;
        std::string    eventType{ "TRACK" };
    };

    /**
     * @struct EventTraits
     * @brief DeliveryQueue policy for events: non-blank name, no dedup.
     */
    struct EventTraits {
        static constexpr const char* kPayloadKey = "events";

        static Result<void> validate(const Event& e);
        static std::optional<std::string> dedupKey(const Event&) { return std::nullopt; }
        static nlohmann::json toJson(const Event& e);
        static std::optional<Event> fromJson(const nlohmann::json& j);
    };

}
