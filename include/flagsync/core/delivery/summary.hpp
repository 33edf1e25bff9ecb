/**
 * @file summary.hpp
 * @brief Config usage summary and its queue traits.
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "flagsync/core/config/config_value.hpp"
#include "flagsync/core/util/error_types.hpp"

namespace flagsync {

    /**
     * @struct Summary
     * @brief One flag evaluation reported back to the platform.
     */
    struct Summary {
        std::optional<std::string> configId;
        std::optional<std::string> version;
        std::optional<std::string> variationId;
        std::optional<std::string> experienceId;
        std::optional<std::string> behaviourId;
        std::optional<std::string> ruleId;
        std::optional<std::string> userId;
        std::optional<std::string> userCustomerId;
        std::optional<std::string> sessionId;
        uint64_t                   requestedTimeMs{ 0 };

        /// Copy the identifying fields of a config entry.
        static Summary fromEntry(const ConfigEntry& e);
    };

    /**
     * @struct SummaryTraits
     * @brief DeliveryQueue policy for summaries: configId, variationId and
     *        version required; deduplicated by experienceId.
     */
    struct SummaryTraits {
        static constexpr const char* kPayloadKey = "summaries";

        static Result<void> validate(const Summary& s);
        static std::optional<std::string> dedupKey(const Summary& s) { return s.experienceId; }
        static nlohmann::json toJson(const Summary& s);
        static std::optional<Summary> fromJson(const nlohmann::json& j);
    };

}
