/**
 * @file client_options.hpp
 * @brief Client configuration, user identity and their JSON loaders.
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "flagsync/core/session/session_lifecycle.hpp"
#include "flagsync/core/util/logger.hpp"

namespace flagsync {

    /**
     * @struct UserContext
     * @brief The user every event and summary batch is attributed to.
     */
    struct UserContext {
        std::optional<std::string> customerId;
        bool                       anonymous{ true };
        nlohmann::json             properties = nlohmann::json::object();

        static UserContext identified(std::string id, nlohmann::json props = nlohmann::json::object());

        /// {"user_customer_id"?, "anonymous", "properties"} as sent in request bodies.
        nlohmann::json toJson() const;
    };

    /**
     * @struct ClientOptions
     * @brief Every tunable of a Client. Defaults match the hosted service.
     *
     * Construct directly or load with fromJson()/fromFile(); JSON keys use
     * the field names below, with the session knobs under "session" and the
     * user under "user" ({"customerId", "anonymous", "properties"}).
     */
    struct ClientOptions {
        std::string clientKey;
        std::string settingsBaseUrl{ "https://sdk.customfit.ai" };
        std::string apiBaseUrl{ "https://api.customfit.ai" };

        uint32_t eventsQueueSize{ 100 };
        uint32_t eventsFlushIntervalMs{ 1000 };
        uint32_t maxStoredEvents{ 100 };
        uint32_t summariesQueueSize{ 100 };
        uint32_t summariesFlushIntervalMs{ 60000 };
        uint32_t batchSize{ 100 };

        uint32_t maxRetryAttempts{ 3 };
        uint32_t retryInitialDelayMs{ 1000 };
        uint32_t retryMaxDelayMs{ 30000 };
        double   retryBackoffMultiplier{ 2.0 };
        double   retryJitterFactor{ 0.5 };

        uint32_t circuitFailureThreshold{ 3 };
        uint64_t circuitResetTimeoutMs{ 30000 };
        uint64_t circuitHalfOpenTimeoutMs{ 30000 };

        uint64_t settingsCheckIntervalMs{ 300000 };
        uint64_t reducedSettingsCheckIntervalMs{ 600000 };
        uint64_t settingsCheckTimeoutMs{ 10000 };
        bool     disableBackgroundPolling{ false };
        bool     useReducedPollingWhenBatteryLow{ true };
        bool     offlineMode{ false };

        uint64_t configCacheTtlSeconds{ 86400 };
        uint64_t cacheSweepIntervalMs{ 3600000 };
        size_t   cacheBlobThresholdBytes{ 100 * 1024 };

        SessionOptions session;

        std::string logLevel{ "INFO" };
        bool        loggingEnabled{ true };

        /// Worker threads of the client's pool; at least 2.
        uint32_t workerThreads{ 4 };

        UserContext user;

        /**
         * @brief Parse options from a JSON object; absent keys keep their defaults.
         * @throws std::invalid_argument on a non-object document or a mistyped field
         */
        static ClientOptions fromJson(const nlohmann::json& j);

        /// @throws std::invalid_argument when the file is missing or malformed
        static ClientOptions fromFile(const std::string& path);

        /**
         * @brief Check every field, including that clientKey decodes.
         * @throws std::invalid_argument naming the offending field
         */
        void validate() const;

        /// `dimension_id` claim of the client key (a JWT).
        std::string dimensionId() const;

        /// Effective logger level: Off when logging is disabled.
        LogLevel effectiveLogLevel() const;

        std::string settingsUrl() const;
        std::string configUrl() const;
        std::string eventsUrl() const;
        std::string summariesUrl() const;
    };

    /**
     * @brief Extract the `dimension_id` claim from a client key.
     * @throws std::invalid_argument when the key is not a JWT or lacks the claim
     */
    std::string decodeDimensionId(const std::string& clientKey);

}
