#include "flagsync/core/client_options.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <jwt-cpp/traits/nlohmann-json/defaults.h>

namespace flagsync {

    namespace {

        template<typename T>
        void readField(const nlohmann::json& j, const char* name, T& out)
        {
            auto it = j.find(name);
            if (it == j.end() || it->is_null()) return;
            try {
                out = it->get<T>();
            } catch (const nlohmann::json::exception& ex) {
                throw std::invalid_argument(std::string("option '") + name + "' has the wrong type: " + ex.what());
            }
        }

        void readSession(const nlohmann::json& j, SessionOptions& s)
        {
            if (!j.is_object()) throw std::invalid_argument("option 'session' must be an object");
            readField(j, "maxSessionDurationMs", s.maxSessionDurationMs);
            readField(j, "minSessionDurationMs", s.minSessionDurationMs);
            readField(j, "backgroundThresholdMs", s.backgroundThresholdMs);
            readField(j, "rotateOnAppRestart", s.rotateOnAppRestart);
            readField(j, "rotateOnAuthChange", s.rotateOnAuthChange);
            readField(j, "sessionIdPrefix", s.sessionIdPrefix);
            readField(j, "enableTimeBasedRotation", s.enableTimeBasedRotation);
        }

        void readUser(const nlohmann::json& j, UserContext& u)
        {
            if (!j.is_object()) throw std::invalid_argument("option 'user' must be an object");
            std::string id;
            readField(j, "customerId", id);
            if (!id.empty()) {
                u.customerId = id;
                u.anonymous = false;
            }
            readField(j, "anonymous", u.anonymous);
            if (auto it = j.find("properties"); it != j.end()) {
                if (!it->is_object()) throw std::invalid_argument("option 'user.properties' must be an object");
                u.properties = *it;
            }
        }

        void require(bool ok, const char* what)
        {
            if (!ok) throw std::invalid_argument(what);
        }

        std::string trimSlash(std::string url)
        {
            while (!url.empty() && url.back() == '/') url.pop_back();
            return url;
        }

    }

    UserContext UserContext::identified(std::string id, nlohmann::json props)
    {
        UserContext u;
        u.customerId = std::move(id);
        u.anonymous = false;
        u.properties = props.is_object() ? std::move(props) : nlohmann::json::object();
        return u;
    }

    nlohmann::json UserContext::toJson() const
    {
        nlohmann::json j = nlohmann::json::object();
        if (customerId) j["user_customer_id"] = *customerId;
        j["anonymous"] = anonymous;
        j["properties"] = properties;
        return j;
    }

    ClientOptions ClientOptions::fromJson(const nlohmann::json& j)
    {
        if (!j.is_object()) throw std::invalid_argument("client options must be a JSON object");

        ClientOptions o;
        readField(j, "clientKey", o.clientKey);
        readField(j, "settingsBaseUrl", o.settingsBaseUrl);
        readField(j, "apiBaseUrl", o.apiBaseUrl);

        readField(j, "eventsQueueSize", o.eventsQueueSize);
        readField(j, "eventsFlushIntervalMs", o.eventsFlushIntervalMs);
        readField(j, "maxStoredEvents", o.maxStoredEvents);
        readField(j, "summariesQueueSize", o.summariesQueueSize);
        readField(j, "summariesFlushIntervalMs", o.summariesFlushIntervalMs);
        readField(j, "batchSize", o.batchSize);

        readField(j, "maxRetryAttempts", o.maxRetryAttempts);
        readField(j, "retryInitialDelayMs", o.retryInitialDelayMs);
        readField(j, "retryMaxDelayMs", o.retryMaxDelayMs);
        readField(j, "retryBackoffMultiplier", o.retryBackoffMultiplier);
        readField(j, "retryJitterFactor", o.retryJitterFactor);

        readField(j, "circuitFailureThreshold", o.circuitFailureThreshold);
        readField(j, "circuitResetTimeoutMs", o.circuitResetTimeoutMs);
        readField(j, "circuitHalfOpenTimeoutMs", o.circuitHalfOpenTimeoutMs);

        readField(j, "settingsCheckIntervalMs", o.settingsCheckIntervalMs);
        readField(j, "reducedSettingsCheckIntervalMs", o.reducedSettingsCheckIntervalMs);
        readField(j, "settingsCheckTimeoutMs", o.settingsCheckTimeoutMs);
        readField(j, "disableBackgroundPolling", o.disableBackgroundPolling);
        readField(j, "useReducedPollingWhenBatteryLow", o.useReducedPollingWhenBatteryLow);
        readField(j, "offlineMode", o.offlineMode);

        readField(j, "configCacheTtlSeconds", o.configCacheTtlSeconds);
        readField(j, "cacheSweepIntervalMs", o.cacheSweepIntervalMs);
        readField(j, "cacheBlobThresholdBytes", o.cacheBlobThresholdBytes);

        readField(j, "logLevel", o.logLevel);
        readField(j, "loggingEnabled", o.loggingEnabled);
        readField(j, "workerThreads", o.workerThreads);

        if (auto it = j.find("session"); it != j.end()) readSession(*it, o.session);
        if (auto it = j.find("user"); it != j.end()) readUser(*it, o.user);
        return o;
    }

    ClientOptions ClientOptions::fromFile(const std::string& path)
    {
        std::ifstream in(path);
        if (!in) throw std::invalid_argument("cannot open options file " + path);
        std::stringstream ss;
        ss << in.rdbuf();
        auto j = nlohmann::json::parse(ss.str(), nullptr, false);
        if (j.is_discarded()) throw std::invalid_argument("options file " + path + " is not valid JSON");
        return fromJson(j);
    }

    void ClientOptions::validate() const
    {
        require(!clientKey.empty(), "clientKey is required");
        decodeDimensionId(clientKey);
        require(!settingsBaseUrl.empty(), "settingsBaseUrl must not be empty");
        require(!apiBaseUrl.empty(), "apiBaseUrl must not be empty");

        require(eventsQueueSize > 0, "eventsQueueSize must be positive");
        require(summariesQueueSize > 0, "summariesQueueSize must be positive");
        require(batchSize > 0, "batchSize must be positive");
        require(eventsFlushIntervalMs > 0, "eventsFlushIntervalMs must be positive");
        require(summariesFlushIntervalMs > 0, "summariesFlushIntervalMs must be positive");

        require(maxRetryAttempts > 0, "maxRetryAttempts must be positive");
        require(retryInitialDelayMs <= retryMaxDelayMs, "retryInitialDelayMs must not exceed retryMaxDelayMs");
        require(retryBackoffMultiplier >= 1.0, "retryBackoffMultiplier must be at least 1");
        require(retryJitterFactor >= 0.0 && retryJitterFactor <= 1.0, "retryJitterFactor must be within [0, 1]");

        require(circuitFailureThreshold > 0, "circuitFailureThreshold must be positive");
        require(settingsCheckIntervalMs > 0, "settingsCheckIntervalMs must be positive");
        require(reducedSettingsCheckIntervalMs > 0, "reducedSettingsCheckIntervalMs must be positive");
        require(settingsCheckTimeoutMs > 0, "settingsCheckTimeoutMs must be positive");
        require(configCacheTtlSeconds > 0, "configCacheTtlSeconds must be positive");
        require(cacheSweepIntervalMs > 0, "cacheSweepIntervalMs must be positive");

        require(session.maxSessionDurationMs > 0, "session.maxSessionDurationMs must be positive");
        require(!session.sessionIdPrefix.empty(), "session.sessionIdPrefix must not be empty");

        require(parseLogLevel(logLevel).has_value(), "logLevel must be one of TRACE, DEBUG, INFO, WARN, ERROR, OFF");
        require(workerThreads >= 2, "workerThreads must be at least 2");
        require(user.properties.is_object(), "user.properties must be an object");
    }

    std::string ClientOptions::dimensionId() const
    {
        return decodeDimensionId(clientKey);
    }

    LogLevel ClientOptions::effectiveLogLevel() const
    {
        if (!loggingEnabled) return LogLevel::Off;
        return parseLogLevel(logLevel).value_or(LogLevel::Info);
    }

    std::string ClientOptions::settingsUrl() const
    {
        return trimSlash(settingsBaseUrl) + "/" + dimensionId() + "/cf-sdk-settings.json";
    }

    std::string ClientOptions::configUrl() const
    {
        return trimSlash(apiBaseUrl) + "/v1/users/configs?cfenc=" + clientKey;
    }

    std::string ClientOptions::eventsUrl() const
    {
        return trimSlash(apiBaseUrl) + "/v1/cfe?cfenc=" + clientKey;
    }

    std::string ClientOptions::summariesUrl() const
    {
        return trimSlash(apiBaseUrl) + "/v1/config/request/summary?cfenc=" + clientKey;
    }

    std::string decodeDimensionId(const std::string& clientKey)
    {
        std::string id;
        try {
            auto decoded = jwt::decode(clientKey);
            if (!decoded.has_payload_claim("dimension_id"))
                throw std::invalid_argument("client key has no dimension_id claim");
            id = decoded.get_payload_claim("dimension_id").as_string();
        } catch (const std::invalid_argument&) {
            throw;
        } catch (const std::exception& ex) {
            throw std::invalid_argument(std::string("client key is not a valid JWT: ") + ex.what());
        }
        if (id.empty()) throw std::invalid_argument("client key has an empty dimension_id claim");
        return id;
    }

}
