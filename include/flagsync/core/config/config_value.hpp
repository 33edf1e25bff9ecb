/**
 * @file config_value.hpp
 * @brief Tagged flag value and the config entry / snapshot model.
 *
 * A flag's variation is classified once, when the config document is parsed,
 * into Bool, Number, String or Json. Reads then check the tag instead of
 * inspecting JSON at every call.
 */
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "flagsync/core/interfaces/itransport.hpp"

namespace flagsync {

    class ConfigValue {
    public:
        enum class Type : uint8_t { Bool, Number, String, Json };

        ConfigValue() : v_(std::in_place_index<3>) {}
        explicit ConfigValue(bool b) : v_(std::in_place_index<0>, b) {}
        explicit ConfigValue(double d) : v_(std::in_place_index<1>, d) {}
        explicit ConfigValue(std::string s) : v_(std::in_place_index<2>, std::move(s)) {}
        explicit ConfigValue(const char* s) : v_(std::in_place_index<2>, s) {}
        explicit ConfigValue(nlohmann::json j) : v_(std::in_place_index<3>, std::move(j)) {}

        /// Classify a JSON variation. Objects, arrays and null become Json.
        static ConfigValue fromJson(const nlohmann::json& j);

        nlohmann::json toJson() const;

        Type type() const { return static_cast<Type>(v_.index()); }
        bool isBool() const   { return type() == Type::Bool; }
        bool isNumber() const { return type() == Type::Number; }
        bool isString() const { return type() == Type::String; }
        bool isJson() const   { return type() == Type::Json; }

        /**
         * @brief Typed access.
         *
         * T may be bool, any arithmetic type (from Number), std::string or
         * nlohmann::json (any value converts to json).
         * @return nullopt when the tag does not match T
         */
        template<typename T>
        std::optional<T> as() const;

        bool operator==(const ConfigValue& o) const { return v_ == o.v_; }
        bool operator!=(const ConfigValue& o) const { return !(*this == o); }

    private:
        std::variant<bool, double, std::string, nlohmann::json> v_;
    };

    const char* toString(ConfigValue::Type t);

    template<typename T>
    std::optional<T> ConfigValue::as() const
    {
        if constexpr (std::is_same_v<T, bool>) {
            if (auto p = std::get_if<bool>(&v_)) return *p;
            return std::nullopt;
        } else if constexpr (std::is_arithmetic_v<T>) {
            if (auto p = std::get_if<double>(&v_)) return static_cast<T>(*p);
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (auto p = std::get_if<std::string>(&v_)) return *p;
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, nlohmann::json>) {
            return toJson();
        } else {
            static_assert(!sizeof(T), "unsupported ConfigValue type");
        }
    }

    /**
     * @struct ConfigMetadata
     * @brief Identifying fields of a flag, used to build usage summaries.
     */
    struct ConfigMetadata {
        std::optional<std::string> experienceId;
        std::optional<std::string> configId;
        std::optional<std::string> variationId;
        std::optional<std::string> version;
        std::optional<std::string> behaviourId;
        std::optional<std::string> ruleId;

        /// True when experienceId, configId, variationId and version are all set.
        bool hasSummaryFields() const {
            return experienceId && configId && variationId && version;
        }

        bool operator==(const ConfigMetadata&) const = default;
    };

    struct ConfigEntry {
        std::string    key;
        ConfigValue    value;      ///< Classified variation
        nlohmann::json raw;        ///< Entry as received
        ConfigMetadata metadata;
    };

    /**
     * @struct ConfigSnapshot
     * @brief Immutable flag map plus the validators it was fetched with.
     *
     * Published as shared_ptr<const ConfigSnapshot> and replaced wholesale.
     */
    struct ConfigSnapshot {
        std::map<std::string, ConfigEntry> entries;
        HttpMetadata                       metadata;

        const ConfigEntry* find(const std::string& key) const {
            auto it = entries.find(key);
            return it == entries.end() ? nullptr : &it->second;
        }

        /// key -> variation as JSON.
        nlohmann::json toFlagMap() const;
    };

    using SnapshotPtr = std::shared_ptr<const ConfigSnapshot>;

    /**
     * @struct ParsedConfig
     * @brief Result of parsing a config document.
     */
    struct ParsedConfig {
        std::map<std::string, ConfigEntry> entries;
        size_t                             discarded{ 0 };  ///< Entries dropped for having no variation
    };

    /**
     * @brief Parse a config document.
     *
     * Entries may be wrapped in a "configs" object. Each entry must be an
     * object with a "variation" field; others are discarded and counted.
     * Identifying fields are read from the entry or from its
     * "experience_behaviour_response" object.
     * @return Validation error when the document is not a JSON object
     */
    Result<ParsedConfig> parseConfigDocument(const nlohmann::json& doc);

    /**
     * @brief Keys whose value differs between two entry maps.
     *
     * Added and changed keys are reported, and so are removed keys.
     */
    std::vector<std::string> diffKeys(const std::map<std::string, ConfigEntry>& before,
                                      const std::map<std::string, ConfigEntry>& after);

}
