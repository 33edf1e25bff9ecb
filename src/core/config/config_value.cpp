#include "flagsync/core/config/config_value.hpp"
#include "flagsync/core/util/logger.hpp"

namespace flagsync {

    namespace {

        /// Identifiers arrive as strings or numbers depending on the backend.
        std::optional<std::string> idField(const nlohmann::json& obj, const char* name)
        {
            auto it = obj.find(name);
            if (it == obj.end() || it->is_null()) return std::nullopt;
            if (it->is_string()) return it->get<std::string>();
            if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
            if (it->is_number()) return it->dump();
            return std::nullopt;
        }

        void readIds(const nlohmann::json& obj, ConfigMetadata& m)
        {
            if (auto v = idField(obj, "experience_id")) m.experienceId = v;
            if (auto v = idField(obj, "config_id"))     m.configId = v;
            if (auto v = idField(obj, "variation_id"))  m.variationId = v;
            if (auto v = idField(obj, "version"))       m.version = v;
            if (auto v = idField(obj, "behaviour_id"))  m.behaviourId = v;
            if (auto v = idField(obj, "rule_id"))       m.ruleId = v;
        }

    }

    const char* toString(ConfigValue::Type t)
    {
        switch (t) {
            case ConfigValue::Type::Bool:   return "bool";
            case ConfigValue::Type::Number: return "number";
            case ConfigValue::Type::String: return "string";
            case ConfigValue::Type::Json:   return "json";
        }
        return "unknown";
    }

    ConfigValue ConfigValue::fromJson(const nlohmann::json& j)
    {
        if (j.is_boolean()) return ConfigValue(j.get<bool>());
        if (j.is_number())  return ConfigValue(j.get<double>());
        if (j.is_string())  return ConfigValue(j.get<std::string>());
        return ConfigValue(j);
    }

    nlohmann::json ConfigValue::toJson() const
    {
        return std::visit([](const auto& v) -> nlohmann::json { return v; }, v_);
    }

    nlohmann::json ConfigSnapshot::toFlagMap() const
    {
        nlohmann::json out = nlohmann::json::object();
        for (const auto& [k, e] : entries) out[k] = e.value.toJson();
        return out;
    }

    Result<ParsedConfig> parseConfigDocument(const nlohmann::json& doc)
    {
        if (!doc.is_object()) {
            return Error::validation("config document is not an object");
        }
        const nlohmann::json* body = &doc;
        auto wrapped = doc.find("configs");
        if (wrapped != doc.end()) {
            if (!wrapped->is_object()) return Error::validation("\"configs\" is not an object");
            body = &*wrapped;
        }

        ParsedConfig out;
        for (auto it = body->begin(); it != body->end(); ++it) {
            const auto& raw = it.value();
            if (!raw.is_object() || !raw.contains("variation")) {
                LOG_WARN("[Config] discarding entry '" + it.key() + "': no variation");
                ++out.discarded;
                continue;
            }

            ConfigEntry e;
            e.key   = it.key();
            e.value = ConfigValue::fromJson(raw.at("variation"));
            e.raw   = raw;
            readIds(raw, e.metadata);
            auto ebr = raw.find("experience_behaviour_response");
            if (ebr != raw.end() && ebr->is_object()) {
                ConfigMetadata nested;
                readIds(*ebr, nested);
                if (!e.metadata.experienceId) e.metadata.experienceId = nested.experienceId;
                if (!e.metadata.behaviourId)  e.metadata.behaviourId = nested.behaviourId;
                if (!e.metadata.ruleId)       e.metadata.ruleId = nested.ruleId;
            }
            out.entries.emplace(e.key, std::move(e));
        }
        return out;
    }

    std::vector<std::string> diffKeys(const std::map<std::string, ConfigEntry>& before,
                                      const std::map<std::string, ConfigEntry>& after)
    {
        std::vector<std::string> changed;
        for (const auto& [k, e] : after) {
            auto it = before.find(k);
            if (it == before.end() || it->second.value != e.value) changed.push_back(k);
        }
        for (const auto& [k, e] : before) {
            if (!after.count(k)) changed.push_back(k);
        }
        return changed;
    }

}
