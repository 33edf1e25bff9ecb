#include "flagsync/core/delivery/summary.hpp"
#include "flagsync/core/util/time.hpp"

namespace flagsync {

    namespace {

        void putOpt(nlohmann::json& j, const char* name, const std::optional<std::string>& v)
        {
            if (v) j[name] = *v;
        }

        std::optional<std::string> getOpt(const nlohmann::json& j, const char* name)
        {
            auto it = j.find(name);
            if (it == j.end() || !it->is_string()) return std::nullopt;
            return it->get<std::string>();
        }

    }

    Summary Summary::fromEntry(const ConfigEntry& e)
    {
        Summary s;
        s.configId     = e.metadata.configId;
        s.version      = e.metadata.version;
        s.variationId  = e.metadata.variationId;
        s.experienceId = e.metadata.experienceId;
        s.behaviourId  = e.metadata.behaviourId;
        s.ruleId       = e.metadata.ruleId;
        return s;
    }

    Result<void> SummaryTraits::validate(const Summary& s)
    {
        if (!s.configId || s.configId->empty())       return Error::validation("summary is missing config_id");
        if (!s.variationId || s.variationId->empty()) return Error::validation("summary is missing variation_id");
        if (!s.version || s.version->empty())         return Error::validation("summary is missing version");
        return Result<void>::success();
    }

    nlohmann::json SummaryTraits::toJson(const Summary& s)
    {
        nlohmann::json j = nlohmann::json::object();
        putOpt(j, "config_id", s.configId);
        putOpt(j, "version", s.version);
        putOpt(j, "variation_id", s.variationId);
        putOpt(j, "experience_id", s.experienceId);
        putOpt(j, "behaviour_id", s.behaviourId);
        putOpt(j, "rule_id", s.ruleId);
        putOpt(j, "user_id", s.userId);
        putOpt(j, "user_customer_id", s.userCustomerId);
        putOpt(j, "session_id", s.sessionId);
        j["requested_time"] = formatTimestamp(s.requestedTimeMs);
        return j;
    }

    std::optional<Summary> SummaryTraits::fromJson(const nlohmann::json& j)
    {
        if (!j.is_object()) return std::nullopt;
        Summary s;
        s.configId       = getOpt(j, "config_id");
        s.version        = getOpt(j, "version");
        s.variationId    = getOpt(j, "variation_id");
        s.experienceId   = getOpt(j, "experience_id");
        s.behaviourId    = getOpt(j, "behaviour_id");
        s.ruleId         = getOpt(j, "rule_id");
        s.userId         = getOpt(j, "user_id");
        s.userCustomerId = getOpt(j, "user_customer_id");
        s.sessionId      = getOpt(j, "session_id");
        if (auto t = getOpt(j, "requested_time")) s.requestedTimeMs = parseTimestamp(*t);
        return s;
    }

}
