#include "flagsync/core/delivery/event.hpp"
#include "flagsync/core/util/time.hpp"
#include <algorithm>
#include <cctype>

namespace flagsync {

    Result<void> EventTraits::validate(const Event& e)
    {
        bool blank = std::all_of(e.name.begin(), e.name.end(),
            [](unsigned char c) { return std::isspace(c); });
        if (blank) return Error::validation("event name must not be blank");
        if (!e.properties.is_object()) return Error::validation("event properties must be an object");
        return Result<void>::success();
    }

    nlohmann::json EventTraits::toJson(const Event& e)
    {
        nlohmann::json j = {
            { "insert_id", e.eventId },
            { "event_customer_id", e.name },
            { "event_type", e.eventType },
            { "properties", e.properties },
            { "event_timestamp", formatTimestamp(e.timestampMs) }
        };
        if (!e.sessionId.empty()) j["session_id"] = e.sessionId;
        return j;
    }

    std::optional<Event> EventTraits::fromJson(const nlohmann::json& j)
    {
        if (!j.is_object()) return std::nullopt;
        auto name = j.find("event_customer_id");
        if (name == j.end() || !name->is_string()) return std::nullopt;

        Event e;
        e.name        = name->get<std::string>();
        e.eventId     = j.value("insert_id", std::string());
        e.eventType   = j.value("event_type", std::string("TRACK"));
        e.sessionId   = j.value("session_id", std::string());
        e.timestampMs = parseTimestamp(j.value("event_timestamp", std::string()));
        if (auto p = j.find("properties"); p != j.end() && p->is_object()) e.properties = *p;
        return e;
    }

}
