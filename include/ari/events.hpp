#pragma once

#include "audit.hpp"
#include "event_bus.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace ari
{

    /** Payload of the audit ingestion channel */
    struct AuditLogRequest
    {
        std::string action;
        std::string actor;
        std::string trust_level{"standard"}; // system | operator | verified | standard
        nlohmann::json details = nlohmann::json::object();
    };

    /** Raised when the bridge gives up on an audit request */
    struct AuditUnavailableEvent
    {
        std::string action;
        std::string actor;
        std::uint32_t attempts{0};
        std::string error;
        std::string timestamp;

        nlohmann::json to_json() const
        {
            return nlohmann::json{{"action", action},
                                  {"actor", actor},
                                  {"attempts", attempts},
                                  {"error", error},
                                  {"timestamp", timestamp}};
        }
    };

    inline constexpr Topic<AuditLogRequest> kAuditLog{"audit:log"};
    inline constexpr Topic<AuditEntry> kAuditLogged{"audit:logged"};
    inline constexpr Topic<AuditUnavailableEvent> kAuditUnavailable{"audit:unavailable"};

} // namespace ari
