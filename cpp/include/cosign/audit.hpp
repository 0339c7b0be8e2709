#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cosign
{
    struct AuditEvent
    {
        Timestamp ts{0};
        std::string actor;
        std::string action;   // e.g. "proposal.created", "validator.removed"
        std::string resource; // proposal or validator id
        std::string result;   // "ok" or an error code name
        nlohmann::json details = nlohmann::json::object();

        nlohmann::json to_json() const;
    };

    /**
     * AuditTrail links lifecycle events with a SHA-256 hash chain: each
     * link hashes the previous head together with the event's JSON, so a
     * removed or reordered entry breaks every later hash. Every appended
     * event is also written to the log as one JSON line.
     */
    class AuditTrail
    {
    public:
        AuditTrail() = default;

        /** Append an event, returning its chain hash */
        std::string append(const AuditEvent &event);

        std::optional<std::string> head() const;

        std::size_t size() const;

        /** Recompute the chain from the retained events and compare hashes */
        bool verify() const;

    private:
        static std::string link(const std::string &previous, const AuditEvent &event);

        mutable std::mutex mutex_;
        std::vector<AuditEvent> events_;
        std::vector<std::string> hashes_;
    };

} // namespace cosign
