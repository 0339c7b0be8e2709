#include "cosign/audit.hpp"
#include "cosign/crypto.hpp"
#include <spdlog/spdlog.h>

namespace cosign
{

    nlohmann::json AuditEvent::to_json() const
    {
        return nlohmann::json{{"ts", to_iso8601(ts)},
                              {"actor", actor},
                              {"action", action},
                              {"resource", resource},
                              {"result", result},
                              {"details", details}};
    }

    std::string AuditTrail::link(const std::string &previous, const AuditEvent &event)
    {
        return crypto::SHA256::to_hex(crypto::SHA256::hash(previous + event.to_json().dump()));
    }

    std::string AuditTrail::append(const AuditEvent &event)
    {
        std::string hash;
        {
            std::lock_guard lock(mutex_);
            hash = link(hashes_.empty() ? std::string{} : hashes_.back(), event);
            events_.push_back(event);
            hashes_.push_back(hash);
        }

        nlohmann::json j = event.to_json();
        j["chain_hash"] = hash;
        spdlog::info("audit {}", j.dump());
        return hash;
    }

    std::optional<std::string> AuditTrail::head() const
    {
        std::lock_guard lock(mutex_);
        if (hashes_.empty())
            return std::nullopt;
        return hashes_.back();
    }

    std::size_t AuditTrail::size() const
    {
        std::lock_guard lock(mutex_);
        return hashes_.size();
    }

    bool AuditTrail::verify() const
    {
        std::lock_guard lock(mutex_);
        std::string previous;
        for (std::size_t i = 0; i < events_.size(); ++i)
        {
            auto expected = link(previous, events_[i]);
            if (expected != hashes_[i])
                return false;
            previous = expected;
        }
        return true;
    }

} // namespace cosign
