#include "cosign/notification.hpp"
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>

namespace cosign
{

    std::string_view to_string(NotificationType type)
    {
        switch (type)
        {
        case NotificationType::NewProposal:
            return "new_proposal";
        case NotificationType::SignatureAdded:
            return "signature_added";
        case NotificationType::ProposalExecuted:
            return "proposal_executed";
        case NotificationType::ProposalCancelled:
            return "proposal_cancelled";
        case NotificationType::ProposalExpired:
            return "proposal_expired";
        }
        return "unknown";
    }

    std::string_view to_string(ChannelType type)
    {
        switch (type)
        {
        case ChannelType::Push:
            return "push";
        case ChannelType::Email:
            return "email";
        case ChannelType::Sms:
            return "sms";
        }
        return "unknown";
    }

    Result<ChannelType> channel_type_from_string(std::string_view s)
    {
        if (s == "push")
            return ChannelType::Push;
        if (s == "email")
            return ChannelType::Email;
        if (s == "sms")
            return ChannelType::Sms;
        return std::unexpected(CosignError::invalid_input(std::format("Invalid channel type: {}", s)));
    }

    namespace
    {
        struct PayloadToJson
        {
            nlohmann::json operator()(const NewProposalPayload &p) const
            {
                return {{"proposalId", p.proposal_id},
                        {"proposal", {{"id", p.proposal_id},
                                      {"createdBy", p.created_by},
                                      {"to", p.to},
                                      {"value", p.value},
                                      {"requiredSignatures", p.required_signatures},
                                      {"expiresAt", p.expires_at}}}};
            }

            nlohmann::json operator()(const SignatureAddedPayload &p) const
            {
                return {{"proposalId", p.proposal_id},
                        {"validatorId", p.validator_id},
                        {"collectedSignatures", p.collected_signatures},
                        {"requiredSignatures", p.required_signatures},
                        {"remainingSignatures", p.remaining_signatures}};
            }

            nlohmann::json operator()(const ProposalExecutedPayload &p) const
            {
                return {{"proposalId", p.proposal_id},
                        {"transactionHash", p.transaction_hash},
                        {"executedAt", p.executed_at}};
            }

            nlohmann::json operator()(const ProposalCancelledPayload &p) const
            {
                return {{"proposalId", p.proposal_id},
                        {"cancelledBy", p.cancelled_by},
                        {"cancelledAt", p.cancelled_at}};
            }

            nlohmann::json operator()(const ProposalExpiredPayload &p) const
            {
                return {{"proposalId", p.proposal_id},
                        {"expiredAt", p.expired_at},
                        {"collectedSignatures", p.collected_signatures},
                        {"requiredSignatures", p.required_signatures}};
            }
        };
    } // namespace

    NotificationType NotificationMessage::type() const
    {
        return static_cast<NotificationType>(payload.index());
    }

    const std::string &NotificationMessage::proposal_id() const
    {
        return std::visit([](const auto &p) -> const std::string & { return p.proposal_id; }, payload);
    }

    nlohmann::json NotificationMessage::to_json() const
    {
        return {{"id", id},
                {"type", to_string(type())},
                {"title", title},
                {"message", message},
                {"data", std::visit(PayloadToJson{}, payload)},
                {"timestamp", timestamp},
                {"read", read}};
    }

    namespace notices
    {
        NotificationMessage new_proposal(const Proposal &p, std::vector<std::string> recipients, Timestamp now)
        {
            return {std::format("new_proposal_{}", p.id),
                    "New Multi-Sig Proposal",
                    std::format("New proposal requires your signature: {} ETH to {}", p.value, p.to),
                    NewProposalPayload{p.id, p.created_by, p.to, p.value, p.required_signatures, p.expires_at},
                    now,
                    std::move(recipients)};
        }

        NotificationMessage signature_added(const Proposal &p, std::string_view validator_id,
                                            std::vector<std::string> recipients, Timestamp now)
        {
            auto remaining = p.remaining_signatures();
            return {std::format("signature_added_{}_{}", p.id, validator_id),
                    "Proposal Signed",
                    std::format("Proposal signed. {} more signature(s) needed.", remaining),
                    SignatureAddedPayload{p.id, std::string(validator_id), p.collected_signatures(),
                                          p.required_signatures, remaining},
                    now,
                    std::move(recipients)};
        }

        NotificationMessage proposal_executed(const Proposal &p, std::vector<std::string> recipients, Timestamp now)
        {
            return {std::format("proposal_executed_{}", p.id),
                    "Proposal Executed",
                    "Multi-sig proposal has been executed successfully!",
                    ProposalExecutedPayload{p.id, p.transaction_hash.value_or(""), p.executed_at.value_or(now)},
                    now,
                    std::move(recipients)};
        }

        NotificationMessage proposal_cancelled(const Proposal &p, std::string_view cancelled_by,
                                               std::vector<std::string> recipients, Timestamp now)
        {
            return {std::format("proposal_cancelled_{}", p.id),
                    "Proposal Cancelled",
                    "Multi-sig proposal has been cancelled.",
                    ProposalCancelledPayload{p.id, std::string(cancelled_by), now},
                    now,
                    std::move(recipients)};
        }

        NotificationMessage proposal_expired(const Proposal &p, std::vector<std::string> recipients, Timestamp now)
        {
            return {std::format("proposal_expired_{}", p.id),
                    "Proposal Expired",
                    "Multi-sig proposal has expired without enough signatures.",
                    ProposalExpiredPayload{p.id, now, p.collected_signatures(), p.required_signatures},
                    now,
                    std::move(recipients)};
        }
    } // namespace notices

    std::string make_frame(std::string_view type, const nlohmann::json &data)
    {
        return nlohmann::json{{"type", type}, {"data", data}}.dump();
    }

    nlohmann::json DeviceInfo::to_json() const
    {
        return {{"deviceId", device_id}, {"name", name}, {"capabilities", capabilities}, {"platform", platform}};
    }

    DeviceInfo DeviceInfo::from_json(const nlohmann::json &j)
    {
        DeviceInfo d;
        d.device_id = j.value("deviceId", "");
        d.name = j.value("name", "");
        d.platform = j.value("platform", "");
        if (j.contains("capabilities") && j["capabilities"].is_array())
        {
            for (const auto &c : j["capabilities"])
            {
                if (c.is_string())
                    d.capabilities.push_back(c.get<std::string>());
            }
        }
        return d;
    }

    Result<void> LoggingSideChannelSender::deliver(const std::string &user,
                                                   const NotificationChannel &channel,
                                                   const NotificationMessage &message)
    {
        spdlog::info("{} notification to {} ({}): {}", to_string(channel.type), user, channel.endpoint, message.title);
        return {};
    }

    nlohmann::json ResyncSnapshot::to_json() const
    {
        nlohmann::json pending = nlohmann::json::array();
        for (const auto &p : pending_proposals)
            pending.push_back(p.to_json());
        nlohmann::json recent = nlohmann::json::array();
        for (const auto &n : recent_notifications)
            recent.push_back(n.to_json());
        return {{"pendingProposals", pending}, {"recentNotifications", recent}, {"serverTime", server_time}};
    }

    NotificationHub::NotificationHub(NotificationConfig cfg,
                                     std::shared_ptr<const Clock> clock,
                                     std::shared_ptr<SideChannelSender> sender,
                                     std::size_t side_channel_threads)
        : cfg_(std::move(cfg)),
          clock_(std::move(clock)),
          sender_(sender ? std::move(sender) : std::make_shared<LoggingSideChannelSender>()),
          pool_(side_channel_threads == 0 ? 1 : side_channel_threads)
    {
    }

    NotificationHub::~NotificationHub()
    {
        pool_.join();
    }

    void NotificationHub::publish(const NotificationMessage &message)
    {
        std::vector<std::pair<std::string, std::vector<std::shared_ptr<Connection>>>> targets;
        {
            std::lock_guard lock(mutex_);
            for (const auto &user : message.recipients)
            {
                auto &history = history_[user];
                history.push_front(message);
                while (history.size() > cfg_.history_limit)
                    history.pop_back();

                auto it = connections_.find(user);
                if (it != connections_.end())
                    targets.emplace_back(user, it->second);
            }
        }

        auto frame = make_frame("notification", message.to_json());
        std::size_t delivered = 0;
        for (const auto &[user, conns] : targets)
        {
            for (const auto &conn : conns)
            {
                conn->send(frame);
                ++delivered;
            }
        }
        spdlog::debug("notification {} sent to {} connection(s)", message.id, delivered);

        for (const auto &user : message.recipients)
            dispatch_side_channels(user, message);
    }

    void NotificationHub::dispatch_side_channels(const std::string &user, const NotificationMessage &message)
    {
        std::vector<NotificationChannel> enabled;
        {
            std::lock_guard lock(mutex_);
            auto it = channels_.find(user);
            if (it == channels_.end())
                return;
            for (const auto &ch : it->second)
            {
                if (ch.enabled)
                    enabled.push_back(ch);
            }
        }

        for (auto &channel : enabled)
        {
            {
                std::lock_guard lock(side_mutex_);
                ++side_in_flight_;
            }
            boost::asio::post(pool_, [this, user, channel = std::move(channel), message]()
                              {
                try
                {
                    if (auto res = sender_->deliver(user, channel, message); !res)
                    {
                        spdlog::warn("{} delivery to {} failed: {}", to_string(channel.type), user, res.error().what());
                    }
                }
                catch (const std::exception &e)
                {
                    spdlog::warn("{} delivery to {} threw: {}", to_string(channel.type), user, e.what());
                }

                std::lock_guard lock(side_mutex_);
                if (--side_in_flight_ == 0)
                    side_idle_.notify_all(); });
        }
    }

    void NotificationHub::drain_side_channels()
    {
        std::unique_lock lock(side_mutex_);
        side_idle_.wait(lock, [this] { return side_in_flight_ == 0; });
    }

    void NotificationHub::subscribe(const std::string &user, std::shared_ptr<Connection> connection)
    {
        std::lock_guard lock(mutex_);
        auto &conns = connections_[user];
        auto dup = std::find_if(conns.begin(), conns.end(),
                                [&](const auto &c) { return c->id() == connection->id(); });
        if (dup != conns.end())
            *dup = std::move(connection);
        else
            conns.push_back(std::move(connection));
        spdlog::debug("user {} now has {} connection(s)", user, conns.size());
    }

    void NotificationHub::unsubscribe(const std::string &user, const std::string &connection_id)
    {
        std::lock_guard lock(mutex_);
        if (auto it = connections_.find(user); it != connections_.end())
        {
            std::erase_if(it->second, [&](const auto &c) { return c->id() == connection_id; });
            if (it->second.empty())
                connections_.erase(it);
        }
        if (auto it = devices_.find(user); it != devices_.end())
        {
            it->second.erase(connection_id);
            if (it->second.empty())
                devices_.erase(it);
        }
    }

    std::size_t NotificationHub::connection_count(const std::string &user) const
    {
        std::lock_guard lock(mutex_);
        auto it = connections_.find(user);
        return it == connections_.end() ? 0 : it->second.size();
    }

    void NotificationHub::register_channel(const std::string &user, NotificationChannel channel)
    {
        std::lock_guard lock(mutex_);
        auto &list = channels_[user];
        std::erase_if(list, [&](const NotificationChannel &c) { return c.type == channel.type; });
        list.push_back(std::move(channel));
    }

    std::vector<NotificationChannel> NotificationHub::channels(const std::string &user) const
    {
        std::lock_guard lock(mutex_);
        auto it = channels_.find(user);
        return it == channels_.end() ? std::vector<NotificationChannel>{} : it->second;
    }

    void NotificationHub::register_device(const std::string &user, const std::string &connection_id, DeviceInfo device)
    {
        std::lock_guard lock(mutex_);
        devices_[user][connection_id] = std::move(device);
    }

    std::vector<DeviceInfo> NotificationHub::devices(const std::string &user) const
    {
        std::vector<DeviceInfo> out;
        std::lock_guard lock(mutex_);
        if (auto it = devices_.find(user); it != devices_.end())
        {
            for (const auto &[conn, device] : it->second)
                out.push_back(device);
        }
        return out;
    }

    std::vector<NotificationMessage> NotificationHub::recent(const std::string &user, std::size_t limit) const
    {
        std::lock_guard lock(mutex_);
        auto it = history_.find(user);
        if (it == history_.end())
            return {};
        auto n = std::min(limit, it->second.size());
        return {it->second.begin(), it->second.begin() + static_cast<std::ptrdiff_t>(n)};
    }

    Result<void> NotificationHub::mark_read(const std::string &user, std::string_view notification_id)
    {
        std::lock_guard lock(mutex_);
        if (auto it = history_.find(user); it != history_.end())
        {
            for (auto &n : it->second)
            {
                if (n.id == notification_id)
                {
                    n.read = true;
                    return {};
                }
            }
        }
        return std::unexpected(CosignError::not_found(std::format("notification {} not found", notification_id)));
    }

    void NotificationHub::set_pending_source(PendingSource source)
    {
        std::lock_guard lock(mutex_);
        pending_source_ = std::move(source);
    }

    ResyncSnapshot NotificationHub::resync(const std::string &user) const
    {
        PendingSource source;
        {
            std::lock_guard lock(mutex_);
            source = pending_source_;
        }

        ResyncSnapshot snapshot;
        if (source)
            snapshot.pending_proposals = source(user);
        snapshot.recent_notifications = recent(user, cfg_.resync_limit);
        snapshot.server_time = clock_->now_ms();
        return snapshot;
    }

} // namespace cosign
