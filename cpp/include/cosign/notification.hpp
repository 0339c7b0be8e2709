#pragma once

#include "config.hpp"
#include "proposal.hpp"
#include "types.hpp"
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace cosign
{

    enum class NotificationType
    {
        NewProposal,
        SignatureAdded,
        ProposalExecuted,
        ProposalCancelled,
        ProposalExpired
    };

    std::string_view to_string(NotificationType type);

    struct NewProposalPayload
    {
        std::string proposal_id;
        std::string created_by;
        std::string to;
        std::string value;
        std::size_t required_signatures{0};
        Timestamp expires_at{0};
    };

    struct SignatureAddedPayload
    {
        std::string proposal_id;
        std::string validator_id;
        std::size_t collected_signatures{0};
        std::size_t required_signatures{0};
        std::size_t remaining_signatures{0};
    };

    struct ProposalExecutedPayload
    {
        std::string proposal_id;
        std::string transaction_hash;
        Timestamp executed_at{0};
    };

    struct ProposalCancelledPayload
    {
        std::string proposal_id;
        std::string cancelled_by;
        Timestamp cancelled_at{0};
    };

    struct ProposalExpiredPayload
    {
        std::string proposal_id;
        Timestamp expired_at{0};
        std::size_t collected_signatures{0};
        std::size_t required_signatures{0};
    };

    /** One payload shape per notification type; the alternative index is the type */
    using NotificationPayload = std::variant<NewProposalPayload,
                                             SignatureAddedPayload,
                                             ProposalExecutedPayload,
                                             ProposalCancelledPayload,
                                             ProposalExpiredPayload>;

    struct NotificationMessage
    {
        std::string id;
        std::string title;
        std::string message;
        NotificationPayload payload;
        Timestamp timestamp{0};
        std::vector<std::string> recipients;
        bool read{false};

        NotificationType type() const;
        const std::string &proposal_id() const;

        nlohmann::json to_json() const;
    };

    /** Builders for the five lifecycle notices */
    namespace notices
    {
        NotificationMessage new_proposal(const Proposal &p, std::vector<std::string> recipients, Timestamp now);
        NotificationMessage signature_added(const Proposal &p, std::string_view validator_id,
                                            std::vector<std::string> recipients, Timestamp now);
        NotificationMessage proposal_executed(const Proposal &p, std::vector<std::string> recipients, Timestamp now);
        NotificationMessage proposal_cancelled(const Proposal &p, std::string_view cancelled_by,
                                               std::vector<std::string> recipients, Timestamp now);
        NotificationMessage proposal_expired(const Proposal &p, std::vector<std::string> recipients, Timestamp now);
    } // namespace notices

    /** Frame sent over a real-time channel: {"type": ..., "data": ...} */
    std::string make_frame(std::string_view type, const nlohmann::json &data);

    /**
     * A live real-time channel (one WebSocket). send() only enqueues; the
     * implementation drains its own queue, so the publisher never waits
     * on a slow client.
     */
    class Connection
    {
    public:
        virtual ~Connection() = default;

        virtual const std::string &id() const = 0;

        virtual void send(std::string frame) = 0;
    };

    struct DeviceInfo
    {
        std::string device_id;
        std::string name;
        std::vector<std::string> capabilities;
        std::string platform;

        nlohmann::json to_json() const;
        static DeviceInfo from_json(const nlohmann::json &j);
    };

    enum class ChannelType
    {
        Push,
        Email,
        Sms
    };

    std::string_view to_string(ChannelType type);
    Result<ChannelType> channel_type_from_string(std::string_view s);

    /** An asynchronous delivery route registered by a user */
    struct NotificationChannel
    {
        ChannelType type{ChannelType::Push};
        std::string endpoint; // push token, address or number
        std::string device_id;
        bool enabled{true};
    };

    /** Delivers one notification over one side channel; may fail independently */
    class SideChannelSender
    {
    public:
        virtual ~SideChannelSender() = default;

        virtual Result<void> deliver(const std::string &user,
                                     const NotificationChannel &channel,
                                     const NotificationMessage &message) = 0;
    };

    /** Writes side-channel deliveries to the log; the default sender */
    class LoggingSideChannelSender : public SideChannelSender
    {
    public:
        Result<void> deliver(const std::string &user,
                             const NotificationChannel &channel,
                             const NotificationMessage &message) override;
    };

    struct ResyncSnapshot
    {
        std::vector<Proposal> pending_proposals;
        std::vector<NotificationMessage> recent_notifications;
        Timestamp server_time{0};

        nlohmann::json to_json() const;
    };

    /**
     * NotificationHub fans lifecycle events out to every live connection of
     * every recipient and, independently, to each recipient's side
     * channels on a background pool. Real-time delivery is best effort;
     * resync() is the idempotent catch-up path for devices that missed
     * frames.
     */
    class NotificationHub
    {
    public:
        /** Supplies a user's current pending proposals to resync() */
        using PendingSource = std::function<std::vector<Proposal>(const std::string &user)>;

        NotificationHub(NotificationConfig cfg,
                        std::shared_ptr<const Clock> clock,
                        std::shared_ptr<SideChannelSender> sender = nullptr,
                        std::size_t side_channel_threads = 2);
        ~NotificationHub();

        NotificationHub(const NotificationHub &) = delete;
        NotificationHub &operator=(const NotificationHub &) = delete;

        void publish(const NotificationMessage &message);

        void subscribe(const std::string &user, std::shared_ptr<Connection> connection);

        /** Drop one connection; other connections of the same user are unaffected */
        void unsubscribe(const std::string &user, const std::string &connection_id);

        std::size_t connection_count(const std::string &user) const;

        /** Register a side channel, replacing any existing channel of the same type */
        void register_channel(const std::string &user, NotificationChannel channel);

        std::vector<NotificationChannel> channels(const std::string &user) const;

        void register_device(const std::string &user, const std::string &connection_id, DeviceInfo device);

        std::vector<DeviceInfo> devices(const std::string &user) const;

        /** Newest first, at most limit entries */
        std::vector<NotificationMessage> recent(const std::string &user, std::size_t limit) const;

        /** Flag a history entry as read; NotFound when the user has no such entry */
        Result<void> mark_read(const std::string &user, std::string_view notification_id);

        void set_pending_source(PendingSource source);

        ResyncSnapshot resync(const std::string &user) const;

        /** Block until every queued side-channel delivery has finished */
        void drain_side_channels();

        const NotificationConfig &config() const { return cfg_; }

    private:
        void dispatch_side_channels(const std::string &user, const NotificationMessage &message);

        NotificationConfig cfg_;
        std::shared_ptr<const Clock> clock_;
        std::shared_ptr<SideChannelSender> sender_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::vector<std::shared_ptr<Connection>>> connections_;
        std::unordered_map<std::string, std::vector<NotificationChannel>> channels_;
        std::unordered_map<std::string, std::unordered_map<std::string, DeviceInfo>> devices_; // user -> connection -> device
        std::unordered_map<std::string, std::deque<NotificationMessage>> history_;              // newest first
        PendingSource pending_source_;

        std::mutex side_mutex_;
        std::condition_variable side_idle_;
        std::size_t side_in_flight_{0};
        boost::asio::thread_pool pool_;
    };

} // namespace cosign
