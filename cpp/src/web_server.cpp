#include "cosign/web_server.hpp"
#include "cosign/crypto.hpp"
#include "cosign/expiration_sweeper.hpp"
#include "cosign/notification.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace cosign
{
    namespace
    {
        constexpr std::size_t kMaxQueuedFrames = 256;

        template <class Body, class Allocator>
        std::string client_id(const http::request<Body, http::basic_fields<Allocator>> &req,
                              const tcp::endpoint &remote)
        {
            if (auto cid = req.find("X-Client-Id"); cid != req.end())
            {
                return std::string(cid->value());
            }
            return remote.address().to_string();
        }

        http::response<http::string_body> too_many_requests(unsigned version)
        {
            http::response<http::string_body> res{http::status::too_many_requests, version};
            res.set(http::field::content_type, "application/json");
            res.set(http::field::retry_after, "1");
            res.body() = nlohmann::json{{"success", false}, {"error", "rate limit exceeded"}}.dump();
            res.prepare_payload();
            return res;
        }

        http::response<http::string_body> unauthorized(const CosignError &err, unsigned version)
        {
            http::response<http::string_body> res{http::status::unauthorized, version};
            res.set(http::field::content_type, "application/json");
            res.body() = nlohmann::json{{"success", false},
                                        {"error", err.what()},
                                        {"code", error_code_name(err.code)}}
                             .dump();
            res.prepare_payload();
            return res;
        }

        /**
         * One authenticated WebSocket. Frames from the hub are queued on the
         * session strand and written one at a time.
         */
        class WsSession : public Connection, public std::enable_shared_from_this<WsSession>
        {
        public:
            WsSession(tcp::socket &&socket,
                      std::shared_ptr<const ApiRouter> router,
                      std::string user)
                : ws_(std::move(socket)),
                  router_(std::move(router)),
                  hub_(router_->engine()->hub()),
                  user_(std::move(user)),
                  id_(crypto::SecureRandom::hex(8))
            {
            }

            const std::string &id() const override { return id_; }

            void send(std::string frame) override
            {
                net::post(ws_.get_executor(),
                          [self = shared_from_this(), frame = std::move(frame)]() mutable
                          { self->enqueue(std::move(frame)); });
            }

            void run(http::request<http::string_body> req)
            {
                auto timeout = websocket::stream_base::timeout::suggested(beast::role_type::server);
                timeout.keep_alive_pings = true;
                ws_.set_option(timeout);
                ws_.set_option(websocket::stream_base::decorator([](websocket::response_type &res)
                                                                 { res.set(http::field::server, "cosign"); }));
                ws_.async_accept(req, beast::bind_front_handler(&WsSession::on_accept, shared_from_this()));
            }

        private:
            void on_accept(beast::error_code ec)
            {
                if (ec)
                {
                    spdlog::debug("websocket handshake failed: {}", ec.message());
                    return;
                }
                hub_->subscribe(user_, shared_from_this());
                spdlog::info("websocket {} opened for {}", id_, user_);
                enqueue(make_frame("connection_established",
                                   {{"connectionId", id_},
                                    {"userId", user_},
                                    {"timestamp", router_->engine()->clock()->now_ms()}}));
                do_read();
            }

            void do_read()
            {
                ws_.async_read(buffer_, beast::bind_front_handler(&WsSession::on_read, shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (ec)
                {
                    if (ec != websocket::error::closed)
                        spdlog::debug("websocket {} read failed: {}", id_, ec.message());
                    return close();
                }

                auto text = beast::buffers_to_string(buffer_.data());
                buffer_.consume(buffer_.size());
                auto reply = router_->handle_socket_message(user_, id_, text);
                if (!reply.empty())
                    enqueue(std::move(reply));
                do_read();
            }

            void enqueue(std::string frame)
            {
                if (closed_)
                    return;
                if (queue_.size() >= kMaxQueuedFrames)
                {
                    spdlog::warn("websocket {} is not draining, dropping it", id_);
                    beast::get_lowest_layer(ws_).close();
                    return close();
                }
                queue_.push_back(std::move(frame));
                if (queue_.size() > 1)
                    return;
                do_write();
            }

            void do_write()
            {
                ws_.text(true);
                ws_.async_write(net::buffer(queue_.front()),
                                beast::bind_front_handler(&WsSession::on_write, shared_from_this()));
            }

            void on_write(beast::error_code ec, std::size_t)
            {
                if (ec)
                    return close();
                queue_.pop_front();
                if (!queue_.empty())
                    do_write();
            }

            void close()
            {
                if (closed_)
                    return;
                closed_ = true;
                queue_.clear();
                hub_->unsubscribe(user_, id_);
                spdlog::info("websocket {} closed for {}", id_, user_);
            }

            websocket::stream<beast::tcp_stream> ws_;
            beast::flat_buffer buffer_;
            std::shared_ptr<const ApiRouter> router_;
            std::shared_ptr<NotificationHub> hub_;
            std::string user_;
            std::string id_;
            std::deque<std::string> queue_;
            bool closed_{false};
        };
    } // namespace

    WebServerConfig WebServerConfig::from(const CosignConfig &cfg)
    {
        WebServerConfig out;
        out.port = cfg.server.port;
        out.threads = cfg.server.threads;
        out.rate_limit.tokens_per_second = cfg.server.rate_limit_tokens_per_second;
        out.rate_limit.burst_capacity = cfg.server.rate_limit_burst;
        out.sweep_interval_secs = cfg.sweeper.interval_secs;
        return out;
    }

    class WebServer::Impl
    {
    public:
        Impl(std::shared_ptr<Engine> engine, WebServerConfig cfg)
            : cfg_(std::move(cfg)),
              ioc_(static_cast<int>(cfg_.threads)),
              acceptor_(ioc_),
              limiter_(cfg_.rate_limit),
              router_(std::make_shared<ApiRouter>(engine)),
              sweeper_(std::make_shared<ExpirationSweeper>(engine->proposals(), ioc_.get_executor(),
                                                           SweeperConfig{cfg_.sweep_interval_secs}))
        {
        }

        ~Impl()
        {
            stop();
        }

        void run()
        {
            tcp::endpoint endpoint{tcp::v4(), cfg_.port};
            beast::error_code ec;

            acceptor_.open(endpoint.protocol(), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.bind(endpoint, ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.listen(net::socket_base::max_listen_connections, ec);
            if (ec)
                throw beast::system_error{ec};

            spdlog::info("listening on port {} with {} thread(s)", cfg_.port, cfg_.threads);
            do_accept();
            sweeper_->start();

            std::vector<std::thread> threads;
            threads.reserve(cfg_.threads);
            for (std::size_t i = 0; i < cfg_.threads; ++i)
            {
                threads.emplace_back([this] { ioc_.run(); });
            }

            for (auto &t : threads)
                t.join();
        }

        void stop()
        {
            sweeper_->stop();
            beast::error_code ec;
            acceptor_.cancel(ec);
            acceptor_.close(ec);
            ioc_.stop();
        }

    private:
        void do_accept()
        {
            acceptor_.async_accept(
                net::make_strand(ioc_),
                beast::bind_front_handler(&Impl::on_accept, this));
        }

        void on_accept(beast::error_code ec, tcp::socket socket)
        {
            if (!ec)
            {
                std::make_shared<Session>(std::move(socket), limiter_, router_)->run();
            }
            if (++accepted_ % 256 == 0)
            {
                auto dropped = limiter_.prune(std::chrono::steady_clock::now());
                if (dropped > 0)
                    spdlog::debug("rate limiter dropped {} idle client(s)", dropped);
            }
            if (acceptor_.is_open())
                do_accept();
        }

        class Session : public std::enable_shared_from_this<Session>
        {
        public:
            Session(tcp::socket socket, RateLimiter &limiter, std::shared_ptr<const ApiRouter> router)
                : stream_(std::move(socket)),
                  buffer_(),
                  limiter_(limiter),
                  router_(std::move(router))
            {
            }

            void run()
            {
                net::dispatch(stream_.get_executor(),
                              beast::bind_front_handler(&Session::do_read, shared_from_this()));
            }

        private:
            void do_read()
            {
                req_ = {};
                stream_.expires_after(std::chrono::seconds(30));
                http::async_read(stream_, buffer_, req_,
                                 beast::bind_front_handler(&Session::on_read, shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (ec == http::error::end_of_stream)
                {
                    return do_close();
                }
                if (ec)
                {
                    return;
                }

                if (websocket::is_upgrade(req_))
                {
                    return upgrade();
                }

                beast::error_code ep_ec;
                auto remote = stream_.socket().remote_endpoint(ep_ec);
                if (ep_ec)
                    return;
                auto decision = limiter_.check(client_id(req_, remote), std::chrono::steady_clock::now());
                if (!decision.allowed)
                {
                    res_ = too_many_requests(req_.version());
                }
                else
                {
                    res_ = router_->handle(req_);
                    res_.set("X-RateLimit-Remaining", std::to_string(decision.remaining));
                }
                res_.keep_alive(req_.keep_alive());
                do_write();
            }

            void upgrade()
            {
                auto target = RequestTarget::parse(std::string_view(req_.target().data(), req_.target().size()));
                if (target.path != "/ws")
                {
                    res_ = router_->handle(req_);
                    res_.keep_alive(false);
                    return do_write();
                }
                auto user = router_->authenticate(req_);
                if (!user)
                {
                    res_ = unauthorized(user.error(), req_.version());
                    res_.keep_alive(false);
                    return do_write();
                }
                stream_.expires_never();
                std::make_shared<WsSession>(stream_.release_socket(), router_, *user)->run(std::move(req_));
            }

            void do_write()
            {
                auto self = shared_from_this();
                http::async_write(stream_, res_,
                                  [self](beast::error_code ec, std::size_t) {
                                      self->on_write(ec);
                                  });
            }

            void on_write(beast::error_code ec)
            {
                if (ec)
                {
                    return;
                }
                if (!res_.keep_alive())
                    return do_close();
                do_read();
            }

            void do_close()
            {
                beast::error_code ec;
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            beast::tcp_stream stream_;
            beast::flat_buffer buffer_;
            http::request<http::string_body> req_;
            http::response<http::string_body> res_;
            RateLimiter &limiter_;
            std::shared_ptr<const ApiRouter> router_;
        };

        WebServerConfig cfg_;
        net::io_context ioc_;
        tcp::acceptor acceptor_;
        RateLimiter limiter_;
        std::shared_ptr<const ApiRouter> router_;
        std::shared_ptr<ExpirationSweeper> sweeper_;
        std::atomic<std::size_t> accepted_{0};
    };

    WebServer::WebServer(std::shared_ptr<Engine> engine, const WebServerConfig &cfg)
        : impl_(std::make_unique<Impl>(std::move(engine), cfg)) {}
    WebServer::~WebServer() = default;

    void WebServer::run() { impl_->run(); }
    void WebServer::stop() { impl_->stop(); }

} // namespace cosign
