#pragma once

#include "engine.hpp"
#include "types.hpp"
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace cosign
{

    /** Path and decoded query parameters of a request target */
    struct RequestTarget
    {
        std::string path;
        std::map<std::string, std::string> query;

        static RequestTarget parse(std::string_view target);
    };

    /**
     * JSON API over the engine. Every /api route requires a bearer token;
     * bodies are {"success": true, "data": ...} on success and
     * {"error": message, "code": name} on failure.
     */
    class ApiRouter
    {
    public:
        using Request = boost::beast::http::request<boost::beast::http::string_body>;
        using Response = boost::beast::http::response<boost::beast::http::string_body>;

        explicit ApiRouter(std::shared_ptr<Engine> engine);

        Response handle(const Request &req) const;

        /** User id from the Authorization header, or the token query parameter */
        Result<std::string> authenticate(const Request &req) const;

        /** Reply frame for one inbound real-time message; empty when none is due */
        std::string handle_socket_message(const std::string &user,
                                          const std::string &connection_id,
                                          std::string_view text) const;

        static boost::beast::http::status status_for(ErrorCode code);

        std::shared_ptr<Engine> engine() const { return engine_; }

    private:
        Result<nlohmann::json> route(const Request &req, const RequestTarget &target,
                                     const std::string &user, boost::beast::http::status &status) const;

        Result<nlohmann::json> list_proposals(const std::string &user, const RequestTarget &target) const;
        Result<nlohmann::json> create_proposal(const std::string &user, const nlohmann::json &body) const;
        Result<nlohmann::json> get_proposal(const std::string &user, const std::string &id) const;
        Result<nlohmann::json> sign_proposal(const std::string &user, const std::string &id,
                                             const nlohmann::json &body) const;
        Result<nlohmann::json> add_validator(const std::string &user, const nlohmann::json &body) const;
        Result<nlohmann::json> update_policy(const std::string &user, const nlohmann::json &body) const;
        Result<nlohmann::json> register_device(const std::string &user, const nlohmann::json &body) const;
        Result<void> require_member(const std::string &user) const;
        Result<void> require_access(const std::string &user, const std::string &proposal_id) const;

        std::shared_ptr<Engine> engine_;
    };

} // namespace cosign
