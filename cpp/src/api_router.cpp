#include "cosign/api_router.hpp"
#include "cosign/crypto.hpp"
#include <spdlog/spdlog.h>
#include <charconv>
#include <format>
#include <vector>

namespace http = boost::beast::http;

namespace cosign
{
    namespace
    {
        std::string percent_decode(std::string_view in)
        {
            std::string out;
            out.reserve(in.size());
            for (std::size_t i = 0; i < in.size(); ++i)
            {
                if (in[i] == '+')
                {
                    out.push_back(' ');
                }
                else if (in[i] == '%' && i + 2 < in.size())
                {
                    unsigned value = 0;
                    auto [ptr, ec] = std::from_chars(in.data() + i + 1, in.data() + i + 3, value, 16);
                    if (ec == std::errc{} && ptr == in.data() + i + 3)
                    {
                        out.push_back(static_cast<char>(value));
                        i += 2;
                    }
                    else
                    {
                        out.push_back(in[i]);
                    }
                }
                else
                {
                    out.push_back(in[i]);
                }
            }
            return out;
        }

        std::vector<std::string> split_path(std::string_view path)
        {
            std::vector<std::string> parts;
            std::size_t start = 0;
            while (start <= path.size())
            {
                auto end = path.find('/', start);
                if (end == std::string_view::npos)
                    end = path.size();
                if (end > start)
                    parts.emplace_back(percent_decode(path.substr(start, end - start)));
                start = end + 1;
            }
            return parts;
        }

        Result<std::size_t> query_size(const RequestTarget &target, const std::string &key, std::size_t fallback)
        {
            auto it = target.query.find(key);
            if (it == target.query.end() || it->second.empty())
                return fallback;
            std::size_t value = 0;
            auto [ptr, ec] = std::from_chars(it->second.data(), it->second.data() + it->second.size(), value);
            if (ec != std::errc{} || ptr != it->second.data() + it->second.size())
                return std::unexpected(CosignError::invalid_input(std::format("invalid {} parameter", key)));
            return value;
        }

        Result<nlohmann::json> parse_body(const ApiRouter::Request &req)
        {
            if (req.body().empty())
                return nlohmann::json::object();
            auto j = nlohmann::json::parse(req.body(), nullptr, false);
            if (j.is_discarded() || !j.is_object())
                return std::unexpected(CosignError::invalid_input("request body must be a JSON object"));
            return j;
        }

        ApiRouter::Response json_response(http::status status, const nlohmann::json &body, unsigned version)
        {
            ApiRouter::Response res{status, version};
            res.set(http::field::content_type, "application/json");
            res.body() = body.dump();
            res.prepare_payload();
            return res;
        }

        ApiRouter::Response error_response(const CosignError &err, unsigned version)
        {
            return json_response(ApiRouter::status_for(err.code),
                                 {{"success", false}, {"error", err.what()}, {"code", error_code_name(err.code)}},
                                 version);
        }

        nlohmann::json proposals_json(const std::vector<Proposal> &proposals)
        {
            nlohmann::json out = nlohmann::json::array();
            for (const auto &p : proposals)
                out.push_back(p.to_json());
            return out;
        }
    } // namespace

    RequestTarget RequestTarget::parse(std::string_view target)
    {
        RequestTarget out;
        auto q = target.find('?');
        out.path = std::string(target.substr(0, q));
        if (q == std::string_view::npos)
            return out;

        auto query = target.substr(q + 1);
        while (!query.empty())
        {
            auto amp = query.find('&');
            auto pair = query.substr(0, amp);
            auto eq = pair.find('=');
            auto key = percent_decode(pair.substr(0, eq));
            auto value = eq == std::string_view::npos ? std::string{} : percent_decode(pair.substr(eq + 1));
            if (!key.empty())
                out.query[key] = value;
            if (amp == std::string_view::npos)
                break;
            query.remove_prefix(amp + 1);
        }
        return out;
    }

    ApiRouter::ApiRouter(std::shared_ptr<Engine> engine)
        : engine_(std::move(engine))
    {
    }

    http::status ApiRouter::status_for(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::NotFound:
            return http::status::not_found;
        case ErrorCode::Unauthorized:
            return http::status::forbidden;
        case ErrorCode::AlreadySigned:
        case ErrorCode::NotPending:
        case ErrorCode::AlreadyResolved:
        case ErrorCode::AlreadyExists:
        case ErrorCode::LastValidatorRemoval:
            return http::status::conflict;
        case ErrorCode::Expired:
            return http::status::gone;
        case ErrorCode::InvalidSignature:
        case ErrorCode::StaleSignature:
        case ErrorCode::InvalidThreshold:
        case ErrorCode::InvalidInput:
            return http::status::bad_request;
        case ErrorCode::AuthError:
            return http::status::unauthorized;
        case ErrorCode::InsufficientWeight:
        case ErrorCode::ExecutionFailed:
        case ErrorCode::ConfigError:
        case ErrorCode::CryptoError:
        case ErrorCode::StorageError:
        case ErrorCode::InternalError:
            return http::status::internal_server_error;
        }
        return http::status::internal_server_error;
    }

    Result<std::string> ApiRouter::authenticate(const Request &req) const
    {
        std::string token;
        if (auto auth = req.find(http::field::authorization); auth != req.end())
        {
            std::string v = std::string(auth->value());
            std::string prefix = "Bearer ";
            if (v.rfind(prefix, 0) == 0)
                token = v.substr(prefix.size());
        }
        if (token.empty())
        {
            auto target = RequestTarget::parse(std::string_view(req.target().data(), req.target().size()));
            if (auto it = target.query.find("token"); it != target.query.end())
                token = it->second;
        }
        if (token.empty())
            return std::unexpected(CosignError::auth("Missing bearer token"));

        auto claims = engine_->authenticator()->verify(token);
        if (!claims)
            return std::unexpected(claims.error());
        return claims->subject;
    }

    ApiRouter::Response ApiRouter::handle(const Request &req) const
    {
        if (req.method() != http::verb::get && req.method() != http::verb::post && req.method() != http::verb::delete_)
        {
            return json_response(http::status::method_not_allowed,
                                 {{"success", false}, {"error", "method not allowed"}}, req.version());
        }

        auto target = RequestTarget::parse(std::string_view(req.target().data(), req.target().size()));
        if (target.path == "/health" && req.method() == http::verb::get)
        {
            return json_response(http::status::ok,
                                 {{"status", "ok"}, {"time", to_iso8601(engine_->clock()->now_ms())}},
                                 req.version());
        }

        auto user = authenticate(req);
        if (!user)
            return error_response(user.error(), req.version());

        auto status = http::status::ok;
        Result<nlohmann::json> result = std::unexpected(CosignError::internal("unhandled"));
        try
        {
            result = route(req, target, *user, status);
        }
        catch (const std::exception &e)
        {
            spdlog::error("{} {} failed: {}", std::string(req.method_string()), target.path, e.what());
            result = std::unexpected(CosignError::internal("internal error"));
        }

        if (!result)
        {
            spdlog::debug("{} {} -> {}", std::string(req.method_string()), target.path,
                          error_code_name(result.error().code));
            return error_response(result.error(), req.version());
        }
        return json_response(status, {{"success", true}, {"data", *result}}, req.version());
    }

    Result<nlohmann::json> ApiRouter::route(const Request &req, const RequestTarget &target,
                                            const std::string &user, http::status &status) const
    {
        auto parts = split_path(target.path);
        auto method = req.method();
        auto not_found = std::unexpected(CosignError::not_found(std::format("no route for {}", target.path)));

        if (parts.size() < 2 || parts[0] != "api")
            return not_found;

        // /api/multisig/proposals[/{id}[/sign|/estimate|/preflight]]
        if (parts[1] == "multisig" && parts.size() >= 3 && parts[2] == "proposals")
        {
            if (parts.size() == 3)
            {
                if (method == http::verb::get)
                    return list_proposals(user, target);
                if (method == http::verb::post)
                {
                    auto body = parse_body(req);
                    if (!body)
                        return std::unexpected(body.error());
                    status = http::status::created;
                    return create_proposal(user, *body);
                }
                return not_found;
            }

            const auto &id = parts[3];
            if (parts.size() == 4)
            {
                if (method == http::verb::get)
                    return get_proposal(user, id);
                if (method == http::verb::delete_)
                {
                    auto cancelled = engine_->proposals()->cancel(id, user);
                    if (!cancelled)
                        return std::unexpected(cancelled.error());
                    return cancelled->to_json();
                }
                return not_found;
            }

            if (parts.size() == 5 && parts[4] == "sign" && method == http::verb::post)
            {
                auto body = parse_body(req);
                if (!body)
                    return std::unexpected(body.error());
                return sign_proposal(user, id, *body);
            }
            if (parts.size() == 5 && parts[4] == "estimate" && method == http::verb::get)
            {
                if (auto access = require_access(user, id); !access)
                    return std::unexpected(access.error());
                auto p = engine_->proposals()->get(id);
                if (!p)
                    return std::unexpected(p.error());
                auto est = engine_->coordinator()->estimate_gas(*p, p->signatures);
                if (!est)
                    return std::unexpected(est.error());
                return est->to_json();
            }
            if (parts.size() == 5 && parts[4] == "preflight" && method == http::verb::get)
            {
                if (auto access = require_access(user, id); !access)
                    return std::unexpected(access.error());
                auto pre = engine_->coordinator()->preflight(id);
                if (!pre)
                    return std::unexpected(pre.error());
                return pre->to_json();
            }
            return not_found;
        }

        if (parts[1] == "validators")
        {
            auto registry = engine_->registry();
            if (parts.size() == 2 && method == http::verb::get)
            {
                nlohmann::json list = nlohmann::json::array();
                for (const auto &v : registry->list_active())
                    list.push_back(v.to_json());
                return nlohmann::json{{"validators", list},
                                      {"policy", registry->policy().to_json()},
                                      {"isMultiSig", registry->is_multi_sig()}};
            }
            if (parts.size() == 2 && method == http::verb::post)
            {
                auto body = parse_body(req);
                if (!body)
                    return std::unexpected(body.error());
                status = http::status::created;
                return add_validator(user, *body);
            }
            if (parts.size() == 3 && method == http::verb::delete_)
            {
                if (auto member = require_member(user); !member)
                    return std::unexpected(member.error());
                if (auto removed = registry->remove(parts[2]); !removed)
                    return std::unexpected(removed.error());
                return nlohmann::json{{"removed", parts[2]}, {"policy", registry->policy().to_json()}};
            }
            return not_found;
        }

        if (parts[1] == "policy")
        {
            auto registry = engine_->registry();
            if (parts.size() == 2 && method == http::verb::get)
                return registry->policy().to_json();
            if (parts.size() == 2 && method == http::verb::post)
            {
                auto body = parse_body(req);
                if (!body)
                    return std::unexpected(body.error());
                return update_policy(user, *body);
            }
            if (parts.size() == 3 && parts[2] == "requires-multisig" && method == http::verb::get)
            {
                auto it = target.query.find("value");
                if (it == target.query.end())
                    return std::unexpected(CosignError::invalid_input("value parameter is required"));
                auto required = registry->requires_multi_sig(std::string_view(it->second));
                if (!required)
                    return std::unexpected(required.error());
                return nlohmann::json{{"value", it->second}, {"requiresMultiSig", *required}};
            }
            return not_found;
        }

        if (parts[1] == "sync" && parts.size() == 2 && method == http::verb::get)
            return engine_->hub()->resync(user).to_json();

        if (parts[1] == "devices" && parts.size() == 2 && method == http::verb::post)
        {
            auto body = parse_body(req);
            if (!body)
                return std::unexpected(body.error());
            return register_device(user, *body);
        }

        if (parts[1] == "notifications" && parts.size() == 4 && parts[3] == "read" && method == http::verb::post)
        {
            if (auto marked = engine_->hub()->mark_read(user, parts[2]); !marked)
                return std::unexpected(marked.error());
            return nlohmann::json{{"id", parts[2]}, {"read", true}};
        }

        return not_found;
    }

    Result<nlohmann::json> ApiRouter::list_proposals(const std::string &user, const RequestTarget &target) const
    {
        ProposalFilter filter;
        if (auto it = target.query.find("status"); it != target.query.end() && !it->second.empty())
        {
            auto status = proposal_status_from_string(it->second);
            if (!status)
                return std::unexpected(status.error());
            filter.status = *status;
        }
        auto limit = query_size(target, "limit", filter.limit);
        if (!limit)
            return std::unexpected(limit.error());
        auto offset = query_size(target, "offset", filter.offset);
        if (!offset)
            return std::unexpected(offset.error());
        filter.limit = *limit;
        filter.offset = *offset;

        return proposals_json(engine_->proposals()->list_for_user(user, filter));
    }

    Result<nlohmann::json> ApiRouter::create_proposal(const std::string &user, const nlohmann::json &body) const
    {
        auto registry = engine_->registry();
        ProposalDraft draft;
        draft.created_by = user;
        try
        {
            draft.to = body.value("to", "");
            if (body.contains("value") && !body["value"].is_string())
                return std::unexpected(CosignError::invalid_input("value must be a decimal string"));
            draft.value = body.value("value", "");
            if (body.contains("data") && body["data"].is_string())
                draft.data = body["data"].get<std::string>();

            if (body.contains("validatorIds"))
            {
                draft.validator_ids = body["validatorIds"].get<std::vector<std::string>>();
            }
            else
            {
                for (const auto &v : registry->list_active())
                    draft.validator_ids.push_back(v.id);
            }
            draft.required_signatures = body.contains("requiredSignatures")
                                            ? body["requiredSignatures"].get<std::size_t>()
                                            : registry->policy().threshold;
            if (body.contains("expiresIn") && !body["expiresIn"].is_null())
            {
                if (!body["expiresIn"].is_number_integer())
                    return std::unexpected(CosignError::invalid_input("expiresIn must be a whole number of seconds"));
                draft.ttl_secs = body["expiresIn"].get<std::int64_t>();
            }

            if (body.contains("metadata") && body["metadata"].is_object())
            {
                const auto &meta = body["metadata"];
                draft.metadata.title = meta.value("title", "");
                draft.metadata.description = meta.value("description", "");
                auto type = proposal_type_from_string(meta.value("type", "transfer"));
                if (!type)
                    return std::unexpected(type.error());
                draft.metadata.type = *type;
            }
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(CosignError::invalid_input(std::format("Malformed proposal request: {}", e.what())));
        }

        auto created = engine_->proposals()->create(std::move(draft));
        if (!created)
            return std::unexpected(created.error());
        return created->to_json();
    }

    Result<nlohmann::json> ApiRouter::get_proposal(const std::string &user, const std::string &id) const
    {
        auto p = engine_->proposals()->get(id);
        if (!p)
            return std::unexpected(p.error());
        if (auto access = require_access(user, id); !access)
            return std::unexpected(access.error());
        return p->to_json();
    }

    Result<nlohmann::json> ApiRouter::sign_proposal(const std::string &user, const std::string &id,
                                                    const nlohmann::json &body) const
    {
        SignRequest request;
        request.proposal_id = id;
        try
        {
            request.validator_id = body.at("validatorId").get<std::string>();
            request.signature = body.at("signature").get<std::string>();
            if (body.contains("signerType") && !body["signerType"].is_null())
            {
                auto kind = validator_kind_from_string(body["signerType"].get<std::string>());
                if (!kind)
                    return std::unexpected(kind.error());
                request.signer_type = *kind;
            }
            if (body.contains("signedAt") && !body["signedAt"].is_null())
                request.signed_at = body["signedAt"].get<Timestamp>();
            if (body.contains("metadata") && body["metadata"].is_object())
            {
                const auto &m = body["metadata"];
                request.device = DeviceMetadata{m.value("deviceId", ""), m.value("deviceName", ""), m.value("platform", "")};
            }
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(CosignError::invalid_input(
                std::format("Missing required fields: validatorId, signature ({})", e.what())));
        }

        // a user may only sign with factors they control
        if (auto validator = engine_->registry()->get(request.validator_id); validator && validator->owner != user)
        {
            return std::unexpected(CosignError::unauthorized(
                std::format("Validator {} does not belong to the caller", request.validator_id)));
        }

        auto outcome = engine_->collector()->sign(request);
        if (!outcome)
            return std::unexpected(outcome.error());
        return outcome->to_json();
    }

    Result<nlohmann::json> ApiRouter::add_validator(const std::string &user, const nlohmann::json &body) const
    {
        auto registry = engine_->registry();
        auto fresh_account = registry->active_count() == 0;
        if (!fresh_account)
        {
            if (auto member = require_member(user); !member)
                return std::unexpected(member.error());
        }

        auto record = body;
        record["owner"] = user;
        if (!record.contains("id") || !record["id"].is_string() || record["id"].get<std::string>().empty())
            record["id"] = std::format("{}_{}", record.value("type", "validator"), crypto::SecureRandom::hex(8));
        record["isActive"] = true;
        record.erase("createdAt");
        record.erase("lastUsed");

        auto validator = Validator::from_json(record);
        if (!validator)
            return std::unexpected(validator.error());

        auto added = fresh_account ? registry->bootstrap(std::move(*validator)) : registry->add(std::move(*validator));
        if (!added)
            return std::unexpected(added.error());
        return nlohmann::json{{"validator", added->to_json()}, {"policy", registry->policy().to_json()}};
    }

    Result<nlohmann::json> ApiRouter::update_policy(const std::string &user, const nlohmann::json &body) const
    {
        if (auto member = require_member(user); !member)
            return std::unexpected(member.error());

        auto registry = engine_->registry();
        auto merged = registry->policy().to_json();
        for (const auto &[key, value] : body.items())
            merged[key] = value;

        auto policy = SigningPolicy::from_json(merged);
        if (!policy)
            return std::unexpected(policy.error());
        if (auto updated = registry->set_policy(*policy); !updated)
            return std::unexpected(updated.error());
        return registry->policy().to_json();
    }

    Result<nlohmann::json> ApiRouter::register_device(const std::string &user, const nlohmann::json &body) const
    {
        auto type = channel_type_from_string(body.value("type", ""));
        if (!type)
            return std::unexpected(type.error());
        auto endpoint = body.value("endpoint", "");
        if (endpoint.empty())
            return std::unexpected(CosignError::invalid_input("endpoint is required"));

        NotificationChannel channel{*type, endpoint, body.value("deviceId", ""), body.value("enabled", true)};
        engine_->hub()->register_channel(user, channel);
        return nlohmann::json{{"type", to_string(channel.type)},
                              {"endpoint", channel.endpoint},
                              {"deviceId", channel.device_id},
                              {"enabled", channel.enabled}};
    }

    Result<void> ApiRouter::require_member(const std::string &user) const
    {
        for (const auto &v : engine_->registry()->list_active())
        {
            if (v.owner == user)
                return {};
        }
        return std::unexpected(CosignError::unauthorized("Caller does not control an active validator"));
    }

    Result<void> ApiRouter::require_access(const std::string &user, const std::string &proposal_id) const
    {
        if (!engine_->proposals()->get(proposal_id))
            return std::unexpected(CosignError::not_found(std::format("Proposal {} not found", proposal_id)));
        if (!engine_->proposals()->user_has_access(user, proposal_id))
            return std::unexpected(CosignError::unauthorized("Access denied"));
        return {};
    }

    std::string ApiRouter::handle_socket_message(const std::string &user,
                                                 const std::string &connection_id,
                                                 std::string_view text) const
    {
        auto now = engine_->clock()->now_ms();
        auto message = nlohmann::json::parse(text, nullptr, false);
        if (message.is_discarded() || !message.is_object() || !message.contains("type") || !message["type"].is_string())
            return make_frame("error", {{"message", "Invalid message format"}});

        auto type = message["type"].get<std::string>();
        auto data = message.value("data", nlohmann::json::object());

        if (type == "ping")
            return make_frame("pong", {{"timestamp", now}});
        if (type == "subscribe_proposals")
            return make_frame("subscribed", {{"channel", "proposals"}, {"timestamp", now}});
        if (type == "request_sync")
            return make_frame("sync_data", engine_->hub()->resync(user).to_json());
        if (type == "device_info")
        {
            auto device = DeviceInfo::from_json(data.is_object() ? data : nlohmann::json::object());
            engine_->hub()->register_device(user, connection_id, device);
            return make_frame("device_registered", {{"connectionId", connection_id}, {"device", device.to_json()}});
        }
        return make_frame("error", {{"message", std::format("Unknown message type: {}", type)}});
    }

} // namespace cosign
