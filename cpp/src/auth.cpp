#include "cosign/auth.hpp"
#include "cosign/crypto.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <format>

namespace cosign
{

    namespace
    {
        std::string encode_segment(const std::string &text)
        {
            return crypto::Base64::encode_url_safe(crypto::Bytes(text.begin(), text.end()));
        }

        Result<nlohmann::json> decode_segment(const std::string &segment)
        {
            auto bytes = crypto::Base64::decode_url_safe(segment);
            if (!bytes)
                return std::unexpected(CosignError::auth("Invalid token encoding"));
            auto parsed = nlohmann::json::parse(bytes->begin(), bytes->end(), nullptr, false);
            if (parsed.is_discarded() || !parsed.is_object())
                return std::unexpected(CosignError::auth("Invalid token encoding"));
            return parsed;
        }

        std::string sign_segments(const std::string &secret, const std::string &signing_input)
        {
            auto mac = crypto::HmacSha256::mac(secret, signing_input);
            return crypto::Base64::encode_url_safe(crypto::Bytes(mac.begin(), mac.end()));
        }
    } // namespace

    TokenAuthenticator::TokenAuthenticator(AuthConfig cfg, std::shared_ptr<const Clock> clock)
        : cfg_(std::move(cfg)),
          clock_(std::move(clock))
    {
    }

    std::string TokenAuthenticator::issue(const std::string &user) const
    {
        auto now = clock_->now_ms() / 1000;
        nlohmann::json header = {{"alg", "HS256"}, {"typ", "JWT"}};
        nlohmann::json payload = {{"sub", user}, {"iat", now}, {"exp", now + cfg_.token_ttl_secs}};

        auto signing_input = encode_segment(header.dump()) + "." + encode_segment(payload.dump());
        return signing_input + "." + sign_segments(cfg_.token_secret, signing_input);
    }

    Result<TokenClaims> TokenAuthenticator::verify(const std::string &token) const
    {
        auto first = token.find('.');
        auto second = first == std::string::npos ? std::string::npos : token.find('.', first + 1);
        if (second == std::string::npos || token.find('.', second + 1) != std::string::npos)
            return std::unexpected(CosignError::auth("Malformed token"));

        auto header = decode_segment(token.substr(0, first));
        if (!header)
            return std::unexpected(header.error());
        if (header->value("alg", "") != "HS256")
            return std::unexpected(CosignError::auth("Unsupported token algorithm"));

        auto signing_input = token.substr(0, second);
        auto presented = crypto::Base64::decode_url_safe(token.substr(second + 1));
        if (!presented || presented->size() != 32)
            return std::unexpected(CosignError::auth("Invalid token signature"));

        auto expected = crypto::HmacSha256::mac(cfg_.token_secret, signing_input);
        crypto::SHA256Hash actual{};
        std::copy(presented->begin(), presented->end(), actual.begin());
        if (!crypto::HmacSha256::equal(expected, actual))
            return std::unexpected(CosignError::auth("Invalid token signature"));

        auto payload = decode_segment(token.substr(first + 1, second - first - 1));
        if (!payload)
            return std::unexpected(payload.error());

        TokenClaims claims;
        try
        {
            claims.subject = payload->at("sub").get<std::string>();
            claims.issued_at = payload->value("iat", std::int64_t{0});
            claims.expires_at = payload->at("exp").get<std::int64_t>();
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(CosignError::auth(std::format("Invalid token claims: {}", e.what())));
        }

        if (claims.subject.empty())
            return std::unexpected(CosignError::auth("Token has no subject"));
        if (clock_->now_ms() / 1000 >= claims.expires_at)
            return std::unexpected(CosignError::auth("Token expired"));
        return claims;
    }

} // namespace cosign
