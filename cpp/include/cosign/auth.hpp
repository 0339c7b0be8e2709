#pragma once

#include "config.hpp"
#include "types.hpp"
#include <memory>
#include <string>

namespace cosign
{

    struct TokenClaims
    {
        std::string subject;     // user id
        std::int64_t issued_at{0};  // unix seconds
        std::int64_t expires_at{0}; // unix seconds
    };

    /**
     * HS256 bearer tokens (header.payload.signature, base64url) carrying the
     * user id in "sub". Signed with HMAC-SHA-256 over auth.token_secret.
     */
    class TokenAuthenticator
    {
    public:
        TokenAuthenticator(AuthConfig cfg, std::shared_ptr<const Clock> clock);

        std::string issue(const std::string &user) const;

        /** AuthError on a malformed, forged or expired token */
        Result<TokenClaims> verify(const std::string &token) const;

    private:
        AuthConfig cfg_;
        std::shared_ptr<const Clock> clock_;
    };

} // namespace cosign
