#ifndef ATELIER_SESSION_TOKENS_HPP
#define ATELIER_SESSION_TOKENS_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace atelier {

struct TokenClaims {
    std::string role;
    int64_t issuedAt = 0;
    int64_t expiresAt = 0;
};

/**
 * @brief Issues and verifies signed bearer tokens.
 *
 * Token layout is base64url(claims JSON) "." hex(HMAC-SHA256(secret, first part)).
 */
class SessionTokens {
public:
    SessionTokens(std::string secret, std::chrono::seconds ttl);

    // Secret from TOKEN_SECRET, else 32 random bytes (tokens die with the process).
    static std::string secretFromEnvironment();

    std::string issue(const std::string& role) const;
    std::string issue(const std::string& role, int64_t nowSeconds) const;

    std::optional<TokenClaims> verify(const std::string& token) const;
    std::optional<TokenClaims> verify(const std::string& token, int64_t nowSeconds) const;

    std::chrono::seconds ttl() const { return ttl_; }

private:
    std::string secret_;
    std::chrono::seconds ttl_;

    std::string sign(const std::string& data) const;
};

}

#endif // ATELIER_SESSION_TOKENS_HPP
