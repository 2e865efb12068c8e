#include <drogon/drogon_test.h>
#include <support/session_tokens.hpp>
#include <stdexcept>

using namespace atelier;

static const int64_t kNow = 1768903445;

DROGON_TEST(TokenRoundTrip)
{
    SessionTokens tokens("secret-one", std::chrono::hours(168));
    auto token = tokens.issue("admin", kNow);
    auto claims = tokens.verify(token, kNow + 60);
    REQUIRE(claims.has_value());
    CHECK(claims->role == "admin");
    CHECK(claims->issuedAt == kNow);
    CHECK(claims->expiresAt == kNow + 168 * 3600);
}

DROGON_TEST(TokenExpiresAfterTtl)
{
    SessionTokens tokens("secret-one", std::chrono::hours(168));
    auto token = tokens.issue("admin", kNow);
    CHECK(tokens.verify(token, kNow + 168 * 3600 - 1).has_value());
    CHECK(!tokens.verify(token, kNow + 168 * 3600).has_value());
}

DROGON_TEST(TokenRejectsTampering)
{
    SessionTokens tokens("secret-one", std::chrono::hours(1));
    SessionTokens other("secret-two", std::chrono::hours(1));
    auto token = tokens.issue("admin", kNow);

    CHECK(!other.verify(token, kNow).has_value());

    auto badSignature = token;
    badSignature.back() = badSignature.back() == '0' ? '1' : '0';
    CHECK(!tokens.verify(badSignature, kNow).has_value());

    auto badPayload = token;
    badPayload[0] = badPayload[0] == 'a' ? 'b' : 'a';
    CHECK(!tokens.verify(badPayload, kNow).has_value());

    CHECK(!tokens.verify("", kNow).has_value());
    CHECK(!tokens.verify("no-dot-here", kNow).has_value());
    CHECK(!tokens.verify(".abc", kNow).has_value());
}

DROGON_TEST(TokenSecretMustNotBeEmpty)
{
    CHECK_THROWS_AS(SessionTokens("", std::chrono::hours(1)), std::invalid_argument);
}
