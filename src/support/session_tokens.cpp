#include <support/session_tokens.hpp>
#include <drogon/drogon.h>
#include <drogon/utils/Utilities.h>
#include <json/json.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <cstdlib>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace atelier {

static std::string toHex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) oss << std::setw(2) << (int)data[i];
    return oss.str();
}

static std::string base64UrlEncode(const std::string& input) {
    std::string out = drogon::utils::base64Encode((const unsigned char*)input.data(), input.size(), true);
    while (!out.empty() && out.back() == '=') out.pop_back();
    return out;
}

static std::string base64UrlDecode(const std::string& input) {
    std::string in = input;
    for (auto& c : in) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
    }
    while (in.size() % 4) in.push_back('=');
    return drogon::utils::base64Decode(in);
}

static int64_t nowEpochSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

SessionTokens::SessionTokens(std::string secret, std::chrono::seconds ttl)
    : secret_(std::move(secret)), ttl_(ttl) {
    if (secret_.empty()) {
        throw std::invalid_argument("token secret must not be empty");
    }
}

std::string SessionTokens::secretFromEnvironment() {
    const char* env_secret = std::getenv("TOKEN_SECRET");
    if (env_secret && *env_secret) return env_secret;

    unsigned char bytes[32];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating token secret");
    }
    LOG_WARN << "TOKEN_SECRET is not set, using a random secret; sessions end on restart";
    return toHex(bytes, sizeof(bytes));
}

std::string SessionTokens::sign(const std::string& data) const {
    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()),
              (const unsigned char*)data.data(), data.size(), result, &len)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return toHex(result, len);
}

std::string SessionTokens::issue(const std::string& role) const {
    return issue(role, nowEpochSeconds());
}

std::string SessionTokens::issue(const std::string& role, int64_t nowSeconds) const {
    Json::Value claims;
    claims["role"] = role;
    claims["iat"] = Json::Int64(nowSeconds);
    claims["exp"] = Json::Int64(nowSeconds + ttl_.count());

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::string payload = base64UrlEncode(Json::writeString(builder, claims));
    return payload + "." + sign(payload);
}

std::optional<TokenClaims> SessionTokens::verify(const std::string& token) const {
    return verify(token, nowEpochSeconds());
}

std::optional<TokenClaims> SessionTokens::verify(const std::string& token, int64_t nowSeconds) const {
    auto pos = token.rfind('.');
    if (pos == std::string::npos || pos == 0) return std::nullopt;

    std::string payload = token.substr(0, pos);
    std::string signature = token.substr(pos + 1);
    std::string expected = sign(payload);
    if (signature.size() != expected.size() ||
        CRYPTO_memcmp(signature.data(), expected.data(), expected.size()) != 0) {
        return std::nullopt;
    }

    std::string json = base64UrlDecode(payload);
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errs;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errs) || !root.isObject()) {
        return std::nullopt;
    }
    if (!root["role"].isString() || !root["exp"].isIntegral() || !root["iat"].isIntegral()) {
        return std::nullopt;
    }

    TokenClaims claims;
    claims.role = root["role"].asString();
    claims.issuedAt = root["iat"].asInt64();
    claims.expiresAt = root["exp"].asInt64();
    if (nowSeconds >= claims.expiresAt) return std::nullopt;
    return claims;
}

}
