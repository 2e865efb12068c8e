#ifndef ATELIER_BEARERFILTER_HPP
#define ATELIER_BEARERFILTER_HPP

#include <drogon/HttpFilter.h>
#include <drogon/HttpResponse.h>
#include <support/controllers.hpp>
#include <support/session_tokens.hpp>

namespace atelier {
    // Registered as an instance (not auto-created) because it needs the token verifier.
    class BearerAuthFilter : public drogon::HttpFilter<BearerAuthFilter, false> {
    public:
        explicit BearerAuthFilter(std::shared_ptr<const SessionTokens> tokens) : tokens_(std::move(tokens)) {}

        void doFilter(const drogon::HttpRequestPtr &req,
                      drogon::FilterCallback &&fcb,
                      drogon::FilterChainCallback &&fccb) override {
            const std::string &auth = req->getHeader("Authorization");
            const std::string prefix = "Bearer ";
            if (auth.size() <= prefix.size() || auth.compare(0, prefix.size(), prefix) != 0) {
                fcb(errorResponse(ErrorKind::Unauthorized, "not authenticated"));
                return;
            }

            auto claims = tokens_->verify(auth.substr(prefix.size()));
            if (!claims || claims->role != "admin") {
                LOG_DEBUG << "Rejected bearer token on " << req->path();
                fcb(errorResponse(ErrorKind::Unauthorized, "invalid or expired token"));
                return;
            }
            fccb();
        }

    private:
        std::shared_ptr<const SessionTokens> tokens_;
    };
}

#endif //ATELIER_BEARERFILTER_HPP
