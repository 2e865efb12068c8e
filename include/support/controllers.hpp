#ifndef ATELIER_CONTROLLERS_HPP
#define ATELIER_CONTROLLERS_HPP
#include <drogon/drogon.h>
#include <support/errors.hpp>

namespace atelier {
    using Callback_t = std::function<void(const drogon::HttpResponsePtr &)>&&;

    inline drogon::HttpStatusCode statusFor(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::NotFound: return drogon::k404NotFound;
            case ErrorKind::InvalidInput: return drogon::k400BadRequest;
            case ErrorKind::Unauthorized: return drogon::k401Unauthorized;
            case ErrorKind::UpstreamUnavailable: return drogon::k503ServiceUnavailable;
            case ErrorKind::Internal: break;
        }
        return drogon::k500InternalServerError;
    }

    inline drogon::HttpResponsePtr errorResponse(ErrorKind kind, const std::string& message) {
        Json::Value body;
        body["error"] = message;
        auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
        resp->setStatusCode(statusFor(kind));
        return resp;
    }

    inline drogon::HttpResponsePtr errorResponse(const ApiError& e) {
        return errorResponse(e.kind(), e.what());
    }

    inline drogon::HttpResponsePtr okResponse(Json::Value body = Json::Value(Json::objectValue)) {
        body["ok"] = true;
        return drogon::HttpResponse::newHttpJsonResponse(body);
    }
}

#endif //ATELIER_CONTROLLERS_HPP
