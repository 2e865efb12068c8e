//
// Created by David Yang on 2026-01-11.
//
#include <controllers/gallery.hpp>
#include <support/photo_views.hpp>
#include <drogon/HttpAppFramework.h>

namespace atelier {
    void GalleryController::get_photos(const drogon::HttpRequestPtr& req, Callback_t callback) {
        try {
            auto photos = context_->store->publicView();
            auto resp = drogon::HttpResponse::newHttpJsonResponse(views::publicList(photos, *context_->media));
            callback(resp);
        } catch (const std::exception& e) {
            LOG_ERROR << "Public photo listing failed: " << e.what();
            callback(errorResponse(ErrorKind::Internal, "internal error"));
        }
    }

    void GalleryController::get_health(const drogon::HttpRequestPtr& req, Callback_t callback) {
        try {
            Json::Value body;
            body["status"] = "ok";
            body["photos"] = static_cast<Json::UInt64>(context_->store->count());
            body["storage"] = context_->store->describe();
            callback(drogon::HttpResponse::newHttpJsonResponse(body));
        } catch (const std::exception& e) {
            LOG_ERROR << "Health check failed: " << e.what();
            callback(errorResponse(ErrorKind::Internal, "internal error"));
        }
    }
}
