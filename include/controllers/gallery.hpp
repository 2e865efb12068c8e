//
// Created by David Yang on 2026-01-11.
//

#ifndef ATELIER_GALLERY_HPP
#define ATELIER_GALLERY_HPP
#include <drogon/HttpController.h>

#include <support/app_context.hpp>
#include <support/controllers.hpp>

namespace atelier {
    class GalleryController : public drogon::HttpController<GalleryController, false>
    {
    public:
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(GalleryController::get_photos, "/api/photos", drogon::Get);
    ADD_METHOD_TO(GalleryController::get_health, "/api/health", drogon::Get);
    METHOD_LIST_END

    explicit GalleryController(std::shared_ptr<AppContext> context) : context_(std::move(context)) {}

    void get_photos(const drogon::HttpRequestPtr& req, Callback_t callback);
    void get_health(const drogon::HttpRequestPtr& req, Callback_t callback);

    private:
    std::shared_ptr<AppContext> context_;
    };
}


#endif //ATELIER_GALLERY_HPP
