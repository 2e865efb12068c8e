#ifndef ATELIER_ADMIN_HPP
#define ATELIER_ADMIN_HPP

#include <drogon/HttpController.h>

#include <support/app_context.hpp>
#include <support/controllers.hpp>

namespace atelier {
    class Admin_Controller : public drogon::HttpController<Admin_Controller, false> {
    public:
        METHOD_LIST_BEGIN
            ADD_METHOD_TO(Admin_Controller::login, "/api/auth/login", drogon::Post);
            ADD_METHOD_TO(Admin_Controller::sign, "/api/admin/sign", drogon::Get, "atelier::BearerAuthFilter");
            ADD_METHOD_TO(Admin_Controller::registerPhoto, "/api/admin/photos/register", drogon::Post, "atelier::BearerAuthFilter");
            ADD_METHOD_TO(Admin_Controller::repairPhotos, "/api/admin/photos/repair", drogon::Post, "atelier::BearerAuthFilter");
            ADD_METHOD_TO(Admin_Controller::listPhotos, "/api/admin/photos", drogon::Get, "atelier::BearerAuthFilter");
            ADD_METHOD_TO(Admin_Controller::clearPhotos, "/api/admin/photos", drogon::Delete, "atelier::BearerAuthFilter");
            ADD_METHOD_TO(Admin_Controller::updatePhoto, "/api/admin/photos/{1}", drogon::Put, "atelier::BearerAuthFilter");
            ADD_METHOD_TO(Admin_Controller::deletePhoto, "/api/admin/photos/{1}", drogon::Delete, "atelier::BearerAuthFilter");
            ADD_METHOD_TO(Admin_Controller::publish, "/api/admin/publish", drogon::Post, "atelier::BearerAuthFilter");
            ADD_METHOD_TO(Admin_Controller::reorder, "/api/admin/reorder", drogon::Post, "atelier::BearerAuthFilter");
        METHOD_LIST_END

        explicit Admin_Controller(std::shared_ptr<AppContext> context) : context_(std::move(context)) {}

        void login(const drogon::HttpRequestPtr &req, Callback_t callback);
        void sign(const drogon::HttpRequestPtr &req, Callback_t callback);
        void registerPhoto(const drogon::HttpRequestPtr &req, Callback_t callback);
        void repairPhotos(const drogon::HttpRequestPtr &req, Callback_t callback);
        void listPhotos(const drogon::HttpRequestPtr &req, Callback_t callback);
        void clearPhotos(const drogon::HttpRequestPtr &req, Callback_t callback);
        void updatePhoto(const drogon::HttpRequestPtr &req, Callback_t callback, const std::string &id);
        void deletePhoto(const drogon::HttpRequestPtr &req, Callback_t callback, const std::string &id);
        void publish(const drogon::HttpRequestPtr &req, Callback_t callback);
        void reorder(const drogon::HttpRequestPtr &req, Callback_t callback);

    private:
        std::shared_ptr<AppContext> context_;
    };
}

#endif //ATELIER_ADMIN_HPP
