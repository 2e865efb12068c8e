#include <controllers/admin.hpp>
#include <filters/bearerfilter.hpp>
#include <support/photo_views.hpp>
#include <drogon/HttpAppFramework.h>
#include <drogon/utils/Utilities.h>
#include <cmath>
#include <limits>
#include <optional>
#include <string>

namespace atelier {
    static std::string trim(const std::string& s) {
        auto start = s.find_first_not_of(" \t\n\r");
        if (start == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t\n\r");
        return s.substr(start, end - start + 1);
    }

    // Runs a handler body and turns exceptions into JSON error responses.
    template <typename Fn>
    static void guarded(const char* what, std::function<void(const drogon::HttpResponsePtr &)>& callback, Fn&& fn) {
        drogon::HttpResponsePtr resp;
        try {
            resp = fn();
        } catch (const ApiError& e) {
            LOG_DEBUG << what << ": " << toString(e.kind()) << " " << e.what();
            resp = errorResponse(e);
        } catch (const std::exception& e) {
            LOG_ERROR << what << " failed: " << e.what();
            resp = errorResponse(ErrorKind::Internal, "internal error");
        }
        callback(resp);
    }

    static Json::Value requireJsonBody(const drogon::HttpRequestPtr &req) {
        auto json = req->getJsonObject();
        if (!json || !json->isObject()) {
            throw ApiError(ErrorKind::InvalidInput, "expected a JSON object body");
        }
        return *json;
    }

    // Accepts numbers and numeric strings. Anything else, including values
    // that do not fit a positive int, counts as "not supplied".
    static int dimensionFrom(const Json::Value& value) {
        double number = 0;
        if (value.isNumeric()) {
            number = value.asDouble();
        } else if (value.isString()) {
            try {
                number = std::stod(value.asString());
            } catch (const std::exception&) {
                return 0;
            }
        }
        if (!std::isfinite(number) || number < 1 || number > std::numeric_limits<int>::max()) {
            return 0;
        }
        return static_cast<int>(number);
    }

    void Admin_Controller::login(const drogon::HttpRequestPtr &req, Callback_t callback) {
        std::string raw_password;
        auto json = req->getJsonObject();
        if (json && (*json)["password"].isString()) {
            raw_password = (*json)["password"].asString();
        } else {
            raw_password = req->getParameter("password");
        }
        std::string password = trim(raw_password);
        const std::string& admin_pass = context_->config.adminPassword;

        if (!admin_pass.empty() && !password.empty() && password == admin_pass) {
            Json::Value body;
            body["token"] = context_->tokens->issue("admin");
            body["expiresIn"] = static_cast<Json::Int64>(context_->tokens->ttl().count());
            callback(drogon::HttpResponse::newHttpJsonResponse(body));
            return;
        }

        if (admin_pass.empty()) {
            LOG_WARN << "ADMIN_PASSWORD environment variable is not set or empty";
        } else if (password.empty()) {
            LOG_DEBUG << "Login failed: empty password received";
        } else {
            LOG_DEBUG << "Login failed: password mismatch (input length: " << password.length()
                      << ", expected length: " << admin_pass.length() << ")";
        }
        callback(errorResponse(ErrorKind::Unauthorized, "wrong password"));
    }

    void Admin_Controller::sign(const drogon::HttpRequestPtr &req, Callback_t callback) {
        auto b2Service = context_->b2;
        if (!b2Service) {
            callback(errorResponse(ErrorKind::UpstreamUnavailable, "blob store not configured"));
            return;
        }

        std::string id = drogon::utils::getUuid();
        std::string folder = context_->config.uploadFolder;
        auto shared_callback = std::make_shared<std::function<void(const drogon::HttpResponsePtr &)>>(std::move(callback));

        b2Service->issueUploadCredential([shared_callback, id, folder](bool success, B2UploadData uploadData) {
            if (!success) {
                (*shared_callback)(errorResponse(ErrorKind::UpstreamUnavailable, "could not obtain an upload URL"));
                return;
            }
            Json::Value body;
            body["id"] = id;
            body["folder"] = folder;
            body["fileName"] = folder + "/" + id;
            body["uploadUrl"] = uploadData.uploadUrl;
            body["authorizationToken"] = uploadData.uploadAuthToken;
            (*shared_callback)(drogon::HttpResponse::newHttpJsonResponse(body));
        });
    }

    void Admin_Controller::registerPhoto(const drogon::HttpRequestPtr &req, Callback_t callback) {
        guarded("Register", callback, [&]() {
            auto json = requireJsonBody(req);
            if (!json["blobRef"].isString() || json["blobRef"].asString().empty()) {
                throw ApiError(ErrorKind::InvalidInput, "blobRef is required");
            }

            Registration registration;
            registration.blobRef = json["blobRef"].asString();
            registration.originalName = json.get("originalName", "").isString() ? json["originalName"].asString() : "";
            registration.width = dimensionFrom(json["width"]);
            registration.height = dimensionFrom(json["height"]);

            auto photo = context_->store->registerPhoto(registration);
            return drogon::HttpResponse::newHttpJsonResponse(views::adminPhoto(photo, *context_->media));
        });
    }

    void Admin_Controller::repairPhotos(const drogon::HttpRequestPtr &req, Callback_t callback) {
        guarded("Repair", callback, [&]() {
            Json::Value body;
            body["repaired"] = static_cast<Json::UInt64>(context_->store->repairDimensions());
            return okResponse(body);
        });
    }

    void Admin_Controller::listPhotos(const drogon::HttpRequestPtr &req, Callback_t callback) {
        guarded("Admin listing", callback, [&]() {
            auto photos = context_->store->adminView();
            return drogon::HttpResponse::newHttpJsonResponse(views::adminList(photos, *context_->media));
        });
    }

    void Admin_Controller::clearPhotos(const drogon::HttpRequestPtr &req, Callback_t callback) {
        Collection removed;
        guarded("Clear", callback, [&]() {
            removed = context_->store->clear();
            Json::Value body;
            body["removed"] = static_cast<Json::UInt64>(removed.size());
            return okResponse(body);
        });

        // The response is out; binaries are cleaned up best-effort afterwards
        std::vector<std::string> blobRefs;
        for (const auto& photo : removed) {
            blobRefs.push_back(photo.blobRef);
        }
        removeBlobsInBackground(context_->b2, blobRefs);
    }

    void Admin_Controller::updatePhoto(const drogon::HttpRequestPtr &req, Callback_t callback, const std::string &id) {
        guarded("Update", callback, [&]() {
            auto json = requireJsonBody(req);

            PhotoPatch patch;
            if (json.isMember("name")) {
                if (!json["name"].isString()) throw ApiError(ErrorKind::InvalidInput, "name must be a string");
                patch.name = json["name"].asString();
            }
            if (json.isMember("order")) {
                if (!json["order"].isInt()) throw ApiError(ErrorKind::InvalidInput, "order must be an integer");
                patch.order = json["order"].asInt();
            }

            context_->store->update(id, patch);
            return okResponse();
        });
    }

    void Admin_Controller::deletePhoto(const drogon::HttpRequestPtr &req, Callback_t callback, const std::string &id) {
        std::optional<std::string> blobRef;
        guarded("Delete", callback, [&]() {
            blobRef = context_->store->remove(id);
            return okResponse();
        });

        if (blobRef) {
            removeBlobsInBackground(context_->b2, {*blobRef});
        }
    }

    void Admin_Controller::publish(const drogon::HttpRequestPtr &req, Callback_t callback) {
        guarded("Publish", callback, [&]() {
            std::optional<std::vector<std::string>> ids;
            auto json = req->getJsonObject();
            // Anything other than a list publishes the whole collection
            if (json && json->isObject() && (*json)["ids"].isArray()) {
                ids = parseIdList((*json)["ids"]);
            }

            Json::Value body;
            body["published"] = static_cast<Json::UInt64>(context_->store->publish(ids));
            return okResponse(body);
        });
    }

    void Admin_Controller::reorder(const drogon::HttpRequestPtr &req, Callback_t callback) {
        guarded("Reorder", callback, [&]() {
            auto json = requireJsonBody(req);
            context_->store->reorderAll(parseIdList(json["ids"]));
            return okResponse();
        });
    }
}
