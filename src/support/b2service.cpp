#include <support/b2service.hpp>
#include <drogon/utils/Utilities.h>
#include <json/json.h>
#include <atomic>
#include <future>

namespace atelier {

static void splitUrl(const std::string& url, std::string& host, std::string& path) {
    size_t pos = url.find("://");
    if (pos == std::string::npos) {
        host = url;
        path = "/";
        return;
    }
    pos += 3;
    size_t pathPos = url.find("/", pos);
    if (pathPos == std::string::npos) {
        host = url;
        path = "/";
    } else {
        host = url.substr(0, pathPos);
        path = url.substr(pathPos);
    }
}

B2Service::B2Service(std::string keyId, std::string applicationKey, std::string bucketName, double timeoutSeconds)
    : keyId_(std::move(keyId)), applicationKey_(std::move(applicationKey)), bucketName_(std::move(bucketName)),
      timeoutSeconds_(timeoutSeconds > 0 ? timeoutSeconds : 10.0), loopThread_("B2Client") {
    loopThread_.run();
}

std::shared_ptr<B2Service> B2Service::fromConfig(const Json::Value& customConfig) {
    const auto& b2Config = customConfig["b2"];

    std::string keyId = b2Config.get("keyId", "").asString();
    std::string bucketName = b2Config.get("bucketName", "").asString();
    double timeoutSeconds = b2Config.get("timeoutSeconds", 10.0).asDouble();
    const char* env_api_key = std::getenv("DB_API_KEY");
    std::string applicationKey = env_api_key ? env_api_key : "";

    if (keyId.empty() || bucketName.empty() || applicationKey.empty()) {
        return nullptr;
    }

    return std::make_shared<B2Service>(keyId, applicationKey, bucketName, timeoutSeconds);
}

drogon::HttpClientPtr B2Service::clientFor(const std::string& host) {
    return drogon::HttpClient::newHttpClient(host, loopThread_.getLoop());
}

std::chrono::milliseconds B2Service::blockingWaitLimit() const {
    // authorize + get upload url + upload + one retry pair, each bounded by the request timeout
    return std::chrono::milliseconds(static_cast<long long>(timeoutSeconds_ * 5 * 1000));
}

void B2Service::upload(const std::string& fileName, std::string&& content, std::function<void(bool success, std::string fileId)>&& callback) {
    auto self = shared_from_this();
    auto sharedContent = std::make_shared<std::string>(std::move(content));
    getAuth([self, fileName, sharedContent, callback = std::move(callback)](bool success, B2AuthResponse auth) mutable {
        if (!success) {
            callback(false, "");
            return;
        }
        self->getUpload(auth, [self, auth, fileName, sharedContent, callback = std::move(callback)](bool success, B2UploadData uploadData) mutable {
            if (!success) {
                callback(false, "");
                return;
            }

            // The first attempt gets a copy so a retry still has the content
            std::string contentForAttempt = *sharedContent;

            self->uploadFile(uploadData.uploadUrl, uploadData.uploadAuthToken, fileName, std::move(contentForAttempt), [self, auth, fileName, sharedContent, callback = std::move(callback)](bool success, std::string fileId) mutable {
                if (!success) {
                    LOG_WARN << "B2 Upload failed with cached URL, retrying with fresh URL...";
                    {
                        std::lock_guard<std::mutex> lock(self->mutex_);
                        self->uploadCache_.reset();
                    }
                    self->getUpload(auth, [self, fileName, sharedContent, callback = std::move(callback)](bool success, B2UploadData uploadData) mutable {
                        if (!success) {
                            callback(false, "");
                            return;
                        }
                        self->uploadFile(uploadData.uploadUrl, uploadData.uploadAuthToken, fileName, std::move(*sharedContent), std::move(callback));
                    });
                } else {
                    callback(true, fileId);
                }
            });
        });
    });
}

void B2Service::download(const std::string& fileName, size_t rangeBytes, std::function<void(bool success, std::string&& content)>&& callback) {
    auto self = shared_from_this();
    getAuth([self, fileName, rangeBytes, callback = std::move(callback)](bool success, B2AuthResponse auth) mutable {
        if (!success) {
            callback(false, "");
            return;
        }

        std::string downloadUrl = auth.downloadUrl + "/file/" + self->bucketName_ + "/" + fileName;
        std::string host, path;
        splitUrl(downloadUrl, host, path);

        auto client = self->clientFor(host);
        auto req = drogon::HttpRequest::newHttpRequest();
        req->setPath(path);
        req->setMethod(drogon::Get);
        req->addHeader("Authorization", auth.authorizationToken);
        if (rangeBytes > 0) {
            req->addHeader("Range", "bytes=0-" + std::to_string(rangeBytes - 1));
        }

        client->sendRequest(req, [client, fileName, callback = std::move(callback)](drogon::ReqResult result, const drogon::HttpResponsePtr& resp) mutable {
            if (result == drogon::ReqResult::Ok && resp &&
                (resp->statusCode() == drogon::k200OK || resp->statusCode() == drogon::k206PartialContent)) {
                std::string body(resp->body().data(), resp->body().size());
                callback(true, std::move(body));
            } else {
                LOG_ERROR << "B2 Download failed for " << fileName << ": " << static_cast<int>(result) << " Status: " << (resp ? (int)resp->statusCode() : 0);
                callback(false, "");
            }
        }, self->timeoutSeconds_);
    });
}

void B2Service::remove(const std::string& fileName, std::function<void(bool success)>&& callback) {
    auto self = shared_from_this();
    getAuth([self, fileName, callback = std::move(callback)](bool success, B2AuthResponse auth) mutable {
        if (!success) {
            callback(false);
            return;
        }
        self->listFileVersions(auth, fileName, [self, auth, fileName, callback = std::move(callback)](bool success, std::vector<B2FileVersion> versions) mutable {
            if (!success) {
                callback(false);
                return;
            }
            if (versions.empty()) {
                LOG_WARN << "B2 has no stored versions of " << fileName;
                callback(true);
                return;
            }

            auto remaining = std::make_shared<std::atomic<size_t>>(versions.size());
            auto allOk = std::make_shared<std::atomic<bool>>(true);
            auto sharedCallback = std::make_shared<std::function<void(bool)>>(std::move(callback));
            for (const auto& version : versions) {
                self->deleteFile(auth, version.fileName, version.fileId, [remaining, allOk, sharedCallback](bool success) {
                    if (!success) *allOk = false;
                    if (--(*remaining) == 0) {
                        (*sharedCallback)(allOk->load());
                    }
                });
            }
        });
    });
}

void B2Service::issueUploadCredential(std::function<void(bool success, B2UploadData uploadData)>&& callback) {
    auto self = shared_from_this();
    getAuth([self, callback = std::move(callback)](bool success, B2AuthResponse auth) mutable {
        if (!success) {
            callback(false, {});
            return;
        }
        // Never hand out the cached URL: B2 upload URLs must not be shared between uploaders
        self->getUploadUrl(auth, [callback = std::move(callback)](bool success, std::string uploadUrl, std::string uploadAuthToken) mutable {
            B2UploadData data;
            if (success) {
                data.uploadUrl = uploadUrl;
                data.uploadAuthToken = uploadAuthToken;
                data.lastUpdated = std::chrono::steady_clock::now();
            }
            callback(success, data);
        });
    });
}

bool B2Service::uploadBlocking(const std::string& fileName, std::string content) {
    if (loopThread_.getLoop()->isInLoopThread()) {
        LOG_ERROR << "Blocking B2 upload requested from the client loop thread";
        return false;
    }
    auto done = std::make_shared<std::promise<bool>>();
    auto future = done->get_future();
    upload(fileName, std::move(content), [done](bool success, std::string) {
        done->set_value(success);
    });
    if (future.wait_for(blockingWaitLimit()) != std::future_status::ready) {
        LOG_ERROR << "B2 upload of " << fileName << " timed out";
        return false;
    }
    return future.get();
}

std::optional<std::string> B2Service::downloadBlocking(const std::string& fileName, size_t rangeBytes) {
    if (loopThread_.getLoop()->isInLoopThread()) {
        LOG_ERROR << "Blocking B2 download requested from the client loop thread";
        return std::nullopt;
    }
    auto done = std::make_shared<std::promise<std::optional<std::string>>>();
    auto future = done->get_future();
    download(fileName, rangeBytes, [done](bool success, std::string&& content) {
        if (success) {
            done->set_value(std::move(content));
        } else {
            done->set_value(std::nullopt);
        }
    });
    if (future.wait_for(blockingWaitLimit()) != std::future_status::ready) {
        LOG_ERROR << "B2 download of " << fileName << " timed out";
        return std::nullopt;
    }
    return future.get();
}

void B2Service::authorizeInBackground() {
    if (authorizing_.exchange(true)) return;
    auto self = shared_from_this();
    getAuth([self](bool success, B2AuthResponse) {
        self->authorizing_ = false;
        if (!success) {
            LOG_WARN << "B2 authorization failed, download URLs stay unknown until it succeeds";
        }
    });
}

std::optional<std::string> B2Service::publicBaseUrl() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (authCache_) return authCache_->downloadUrl + "/file/" + bucketName_;
    }
    authorizeInBackground();
    return std::nullopt;
}

void B2Service::getAuth(std::function<void(bool success, B2AuthResponse auth)>&& callback) {
    std::optional<B2AuthResponse> cached;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (authCache_.has_value()) {
            auto now = std::chrono::steady_clock::now();
            if (std::chrono::duration_cast<std::chrono::hours>(now - lastAuthTime_).count() < 20) {
                cached = authCache_;
            }
        }
    }
    if (cached) {
        callback(true, *cached);
        return;
    }

    auto self = shared_from_this();
    authorize([self, callback = std::move(callback)](bool success, B2AuthResponse auth) mutable {
        if (success) {
            std::lock_guard<std::mutex> lock(self->mutex_);
            self->authCache_ = auth;
            self->lastAuthTime_ = std::chrono::steady_clock::now();
        }
        callback(success, auth);
    });
}

void B2Service::getUpload(const B2AuthResponse& auth, std::function<void(bool success, B2UploadData uploadData)>&& callback) {
    std::optional<B2UploadData> cached;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (uploadCache_.has_value()) {
            auto now = std::chrono::steady_clock::now();
            // Refresh upload URL every 12 hours (B2 tokens last 24h, but URLs can be shorter lived if many files uploaded)
            if (std::chrono::duration_cast<std::chrono::hours>(now - uploadCache_->lastUpdated).count() < 12) {
                cached = uploadCache_;
            }
        }
    }
    if (cached) {
        callback(true, *cached);
        return;
    }

    auto self = shared_from_this();
    getUploadUrl(auth, [self, callback = std::move(callback)](bool success, std::string uploadUrl, std::string uploadAuthToken) mutable {
        B2UploadData data;
        if (success) {
            data.uploadUrl = uploadUrl;
            data.uploadAuthToken = uploadAuthToken;
            data.lastUpdated = std::chrono::steady_clock::now();
            std::lock_guard<std::mutex> lock(self->mutex_);
            self->uploadCache_ = data;
        }
        callback(success, data);
    });
}

void B2Service::authorize(std::function<void(bool success, B2AuthResponse auth)>&& callback) {
    auto client = clientFor("https://api.backblazeb2.com");
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setPath("/b2api/v2/b2_authorize_account");
    req->setMethod(drogon::Get);

    std::string authStr = keyId_ + ":" + applicationKey_;
    req->addHeader("Authorization", "Basic " + drogon::utils::base64Encode((const unsigned char*)authStr.data(), authStr.size()));

    client->sendRequest(req, [client, callback = std::move(callback)](drogon::ReqResult result, const drogon::HttpResponsePtr &resp) {
        if (result != drogon::ReqResult::Ok || !resp || resp->statusCode() != drogon::k200OK) {
            LOG_ERROR << "B2 Auth Error: " << (resp ? std::to_string(resp->statusCode()) : "No response");
            if (resp) LOG_ERROR << "Body: " << resp->body();
            callback(false, {});
            return;
        }

        auto json = resp->getJsonObject();
        if (!json) {
            callback(false, {});
            return;
        }

        B2AuthResponse auth;
        auth.accountId = (*json)["accountId"].asString();
        auth.apiUrl = (*json)["apiUrl"].asString();
        auth.authorizationToken = (*json)["authorizationToken"].asString();
        auth.downloadUrl = (*json)["downloadUrl"].asString();
        auth.bucketId = (*json)["allowed"]["bucketId"].asString();
        callback(true, auth);
    }, timeoutSeconds_);
}

void B2Service::getUploadUrl(const B2AuthResponse& auth, std::function<void(bool success, std::string uploadUrl, std::string uploadAuthToken)>&& callback) {
    auto client = clientFor(auth.apiUrl);
    Json::Value body;
    body["bucketId"] = auth.bucketId;
    auto req = drogon::HttpRequest::newHttpJsonRequest(body);
    req->setPath("/b2api/v2/b2_get_upload_url");
    req->setMethod(drogon::Post);
    req->addHeader("Authorization", auth.authorizationToken);

    client->sendRequest(req, [client, callback = std::move(callback)](drogon::ReqResult result, const drogon::HttpResponsePtr &resp) {
        if (result != drogon::ReqResult::Ok || !resp || resp->statusCode() != drogon::k200OK) {
            LOG_ERROR << "B2 GetUploadUrl Error: " << (resp ? resp->body() : "No response");
            callback(false, "", "");
            return;
        }
        auto json = resp->getJsonObject();
        if (!json) {
            callback(false, "", "");
            return;
        }
        callback(true, (*json)["uploadUrl"].asString(), (*json)["authorizationToken"].asString());
    }, timeoutSeconds_);
}

void B2Service::uploadFile(const std::string& uploadUrl, const std::string& uploadAuthToken, const std::string& fileName, std::string&& content, std::function<void(bool success, std::string fileId)>&& callback) {
    std::string host, path;
    splitUrl(uploadUrl, host, path);
    auto client = clientFor(host);
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setPath(path);
    req->setMethod(drogon::Post);
    req->addHeader("Authorization", uploadAuthToken);
    req->addHeader("X-Bz-File-Name", drogon::utils::urlEncode(fileName));
    req->addHeader("Content-Type", "b2/x-auto");
    req->addHeader("X-Bz-Content-Sha1", drogon::utils::getSha1(content));
    req->setBody(std::move(content));

    client->sendRequest(req, [client, callback = std::move(callback)](drogon::ReqResult result, const drogon::HttpResponsePtr &resp) {
        if (result != drogon::ReqResult::Ok || !resp || resp->statusCode() != drogon::k200OK) {
            LOG_ERROR << "B2 Upload Error: " << (resp ? resp->body() : "No response");
            callback(false, "");
            return;
        }
        auto json = resp->getJsonObject();
        callback(true, json ? (*json)["fileId"].asString() : "");
    }, timeoutSeconds_);
}

void B2Service::listFileVersions(const B2AuthResponse& auth, const std::string& fileName, std::function<void(bool success, std::vector<B2FileVersion> versions)>&& callback) {
    auto client = clientFor(auth.apiUrl);
    Json::Value body;
    body["bucketId"] = auth.bucketId;
    body["startFileName"] = fileName;
    body["prefix"] = fileName;
    body["maxFileCount"] = 100;
    auto req = drogon::HttpRequest::newHttpJsonRequest(body);
    req->setPath("/b2api/v2/b2_list_file_versions");
    req->setMethod(drogon::Post);
    req->addHeader("Authorization", auth.authorizationToken);

    client->sendRequest(req, [client, fileName, callback = std::move(callback)](drogon::ReqResult result, const drogon::HttpResponsePtr &resp) {
        if (result != drogon::ReqResult::Ok || !resp || resp->statusCode() != drogon::k200OK) {
            LOG_ERROR << "B2 ListFileVersions Error: " << (resp ? resp->body() : "No response");
            callback(false, {});
            return;
        }
        auto json = resp->getJsonObject();
        if (!json) {
            callback(false, {});
            return;
        }

        std::vector<B2FileVersion> versions;
        for (const auto& file : (*json)["files"]) {
            // prefix matching also returns longer names; keep exact matches only
            if (file["fileName"].asString() != fileName) continue;
            versions.push_back({file["fileName"].asString(), file["fileId"].asString()});
        }
        callback(true, std::move(versions));
    }, timeoutSeconds_);
}

void B2Service::deleteFile(const B2AuthResponse& auth, const std::string& fileName, const std::string& fileId, std::function<void(bool success)>&& callback) {
    auto client = clientFor(auth.apiUrl);
    Json::Value body;
    body["fileName"] = fileName;
    body["fileId"] = fileId;
    auto req = drogon::HttpRequest::newHttpJsonRequest(body);
    req->setPath("/b2api/v2/b2_delete_file_version");
    req->setMethod(drogon::Post);
    req->addHeader("Authorization", auth.authorizationToken);

    client->sendRequest(req, [client, callback = std::move(callback)](drogon::ReqResult result, const drogon::HttpResponsePtr &resp) {
        if (result != drogon::ReqResult::Ok || !resp || resp->statusCode() != drogon::k200OK) {
            LOG_ERROR << "B2 Delete Error: " << (resp ? resp->body() : "No response");
            callback(false);
            return;
        }
        callback(true);
    }, timeoutSeconds_);
}

}
