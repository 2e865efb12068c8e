#ifndef ATELIER_B2SERVICE_HPP
#define ATELIER_B2SERVICE_HPP

#include <drogon/drogon.h>
#include <trantor/net/EventLoopThread.h>
#include <string>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include <atomic>
#include <mutex>
#include <chrono>

namespace atelier {

struct B2AuthResponse {
    std::string accountId;
    std::string apiUrl;
    std::string authorizationToken;
    std::string downloadUrl;
    std::string bucketId;
};

struct B2UploadData {
    std::string uploadUrl;
    std::string uploadAuthToken;
    std::chrono::steady_clock::time_point lastUpdated;
};

struct B2FileVersion {
    std::string fileName;
    std::string fileId;
};

class B2Service : public std::enable_shared_from_this<B2Service> {
public:
    // nullptr when b2.keyId, b2.bucketName or DB_API_KEY is missing.
    static std::shared_ptr<B2Service> fromConfig(const Json::Value& customConfig);

    B2Service(std::string keyId, std::string applicationKey, std::string bucketName, double timeoutSeconds = 10.0);

    // High-level upload method with caching
    void upload(const std::string& fileName,
                std::string&& content,
                std::function<void(bool success, std::string fileId)>&& callback);

    // High-level download method; rangeBytes > 0 fetches only the head of the file
    void download(const std::string& fileName,
                  size_t rangeBytes,
                  std::function<void(bool success, std::string&& content)>&& callback);

    // Deletes every stored version of fileName
    void remove(const std::string& fileName,
                std::function<void(bool success)>&& callback);

    // A fresh upload URL for a direct-to-bucket upload by a browser
    void issueUploadCredential(std::function<void(bool success, B2UploadData uploadData)>&& callback);

    // Blocking variants, bounded by the request timeout. Must not be called
    // from the client loop thread.
    bool uploadBlocking(const std::string& fileName, std::string content);
    std::optional<std::string> downloadBlocking(const std::string& fileName, size_t rangeBytes = 0);

    // Fetches and caches an account authorization without waiting for it.
    // Concurrent calls share one request.
    void authorizeInBackground();

    // <downloadUrl>/file/<bucket> once an authorization has been cached;
    // otherwise starts one and returns nullopt
    std::optional<std::string> publicBaseUrl();

    const std::string& bucketName() const { return bucketName_; }

private:
    std::string keyId_;
    std::string applicationKey_;
    std::string bucketName_;
    double timeoutSeconds_;

    // HTTP clients run on their own loop so blocking callers on drogon IO
    // threads cannot starve their own responses
    trantor::EventLoopThread loopThread_;

    // Caching
    std::mutex mutex_;
    std::optional<B2AuthResponse> authCache_;
    std::chrono::steady_clock::time_point lastAuthTime_;
    std::optional<B2UploadData> uploadCache_;
    std::atomic<bool> authorizing_{false};

    drogon::HttpClientPtr clientFor(const std::string& host);
    std::chrono::milliseconds blockingWaitLimit() const;

    void getAuth(std::function<void(bool success, B2AuthResponse auth)>&& callback);
    void getUpload(const B2AuthResponse& auth, std::function<void(bool success, B2UploadData uploadData)>&& callback);

    void authorize(std::function<void(bool success, B2AuthResponse auth)>&& callback);

    void getUploadUrl(const B2AuthResponse& auth,
                      std::function<void(bool success, std::string uploadUrl, std::string uploadAuthToken)>&& callback);

    void uploadFile(const std::string& uploadUrl,
                    const std::string& uploadAuthToken,
                    const std::string& fileName,
                    std::string&& content,
                    std::function<void(bool success, std::string fileId)>&& callback);

    void listFileVersions(const B2AuthResponse& auth,
                          const std::string& fileName,
                          std::function<void(bool success, std::vector<B2FileVersion> versions)>&& callback);

    void deleteFile(const B2AuthResponse& auth,
                    const std::string& fileName,
                    const std::string& fileId,
                    std::function<void(bool success)>&& callback);
};

}

#endif // ATELIER_B2SERVICE_HPP
