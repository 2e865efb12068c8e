#ifndef ATELIER_APP_CONTEXT_HPP
#define ATELIER_APP_CONTEXT_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <json/json.h>
#include <support/b2service.hpp>
#include <support/collection_store.hpp>
#include <support/media_urls.hpp>
#include <support/session_tokens.hpp>

namespace atelier {

struct AppConfig {
    std::filesystem::path dataDir = "data";
    std::string snapshotObject = "db/photos.json";
    std::filesystem::path fallbackDir = "data/durable";
    std::string mediaBaseUrl;
    std::string thumbnailQuery = "width=400&fit=scale-down";
    std::string uploadFolder = "photos";
    std::chrono::hours tokenTtl{168};
    std::string adminPassword;

    // Reads drogon's custom_config section plus ADMIN_PASSWORD.
    static AppConfig fromCustomConfig(const Json::Value& customConfig);

    std::filesystem::path cacheFile() const { return dataDir / "photos.json"; }
};

// Everything the controllers share. Built once in main and handed to each
// controller; b2 is null when the blob store is not configured.
struct AppContext {
    AppConfig config;
    std::shared_ptr<B2Service> b2;
    std::shared_ptr<CollectionStore> store;
    std::shared_ptr<SessionTokens> tokens;
    std::shared_ptr<MediaUrls> media;

    static std::shared_ptr<AppContext> create(const Json::Value& customConfig);
};

// Starts best-effort removal of the given binaries and returns at once.
// Failures are logged, never reported to the caller.
void removeBlobsInBackground(const std::shared_ptr<B2Service>& b2, const std::vector<std::string>& blobRefs);

}

#endif // ATELIER_APP_CONTEXT_HPP
