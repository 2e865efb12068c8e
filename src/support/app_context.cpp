#include <support/app_context.hpp>
#include <support/b2_snapshot_backend.hpp>
#include <support/image_utils.hpp>
#include <drogon/drogon.h>
#include <cstdlib>

namespace atelier {

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

AppConfig AppConfig::fromCustomConfig(const Json::Value& customConfig) {
    AppConfig config;
    const auto& storage = customConfig["storage"];
    config.dataDir = storage.get("dataDir", config.dataDir.string()).asString();
    config.snapshotObject = storage.get("snapshotObject", config.snapshotObject).asString();
    config.fallbackDir = storage.get("fallbackDir", (config.dataDir / "durable").string()).asString();

    const auto& media = customConfig["media"];
    config.mediaBaseUrl = media.get("baseUrl", "").asString();
    config.thumbnailQuery = media.get("thumbnailQuery", config.thumbnailQuery).asString();

    config.uploadFolder = customConfig["upload"].get("folder", config.uploadFolder).asString();

    int ttlHours = customConfig["auth"].get("tokenTtlHours", 168).asInt();
    config.tokenTtl = std::chrono::hours(ttlHours > 0 ? ttlHours : 168);

    const char* env_admin_pass = std::getenv("ADMIN_PASSWORD");
    config.adminPassword = env_admin_pass ? trim(env_admin_pass) : "";
    return config;
}

std::shared_ptr<AppContext> AppContext::create(const Json::Value& customConfig) {
    auto context = std::make_shared<AppContext>();
    context->config = AppConfig::fromCustomConfig(customConfig);
    context->b2 = B2Service::fromConfig(customConfig);

    auto cache = std::make_shared<LocalSnapshotBackend>(context->config.cacheFile());
    std::shared_ptr<SnapshotBackend> durable;
    if (context->b2) {
        durable = std::make_shared<B2SnapshotBackend>(context->b2, context->config.snapshotObject);
    } else {
        LOG_WARN << "B2 is not configured (b2.keyId, b2.bucketName, DB_API_KEY); using local durable store in "
                 << context->config.fallbackDir;
        durable = std::make_shared<LocalSnapshotBackend>(context->config.fallbackDir / "photos.json");
    }

    context->store = std::make_shared<CollectionStore>(cache, durable);
    if (auto b2 = context->b2) {
        // Download URLs depend on the account authorization
        b2->authorizeInBackground();
        context->store->setDimensionLookup([b2](const std::string& blobRef) -> std::optional<image::Dimensions> {
            auto head = b2->downloadBlocking(blobRef, image::kProbeBytes);
            if (!head) return std::nullopt;
            return image::readDimensions(*head);
        });
    }

    context->tokens = std::make_shared<SessionTokens>(SessionTokens::secretFromEnvironment(), context->config.tokenTtl);

    std::weak_ptr<B2Service> weakB2 = context->b2;
    context->media = std::make_shared<MediaUrls>(context->config.mediaBaseUrl, context->config.thumbnailQuery,
                                                 [weakB2]() -> std::optional<std::string> {
                                                     if (auto b2 = weakB2.lock()) return b2->publicBaseUrl();
                                                     return std::nullopt;
                                                 });
    return context;
}

void removeBlobsInBackground(const std::shared_ptr<B2Service>& b2, const std::vector<std::string>& blobRefs) {
    if (blobRefs.empty()) return;
    if (!b2) {
        LOG_WARN << "Blob store not configured, leaving " << blobRefs.size() << " binaries in place";
        return;
    }
    // All removals are in flight at once; each outcome is only logged
    for (const auto& blobRef : blobRefs) {
        b2->remove(blobRef, [blobRef](bool success) {
            if (!success) {
                LOG_WARN << "Could not delete blob " << blobRef << ", metadata removal stands";
            }
        });
    }
}

}
