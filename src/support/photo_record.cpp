#include <support/photo_record.hpp>
#include <drogon/drogon.h>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <memory>

namespace atelier {

void PhotoRecord::classify() {
    auto c = geometry::classify(width, height);
    ratio = c.ratio;
    orientation = c.orientation;
}

namespace record {

Json::Value toJson(const PhotoRecord& photo) {
    Json::Value jItem;
    jItem["id"] = photo.id;
    jItem["blobRef"] = photo.blobRef;
    jItem["name"] = photo.name;
    jItem["width"] = photo.width;
    jItem["height"] = photo.height;
    jItem["ratio"] = photo.ratio;
    jItem["orientation"] = geometry::toString(photo.orientation);
    jItem["order"] = photo.order;
    jItem["published"] = photo.published;
    jItem["createdAt"] = photo.createdAt;
    return jItem;
}

std::optional<PhotoRecord> fromJson(const Json::Value& jItem) {
    if (!jItem.isObject()) return std::nullopt;
    if (!jItem["id"].isString() || !jItem["blobRef"].isString()) return std::nullopt;

    PhotoRecord photo;
    photo.id = jItem["id"].asString();
    photo.blobRef = jItem["blobRef"].asString();
    if (photo.id.empty() || photo.blobRef.empty()) return std::nullopt;

    photo.name = jItem.get("name", "").asString();
    photo.width = jItem["width"].isInt() ? jItem["width"].asInt() : 0;
    photo.height = jItem["height"].isInt() ? jItem["height"].asInt() : 0;
    photo.order = jItem["order"].isInt() ? jItem["order"].asInt() : 0;
    photo.published = jItem["published"].isBool() && jItem["published"].asBool();
    photo.createdAt = jItem.get("createdAt", "").asString();

    // ratio/orientation are derived; trust the stored pair only if both are sane
    auto orientation = geometry::parseOrientation(jItem.get("orientation", "").asString());
    if (orientation && jItem["ratio"].isNumeric()) {
        photo.ratio = jItem["ratio"].asDouble();
        photo.orientation = *orientation;
    } else {
        photo.classify();
    }
    return photo;
}

std::string serialize(const Collection& photos) {
    Json::Value root(Json::arrayValue);
    for (const auto& photo : photos) {
        root.append(toJson(photo));
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, root);
}

std::optional<Collection> parse(const std::string& bytes) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errs;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(bytes.data(), bytes.data() + bytes.size(), &root, &errs)) {
        LOG_ERROR << "Failed to parse photo snapshot: " << errs;
        return std::nullopt;
    }
    if (!root.isArray()) {
        LOG_ERROR << "Photo snapshot is not a JSON array";
        return std::nullopt;
    }

    Collection photos;
    photos.reserve(root.size());
    for (const auto& jItem : root) {
        auto photo = fromJson(jItem);
        if (!photo) {
            LOG_WARN << "Skipping malformed photo entry in snapshot";
            continue;
        }
        photos.push_back(std::move(*photo));
    }
    return photos;
}

std::string defaultName(const std::string& originalName, const std::string& blobRef) {
    if (!originalName.empty()) {
        std::string base = originalName;
        size_t lastSlash = base.find_last_of("/\\");
        if (lastSlash != std::string::npos) {
            base = base.substr(lastSlash + 1);
        }
        size_t lastDot = base.find_last_of('.');
        if (lastDot != std::string::npos && lastDot > 0) {
            base = base.substr(0, lastDot);
        }
        if (!base.empty()) return base;
    }

    size_t lastSlash = blobRef.find_last_of('/');
    return lastSlash == std::string::npos ? blobRef : blobRef.substr(lastSlash + 1);
}

std::string nowIso8601() {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    char result[40];
    std::snprintf(result, sizeof(result), "%s.%03dZ", buffer, static_cast<int>(millis));
    return result;
}

}
}
