#include <support/photo_views.hpp>

namespace atelier::views {

static Json::Value urlOrNull(const std::optional<std::string>& url) {
    return url ? Json::Value(*url) : Json::Value(Json::nullValue);
}

Json::Value publicPhoto(const PhotoRecord& photo, const MediaUrls& media) {
    Json::Value jItem;
    jItem["id"] = photo.id;
    jItem["url"] = urlOrNull(media.imageUrl(photo.blobRef));
    jItem["name"] = photo.name;
    jItem["width"] = photo.width;
    jItem["height"] = photo.height;
    jItem["orientation"] = geometry::toString(photo.orientation);
    jItem["ratio"] = photo.ratio;
    jItem["order"] = photo.order;
    return jItem;
}

Json::Value adminPhoto(const PhotoRecord& photo, const MediaUrls& media) {
    Json::Value jItem = publicPhoto(photo, media);
    jItem["thumbUrl"] = urlOrNull(media.thumbnailUrl(photo.blobRef));
    jItem["published"] = photo.published;
    jItem["createdAt"] = photo.createdAt;
    jItem["blobRef"] = photo.blobRef;
    return jItem;
}

Json::Value publicList(const Collection& photos, const MediaUrls& media) {
    Json::Value root(Json::arrayValue);
    for (const auto& photo : photos) {
        root.append(publicPhoto(photo, media));
    }
    return root;
}

Json::Value adminList(const Collection& photos, const MediaUrls& media) {
    Json::Value root(Json::arrayValue);
    for (const auto& photo : photos) {
        root.append(adminPhoto(photo, media));
    }
    return root;
}

}
