#ifndef ATELIER_PHOTO_VIEWS_HPP
#define ATELIER_PHOTO_VIEWS_HPP

#include <json/json.h>
#include <support/media_urls.hpp>
#include <support/photo_record.hpp>

namespace atelier::views {
    // id, url, name, width, height, orientation, ratio, order. url is null
    // while no media base URL is known.
    Json::Value publicPhoto(const PhotoRecord& photo, const MediaUrls& media);

    // publicPhoto plus thumbUrl, published, createdAt and the raw blobRef
    Json::Value adminPhoto(const PhotoRecord& photo, const MediaUrls& media);

    Json::Value publicList(const Collection& photos, const MediaUrls& media);
    Json::Value adminList(const Collection& photos, const MediaUrls& media);
}

#endif // ATELIER_PHOTO_VIEWS_HPP
