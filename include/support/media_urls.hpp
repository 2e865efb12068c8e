#ifndef ATELIER_MEDIA_URLS_HPP
#define ATELIER_MEDIA_URLS_HPP

#include <functional>
#include <optional>
#include <string>

namespace atelier {

// Rendering URLs for blob refs. Resizing and format negotiation are the CDN's
// job; this only puts the pieces together.
class MediaUrls {
public:
    using BaseResolver = std::function<std::optional<std::string>()>;

    MediaUrls(std::string baseUrl, std::string thumbnailQuery, BaseResolver fallback = nullptr);

    // nullopt while no base URL is known (no media.baseUrl and the blob store
    // has not been reached yet)
    std::optional<std::string> imageUrl(const std::string& blobRef) const;
    std::optional<std::string> thumbnailUrl(const std::string& blobRef) const;

private:
    std::string baseUrl_;
    std::string thumbnailQuery_;
    BaseResolver fallback_;

    std::optional<std::string> base() const;
};

}

#endif // ATELIER_MEDIA_URLS_HPP
