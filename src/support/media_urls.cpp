#include <support/media_urls.hpp>

namespace atelier {

static std::string stripTrailingSlash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

MediaUrls::MediaUrls(std::string baseUrl, std::string thumbnailQuery, BaseResolver fallback)
    : baseUrl_(stripTrailingSlash(std::move(baseUrl))), thumbnailQuery_(std::move(thumbnailQuery)),
      fallback_(std::move(fallback)) {}

std::optional<std::string> MediaUrls::base() const {
    if (!baseUrl_.empty()) return baseUrl_;
    if (fallback_) {
        if (auto resolved = fallback_()) {
            auto url = stripTrailingSlash(*resolved);
            if (!url.empty()) return url;
        }
    }
    return std::nullopt;
}

std::optional<std::string> MediaUrls::imageUrl(const std::string& blobRef) const {
    auto root = base();
    if (!root) return std::nullopt;
    return *root + "/" + blobRef;
}

std::optional<std::string> MediaUrls::thumbnailUrl(const std::string& blobRef) const {
    auto url = imageUrl(blobRef);
    if (!url || thumbnailQuery_.empty()) return url;
    return *url + "?" + thumbnailQuery_;
}

}
