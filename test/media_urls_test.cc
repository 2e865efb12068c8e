#include <drogon/drogon_test.h>
#include <support/media_urls.hpp>
#include <support/photo_views.hpp>
#include <memory>

using namespace atelier;

DROGON_TEST(ConfiguredBaseWins)
{
    MediaUrls media("https://cdn.example.test//", "width=400", []() -> std::optional<std::string> {
        return std::string("https://f000.backblazeb2.com/file/bucket");
    });
    CHECK(media.imageUrl("photos/a") == std::optional<std::string>("https://cdn.example.test/photos/a"));
    CHECK(media.thumbnailUrl("photos/a") == std::optional<std::string>("https://cdn.example.test/photos/a?width=400"));
}

DROGON_TEST(UnknownBaseYieldsNoUrlUntilResolved)
{
    auto known = std::make_shared<std::optional<std::string>>();
    MediaUrls media("", "width=400", [known]() { return *known; });

    CHECK(!media.imageUrl("photos/a").has_value());
    CHECK(!media.thumbnailUrl("photos/a").has_value());

    PhotoRecord photo;
    photo.id = "a";
    photo.blobRef = "photos/a";
    auto view = views::adminPhoto(photo, media);
    CHECK(view["url"].isNull());
    CHECK(view["thumbUrl"].isNull());

    // once the blob store's download URL is known it is used as the base
    *known = "https://f000.backblazeb2.com/file/bucket/";
    CHECK(media.imageUrl("photos/a") == std::optional<std::string>("https://f000.backblazeb2.com/file/bucket/photos/a"));
    CHECK(views::publicPhoto(photo, media)["url"].asString() == "https://f000.backblazeb2.com/file/bucket/photos/a");
}

DROGON_TEST(NoResolverAndNoBase)
{
    MediaUrls media("", "");
    CHECK(!media.imageUrl("photos/a").has_value());
}
