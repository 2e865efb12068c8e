#include <drogon/drogon_test.h>
#include <support/photo_record.hpp>

using namespace atelier;

static PhotoRecord samplePhoto(const std::string& id, int order) {
    PhotoRecord photo;
    photo.id = id;
    photo.blobRef = "photos/" + id;
    photo.name = "Sample " + id;
    photo.width = 3000;
    photo.height = 2000;
    photo.classify();
    photo.order = order;
    photo.createdAt = "2026-01-20T10:04:05.123Z";
    return photo;
}

DROGON_TEST(SerializeIsDeterministic)
{
    Collection photos{samplePhoto("a", 0), samplePhoto("b", 1)};
    auto first = record::serialize(photos);
    auto reparsed = record::parse(first);
    REQUIRE(reparsed.has_value());
    CHECK(record::serialize(*reparsed) == first);
    CHECK(first.find("\"orientation\" : \"landscape\"") != std::string::npos);
}

DROGON_TEST(ParseRejectsNonArrays)
{
    CHECK(!record::parse("not json at all").has_value());
    CHECK(!record::parse("{\"id\": \"a\"}").has_value());
    auto empty = record::parse("[]");
    REQUIRE(empty.has_value());
    CHECK(empty->empty());
}

DROGON_TEST(ParseDropsMalformedEntries)
{
    auto photos = record::parse(R"([
        {"id": "a", "blobRef": "photos/a", "name": "A", "width": 800, "height": 1200, "order": 0},
        {"name": "no id"},
        {"id": "c", "blobRef": ""},
        42
    ])");
    REQUIRE(photos.has_value());
    REQUIRE(photos->size() == 1);

    const auto& a = photos->front();
    CHECK(a.id == "a");
    CHECK(a.published == false);
    // orientation/ratio were absent and get derived
    CHECK(a.orientation == geometry::Orientation::Portrait);
}

DROGON_TEST(DefaultNameFromOriginalOrBlob)
{
    CHECK(record::defaultName("IMG_0042.JPG", "photos/x") == "IMG_0042");
    CHECK(record::defaultName("holiday/beach.day.png", "photos/x") == "beach.day");
    CHECK(record::defaultName(".hidden", "photos/x") == ".hidden");
    CHECK(record::defaultName("", "photos/abc123") == "abc123");
    CHECK(record::defaultName("", "loose") == "loose");
}

DROGON_TEST(TimestampFormat)
{
    auto ts = record::nowIso8601();
    REQUIRE(ts.size() == 24);
    CHECK(ts[4] == '-');
    CHECK(ts[10] == 'T');
    CHECK(ts[19] == '.');
    CHECK(ts.back() == 'Z');
}
