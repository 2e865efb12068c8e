#include <drogon/drogon_test.h>
#include <support/geometry.hpp>

using namespace atelier::geometry;

DROGON_TEST(ClassifyCommonShapes)
{
    CHECK(classify(1920, 1080).orientation == Orientation::Landscape);
    CHECK(classify(1080, 1920).orientation == Orientation::Portrait);
    CHECK(classify(1000, 1000).orientation == Orientation::Square);

    auto unknown = classify(0, 0);
    CHECK(unknown.orientation == Orientation::Square);
    CHECK(unknown.ratio == 1.0);
}

DROGON_TEST(ClassifyThresholdsAreExclusive)
{
    CHECK(classify(115, 100).orientation == Orientation::Square);
    CHECK(classify(116, 100).orientation == Orientation::Landscape);
    CHECK(classify(87, 100).orientation == Orientation::Square);
    CHECK(classify(86, 100).orientation == Orientation::Portrait);
}

DROGON_TEST(ClassifyMissingSideFallsBackToDefault)
{
    CHECK(classify(1920, 0).ratio == kDefaultRatio);
    CHECK(classify(0, 1080).ratio == kDefaultRatio);
    CHECK(classify(-5, 10).orientation == Orientation::Square);
}

DROGON_TEST(OrientationNames)
{
    CHECK(toString(Orientation::Landscape) == "landscape");
    CHECK(toString(Orientation::Portrait) == "portrait");
    CHECK(toString(Orientation::Square) == "square");
    CHECK(parseOrientation("portrait") == Orientation::Portrait);
    CHECK(!parseOrientation("land").has_value());
}
