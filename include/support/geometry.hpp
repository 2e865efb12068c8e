#ifndef ATELIER_GEOMETRY_HPP
#define ATELIER_GEOMETRY_HPP

#include <optional>
#include <string>

namespace atelier::geometry {
    enum class Orientation {
        Landscape,
        Portrait,
        Square
    };

    struct Classification {
        double ratio = 1.0;
        Orientation orientation = Orientation::Square;
    };

    constexpr double kDefaultRatio = 1.0;
    constexpr double kLandscapeAbove = 1.15;
    constexpr double kPortraitBelow = 0.87;

    /**
     * @brief Derives aspect ratio and orientation from pixel dimensions.
     * @param width Width in pixels, 0 when unknown.
     * @param height Height in pixels, 0 when unknown.
     * @return ratio = width/height when both are positive, else 1.0 (square).
     */
    Classification classify(int width, int height);

    std::string toString(Orientation orientation);
    std::optional<Orientation> parseOrientation(const std::string& value);
}

#endif // ATELIER_GEOMETRY_HPP
