#include <support/geometry.hpp>

namespace atelier::geometry {

Classification classify(int width, int height) {
    Classification result;
    if (width > 0 && height > 0) {
        result.ratio = static_cast<double>(width) / static_cast<double>(height);
    } else {
        result.ratio = kDefaultRatio;
    }

    if (result.ratio > kLandscapeAbove) {
        result.orientation = Orientation::Landscape;
    } else if (result.ratio < kPortraitBelow) {
        result.orientation = Orientation::Portrait;
    } else {
        result.orientation = Orientation::Square;
    }
    return result;
}

std::string toString(Orientation orientation) {
    switch (orientation) {
        case Orientation::Landscape: return "landscape";
        case Orientation::Portrait: return "portrait";
        case Orientation::Square: return "square";
    }
    return "square";
}

std::optional<Orientation> parseOrientation(const std::string& value) {
    if (value == "landscape") return Orientation::Landscape;
    if (value == "portrait") return Orientation::Portrait;
    if (value == "square") return Orientation::Square;
    return std::nullopt;
}

}
