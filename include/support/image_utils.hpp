#ifndef ATELIER_IMAGE_UTILS_HPP
#define ATELIER_IMAGE_UTILS_HPP

#include <optional>
#include <string>

namespace atelier::image {
    struct Dimensions {
        int width = 0;
        int height = 0;
    };

    // Enough of the file to reach the frame header of practically every JPEG.
    constexpr size_t kProbeBytes = 256 * 1024;

    /**
     * @brief Reads pixel dimensions from the head of an encoded image.
     * @param inputData The first bytes of the file (a prefix is enough).
     * @return Dimensions for JPEG (via TurboJPEG) and PNG, std::nullopt otherwise.
     */
    std::optional<Dimensions> readDimensions(const std::string& inputData);
}

#endif // ATELIER_IMAGE_UTILS_HPP
