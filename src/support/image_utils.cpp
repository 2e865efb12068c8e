#include <support/image_utils.hpp>
#include <turbojpeg.h>
#include <drogon/drogon.h>
#include <cstdint>
#include <cstring>

namespace atelier::image {

static uint32_t read32(const unsigned char* data) {
    return (uint32_t(data[0]) << 24) | (uint32_t(data[1]) << 16) | (uint32_t(data[2]) << 8) | uint32_t(data[3]);
}

static std::optional<Dimensions> readJpegDimensions(const std::string& inputData) {
    tjhandle decompressor = tjInitDecompress();
    if (!decompressor) return std::nullopt;

    std::optional<Dimensions> result;
    int width, height, subsamp, colorspace;
    if (tjDecompressHeader3(decompressor, (const unsigned char*)inputData.data(), inputData.size(), &width, &height, &subsamp, &colorspace) >= 0) {
        result = Dimensions{width, height};
    } else {
        LOG_ERROR << "TurboJPEG DecompressHeader failed: " << tjGetErrorStr2(decompressor);
    }
    tjDestroy(decompressor);
    return result;
}

static std::optional<Dimensions> readPngDimensions(const std::string& inputData) {
    // signature (8) + IHDR length (4) + "IHDR" (4) + width (4) + height (4)
    if (inputData.size() < 24) return std::nullopt;
    const auto* bytes = (const unsigned char*)inputData.data();
    if (std::memcmp(bytes + 12, "IHDR", 4) != 0) return std::nullopt;

    uint32_t width = read32(bytes + 16);
    uint32_t height = read32(bytes + 20);
    if (width == 0 || height == 0 || width > INT32_MAX || height > INT32_MAX) return std::nullopt;
    return Dimensions{static_cast<int>(width), static_cast<int>(height)};
}

std::optional<Dimensions> readDimensions(const std::string& inputData) {
    if (inputData.size() < 4) return std::nullopt;
    const auto* bytes = (const unsigned char*)inputData.data();

    if (bytes[0] == 0xFF && bytes[1] == 0xD8) {
        return readJpegDimensions(inputData);
    }

    static const unsigned char pngSignature[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    if (inputData.size() >= 8 && std::memcmp(bytes, pngSignature, 8) == 0) {
        return readPngDimensions(inputData);
    }

    LOG_DEBUG << "Unrecognized image format, cannot read dimensions";
    return std::nullopt;
}

}
