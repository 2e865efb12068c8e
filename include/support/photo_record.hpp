#ifndef ATELIER_PHOTO_RECORD_HPP
#define ATELIER_PHOTO_RECORD_HPP

#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include <support/geometry.hpp>

namespace atelier {

struct PhotoRecord {
    std::string id;
    std::string blobRef;
    std::string name;
    int width = 0;
    int height = 0;
    double ratio = geometry::kDefaultRatio;
    geometry::Orientation orientation = geometry::Orientation::Square;
    int order = 0;
    bool published = false;
    std::string createdAt;

    // Re-derives ratio and orientation from the current width/height.
    void classify();
};

// Only the fields that are set are applied; absent fields stay untouched.
struct PhotoPatch {
    std::optional<std::string> name;
    std::optional<int> order;

    bool empty() const { return !name && !order; }
};

using Collection = std::vector<PhotoRecord>;

namespace record {
    Json::Value toJson(const PhotoRecord& photo);
    std::optional<PhotoRecord> fromJson(const Json::Value& value);

    /**
     * @brief Encodes the whole collection as the persisted JSON document.
     *
     * Output is deterministic: keys are sorted and indentation is fixed, so
     * the same collection always yields the same bytes.
     */
    std::string serialize(const Collection& photos);

    /**
     * @brief Parses a persisted snapshot.
     * @return std::nullopt when the bytes are not a JSON array. Entries without
     *         an id or blobRef are dropped.
     */
    std::optional<Collection> parse(const std::string& bytes);

    // Label used when none is supplied: the original filename without
    // directory and extension, else the last path segment of the blob ref.
    std::string defaultName(const std::string& originalName, const std::string& blobRef);

    // Current UTC time as ISO-8601 with milliseconds, e.g. 2026-01-20T10:04:05.123Z
    std::string nowIso8601();
}

}

#endif // ATELIER_PHOTO_RECORD_HPP
