#ifndef ATELIER_COLLECTION_STORE_HPP
#define ATELIER_COLLECTION_STORE_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <support/image_utils.hpp>
#include <support/photo_record.hpp>
#include <support/snapshot_backend.hpp>

namespace atelier {

struct Registration {
    std::string blobRef;
    std::string originalName;
    int width = 0;
    int height = 0;
};

/**
 * @brief Owns the ordered photo collection and keeps its two copies in sync.
 *
 * Reads go local cache → durable backend → empty collection. Writes go to the
 * local cache first and then to the durable backend; failure of either is
 * logged and absorbed. Mutations are serialized by an internal mutex and each
 * one performs a full load → mutate → save cycle. Reads take no lock.
 */
class CollectionStore {
public:
    using DimensionLookup = std::function<std::optional<image::Dimensions>(const std::string& blobRef)>;
    using IdGenerator = std::function<std::string()>;

    CollectionStore(std::shared_ptr<SnapshotBackend> cache, std::shared_ptr<SnapshotBackend> durable);

    // Both setters are for startup wiring, before the store is shared.
    void setDimensionLookup(DimensionLookup lookup);
    void setIdGenerator(IdGenerator generator);

    // Never throws for storage failures; an empty collection is a valid result.
    // A lock-free read refills an empty local cache only when no save has
    // happened since its fetch began.
    Collection load();
    void save(const Collection& photos);

    PhotoRecord registerPhoto(const Registration& registration);
    PhotoRecord rename(const std::string& id, const std::string& name);
    PhotoRecord reorderOne(const std::string& id, int order);
    PhotoRecord update(const std::string& id, const PhotoPatch& patch);

    // Returns the removed record's blob ref so the caller can clean up the binary.
    std::string remove(const std::string& id);

    /**
     * @brief Replaces the published set.
     * @param orderedIds When set, exactly these ids are published, ordered by
     *        list position; unknown ids are skipped. When unset, everything is
     *        published in its current order.
     * @return Number of published records.
     */
    size_t publish(const std::optional<std::vector<std::string>>& orderedIds);

    // Assigns order = list position to each listed id, then stable-sorts by order.
    void reorderAll(const std::vector<std::string>& orderedIds);

    // Empties the collection and returns what was in it.
    Collection clear();

    // Re-runs the dimension lookup for records with unknown size.
    size_t repairDimensions();

    Collection publicView();
    Collection adminView();
    size_t count();

    std::string describe() const;

private:
    std::shared_ptr<SnapshotBackend> cache_;
    std::shared_ptr<SnapshotBackend> durable_;
    DimensionLookup dimensionLookup_;
    IdGenerator idGenerator_;
    std::mutex writeMutex_;
    std::atomic<uint64_t> saveGeneration_{0};

    Collection loadSnapshot(bool holdsWriteLock);
    void repopulateCache(const std::string& bytes, uint64_t generation, bool holdsWriteLock);
    std::optional<image::Dimensions> lookupDimensions(const std::string& blobRef);
    std::string newId(const Collection& photos);
    PhotoRecord& findOrThrow(Collection& photos, const std::string& id);
};

// Validates the "ids" member of a request body. Throws InvalidInput when it
// is not an array; non-string entries are ignored.
std::vector<std::string> parseIdList(const Json::Value& ids);

}

#endif // ATELIER_COLLECTION_STORE_HPP
