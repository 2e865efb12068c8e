#include <support/collection_store.hpp>
#include <support/errors.hpp>
#include <drogon/drogon.h>
#include <drogon/utils/Utilities.h>
#include <algorithm>
#include <unordered_set>

namespace atelier {

// Sorts by order (stable) and rewrites order as 0..n-1.
static void renumber(Collection& photos) {
    std::stable_sort(photos.begin(), photos.end(), [](const PhotoRecord& a, const PhotoRecord& b) {
        return a.order < b.order;
    });
    for (size_t i = 0; i < photos.size(); ++i) {
        photos[i].order = static_cast<int>(i);
    }
}

static Collection sortedByOrder(Collection photos) {
    std::stable_sort(photos.begin(), photos.end(), [](const PhotoRecord& a, const PhotoRecord& b) {
        return a.order < b.order;
    });
    return photos;
}

CollectionStore::CollectionStore(std::shared_ptr<SnapshotBackend> cache, std::shared_ptr<SnapshotBackend> durable)
    : cache_(std::move(cache)), durable_(std::move(durable)) {
    idGenerator_ = []() { return drogon::utils::getUuid(); };
}

void CollectionStore::setDimensionLookup(DimensionLookup lookup) {
    dimensionLookup_ = std::move(lookup);
}

void CollectionStore::setIdGenerator(IdGenerator generator) {
    idGenerator_ = std::move(generator);
}

Collection CollectionStore::load() {
    return loadSnapshot(false);
}

Collection CollectionStore::loadSnapshot(bool holdsWriteLock) {
    const uint64_t generation = saveGeneration_.load();

    if (cache_) {
        if (auto bytes = cache_->fetchSnapshot()) {
            if (auto photos = record::parse(*bytes)) {
                return std::move(*photos);
            }
            LOG_WARN << "Local snapshot " << cache_->describe() << " is corrupt, falling back to backing store";
        }
    }

    if (durable_) {
        if (auto bytes = durable_->fetchSnapshot()) {
            if (auto photos = record::parse(*bytes)) {
                if (cache_) {
                    repopulateCache(*bytes, generation, holdsWriteLock);
                }
                LOG_INFO << "Loaded " << photos->size() << " photos from " << durable_->describe();
                return std::move(*photos);
            }
            LOG_ERROR << "Snapshot from " << durable_->describe() << " is not a valid collection";
        } else {
            LOG_WARN << "Backing store " << durable_->describe() << " has no snapshot available";
        }
    }

    return {};
}

void CollectionStore::repopulateCache(const std::string& bytes, uint64_t generation, bool holdsWriteLock) {
    // A reader's bytes may predate a save that finished while it was
    // fetching; writing them back would resurrect the old collection.
    std::unique_lock<std::mutex> lock(writeMutex_, std::defer_lock);
    if (!holdsWriteLock) {
        if (!lock.try_lock() || saveGeneration_.load() != generation) {
            LOG_DEBUG << "Skipping local snapshot repopulation, a mutation got there first";
            return;
        }
    }
    if (!cache_->pushSnapshot(bytes)) {
        LOG_WARN << "Could not repopulate local snapshot " << cache_->describe();
    }
}

void CollectionStore::save(const Collection& photos) {
    ++saveGeneration_;
    const std::string bytes = record::serialize(photos);

    if (cache_ && !cache_->pushSnapshot(bytes)) {
        LOG_ERROR << "Local snapshot write failed (" << cache_->describe() << "), continuing";
    }
    if (durable_ && !durable_->pushSnapshot(bytes)) {
        LOG_ERROR << "Backing store push failed (" << durable_->describe() << "), copies may diverge until the next save";
    }
}

PhotoRecord CollectionStore::registerPhoto(const Registration& registration) {
    if (registration.blobRef.empty()) {
        throw ApiError(ErrorKind::InvalidInput, "blobRef is required");
    }

    int width = registration.width > 0 ? registration.width : 0;
    int height = registration.height > 0 ? registration.height : 0;
    if (width == 0 || height == 0) {
        auto dims = lookupDimensions(registration.blobRef);
        width = dims ? dims->width : 0;
        height = dims ? dims->height : 0;
    }

    std::lock_guard<std::mutex> lock(writeMutex_);
    auto photos = loadSnapshot(true);

    PhotoRecord photo;
    photo.id = newId(photos);
    photo.blobRef = registration.blobRef;
    photo.name = record::defaultName(registration.originalName, registration.blobRef);
    photo.width = width;
    photo.height = height;
    photo.classify();
    photo.order = static_cast<int>(photos.size());
    photo.published = false;
    photo.createdAt = record::nowIso8601();

    photos.push_back(photo);
    save(photos);

    LOG_INFO << "Registered photo " << photo.id << " (" << photo.blobRef << ", "
             << photo.width << "x" << photo.height << ")";
    return photo;
}

PhotoRecord CollectionStore::rename(const std::string& id, const std::string& name) {
    PhotoPatch patch;
    patch.name = name;
    return update(id, patch);
}

PhotoRecord CollectionStore::reorderOne(const std::string& id, int order) {
    PhotoPatch patch;
    patch.order = order;
    return update(id, patch);
}

PhotoRecord CollectionStore::update(const std::string& id, const PhotoPatch& patch) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    auto photos = loadSnapshot(true);
    auto& photo = findOrThrow(photos, id);

    if (patch.name) photo.name = *patch.name;
    if (patch.order) photo.order = *patch.order;

    PhotoRecord result = photo;
    save(photos);
    return result;
}

std::string CollectionStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    auto photos = loadSnapshot(true);
    auto& photo = findOrThrow(photos, id);
    std::string blobRef = photo.blobRef;

    photos.erase(std::remove_if(photos.begin(), photos.end(),
                                [&id](const PhotoRecord& p) { return p.id == id; }),
                 photos.end());
    renumber(photos);
    save(photos);

    LOG_INFO << "Deleted photo " << id;
    return blobRef;
}

size_t CollectionStore::publish(const std::optional<std::vector<std::string>>& orderedIds) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    auto photos = loadSnapshot(true);

    if (!orderedIds) {
        renumber(photos);
        for (auto& photo : photos) photo.published = true;
        save(photos);
        return photos.size();
    }

    for (auto& photo : photos) photo.published = false;

    // Published records take 0..k-1 in list order, the rest follow in their
    // previous relative order, so both scopes stay dense.
    Collection ordered;
    ordered.reserve(photos.size());
    for (const auto& id : *orderedIds) {
        auto it = std::find_if(photos.begin(), photos.end(),
                               [&id](const PhotoRecord& p) { return p.id == id && !p.published; });
        if (it == photos.end()) continue;
        it->published = true;
        ordered.push_back(*it);
    }
    size_t publishedCount = ordered.size();

    Collection rest;
    for (const auto& photo : photos) {
        if (!photo.published) rest.push_back(photo);
    }
    rest = sortedByOrder(std::move(rest));
    ordered.insert(ordered.end(), rest.begin(), rest.end());

    for (size_t i = 0; i < ordered.size(); ++i) {
        ordered[i].order = static_cast<int>(i);
    }
    save(ordered);

    LOG_INFO << "Published " << publishedCount << " of " << ordered.size() << " photos";
    return publishedCount;
}

void CollectionStore::reorderAll(const std::vector<std::string>& orderedIds) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    auto photos = loadSnapshot(true);

    for (size_t i = 0; i < orderedIds.size(); ++i) {
        for (auto& photo : photos) {
            if (photo.id == orderedIds[i]) {
                photo.order = static_cast<int>(i);
                break;
            }
        }
    }
    photos = sortedByOrder(std::move(photos));
    save(photos);
}

Collection CollectionStore::clear() {
    std::lock_guard<std::mutex> lock(writeMutex_);
    auto photos = loadSnapshot(true);
    save({});
    LOG_INFO << "Cleared collection (" << photos.size() << " photos)";
    return photos;
}

size_t CollectionStore::repairDimensions() {
    std::lock_guard<std::mutex> lock(writeMutex_);
    auto photos = loadSnapshot(true);

    size_t repaired = 0;
    for (auto& photo : photos) {
        if (photo.width > 0 && photo.height > 0) continue;
        auto dims = lookupDimensions(photo.blobRef);
        if (!dims) continue;
        photo.width = dims->width;
        photo.height = dims->height;
        photo.classify();
        ++repaired;
    }

    if (repaired > 0) {
        save(photos);
    }
    return repaired;
}

Collection CollectionStore::publicView() {
    Collection published;
    for (auto& photo : load()) {
        if (photo.published) published.push_back(std::move(photo));
    }
    return sortedByOrder(std::move(published));
}

Collection CollectionStore::adminView() {
    return sortedByOrder(load());
}

size_t CollectionStore::count() {
    return load().size();
}

std::string CollectionStore::describe() const {
    return durable_ ? durable_->describe() : "none";
}

std::optional<image::Dimensions> CollectionStore::lookupDimensions(const std::string& blobRef) {
    if (!dimensionLookup_) return std::nullopt;
    try {
        auto dims = dimensionLookup_(blobRef);
        if (dims && dims->width > 0 && dims->height > 0) return dims;
        LOG_WARN << "Dimension lookup found nothing for " << blobRef;
    } catch (const std::exception& e) {
        LOG_WARN << "Dimension lookup failed for " << blobRef << ": " << e.what();
    }
    return std::nullopt;
}

std::string CollectionStore::newId(const Collection& photos) {
    std::unordered_set<std::string> used;
    for (const auto& photo : photos) used.insert(photo.id);

    std::string id = idGenerator_();
    while (used.count(id) > 0) {
        id = idGenerator_();
    }
    return id;
}

PhotoRecord& CollectionStore::findOrThrow(Collection& photos, const std::string& id) {
    auto it = std::find_if(photos.begin(), photos.end(), [&id](const PhotoRecord& p) { return p.id == id; });
    if (it == photos.end()) {
        throw ApiError(ErrorKind::NotFound, "photo not found: " + id);
    }
    return *it;
}

std::vector<std::string> parseIdList(const Json::Value& ids) {
    if (!ids.isArray()) {
        throw ApiError(ErrorKind::InvalidInput, "ids must be a list");
    }
    std::vector<std::string> result;
    result.reserve(ids.size());
    for (const auto& id : ids) {
        if (id.isString()) result.push_back(id.asString());
    }
    return result;
}

}
