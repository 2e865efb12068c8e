#ifndef ATELIER_SNAPSHOT_BACKEND_HPP
#define ATELIER_SNAPSHOT_BACKEND_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace atelier {

/*
  Whole-collection byte store.

  The collection store reads and writes the entire snapshot at once; there is
  no record-level access. Implementations may be slow and may fail, and a push
  is never transactional with anything else.

  Implementations:
    LocalSnapshotBackend → a single file on local disk
    B2SnapshotBackend    → a single object in a Backblaze B2 bucket
*/
class SnapshotBackend {
public:
    virtual ~SnapshotBackend() = default;

    // std::nullopt means "not available": missing, unreadable or unreachable.
    virtual std::optional<std::string> fetchSnapshot() = 0;

    // false means the push failed; callers log and continue.
    virtual bool pushSnapshot(const std::string& bytes) = 0;

    // Short human readable description, reported by the health route.
    virtual std::string describe() const = 0;
};

class LocalSnapshotBackend : public SnapshotBackend {
public:
    explicit LocalSnapshotBackend(std::filesystem::path filePath);

    std::optional<std::string> fetchSnapshot() override;

    // Writes to a sibling temporary file and renames it into place.
    bool pushSnapshot(const std::string& bytes) override;

    std::string describe() const override;

    const std::filesystem::path& path() const { return filePath_; }

private:
    std::filesystem::path filePath_;
};

}

#endif // ATELIER_SNAPSHOT_BACKEND_HPP
