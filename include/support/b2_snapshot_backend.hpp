#ifndef ATELIER_B2_SNAPSHOT_BACKEND_HPP
#define ATELIER_B2_SNAPSHOT_BACKEND_HPP

#include <memory>
#include <string>
#include <support/b2service.hpp>
#include <support/snapshot_backend.hpp>

namespace atelier {

// Keeps the snapshot as a single object in the B2 bucket; every push
// uploads a new version of the same file name.
class B2SnapshotBackend : public SnapshotBackend {
public:
    B2SnapshotBackend(std::shared_ptr<B2Service> b2, std::string objectName);

    std::optional<std::string> fetchSnapshot() override;
    bool pushSnapshot(const std::string& bytes) override;
    std::string describe() const override;

private:
    std::shared_ptr<B2Service> b2_;
    std::string objectName_;
};

}

#endif // ATELIER_B2_SNAPSHOT_BACKEND_HPP
