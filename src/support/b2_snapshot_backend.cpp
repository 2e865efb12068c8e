#include <support/b2_snapshot_backend.hpp>

namespace atelier {

B2SnapshotBackend::B2SnapshotBackend(std::shared_ptr<B2Service> b2, std::string objectName)
    : b2_(std::move(b2)), objectName_(std::move(objectName)) {}

std::optional<std::string> B2SnapshotBackend::fetchSnapshot() {
    auto content = b2_->downloadBlocking(objectName_);
    if (!content) {
        LOG_WARN << "Snapshot " << objectName_ << " not available from B2";
    }
    return content;
}

bool B2SnapshotBackend::pushSnapshot(const std::string& bytes) {
    bool ok = b2_->uploadBlocking(objectName_, bytes);
    if (ok) {
        LOG_DEBUG << "Pushed snapshot to B2 as " << objectName_ << " (" << bytes.size() << " bytes)";
    }
    return ok;
}

std::string B2SnapshotBackend::describe() const {
    return "b2:" + b2_->bucketName() + "/" + objectName_;
}

}
