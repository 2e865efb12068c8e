#include <support/snapshot_backend.hpp>
#include <drogon/drogon.h>
#include <drogon/utils/Utilities.h>
#include <fstream>
#include <iterator>
#include <system_error>

namespace atelier {

LocalSnapshotBackend::LocalSnapshotBackend(std::filesystem::path filePath)
    : filePath_(std::move(filePath)) {}

std::optional<std::string> LocalSnapshotBackend::fetchSnapshot() {
    std::ifstream ifile(filePath_, std::ios::binary);
    if (!ifile.is_open()) return std::nullopt;

    std::string content((std::istreambuf_iterator<char>(ifile)), std::istreambuf_iterator<char>());
    if (ifile.bad()) {
        LOG_WARN << "Failed to read snapshot file " << filePath_;
        return std::nullopt;
    }
    return content;
}

bool LocalSnapshotBackend::pushSnapshot(const std::string& bytes) {
    std::error_code ec;
    if (filePath_.has_parent_path()) {
        std::filesystem::create_directories(filePath_.parent_path(), ec);
        if (ec) {
            LOG_WARN << "Cannot create snapshot directory " << filePath_.parent_path() << ": " << ec.message();
            return false;
        }
    }

    // One temp file per write so concurrent pushes never share it
    auto tmpPath = filePath_;
    tmpPath += ".tmp." + drogon::utils::getUuid();
    {
        std::ofstream ofile(tmpPath, std::ios::binary | std::ios::trunc);
        if (!ofile.is_open()) {
            LOG_WARN << "Cannot open " << tmpPath << " for writing";
            return false;
        }
        ofile.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!ofile) {
            LOG_WARN << "Short write to " << tmpPath;
            ofile.close();
            std::filesystem::remove(tmpPath, ec);
            return false;
        }
    }

    std::filesystem::rename(tmpPath, filePath_, ec);
    if (ec) {
        LOG_WARN << "Cannot move snapshot into place at " << filePath_ << ": " << ec.message();
        std::filesystem::remove(tmpPath, ec);
        return false;
    }
    return true;
}

std::string LocalSnapshotBackend::describe() const {
    return "local:" + filePath_.string();
}

}
