#ifndef ATELIER_TEST_SUPPORT_HPP
#define ATELIER_TEST_SUPPORT_HPP

#include <support/app_context.hpp>
#include <support/snapshot_backend.hpp>
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace atelier::test_support {

constexpr uint16_t kTestPort = 18731;
constexpr const char* kAdminPassword = "correct horse battery staple";

// Context wired into the in-process server started by test_main.cc
std::shared_ptr<AppContext> serverContext();

// A fresh, empty directory under the system temp dir
std::filesystem::path scratchDir(const std::string& name);

// In-memory backend whose failures can be switched on per test
class MemoryBackend : public SnapshotBackend {
public:
    std::optional<std::string> fetchSnapshot() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++fetches;
        if (failFetch) return std::nullopt;
        return content_;
    }

    bool pushSnapshot(const std::string& bytes) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++pushes;
        if (failPush) return false;
        content_ = bytes;
        return true;
    }

    std::string describe() const override { return "memory"; }

    void set(std::optional<std::string> bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        content_ = std::move(bytes);
    }

    std::optional<std::string> get() {
        std::lock_guard<std::mutex> lock(mutex_);
        return content_;
    }

    std::atomic<bool> failFetch{false};
    std::atomic<bool> failPush{false};
    std::atomic<int> fetches{0};
    std::atomic<int> pushes{0};

private:
    std::mutex mutex_;
    std::optional<std::string> content_;
};

}

#endif // ATELIER_TEST_SUPPORT_HPP
