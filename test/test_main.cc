#define DROGON_TEST_MAIN
#include <drogon/drogon_test.h>
#include <drogon/drogon.h>
#include <controllers/admin.hpp>
#include <controllers/gallery.hpp>
#include <filters/bearerfilter.hpp>
#include <filesystem>
#include <cstdlib>
#include <future>
#include <thread>
#include "test_support.hpp"

namespace atelier::test_support {

static std::shared_ptr<AppContext> g_serverContext;

std::shared_ptr<AppContext> serverContext() {
    return g_serverContext;
}

std::filesystem::path scratchDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("atelier_test_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

}

DROGON_TEST(BasicTest)
{
    using namespace atelier::test_support;
    REQUIRE(serverContext() != nullptr);
    CHECK(serverContext()->b2 == nullptr);
}

int main(int argc, char** argv)
{
    using namespace drogon;
    using namespace atelier::test_support;

    // Blob store stays unconfigured so nothing leaves the machine
    unsetenv("DB_API_KEY");
    setenv("ADMIN_PASSWORD", kAdminPassword, 1);
    setenv("TOKEN_SECRET", "test-token-secret", 1);

    auto dir = scratchDir("server");
    Json::Value customConfig;
    customConfig["storage"]["dataDir"] = (dir / "cache").string();
    customConfig["storage"]["fallbackDir"] = (dir / "durable").string();
    customConfig["media"]["baseUrl"] = "https://cdn.example.test/";
    g_serverContext = atelier::AppContext::create(customConfig);

    app().setLogLevel(trantor::Logger::kWarn);
    app().addListener("127.0.0.1", kTestPort);
    app().setThreadNum(2);
    app().registerFilter(std::make_shared<atelier::BearerAuthFilter>(g_serverContext->tokens));
    app().registerController(std::make_shared<atelier::Admin_Controller>(g_serverContext));
    app().registerController(std::make_shared<atelier::GalleryController>(g_serverContext));

    std::promise<void> p1;
    std::future<void> f1 = p1.get_future();

    // Start the main loop on another thread
    std::thread thr([&]() {
        // Queues the promise to be fulfilled after starting the loop
        app().getLoop()->queueInLoop([&p1]() { p1.set_value(); });
        app().run();
    });

    // The future is only satisfied after the event loop started
    f1.get();
    int status = test::run(argc, argv);

    // Ask the event loop to shutdown and wait
    app().getLoop()->queueInLoop([]() { app().quit(); });
    thr.join();
    return status;
}
