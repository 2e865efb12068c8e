#include <drogon/drogon.h>
#include <filesystem>
#include <iostream>
#include <yaml-cpp/yaml.h>
#include <controllers/admin.hpp>
#include <controllers/gallery.hpp>
#include <filters/bearerfilter.hpp>
#include <support/app_context.hpp>

int main() {

    // load configuration files
    std::string configPath;
    if (std::filesystem::exists("config.json")) {
        configPath = "config.json";
    } else if (std::filesystem::exists("config.yaml")) {
        configPath = "config.yaml";
    } else if (std::filesystem::exists("../config.json")) {
        std::filesystem::current_path("..");
        configPath = "config.json";
    } else if (std::filesystem::exists("../config.yaml")) {
        std::filesystem::current_path("..");
        configPath = "config.yaml";
    }

    if (configPath.empty()) {
        LOG_ERROR << "Could not find config.yaml or config.json";
        return 1;
    }

    if (!std::filesystem::exists("logs")) {
        std::filesystem::create_directory("logs");
        LOG_INFO << "Created log directory";
    }

    std::shared_ptr<atelier::AppContext> context;
    try {
        drogon::app().loadConfigFile(configPath);
        LOG_INFO << "Loaded config file from: " << std::filesystem::absolute(configPath);
        LOG_INFO << "Current working directory: " << std::filesystem::current_path();

        context = atelier::AppContext::create(drogon::app().getCustomConfig());
    } catch (const std::exception& e) {
        LOG_ERROR << "Failed to start: " << e.what();
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(context->config.dataDir, ec);
    if (ec) {
        // The store still works from the backing store alone
        LOG_WARN << "Cannot create data directory " << context->config.dataDir << ": " << ec.message();
    }

    LOG_INFO << "Snapshot cache: " << context->config.cacheFile();
    LOG_INFO << "Backing store: " << context->store->describe();
    if (context->config.adminPassword.empty()) {
        LOG_WARN << "ADMIN_PASSWORD is not set, admin login is disabled";
    }

    drogon::app().registerFilter(std::make_shared<atelier::BearerAuthFilter>(context->tokens));
    drogon::app().registerController(std::make_shared<atelier::Admin_Controller>(context));
    drogon::app().registerController(std::make_shared<atelier::GalleryController>(context));

    drogon::app().run();

    // parse shutdown_options.yaml
    if (std::filesystem::exists("shutdown_options.yaml")) {
        try {
            YAML::Node root = YAML::LoadFile("shutdown_options.yaml");
            auto options = root["shutdown_options"];
            if (options) {
                if (options["cache_cleanup"] && options["cache_cleanup"].as<bool>()) {
                    std::cout << "Removing local snapshot cache " << context->config.cacheFile() << std::endl;
                    std::filesystem::remove(context->config.cacheFile(), ec);
                }
                if (options["log_cleanup"] && options["log_cleanup"].as<bool>()) {
                    std::cout << "Cleaning up log directory" << std::endl;
                    std::filesystem::remove_all("logs");
                    std::filesystem::create_directory("logs");
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "Failed to parse shutdown_options.yaml: " << e.what() << std::endl;
        }
    }
}
