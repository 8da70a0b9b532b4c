#include <catch2/catch_test_macros.hpp>
#include "utils/LogManager.hpp"
#include "config/ClientConfig.hpp"

#include <plog/Log.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using langcloud::config::LoggingSettings;
using langcloud::utils::LogManager;

TEST_CASE("LogManager - prepares nested log directories", "[utils][log]") {
    const auto root = std::filesystem::temp_directory_path() / "langcloud_log_dirs";
    std::filesystem::remove_all(root);

    REQUIRE(LogManager::PrepareLogDirectory((root / "a" / "b" / "client.log").string()));
    REQUIRE(std::filesystem::is_directory(root / "a" / "b"));
    REQUIRE(LogManager::PrepareLogDirectory("client.log"));

    std::filesystem::remove_all(root);
}

TEST_CASE("LogManager - writes to the configured file across restarts", "[utils][log]") {
    const auto root = std::filesystem::temp_directory_path() / "langcloud_log_file";
    std::filesystem::remove_all(root);
    const auto file = root / "logs" / "langcloud.log";

    LoggingSettings settings;
    settings.level = plog::debug;
    settings.file = file.string();

    REQUIRE(LogManager::Initialize(settings));
    REQUIRE(LogManager::GetDefaultLogLevel() == plog::debug);
    PLOG_INFO << "first session entry";
    LogManager::Shutdown();

    PLOG_ERROR << "entry while shut down";

    settings.level = plog::info;
    REQUIRE(LogManager::Initialize(settings));
    REQUIRE(LogManager::GetDefaultLogLevel() == plog::info);
    PLOG_INFO << "second session entry";
    PLOG_DEBUG << "below the restored level";
    LogManager::Shutdown();

    std::ifstream in(file);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(contents.find("first session entry") != std::string::npos);
    REQUIRE(contents.find("second session entry") != std::string::npos);
    REQUIRE(contents.find("entry while shut down") == std::string::npos);
    REQUIRE(contents.find("below the restored level") == std::string::npos);

    // Written once even though Initialize ran twice with the same file.
    const auto first = contents.find("second session entry");
    REQUIRE(contents.find("second session entry", first + 1) == std::string::npos);

    in.close();
    std::filesystem::remove_all(root);
}
