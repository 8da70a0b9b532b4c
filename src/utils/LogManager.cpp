#include "LogManager.hpp"

#include "../config/ClientConfig.hpp"

#include <filesystem>
#include <iostream>
#include <utility>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

namespace langcloud::utils
{

bool LogManager::s_initialized = false;
plog::Severity LogManager::s_default_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;
std::set<std::string> LogManager::s_file_paths;
bool LogManager::s_console_attached = false;

bool LogManager::Initialize(const config::LoggingSettings& settings)
{
    if (s_initialized)
        return true;

    s_default_level = settings.level;
    s_initialized = true;

    return RegisterLogger<0>({ .name = "main",
                               .filepath = settings.file,
                               .level_override = std::nullopt,
                               .max_file_size = settings.max_file_size,
                               .backup_count = settings.backup_count,
                               .add_console_appender = settings.console });
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        std::cerr << "LogManager not initialized before registering logger " << config.name << "\n";
        return false;
    }

    try
    {
        plog::Severity level = config.level_override.value_or(s_default_level);

        // plog keeps one static logger per instance; after a Shutdown it is
        // revived rather than created again.
        auto* logger = plog::get<InstanceId>();
        if (logger)
            logger->setMaxSeverity(level);
        else
            logger = &plog::init<InstanceId>(level);

        if (!config.filepath.empty() && s_file_paths.count(config.filepath) == 0 &&
            PrepareLogDirectory(config.filepath))
        {
            auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
                config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));
            logger->addAppender(file_appender.get());
            s_appenders.push_back(std::move(file_appender));
            s_file_paths.insert(config.filepath);
        }

        if (config.add_console_appender && !s_console_attached)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger->addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
            s_console_attached = true;
        }
        return true;
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Failed to register logger " << config.name << ": " << ex.what() << "\n";
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);

// Appenders stay registered with plog until process exit; Shutdown only
// silences the logger.
void LogManager::Shutdown()
{
    if (auto logger = plog::get<0>())
        logger->setMaxSeverity(plog::none);
    s_initialized = false;
}

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

bool LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const auto dir = std::filesystem::path(filepath).parent_path();
    if (dir.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        std::cerr << "Unable to prepare log directory " << dir.string() << ": " << ec.message() << "\n";
        return false;
    }
    return true;
}

} // namespace langcloud::utils
