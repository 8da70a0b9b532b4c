#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace langcloud::config
{
struct LoggingSettings;
}

namespace langcloud::utils
{

// Owns plog appenders for the executable. The library itself only logs
// through PLOG_* and never initializes plog.
class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    static bool Initialize(const config::LoggingSettings& settings);

    template <int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static plog::Severity GetDefaultLogLevel();
    static bool PrepareLogDirectory(const std::string& filepath);

private:
    LogManager() = default;

    static bool s_initialized;
    static plog::Severity s_default_level;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
    static std::set<std::string> s_file_paths;
    static bool s_console_attached;
};

} // namespace langcloud::utils
