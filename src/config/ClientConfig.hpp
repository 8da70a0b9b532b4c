#pragma once

#include "../http/HttpCommon.hpp"

#include <plog/Severity.h>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace langcloud::service
{
class ServiceBase;
}

namespace langcloud::config
{

struct ServiceSettings
{
    std::string url; // empty keeps the service's default endpoint
    std::string username;
    std::string password;
    std::string api_key;
};

struct LoggingSettings
{
    plog::Severity level = plog::info;
    std::string file = "logs/langcloud.log";
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t backup_count = 3;
    bool console = false;
};

struct ClientConfig
{
    http::SessionConfig session;
    LoggingSettings logging;
    ServiceSettings language_translation;
    ServiceSettings text_to_speech;
};

// Malformed TOML. what() carries line and column.
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// A missing file yields the defaults; a malformed one throws ConfigError.
ClientConfig load_client_config(const std::string& path);
ClientConfig parse_client_config(const std::string& toml_text, const std::string& source_name = "config");

// Endpoint override, credentials (api_key wins over username/password) and
// timeouts.
void apply_settings(const ServiceSettings& settings, const http::SessionConfig& session,
                    service::ServiceBase& service);

} // namespace langcloud::config
