#include "ClientConfig.hpp"

#include "../service/ServiceBase.hpp"

#include <plog/Log.h>
#include <toml++/toml.h>

#include <cstdint>
#include <fstream>
#include <sstream>

namespace langcloud::config
{

namespace
{

void read_service(const toml::table& root, const char* section, ServiceSettings& out)
{
    const auto* table = root[section].as_table();
    if (!table)
        return;
    if (auto v = (*table)["url"].value<std::string>())
        out.url = *v;
    if (auto v = (*table)["username"].value<std::string>())
        out.username = *v;
    if (auto v = (*table)["password"].value<std::string>())
        out.password = *v;
    if (auto v = (*table)["api_key"].value<std::string>())
        out.api_key = *v;
}

void read_positive_ms(const toml::table& table, const char* key, int& out)
{
    if (auto v = table[key].value<int64_t>())
    {
        if (*v > 0 && *v <= 600000)
            out = static_cast<int>(*v);
        else
            PLOG_WARNING << "Ignoring out-of-range http." << key << " = " << *v;
    }
}

ClientConfig from_table(const toml::table& root)
{
    ClientConfig cfg;

    if (const auto* http = root["http"].as_table())
    {
        read_positive_ms(*http, "connect_timeout_ms", cfg.session.connect_timeout_ms);
        read_positive_ms(*http, "timeout_ms", cfg.session.timeout_ms);
    }

    if (const auto* logging = root["logging"].as_table())
    {
        if (auto level = (*logging)["level"].value<int64_t>())
        {
            int level_int = static_cast<int>(*level);
            if (level_int >= 0 && level_int <= 6)
                cfg.logging.level = static_cast<plog::Severity>(level_int);
            else
                PLOG_WARNING << "Ignoring out-of-range logging.level = " << *level;
        }
        if (auto file = (*logging)["file"].value<std::string>())
            cfg.logging.file = *file;
        if (auto size = (*logging)["max_file_size"].value<int64_t>(); size && *size > 0)
            cfg.logging.max_file_size = static_cast<std::size_t>(*size);
        if (auto count = (*logging)["backup_count"].value<int64_t>(); count && *count >= 0)
            cfg.logging.backup_count = static_cast<std::size_t>(*count);
        if (auto console = (*logging)["console"].value<bool>())
            cfg.logging.console = *console;
    }

    read_service(root, "language_translation", cfg.language_translation);
    read_service(root, "text_to_speech", cfg.text_to_speech);
    return cfg;
}

} // namespace

ClientConfig parse_client_config(const std::string& toml_text, const std::string& source_name)
{
    try
    {
        auto root = toml::parse(toml_text, source_name);
        return from_table(root);
    }
    catch (const toml::parse_error& pe)
    {
        std::ostringstream oss;
        oss << "config parse error in " << source_name;
        if (pe.source().begin.line > 0)
            oss << " at line " << pe.source().begin.line << ", column " << pe.source().begin.column;
        oss << ": " << pe.description();
        throw ConfigError(oss.str());
    }
}

ClientConfig load_client_config(const std::string& path)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No config file at " << path << ", using defaults";
        return ClientConfig{};
    }

    std::ostringstream contents;
    contents << ifs.rdbuf();
    return parse_client_config(contents.str(), path);
}

void apply_settings(const ServiceSettings& settings, const http::SessionConfig& session,
                    service::ServiceBase& service)
{
    if (!settings.url.empty())
        service.setEndPoint(settings.url);

    if (!settings.api_key.empty())
        service.setApiKey(settings.api_key);
    else if (!settings.username.empty())
        service.setUsernameAndPassword(settings.username, settings.password);

    service.setSessionConfig(session);
}

} // namespace langcloud::config
