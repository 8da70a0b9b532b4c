#include "app/CommandLine.hpp"
#include "config/ClientConfig.hpp"
#include "http/CprTransport.hpp"
#include "translation/LanguageTranslation.hpp"
#include "tts/TextToSpeech.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace langcloud;

int main(int argc, char** argv)
{
    app::CommandLine cmd;
    try
    {
        cmd = app::parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
    }
    catch (const app::UsageError& ex)
    {
        std::cerr << "error: " << ex.what() << "\n" << app::usage();
        return 2;
    }

    config::ClientConfig cfg;
    try
    {
        cfg = config::load_client_config(cmd.config_path);
    }
    catch (const config::ConfigError& ex)
    {
        std::cerr << "error: " << ex.what() << "\n";
        return 2;
    }

    if (!utils::LogManager::Initialize(cfg.logging))
        std::cerr << "warning: logging is disabled\n";

    PLOG_INFO << "langcloud-cli " << service::kLibraryVersion << " command=" << cmd.command;

    auto transport = std::make_shared<http::CprTransport>();
    translation::LanguageTranslation translation(transport);
    tts::TextToSpeech speech(transport);
    config::apply_settings(cfg.language_translation, cfg.session, translation);
    config::apply_settings(cfg.text_to_speech, cfg.session, speech);

    const int status = app::run_command(cmd, { translation, speech }, std::cout, std::cerr);
    utils::LogManager::Shutdown();
    return status;
}
