#include "CommandLine.hpp"

#include "../http/HttpErrors.hpp"
#include "../translation/LanguageTranslation.hpp"
#include "../tts/TextToSpeech.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <optional>
#include <string_view>

namespace langcloud::app
{

namespace
{

struct CommandSpec
{
    const char* name;
    std::size_t positional;
    std::array<std::string_view, 5> options; // unused slots stay empty
};

constexpr std::array<CommandSpec, 11> kCommands{ {
    { "identify", 1, {} },
    { "translate", 1, { "model", "source", "target" } },
    { "languages", 0, {} },
    { "models", 0, { "default", "source", "target" } },
    { "model", 1, {} },
    { "delete-model", 1, {} },
    { "create-model", 0, { "base", "name", "glossary", "monolingual", "parallel" } },
    { "voices", 0, {} },
    { "voice", 1, {} },
    { "synthesize", 1, { "out", "voice", "format" } },
    { "help", 0, {} },
} };

const CommandSpec* find_command(const std::string& name)
{
    auto it = std::find_if(kCommands.begin(), kCommands.end(),
                           [&](const CommandSpec& spec) { return name == spec.name; });
    return it == kCommands.end() ? nullptr : &*it;
}

bool accepts_option(const CommandSpec& spec, const std::string& option)
{
    return !option.empty() &&
           std::find(spec.options.begin(), spec.options.end(), option) != spec.options.end();
}

std::string option_or(const CommandLine& cmd, const std::string& name, const std::string& fallback = {})
{
    auto it = cmd.options.find(name);
    return it == cmd.options.end() ? fallback : it->second;
}

std::string require_option(const CommandLine& cmd, const std::string& name)
{
    auto value = option_or(cmd, name);
    if (value.empty())
        throw UsageError("'" + cmd.command + "' requires --" + name);
    return value;
}

translation::Language require_language(const CommandLine& cmd, const std::string& name)
{
    const auto code = require_option(cmd, name);
    auto lang = translation::language_from_string(code);
    if (!lang)
        throw UsageError("unsupported language for --" + name + ": " + code);
    return *lang;
}

std::optional<bool> parse_bool_option(const CommandLine& cmd, const std::string& name)
{
    const auto value = option_or(cmd, name);
    if (value.empty())
        return std::nullopt;
    if (value == "true")
        return true;
    if (value == "false")
        return false;
    throw UsageError("--" + name + " expects true or false");
}

void print(std::ostream& out, const nlohmann::json& j) { out << j.dump(2) << "\n"; }

int dispatch(const CommandLine& cmd, const Services& services, std::ostream& out)
{
    const auto& lt = services.translation;
    const auto& speech = services.speech;

    if (cmd.command == "help")
    {
        out << usage();
        return 0;
    }
    if (cmd.command == "identify")
    {
        print(out, lt.identify(cmd.positional.at(0)).execute());
        return 0;
    }
    if (cmd.command == "translate")
    {
        const auto model = option_or(cmd, "model");
        auto call = model.empty()
                        ? lt.translate(cmd.positional.at(0), require_language(cmd, "source"),
                                       require_language(cmd, "target"))
                        : lt.translate(cmd.positional.at(0), model);
        print(out, call.execute());
        return 0;
    }
    if (cmd.command == "languages")
    {
        print(out, lt.getIdentifiableLanguages().execute());
        return 0;
    }
    if (cmd.command == "models")
    {
        print(out, lt.getModels(parse_bool_option(cmd, "default"), option_or(cmd, "source"),
                                option_or(cmd, "target"))
                       .execute());
        return 0;
    }
    if (cmd.command == "model")
    {
        print(out, lt.getModel(cmd.positional.at(0)).execute());
        return 0;
    }
    if (cmd.command == "delete-model")
    {
        lt.deleteModel(cmd.positional.at(0)).execute();
        out << "deleted " << cmd.positional.at(0) << "\n";
        return 0;
    }
    if (cmd.command == "create-model")
    {
        translation::CreateModelOptions options;
        options.base_model_id = require_option(cmd, "base");
        options.name = option_or(cmd, "name");
        if (auto f = option_or(cmd, "glossary"); !f.empty())
            options.forced_glossary = f;
        if (auto f = option_or(cmd, "monolingual"); !f.empty())
            options.monolingual_corpus = f;
        if (auto f = option_or(cmd, "parallel"); !f.empty())
            options.parallel_corpus = f;
        print(out, lt.createModel(options).execute());
        return 0;
    }
    if (cmd.command == "voices")
    {
        print(out, speech.getVoices().execute());
        return 0;
    }
    if (cmd.command == "voice")
    {
        print(out, speech.getVoice(cmd.positional.at(0)).execute());
        return 0;
    }
    if (cmd.command == "synthesize")
    {
        const auto out_path = require_option(cmd, "out");
        const auto format_name = option_or(cmd, "format", "ogg");
        auto format = tts::audio_format_from_string(format_name);
        if (!format)
            throw UsageError("unsupported --format: " + format_name);

        auto audio =
            speech.synthesize(cmd.positional.at(0), option_or(cmd, "voice", tts::TextToSpeech::kDefaultVoice), *format)
                .execute();

        std::ofstream file(out_path, std::ios::binary | std::ios::trunc);
        file.write(audio.data.data(), static_cast<std::streamsize>(audio.data.size()));
        if (!file)
            throw std::runtime_error("cannot write " + out_path);
        out << "wrote " << audio.data.size() << " bytes (" << audio.content_type << ") to " << out_path << "\n";
        return 0;
    }
    throw UsageError("unknown command: " + cmd.command);
}

} // namespace

CommandLine parse_command_line(const std::vector<std::string>& args)
{
    CommandLine cmd;
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const auto& arg = args[i];
        if (arg.size() > 2 && arg.compare(0, 2, "--") == 0)
        {
            if (i + 1 >= args.size())
                throw UsageError("missing value for " + arg);
            auto name = arg.substr(2);
            if (name == "config")
                cmd.config_path = args[++i];
            else
                cmd.options[name] = args[++i];
        }
        else if (cmd.command.empty())
        {
            cmd.command = arg;
        }
        else
        {
            cmd.positional.push_back(arg);
        }
    }

    if (cmd.command.empty())
        throw UsageError("no command given");
    const auto* spec = find_command(cmd.command);
    if (!spec)
        throw UsageError("unknown command: " + cmd.command);
    if (cmd.positional.size() != spec->positional)
        throw UsageError("'" + cmd.command + "' expects " + std::to_string(spec->positional) + " argument(s)");
    for (const auto& [name, value] : cmd.options)
    {
        if (!accepts_option(*spec, name))
            throw UsageError("'" + cmd.command + "' does not accept --" + name);
    }
    return cmd;
}

const char* usage()
{
    return "usage: langcloud-cli [--config FILE] <command> [args]\n"
           "  identify TEXT\n"
           "  translate TEXT (--model ID | --source LANG --target LANG)\n"
           "  languages\n"
           "  models [--default true|false] [--source LANG] [--target LANG]\n"
           "  model ID\n"
           "  delete-model ID\n"
           "  create-model --base ID [--name NAME] [--glossary FILE] [--monolingual FILE] [--parallel FILE]\n"
           "  voices\n"
           "  voice NAME\n"
           "  synthesize TEXT --out FILE [--voice NAME] [--format ogg|wav|flac]\n";
}

int run_command(const CommandLine& cmd, const Services& services, std::ostream& out, std::ostream& err)
{
    try
    {
        return dispatch(cmd, services, out);
    }
    catch (const UsageError& ex)
    {
        err << "error: " << ex.what() << "\n" << usage();
        return 2;
    }
    catch (const std::invalid_argument& ex)
    {
        err << "error: " << ex.what() << "\n";
        return 2;
    }
    catch (const http::ServiceError& ex)
    {
        PLOG_ERROR << cmd.command << " failed with HTTP " << ex.statusCode();
        err << "error: " << ex.what() << "\n";
        return 1;
    }
    catch (const std::exception& ex)
    {
        PLOG_ERROR << cmd.command << " failed: " << ex.what();
        err << "error: " << ex.what() << "\n";
        return 1;
    }
}

} // namespace langcloud::app
