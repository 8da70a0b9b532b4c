#pragma once

#include <map>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace langcloud::translation
{
class LanguageTranslation;
}

namespace langcloud::tts
{
class TextToSpeech;
}

namespace langcloud::app
{

class UsageError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct CommandLine
{
    std::string config_path = "config.toml";
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options; // "--name value" without the dashes
};

// Throws UsageError on unknown commands or a dangling option.
CommandLine parse_command_line(const std::vector<std::string>& args);

const char* usage();

struct Services
{
    translation::LanguageTranslation& translation;
    tts::TextToSpeech& speech;
};

// Executes the command synchronously. Results go to `out` as JSON; returns
// the process exit status (0 ok, 1 service failure, 2 usage error).
int run_command(const CommandLine& cmd, const Services& services, std::ostream& out, std::ostream& err);

} // namespace langcloud::app
