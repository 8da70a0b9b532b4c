#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace langcloud::tts
{

enum class AudioFormat
{
    Ogg,
    Wav,
    Flac
};

// "audio/ogg; codecs=opus", "audio/wav" or "audio/flac".
const char* media_type(AudioFormat format);
// Short name as used on the command line: "ogg", "wav", "flac".
const char* to_string(AudioFormat format);
std::optional<AudioFormat> audio_format_from_string(const std::string& name);

struct Voice
{
    std::string name;
    std::string language;
    std::string gender;
    std::string url;
    std::string description;
};

void from_json(const nlohmann::json& j, Voice& v);
void to_json(nlohmann::json& j, const Voice& v);

} // namespace langcloud::tts
