#include "TtsTypes.hpp"

#include "../http/JsonFields.hpp"
#include "../http/MediaTypes.hpp"

namespace langcloud::tts
{

const char* media_type(AudioFormat format)
{
    switch (format)
    {
    case AudioFormat::Ogg:
        return http::media_type::AUDIO_OGG;
    case AudioFormat::Wav:
        return http::media_type::AUDIO_WAV;
    case AudioFormat::Flac:
        return http::media_type::AUDIO_FLAC;
    }
    return http::media_type::AUDIO_OGG;
}

const char* to_string(AudioFormat format)
{
    switch (format)
    {
    case AudioFormat::Ogg:
        return "ogg";
    case AudioFormat::Wav:
        return "wav";
    case AudioFormat::Flac:
        return "flac";
    }
    return "ogg";
}

std::optional<AudioFormat> audio_format_from_string(const std::string& name)
{
    if (name == "ogg")
        return AudioFormat::Ogg;
    if (name == "wav")
        return AudioFormat::Wav;
    if (name == "flac")
        return AudioFormat::Flac;
    return std::nullopt;
}

void from_json(const nlohmann::json& j, Voice& v)
{
    http::require_object(j, "Voice");
    http::read_field(j, "name", v.name);
    http::read_field(j, "language", v.language);
    http::read_field(j, "gender", v.gender);
    http::read_field(j, "url", v.url);
    http::read_field(j, "description", v.description);
}

void to_json(nlohmann::json& j, const Voice& v)
{
    j = nlohmann::json{ { "name", v.name },
                        { "language", v.language },
                        { "gender", v.gender },
                        { "url", v.url },
                        { "description", v.description } };
}

} // namespace langcloud::tts
