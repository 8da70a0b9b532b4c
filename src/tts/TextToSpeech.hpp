#pragma once

#include "TtsTypes.hpp"

#include "../service/ServiceBase.hpp"

#include <memory>
#include <string>
#include <vector>

namespace langcloud::tts
{

// Client for the Text to Speech service.
class TextToSpeech : public service::ServiceBase
{
public:
    static constexpr const char* kServiceName = "text_to_speech";
    static constexpr const char* kDefaultUrl = "https://stream.watsonplatform.net/text-to-speech/api";
    static constexpr const char* kDefaultVoice = "en-US_MichaelVoice";

    explicit TextToSpeech(std::shared_ptr<http::ITransport> transport = nullptr);

    http::ServiceCall<std::vector<Voice>> getVoices() const;
    http::ServiceCall<Voice> getVoice(const std::string& voice_name) const;

    // Returns the encoded audio; the body is not inspected.
    http::ServiceCall<http::BinaryContent> synthesize(const std::string& text, const std::string& voice = kDefaultVoice,
                                                      AudioFormat format = AudioFormat::Ogg) const;
};

} // namespace langcloud::tts
