#include "TextToSpeech.hpp"

#include "../http/RequestBuilder.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <utility>

namespace langcloud::tts
{

namespace
{
constexpr const char* PATH_VOICES = "/v1/voices";
constexpr const char* PATH_VOICE = "/v1/voices/{}";
constexpr const char* PATH_SYNTHESIZE = "/v1/synthesize";
} // namespace

using http::RequestBuilder;
using http::ResponseConverter;
using http::ServiceCall;

TextToSpeech::TextToSpeech(std::shared_ptr<http::ITransport> transport)
    : ServiceBase(kServiceName, std::move(transport))
{
    setEndPoint(kDefaultUrl);
}

ServiceCall<std::vector<Voice>> TextToSpeech::getVoices() const
{
    auto request = RequestBuilder::get(PATH_VOICES).build();
    return createServiceCall(std::move(request), ResponseConverter<std::vector<Voice>>::field("voices"));
}

ServiceCall<Voice> TextToSpeech::getVoice(const std::string& voice_name) const
{
    if (voice_name.empty())
        throw std::invalid_argument("voice cannot be null or empty");
    auto request = RequestBuilder::get(http::format_path(PATH_VOICE, voice_name)).build();
    return createServiceCall(std::move(request), ResponseConverter<Voice>::object());
}

ServiceCall<http::BinaryContent> TextToSpeech::synthesize(const std::string& text, const std::string& voice,
                                                          AudioFormat format) const
{
    if (text.empty())
        throw std::invalid_argument("text cannot be null or empty");

    auto builder = RequestBuilder::post(PATH_SYNTHESIZE);
    if (!voice.empty())
        builder.withQuery("voice", voice);
    builder.withQuery("accept", media_type(format));
    builder.withHeader("Accept", media_type(format));
    builder.withBodyJson(nlohmann::json{ { "text", text } });

    return createServiceCall(builder.build(), ResponseConverter<http::BinaryContent>::binary());
}

} // namespace langcloud::tts
