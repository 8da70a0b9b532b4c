#include "LanguageTranslation.hpp"

#include "../http/MediaTypes.hpp"
#include "../http/RequestBuilder.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <stdexcept>
#include <utility>

namespace langcloud::translation
{

namespace
{
constexpr const char* PATH_IDENTIFY = "/v2/identify";
constexpr const char* PATH_TRANSLATE = "/v2/translate";
constexpr const char* PATH_IDENTIFIABLE_LANGUAGES = "/v2/identifiable_languages";
constexpr const char* PATH_MODELS = "/v2/models";
constexpr const char* PATH_MODEL = "/v2/models/{}";

constexpr const char* BASE_MODEL_ID = "base_model_id";
constexpr const char* DEFAULT = "default";
constexpr const char* FORCED_GLOSSARY = "forced_glossary";
constexpr const char* LANGUAGES = "languages";
constexpr const char* MODEL_ID = "model_id";
constexpr const char* MODELS = "models";
constexpr const char* MONOLINGUAL_CORPUS = "monolingual_corpus";
constexpr const char* NAME = "name";
constexpr const char* PARALLEL_CORPUS = "parallel_corpus";
constexpr const char* SOURCE = "source";
constexpr const char* TARGET = "target";
constexpr const char* TEXT = "text";

void require_not_empty(const std::string& value, const char* what)
{
    if (value.empty())
        throw std::invalid_argument(std::string(what) + " cannot be null or empty");
}
} // namespace

using http::MultipartForm;
using http::RequestBuilder;
using http::ResponseConverter;
using http::ServiceCall;
namespace media_type = http::media_type;

LanguageTranslation::LanguageTranslation(std::shared_ptr<http::ITransport> transport)
    : ServiceBase(kServiceName, std::move(transport))
{
    setEndPoint(kDefaultUrl);
}

ServiceCall<TranslationModel> LanguageTranslation::createModel(const CreateModelOptions& options) const
{
    require_not_empty(options.base_model_id, "options.base_model_id");

    auto builder = RequestBuilder::post(PATH_MODELS);
    builder.withQuery(BASE_MODEL_ID, options.base_model_id);
    if (!options.name.empty())
        builder.withQuery(NAME, options.name);

    // the server wants at least one of these; which ones is up to the caller
    MultipartForm form;
    if (options.forced_glossary)
        form.addFile(FORCED_GLOSSARY, *options.forced_glossary, media_type::BINARY_FILE);
    if (options.monolingual_corpus)
        form.addFile(MONOLINGUAL_CORPUS, *options.monolingual_corpus, media_type::BINARY_FILE);
    if (options.parallel_corpus)
        form.addFile(PARALLEL_CORPUS, *options.parallel_corpus, media_type::BINARY_FILE);

    PLOG_DEBUG << "createModel base=" << options.base_model_id << " parts=" << form.parts().size();

    builder.withForm(std::move(form));
    return createServiceCall(builder.build(), ResponseConverter<TranslationModel>::object());
}

ServiceCall<http::NoContent> LanguageTranslation::deleteModel(const std::string& model_id) const
{
    require_not_empty(model_id, "model_id");
    auto request = RequestBuilder::del(http::format_path(PATH_MODEL, model_id)).build();
    return createServiceCall(std::move(request), ResponseConverter<http::NoContent>::none());
}

ServiceCall<TranslationModel> LanguageTranslation::getModel(const std::string& model_id) const
{
    require_not_empty(model_id, "model_id");
    auto request = RequestBuilder::get(http::format_path(PATH_MODEL, model_id)).build();
    return createServiceCall(std::move(request), ResponseConverter<TranslationModel>::object());
}

ServiceCall<std::vector<TranslationModel>> LanguageTranslation::getModels() const
{
    return getModels(std::nullopt, {}, {});
}

ServiceCall<std::vector<TranslationModel>> LanguageTranslation::getModels(std::optional<bool> show_default,
                                                                          const std::string& source,
                                                                          const std::string& target) const
{
    auto builder = RequestBuilder::get(PATH_MODELS);
    if (!source.empty())
        builder.withQuery(SOURCE, source);
    if (!target.empty())
        builder.withQuery(TARGET, target);
    if (show_default)
        builder.withQuery(DEFAULT, *show_default);

    return createServiceCall(builder.build(), ResponseConverter<std::vector<TranslationModel>>::field(MODELS));
}

ServiceCall<std::vector<IdentifiableLanguage>> LanguageTranslation::getIdentifiableLanguages() const
{
    auto request = RequestBuilder::get(PATH_IDENTIFIABLE_LANGUAGES).build();
    return createServiceCall(std::move(request),
                             ResponseConverter<std::vector<IdentifiableLanguage>>::field(LANGUAGES));
}

ServiceCall<std::vector<IdentifiedLanguage>> LanguageTranslation::identify(const std::string& text) const
{
    require_not_empty(text, "text");
    auto request = RequestBuilder::post(PATH_IDENTIFY)
                       .withHeader("Accept", media_type::APPLICATION_JSON)
                       .withBodyContent(text, media_type::TEXT_PLAIN)
                       .build();
    return createServiceCall(std::move(request), ResponseConverter<std::vector<IdentifiedLanguage>>::field(LANGUAGES));
}

ServiceCall<TranslationResult> LanguageTranslation::translate(const std::string& text,
                                                              const std::string& model_id) const
{
    require_not_empty(model_id, "model_id");
    return translateRequest(text, model_id, std::nullopt, std::nullopt);
}

ServiceCall<TranslationResult> LanguageTranslation::translate(const std::string& text, Language source,
                                                              Language target) const
{
    return translateRequest(text, {}, source, target);
}

ServiceCall<TranslationResult> LanguageTranslation::translateRequest(const std::string& text,
                                                                     const std::string& model_id,
                                                                     std::optional<Language> source,
                                                                     std::optional<Language> target) const
{
    require_not_empty(text, "text");

    nlohmann::json body;
    body[TEXT] = nlohmann::json::array({ text });
    if (!model_id.empty())
    {
        body[MODEL_ID] = model_id;
    }
    else
    {
        if (source)
            body[SOURCE] = to_string(*source);
        if (target)
            body[TARGET] = to_string(*target);
    }

    auto request = RequestBuilder::post(PATH_TRANSLATE)
                       .withHeader("Accept", media_type::APPLICATION_JSON)
                       .withBodyJson(body)
                       .build();
    return createServiceCall(std::move(request), ResponseConverter<TranslationResult>::object());
}

} // namespace langcloud::translation
