#pragma once

#include "Language.hpp"
#include "TranslationTypes.hpp"

#include "../service/ServiceBase.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace langcloud::translation
{

// Client for the Language Translation service: translates text between
// languages, identifies the language of a text and manages custom models.
//
// Every method validates its arguments immediately (std::invalid_argument)
// and returns an unsent ServiceCall:
//
//   LanguageTranslation service;
//   service.setUsernameAndPassword("user", "pass");
//   auto result = service.translate("hello", Language::English, Language::Spanish).execute();
class LanguageTranslation : public service::ServiceBase
{
public:
    static constexpr const char* kServiceName = "language_translation";
    static constexpr const char* kDefaultUrl = "https://gateway.watsonplatform.net/language-translation/api";

    explicit LanguageTranslation(std::shared_ptr<http::ITransport> transport = nullptr);

    http::ServiceCall<TranslationModel> createModel(const CreateModelOptions& options) const;
    http::ServiceCall<http::NoContent> deleteModel(const std::string& model_id) const;
    http::ServiceCall<TranslationModel> getModel(const std::string& model_id) const;

    http::ServiceCall<std::vector<TranslationModel>> getModels() const;
    // Filters are sent only when set (and, for strings, non-empty).
    http::ServiceCall<std::vector<TranslationModel>> getModels(std::optional<bool> show_default,
                                                               const std::string& source,
                                                               const std::string& target) const;

    http::ServiceCall<std::vector<IdentifiableLanguage>> getIdentifiableLanguages() const;
    http::ServiceCall<std::vector<IdentifiedLanguage>> identify(const std::string& text) const;

    http::ServiceCall<TranslationResult> translate(const std::string& text, const std::string& model_id) const;
    http::ServiceCall<TranslationResult> translate(const std::string& text, Language source, Language target) const;

private:
    // model_id wins over source/target when both are given.
    http::ServiceCall<TranslationResult> translateRequest(const std::string& text, const std::string& model_id,
                                                          std::optional<Language> source,
                                                          std::optional<Language> target) const;
};

} // namespace langcloud::translation
