#include "TranslationTypes.hpp"

#include "../http/JsonFields.hpp"

#include <utility>

namespace langcloud::translation
{

using http::read_field;

std::string TranslationResult::firstTranslation() const
{
    if (translations.empty())
        return {};
    return translations.front().translation;
}

void from_json(const nlohmann::json& j, TranslationModel& m)
{
    http::require_object(j, "TranslationModel");
    read_field(j, "model_id", m.model_id);
    read_field(j, "name", m.name);
    read_field(j, "source", m.source);
    read_field(j, "target", m.target);
    read_field(j, "base_model_id", m.base_model_id);
    read_field(j, "domain", m.domain);
    read_field(j, "customizable", m.customizable);
    read_field(j, "default", m.default_model);
    read_field(j, "owner", m.owner);
    read_field(j, "status", m.status);
}

void to_json(nlohmann::json& j, const TranslationModel& m)
{
    j = nlohmann::json{ { "model_id", m.model_id },
                        { "name", m.name },
                        { "source", m.source },
                        { "target", m.target },
                        { "base_model_id", m.base_model_id },
                        { "domain", m.domain },
                        { "customizable", m.customizable },
                        { "default", m.default_model },
                        { "owner", m.owner },
                        { "status", m.status } };
}

void from_json(const nlohmann::json& j, IdentifiableLanguage& l)
{
    http::require_object(j, "IdentifiableLanguage");
    read_field(j, "language", l.language);
    read_field(j, "name", l.name);
}

void to_json(nlohmann::json& j, const IdentifiableLanguage& l)
{
    j = nlohmann::json{ { "language", l.language }, { "name", l.name } };
}

void from_json(const nlohmann::json& j, IdentifiedLanguage& l)
{
    http::require_object(j, "IdentifiedLanguage");
    read_field(j, "language", l.language);
    read_field(j, "confidence", l.confidence);
}

void to_json(nlohmann::json& j, const IdentifiedLanguage& l)
{
    j = nlohmann::json{ { "language", l.language }, { "confidence", l.confidence } };
}

void from_json(const nlohmann::json& j, Translation& t)
{
    http::require_object(j, "Translation");
    read_field(j, "translation", t.translation);
}

void from_json(const nlohmann::json& j, TranslationResult& r)
{
    http::require_object(j, "TranslationResult");
    read_field(j, "word_count", r.word_count);
    read_field(j, "character_count", r.character_count);
    read_field(j, "translations", r.translations);
}

void to_json(nlohmann::json& j, const TranslationResult& r)
{
    auto translations = nlohmann::json::array();
    for (const auto& t : r.translations)
        translations.push_back({ { "translation", t.translation } });
    j = nlohmann::json{ { "word_count", r.word_count },
                        { "character_count", r.character_count },
                        { "translations", std::move(translations) } };
}

} // namespace langcloud::translation
