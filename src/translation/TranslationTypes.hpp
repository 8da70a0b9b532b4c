#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace langcloud::translation
{

struct TranslationModel
{
    std::string model_id;
    std::string name;
    std::string source;
    std::string target;
    std::string base_model_id;
    std::string domain;
    bool customizable = false;
    bool default_model = false; // "default" on the wire
    std::string owner;
    std::string status;
};

struct IdentifiableLanguage
{
    std::string language;
    std::string name;
};

struct IdentifiedLanguage
{
    std::string language;
    double confidence = 0.0;
};

struct Translation
{
    std::string translation;
};

struct TranslationResult
{
    int word_count = 0;
    int character_count = 0;
    std::vector<Translation> translations;

    // Empty when the server returned no translations.
    std::string firstTranslation() const;
};

// Parameters for creating a custom model. At least one training file is
// expected by the server, but none is required here.
struct CreateModelOptions
{
    std::string base_model_id;
    std::string name;
    std::optional<std::filesystem::path> forced_glossary;
    std::optional<std::filesystem::path> monolingual_corpus;
    std::optional<std::filesystem::path> parallel_corpus;
};

void from_json(const nlohmann::json& j, TranslationModel& m);
void to_json(nlohmann::json& j, const TranslationModel& m);
void from_json(const nlohmann::json& j, IdentifiableLanguage& l);
void to_json(nlohmann::json& j, const IdentifiableLanguage& l);
void from_json(const nlohmann::json& j, IdentifiedLanguage& l);
void to_json(nlohmann::json& j, const IdentifiedLanguage& l);
void from_json(const nlohmann::json& j, Translation& t);
void from_json(const nlohmann::json& j, TranslationResult& r);
void to_json(nlohmann::json& j, const TranslationResult& r);

} // namespace langcloud::translation
