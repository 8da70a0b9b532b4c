#pragma once

#include <optional>
#include <string>

namespace langcloud::translation
{

// Languages accepted as translate() source/target.
enum class Language
{
    Arabic,
    German,
    English,
    Spanish,
    French,
    Italian,
    Japanese,
    Korean,
    Portuguese,
    Chinese
};

// ISO 639-1 code, e.g. "en".
const char* to_string(Language lang);
std::optional<Language> language_from_string(const std::string& code);

} // namespace langcloud::translation
