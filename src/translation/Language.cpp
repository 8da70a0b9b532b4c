#include "Language.hpp"

#include <array>
#include <utility>

namespace langcloud::translation
{

namespace
{
constexpr std::array<std::pair<Language, const char*>, 10> kCodes{ {
    { Language::Arabic, "ar" },
    { Language::German, "de" },
    { Language::English, "en" },
    { Language::Spanish, "es" },
    { Language::French, "fr" },
    { Language::Italian, "it" },
    { Language::Japanese, "ja" },
    { Language::Korean, "ko" },
    { Language::Portuguese, "pt" },
    { Language::Chinese, "zh" },
} };
} // namespace

const char* to_string(Language lang)
{
    for (const auto& [value, code] : kCodes)
    {
        if (value == lang)
            return code;
    }
    return "en";
}

std::optional<Language> language_from_string(const std::string& code)
{
    for (const auto& [value, c] : kCodes)
    {
        if (code == c)
            return value;
    }
    return std::nullopt;
}

} // namespace langcloud::translation
